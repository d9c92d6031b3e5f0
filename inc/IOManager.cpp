#include "helper.h"
#include "IOManager.h"
#include "assemblyAnnotator.h"
#include "errorCollection.h"
#include "stringManager.h"
#include "unitBuilder.h"

#include <chrono>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <boost/filesystem.hpp>

template<typename T>
void addTimeToJSON(nlohmann::json* j, const std::string& valueName, T duration)
{
	std::string timeUnitString = "Unit";
	std::string timeDurationString = "Duration";
	nlohmann::json timeSet;
	if (duration == 0) { return; }
	else if (duration < 5000)
	{
		timeSet[timeDurationString] = duration;
		timeSet[timeUnitString] = UnitStringEnum::getString(UnitStringID::milliseconds);
	}
	else
	{
		timeSet[timeDurationString] = duration / 1000;
		timeSet[timeUnitString] = UnitStringEnum::getString(UnitStringID::seconds);
	}
	(*j)[valueName] = timeSet;
	return;
}

std::string IOManager::getTargetPath()
{
	// preload communcation strings
	std::string stringJSONRequest = CommunicationStringEnum::getString(CommunicationStringID::infoJsonRequest);
	std::string stringNoFilePath = CommunicationStringEnum::getString(CommunicationStringID::infoNoFilePath);
	std::string stringNoValFilePath = CommunicationStringEnum::getString(CommunicationStringID::infoNoValFilePath);

	std::cout << stringJSONRequest << std::endl;

	while (true)
	{
		std::cout << "Path: ";
		std::string singlepath = "";
		if (!std::getline(std::cin, singlepath)) { return ""; }
		singlepath = helperFunctions::trim(singlepath);

		if (singlepath.size() == 0)
		{
			std::cout << stringNoFilePath << std::endl;
			std::cout << stringJSONRequest << std::endl;
			continue;
		}
		if (singlepath.size() > 1 && singlepath.front() == '"' && singlepath.back() == '"')
		{
			singlepath = singlepath.substr(1, singlepath.size() - 2);
		}
		if (!helperFunctions::hasExtension(singlepath, "json") || !helperFunctions::isValidPath(singlepath))
		{
			std::cout << stringNoValFilePath << std::endl;
			std::cout << stringJSONRequest << std::endl;
			continue;
		}
		return singlepath;
	}
}

bool IOManager::getJSONValues(const std::string& inputPath)
{
	SettingsCollection& settingsCollection = SettingsCollection::getInstance();
	settingsCollection.reset();

	// test if input configuration path is valid
	settingsCollection.setInputJSONPath(inputPath, true);

	// read config file
	nlohmann::json json;
	try
	{
		std::ifstream f(settingsCollection.getInputJSONPath());
		json = nlohmann::json::parse(f);
	}
	catch (const nlohmann::json::parse_error& parseError)
	{
		throw std::string(errorWarningStringEnum::getString(ErrorID::errorJsonInvalEntry) + inputPath + " (" + parseError.what() + ")");
	}

	// silence first so the remaining parsing can be communicated correctly
	settingsCollection.setSilent(json);

	// in and output related settings
	settingsCollection.setIOPaths(json);
	settingsCollection.setWriteReport(json);

	// ifc file related settings
	settingsCollection.setIFCRelatedSettings(json);

	// the unit input itself
	settingsCollection.setUnitInput(json);
	settingsCollection.setBulkInput(json);
	settingsCollection.setHierarchy(json);
	settingsCollection.setSubAssemblies(json);

	// the report is placed next to the ifc file if not supplied
	if (settingsCollection.getOutputReportPath() == "")
	{
		boost::filesystem::path ifcPath = IfcExporter::resolveOutputPath(settingsCollection.getOutputIFCPath(), settingsCollection.getStoreyName());
		boost::filesystem::path reportPath = ifcPath.parent_path() / (ifcPath.stem().string() + fileExtensionEnum::getString(fileExtensionID::reportSuffix));
		settingsCollection.setOutputReportPath(reportPath.string());
	}
	return true;
}

void IOManager::printSummary()
{
	SettingsCollection& settingsCollection = SettingsCollection::getInstance();
	std::string indentString = CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::indent);
	std::string infoString = CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::info);

	std::cout << CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::seperator) << "\n\n";
	std::cout << infoString << "Used settings:\n\n";

	std::cout << infoString << "I/O settings\n";
	std::cout << "- Configuration file:\n";
	std::cout << indentString << settingsCollection.getInputJSONPath() << "\n";
	std::cout << "- Output File:\n";
	std::cout << indentString << IfcExporter::resolveOutputPath(settingsCollection.getOutputIFCPath(), settingsCollection.getStoreyName()) << "\n";
	std::cout << "- Create Report:\n";
	std::cout << boolToString(settingsCollection.writeReport()) << "\n";
	std::cout << "- Report File:\n";
	std::cout << indentString << settingsCollection.getOutputReportPath() << "\n\n";

	std::cout << infoString << "IFC settings\n";
	std::cout << "- Project name:\n";
	std::cout << indentString << settingsCollection.getProjectName() << "\n";
	std::cout << "- Storey:\n";
	std::cout << indentString << settingsCollection.getStoreyName() << " (" << settingsCollection.getStoreyElevation() << ")\n";
	std::cout << "- Length unit:\n";
	if (settingsCollection.lengthInMetre()) { std::cout << indentString << UnitStringEnum::getString(UnitStringID::meterFull) << "\n"; }
	else { std::cout << indentString << UnitStringEnum::getString(UnitStringID::millimeterFull) << "\n"; }
	std::cout << "- Mesh deflection (linear/angular):\n";
	std::cout << indentString << settingsCollection.getMeshDeflection() << " / " << settingsCollection.getMeshAngularDeflection() << "\n\n";

	std::cout << infoString << "Unit input\n";
	std::cout << "- Units:\n";
	std::cout << indentString << settingsCollection.getUnitIdList().size() << "\n";
	std::cout << "- Bulk containers:\n";
	std::cout << indentString << settingsCollection.getBulkInputList().size() << "\n";
	std::cout << "- Hierarchy entries:\n";
	std::cout << indentString << settingsCollection.getHierarchyMap().size() << "\n";
	std::cout << "- Sub assemblies:\n";
	if (settingsCollection.getSubAssemblyList().empty()) { std::cout << indentString << "none\n"; }
	for (const SubAssemblyInput& subAssembly : settingsCollection.getSubAssemblyList())
	{
		std::cout << indentString << subAssembly.name_;
		if (subAssembly.keySuffix_ != "") { std::cout << " [" << subAssembly.keySuffix_ << "]"; }
		std::cout << "\n";
	}
	std::cout << "\n";

	std::cout << CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::seperator) << "\n\n";
}

void IOManager::printErrors()
{
	ErrorCollection& errorCol = ErrorCollection::getInstance();

	std::cout << "[INFO] Warnings/Errors:\n";
	if (!errorCol.hasError())
	{
		std::cout << "\tCode 0\n";
		return;
	}

	for (const auto& error : errorCol.getErrorCollection())
	{
		const ErrorObject& currentError = error.second;
		std::cout << "\tCode " << currentError.errorCode_ << " : " << currentError.errorDescript_ << "\n";
		for (const std::string& occuringObject : currentError.occuringObjectList_)
		{
			std::cout << "\t\t" << occuringObject << "\n";
		}
	}
	return;
}

std::string IOManager::boolToString(const bool boolValue)
{
	if (boolValue) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::indent) + "yes"; }
	else { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::indent) + "no"; }
}

nlohmann::json IOManager::settingsToJSON()
{
	SettingsCollection& settingsCollection = SettingsCollection::getInstance();

	nlohmann::json settingsJSON; // overal jsonFile

	// store the filepath data
	nlohmann::json ioJSON;
	std::string filePathsOName = JsonObjectInEnum::getString(JsonObjectInID::filePaths);
	std::string outputOName = JsonObjectInEnum::getString(JsonObjectInID::filePathOutput);
	std::string reportOName = JsonObjectInEnum::getString(JsonObjectInID::filePathReport);

	ioJSON[outputOName] = IfcExporter::resolveOutputPath(settingsCollection.getOutputIFCPath(), settingsCollection.getStoreyName());
	ioJSON[reportOName] = settingsCollection.getOutputReportPath();
	settingsJSON[filePathsOName] = ioJSON;

	settingsJSON[JsonObjectInEnum::getString(JsonObjectInID::outputReport)] = settingsCollection.writeReport();
	settingsJSON[JsonObjectInEnum::getString(JsonObjectInID::silent)] = settingsCollection.isSilent();

	//store the ifc data
	nlohmann::json ifcJSON;
	ifcJSON[JsonObjectInEnum::getString(JsonObjectInID::IFCProjectName)] = settingsCollection.getProjectName();
	ifcJSON[JsonObjectInEnum::getString(JsonObjectInID::IFCStoreyName)] = settingsCollection.getStoreyName();
	ifcJSON[JsonObjectInEnum::getString(JsonObjectInID::IFCStoreyElevation)] = settingsCollection.getStoreyElevation();
	if (settingsCollection.lengthInMetre())
	{
		ifcJSON[JsonObjectInEnum::getString(JsonObjectInID::IFCLengthUnit)] = UnitStringEnum::getString(UnitStringID::meter);
	}
	else
	{
		ifcJSON[JsonObjectInEnum::getString(JsonObjectInID::IFCLengthUnit)] = UnitStringEnum::getString(UnitStringID::millimeter);
	}
	ifcJSON[JsonObjectInEnum::getString(JsonObjectInID::IFCMeshDeflection)] = settingsCollection.getMeshDeflection();
	ifcJSON[JsonObjectInEnum::getString(JsonObjectInID::IFCMeshAngularDeflection)] = settingsCollection.getMeshAngularDeflection();
	settingsJSON[JsonObjectInEnum::getString(JsonObjectInID::IFC)] = ifcJSON;

	// the unit input is summarized, the records themselves are part of the export summary
	nlohmann::json unitJSON;
	unitJSON[JsonObjectInEnum::getString(JsonObjectInID::unitsIds)] = settingsCollection.getUnitIdList();
	unitJSON[JsonObjectInEnum::getString(JsonObjectInID::unitsGeometry)] = settingsCollection.getUnitGeometryPathList();
	unitJSON[JsonObjectInEnum::getString(JsonObjectInID::unitsCategories)] = settingsCollection.getUnitCategoryList();
	settingsJSON[JsonObjectInEnum::getString(JsonObjectInID::units)] = unitJSON;

	nlohmann::json bulkJSON = nlohmann::json::array();
	for (const BulkInput& bulkInput : settingsCollection.getBulkInputList())
	{
		nlohmann::json bulkEntryJSON;
		bulkEntryJSON[JsonObjectInEnum::getString(JsonObjectInID::bulkContainerId)] = bulkInput.containerId_;
		bulkEntryJSON[JsonObjectInEnum::getString(JsonObjectInID::bulkCategory)] = bulkInput.category_;
		bulkEntryJSON[JsonObjectInEnum::getString(JsonObjectInID::bulkGeometry)] = bulkInput.geometryPathList_;
		bulkJSON.emplace_back(bulkEntryJSON);
	}
	settingsJSON[JsonObjectInEnum::getString(JsonObjectInID::bulk)] = bulkJSON;

	settingsJSON[JsonObjectInEnum::getString(JsonObjectInID::hierarchy)] = settingsCollection.getHierarchyMap();

	nlohmann::json subAssemblyJSON = nlohmann::json::array();
	for (const SubAssemblyInput& subAssembly : settingsCollection.getSubAssemblyList())
	{
		nlohmann::json subAssemblyEntryJSON;
		subAssemblyEntryJSON[JsonObjectInEnum::getString(JsonObjectInID::subAssemblyName)] = subAssembly.name_;
		subAssemblyEntryJSON[JsonObjectInEnum::getString(JsonObjectInID::subAssemblyKeySuffix)] = subAssembly.keySuffix_;
		subAssemblyJSON.emplace_back(subAssemblyEntryJSON);
	}
	settingsJSON[JsonObjectInEnum::getString(JsonObjectInID::subAssemblies)] = subAssemblyJSON;

	return settingsJSON;
}

ExportOptions IOManager::getExportOptions()
{
	SettingsCollection& settingsCollection = SettingsCollection::getInstance();

	ExportOptions options;
	options.projectName_ = settingsCollection.getProjectName();
	options.storeyName_ = settingsCollection.getStoreyName();
	options.storeyElevation_ = settingsCollection.getStoreyElevation();
	options.lengthInMetre_ = settingsCollection.lengthInMetre();
	options.meshDeflection_ = settingsCollection.getMeshDeflection();
	options.meshAngularDeflection_ = settingsCollection.getMeshAngularDeflection();
	return options;
}

std::vector<TopoDS_Shape> IOManager::loadGeometryGroup(const std::vector<std::string>& pathList)
{
	std::vector<TopoDS_Shape> shapeList;
	shapeList.reserve(pathList.size());
	for (const std::string& path : pathList)
	{
		try
		{
			shapeList.emplace_back(geometryLoader_.loadShape(path));
		}
		catch (const ErrorID& exceptionId)
		{
			ErrorCollection::getInstance().addError(exceptionId, path);
			throw std::string(errorWarningStringEnum::getString(exceptionId) + path);
		}
	}
	return shapeList;
}

std::vector<std::string> IOManager::getPartNameList(const std::vector<std::string>& pathList)
{
	std::vector<std::string> partNameList;
	partNameList.reserve(pathList.size());
	for (const std::string& path : pathList) { partNameList.emplace_back(helperFunctions::pathToPartName(path)); }
	return partNameList;
}

void IOManager::buildBatch()
{
	SettingsCollection& settingsCollection = SettingsCollection::getInstance();
	bool isSilent = settingsCollection.isSilent();

	if (!isSilent) { std::cout << CommunicationStringEnum::getString(CommunicationStringID::infoLoadingGeometry) << std::endl; }
	auto startTime = std::chrono::high_resolution_clock::now();

	std::vector<std::vector<TopoDS_Shape>> geometryGroupList;
	std::vector<std::vector<std::string>> partNameGroupList;
	for (const std::vector<std::string>& pathList : settingsCollection.getUnitGeometryPathList())
	{
		geometryGroupList.emplace_back(loadGeometryGroup(pathList));
		partNameGroupList.emplace_back(getPartNameList(pathList));
	}

	std::vector<std::vector<TopoDS_Shape>> bulkGeometryList;
	for (const BulkInput& bulkInput : settingsCollection.getBulkInputList())
	{
		bulkGeometryList.emplace_back(loadGeometryGroup(bulkInput.geometryPathList_));
	}
	timeLoading_ = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::high_resolution_clock::now() - startTime).count();
	if (!isSilent) { std::cout << CommunicationStringEnum::getString(CommunicationStringID::indentLoadedShapes) << geometryLoader_.getLoadedFileCount() << std::endl; }

	if (!isSilent) { std::cout << CommunicationStringEnum::getString(CommunicationStringID::infoBuildingUnits) << std::endl; }
	batch_ = UnitBuilder::build(
		settingsCollection.getUnitIdList(),
		geometryGroupList,
		settingsCollection.getUnitPlacementList(),
		settingsCollection.getUnitCategoryList(),
		partNameGroupList
	);

	const std::vector<BulkInput>& bulkInputList = settingsCollection.getBulkInputList();
	if (!bulkInputList.empty() && !isSilent) { std::cout << CommunicationStringEnum::getString(CommunicationStringID::infoBuildingBulk) << std::endl; }
	for (size_t i = 0; i < bulkInputList.size(); i++)
	{
		batch_.emplace_back(UnitBuilder::buildBulk(
			bulkInputList[i].containerId_,
			bulkGeometryList[i],
			bulkInputList[i].category_,
			getPartNameList(bulkInputList[i].geometryPathList_)
		));
	}
	if (!isSilent) { std::cout << CommunicationStringEnum::getString(CommunicationStringID::indentBuiltUnits) << batch_.size() << std::endl; }
	return;
}

void IOManager::annotateBatch()
{
	SettingsCollection& settingsCollection = SettingsCollection::getInstance();
	ErrorCollection& errorCollection = ErrorCollection::getInstance();
	bool isSilent = settingsCollection.isSilent();

	const HierarchyMap& hierarchyMap = settingsCollection.getHierarchyMap();
	if (!hierarchyMap.empty())
	{
		if (!isSilent) { std::cout << CommunicationStringEnum::getString(CommunicationStringID::infoAnnotatingAssemblies) << std::endl; }

		// hierarchy entries that do not match any record are reported but do not stop the export
		for (const auto& hierarchyPair : hierarchyMap)
		{
			bool hasMatch = false;
			for (const UnitRecord& record : batch_)
			{
				if (record.getId() != hierarchyPair.first) { continue; }
				hasMatch = true;
				break;
			}
			if (!hasMatch) { errorCollection.addError(ErrorID::warningNoHierarchyMatch, hierarchyPair.first); }
		}
		batch_ = AssemblyAnnotator::annotate(std::move(batch_), hierarchyMap);
	}

	for (const SubAssemblyInput& subAssembly : settingsCollection.getSubAssemblyList())
	{
		if (helperFunctions::trim(subAssembly.name_) == "")
		{
			errorCollection.addError(ErrorID::warningEmptySubAssemblyName);
			continue;
		}
		if (!isSilent) { std::cout << CommunicationStringEnum::getString(CommunicationStringID::infoWrappingSubAssembly) << subAssembly.name_ << std::endl; }
		batch_ = AssemblyAnnotator::wrapSubAssembly(std::move(batch_), subAssembly.name_, subAssembly.keySuffix_);
	}
	return;
}

void IOManager::exportBatch()
{
	SettingsCollection& settingsCollection = SettingsCollection::getInstance();
	bool isSilent = settingsCollection.isSilent();

	if (!isSilent) { std::cout << CommunicationStringEnum::getString(CommunicationStringID::infoExportingIfc) << std::endl; }

	IfcExporter exporter(getExportOptions());
	exportResult_ = std::make_unique<ExportResult>(exporter.exportBatch(batch_, settingsCollection.getOutputIFCPath()));

	if (isSilent) { return; }
	std::cout << CommunicationStringEnum::getString(CommunicationStringID::indentExportedProducts) << exportResult_->productCount_ << std::endl;
	std::cout << CommunicationStringEnum::getString(CommunicationStringID::indentExportedAssemblies) << exportResult_->assemblyCount_ << std::endl;
	std::cout << CommunicationStringEnum::getString(CommunicationStringID::indentWrittenTo) << exportResult_->outputPath_ << std::endl;
	return;
}

bool IOManager::processStep(const std::function<void()>& stepFunc, long long& timeRecord)
{
	ErrorCollection& errorCollection = ErrorCollection::getInstance();

	auto startTime = std::chrono::high_resolution_clock::now();
	try
	{
		stepFunc();
	}
	catch (const UnitExportException& exception)
	{
		errorCollection.addError(exception.getErrorId(), exception.getUnitId());
		std::cout << CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) << exception.what() << std::endl;
		succesfullExit_ = 0;
	}
	catch (const std::string& exceptionString)
	{
		// the failure is already stored by the step itself
		std::cout << exceptionString << std::endl;
		succesfullExit_ = 0;
	}
	catch (const std::exception& exception)
	{
		errorCollection.addError(ErrorID::errorUnableToProcessFile, exception.what());
		std::cout << CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) << exception.what() << std::endl;
		succesfullExit_ = 0;
	}
	timeRecord = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::high_resolution_clock::now() - startTime).count();
	return succesfullExit_;
}

bool IOManager::init(const std::vector<std::string>& inputPathList)
{
	std::cout << CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::seperator) << std::endl;
	std::cout << "		IFC_UnitExporter " << buildVersion << std::endl;
	std::cout << "    Unit grouped IFC export of curtain wall panels\n" << std::endl;
	std::cout << CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::seperator) << std::endl;
	std::cout << std::endl;

	std::string inputPath = "";
	if (inputPathList.size() == 0) { inputPath = getTargetPath(); }
	else if (inputPathList.size() > 1) { return false; } // too many args
	else { inputPath = inputPathList[0]; }

	if (inputPath == "") { return false; }

	std::cout << CommunicationStringEnum::getString(CommunicationStringID::infoParsingConfig) << inputPath << std::endl;
	getJSONValues(inputPath);

	if (SettingsCollection::getInstance().isSilent()) { return true; }
	std::cout << CommunicationStringEnum::getString(CommunicationStringID::indentValidConfigFound) << std::endl;
	std::cout << std::endl;
	printSummary();
	return true;
}

bool IOManager::run()
{
	bool isSilent = SettingsCollection::getInstance().isSilent();
	auto startTime = std::chrono::high_resolution_clock::now();

	// every step depends on the result of the previous one
	if (processStep([this]() { buildBatch(); }, timeBuilding_) &&
		processStep([this]() { annotateBatch(); }, timeAnnotating_) &&
		processStep([this]() { exportBatch(); }, timeExporting_))
	{
		if (!isSilent)
		{
			long long duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::high_resolution_clock::now() - startTime).count();
			std::cout << CommunicationStringEnum::getString(CommunicationStringID::indentSuccesFinished) << duration << " " << UnitStringEnum::getString(UnitStringID::milliseconds) << std::endl;
		}
	}
	else
	{
		std::cout << CommunicationStringEnum::getString(CommunicationStringID::indentUnsuccesful) << std::endl;
	}

	// building includes the loading time, report them apart
	timeBuilding_ -= timeLoading_;
	if (timeBuilding_ < 0) { timeBuilding_ = 0; }

	if (!isSilent || !succesfullExit_)
	{
		std::cout << std::endl;
		printErrors();
	}
	return succesfullExit_;
}

bool IOManager::write(bool reportOnly)
{
	SettingsCollection& settingsCollection = SettingsCollection::getInstance();

	// no output path set yet, cannot write to unknown location
	if (settingsCollection.getOutputReportPath() == "") { return true; }
	if (!settingsCollection.writeReport()) { return true; }

	if (!settingsCollection.isSilent()) { std::cout << CommunicationStringEnum::getString(CommunicationStringID::infoWritingReport) << std::endl; }

	nlohmann::json report;
	report["Input settings"] = settingsToJSON();

	nlohmann::json timeReport;
	addTimeToJSON(&timeReport, "Geometry loading", timeLoading_);
	addTimeToJSON(&timeReport, "Unit building", timeBuilding_);
	addTimeToJSON(&timeReport, "Assembly annotation", timeAnnotating_);
	addTimeToJSON(&timeReport, "IFC export", timeExporting_);
	addTimeToJSON(&timeReport, "Total Processing",
		timeLoading_ +
		timeBuilding_ +
		timeAnnotating_ +
		timeExporting_
	);
	report["Duration"] = timeReport;
	report["Errors"] = ErrorCollection::getInstance().toJson();

	if (!reportOnly && exportResult_)
	{
		report["Export"] = exportResult_->toJson();
	}

	boost::filesystem::path reportPath(settingsCollection.getOutputReportPath());
	boost::system::error_code errorCode;
	if (reportPath.has_parent_path()) { boost::filesystem::create_directories(reportPath.parent_path(), errorCode); }

	std::ofstream reportFile(settingsCollection.getOutputReportPath());
	if (!reportFile.is_open())
	{
		std::cout << errorWarningStringEnum::getString(ErrorID::errorExportUnableToWrite) << ": " << settingsCollection.getOutputReportPath() << std::endl;
		return false;
	}
	reportFile << report.dump(4);
	reportFile.close();
	return true;
}

#include "settingsCollection.h"
#include "errorCollection.h"
#include "stringManager.h"

#include <nlohmann/json.hpp>
#include <boost/filesystem.hpp>
#include <boost/algorithm/string.hpp>

#include <algorithm>
#include <vector>

bool getJsonBoolValue(const nlohmann::json& jsonBoolValue)
{
	if (jsonBoolValue.is_boolean())
	{
		return static_cast<bool>(jsonBoolValue);
	}

	if (!jsonBoolValue.is_number_integer() &&
		!jsonBoolValue.is_number_unsigned())
	{
		throw ErrorID::errorJsonInvalBool;
	}

	int jsonBoolInt = static_cast<int>(jsonBoolValue);
	if (jsonBoolInt == 0) { return false; }
	if (jsonBoolInt == 1) { return true; }

	throw ErrorID::errorJsonInvalBool; //if not 0 or 1 invalid
}

double getJsonDouble(const nlohmann::json& jsonDouleValue)
{
	if (!jsonDouleValue.is_number_integer() &&
		!jsonDouleValue.is_number_unsigned() &&
		!jsonDouleValue.is_number_float())
	{
		throw ErrorID::errorJsonInvalNum;
	}
	return static_cast<double>(jsonDouleValue);
}

std::string getJsonString(const nlohmann::json& jsonStringValue)
{
	if (!jsonStringValue.is_string())
	{
		throw ErrorID::errorJsonInvalString;
	}
	return static_cast<std::string>(jsonStringValue);
}

std::string getJsonPath(const nlohmann::json& jsonStringValue, bool mustExist, const std::string& fileExtension)
{
	std::string jsonPathPtr = helperFunctions::trim(getJsonString(jsonStringValue));

	if (!helperFunctions::hasExtension(jsonPathPtr, fileExtension))
	{
		throw ErrorID::errorJsonInvalPath;
	}

	// output files, the folders are created when writing
	if (!mustExist) { return jsonPathPtr; }

	if (!helperFunctions::isValidPath(jsonPathPtr))
	{
		throw ErrorID::errorJsonNoRealPath;
	}
	return jsonPathPtr;
}

std::vector<std::string> getJsonStringList(const nlohmann::json& jsonArrayValue)
{
	if (!jsonArrayValue.is_array())
	{
		throw ErrorID::errorJsonInvalArray;
	}

	std::vector<std::string> stringList;
	stringList.reserve(jsonArrayValue.size());
	for (const nlohmann::json& jsonValue : jsonArrayValue)
	{
		stringList.emplace_back(getJsonString(jsonValue));
	}
	return stringList;
}

void SettingsCollection::reset()
{
	isSilent_ = false;
	InputJsonPath_ = "";
	outputIFCPath_ = "";
	outputReportPath_ = "";
	writeReport_ = true;

	projectName_ = "";
	storeyName_ = IfcObjectEnum::getString(IfcObjectID::defaultStoreyName);
	storeyElevation_ = 0;
	lengthInMetre_ = false;
	meshDeflection_ = 0.5;
	meshAngularDeflection_ = 0.5;

	unitIdList_.clear();
	unitGeometryPathList_.clear();
	unitPlacementList_.clear();
	unitCategoryList_.clear();
	bulkInputList_.clear();
	hierarchyMap_.clear();
	subAssemblyList_.clear();
	return;
}

void SettingsCollection::setSilent(const nlohmann::json& json)
{
	std::string silentOName = JsonObjectInEnum::getString(JsonObjectInID::silent);
	if (json.contains(silentOName))
	{
		try
		{
			setSilent(getJsonBoolValue(json[silentOName]));
		}
		catch (const ErrorID& exceptionId)
		{
			throw std::string(errorWarningStringEnum::getString(exceptionId) + silentOName);
		}
	}
	return;
}

void SettingsCollection::setInputJSONPath(const std::string& inputString, bool validate)
{
	if (validate)
	{
		if (!helperFunctions::isValidPath(inputString))
		{
			throw std::string(errorWarningStringEnum::getString(ErrorID::errorNoValFilePaths));
		}
		else if (!helperFunctions::hasExtension(inputString, fileExtensionEnum::getString(fileExtensionID::JSON))) {
			throw std::string(errorWarningStringEnum::getString(ErrorID::errorNoValFilePaths));
		}
	}
	InputJsonPath_ = inputString;
	return;
}

void SettingsCollection::setIOPaths(const nlohmann::json& json)
{
	// get filepath object
	std::string filePathsOName = JsonObjectInEnum::getString(JsonObjectInID::filePaths);
	if (!json.contains(filePathsOName))
	{
		throw std::string(errorWarningStringEnum::getString(ErrorID::errorJsonMissingEntry) + filePathsOName);
	}
	const nlohmann::json& filePaths = json[filePathsOName];

	// the output path is normalized by the exporter, a folder or extensionless path is allowed
	std::string outputOName = JsonObjectInEnum::getString(JsonObjectInID::filePathOutput);
	if (!filePaths.contains(outputOName))
	{
		throw std::string(errorWarningStringEnum::getString(ErrorID::errorJsonMissingEntry) + outputOName);
	}

	try
	{
		std::string outputPath = helperFunctions::trim(getJsonString(filePaths[outputOName]));
		if (outputPath == "") { throw ErrorID::errorJsonInvalPath; }
		setOutputIFCPath(outputPath);
	}
	catch (const ErrorID& exceptionId)
	{
		throw std::string(errorWarningStringEnum::getString(exceptionId) + outputOName);
	}

	// the report path defaults to the output stem when it is not supplied
	std::string outputReportPathOName = JsonObjectInEnum::getString(JsonObjectInID::filePathReport);
	if (filePaths.contains(outputReportPathOName))
	{
		try
		{
			setOutputReportPath(getJsonPath(filePaths[outputReportPathOName], false, fileExtensionEnum::getString(fileExtensionID::JSON)));
		}
		catch (const ErrorID& exceptionId)
		{
			throw std::string(errorWarningStringEnum::getString(exceptionId) + outputReportPathOName);
		}
	}
	return;
}

void SettingsCollection::setWriteReport(const nlohmann::json& json)
{
	std::string outputReportOName = JsonObjectInEnum::getString(JsonObjectInID::outputReport);
	if (json.contains(outputReportOName))
	{
		try
		{
			bool reportBool = getJsonBoolValue(json[outputReportOName]);
			setWriteReport(reportBool);
		}
		catch (const ErrorID& exceptionId)
		{
			throw std::string(errorWarningStringEnum::getString(exceptionId) + outputReportOName);
		}
	}
	return;
}

void SettingsCollection::setIFCRelatedSettings(const nlohmann::json& json)
{
	std::string ifcOName = JsonObjectInEnum::getString(JsonObjectInID::IFC);
	if (!json.contains(ifcOName)) { return; }
	const nlohmann::json& ifcSettings = json[ifcOName];

	std::string projectNameOName = JsonObjectInEnum::getString(JsonObjectInID::IFCProjectName);
	if (ifcSettings.contains(projectNameOName))
	{
		try { setProjectName(helperFunctions::trim(getJsonString(ifcSettings[projectNameOName]))); }
		catch (const ErrorID& exceptionId)
		{
			throw std::string(errorWarningStringEnum::getString(exceptionId) + projectNameOName);
		}
	}

	std::string storeyNameOName = JsonObjectInEnum::getString(JsonObjectInID::IFCStoreyName);
	if (ifcSettings.contains(storeyNameOName))
	{
		try
		{
			std::string storeyName = helperFunctions::trim(getJsonString(ifcSettings[storeyNameOName]));
			if (storeyName == "") { throw ErrorID::errorJsonInvalString; }
			setStoreyName(storeyName);
		}
		catch (const ErrorID& exceptionId)
		{
			throw std::string(errorWarningStringEnum::getString(exceptionId) + storeyNameOName);
		}
	}

	std::string storeyElevationOName = JsonObjectInEnum::getString(JsonObjectInID::IFCStoreyElevation);
	if (ifcSettings.contains(storeyElevationOName))
	{
		try { setStoreyElevation(getJsonDouble(ifcSettings[storeyElevationOName])); }
		catch (const ErrorID& exceptionId)
		{
			throw std::string(errorWarningStringEnum::getString(exceptionId) + storeyElevationOName);
		}
	}

	std::string lengthUnitOName = JsonObjectInEnum::getString(JsonObjectInID::IFCLengthUnit);
	if (ifcSettings.contains(lengthUnitOName))
	{
		try
		{
			std::string lengthUnit = helperFunctions::toLower(helperFunctions::trim(getJsonString(ifcSettings[lengthUnitOName])));
			if (lengthUnit == UnitStringEnum::getString(UnitStringID::millimeterFull) ||
				lengthUnit == UnitStringEnum::getString(UnitStringID::millimeter))
			{
				setLengthInMetre(false);
			}
			else if (lengthUnit == UnitStringEnum::getString(UnitStringID::meterFull) ||
				lengthUnit == UnitStringEnum::getString(UnitStringID::meter))
			{
				setLengthInMetre(true);
			}
			else
			{
				throw ErrorID::errorJsonInvalUnit;
			}
		}
		catch (const ErrorID& exceptionId)
		{
			throw std::string(errorWarningStringEnum::getString(exceptionId) + lengthUnitOName);
		}
	}

	std::string deflectionOName = JsonObjectInEnum::getString(JsonObjectInID::IFCMeshDeflection);
	if (ifcSettings.contains(deflectionOName))
	{
		try
		{
			double deflection = getJsonDouble(ifcSettings[deflectionOName]);
			if (deflection <= 0) { throw ErrorID::errorJsonInvalNum; }
			setMeshDeflection(deflection);
		}
		catch (const ErrorID& exceptionId)
		{
			throw std::string(errorWarningStringEnum::getString(exceptionId) + deflectionOName);
		}
	}

	std::string angularDeflectionOName = JsonObjectInEnum::getString(JsonObjectInID::IFCMeshAngularDeflection);
	if (ifcSettings.contains(angularDeflectionOName))
	{
		try
		{
			double angularDeflection = getJsonDouble(ifcSettings[angularDeflectionOName]);
			if (angularDeflection <= 0) { throw ErrorID::errorJsonInvalNum; }
			setMeshAngularDeflection(angularDeflection);
		}
		catch (const ErrorID& exceptionId)
		{
			throw std::string(errorWarningStringEnum::getString(exceptionId) + angularDeflectionOName);
		}
	}
	return;
}

std::string SettingsCollection::getProjectName() const
{
	if (projectName_ != "") { return projectName_; }
	return storeyName_ + IfcObjectEnum::getString(IfcObjectID::defaultProjectSuffix);
}

std::string SettingsCollection::getGeometryPath(const nlohmann::json& jsonPathValue)
{
	std::string geometryPath = helperFunctions::trim(getJsonString(jsonPathValue));

	if (!helperFunctions::hasExtension(geometryPath, fileExtensionEnum::getString(fileExtensionID::STEP)) &&
		!helperFunctions::hasExtension(geometryPath, fileExtensionEnum::getString(fileExtensionID::STP)) &&
		!helperFunctions::hasExtension(geometryPath, fileExtensionEnum::getString(fileExtensionID::BREP)))
	{
		throw ErrorID::errorJsonInvalPath;
	}

	// relative paths are relative to the config file
	boost::filesystem::path filePath(geometryPath);
	if (filePath.is_relative() && InputJsonPath_ != "")
	{
		filePath = boost::filesystem::path(InputJsonPath_).parent_path() / filePath;
	}

	if (!helperFunctions::isValidPath(filePath.string()))
	{
		throw ErrorID::errorJsonNoRealPath;
	}
	return filePath.lexically_normal().string();
}

gp_Ax3 SettingsCollection::getPlacement(const nlohmann::json& jsonPlacement)
{
	if (!jsonPlacement.is_object()) { throw ErrorID::errorJsonInvalEntry; }

	std::string originOName = JsonObjectInEnum::getString(JsonObjectInID::placementOrigin);
	std::string zAxisOName = JsonObjectInEnum::getString(JsonObjectInID::placementZAxis);
	std::string xAxisOName = JsonObjectInEnum::getString(JsonObjectInID::placementXAxis);

	if (!jsonPlacement.contains(originOName)) { throw ErrorID::errorJsonMissingEntry; }
	gp_Pnt origin = helperFunctions::jsonToPoint(jsonPlacement[originOName]);

	gp_Dir zDir(0, 0, 1);
	gp_Dir xDir(1, 0, 0);
	if (jsonPlacement.contains(zAxisOName)) { zDir = helperFunctions::jsonToDir(jsonPlacement[zAxisOName]); }
	if (jsonPlacement.contains(xAxisOName)) { xDir = helperFunctions::jsonToDir(jsonPlacement[xAxisOName]); }

	if (zDir.IsParallel(xDir, 1e-6)) { throw ErrorID::errorJsonInvalPlacement; }
	return gp_Ax3(origin, zDir, xDir);
}

void SettingsCollection::setUnitInput(const nlohmann::json& json)
{
	std::string unitsOName = JsonObjectInEnum::getString(JsonObjectInID::units);
	if (!json.contains(unitsOName)) { return; }
	const nlohmann::json& unitInput = json[unitsOName];
	if (!unitInput.is_object())
	{
		throw std::string(errorWarningStringEnum::getString(ErrorID::errorJsonInvalEntry) + unitsOName);
	}

	std::string idsOName = JsonObjectInEnum::getString(JsonObjectInID::unitsIds);
	std::string geometryOName = JsonObjectInEnum::getString(JsonObjectInID::unitsGeometry);
	std::string placementsOName = JsonObjectInEnum::getString(JsonObjectInID::unitsPlacements);
	std::string categoriesOName = JsonObjectInEnum::getString(JsonObjectInID::unitsCategories);

	for (const std::string& requiredOName : { idsOName, geometryOName, placementsOName })
	{
		if (!unitInput.contains(requiredOName))
		{
			throw std::string(errorWarningStringEnum::getString(ErrorID::errorJsonMissingEntry) + requiredOName);
		}
		if (!unitInput[requiredOName].is_array())
		{
			throw std::string(errorWarningStringEnum::getString(ErrorID::errorJsonInvalArray) + requiredOName);
		}
	}

	// the list lengths are not compared here, the unit builder reports mismatches
	try { unitIdList_ = getJsonStringList(unitInput[idsOName]); }
	catch (const ErrorID& exceptionId)
	{
		throw std::string(errorWarningStringEnum::getString(exceptionId) + idsOName);
	}

	unitGeometryPathList_.clear();
	for (const nlohmann::json& geometryGroup : unitInput[geometryOName])
	{
		try
		{
			std::vector<std::string> groupPathList;
			if (geometryGroup.is_string()) { groupPathList.emplace_back(getGeometryPath(geometryGroup)); }
			else if (geometryGroup.is_array())
			{
				for (const nlohmann::json& geometryPath : geometryGroup) { groupPathList.emplace_back(getGeometryPath(geometryPath)); }
			}
			else { throw ErrorID::errorJsonInvalArray; }
			unitGeometryPathList_.emplace_back(groupPathList);
		}
		catch (const ErrorID& exceptionId)
		{
			ErrorCollection::getInstance().addError(exceptionId, geometryOName);
			throw std::string(errorWarningStringEnum::getString(exceptionId) + geometryOName);
		}
	}

	unitPlacementList_.clear();
	for (const nlohmann::json& jsonPlacement : unitInput[placementsOName])
	{
		try { unitPlacementList_.emplace_back(getPlacement(jsonPlacement)); }
		catch (const ErrorID& exceptionId)
		{
			throw std::string(errorWarningStringEnum::getString(exceptionId) + placementsOName);
		}
	}

	unitCategoryList_.clear();
	if (unitInput.contains(categoriesOName))
	{
		try { unitCategoryList_ = getJsonStringList(unitInput[categoriesOName]); }
		catch (const ErrorID& exceptionId)
		{
			throw std::string(errorWarningStringEnum::getString(exceptionId) + categoriesOName);
		}
	}
	return;
}

void SettingsCollection::setBulkInput(const nlohmann::json& json)
{
	std::string bulkOName = JsonObjectInEnum::getString(JsonObjectInID::bulk);
	if (!json.contains(bulkOName)) { return; }
	const nlohmann::json& bulkInput = json[bulkOName];
	if (!bulkInput.is_array())
	{
		throw std::string(errorWarningStringEnum::getString(ErrorID::errorJsonInvalArray) + bulkOName);
	}

	std::string containerIdOName = JsonObjectInEnum::getString(JsonObjectInID::bulkContainerId);
	std::string categoryOName = JsonObjectInEnum::getString(JsonObjectInID::bulkCategory);
	std::string geometryOName = JsonObjectInEnum::getString(JsonObjectInID::bulkGeometry);

	bulkInputList_.clear();
	for (const nlohmann::json& bulkEntry : bulkInput)
	{
		for (const std::string& requiredOName : { containerIdOName, categoryOName, geometryOName })
		{
			if (!bulkEntry.contains(requiredOName))
			{
				throw std::string(errorWarningStringEnum::getString(ErrorID::errorJsonMissingEntry) + bulkOName + " " + requiredOName);
			}
		}

		BulkInput bulkObject;
		try
		{
			bulkObject.containerId_ = getJsonString(bulkEntry[containerIdOName]);
			bulkObject.category_ = getJsonString(bulkEntry[categoryOName]);

			if (!bulkEntry[geometryOName].is_array()) { throw ErrorID::errorJsonInvalArray; }
			for (const nlohmann::json& geometryPath : bulkEntry[geometryOName])
			{
				bulkObject.geometryPathList_.emplace_back(getGeometryPath(geometryPath));
			}
		}
		catch (const ErrorID& exceptionId)
		{
			throw std::string(errorWarningStringEnum::getString(exceptionId) + bulkOName);
		}
		bulkInputList_.emplace_back(bulkObject);
	}
	return;
}

void SettingsCollection::setHierarchy(const nlohmann::json& json)
{
	std::string hierarchyOName = JsonObjectInEnum::getString(JsonObjectInID::hierarchy);
	if (!json.contains(hierarchyOName)) { return; }
	const nlohmann::json& hierarchyInput = json[hierarchyOName];
	if (!hierarchyInput.is_object())
	{
		throw std::string(errorWarningStringEnum::getString(ErrorID::errorJsonInvalEntry) + hierarchyOName);
	}

	hierarchyMap_.clear();
	for (auto it = hierarchyInput.begin(); it != hierarchyInput.end(); ++it)
	{
		try { hierarchyMap_[it.key()] = getJsonStringList(it.value()); }
		catch (const ErrorID& exceptionId)
		{
			throw std::string(errorWarningStringEnum::getString(exceptionId) + hierarchyOName + " " + it.key());
		}
	}
	return;
}

void SettingsCollection::setSubAssemblies(const nlohmann::json& json)
{
	std::string subAssembliesOName = JsonObjectInEnum::getString(JsonObjectInID::subAssemblies);
	if (!json.contains(subAssembliesOName)) { return; }
	const nlohmann::json& subAssemblyInput = json[subAssembliesOName];
	if (!subAssemblyInput.is_array())
	{
		throw std::string(errorWarningStringEnum::getString(ErrorID::errorJsonInvalArray) + subAssembliesOName);
	}

	std::string nameOName = JsonObjectInEnum::getString(JsonObjectInID::subAssemblyName);
	std::string keySuffixOName = JsonObjectInEnum::getString(JsonObjectInID::subAssemblyKeySuffix);

	subAssemblyList_.clear();
	for (const nlohmann::json& subAssemblyEntry : subAssemblyInput)
	{
		SubAssemblyInput subAssemblyObject;
		try
		{
			if (subAssemblyEntry.is_string())
			{
				subAssemblyObject.name_ = getJsonString(subAssemblyEntry);
			}
			else if (subAssemblyEntry.is_object())
			{
				if (!subAssemblyEntry.contains(nameOName)) { throw ErrorID::errorJsonMissingEntry; }
				subAssemblyObject.name_ = getJsonString(subAssemblyEntry[nameOName]);
				if (subAssemblyEntry.contains(keySuffixOName))
				{
					subAssemblyObject.keySuffix_ = getJsonString(subAssemblyEntry[keySuffixOName]);
				}
			}
			else
			{
				throw ErrorID::errorJsonInvalEntry;
			}
		}
		catch (const ErrorID& exceptionId)
		{
			throw std::string(errorWarningStringEnum::getString(exceptionId) + subAssembliesOName);
		}
		subAssemblyList_.emplace_back(subAssemblyObject);
	}
	return;
}

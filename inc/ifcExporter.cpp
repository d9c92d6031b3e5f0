#include "ifcExporter.h"
#include "errorCollection.h"
#include "stringManager.h"

#include <ifcparse/IfcException.h>

#include <boost/filesystem.hpp>
#include <boost/make_shared.hpp>

#include <Standard_Failure.hxx>

#include <fstream>
#include <set>

nlohmann::json ExportResult::toJson() const
{
	nlohmann::json resultJson;
	resultJson["Output file"] = outputPath_;
	resultJson["Products"] = productCount_;
	resultJson["Assemblies"] = assemblyCount_;
	resultJson["Triangles"] = triangleCount_;
	resultJson["Units"] = unitSummaryList_;
	return resultJson;
}

IfcExporter::IfcExporter(const ExportOptions& options)
{
	options_ = options;
}

std::string IfcExporter::resolveOutputPath(const std::string& outputPath, const std::string& storeyName)
{
	std::string cleanPath = helperFunctions::trim(outputPath);
	if (cleanPath.size() >= 2 && cleanPath.front() == '"' && cleanPath.back() == '"')
	{
		cleanPath = cleanPath.substr(1, cleanPath.size() - 2);
	}
	if (cleanPath == "") { cleanPath = "."; }

	boost::filesystem::path filePath(cleanPath);
	boost::system::error_code errorCode;
	if (boost::filesystem::is_directory(filePath, errorCode) || !filePath.has_extension())
	{
		return (filePath / (storeyName + fileExtensionEnum::getString(fileExtensionID::multiUnitSuffix))).string();
	}

	if (helperFunctions::toLower(filePath.extension().string()) != fileExtensionEnum::getString(fileExtensionID::IFC))
	{
		filePath.replace_extension(fileExtensionEnum::getString(fileExtensionID::IFC));
	}
	return filePath.string();
}

IfcSchema::IfcLocalPlacement* IfcExporter::createLocalPlacement(IfcSchema::IfcObjectPlacement* relativeTo, const gp_Ax3& placement) const
{
	const gp_Pnt& origin = placement.Location();
	const gp_Dir& zDir = placement.Direction();
	const gp_Dir& xDir = placement.XDirection();

	IfcSchema::IfcAxis2Placement3D* axisPlacement = new IfcSchema::IfcAxis2Placement3D(
		new IfcSchema::IfcCartesianPoint(std::vector<double>{ origin.X(), origin.Y(), origin.Z() }),
		new IfcSchema::IfcDirection(std::vector<double>{ zDir.X(), zDir.Y(), zDir.Z() }),
		new IfcSchema::IfcDirection(std::vector<double>{ xDir.X(), xDir.Y(), xDir.Z() })
	);
	return new IfcSchema::IfcLocalPlacement(relativeTo, axisPlacement);
}

void IfcExporter::createSkeleton(ExportContext& context, const std::string& fileName) const
{
	context.ownerHistory = context.file.addOwnerHistory();

	context.file.header().file_name().name(fileName);
	context.file.header().file_name().originating_system(IfcObjectEnum::getString(IfcObjectID::originatingSystem));

	// length in millimetre unless metre is requested, angles in radian
	IfcSchema::IfcUnit::list::ptr unitList(new IfcSchema::IfcUnit::list);
	boost::optional<IfcSchema::IfcSIPrefix::Value> lengthPrefix = boost::none;
	if (!options_.lengthInMetre_) { lengthPrefix = IfcSchema::IfcSIPrefix::IfcSIPrefix_MILLI; }

	IfcSchema::IfcSIUnit* lengthUnit = new IfcSchema::IfcSIUnit(IfcSchema::IfcUnitEnum::IfcUnit_LENGTHUNIT, lengthPrefix, IfcSchema::IfcSIUnitName::IfcSIUnitName_METRE);
	IfcSchema::IfcSIUnit* angleUnit = new IfcSchema::IfcSIUnit(IfcSchema::IfcUnitEnum::IfcUnit_PLANEANGLEUNIT, boost::none, IfcSchema::IfcSIUnitName::IfcSIUnitName_RADIAN);
	unitList->push(lengthUnit);
	unitList->push(angleUnit);
	IfcSchema::IfcUnitAssignment* unitAssignment = new IfcSchema::IfcUnitAssignment(unitList);

	std::string projectName = options_.projectName_;
	if (projectName == "") { projectName = options_.storeyName_ + IfcObjectEnum::getString(IfcObjectID::defaultProjectSuffix); }

	IfcSchema::IfcRepresentationContext::list::ptr representationContextList(new IfcSchema::IfcRepresentationContext::list);
	IfcSchema::IfcProject* project = new IfcSchema::IfcProject(
		IfcParse::IfcGlobalId(),
		context.ownerHistory,
		projectName,
		boost::none,
		boost::none,
		boost::none,
		boost::none,
		representationContextList,
		unitAssignment
	);
	context.file.addEntity(project);

	IfcSchema::IfcSite* site = context.file.addSite(project, context.ownerHistory);
	site->setName(IfcObjectEnum::getString(IfcObjectID::defaultSite));

	IfcSchema::IfcBuilding* building = context.file.addBuilding(site, context.ownerHistory);
	building->setName(IfcObjectEnum::getString(IfcObjectID::defaultBuilding));

	context.storey = context.file.addBuildingStorey(building, context.ownerHistory);
	context.storey->setName(options_.storeyName_);
	context.storey->setElevation(options_.storeyElevation_);
	context.storeyPlacement = context.storey->ObjectPlacement();

	// the model context is created on first request
	IfcSchema::IfcGeometricRepresentationContext* modelContext = context.file.getRepresentationContext(IfcObjectEnum::getString(IfcObjectID::contextModel));
	context.bodyContext = new IfcSchema::IfcGeometricRepresentationSubContext(
		IfcObjectEnum::getString(IfcObjectID::contextBody),
		IfcObjectEnum::getString(IfcObjectID::contextModel),
		modelContext,
		boost::none,
		IfcSchema::IfcGeometricProjectionEnum::IfcGeometricProjection_MODEL_VIEW,
		boost::none
	);
	context.file.addEntity(context.bodyContext);
	return;
}

void IfcExporter::addAggregate(ExportContext& context, IfcSchema::IfcObjectDefinition* parent, IfcSchema::IfcObjectDefinition* child) const
{
	auto indexIt = context.aggregateIndex.find(parent);
	if (indexIt != context.aggregateIndex.end())
	{
		context.aggregateList[indexIt->second].second->push(child);
		return;
	}

	IfcSchema::IfcObjectDefinition::list::ptr childList(new IfcSchema::IfcObjectDefinition::list);
	childList->push(child);
	context.aggregateIndex[parent] = context.aggregateList.size();
	context.aggregateList.emplace_back(parent, childList);
	return;
}

void IfcExporter::addPropertySet(ExportContext& context, IfcSchema::IfcObjectDefinition* relatedObject, const std::string& psetName, IfcSchema::IfcProperty::list::ptr propertyList) const
{
	IfcSchema::IfcPropertySet* propertySet = new IfcSchema::IfcPropertySet(IfcParse::IfcGlobalId(), context.ownerHistory, psetName, boost::none, propertyList);

	IfcSchema::IfcObjectDefinition::list::ptr relatedObjectList(new IfcSchema::IfcObjectDefinition::list);
	relatedObjectList->push(relatedObject);

	IfcSchema::IfcRelDefinesByProperties* propertyRelation = new IfcSchema::IfcRelDefinesByProperties(
		IfcParse::IfcGlobalId(),
		context.ownerHistory,
		boost::none,
		boost::none,
		relatedObjectList,
		propertySet
	);
	context.file.addEntity(propertyRelation);
	return;
}

IfcSchema::IfcElementAssembly* IfcExporter::ensureAssemblyChain(ExportContext& context, const std::vector<AssemblyNode>& assemblyPath) const
{
	IfcSchema::IfcObjectDefinition* parent = context.storey;
	IfcSchema::IfcElementAssembly* assembly = nullptr;

	int level = 0;
	for (const AssemblyNode& currentNode : assemblyPath)
	{
		level++;
		std::pair<IfcSchema::IfcObjectDefinition*, std::string> cacheKey = std::make_pair(parent, currentNode.getKey());

		auto cacheIt = context.assemblyCache.find(cacheKey);
		if (cacheIt != context.assemblyCache.end())
		{
			assembly = cacheIt->second;
			parent = assembly;
			continue;
		}

		// assemblies share the origin of the storey
		IfcSchema::IfcObjectPlacement* parentPlacement = context.storeyPlacement;
		if (assembly != nullptr) { parentPlacement = assembly->ObjectPlacement(); }

		IfcSchema::IfcElementAssembly* newAssembly = new IfcSchema::IfcElementAssembly(
			IfcParse::IfcGlobalId(),
			context.ownerHistory,
			currentNode.getName(),
			boost::none,
			boost::none,
			createLocalPlacement(parentPlacement, gp_Ax3()),
			nullptr,
			boost::none,
			boost::none,
			boost::none
		);
		context.file.addEntity(newAssembly);

		if (assembly == nullptr) { context.storeyContentList->push(newAssembly); }
		else { addAggregate(context, assembly, newAssembly); }

		IfcSchema::IfcProperty::list::ptr propertyList(new IfcSchema::IfcProperty::list);
		propertyList->push(new IfcSchema::IfcPropertySingleValue(IfcObjectEnum::getString(IfcObjectID::propLevel), boost::none, new IfcSchema::IfcInteger(level), nullptr));
		propertyList->push(new IfcSchema::IfcPropertySingleValue(IfcObjectEnum::getString(IfcObjectID::propName), boost::none, new IfcSchema::IfcLabel(currentNode.getName()), nullptr));
		if (currentNode.getKey() != currentNode.getName())
		{
			propertyList->push(new IfcSchema::IfcPropertySingleValue(IfcObjectEnum::getString(IfcObjectID::propKey), boost::none, new IfcSchema::IfcIdentifier(currentNode.getKey()), nullptr));
		}
		addPropertySet(context, newAssembly, IfcObjectEnum::getString(IfcObjectID::psetAssemblyNode), propertyList);

		context.assemblyCache[cacheKey] = newAssembly;
		assembly = newAssembly;
		parent = newAssembly;
	}
	return assembly;
}

IfcSchema::IfcFacetedBrep* IfcExporter::createFacetedBrep(const TopoDS_Shape& shape, const gp_Trsf& placementTransformation, const std::string& unitId, size_t geometryIndex, int& triangleCount) const
{
	MeshData mesh = helperFunctions::shapeToMesh(shape, options_.meshDeflection_, options_.meshAngularDeflection_);
	if (mesh.isEmpty())
	{
		throw ExportError(ErrorID::errorExportUnableToMesh, unitId, "geometry " + std::to_string(geometryIndex));
	}
	MeshData localMesh = helperFunctions::transformMesh(mesh, placementTransformation);

	// points are only created when a triangle uses them
	std::vector<IfcSchema::IfcCartesianPoint*> pointList(localMesh.vertexList_.size(), nullptr);

	IfcSchema::IfcFace::list::ptr faceList(new IfcSchema::IfcFace::list);
	for (const std::array<int, 3>& triangle : localMesh.triangleList_)
	{
		IfcSchema::IfcCartesianPoint::list::ptr loopPointList(new IfcSchema::IfcCartesianPoint::list);
		for (int vertexIndex : triangle)
		{
			if (pointList[vertexIndex] == nullptr)
			{
				const gp_Pnt& vertex = localMesh.vertexList_[vertexIndex];
				pointList[vertexIndex] = new IfcSchema::IfcCartesianPoint(std::vector<double>{ vertex.X(), vertex.Y(), vertex.Z() });
			}
			loopPointList->push(pointList[vertexIndex]);
		}

		IfcSchema::IfcFaceBound::list::ptr boundList(new IfcSchema::IfcFaceBound::list);
		boundList->push(new IfcSchema::IfcFaceOuterBound(new IfcSchema::IfcPolyLoop(loopPointList), true));
		faceList->push(new IfcSchema::IfcFace(boundList));
	}
	triangleCount += static_cast<int>(localMesh.triangleList_.size());

	return new IfcSchema::IfcFacetedBrep(new IfcSchema::IfcClosedShell(faceList));
}

IfcSchema::IfcProduct* IfcExporter::createProduct(ExportContext& context, const UnitRecord& record, ExportResult& result) const
{
	// geometry is stored relative to the unit placement
	gp_Trsf placementTransformation = helperFunctions::worldToPlacement(record.getPlacement());

	int triangleCount = 0;
	IfcSchema::IfcRepresentationItem::list::ptr itemList(new IfcSchema::IfcRepresentationItem::list);
	const std::vector<TopoDS_Shape>& geometryList = record.getGeometryList();
	for (size_t i = 0; i < geometryList.size(); i++)
	{
		itemList->push(createFacetedBrep(geometryList[i], placementTransformation, record.getId(), i, triangleCount));
	}

	IfcSchema::IfcShapeRepresentation* shapeRepresentation = new IfcSchema::IfcShapeRepresentation(
		context.bodyContext,
		IfcObjectEnum::getString(IfcObjectID::contextBody),
		IfcObjectEnum::getString(IfcObjectID::representationBrep),
		itemList
	);
	IfcSchema::IfcRepresentation::list::ptr representationList(new IfcSchema::IfcRepresentation::list);
	representationList->push(shapeRepresentation);
	IfcSchema::IfcProductDefinitionShape* productShape = new IfcSchema::IfcProductDefinitionShape(boost::none, boost::none, representationList);

	IfcSchema::IfcElementAssembly* deepestAssembly = nullptr;
	IfcSchema::IfcObjectPlacement* parentPlacement = context.storeyPlacement;
	if (record.hasAssemblyPath())
	{
		deepestAssembly = ensureAssemblyChain(context, record.getAssemblyPath());
		parentPlacement = deepestAssembly->ObjectPlacement();
	}
	IfcSchema::IfcLocalPlacement* productPlacement = createLocalPlacement(parentPlacement, record.getPlacement());

	std::string ifcClass = helperFunctions::categoryToIfcClass(record.getCategory());
	std::string productName = record.getContainerName();

	IfcSchema::IfcProduct* product = nullptr;
	if (ifcClass == "IfcMember")
	{
		product = new IfcSchema::IfcMember(
			IfcParse::IfcGlobalId(), context.ownerHistory, productName, boost::none, record.getCategory(),
			productPlacement, productShape, record.getId(), boost::none
		);
	}
	else if (ifcClass == "IfcBeam")
	{
		product = new IfcSchema::IfcBeam(
			IfcParse::IfcGlobalId(), context.ownerHistory, productName, boost::none, record.getCategory(),
			productPlacement, productShape, record.getId(), boost::none
		);
	}
	else
	{
		product = new IfcSchema::IfcBuildingElementProxy(
			IfcParse::IfcGlobalId(), context.ownerHistory, productName, boost::none, record.getCategory(),
			productPlacement, productShape, record.getId(), boost::none
		);
	}
	context.file.addEntity(product);

	if (deepestAssembly != nullptr) { addAggregate(context, deepestAssembly, product); }
	else { context.storeyContentList->push(product); }

	IfcSchema::IfcProperty::list::ptr propertyList(new IfcSchema::IfcProperty::list);
	propertyList->push(new IfcSchema::IfcPropertySingleValue(IfcObjectEnum::getString(IfcObjectID::propScope), boost::none, new IfcSchema::IfcLabel(record.getScopeString()), nullptr));
	if (record.getScope() == UnitScope::bulk)
	{
		propertyList->push(new IfcSchema::IfcPropertySingleValue(IfcObjectEnum::getString(IfcObjectID::propContainerId), boost::none, new IfcSchema::IfcIdentifier(record.getId()), nullptr));
	}
	else
	{
		propertyList->push(new IfcSchema::IfcPropertySingleValue(IfcObjectEnum::getString(IfcObjectID::propUnitId), boost::none, new IfcSchema::IfcIdentifier(record.getId()), nullptr));
	}
	propertyList->push(new IfcSchema::IfcPropertySingleValue(IfcObjectEnum::getString(IfcObjectID::propCategory), boost::none, new IfcSchema::IfcLabel(record.getCategory()), nullptr));
	propertyList->push(new IfcSchema::IfcPropertySingleValue(IfcObjectEnum::getString(IfcObjectID::propGeometryCount), boost::none, new IfcSchema::IfcInteger(static_cast<int>(geometryList.size())), nullptr));
	if (record.hasPartNames())
	{
		// one value per representation item, in item order
		IfcSchema::IfcValue::list::ptr partNoList(new IfcSchema::IfcValue::list);
		IfcSchema::IfcValue::list::ptr sourceGuidList(new IfcSchema::IfcValue::list);
		for (const std::string& partName : record.getPartNameList())
		{
			std::pair<std::string, std::string> splitName = helperFunctions::splitPartName(partName);
			partNoList->push(new IfcSchema::IfcLabel(splitName.first));
			sourceGuidList->push(new IfcSchema::IfcIdentifier(splitName.second));
		}
		propertyList->push(new IfcSchema::IfcPropertyListValue(IfcObjectEnum::getString(IfcObjectID::propPartNo), boost::none, partNoList, nullptr));
		propertyList->push(new IfcSchema::IfcPropertyListValue(IfcObjectEnum::getString(IfcObjectID::propSourceGuid), boost::none, sourceGuidList, nullptr));
	}
	addPropertySet(context, product, IfcObjectEnum::getString(IfcObjectID::psetIdentity), propertyList);

	IfcSchema::IfcProperty::list::ptr containerPropertyList(new IfcSchema::IfcProperty::list);
	if (record.getScope() == UnitScope::bulk)
	{
		containerPropertyList->push(new IfcSchema::IfcPropertySingleValue(IfcObjectEnum::getString(IfcObjectID::propContainerId), boost::none, new IfcSchema::IfcIdentifier(record.getId()), nullptr));
		addPropertySet(context, product, IfcObjectEnum::getString(IfcObjectID::psetBulk), containerPropertyList);
	}
	else
	{
		containerPropertyList->push(new IfcSchema::IfcPropertySingleValue(IfcObjectEnum::getString(IfcObjectID::propUnitId), boost::none, new IfcSchema::IfcIdentifier(record.getId()), nullptr));
		addPropertySet(context, product, IfcObjectEnum::getString(IfcObjectID::psetUnit), containerPropertyList);
	}

	nlohmann::json unitSummary = record.toJson();
	unitSummary["IfcClass"] = ifcClass;
	unitSummary["Triangles"] = triangleCount;
	result.unitSummaryList_.emplace_back(unitSummary);
	result.triangleCount_ += triangleCount;
	return product;
}

void IfcExporter::finalizeRelationships(ExportContext& context) const
{
	for (const std::pair<IfcSchema::IfcObjectDefinition*, IfcSchema::IfcObjectDefinition::list::ptr>& aggregatePair : context.aggregateList)
	{
		IfcSchema::IfcRelAggregates* aggregateRelation = new IfcSchema::IfcRelAggregates(
			IfcParse::IfcGlobalId(),
			context.ownerHistory,
			boost::none,
			boost::none,
			aggregatePair.first,
			aggregatePair.second
		);
		context.file.addEntity(aggregateRelation);
	}

	if (context.storeyContentList->size() == 0) { return; }
	IfcSchema::IfcRelContainedInSpatialStructure* containmentRelation = new IfcSchema::IfcRelContainedInSpatialStructure(
		IfcParse::IfcGlobalId(),
		context.ownerHistory,
		boost::none,
		boost::none,
		context.storeyContentList,
		context.storey
	);
	context.file.addEntity(containmentRelation);
	return;
}

void IfcExporter::writeFile(ExportContext& context, const std::string& outputPath) const
{
	try
	{
		boost::filesystem::path parentFolder = boost::filesystem::path(outputPath).parent_path();
		if (!parentFolder.empty() && !boost::filesystem::exists(parentFolder))
		{
			boost::filesystem::create_directories(parentFolder);
		}
	}
	catch (const boost::filesystem::filesystem_error& exception)
	{
		throw ExportError(ErrorID::errorExportUnableToWrite, "", exception.what());
	}

	std::ofstream outputStream(outputPath);
	if (!outputStream.is_open()) { throw ExportError(ErrorID::errorExportUnableToWrite, "", outputPath); }

	outputStream << context.file;
	outputStream.close();
	if (outputStream.fail()) { throw ExportError(ErrorID::errorExportUnableToWrite, "", outputPath); }
	return;
}

ExportResult IfcExporter::exportBatch(const ExportBatch& batch, const std::string& outputPath) const
{
	if (batch.empty()) { throw ExportError(ErrorID::errorExportEmptyBatch); }

	std::set<std::pair<UnitScope, std::string>> usedIdSet;
	for (const UnitRecord& record : batch)
	{
		if (!usedIdSet.insert(std::make_pair(record.getScope(), record.getId())).second)
		{
			throw ExportError(ErrorID::errorExportDuplicateId, record.getId());
		}
	}

	ExportResult result;
	result.outputPath_ = resolveOutputPath(outputPath, options_.storeyName_);

	ExportContext context;
	context.storeyContentList = boost::make_shared<IfcSchema::IfcProduct::list>();

	try
	{
		createSkeleton(context, boost::filesystem::path(result.outputPath_).filename().string());
	}
	catch (const IfcParse::IfcException& exception)
	{
		throw ExportError(ErrorID::errorExportIfcFailure, "", exception.what());
	}

	for (const UnitRecord& record : batch)
	{
		try
		{
			createProduct(context, record, result);
		}
		catch (const ExportError&)
		{
			throw;
		}
		catch (const Standard_Failure& failure)
		{
			std::string failureMessage = "";
			if (failure.GetMessageString() != nullptr) { failureMessage = failure.GetMessageString(); }
			throw ExportError(ErrorID::errorExportKernelFailure, record.getId(), failureMessage);
		}
		catch (const IfcParse::IfcException& exception)
		{
			throw ExportError(ErrorID::errorExportIfcFailure, record.getId(), exception.what());
		}
		catch (const std::exception& exception)
		{
			throw ExportError(ErrorID::errorExportIfcFailure, record.getId(), exception.what());
		}
	}
	result.productCount_ = static_cast<int>(batch.size());
	result.assemblyCount_ = static_cast<int>(context.assemblyCache.size());

	try
	{
		finalizeRelationships(context);
		writeFile(context, result.outputPath_);
	}
	catch (const ExportError&)
	{
		throw;
	}
	catch (const IfcParse::IfcException& exception)
	{
		throw ExportError(ErrorID::errorExportIfcFailure, "", exception.what());
	}
	catch (const std::exception& exception)
	{
		throw ExportError(ErrorID::errorExportUnableToWrite, "", exception.what());
	}
	return result;
}

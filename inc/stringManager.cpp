#include "stringManager.h"

#include <string>
#include <map>

#include <nlohmann/json.hpp>

std::string CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID id)
{
	//Include the spaces on the end for spacing
	switch (id) {
	case CommunicationStringImportanceID::indent:
		return "\t";
	case CommunicationStringImportanceID::info:
		return "[INFO] ";
	case CommunicationStringImportanceID::warning: 
		return "[WARNING] ";
	case CommunicationStringImportanceID::error:
		return "[Error] ";
	case CommunicationStringImportanceID::seperator:
		return "=============================================================";
	default:
		return "";
	}
}

std::string UnitStringEnum::getString(UnitStringID id)
{
	switch (id) {
	case UnitStringID::seconds:
		return "s";
	case UnitStringID::milliseconds:
		return "ms";
	case UnitStringID::meter:
		return "m";
	case UnitStringID::meterFull:
		return "metre";
	case UnitStringID::millimeter:
		return "mm";
	case UnitStringID::millimeterFull:
		return "millimetre";
	default:
		return "";
	}
}

std::string CommunicationStringEnum::getString(CommunicationStringID id)
{
	switch (id) {
	case CommunicationStringID::infoJsonRequest:
		return "Enter filepath of the config JSON";
	case CommunicationStringID::infoNoFilePath:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::info) + "No filepath has been supplied";
	case CommunicationStringID::infoNoValFilePath:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::info) + "No valid filepath has been supplied";
	case CommunicationStringID::infoParsingConfig:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::info) + "Parsing config: ";
	case CommunicationStringID::infoLoadingGeometry:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::info) + "Loading unit geometry";
	case CommunicationStringID::infoBuildingUnits:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::info) + "Building unit records";
	case CommunicationStringID::infoBuildingBulk:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::info) + "Building bulk records";
	case CommunicationStringID::infoAnnotatingAssemblies:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::info) + "Annotating assembly hierarchy";
	case CommunicationStringID::infoWrappingSubAssembly:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::info) + "Wrapping units in sub assembly: ";
	case CommunicationStringID::infoExportingIfc:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::info) + "Exporting IFC file";
	case CommunicationStringID::infoWritingReport:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::info) + "Writing report";

	case CommunicationStringID::indentValidConfigFound:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::indent) + "Valid config file found";
	case CommunicationStringID::indentSuccesFinished:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::indent) + "Successfully finished in: ";
	case CommunicationStringID::indentUnsuccesful:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::indent) + "Unsuccessful";
	case CommunicationStringID::indentLoadedShapes:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::indent) + "Loaded shape files: ";
	case CommunicationStringID::indentBuiltUnits:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::indent) + "Unit records: ";
	case CommunicationStringID::indentExportedProducts:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::indent) + "Exported products: ";
	case CommunicationStringID::indentExportedAssemblies:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::indent) + "Exported assemblies: ";
	case CommunicationStringID::indentWrittenTo:
		return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::indent) + "Written to: ";
	default:
		return "Output string not found";
	}
}

std::string errorWarningStringEnum::getString(ErrorID id, bool withImportance)
{
	switch (id) {
	case ErrorID::errorNoValFilePaths: {
		const std::string coms = "No valid filepath has been supplied";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms; }
		return coms; }
	case ErrorID::errorUnableToProcessFile: {
		const std::string coms = "Unable to process file(s)";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms; }
		return coms; }
	case ErrorID::errorFailedInit: {
		const std::string coms = "Unable to initialize the exporter";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms; }
		return coms; }

	case ErrorID::errorJsonInvalBool: {
		const std::string coms = "JSON file does not contain a valid bool for entry";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms + ": "; }
		return coms; }
	case ErrorID::errorJsonInvalNum: {
		const std::string coms = "JSON file does not contain a valid numeric value for entry";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms + ": "; }
		return coms; }
	case ErrorID::errorJsonInvalString: {
		const std::string coms = "JSON file does not contain a valid string for entry";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms + ": "; }
		return coms; }
	case ErrorID::errorJsonInvalPath: {
		const std::string coms = "JSON file contains a path to a file with incorrect type for entry";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms + ": "; }
		return coms; }
	case ErrorID::errorJsonNoRealPath: {
		const std::string coms = "JSON file contains an invalid path for entry";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms + ": "; }
		return coms; }
	case ErrorID::errorJsonInvalArray: {
		const std::string coms = "JSON file does not contain a valid array for entry";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms + ": "; }
		return coms; }
	case ErrorID::errorJsonInvalEntry: {
		const std::string coms = "JSON file does not contain a valid value for entry";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms + ": "; }
		return coms; }
	case ErrorID::errorJsonMissingEntry: {
		const std::string coms = "JSON file does not contain required entry";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms + ": "; }
		return coms; }
	case ErrorID::errorJsonInvalPlacement: {
		const std::string coms = "JSON file contains a placement with a zero length or parallel axis for entry";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms + ": "; }
		return coms; }
	case ErrorID::errorJsonInvalUnit: {
		const std::string coms = "JSON file contains an unsupported length unit (metre or millimetre) for entry";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms + ": "; }
		return coms; }

	case ErrorID::errorGeometryNoFile: {
		const std::string coms = "Geometry file cannot be found";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms + ": "; }
		return coms; }
	case ErrorID::errorGeometryUnsupportedFormat: {
		const std::string coms = "Geometry file is not a STEP or BREP file";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms + ": "; }
		return coms; }
	case ErrorID::errorGeometryUnreadable: {
		const std::string coms = "Geometry file could not be read";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms + ": "; }
		return coms; }
	case ErrorID::errorGeometryEmpty: {
		const std::string coms = "Geometry file does not contain any shape";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms + ": "; }
		return coms; }

	case ErrorID::errorUnitNoId: {
		const std::string coms = "Unit record has no id";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms; }
		return coms; }
	case ErrorID::errorUnitNoGeometry: {
		const std::string coms = "Unit record has no geometry";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms; }
		return coms; }
	case ErrorID::errorUnitDuplicateId: {
		const std::string coms = "Unit id is used more than once";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms; }
		return coms; }
	case ErrorID::errorBulkNoContainerId: {
		const std::string coms = "Bulk record has no container id";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms; }
		return coms; }
	case ErrorID::errorBulkNoCategory: {
		const std::string coms = "Bulk record has no category";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms; }
		return coms; }
	case ErrorID::errorMismatchedLength: {
		const std::string coms = "Unit input lists do not have matching lengths";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms; }
		return coms; }

	case ErrorID::errorExportEmptyBatch: {
		const std::string coms = "No unit records have been supplied for export";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms; }
		return coms; }
	case ErrorID::errorExportDuplicateId: {
		const std::string coms = "Export batch contains a duplicate unit id";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms; }
		return coms; }
	case ErrorID::errorExportUnableToMesh: {
		const std::string coms = "Unit geometry could not be meshed";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms; }
		return coms; }
	case ErrorID::errorExportKernelFailure: {
		const std::string coms = "Geometry kernel failed while processing unit";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms; }
		return coms; }
	case ErrorID::errorExportIfcFailure: {
		const std::string coms = "IFC entity creation failed for unit";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms; }
		return coms; }
	case ErrorID::errorExportUnableToWrite: {
		const std::string coms = "IFC file could not be written";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::error) + coms; }
		return coms; }

	case ErrorID::warningIssueencountered: {
		const std::string coms = "Issue encountered";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::warning) + coms; }
		return coms; }
	case ErrorID::warningNoHierarchyMatch: {
		const std::string coms = "Hierarchy entry does not match any unit";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::warning) + coms; }
		return coms; }
	case ErrorID::warningEmptySubAssemblyName: {
		const std::string coms = "Sub assembly without name has been ignored";
		if (withImportance) { return CommunicationStringImportanceEnum::getString(CommunicationStringImportanceID::warning) + coms; }
		return coms; }
	default:
		return "";
	}
}

std::string fileExtensionEnum::getString(fileExtensionID id)
{
	switch (id) {
	case fileExtensionID::JSON:
		return ".json";
	case fileExtensionID::IFC:
		return ".ifc";
	case fileExtensionID::STEP:
		return ".step";
	case fileExtensionID::STP:
		return ".stp";
	case fileExtensionID::BREP:
		return ".brep";
	case fileExtensionID::dash:
		return "_";

	case fileExtensionID::reportSuffix:
		return getString(fileExtensionID::dash) + "report" + getString(fileExtensionID::JSON);
	case fileExtensionID::multiUnitSuffix:
		return getString(fileExtensionID::dash) + "multi_units" + getString(fileExtensionID::IFC);
	default:
		return "";
	}
}

std::string JsonObjectInEnum::getString(JsonObjectInID id)
{
	switch (id) {
	case JsonObjectInID::outputReport:
		return "Output report";
	case JsonObjectInID::silent:
		return "Silent";
	case JsonObjectInID::filePaths:
		return "Filepaths";
	case JsonObjectInID::filePathOutput:
		return "Output";
	case JsonObjectInID::filePathReport:
		return "Report";

	case JsonObjectInID::IFC:
		return "IFC";
	case JsonObjectInID::IFCProjectName:
		return "Project name";
	case JsonObjectInID::IFCStoreyName:
		return "Storey name";
	case JsonObjectInID::IFCStoreyElevation:
		return "Storey elevation";
	case JsonObjectInID::IFCLengthUnit:
		return "Length unit";
	case JsonObjectInID::IFCMeshDeflection:
		return "Mesh deflection";
	case JsonObjectInID::IFCMeshAngularDeflection:
		return "Mesh angular deflection";

	case JsonObjectInID::units:
		return "Units";
	case JsonObjectInID::unitsIds:
		return "Ids";
	case JsonObjectInID::unitsGeometry:
		return "Geometry";
	case JsonObjectInID::unitsPlacements:
		return "Placements";
	case JsonObjectInID::unitsCategories:
		return "Categories";

	case JsonObjectInID::placementOrigin:
		return "Origin";
	case JsonObjectInID::placementZAxis:
		return "Z axis";
	case JsonObjectInID::placementXAxis:
		return "X axis";

	case JsonObjectInID::bulk:
		return "Bulk";
	case JsonObjectInID::bulkContainerId:
		return "Container id";
	case JsonObjectInID::bulkCategory:
		return "Category";
	case JsonObjectInID::bulkGeometry:
		return "Geometry";

	case JsonObjectInID::hierarchy:
		return "Hierarchy";

	case JsonObjectInID::subAssemblies:
		return "Sub assemblies";
	case JsonObjectInID::subAssemblyName:
		return "Name";
	case JsonObjectInID::subAssemblyKeySuffix:
		return "Key suffix";
	default:
		return "";
	}
}

std::string IfcObjectEnum::getString(IfcObjectID id)
{
	switch (id) {
	case IfcObjectID::originatingSystem:
		return "IFC_UnitExporter";
	case IfcObjectID::defaultProjectSuffix:
		return "_Export";
	case IfcObjectID::defaultStoreyName:
		return "Level_01";
	case IfcObjectID::defaultSite:
		return "Default Site";
	case IfcObjectID::defaultBuilding:
		return "Default Building";

	case IfcObjectID::contextModel:
		return "Model";
	case IfcObjectID::contextBody:
		return "Body";
	case IfcObjectID::representationBrep:
		return "Brep";

	case IfcObjectID::unitPrefix:
		return "Unit_";
	case IfcObjectID::bulkPrefix:
		return "Bulk_";
	case IfcObjectID::scopeUnit:
		return "UNIT";
	case IfcObjectID::scopeBulk:
		return "BULK";

	case IfcObjectID::categoryUnspecified:
		return "Unspecified";
	case IfcObjectID::categoryVertical:
		return "vertical";
	case IfcObjectID::categoryHorizontal:
		return "horizontal";

	case IfcObjectID::propPartNo:
		return "PartNo";
	case IfcObjectID::propSourceGuid:
		return "SourceGuid";
	case IfcObjectID::psetUnit:
		return "Pset_Unit";
	case IfcObjectID::psetBulk:
		return "Pset_Bulk";

	case IfcObjectID::psetIdentity:
		return "Pset_CWIdentity";
	case IfcObjectID::propScope:
		return "Scope";
	case IfcObjectID::propUnitId:
		return "UnitId";
	case IfcObjectID::propContainerId:
		return "ContainerId";
	case IfcObjectID::propCategory:
		return "Category";
	case IfcObjectID::propGeometryCount:
		return "GeometryCount";

	case IfcObjectID::psetAssemblyNode:
		return "Pset_AssemblyNode";
	case IfcObjectID::propLevel:
		return "Level";
	case IfcObjectID::propName:
		return "Name";
	case IfcObjectID::propKey:
		return "Key";
	default:
		return "";
	}
}

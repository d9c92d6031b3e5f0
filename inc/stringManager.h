#include <string>
#include <map>

#include "errorCollection.h"

#include <nlohmann/json.hpp>

#ifndef STRINGMANAGER_H
#define STRINGMANAGER_H

// collects all the importance elements in communication with the user
enum class CommunicationStringImportanceID
{
	indent,
	info,
	warning,
	error,
	seperator
};

class CommunicationStringImportanceEnum {
public:
	static std::string getString(CommunicationStringImportanceID id);
};

// collects all the unit names for user comms, reports, and input
enum class UnitStringID {
	seconds,
	milliseconds,
	meter,
	meterFull,
	millimeter,
	millimeterFull
};

class UnitStringEnum {
public:
	static std::string getString(UnitStringID id);
};

// collects all the normal cout communication with the user
enum class CommunicationStringID {
	infoJsonRequest,
	infoNoFilePath,
	infoNoValFilePath,
	infoParsingConfig,
	infoLoadingGeometry,
	infoBuildingUnits,
	infoBuildingBulk,
	infoAnnotatingAssemblies,
	infoWrappingSubAssembly,
	infoExportingIfc,
	infoWritingReport,

	indentValidConfigFound,
	indentSuccesFinished,
	indentUnsuccesful,
	indentLoadedShapes,
	indentBuiltUnits,
	indentExportedProducts,
	indentExportedAssemblies,
	indentWrittenTo
};

class CommunicationStringEnum {
public:
	static std::string getString(CommunicationStringID id);
};

// collects all the errors and warnings for both cout and error object description
class errorWarningStringEnum {
public:
	static std::string getString(ErrorID id, bool withImportance = true);
};

/// collects all the file extension of the input and output
enum class fileExtensionID {
	JSON,
	IFC,
	STEP,
	STP,
	BREP,
	dash,

	reportSuffix,
	multiUnitSuffix
};

class fileExtensionEnum {
public:
	static std::string getString(fileExtensionID id);
};

// collects all the JSON object of the config files
enum class JsonObjectInID {
	outputReport,
	silent,
	filePaths,
	filePathOutput,
	filePathReport,

	IFC,
	IFCProjectName,
	IFCStoreyName,
	IFCStoreyElevation,
	IFCLengthUnit,
	IFCMeshDeflection,
	IFCMeshAngularDeflection,

	units,
	unitsIds,
	unitsGeometry,
	unitsPlacements,
	unitsCategories,

	placementOrigin,
	placementZAxis,
	placementXAxis,

	bulk,
	bulkContainerId,
	bulkCategory,
	bulkGeometry,

	hierarchy,

	subAssemblies,
	subAssemblyName,
	subAssemblyKeySuffix
};

class JsonObjectInEnum {
public:
	static std::string getString(JsonObjectInID id);
};

// collects the names and values that are written into the IFC file
enum class IfcObjectID {
	originatingSystem,
	defaultProjectSuffix,
	defaultStoreyName,
	defaultSite,
	defaultBuilding,

	contextModel,
	contextBody,
	representationBrep,

	unitPrefix,
	bulkPrefix,
	scopeUnit,
	scopeBulk,

	categoryUnspecified,
	categoryVertical,
	categoryHorizontal,

	psetIdentity,
	propScope,
	propUnitId,
	propContainerId,
	propCategory,
	propGeometryCount,
	propPartNo,
	propSourceGuid,

	psetUnit,
	psetBulk,

	psetAssemblyNode,
	propLevel,
	propName,
	propKey
};

class IfcObjectEnum {
public:
	static std::string getString(IfcObjectID id);
};

#endif // STRINGMANAGER_H

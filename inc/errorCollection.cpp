#include "errorCollection.h"
#include "stringManager.h"

#include <algorithm>
#include <map>
#include <nlohmann/json.hpp>

ErrorObject::ErrorObject(const std::string& errorCode, const std::string& errorDescript)
{
	errorCode_ = errorCode;
	errorDescript_ = errorDescript;
	occuringObjectList_ = {};
}

ErrorObject::ErrorObject(const std::string& errorCode, const std::string& errorDescript, const std::string& occuringObb)
{
	errorCode_ = errorCode;
	errorDescript_ = errorDescript;
	occuringObjectList_ = { occuringObb };
}

nlohmann::json ErrorObject::toJson() const
{
	nlohmann::json jsonObject;
	jsonObject["ErrorCode"] = errorCode_;
	jsonObject["Error Description"] = errorDescript_;

	if (occuringObjectList_.size()) { jsonObject["Occuring Objects"] = occuringObjectList_; }
	return jsonObject;
}

void ErrorObject::addOccuringObject(const std::string& obb) {
	if (std::find(occuringObjectList_.begin(), occuringObjectList_.end(), obb) != occuringObjectList_.end()) { return;}
	occuringObjectList_.emplace_back(obb);
	return;
}

ErrorCollection::ErrorCollection() {
	errorCollection_ = {};
	errorMap_ = {
		{ErrorID::errorNoValFilePaths, ErrorObject("I0001", errorWarningStringEnum::getString(ErrorID::errorNoValFilePaths, false))},
		{ErrorID::errorUnableToProcessFile, ErrorObject("I0002", errorWarningStringEnum::getString(ErrorID::errorUnableToProcessFile, false))},
		{ErrorID::errorFailedInit, ErrorObject("I0003", errorWarningStringEnum::getString(ErrorID::errorFailedInit, false))},

		{ErrorID::errorJsonInvalBool, ErrorObject("J0001", errorWarningStringEnum::getString(ErrorID::errorJsonInvalBool, false))},
		{ErrorID::errorJsonInvalNum, ErrorObject("J0002", errorWarningStringEnum::getString(ErrorID::errorJsonInvalNum, false))},
		{ErrorID::errorJsonInvalString, ErrorObject("J0003", errorWarningStringEnum::getString(ErrorID::errorJsonInvalString, false))},
		{ErrorID::errorJsonInvalPath, ErrorObject("J0004", errorWarningStringEnum::getString(ErrorID::errorJsonInvalPath, false))},
		{ErrorID::errorJsonNoRealPath, ErrorObject("J0005", errorWarningStringEnum::getString(ErrorID::errorJsonNoRealPath, false))},
		{ErrorID::errorJsonInvalArray, ErrorObject("J0006", errorWarningStringEnum::getString(ErrorID::errorJsonInvalArray, false))},
		{ErrorID::errorJsonInvalEntry, ErrorObject("J0007", errorWarningStringEnum::getString(ErrorID::errorJsonInvalEntry, false))},
		{ErrorID::errorJsonMissingEntry, ErrorObject("J0008", errorWarningStringEnum::getString(ErrorID::errorJsonMissingEntry, false))},
		{ErrorID::errorJsonInvalPlacement, ErrorObject("J0009", errorWarningStringEnum::getString(ErrorID::errorJsonInvalPlacement, false))},
		{ErrorID::errorJsonInvalUnit, ErrorObject("J0010", errorWarningStringEnum::getString(ErrorID::errorJsonInvalUnit, false))},

		{ErrorID::errorGeometryNoFile, ErrorObject("G0001", errorWarningStringEnum::getString(ErrorID::errorGeometryNoFile, false))},
		{ErrorID::errorGeometryUnsupportedFormat, ErrorObject("G0002", errorWarningStringEnum::getString(ErrorID::errorGeometryUnsupportedFormat, false))},
		{ErrorID::errorGeometryUnreadable, ErrorObject("G0003", errorWarningStringEnum::getString(ErrorID::errorGeometryUnreadable, false))},
		{ErrorID::errorGeometryEmpty, ErrorObject("G0004", errorWarningStringEnum::getString(ErrorID::errorGeometryEmpty, false))},

		{ErrorID::errorUnitNoId, ErrorObject("V0001", errorWarningStringEnum::getString(ErrorID::errorUnitNoId, false))},
		{ErrorID::errorUnitNoGeometry, ErrorObject("V0002", errorWarningStringEnum::getString(ErrorID::errorUnitNoGeometry, false))},
		{ErrorID::errorUnitDuplicateId, ErrorObject("V0003", errorWarningStringEnum::getString(ErrorID::errorUnitDuplicateId, false))},
		{ErrorID::errorBulkNoContainerId, ErrorObject("V0004", errorWarningStringEnum::getString(ErrorID::errorBulkNoContainerId, false))},
		{ErrorID::errorBulkNoCategory, ErrorObject("V0005", errorWarningStringEnum::getString(ErrorID::errorBulkNoCategory, false))},
		{ErrorID::errorMismatchedLength, ErrorObject("V0006", errorWarningStringEnum::getString(ErrorID::errorMismatchedLength, false))},

		{ErrorID::errorExportEmptyBatch, ErrorObject("E0001", errorWarningStringEnum::getString(ErrorID::errorExportEmptyBatch, false))},
		{ErrorID::errorExportDuplicateId, ErrorObject("E0002", errorWarningStringEnum::getString(ErrorID::errorExportDuplicateId, false))},
		{ErrorID::errorExportUnableToMesh, ErrorObject("E0003", errorWarningStringEnum::getString(ErrorID::errorExportUnableToMesh, false))},
		{ErrorID::errorExportKernelFailure, ErrorObject("E0004", errorWarningStringEnum::getString(ErrorID::errorExportKernelFailure, false))},
		{ErrorID::errorExportIfcFailure, ErrorObject("E0005", errorWarningStringEnum::getString(ErrorID::errorExportIfcFailure, false))},
		{ErrorID::errorExportUnableToWrite, ErrorObject("E0006", errorWarningStringEnum::getString(ErrorID::errorExportUnableToWrite, false))},

		{ErrorID::warningIssueencountered, ErrorObject("W0000", errorWarningStringEnum::getString(ErrorID::warningIssueencountered, false))},
		{ErrorID::warningNoHierarchyMatch, ErrorObject("W0001", errorWarningStringEnum::getString(ErrorID::warningNoHierarchyMatch, false))},
		{ErrorID::warningEmptySubAssemblyName, ErrorObject("W0002", errorWarningStringEnum::getString(ErrorID::warningEmptySubAssemblyName, false))}
	};
}

void ErrorCollection::addError(ErrorID id, const std::string& objectName)
{
	std::lock_guard<std::mutex> errorLock(dataMutex_);
	//search if error is present ignore or add object
	if (errorCollection_.find(id) != errorCollection_.end())
	{
		if (objectName != "")
		{
			errorCollection_[id].addOccuringObject(objectName);
		}
		return;
	}

	// new error and add object
	ErrorObject errorObject = errorMap_[id];
	if (objectName != "") { errorObject.addOccuringObject(objectName); }
	errorCollection_[id] = errorObject;
	return;
}

void ErrorCollection::clear()
{
	std::lock_guard<std::mutex> errorLock(dataMutex_);
	errorCollection_.clear();
	return;
}

nlohmann::json ErrorCollection::toJson() const
{
	nlohmann::json jsonList = nlohmann::json::array();
	for (const std::pair<const ErrorID, ErrorObject>& errorPair : errorCollection_)
	{
		jsonList.emplace_back(errorPair.second.toJson());
	}
	return jsonList;
}

std::string UnitExportException::composeMessage(ErrorID id, const std::string& unitId, const std::string& detail)
{
	std::string message = errorWarningStringEnum::getString(id, false);
	if (unitId != "") { message += " (unit: " + unitId + ")"; }
	if (detail != "") { message += ": " + detail; }
	return message;
}

UnitExportException::UnitExportException(ErrorID id, const std::string& unitId, const std::string& detail)
	: std::runtime_error(composeMessage(id, unitId, detail)),
	errorId_(id),
	unitId_(unitId)
{
}

MismatchedLengthError::MismatchedLengthError(const std::string& listName, size_t expectedSize, size_t foundSize)
	: UnitExportException(
		ErrorID::errorMismatchedLength,
		"",
		listName + " has " + std::to_string(foundSize) + " items, expected " + std::to_string(expectedSize))
{
}

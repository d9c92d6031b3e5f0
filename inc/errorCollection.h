#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#ifndef ERRORCOLLECTION_ERRORCOLLECTION_H
#define ERRORCOLLECTION_ERRORCOLLECTION_H
enum class ErrorID {
	errorNoValFilePaths,
	errorUnableToProcessFile,
	errorFailedInit,

	errorJsonInvalBool,
	errorJsonInvalNum,
	errorJsonInvalString,
	errorJsonInvalPath,
	errorJsonNoRealPath,
	errorJsonInvalArray,
	errorJsonInvalEntry,
	errorJsonMissingEntry,
	errorJsonInvalPlacement,
	errorJsonInvalUnit,

	errorGeometryNoFile,
	errorGeometryUnsupportedFormat,
	errorGeometryUnreadable,
	errorGeometryEmpty,

	errorUnitNoId,
	errorUnitNoGeometry,
	errorUnitDuplicateId,
	errorBulkNoContainerId,
	errorBulkNoCategory,
	errorMismatchedLength,

	errorExportEmptyBatch,
	errorExportDuplicateId,
	errorExportUnableToMesh,
	errorExportKernelFailure,
	errorExportIfcFailure,
	errorExportUnableToWrite,

	warningIssueencountered,
	warningNoHierarchyMatch,
	warningEmptySubAssemblyName
};

struct ErrorObject {
	std::string errorCode_;
	std::string errorDescript_;
	std::vector<std::string> occuringObjectList_;

	ErrorObject() {};

	ErrorObject(
		const std::string& errorCode,
		const std::string& errorDescript
	);

	ErrorObject(
		const std::string& errorCode,
		const std::string& errorDescript,
		const std::string& occuringObb
	);

	nlohmann::json toJson() const;

	void addOccuringObject(const std::string& obb);
};

struct ErrorCollection {
private:
	//Errors and issues present in this process
	std::map<ErrorID, ErrorObject> errorCollection_;
	// collection of all the possible errors and issues
	std::map<ErrorID, ErrorObject> errorMap_;

	//Prevents datarace when writing to the instance
	std::mutex dataMutex_;

	explicit ErrorCollection();

public:
	static ErrorCollection& getInstance() {
		static ErrorCollection instance;
		return instance;
	}

	// disable asignement and copying
	ErrorCollection(const ErrorCollection&) = delete;
	ErrorCollection& operator=(const ErrorCollection&) = delete;

	void addError(ErrorID id, const std::string& objectName = "");
	void clear();

	bool hasError() const { return !errorCollection_.empty(); }
	bool hasError(ErrorID id) const { return errorCollection_.find(id) != errorCollection_.end(); }
	const std::map<ErrorID, ErrorObject>& getErrorCollection() const { return errorCollection_; }

	nlohmann::json toJson() const;
};

/// <summary>
/// Base of the failures raised by the unit export pipeline, carries the error id and the unit it occured on
/// </summary>
class UnitExportException : public std::runtime_error {
private:
	ErrorID errorId_;
	std::string unitId_;

	static std::string composeMessage(ErrorID id, const std::string& unitId, const std::string& detail);

public:
	UnitExportException(ErrorID id, const std::string& unitId = "", const std::string& detail = "");

	ErrorID getErrorId() const { return errorId_; }
	const std::string& getUnitId() const { return unitId_; }
};

// malformed unit record construction
class ValidationError : public UnitExportException {
public:
	using UnitExportException::UnitExportException;
};

// parallel input lists that disagree in length
class MismatchedLengthError : public UnitExportException {
public:
	MismatchedLengthError(const std::string& listName, size_t expectedSize, size_t foundSize);
};

// failure of the ifc authoring or geometry library while exporting
class ExportError : public UnitExportException {
public:
	using UnitExportException::UnitExportException;
};
#endif // ERRORCOLLECTION_ERRORCOLLECTION_H

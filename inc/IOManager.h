#include "helper.h"
#include "geometryLoader.h"
#include "ifcExporter.h"
#include "settingsCollection.h"
#include "stringManager.h"
#include "unitRecord.h"

#include <functional>
#include <memory>
#include <string>
#include <vector>

#ifndef IOMANAGER_IOMANAGER_H
#define IOMANAGER_IOMANAGER_H

/// <summary>
/// Manages and facilitates the communication between the user and the rest of the application
/// </summary>
class IOManager {
private:
	GeometryLoader geometryLoader_;

	ExportBatch batch_;
	std::unique_ptr<ExportResult> exportResult_;

	// time summary for the output
	long long timeLoading_ = 0;
	long long timeBuilding_ = 0;
	long long timeAnnotating_ = 0;
	long long timeExporting_ = 0;

	// 1 if all the steps were succesfull
	bool succesfullExit_ = 1;

	// get target path from user when program is started with no args
	std::string getTargetPath();
	// attempts to get the settings from json file
	bool getJSONValues(const std::string& inputPath);

	// console outputs the settings that are utilized
	void printSummary();
	// console output the encountered errors
	void printErrors();
	// outputs yes or no based on a input bool
	std::string boolToString(const bool boolValue);

	// returns a json object that is populated with the settings in the settingsobject
	nlohmann::json settingsToJSON();
	// copies the ifc related settings into the exporter options
	ExportOptions getExportOptions();

	// loads all the files of a geometry group, failures are stored and rethrown as string
	std::vector<TopoDS_Shape> loadGeometryGroup(const std::vector<std::string>& pathList);
	// the geometry files are named [PartNo]_[GUID]
	std::vector<std::string> getPartNameList(const std::vector<std::string>& pathList);

	/// load the geometry and turn the unit and bulk input into the batch
	void buildBatch();
	/// apply the hierarchy and the sub assemblies to the batch
	void annotateBatch();
	/// write the batch to the ifc file
	void exportBatch();

	/// process, collect errors and clock a single step of the export
	bool processStep(const std::function<void()>& stepFunc, long long& timeRecord);

public:

	bool init(const std::vector<std::string>& inputPathList);

	bool run();

	bool write(bool reportOnly = false);

	const ExportBatch& getBatch() const { return batch_; }
	const ExportResult* getExportResult() const { return exportResult_.get(); }
};

#endif // IOMANAGER_IOMANAGER_H

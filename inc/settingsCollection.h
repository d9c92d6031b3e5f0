#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include "helper.h"

#ifndef SETTINGSCOLLECTION_SETTINGSCOLLECTION_H
#define SETTINGSCOLLECTION_SETTINGSCOLLECTION_H

// loose geometry that is exported as a single bulk product
struct BulkInput {
	std::string containerId_;
	std::string category_;
	std::vector<std::string> geometryPathList_;
};

// extra outer assembly level that is wrapped around every unit
struct SubAssemblyInput {
	std::string name_;
	std::string keySuffix_;
};

// collection of all the settings used by the exporter, both user set and the unit input
struct SettingsCollection {

private:
	// if true no comminucation is pushed to console
	bool isSilent_ = false;

	std::string InputJsonPath_ = "";
	std::string outputIFCPath_ = "";
	std::string outputReportPath_ = "";

	bool writeReport_ = true;

	// ifc file settings
	std::string projectName_ = "";
	std::string storeyName_ = "Level_01";
	double storeyElevation_ = 0;
	bool lengthInMetre_ = false;
	double meshDeflection_ = 0.5;
	double meshAngularDeflection_ = 0.5;

	// unit input, all lists are index aligned
	std::vector<std::string> unitIdList_ = {};
	std::vector<std::vector<std::string>> unitGeometryPathList_ = {};
	std::vector<gp_Ax3> unitPlacementList_ = {};
	std::vector<std::string> unitCategoryList_ = {};

	std::vector<BulkInput> bulkInputList_ = {};

	// unit id to assembly labels ordered from root to unit
	std::map<std::string, std::vector<std::string>> hierarchyMap_ = {};
	std::vector<SubAssemblyInput> subAssemblyList_ = {};

	SettingsCollection() = default;

	// resolves a geometry path relative to the config file and validates it
	std::string getGeometryPath(const nlohmann::json& jsonPathValue);
	// reads a placement object {"Origin", "Z axis", "X axis"}
	gp_Ax3 getPlacement(const nlohmann::json& jsonPlacement);

public:
	static SettingsCollection& getInstance() {
		static SettingsCollection instance;
		return instance;
	}

	// disable asignement and copying
	SettingsCollection(const SettingsCollection&) = delete;
	SettingsCollection& operator=(const SettingsCollection&) = delete;

	// clears all the read values and restores the defaults
	void reset();

	bool isSilent() const { return isSilent_; }
	void setSilent(bool value) { isSilent_ = value; }
	void setSilent(const nlohmann::json& json);

	// check if path is valid and stores it
	void setInputJSONPath(const std::string& inputString, bool validate);
	const std::string& getInputJSONPath() const { return InputJsonPath_; }

	// populates the output and report paths
	void setIOPaths(const nlohmann::json& json);
	const std::string& getOutputIFCPath() const { return outputIFCPath_; }
	void setOutputIFCPath(const std::string& value) { outputIFCPath_ = value; }
	const std::string& getOutputReportPath() const { return outputReportPath_; }
	void setOutputReportPath(const std::string& value) { outputReportPath_ = value; }

	bool writeReport() const { return writeReport_; }
	void setWriteReport(bool value) { writeReport_ = value; }
	void setWriteReport(const nlohmann::json& json);

	// read and store the ifc file related settings
	void setIFCRelatedSettings(const nlohmann::json& json);

	// the project name falls back to <storey name>_Export
	std::string getProjectName() const;
	void setProjectName(const std::string& value) { projectName_ = value; }
	const std::string& getStoreyName() const { return storeyName_; }
	void setStoreyName(const std::string& value) { storeyName_ = value; }
	double getStoreyElevation() const { return storeyElevation_; }
	void setStoreyElevation(double value) { storeyElevation_ = value; }
	bool lengthInMetre() const { return lengthInMetre_; }
	void setLengthInMetre(bool value) { lengthInMetre_ = value; }
	double getMeshDeflection() const { return meshDeflection_; }
	void setMeshDeflection(double value) { meshDeflection_ = value; }
	double getMeshAngularDeflection() const { return meshAngularDeflection_; }
	void setMeshAngularDeflection(double value) { meshAngularDeflection_ = value; }

	// read and store the unit, bulk, hierarchy and sub assembly input
	void setUnitInput(const nlohmann::json& json);
	void setBulkInput(const nlohmann::json& json);
	void setHierarchy(const nlohmann::json& json);
	void setSubAssemblies(const nlohmann::json& json);

	const std::vector<std::string>& getUnitIdList() const { return unitIdList_; }
	const std::vector<std::vector<std::string>>& getUnitGeometryPathList() const { return unitGeometryPathList_; }
	const std::vector<gp_Ax3>& getUnitPlacementList() const { return unitPlacementList_; }
	const std::vector<std::string>& getUnitCategoryList() const { return unitCategoryList_; }
	const std::vector<BulkInput>& getBulkInputList() const { return bulkInputList_; }
	const std::map<std::string, std::vector<std::string>>& getHierarchyMap() const { return hierarchyMap_; }
	const std::vector<SubAssemblyInput>& getSubAssemblyList() const { return subAssemblyList_; }
};

// typed json getters, throw an ErrorID when the value is not valid
bool getJsonBoolValue(const nlohmann::json& jsonBoolValue);
double getJsonDouble(const nlohmann::json& jsonDouleValue);
std::string getJsonString(const nlohmann::json& jsonStringValue);
std::string getJsonPath(const nlohmann::json& jsonStringValue, bool mustExist, const std::string& fileExtension);
std::vector<std::string> getJsonStringList(const nlohmann::json& jsonArrayValue);

#endif // SETTINGSCOLLECTION_SETTINGSCOLLECTION_H

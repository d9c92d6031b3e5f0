#include "inc/IOManager.h"
#include "inc/errorCollection.h"
#include "inc/settingsCollection.h"

#include <gtest/gtest.h>

#include <BRepPrimAPI_MakeBox.hxx>
#include <BRepTools.hxx>

#include <boost/filesystem.hpp>

#include <algorithm>
#include <fstream>

class utIOManager : public ::testing::Test {
protected:
	boost::filesystem::path workFolder_;

	void SetUp() override
	{
		SettingsCollection::getInstance().reset();
		ErrorCollection::getInstance().clear();

		workFolder_ = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("utIOManager_%%%%%%");
		boost::filesystem::create_directories(workFolder_ / "geometry");
		BRepTools::Write(BRepPrimAPI_MakeBox(1200.0, 20.0, 3000.0).Shape(), (workFolder_ / "geometry" / "GL-1200_3f9a1c2e.brep").string().c_str());
		BRepTools::Write(BRepPrimAPI_MakeBox(60.0, 150.0, 3000.0).Shape(), (workFolder_ / "geometry" / "FR-60.brep").string().c_str());
	}

	void TearDown() override
	{
		SettingsCollection::getInstance().reset();
		ErrorCollection::getInstance().clear();

		boost::system::error_code errorCode;
		boost::filesystem::remove_all(workFolder_, errorCode);
	}

	nlohmann::json makeConfig()
	{
		return {
			{ "Filepaths", {
				{ "Output", (workFolder_ / "export").string() },
				{ "Report", (workFolder_ / "export" / "report.json").string() }
			}},
			{ "Output report", true },
			{ "Silent", true },
			{ "IFC", { { "Storey name", "Level_02" } } },
			{ "Units", {
				{ "Ids", { "U1", "U2" } },
				{ "Geometry", { "geometry/GL-1200_3f9a1c2e.brep", { "geometry/GL-1200_3f9a1c2e.brep", "geometry/FR-60.brep" } } },
				{ "Placements", { { { "Origin", { 0, 0, 0 } } }, { { "Origin", { 1200, 0, 0 } } } } }
			}},
			{ "Bulk", {
				{ { "Container id", "Brackets" }, { "Category", "Bracket" }, { "Geometry", { "geometry/FR-60.brep" } } }
			}},
			{ "Hierarchy", {
				{ "U1", { "Facade North" } },
				{ "U9", { "Facade North" } }
			}},
			{ "Sub assemblies", { "Tower A", "  " } }
		};
	}

	std::string writeConfig(const nlohmann::json& config)
	{
		std::string configPath = (workFolder_ / "config.json").string();
		std::ofstream configFile(configPath);
		configFile << config.dump(4);
		configFile.close();
		return configPath;
	}

	nlohmann::json readReport()
	{
		std::ifstream reportFile((workFolder_ / "export" / "report.json").string());
		return nlohmann::json::parse(reportFile);
	}

	std::vector<std::string> getErrorCodeList(const nlohmann::json& report)
	{
		std::vector<std::string> errorCodeList;
		for (const nlohmann::json& errorJson : report["Errors"]) { errorCodeList.emplace_back(errorJson["ErrorCode"].get<std::string>()); }
		return errorCodeList;
	}
};

TEST_F(utIOManager, runsConfigToIfcAndReport)
{
	IOManager manager;
	ASSERT_TRUE(manager.init({ writeConfig(makeConfig()) }));
	ASSERT_TRUE(manager.run());
	ASSERT_TRUE(manager.write());

	const ExportBatch& batch = manager.getBatch();
	ASSERT_EQ(3u, batch.size());
	EXPECT_EQ(UnitScope::bulk, batch[2].getScope());
	EXPECT_EQ(std::vector<std::string>({ "GL-1200_3f9a1c2e", "FR-60" }), batch[1].getPartNameList());

	// the sub assembly wraps every record, the hierarchy sits below it
	EXPECT_EQ(std::vector<std::string>({ "Tower A", "Facade North" }), batch[0].getAssemblyLabels());
	EXPECT_EQ(std::vector<std::string>({ "Tower A" }), batch[1].getAssemblyLabels());

	const ExportResult* exportResult = manager.getExportResult();
	ASSERT_NE(nullptr, exportResult);
	EXPECT_EQ(3, exportResult->productCount_);
	EXPECT_EQ((workFolder_ / "export" / "Level_02_multi_units.ifc").string(), exportResult->outputPath_);
	EXPECT_TRUE(boost::filesystem::exists(exportResult->outputPath_));

	nlohmann::json report = readReport();
	EXPECT_EQ("Level_02", report["Input settings"]["IFC"]["Storey name"].get<std::string>());
	EXPECT_EQ(3, report["Export"]["Products"].get<int>());
	EXPECT_TRUE(report.contains("Duration"));

	// unmatched hierarchy id and blank sub assembly name are warnings only
	std::vector<std::string> expectedCodeList = { "W0001", "W0002" };
	EXPECT_EQ(expectedCodeList, getErrorCodeList(report));
	const nlohmann::json& hierarchyWarning = report["Errors"][0];
	ASSERT_TRUE(hierarchyWarning.contains("Occuring Objects"));
	EXPECT_EQ("U9", hierarchyWarning["Occuring Objects"][0].get<std::string>());
}

TEST_F(utIOManager, mismatchedUnitInputFailsRun)
{
	nlohmann::json config = makeConfig();
	config["Units"]["Ids"] = { "U1", "U2", "U3" };

	IOManager manager;
	ASSERT_TRUE(manager.init({ writeConfig(config) }));
	EXPECT_FALSE(manager.run());
	EXPECT_EQ(nullptr, manager.getExportResult());
	EXPECT_TRUE(ErrorCollection::getInstance().hasError(ErrorID::errorMismatchedLength));

	ASSERT_TRUE(manager.write());
	nlohmann::json report = readReport();
	EXPECT_FALSE(report.contains("Export"));
	std::vector<std::string> errorCodeList = getErrorCodeList(report);
	EXPECT_NE(errorCodeList.end(), std::find(errorCodeList.begin(), errorCodeList.end(), "V0006"));
	EXPECT_FALSE(boost::filesystem::exists(workFolder_ / "export" / "Level_02_multi_units.ifc"));
}

TEST_F(utIOManager, unwritableOutputFailsRun)
{
	std::ofstream blockingFile((workFolder_ / "blocking").string());
	blockingFile << "not a folder";
	blockingFile.close();

	nlohmann::json config = makeConfig();
	config["Filepaths"]["Output"] = (workFolder_ / "blocking" / "out.ifc").string();

	IOManager manager;
	ASSERT_TRUE(manager.init({ writeConfig(config) }));
	EXPECT_FALSE(manager.run());
	EXPECT_TRUE(ErrorCollection::getInstance().hasError(ErrorID::errorExportUnableToWrite));
	EXPECT_TRUE(manager.write());
}

TEST_F(utIOManager, invalidInvocationIsRejected)
{
	IOManager manager;
	EXPECT_FALSE(manager.init({ writeConfig(makeConfig()), "second.json" }));
	EXPECT_THROW(manager.init({ (workFolder_ / "missing.json").string() }), std::string);

	nlohmann::json config = makeConfig();
	config["Filepaths"]["Report"] = (workFolder_ / "report.txt").string();
	EXPECT_THROW(manager.init({ writeConfig(config) }), std::string);
}

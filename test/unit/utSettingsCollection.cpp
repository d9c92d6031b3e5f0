#include "inc/settingsCollection.h"
#include "inc/errorCollection.h"

#include <gtest/gtest.h>

#include <BRepPrimAPI_MakeBox.hxx>
#include <BRepTools.hxx>

#include <boost/filesystem.hpp>

class utSettingsCollection : public ::testing::Test {
protected:
	boost::filesystem::path workFolder_;
	std::string configPath_;

	void SetUp() override
	{
		SettingsCollection::getInstance().reset();
		ErrorCollection::getInstance().clear();

		workFolder_ = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("utSettingsCollection_%%%%%%");
		boost::filesystem::create_directories(workFolder_ / "geometry");
		BRepTools::Write(BRepPrimAPI_MakeBox(1200.0, 20.0, 3000.0).Shape(), (workFolder_ / "geometry" / "panel.brep").string().c_str());

		configPath_ = (workFolder_ / "config.json").string();
		SettingsCollection::getInstance().setInputJSONPath(configPath_, false);
	}

	void TearDown() override
	{
		SettingsCollection::getInstance().reset();
		ErrorCollection::getInstance().clear();

		boost::system::error_code errorCode;
		boost::filesystem::remove_all(workFolder_, errorCode);
	}
};

TEST_F(utSettingsCollection, outputPathIsRequired)
{
	SettingsCollection& settings = SettingsCollection::getInstance();
	EXPECT_THROW(settings.setIOPaths(nlohmann::json::object()), std::string);
	EXPECT_THROW(settings.setIOPaths({ { "Filepaths", { { "Report", "report.json" } } } }), std::string);

	settings.setIOPaths({ { "Filepaths", { { "Output", "  out.ifc " } } } });
	EXPECT_EQ("out.ifc", settings.getOutputIFCPath());
	EXPECT_EQ("", settings.getOutputReportPath());
}

TEST_F(utSettingsCollection, reportPathMustBeJson)
{
	SettingsCollection& settings = SettingsCollection::getInstance();
	EXPECT_THROW(settings.setIOPaths({ { "Filepaths", { { "Output", "out.ifc" }, { "Report", "report.txt" } } } }), std::string);
}

TEST_F(utSettingsCollection, reportFolderIsCreatedLater)
{
	SettingsCollection& settings = SettingsCollection::getInstance();
	std::string reportPath = (workFolder_ / "export" / "nested" / "Level_02_report.json").string();
	ASSERT_FALSE(boost::filesystem::exists(workFolder_ / "export"));

	settings.setIOPaths({ { "Filepaths", { { "Output", (workFolder_ / "export").string() }, { "Report", reportPath } } } });
	EXPECT_EQ(reportPath, settings.getOutputReportPath());
}

TEST_F(utSettingsCollection, ifcSettingsAreRead)
{
	SettingsCollection& settings = SettingsCollection::getInstance();
	EXPECT_EQ("Level_01_Export", settings.getProjectName());

	nlohmann::json config = {
		{ "IFC", {
			{ "Storey name", "Level_04" },
			{ "Storey elevation", 10800 },
			{ "Length unit", "Metre" },
			{ "Mesh deflection", 2.5 }
		}}
	};
	settings.setIFCRelatedSettings(config);

	EXPECT_EQ("Level_04", settings.getStoreyName());
	EXPECT_EQ("Level_04_Export", settings.getProjectName());
	EXPECT_DOUBLE_EQ(10800, settings.getStoreyElevation());
	EXPECT_TRUE(settings.lengthInMetre());
	EXPECT_DOUBLE_EQ(2.5, settings.getMeshDeflection());
	EXPECT_DOUBLE_EQ(0.5, settings.getMeshAngularDeflection());
}

TEST_F(utSettingsCollection, invalidIfcSettingsThrow)
{
	SettingsCollection& settings = SettingsCollection::getInstance();
	EXPECT_THROW(settings.setIFCRelatedSettings({ { "IFC", { { "Length unit", "feet" } } } }), std::string);
	EXPECT_THROW(settings.setIFCRelatedSettings({ { "IFC", { { "Mesh deflection", 0 } } } }), std::string);
	EXPECT_THROW(settings.setIFCRelatedSettings({ { "IFC", { { "Storey elevation", "high" } } } }), std::string);
}

TEST_F(utSettingsCollection, unitInputIsReadRelativeToConfig)
{
	SettingsCollection& settings = SettingsCollection::getInstance();
	nlohmann::json config = {
		{ "Units", {
			{ "Ids", { "U1", "U2" } },
			{ "Geometry", { "geometry/panel.brep", { "geometry/panel.brep", "geometry/panel.brep" } } },
			{ "Placements", {
				{ { "Origin", { 0, 0, 0 } } },
				{ { "Origin", { 1200, 0, 0 } }, { "Z axis", { 0, 0, 1 } }, { "X axis", { 0, 1, 0 } } }
			}},
			{ "Categories", { "vertical" } }
		}}
	};
	settings.setUnitInput(config);

	ASSERT_EQ(2u, settings.getUnitIdList().size());
	ASSERT_EQ(2u, settings.getUnitGeometryPathList().size());
	EXPECT_EQ(1u, settings.getUnitGeometryPathList()[0].size());
	EXPECT_EQ(2u, settings.getUnitGeometryPathList()[1].size());
	EXPECT_TRUE(boost::filesystem::exists(settings.getUnitGeometryPathList()[0][0]));

	ASSERT_EQ(2u, settings.getUnitPlacementList().size());
	const gp_Ax3& secondPlacement = settings.getUnitPlacementList()[1];
	EXPECT_TRUE(secondPlacement.Location().IsEqual(gp_Pnt(1200, 0, 0), 1e-9));
	EXPECT_TRUE(secondPlacement.XDirection().IsEqual(gp_Dir(0, 1, 0), 1e-9));

	ASSERT_EQ(1u, settings.getUnitCategoryList().size());
}

TEST_F(utSettingsCollection, missingGeometryFileThrows)
{
	SettingsCollection& settings = SettingsCollection::getInstance();
	nlohmann::json config = {
		{ "Units", {
			{ "Ids", { "U1" } },
			{ "Geometry", { "geometry/missing.brep" } },
			{ "Placements", { { { "Origin", { 0, 0, 0 } } } } }
		}}
	};
	EXPECT_THROW(settings.setUnitInput(config), std::string);
}

TEST_F(utSettingsCollection, parallelAxesAreRejected)
{
	SettingsCollection& settings = SettingsCollection::getInstance();
	nlohmann::json config = {
		{ "Units", {
			{ "Ids", { "U1" } },
			{ "Geometry", { "geometry/panel.brep" } },
			{ "Placements", { { { "Origin", { 0, 0, 0 } }, { "Z axis", { 1, 0, 0 } } } } }
		}}
	};
	EXPECT_THROW(settings.setUnitInput(config), std::string);
}

TEST_F(utSettingsCollection, bulkHierarchyAndSubAssembliesAreRead)
{
	SettingsCollection& settings = SettingsCollection::getInstance();
	nlohmann::json config = {
		{ "Bulk", {
			{ { "Container id", "Brackets" }, { "Category", "Bracket" }, { "Geometry", { "geometry/panel.brep" } } }
		}},
		{ "Hierarchy", {
			{ "U1", { "Facade", "Level2" } }
		}},
		{ "Sub assemblies", { "Tower", { { "Name", "Zone" }, { "Key suffix", "North" } } } }
	};
	settings.setBulkInput(config);
	settings.setHierarchy(config);
	settings.setSubAssemblies(config);

	ASSERT_EQ(1u, settings.getBulkInputList().size());
	EXPECT_EQ("Brackets", settings.getBulkInputList()[0].containerId_);
	EXPECT_EQ(1u, settings.getBulkInputList()[0].geometryPathList_.size());

	ASSERT_EQ(1u, settings.getHierarchyMap().count("U1"));
	EXPECT_EQ(2u, settings.getHierarchyMap().at("U1").size());

	ASSERT_EQ(2u, settings.getSubAssemblyList().size());
	EXPECT_EQ("Tower", settings.getSubAssemblyList()[0].name_);
	EXPECT_EQ("", settings.getSubAssemblyList()[0].keySuffix_);
	EXPECT_EQ("North", settings.getSubAssemblyList()[1].keySuffix_);
}

TEST_F(utSettingsCollection, bulkEntryNeedsAllFields)
{
	SettingsCollection& settings = SettingsCollection::getInstance();
	nlohmann::json config = {
		{ "Bulk", { { { "Container id", "Brackets" }, { "Geometry", { "geometry/panel.brep" } } } } }
	};
	EXPECT_THROW(settings.setBulkInput(config), std::string);
}

TEST_F(utSettingsCollection, resetRestoresDefaults)
{
	SettingsCollection& settings = SettingsCollection::getInstance();
	settings.setSilent(true);
	settings.setStoreyName("Level_09");
	settings.reset();

	EXPECT_FALSE(settings.isSilent());
	EXPECT_EQ("Level_01", settings.getStoreyName());
	EXPECT_TRUE(settings.getUnitIdList().empty());
}

TEST(utJsonValue, typedGettersValidate)
{
	EXPECT_TRUE(getJsonBoolValue(true));
	EXPECT_FALSE(getJsonBoolValue(0));
	EXPECT_THROW(getJsonBoolValue(2), ErrorID);
	EXPECT_DOUBLE_EQ(1.5, getJsonDouble(1.5));
	EXPECT_THROW(getJsonDouble("1.5"), ErrorID);
	EXPECT_EQ("abc", getJsonString("abc"));
	EXPECT_THROW(getJsonString(12), ErrorID);

	std::vector<std::string> expectedList = { "a", "b" };
	EXPECT_EQ(expectedList, getJsonStringList(nlohmann::json::array({ "a", "b" })));
	EXPECT_THROW(getJsonStringList("a"), ErrorID);
}

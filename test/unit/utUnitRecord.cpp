#include "inc/errorCollection.h"
#include "inc/unitRecord.h"

#include <gtest/gtest.h>

#include <BRepPrimAPI_MakeBox.hxx>

class utUnitRecord : public ::testing::Test {
protected:
	std::vector<TopoDS_Shape> geometryList_;

	void SetUp() override
	{
		geometryList_ = { BRepPrimAPI_MakeBox(1000.0, 50.0, 3000.0).Shape() };
	}
};

TEST_F(utUnitRecord, storesTrimmedIdAndDefaults)
{
	UnitRecord record("  U1 ", geometryList_, gp_Ax3());
	EXPECT_EQ("U1", record.getId());
	EXPECT_EQ("Unspecified", record.getCategory());
	EXPECT_EQ(UnitScope::unit, record.getScope());
	EXPECT_FALSE(record.hasAssemblyPath());
	EXPECT_EQ("Unit_U1", record.getContainerName());
}

TEST_F(utUnitRecord, emptyIdIsRejected)
{
	EXPECT_THROW(UnitRecord("   ", geometryList_, gp_Ax3()), ValidationError);
}

TEST_F(utUnitRecord, missingGeometryIsRejectedWithId)
{
	try
	{
		UnitRecord record("U7", {}, gp_Ax3());
		FAIL() << "record without geometry was accepted";
	}
	catch (const ValidationError& exception)
	{
		EXPECT_EQ(ErrorID::errorUnitNoGeometry, exception.getErrorId());
		EXPECT_EQ("U7", exception.getUnitId());
	}
}

TEST_F(utUnitRecord, bulkScopeChangesContainerName)
{
	UnitRecord record("Anchors", geometryList_, gp_Ax3(), "Anchor", UnitScope::bulk);
	EXPECT_EQ("Bulk_Anchors", record.getContainerName());
	EXPECT_EQ("Anchor", record.getCategory());
}

TEST_F(utUnitRecord, emptyAssemblyNodesAreDropped)
{
	UnitRecord record("U1", geometryList_, gp_Ax3());
	record.setAssemblyPath({ AssemblyNode("Facade"), AssemblyNode("  "), AssemblyNode("Panel A") });

	ASSERT_EQ(2u, record.getAssemblyPath().size());
	std::vector<std::string> expectedLabels = { "Facade", "Panel A" };
	EXPECT_EQ(expectedLabels, record.getAssemblyLabels());
}

TEST_F(utUnitRecord, assemblyNodeKeyFallsBackToName)
{
	AssemblyNode nameOnly(" Facade ");
	EXPECT_EQ("Facade", nameOnly.getName());
	EXPECT_EQ("Facade", nameOnly.getKey());

	AssemblyNode keyed("Facade", "Facade|North");
	EXPECT_EQ("Facade|North", keyed.getKey());
	EXPECT_NE(nameOnly, keyed);
	EXPECT_TRUE(AssemblyNode("").isEmpty());
}

TEST_F(utUnitRecord, toJsonSummarizesRecord)
{
	UnitRecord record("U1", geometryList_, gp_Ax3(), "vertical");
	record.setAssemblyPath({ AssemblyNode("Facade") });

	nlohmann::json recordJson = record.toJson();
	EXPECT_EQ("U1", recordJson["Id"].get<std::string>());
	EXPECT_EQ("Unit_U1", recordJson["Name"].get<std::string>());
	EXPECT_EQ("vertical", recordJson["Category"].get<std::string>());
	EXPECT_EQ(1, recordJson["GeometryCount"].get<int>());
	EXPECT_EQ("Facade", recordJson["Assembly path"][0].get<std::string>());
}

TEST_F(utUnitRecord, partNamesFollowGeometry)
{
	UnitRecord record("U1", geometryList_, gp_Ax3());
	EXPECT_FALSE(record.hasPartNames());

	record.setPartNameList({ " GL-1200_3f9a1c2e " });
	ASSERT_TRUE(record.hasPartNames());
	EXPECT_EQ("GL-1200_3f9a1c2e", record.getPartNameList()[0]);
	EXPECT_EQ("GL-1200_3f9a1c2e", record.toJson()["Parts"][0].get<std::string>());

	EXPECT_THROW(record.setPartNameList({ "GL-1200", "FR-60" }), MismatchedLengthError);
	EXPECT_EQ(1u, record.getPartNameList().size());

	record.setPartNameList({});
	EXPECT_FALSE(record.hasPartNames());
}

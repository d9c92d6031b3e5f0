#include "inc/errorCollection.h"
#include "inc/unitBuilder.h"

#include <gtest/gtest.h>

#include <BRepPrimAPI_MakeBox.hxx>

class utUnitBuilder : public ::testing::Test {
protected:
	TopoDS_Shape panel_;
	TopoDS_Shape frame_;

	void SetUp() override
	{
		panel_ = BRepPrimAPI_MakeBox(1200.0, 20.0, 3000.0).Shape();
		frame_ = BRepPrimAPI_MakeBox(60.0, 150.0, 3000.0).Shape();
	}
};

TEST_F(utUnitBuilder, buildsOneRecordPerId)
{
	gp_Ax3 secondPlacement(gp_Pnt(1200, 0, 0), gp_Dir(0, 0, 1), gp_Dir(1, 0, 0));
	TopoDS_Shape glass = BRepPrimAPI_MakeBox(1100.0, 8.0, 2900.0).Shape();
	ExportBatch batch = UnitBuilder::build(
		{ "U1", "U2" },
		{ { panel_ }, { frame_, glass } },
		{ gp_Ax3(), secondPlacement }
	);

	ASSERT_EQ(2u, batch.size());
	EXPECT_EQ("U1", batch[0].getId());
	EXPECT_EQ("U2", batch[1].getId());
	ASSERT_EQ(1u, batch[0].getGeometryList().size());
	ASSERT_EQ(2u, batch[1].getGeometryList().size());

	// the handles are shared with the input, in input order
	EXPECT_TRUE(batch[0].getGeometryList()[0].IsSame(panel_));
	EXPECT_TRUE(batch[1].getGeometryList()[0].IsSame(frame_));
	EXPECT_TRUE(batch[1].getGeometryList()[1].IsSame(glass));
	EXPECT_FALSE(batch[1].getGeometryList()[1].IsSame(frame_));
	EXPECT_TRUE(batch[1].getPlacement().Location().IsEqual(gp_Pnt(1200, 0, 0), 1e-9));
	EXPECT_FALSE(batch[0].hasAssemblyPath());
	EXPECT_FALSE(batch[1].hasAssemblyPath());
}

TEST_F(utUnitBuilder, emptyInputGivesEmptyBatch)
{
	EXPECT_TRUE(UnitBuilder::build({}, {}, {}).empty());
}

TEST_F(utUnitBuilder, mismatchedGeometryCountIsRejected)
{
	EXPECT_THROW(
		UnitBuilder::build({ "U1", "U2" }, { { panel_ } }, { gp_Ax3(), gp_Ax3() }),
		MismatchedLengthError
	);
}

TEST_F(utUnitBuilder, mismatchedPlacementCountIsRejected)
{
	try
	{
		UnitBuilder::build({ "U1", "U2" }, { { panel_ }, { panel_ } }, { gp_Ax3() });
		FAIL() << "mismatched placement list was accepted";
	}
	catch (const MismatchedLengthError& exception)
	{
		EXPECT_EQ(ErrorID::errorMismatchedLength, exception.getErrorId());
	}
}

TEST_F(utUnitBuilder, singleCategoryIsBroadcast)
{
	ExportBatch batch = UnitBuilder::build(
		{ "U1", "U2" },
		{ { panel_ }, { panel_ } },
		{ gp_Ax3(), gp_Ax3() },
		{ "vertical" }
	);
	EXPECT_EQ("vertical", batch[0].getCategory());
	EXPECT_EQ("vertical", batch[1].getCategory());
}

TEST_F(utUnitBuilder, categoryCountMustMatch)
{
	EXPECT_THROW(
		UnitBuilder::build({ "U1", "U2", "U3" }, { { panel_ }, { panel_ }, { panel_ } }, { gp_Ax3(), gp_Ax3(), gp_Ax3() }, { "vertical", "horizontal" }),
		MismatchedLengthError
	);
}

TEST_F(utUnitBuilder, duplicateIdIsRejected)
{
	try
	{
		UnitBuilder::build({ "U1", " U1" }, { { panel_ }, { frame_ } }, { gp_Ax3(), gp_Ax3() });
		FAIL() << "duplicate id was accepted";
	}
	catch (const ValidationError& exception)
	{
		EXPECT_EQ(ErrorID::errorUnitDuplicateId, exception.getErrorId());
		EXPECT_EQ("U1", exception.getUnitId());
	}
}

TEST_F(utUnitBuilder, emptyGeometryGroupIsRejected)
{
	EXPECT_THROW(UnitBuilder::build({ "U1" }, { {} }, { gp_Ax3() }), ValidationError);
}

TEST_F(utUnitBuilder, bulkRecordSitsAtWorldOrigin)
{
	UnitRecord bulkRecord = UnitBuilder::buildBulk("Brackets", { frame_, frame_ }, "Bracket");
	EXPECT_EQ(UnitScope::bulk, bulkRecord.getScope());
	EXPECT_EQ("Bulk_Brackets", bulkRecord.getContainerName());
	EXPECT_TRUE(bulkRecord.getPlacement().Location().IsEqual(gp_Pnt(0, 0, 0), 1e-9));
	EXPECT_EQ(2u, bulkRecord.getGeometryList().size());
}

TEST_F(utUnitBuilder, bulkRecordNeedsIdAndCategory)
{
	EXPECT_THROW(UnitBuilder::buildBulk(" ", { frame_ }, "Bracket"), ValidationError);
	EXPECT_THROW(UnitBuilder::buildBulk("Brackets", { frame_ }, ""), ValidationError);
}

TEST_F(utUnitBuilder, partNamesArePassedPerUnit)
{
	ExportBatch batch = UnitBuilder::build(
		{ "U1", "U2" },
		{ { panel_ }, { panel_, frame_ } },
		{ gp_Ax3(), gp_Ax3() },
		{},
		{ { "GL-1200_3f9a1c2e" }, { "GL-1200_77b0d1aa", "FR-60" } }
	);
	ASSERT_EQ(2u, batch.size());
	EXPECT_EQ(std::vector<std::string>({ "GL-1200_3f9a1c2e" }), batch[0].getPartNameList());
	EXPECT_EQ(std::vector<std::string>({ "GL-1200_77b0d1aa", "FR-60" }), batch[1].getPartNameList());

	EXPECT_THROW(
		UnitBuilder::build({ "U1", "U2" }, { { panel_ }, { panel_ } }, { gp_Ax3(), gp_Ax3() }, {}, { { "GL-1200" } }),
		MismatchedLengthError
	);
	EXPECT_THROW(
		UnitBuilder::build({ "U1" }, { { panel_ } }, { gp_Ax3() }, {}, { { "GL-1200", "FR-60" } }),
		MismatchedLengthError
	);

	UnitRecord bulkRecord = UnitBuilder::buildBulk("Brackets", { frame_ }, "Bracket", { "BR-01_a1" });
	EXPECT_EQ(std::vector<std::string>({ "BR-01_a1" }), bulkRecord.getPartNameList());
}

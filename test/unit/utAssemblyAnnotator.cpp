#include "inc/assemblyAnnotator.h"
#include "inc/unitBuilder.h"

#include <gtest/gtest.h>

#include <BRepPrimAPI_MakeBox.hxx>

class utAssemblyAnnotator : public ::testing::Test {
protected:
	ExportBatch batch_;

	void SetUp() override
	{
		TopoDS_Shape panel = BRepPrimAPI_MakeBox(1200.0, 20.0, 3000.0).Shape();
		batch_ = UnitBuilder::build(
			{ "U1", "U2" },
			{ { panel }, { panel } },
			{ gp_Ax3(), gp_Ax3(gp_Pnt(1200, 0, 0), gp_Dir(0, 0, 1), gp_Dir(1, 0, 0)) }
		);
	}
};

TEST_F(utAssemblyAnnotator, setsPathOfListedUnitsOnly)
{
	ExportBatch annotatedBatch = AssemblyAnnotator::annotate(batch_, { { "U1", { "Facade", "Level2" } } });

	std::vector<std::string> expectedLabels = { "Facade", "Level2" };
	EXPECT_EQ(expectedLabels, annotatedBatch[0].getAssemblyLabels());
	EXPECT_TRUE(annotatedBatch[1].getAssemblyLabels().empty());
}

TEST_F(utAssemblyAnnotator, annotatingTwiceGivesSamePaths)
{
	HierarchyMap hierarchyMap = { { "U1", { "Facade", "Level2" } }, { "U2", { "Facade" } } };
	ExportBatch onceBatch = AssemblyAnnotator::annotate(batch_, hierarchyMap);
	ExportBatch twiceBatch = AssemblyAnnotator::annotate(onceBatch, hierarchyMap);

	ASSERT_EQ(onceBatch.size(), twiceBatch.size());
	for (size_t i = 0; i < onceBatch.size(); i++)
	{
		EXPECT_EQ(onceBatch[i].getAssemblyPath(), twiceBatch[i].getAssemblyPath());
	}
}

TEST_F(utAssemblyAnnotator, unknownIdsAreIgnored)
{
	ExportBatch annotatedBatch = AssemblyAnnotator::annotate(batch_, { { "U9", { "Facade" } } });
	ASSERT_EQ(2u, annotatedBatch.size());
	EXPECT_FALSE(annotatedBatch[0].hasAssemblyPath());
	EXPECT_FALSE(annotatedBatch[1].hasAssemblyPath());
}

TEST_F(utAssemblyAnnotator, emptyLabelsAreSkipped)
{
	ExportBatch annotatedBatch = AssemblyAnnotator::annotate(batch_, { { "U2", { " ", "Facade", "" } } });
	std::vector<std::string> expectedLabels = { "Facade" };
	EXPECT_EQ(expectedLabels, annotatedBatch[1].getAssemblyLabels());
}

TEST_F(utAssemblyAnnotator, subAssemblyBecomesOutermostLevel)
{
	ExportBatch annotatedBatch = AssemblyAnnotator::annotate(batch_, { { "U1", { "Facade" } } });
	ExportBatch wrappedBatch = AssemblyAnnotator::wrapSubAssembly(annotatedBatch, "Tower");

	std::vector<std::string> firstLabels = { "Tower", "Facade" };
	std::vector<std::string> secondLabels = { "Tower" };
	EXPECT_EQ(firstLabels, wrappedBatch[0].getAssemblyLabels());
	EXPECT_EQ(secondLabels, wrappedBatch[1].getAssemblyLabels());
}

TEST_F(utAssemblyAnnotator, wrappingTwiceDoesNotNest)
{
	ExportBatch wrappedBatch = AssemblyAnnotator::wrapSubAssembly(batch_, "Tower", "North");
	wrappedBatch = AssemblyAnnotator::wrapSubAssembly(wrappedBatch, "Tower", "North");

	ASSERT_EQ(1u, wrappedBatch[0].getAssemblyPath().size());
	EXPECT_EQ("Tower", wrappedBatch[0].getAssemblyPath()[0].getName());
	EXPECT_EQ("Tower|North", wrappedBatch[0].getAssemblyPath()[0].getKey());
}

TEST_F(utAssemblyAnnotator, emptySubAssemblyNameLeavesBatchUnchanged)
{
	ExportBatch wrappedBatch = AssemblyAnnotator::wrapSubAssembly(batch_, "  ", "North");
	EXPECT_FALSE(wrappedBatch[0].hasAssemblyPath());
	EXPECT_FALSE(wrappedBatch[1].hasAssemblyPath());
}

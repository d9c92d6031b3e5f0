#include "inc/helper.h"
#include "inc/errorCollection.h"

#include <gtest/gtest.h>

#include <BRepPrimAPI_MakeBox.hxx>

TEST(utHelper, partNameSplitsOnLastUnderscore)
{
	EXPECT_EQ(std::make_pair(std::string("GL_1200"), std::string("3f9a1c2e")), helperFunctions::splitPartName("GL_1200_3f9a1c2e"));
	EXPECT_EQ(std::make_pair(std::string("FR-60"), std::string("")), helperFunctions::splitPartName(" FR-60 "));
	EXPECT_EQ("GL-1200_3f9a1c2e", helperFunctions::pathToPartName("geometry/GL-1200_3f9a1c2e.brep"));
}

TEST(utHelper, extensionIsCaseInsensitive)
{
	EXPECT_TRUE(helperFunctions::hasExtension("panel.STEP", "step"));
	EXPECT_TRUE(helperFunctions::hasExtension("folder.v2/panel.brep", "BREP"));
	EXPECT_TRUE(helperFunctions::hasExtension("panel.stp", ".stp"));
	EXPECT_FALSE(helperFunctions::hasExtension("panel", "step"));
	EXPECT_FALSE(helperFunctions::hasExtension("panel.stp.txt", "stp"));
}

TEST(utHelper, categoryPicksIfcClass)
{
	EXPECT_EQ("IfcMember", helperFunctions::categoryToIfcClass(" Vertical "));
	EXPECT_EQ("IfcBeam", helperFunctions::categoryToIfcClass("horizontal"));
	EXPECT_EQ("IfcBuildingElementProxy", helperFunctions::categoryToIfcClass("Glass"));
	EXPECT_EQ("IfcBuildingElementProxy", helperFunctions::categoryToIfcClass(""));
}

TEST(utHelper, jsonPointsAreValidated)
{
	gp_Pnt point = helperFunctions::jsonToPoint(nlohmann::json::array({ 1, 2.5, -3 }));
	EXPECT_TRUE(point.IsEqual(gp_Pnt(1, 2.5, -3), 1e-12));

	EXPECT_THROW(helperFunctions::jsonToPoint(nlohmann::json::array({ 1, 2 })), ErrorID);
	EXPECT_THROW(helperFunctions::jsonToPoint(nlohmann::json::array({ 1, "2", 3 })), ErrorID);
	EXPECT_THROW(helperFunctions::jsonToDir(nlohmann::json::array({ 0, 0, 0 })), ErrorID);
}

TEST(utHelper, worldPointsMoveIntoPlacement)
{
	gp_Ax3 placement(gp_Pnt(1000, 0, 0), gp_Dir(0, 0, 1), gp_Dir(0, 1, 0));
	gp_Pnt localPoint = gp_Pnt(1000, 500, 0).Transformed(helperFunctions::worldToPlacement(placement));
	EXPECT_TRUE(localPoint.IsEqual(gp_Pnt(500, 0, 0), 1e-9));
}

TEST(utHelper, boxMeshesIntoTriangles)
{
	MeshData mesh = helperFunctions::shapeToMesh(BRepPrimAPI_MakeBox(100.0, 100.0, 100.0).Shape(), 0.5, 0.5);
	ASSERT_FALSE(mesh.isEmpty());
	EXPECT_GE(mesh.triangleList_.size(), 12u);

	for (const std::array<int, 3>& triangle : mesh.triangleList_)
	{
		EXPECT_GT(helperFunctions::computeArea(mesh.vertexList_[triangle[0]], mesh.vertexList_[triangle[1]], mesh.vertexList_[triangle[2]]), 0);
	}
}

TEST(utHelper, nullShapeGivesEmptyMesh)
{
	EXPECT_TRUE(helperFunctions::shapeToMesh(TopoDS_Shape(), 0.5, 0.5).isEmpty());
}

TEST(utHelper, transformKeepsTriangles)
{
	MeshData mesh;
	mesh.vertexList_ = { gp_Pnt(0, 0, 0), gp_Pnt(1, 0, 0), gp_Pnt(0, 1, 0) };
	mesh.triangleList_ = { { 0, 1, 2 } };

	gp_Trsf translation;
	translation.SetTranslation(gp_Vec(0, 0, 10));
	MeshData movedMesh = helperFunctions::transformMesh(mesh, translation);

	EXPECT_EQ(mesh.triangleList_, movedMesh.triangleList_);
	EXPECT_TRUE(movedMesh.vertexList_[2].IsEqual(gp_Pnt(0, 1, 10), 1e-12));
}

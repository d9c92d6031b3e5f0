#include "helper.h"
#include "errorCollection.h"
#include "stringManager.h"

#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>

#include <BRep_Tool.hxx>
#include <BRepMesh_IncrementalMesh.hxx>
#include <Poly_Triangulation.hxx>
#include <TopExp_Explorer.hxx>
#include <TopLoc_Location.hxx>
#include <TopoDS_Face.hxx>

#include <algorithm>
#include <cmath>

bool helperFunctions::hasExtension(const std::string& string, const std::string& ext)
{
	size_t dotPosition = string.find_last_of(".");
	if (dotPosition == std::string::npos) { return false; }

	std::string substring = boost::to_lower_copy<std::string>(string.substr(dotPosition + 1));
	std::string cleanExt = boost::to_lower_copy<std::string>(ext);
	if (!cleanExt.empty() && cleanExt[0] == '.') { cleanExt.erase(0, 1); }
	if (substring == cleanExt) { return true; }
	return false;
}

bool helperFunctions::isValidPath(const std::string& path)
{
	return boost::filesystem::exists(path);
}

std::string helperFunctions::trim(const std::string& string)
{
	return boost::trim_copy(string);
}

std::pair<std::string, std::string> helperFunctions::splitPartName(const std::string& partName)
{
	std::string cleanName = trim(partName);
	size_t splitPosition = cleanName.find_last_of('_');
	if (splitPosition == std::string::npos) { return std::make_pair(cleanName, std::string("")); }
	return std::make_pair(cleanName.substr(0, splitPosition), cleanName.substr(splitPosition + 1));
}

std::string helperFunctions::pathToPartName(const std::string& path)
{
	return boost::filesystem::path(trim(path)).stem().string();
}

std::string helperFunctions::toLower(const std::string& string)
{
	return boost::to_lower_copy<std::string>(string);
}

gp_Pnt helperFunctions::jsonToPoint(const nlohmann::json& jsonArray)
{
	if (!jsonArray.is_array() || jsonArray.size() != 3) { throw ErrorID::errorJsonInvalArray; }

	std::array<double, 3> coordinateList;
	for (size_t i = 0; i < 3; i++)
	{
		const nlohmann::json& coordinate = jsonArray[i];
		if (!coordinate.is_number()) { throw ErrorID::errorJsonInvalNum; }
		coordinateList[i] = coordinate.get<double>();
	}
	return gp_Pnt(coordinateList[0], coordinateList[1], coordinateList[2]);
}

gp_Dir helperFunctions::jsonToDir(const nlohmann::json& jsonArray)
{
	gp_Pnt vectorPoint = jsonToPoint(jsonArray);
	gp_Vec vector(vectorPoint.X(), vectorPoint.Y(), vectorPoint.Z());
	if (vector.Magnitude() < 1e-9) { throw ErrorID::errorJsonInvalPlacement; }
	return gp_Dir(vector);
}

gp_Trsf helperFunctions::worldToPlacement(const gp_Ax3& placement)
{
	gp_Trsf transformation;
	transformation.SetTransformation(placement);
	return transformation;
}

MeshData helperFunctions::shapeToMesh(const TopoDS_Shape& shape, double linearDeflection, double angularDeflection)
{
	MeshData mesh;
	if (shape.IsNull()) { return mesh; }

	BRepMesh_IncrementalMesh mesher(shape, linearDeflection, Standard_False, angularDeflection, Standard_False);
	if (!mesher.IsDone()) { return mesh; }

	for (TopExp_Explorer faceExpl(shape, TopAbs_FACE); faceExpl.More(); faceExpl.Next())
	{
		TopoDS_Face currentFace = TopoDS::Face(faceExpl.Current());

		TopLoc_Location loc;
		Handle(Poly_Triangulation) triangulation = BRep_Tool::Triangulation(currentFace, loc);
		if (triangulation.IsNull()) { continue; } // face could not be meshed

		const gp_Trsf& locTransformation = loc.Transformation();
		int offset = static_cast<int>(mesh.vertexList_.size());
		for (int i = 1; i <= triangulation->NbNodes(); i++)
		{
			mesh.vertexList_.emplace_back(triangulation->Node(i).Transformed(locTransformation));
		}

		bool isReversed = currentFace.Orientation() == TopAbs_REVERSED;
		for (int i = 1; i <= triangulation->NbTriangles(); i++)
		{
			int n1 = 0;
			int n2 = 0;
			int n3 = 0;
			triangulation->Triangle(i).Get(n1, n2, n3);
			if (isReversed) { std::swap(n2, n3); }

			std::array<int, 3> triangle = { offset + n1 - 1, offset + n2 - 1, offset + n3 - 1 };
			if (triangle[0] == triangle[1] || triangle[1] == triangle[2] || triangle[0] == triangle[2]) { continue; }
			if (computeArea(mesh.vertexList_[triangle[0]], mesh.vertexList_[triangle[1]], mesh.vertexList_[triangle[2]]) < 1e-12) { continue; }

			mesh.triangleList_.emplace_back(triangle);
		}
	}
	return mesh;
}

MeshData helperFunctions::transformMesh(const MeshData& mesh, const gp_Trsf& transformation)
{
	MeshData transformedMesh;
	transformedMesh.triangleList_ = mesh.triangleList_;
	transformedMesh.vertexList_.reserve(mesh.vertexList_.size());
	for (const gp_Pnt& vertex : mesh.vertexList_)
	{
		transformedMesh.vertexList_.emplace_back(vertex.Transformed(transformation));
	}
	return transformedMesh;
}

double helperFunctions::computeArea(const gp_Pnt& p0, const gp_Pnt& p1, const gp_Pnt& p2)
{
	gp_Vec v1(p0, p1);
	gp_Vec v2(p0, p2);
	return v1.Crossed(v2).Magnitude() / 2;
}

std::string helperFunctions::categoryToIfcClass(const std::string& category)
{
	std::string lowerCategory = toLower(trim(category));
	if (lowerCategory == IfcObjectEnum::getString(IfcObjectID::categoryVertical)) { return "IfcMember"; }
	if (lowerCategory == IfcObjectEnum::getString(IfcObjectID::categoryHorizontal)) { return "IfcBeam"; }
	return "IfcBuildingElementProxy";
}

#if !defined(USE_IFC4) && !defined(USE_IFC4x3)
#define USE_IFC4
#endif

#ifdef USE_IFC4
#define IfcSchema Ifc4
#define buildVersion "IFC4"

#elif defined(USE_IFC4x3)
#define IfcSchema Ifc4x3
#define buildVersion "IFC4X3"

#else
#error "No IFC version defined"
#endif // USE_IFC

// IfcOpenShell includes
#include <ifcparse/IfcFile.h>
#include <ifcparse/IfcHierarchyHelper.h>
#ifdef USE_IFC4
#include <ifcparse/Ifc4.h>
#else
#include <ifcparse/Ifc4x3.h>
#endif

// OpenCascade includes
#include <gp_Pnt.hxx>
#include <gp_Vec.hxx>
#include <gp_Ax3.hxx>
#include <gp_Trsf.hxx>
#include <TopoDS.hxx>
#include <TopoDS_Shape.hxx>

#include <nlohmann/json.hpp>

#include <array>
#include <utility>
#include <string>
#include <vector>

#ifndef HELPER_HELPER_H
#define HELPER_HELPER_H

// triangulated copy of a shape, indices refer to the vertex list
struct MeshData {
	std::vector<gp_Pnt> vertexList_;
	std::vector<std::array<int, 3>> triangleList_;

	bool isEmpty() const { return vertexList_.empty() || triangleList_.empty(); }
};

// helper functions that can be utilised everywhere
struct helperFunctions{

	/// string and path code

	/// checks if the string has the extension that is supplied (case insensitive, without dot)
	static bool hasExtension(const std::string& string, const std::string& ext);
	/// checks if the string supplied is a path that exists on the system
	static bool isValidPath(const std::string& path);
	/// returns a copy of the input without leading and trailing whitespace
	static std::string trim(const std::string& string);
	/// returns a lower case copy of the input
	static std::string toLower(const std::string& string);
	/// splits a [PartNo]_[GUID] name on its last underscore, the guid is empty when there is none
	static std::pair<std::string, std::string> splitPartName(const std::string& partName);
	/// the part name of a geometry file is its stem
	static std::string pathToPartName(const std::string& path);

	/// point and placement code

	/// convert a json array of 3 numbers to a point
	static gp_Pnt jsonToPoint(const nlohmann::json& jsonArray);
	/// convert a json array of 3 numbers to a direction
	static gp_Dir jsonToDir(const nlohmann::json& jsonArray);
	/// returns the transformation that maps world coordinates onto the coordinates relative to the placement
	static gp_Trsf worldToPlacement(const gp_Ax3& placement);

	/// mesh code

	/// mesh the shape and collect the triangles of all its faces, nodes are in world coordinates
	static MeshData shapeToMesh(const TopoDS_Shape& shape, double linearDeflection, double angularDeflection);
	/// returns a copy of the mesh with all the vertices transformed
	static MeshData transformMesh(const MeshData& mesh, const gp_Trsf& transformation);
	/// compute the area of a triangle
	static double computeArea(const gp_Pnt& p0, const gp_Pnt& p1, const gp_Pnt& p2);

	/// IFC related code

	/// returns the IFC class name that a unit category is exported as
	static std::string categoryToIfcClass(const std::string& category);
};

#endif // HELPER_HELPER_H

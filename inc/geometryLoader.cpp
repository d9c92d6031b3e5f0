#include "geometryLoader.h"
#include "errorCollection.h"
#include "helper.h"
#include "stringManager.h"

#include <BRep_Builder.hxx>
#include <BRepTools.hxx>
#include <IFSelect_ReturnStatus.hxx>
#include <Standard_Failure.hxx>
#include <STEPControl_Reader.hxx>
#include <TopExp_Explorer.hxx>

TopoDS_Shape GeometryLoader::readStep(const std::string& path)
{
	STEPControl_Reader reader;
	IFSelect_ReturnStatus status = reader.ReadFile(path.c_str());
	if (status != IFSelect_RetDone) { throw ErrorID::errorGeometryUnreadable; }

	// all roots are merged into one shape
	reader.TransferRoots();
	return reader.OneShape();
}

TopoDS_Shape GeometryLoader::readBrep(const std::string& path)
{
	TopoDS_Shape shape;
	BRep_Builder builder;
	if (!BRepTools::Read(shape, path.c_str(), builder)) { throw ErrorID::errorGeometryUnreadable; }
	return shape;
}

TopoDS_Shape GeometryLoader::loadShape(const std::string& path)
{
	auto cacheIt = shapeCache_.find(path);
	if (cacheIt != shapeCache_.end()) { return cacheIt->second; }

	if (!helperFunctions::isValidPath(path)) { throw ErrorID::errorGeometryNoFile; }

	TopoDS_Shape shape;
	try
	{
		if (helperFunctions::hasExtension(path, fileExtensionEnum::getString(fileExtensionID::STEP)) || helperFunctions::hasExtension(path, fileExtensionEnum::getString(fileExtensionID::STP))) { shape = readStep(path); }
		else if (helperFunctions::hasExtension(path, fileExtensionEnum::getString(fileExtensionID::BREP))) { shape = readBrep(path); }
		else { throw ErrorID::errorGeometryUnsupportedFormat; }
	}
	catch (const Standard_Failure&)
	{
		throw ErrorID::errorGeometryUnreadable;
	}

	if (shape.IsNull()) { throw ErrorID::errorGeometryEmpty; }

	// shapes without faces cannot be meshed
	TopExp_Explorer faceExpl(shape, TopAbs_FACE);
	if (!faceExpl.More()) { throw ErrorID::errorGeometryEmpty; }

	shapeCache_[path] = shape;
	return shape;
}

std::vector<TopoDS_Shape> GeometryLoader::loadShapeList(const std::vector<std::string>& pathList)
{
	std::vector<TopoDS_Shape> shapeList;
	shapeList.reserve(pathList.size());
	for (const std::string& path : pathList)
	{
		shapeList.emplace_back(loadShape(path));
	}
	return shapeList;
}

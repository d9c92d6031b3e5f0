#include <map>
#include <string>
#include <vector>

#include <TopoDS_Shape.hxx>

#ifndef GEOMETRYLOADER_GEOMETRYLOADER_H
#define GEOMETRYLOADER_GEOMETRYLOADER_H

/// <summary>
/// Reads STEP and BREP files into shapes, every file is read only once per loader
/// </summary>
class GeometryLoader {
private:
	std::map<std::string, TopoDS_Shape> shapeCache_;

	TopoDS_Shape readStep(const std::string& path);
	TopoDS_Shape readBrep(const std::string& path);

public:
	// throws an ErrorID if the file is missing, unsupported, unreadable or empty
	TopoDS_Shape loadShape(const std::string& path);
	std::vector<TopoDS_Shape> loadShapeList(const std::vector<std::string>& pathList);

	size_t getLoadedFileCount() const { return shapeCache_.size(); }
	void clear() { shapeCache_.clear(); }
};

#endif // GEOMETRYLOADER_GEOMETRYLOADER_H

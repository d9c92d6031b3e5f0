#include "helper.h"
#include "unitRecord.h"

#include <map>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#ifndef IFCEXPORTER_IFCEXPORTER_H
#define IFCEXPORTER_IFCEXPORTER_H

// the values that shape the skeleton and geometry of the exported file
struct ExportOptions {
	// falls back to <storey name>_Export when empty
	std::string projectName_ = "";
	std::string storeyName_ = "Level_01";
	double storeyElevation_ = 0;
	bool lengthInMetre_ = false;

	double meshDeflection_ = 0.5;
	double meshAngularDeflection_ = 0.5;
};

// summary of a completed export
struct ExportResult {
	std::string outputPath_ = "";
	int productCount_ = 0;
	int assemblyCount_ = 0;
	int triangleCount_ = 0;
	nlohmann::json unitSummaryList_ = nlohmann::json::array();

	nlohmann::json toJson() const;
};

/// <summary>
/// Writes an ExportBatch to a single IFC file, one product per record grouped by its assembly path
/// </summary>
class IfcExporter {
private:
	ExportOptions options_;

	// all the data that lives for a single export call
	struct ExportContext {
		IfcHierarchyHelper<IfcSchema> file;
		IfcSchema::IfcOwnerHistory* ownerHistory = nullptr;
		IfcSchema::IfcBuildingStorey* storey = nullptr;
		IfcSchema::IfcObjectPlacement* storeyPlacement = nullptr;
		IfcSchema::IfcGeometricRepresentationSubContext* bodyContext = nullptr;

		// assembly nodes indexed by parent and level key
		std::map<std::pair<IfcSchema::IfcObjectDefinition*, std::string>, IfcSchema::IfcElementAssembly*> assemblyCache;

		// children per parent in creation order, resolved into one IfcRelAggregates per parent
		std::vector<std::pair<IfcSchema::IfcObjectDefinition*, IfcSchema::IfcObjectDefinition::list::ptr>> aggregateList;
		std::map<IfcSchema::IfcObjectDefinition*, size_t> aggregateIndex;

		// products that are directly contained in the storey
		IfcSchema::IfcProduct::list::ptr storeyContentList;
	};

	// creates the project, site, building, storey and the representation contexts
	void createSkeleton(ExportContext& context, const std::string& fileName) const;

	// returns the deepest assembly of the path, creating the missing levels
	IfcSchema::IfcElementAssembly* ensureAssemblyChain(ExportContext& context, const std::vector<AssemblyNode>& assemblyPath) const;

	// creates the product of a single record including its geometry, placement and properties
	IfcSchema::IfcProduct* createProduct(ExportContext& context, const UnitRecord& record, ExportResult& result) const;

	// mesh a shape and convert it to a faceted brep relative to the unit placement
	IfcSchema::IfcFacetedBrep* createFacetedBrep(const TopoDS_Shape& shape, const gp_Trsf& placementTransformation, const std::string& unitId, size_t geometryIndex, int& triangleCount) const;

	IfcSchema::IfcLocalPlacement* createLocalPlacement(IfcSchema::IfcObjectPlacement* relativeTo, const gp_Ax3& placement) const;

	void addAggregate(ExportContext& context, IfcSchema::IfcObjectDefinition* parent, IfcSchema::IfcObjectDefinition* child) const;
	void addPropertySet(ExportContext& context, IfcSchema::IfcObjectDefinition* relatedObject, const std::string& psetName, IfcSchema::IfcProperty::list::ptr propertyList) const;

	// write the relationships that have been collected while creating the products
	void finalizeRelationships(ExportContext& context) const;

	void writeFile(ExportContext& context, const std::string& outputPath) const;

public:
	explicit IfcExporter(const ExportOptions& options = ExportOptions());

	const ExportOptions& getOptions() const { return options_; }

	/// writes exactly one IFC file, any failing record aborts the whole batch with an ExportError
	ExportResult exportBatch(const ExportBatch& batch, const std::string& outputPath) const;

	/// a folder or extensionless path becomes <path>/<storey name>_multi_units.ifc, other extensions are replaced by .ifc
	static std::string resolveOutputPath(const std::string& outputPath, const std::string& storeyName);
};

#endif // IFCEXPORTER_IFCEXPORTER_H

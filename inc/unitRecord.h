#include <map>
#include <string>
#include <vector>

#include <gp_Ax3.hxx>
#include <TopoDS_Shape.hxx>

#include <nlohmann/json.hpp>

#ifndef UNITRECORD_UNITRECORD_H
#define UNITRECORD_UNITRECORD_H

enum class UnitScope {
	unit,
	bulk
};

// a single level of an assembly path, the key identifies the level when nodes are reused
class AssemblyNode {
private:
	std::string name_;
	std::string key_;

public:
	// name and key are trimmed, an empty one is copied from the other
	explicit AssemblyNode(const std::string& name, const std::string& key = "");

	const std::string& getName() const { return name_; }
	const std::string& getKey() const { return key_; }

	bool isEmpty() const { return key_.empty(); }

	bool operator==(const AssemblyNode& other) const { return name_ == other.name_ && key_ == other.key_; }
	bool operator!=(const AssemblyNode& other) const { return !(*this == other); }
};

/// <summary>
/// Payload of one prefabricated unit, the geometry handles are shared and never copied or inspected
/// </summary>
class UnitRecord {
private:
	std::string id_;
	std::vector<TopoDS_Shape> geometryList_;
	// [PartNo]_[GUID] per geometry, empty when the parts are unnamed
	std::vector<std::string> partNameList_ = {};
	gp_Ax3 placement_;
	std::vector<AssemblyNode> assemblyPath_ = {};
	std::string category_;
	UnitScope scope_ = UnitScope::unit;

public:
	// throws ValidationError if the id is empty or no geometry is supplied
	UnitRecord(
		const std::string& id,
		const std::vector<TopoDS_Shape>& geometryList,
		const gp_Ax3& placement,
		const std::string& category = "",
		UnitScope scope = UnitScope::unit
	);

	const std::string& getId() const { return id_; }
	const std::vector<TopoDS_Shape>& getGeometryList() const { return geometryList_; }
	const gp_Ax3& getPlacement() const { return placement_; }
	const std::string& getCategory() const { return category_; }
	UnitScope getScope() const { return scope_; }

	const std::vector<std::string>& getPartNameList() const { return partNameList_; }
	// throws MismatchedLengthError if a non empty list does not match the geometry count
	void setPartNameList(const std::vector<std::string>& partNameList);
	bool hasPartNames() const { return !partNameList_.empty(); }

	const std::vector<AssemblyNode>& getAssemblyPath() const { return assemblyPath_; }
	// empty nodes are not stored
	void setAssemblyPath(const std::vector<AssemblyNode>& assemblyPath);
	bool hasAssemblyPath() const { return !assemblyPath_.empty(); }

	// the names of the assembly path, root first
	std::vector<std::string> getAssemblyLabels() const;

	// Unit_<id> or Bulk_<id>
	std::string getContainerName() const;
	// UNIT or BULK
	std::string getScopeString() const;

	nlohmann::json toJson() const;
};

// ordered collection of records that moves through the pipeline
typedef std::vector<UnitRecord> ExportBatch;

// unit id to assembly labels ordered from root to unit
typedef std::map<std::string, std::vector<std::string>> HierarchyMap;

#endif // UNITRECORD_UNITRECORD_H

#include "unitRecord.h"

#include <string>

#ifndef ASSEMBLYANNOTATOR_ASSEMBLYANNOTATOR_H
#define ASSEMBLYANNOTATOR_ASSEMBLYANNOTATOR_H

// attaches assembly hierarchy labels to the records of a batch
class AssemblyAnnotator {
private:
	// key of a wrapping node, name|suffix if a suffix is supplied
	static std::string buildKey(const std::string& name, const std::string& keySuffix);

	// removes the levels with the same key, inserts the node as outermost level and collapses consecutive levels with the same key
	static std::vector<AssemblyNode> wrapPath(const std::vector<AssemblyNode>& assemblyPath, const AssemblyNode& wrapNode);

public:
	/// sets the assembly path of every record whose id is in the map, other records are left untouched.
	/// applying the same map twice results in the same paths
	static ExportBatch annotate(ExportBatch batch, const HierarchyMap& hierarchyMap);

	/// wraps every record in an outer assembly level, an empty name returns the batch unchanged
	static ExportBatch wrapSubAssembly(ExportBatch batch, const std::string& name, const std::string& keySuffix = "");
};

#endif // ASSEMBLYANNOTATOR_ASSEMBLYANNOTATOR_H

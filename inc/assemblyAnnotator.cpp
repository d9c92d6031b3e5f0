#include "assemblyAnnotator.h"
#include "helper.h"

std::string AssemblyAnnotator::buildKey(const std::string& name, const std::string& keySuffix)
{
	std::string baseKey = helperFunctions::trim(name);
	if (baseKey == "") { return ""; }

	std::string suffix = helperFunctions::trim(keySuffix);
	if (suffix == "") { return baseKey; }
	return baseKey + "|" + suffix;
}

std::vector<AssemblyNode> AssemblyAnnotator::wrapPath(const std::vector<AssemblyNode>& assemblyPath, const AssemblyNode& wrapNode)
{
	std::vector<AssemblyNode> wrappedPath = { wrapNode };
	for (const AssemblyNode& currentNode : assemblyPath)
	{
		if (currentNode.getKey() == wrapNode.getKey()) { continue; }
		wrappedPath.emplace_back(currentNode);
	}

	std::vector<AssemblyNode> collapsedPath;
	collapsedPath.reserve(wrappedPath.size());
	for (const AssemblyNode& currentNode : wrappedPath)
	{
		if (!collapsedPath.empty() && collapsedPath.back().getKey() == currentNode.getKey()) { continue; }
		collapsedPath.emplace_back(currentNode);
	}
	return collapsedPath;
}

ExportBatch AssemblyAnnotator::annotate(ExportBatch batch, const HierarchyMap& hierarchyMap)
{
	for (UnitRecord& record : batch)
	{
		auto hierarchyIt = hierarchyMap.find(record.getId());
		if (hierarchyIt == hierarchyMap.end()) { continue; }

		std::vector<AssemblyNode> assemblyPath;
		for (const std::string& label : hierarchyIt->second)
		{
			AssemblyNode currentNode(label);
			if (currentNode.isEmpty()) { continue; }
			assemblyPath.emplace_back(currentNode);
		}
		record.setAssemblyPath(assemblyPath);
	}
	return batch;
}

ExportBatch AssemblyAnnotator::wrapSubAssembly(ExportBatch batch, const std::string& name, const std::string& keySuffix)
{
	std::string key = buildKey(name, keySuffix);
	if (key == "") { return batch; }

	AssemblyNode wrapNode(name, key);
	for (UnitRecord& record : batch)
	{
		record.setAssemblyPath(wrapPath(record.getAssemblyPath(), wrapNode));
	}
	return batch;
}

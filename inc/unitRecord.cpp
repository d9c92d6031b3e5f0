#include "unitRecord.h"
#include "errorCollection.h"
#include "helper.h"
#include "stringManager.h"

AssemblyNode::AssemblyNode(const std::string& name, const std::string& key)
{
	name_ = helperFunctions::trim(name);
	key_ = helperFunctions::trim(key);

	if (key_ == "") { key_ = name_; }
	if (name_ == "") { name_ = key_; }
}

UnitRecord::UnitRecord(
	const std::string& id,
	const std::vector<TopoDS_Shape>& geometryList,
	const gp_Ax3& placement,
	const std::string& category,
	UnitScope scope)
{
	id_ = helperFunctions::trim(id);
	if (id_ == "") { throw ValidationError(ErrorID::errorUnitNoId); }
	if (geometryList.empty()) { throw ValidationError(ErrorID::errorUnitNoGeometry, id_); }

	geometryList_ = geometryList;
	placement_ = placement;
	scope_ = scope;

	category_ = helperFunctions::trim(category);
	if (category_ == "") { category_ = IfcObjectEnum::getString(IfcObjectID::categoryUnspecified); }
}

void UnitRecord::setPartNameList(const std::vector<std::string>& partNameList)
{
	if (!partNameList.empty() && partNameList.size() != geometryList_.size())
	{
		throw MismatchedLengthError("part names of " + id_, geometryList_.size(), partNameList.size());
	}

	partNameList_.clear();
	for (const std::string& partName : partNameList) { partNameList_.emplace_back(helperFunctions::trim(partName)); }
	return;
}

void UnitRecord::setAssemblyPath(const std::vector<AssemblyNode>& assemblyPath)
{
	assemblyPath_.clear();
	for (const AssemblyNode& currentNode : assemblyPath)
	{
		if (currentNode.isEmpty()) { continue; }
		assemblyPath_.emplace_back(currentNode);
	}
	return;
}

std::vector<std::string> UnitRecord::getAssemblyLabels() const
{
	std::vector<std::string> labelList;
	labelList.reserve(assemblyPath_.size());
	for (const AssemblyNode& currentNode : assemblyPath_) { labelList.emplace_back(currentNode.getName()); }
	return labelList;
}

std::string UnitRecord::getContainerName() const
{
	if (scope_ == UnitScope::bulk) { return IfcObjectEnum::getString(IfcObjectID::bulkPrefix) + id_; }
	return IfcObjectEnum::getString(IfcObjectID::unitPrefix) + id_;
}

std::string UnitRecord::getScopeString() const
{
	if (scope_ == UnitScope::bulk) { return IfcObjectEnum::getString(IfcObjectID::scopeBulk); }
	return IfcObjectEnum::getString(IfcObjectID::scopeUnit);
}

nlohmann::json UnitRecord::toJson() const
{
	nlohmann::json recordJson;
	recordJson["Id"] = id_;
	recordJson[IfcObjectEnum::getString(IfcObjectID::propScope)] = getScopeString();
	recordJson[IfcObjectEnum::getString(IfcObjectID::propName)] = getContainerName();
	recordJson[IfcObjectEnum::getString(IfcObjectID::propCategory)] = category_;
	recordJson[IfcObjectEnum::getString(IfcObjectID::propGeometryCount)] = geometryList_.size();
	if (hasPartNames()) { recordJson["Parts"] = partNameList_; }
	recordJson["Assembly path"] = getAssemblyLabels();
	return recordJson;
}

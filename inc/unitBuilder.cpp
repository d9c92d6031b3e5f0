#include "unitBuilder.h"
#include "errorCollection.h"
#include "helper.h"

#include <unordered_set>

ExportBatch UnitBuilder::build(
	const std::vector<std::string>& idList,
	const std::vector<std::vector<TopoDS_Shape>>& geometryGroupList,
	const std::vector<gp_Ax3>& placementList)
{
	return build(idList, geometryGroupList, placementList, {});
}

ExportBatch UnitBuilder::build(
	const std::vector<std::string>& idList,
	const std::vector<std::vector<TopoDS_Shape>>& geometryGroupList,
	const std::vector<gp_Ax3>& placementList,
	const std::vector<std::string>& categoryList)
{
	return build(idList, geometryGroupList, placementList, categoryList, {});
}

ExportBatch UnitBuilder::build(
	const std::vector<std::string>& idList,
	const std::vector<std::vector<TopoDS_Shape>>& geometryGroupList,
	const std::vector<gp_Ax3>& placementList,
	const std::vector<std::string>& categoryList,
	const std::vector<std::vector<std::string>>& partNameGroupList)
{
	size_t unitCount = idList.size();
	if (geometryGroupList.size() != unitCount) { throw MismatchedLengthError("geometry groups", unitCount, geometryGroupList.size()); }
	if (placementList.size() != unitCount) { throw MismatchedLengthError("placements", unitCount, placementList.size()); }
	if (categoryList.size() > 1 && categoryList.size() != unitCount) { throw MismatchedLengthError("categories", unitCount, categoryList.size()); }
	if (!partNameGroupList.empty() && partNameGroupList.size() != unitCount) { throw MismatchedLengthError("part names", unitCount, partNameGroupList.size()); }

	ExportBatch batch;
	batch.reserve(unitCount);

	std::unordered_set<std::string> usedIdSet;
	for (size_t i = 0; i < unitCount; i++)
	{
		std::string category = "";
		if (categoryList.size() == 1) { category = categoryList[0]; }
		else if (!categoryList.empty()) { category = categoryList[i]; }

		UnitRecord record(idList[i], geometryGroupList[i], placementList[i], category);
		if (!partNameGroupList.empty()) { record.setPartNameList(partNameGroupList[i]); }
		if (!usedIdSet.insert(record.getId()).second)
		{
			throw ValidationError(ErrorID::errorUnitDuplicateId, record.getId());
		}
		batch.emplace_back(record);
	}
	return batch;
}

UnitRecord UnitBuilder::buildBulk(
	const std::string& containerId,
	const std::vector<TopoDS_Shape>& geometryList,
	const std::string& category,
	const std::vector<std::string>& partNameList)
{
	if (helperFunctions::trim(containerId) == "") { throw ValidationError(ErrorID::errorBulkNoContainerId); }
	if (helperFunctions::trim(category) == "") { throw ValidationError(ErrorID::errorBulkNoCategory, containerId); }

	UnitRecord record(containerId, geometryList, gp_Ax3(), category, UnitScope::bulk);
	record.setPartNameList(partNameList);
	return record;
}

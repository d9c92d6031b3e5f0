#include "unitRecord.h"

#include <string>
#include <vector>

#ifndef UNITBUILDER_UNITBUILDER_H
#define UNITBUILDER_UNITBUILDER_H

/// <summary>
/// Turns the flattened parallel input lists into an ExportBatch
/// </summary>
class UnitBuilder {
public:
	/// one record per index, in input order, all with an empty assembly path.
	/// throws MismatchedLengthError if the list lengths differ and ValidationError on empty or duplicate ids
	static ExportBatch build(
		const std::vector<std::string>& idList,
		const std::vector<std::vector<TopoDS_Shape>>& geometryGroupList,
		const std::vector<gp_Ax3>& placementList
	);

	/// categories can be empty, a single broadcast value or one per id
	static ExportBatch build(
		const std::vector<std::string>& idList,
		const std::vector<std::vector<TopoDS_Shape>>& geometryGroupList,
		const std::vector<gp_Ax3>& placementList,
		const std::vector<std::string>& categoryList
	);

	/// part names can be empty or one list per id, each matching the size of its geometry group
	static ExportBatch build(
		const std::vector<std::string>& idList,
		const std::vector<std::vector<TopoDS_Shape>>& geometryGroupList,
		const std::vector<gp_Ax3>& placementList,
		const std::vector<std::string>& categoryList,
		const std::vector<std::vector<std::string>>& partNameGroupList
	);

	/// groups loose geometry under a single bulk container at the world origin
	static UnitRecord buildBulk(
		const std::string& containerId,
		const std::vector<TopoDS_Shape>& geometryList,
		const std::string& category,
		const std::vector<std::string>& partNameList = {}
	);
};

#endif // UNITBUILDER_UNITBUILDER_H

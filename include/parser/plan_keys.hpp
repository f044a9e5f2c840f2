#pragma once

#include <string_view>

namespace plansight::plan_keys {

// EXPLAIN (FORMAT JSON) node keys mapped onto PlanNode fields
inline constexpr std::string_view kNodeType          = "Node Type";
inline constexpr std::string_view kRelationName      = "Relation Name";
inline constexpr std::string_view kStartupCost       = "Startup Cost";
inline constexpr std::string_view kTotalCost         = "Total Cost";
inline constexpr std::string_view kPlanRows          = "Plan Rows";
inline constexpr std::string_view kPlanWidth         = "Plan Width";
inline constexpr std::string_view kActualStartupTime = "Actual Startup Time";
inline constexpr std::string_view kActualTotalTime   = "Actual Total Time";
inline constexpr std::string_view kActualRows        = "Actual Rows";
inline constexpr std::string_view kActualLoops       = "Actual Loops";
inline constexpr std::string_view kPlans             = "Plans";

// Whole-plan keys
inline constexpr std::string_view kPlan          = "Plan";
inline constexpr std::string_view kExecution     = "Execution";
inline constexpr std::string_view kExecutionTime = "Execution Time";
inline constexpr std::string_view kPlanning      = "Planning";
inline constexpr std::string_view kPlanningTime  = "Planning Time";
inline constexpr std::string_view kTriggers      = "Triggers";
inline constexpr std::string_view kWarnings      = "Warnings";
inline constexpr std::string_view kQuery         = "Query";

// Extension attributes read by diagnostic rules (camelCase, as stored)
inline constexpr std::string_view kAttrSortMethod    = "sortMethod";
inline constexpr std::string_view kAttrSortSpaceUsed = "sortSpaceUsed";
inline constexpr std::string_view kAttrIndexName     = "indexName";

inline constexpr std::string_view kUnknownNodeType = "Unknown";

} // namespace plansight::plan_keys

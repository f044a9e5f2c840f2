#include "analyzer/diagnostic_rules.hpp"
#include "analyzer/plan_visitor.hpp"
#include "parser/plan_keys.hpp"
#include "core/utils.hpp"

#include <format>

namespace plansight {

namespace {

// A statistic counts only when reported and non-zero
inline bool reported(const std::optional<double>& v) {
    return v.has_value() && *v != 0.0;
}

inline bool exceeds(const std::optional<double>& v, double limit) {
    return reported(v) && *v > limit;
}

inline std::string rows_text(const std::optional<double>& v) {
    return v ? utils::format_number(*v) : std::string("unknown");
}

inline std::string attribute_text(const JsonValue& v) {
    if (auto s = v.as_string()) return *s;
    return v.dump();
}

} // anonymous namespace

void INodeRule::evaluate(const QueryPlan& plan, std::vector<Issue>& issues) const {
    visit_preorder(plan.plan, [&](const PlanNode& node) { inspect(node, issues); });
}

// ---- Sequential scan -------------------------------------------------------

void SequentialScanRule::inspect(const PlanNode& node, std::vector<Issue>& issues) const {
    if (node.node_type != "Seq Scan" || !node.relation) return;

    if (!exceeds(node.actual_rows, t_.seq_scan_min_rows) &&
        !exceeds(node.actual_total_time, t_.seq_scan_min_time_ms)) {
        return;
    }

    const auto& rel = *node.relation;
    issues.push_back(Issue{
        IssueType::SEQUENTIAL_SCAN,
        std::format("Sequential scan on table {} with {} rows", rel, rows_text(node.actual_rows)),
        exceeds(node.actual_rows, t_.seq_scan_high_rows) ? Severity::HIGH : Severity::MEDIUM,
        std::format("Seq Scan on {}", rel),
        std::format("Consider adding an index on columns in the WHERE clause for table {}", rel),
    });
}

// ---- Expensive join --------------------------------------------------------

void ExpensiveJoinRule::inspect(const PlanNode& node, std::vector<Issue>& issues) const {
    if (node.node_type.find("Join") == std::string::npos) return;

    if (!exceeds(node.actual_rows, t_.join_min_rows) &&
        !exceeds(node.actual_total_time, t_.join_min_time_ms)) {
        return;
    }

    issues.push_back(Issue{
        IssueType::EXPENSIVE_JOIN,
        std::format("Expensive {} producing {} rows", node.node_type, rows_text(node.actual_rows)),
        exceeds(node.actual_total_time, t_.join_high_time_ms) ? Severity::HIGH : Severity::MEDIUM,
        node.node_type,
        "Consider adding indexes on join columns or restructuring the query",
    });
}

// ---- Estimation error ------------------------------------------------------

void EstimationErrorRule::inspect(const PlanNode& node, std::vector<Issue>& issues) const {
    // Zero on either side gives no usable ratio
    if (!reported(node.plan_rows) || !reported(node.actual_rows)) return;

    const double ratio = *node.actual_rows / *node.plan_rows;
    const double medium = t_.estimation_ratio_medium;
    const double high = t_.estimation_ratio_high;

    if (!(ratio > medium || ratio < 1.0 / medium)) return;

    issues.push_back(Issue{
        IssueType::ESTIMATION_ERROR,
        std::format("Row estimation error in {}: estimated {}, got {}", node.node_type,
                    utils::format_number(*node.plan_rows), utils::format_number(*node.actual_rows)),
        (ratio > high || ratio < 1.0 / high) ? Severity::HIGH : Severity::MEDIUM,
        node.node_type,
        "Run ANALYZE on related tables to update statistics",
    });
}

// ---- Temporary files -------------------------------------------------------

std::vector<std::string_view> TemporaryFilesRule::attribute_keys() const {
    return {plan_keys::kAttrSortMethod, plan_keys::kAttrSortSpaceUsed};
}

void TemporaryFilesRule::inspect(const PlanNode& node, std::vector<Issue>& issues) const {
    bool spilled = false;
    if (const auto* method = node.attribute(plan_keys::kAttrSortMethod)) {
        spilled = method->as_string() == "external merge";
    }
    if (const auto* space = node.attribute(plan_keys::kAttrSortSpaceUsed)) {
        spilled = spilled || space->is_truthy();
    }
    if (!spilled) return;

    issues.push_back(Issue{
        IssueType::TEMPORARY_FILES,
        std::format("External temporary file used in {}", node.node_type),
        Severity::HIGH,
        node.node_type,
        "Increase work_mem setting or restructure query to reduce memory usage",
    });
}

// ---- Inefficient index -----------------------------------------------------

std::vector<std::string_view> InefficientIndexRule::attribute_keys() const {
    return {plan_keys::kAttrIndexName};
}

void InefficientIndexRule::inspect(const PlanNode& node, std::vector<Issue>& issues) const {
    if (node.node_type != "Index Scan" && node.node_type != "Index Only Scan") return;
    if (!node.relation) return;

    const auto* index = node.attribute(plan_keys::kAttrIndexName);
    if (!index || !index->is_truthy()) return;

    if (!reported(node.actual_rows) || *node.actual_rows >= t_.index_max_actual_rows) return;
    if (!exceeds(node.plan_rows, t_.index_min_plan_rows)) return;

    const auto& rel = *node.relation;
    issues.push_back(Issue{
        IssueType::INEFFICIENT_INDEX,
        std::format("Inefficient index {} on {}", attribute_text(*index), rel),
        Severity::MEDIUM,
        std::format("{} on {}", node.node_type, rel),
        "Consider creating a more specific index for this query pattern",
    });
}

// ---- Missing parallelism ---------------------------------------------------

void MissingParallelismRule::evaluate(const QueryPlan& plan, std::vector<Issue>& issues) const {
    if (!(plan.execution_time > t_.parallel_min_execution_ms)) return;

    const bool has_parallel = any_node(plan.plan, [](const PlanNode& node) {
        return node.node_type.find("Parallel") != std::string::npos;
    });
    if (has_parallel) return;

    issues.push_back(Issue{
        IssueType::MISSING_PARALLELISM,
        "Query is slow but not utilizing parallel execution",
        Severity::MEDIUM,
        std::nullopt,
        "Consider enabling parallel query execution or restructuring the query",
    });
}

// ---- High planning time ----------------------------------------------------

void HighPlanningTimeRule::evaluate(const QueryPlan& plan, std::vector<Issue>& issues) const {
    if (!(plan.planning_time > plan.execution_time * t_.planning_ratio)) return;

    issues.push_back(Issue{
        IssueType::HIGH_PLANNING_TIME,
        "Planning time is high relative to execution time",
        Severity::MEDIUM,
        std::nullopt,
        "Consider simplifying the query or creating helper views",
    });
}

} // namespace plansight

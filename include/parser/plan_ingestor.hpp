#pragma once

#include "core/json.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace plansight {

/**
 * @brief Plan ingestor - raw EXPLAIN output to canonical QueryPlan
 *
 * Accepts what `EXPLAIN (ANALYZE, FORMAT JSON)` returns: a one-element
 * array wrapping the plan document, or the document itself. Timings are
 * read from the top level ("Execution Time") or from nested
 * "Execution"/"Planning" sections.
 *
 * Never throws on data shape. Anything it cannot interpret degrades to
 * {execution_time: 0, planning_time: 0, plan: {node_type: "Unknown"}}.
 *
 * Example:
 *   Input:  [{"Plan": {"Node Type": "Sort", "Sort Method": "quicksort", ...}}]
 *   Output: PlanNode{node_type = "Sort", attributes = {"sortMethod": "quicksort"}}
 */
class PlanIngestor {
public:
    /**
     * @brief Build a QueryPlan from an already-parsed JSON document
     */
    [[nodiscard]] static QueryPlan ingest(const JsonValue& raw);

    /**
     * @brief Parse JSON text and build a QueryPlan
     * @param json_text EXPLAIN output; empty or malformed text degrades
     */
    [[nodiscard]] static QueryPlan ingest_text(std::string_view json_text);

    /**
     * @brief Normalize a raw plan key into its attribute name
     *
     * "Sort Method" -> "sortMethod", "Shared Hit Blocks" -> "sharedHitBlocks"
     */
    [[nodiscard]] static std::string normalize_key(std::string_view key);

    /**
     * @brief The plan returned for input that cannot be interpreted
     */
    [[nodiscard]] static QueryPlan degenerate_plan();

private:
    static PlanNode parse_node(const JsonValue& node);

    static bool is_mapped_key(std::string_view key);

    static std::optional<double> read_timing(const JsonValue& doc,
                                             std::string_view section,
                                             std::string_view key);
};

} // namespace plansight

#pragma once

#include "analyzer/plan_analyzer.hpp"
#include "core/types.hpp"

#include <string>

namespace plansight {

/**
 * @brief JSON output for analysis results
 *
 * Field names are camelCase (nodeType, actualRows, healthScore, ...).
 * Absent optionals are omitted. Node extension attributes are written
 * inline next to the canonical fields, in key order.
 */
class ResultSerializer {
public:
    [[nodiscard]] static std::string to_json(const AnalysisResult& result);
    [[nodiscard]] static std::string to_json(const QueryPlan& plan);
    [[nodiscard]] static std::string to_json(const PlanNode& node);
    [[nodiscard]] static std::string to_json(const Issue& issue);

    // JSON array of strings
    [[nodiscard]] static std::string to_json(const std::vector<std::string>& values);
};

} // namespace plansight

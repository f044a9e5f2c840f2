#pragma once

#include "analyzer/diagnostic_rule.hpp"
#include "analyzer/thresholds.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace plansight {

/**
 * @brief Runs the diagnostic rules over a plan in their fixed order
 *
 * Order: sequential_scan, expensive_join, estimation_error,
 * temporary_files, inefficient_index, missing_parallelism,
 * high_planning_time. Holds no mutable state; `run` is safe to call
 * from several threads at once.
 */
class RuleEngine {
public:
    RuleEngine() : RuleEngine(AnalyzerThresholds{}) {}
    explicit RuleEngine(const AnalyzerThresholds& thresholds);

    [[nodiscard]] std::vector<Issue> run(const QueryPlan& plan) const;

    [[nodiscard]] std::vector<std::string_view> rule_names() const;

    [[nodiscard]] const std::vector<std::unique_ptr<IDiagnosticRule>>& rules() const {
        return rules_;
    }

private:
    std::vector<std::unique_ptr<IDiagnosticRule>> rules_;
};

} // namespace plansight

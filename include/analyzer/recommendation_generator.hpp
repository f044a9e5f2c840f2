#pragma once

#include "analyzer/thresholds.hpp"
#include "core/types.hpp"

#include <string>
#include <vector>

namespace plansight {

/**
 * @brief Turns the issue list into deduplicated advice
 *
 * One line per issue type present, in a fixed order. Sequential scans
 * collapse into a single line naming each distinct table once, in the
 * order first seen. A slow plan additionally gets a caching hint.
 */
class RecommendationGenerator {
public:
    RecommendationGenerator() = default;
    explicit RecommendationGenerator(const AnalyzerThresholds& thresholds)
        : caching_min_execution_ms_(thresholds.caching_min_execution_ms) {}

    [[nodiscard]] std::vector<std::string> generate(const QueryPlan& plan,
                                                    const std::vector<Issue>& issues) const;

private:
    double caching_min_execution_ms_ = AnalyzerThresholds{}.caching_min_execution_ms;
};

} // namespace plansight

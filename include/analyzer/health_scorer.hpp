#pragma once

#include "analyzer/thresholds.hpp"
#include "core/types.hpp"

#include <vector>

namespace plansight {

/**
 * @brief 100 minus the severity deduction of every issue, clamped to [0, 100]
 */
class HealthScorer {
public:
    static constexpr int kMaxScore = 100;
    static constexpr int kMinScore = 0;

    HealthScorer() = default;
    explicit HealthScorer(const SeverityWeights& weights) : weights_(weights) {}

    [[nodiscard]] int score(const std::vector<Issue>& issues) const;

private:
    SeverityWeights weights_;
};

} // namespace plansight

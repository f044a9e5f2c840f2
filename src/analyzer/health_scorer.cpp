#include "analyzer/health_scorer.hpp"

#include <algorithm>
#include <cstdint>

namespace plansight {

int HealthScorer::score(const std::vector<Issue>& issues) const {
    int64_t total = kMaxScore;
    for (const auto& issue : issues) {
        total -= weights_.deduction(issue.severity);
    }
    return static_cast<int>(std::clamp<int64_t>(total, kMinScore, kMaxScore));
}

} // namespace plansight

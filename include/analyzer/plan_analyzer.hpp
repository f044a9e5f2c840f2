#pragma once

#include "analyzer/health_scorer.hpp"
#include "analyzer/recommendation_generator.hpp"
#include "analyzer/rule_engine.hpp"
#include "analyzer/thresholds.hpp"
#include "core/json.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace plansight {

/**
 * @brief Diagnosis of one captured plan
 */
struct AnalysisResult {
    QueryPlan plan;
    std::string plan_text;                          // display only, never analyzed
    std::vector<Issue> issues;                      // rule order, pre-order within a rule
    std::vector<std::string> recommendations;
    int health_score = HealthScorer::kMaxScore;     // [0, 100]
    std::optional<double> measured_execution_time;  // ms, wall clock from the caller
};

/**
 * @brief Plan in, diagnosis out
 *
 * Ingest -> rules -> {recommendations, score}. Holds only configuration
 * fixed at construction; analyze() is a pure function of its arguments
 * and safe to call concurrently.
 */
class PlanAnalyzer {
public:
    struct Config {
        AnalyzerThresholds thresholds;
        SeverityWeights weights;
    };

    PlanAnalyzer() : PlanAnalyzer(Config{}) {}
    explicit PlanAnalyzer(const Config& config);

    /**
     * @brief Analyze an already-canonical plan
     * @param plan_text Text rendering for display; rendered from `plan` when empty
     * @param measured_execution_ms Wall-clock time measured by the caller, carried through
     */
    [[nodiscard]] AnalysisResult analyze(QueryPlan plan,
                                         std::string plan_text = {},
                                         std::optional<double> measured_execution_ms = std::nullopt) const;

    // Raw EXPLAIN JSON document
    [[nodiscard]] AnalysisResult analyze_raw(const JsonValue& raw,
                                             std::string plan_text = {},
                                             std::optional<double> measured_execution_ms = std::nullopt) const;

    // Raw EXPLAIN JSON text; empty or malformed text degrades to an Unknown plan
    [[nodiscard]] AnalysisResult analyze_json(std::string_view json_text,
                                              std::string plan_text = {},
                                              std::optional<double> measured_execution_ms = std::nullopt) const;

    [[nodiscard]] const Config& config() const { return config_; }
    [[nodiscard]] const RuleEngine& engine() const { return engine_; }

private:
    Config config_;
    RuleEngine engine_;
    RecommendationGenerator recommender_;
    HealthScorer scorer_;
};

} // namespace plansight

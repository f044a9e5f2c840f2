#include "analyzer/plan_analyzer.hpp"
#include "analyzer/plan_renderer.hpp"
#include "parser/plan_ingestor.hpp"
#include "core/utils.hpp"

#include <format>

namespace plansight {

PlanAnalyzer::PlanAnalyzer(const Config& config)
    : config_(config),
      engine_(config.thresholds),
      recommender_(config.thresholds),
      scorer_(config.weights) {}

AnalysisResult PlanAnalyzer::analyze(QueryPlan plan, std::string plan_text,
                                     std::optional<double> measured_execution_ms) const {
    const utils::Timer timer;

    AnalysisResult result;
    result.issues = engine_.run(plan);
    result.recommendations = recommender_.generate(plan, result.issues);
    result.health_score = scorer_.score(result.issues);
    result.plan_text = plan_text.empty() ? PlanRenderer::render(plan) : std::move(plan_text);
    result.measured_execution_time = measured_execution_ms;
    result.plan = std::move(plan);

    utils::log::debug(std::format("Analyzed plan rooted at '{}': {} issues, score {} ({}us)",
                                  result.plan.plan.node_type, result.issues.size(),
                                  result.health_score, timer.elapsed_us().count()));
    return result;
}

AnalysisResult PlanAnalyzer::analyze_raw(const JsonValue& raw, std::string plan_text,
                                         std::optional<double> measured_execution_ms) const {
    return analyze(PlanIngestor::ingest(raw), std::move(plan_text), measured_execution_ms);
}

AnalysisResult PlanAnalyzer::analyze_json(std::string_view json_text, std::string plan_text,
                                          std::optional<double> measured_execution_ms) const {
    return analyze(PlanIngestor::ingest_text(json_text), std::move(plan_text), measured_execution_ms);
}

} // namespace plansight

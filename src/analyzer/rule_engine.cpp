#include "analyzer/rule_engine.hpp"
#include "analyzer/diagnostic_rules.hpp"

namespace plansight {

RuleEngine::RuleEngine(const AnalyzerThresholds& thresholds) {
    rules_.reserve(7);
    rules_.push_back(std::make_unique<SequentialScanRule>(thresholds));
    rules_.push_back(std::make_unique<ExpensiveJoinRule>(thresholds));
    rules_.push_back(std::make_unique<EstimationErrorRule>(thresholds));
    rules_.push_back(std::make_unique<TemporaryFilesRule>());
    rules_.push_back(std::make_unique<InefficientIndexRule>(thresholds));
    rules_.push_back(std::make_unique<MissingParallelismRule>(thresholds));
    rules_.push_back(std::make_unique<HighPlanningTimeRule>(thresholds));
}

std::vector<Issue> RuleEngine::run(const QueryPlan& plan) const {
    std::vector<Issue> issues;
    for (const auto& rule : rules_) {
        rule->evaluate(plan, issues);
    }
    return issues;
}

std::vector<std::string_view> RuleEngine::rule_names() const {
    std::vector<std::string_view> names;
    names.reserve(rules_.size());
    for (const auto& rule : rules_) {
        names.push_back(rule->name());
    }
    return names;
}

} // namespace plansight

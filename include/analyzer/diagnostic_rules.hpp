#pragma once

#include "analyzer/diagnostic_rule.hpp"
#include "analyzer/thresholds.hpp"

namespace plansight {

// ============================================================================
// Per-node rules
// ============================================================================

/**
 * @brief "Seq Scan" on a named relation reading many rows or taking long
 */
class SequentialScanRule final : public INodeRule {
public:
    explicit SequentialScanRule(const AnalyzerThresholds& t) : t_(t) {}
    [[nodiscard]] std::string_view name() const override { return "sequential_scan"; }

protected:
    void inspect(const PlanNode& node, std::vector<Issue>& issues) const override;

private:
    AnalyzerThresholds t_;
};

/**
 * @brief Any "... Join" node producing many rows or taking long
 */
class ExpensiveJoinRule final : public INodeRule {
public:
    explicit ExpensiveJoinRule(const AnalyzerThresholds& t) : t_(t) {}
    [[nodiscard]] std::string_view name() const override { return "expensive_join"; }

protected:
    void inspect(const PlanNode& node, std::vector<Issue>& issues) const override;

private:
    AnalyzerThresholds t_;
};

/**
 * @brief Planner row estimate off by more than an order of magnitude
 */
class EstimationErrorRule final : public INodeRule {
public:
    explicit EstimationErrorRule(const AnalyzerThresholds& t) : t_(t) {}
    [[nodiscard]] std::string_view name() const override { return "estimation_error"; }

protected:
    void inspect(const PlanNode& node, std::vector<Issue>& issues) const override;

private:
    AnalyzerThresholds t_;
};

/**
 * @brief Sort spilled to disk (external merge) or reported sort space
 */
class TemporaryFilesRule final : public INodeRule {
public:
    [[nodiscard]] std::string_view name() const override { return "temporary_files"; }
    [[nodiscard]] std::vector<std::string_view> attribute_keys() const override;

protected:
    void inspect(const PlanNode& node, std::vector<Issue>& issues) const override;
};

/**
 * @brief Index scan expected to touch many rows but returning very few
 */
class InefficientIndexRule final : public INodeRule {
public:
    explicit InefficientIndexRule(const AnalyzerThresholds& t) : t_(t) {}
    [[nodiscard]] std::string_view name() const override { return "inefficient_index"; }
    [[nodiscard]] std::vector<std::string_view> attribute_keys() const override;

protected:
    void inspect(const PlanNode& node, std::vector<Issue>& issues) const override;

private:
    AnalyzerThresholds t_;
};

// ============================================================================
// Whole-plan rules
// ============================================================================

/**
 * @brief Slow query with no parallel node anywhere in the tree
 */
class MissingParallelismRule final : public IDiagnosticRule {
public:
    explicit MissingParallelismRule(const AnalyzerThresholds& t) : t_(t) {}
    void evaluate(const QueryPlan& plan, std::vector<Issue>& issues) const override;
    [[nodiscard]] std::string_view name() const override { return "missing_parallelism"; }

private:
    AnalyzerThresholds t_;
};

class HighPlanningTimeRule final : public IDiagnosticRule {
public:
    explicit HighPlanningTimeRule(const AnalyzerThresholds& t) : t_(t) {}
    void evaluate(const QueryPlan& plan, std::vector<Issue>& issues) const override;
    [[nodiscard]] std::string_view name() const override { return "high_planning_time"; }

private:
    AnalyzerThresholds t_;
};

} // namespace plansight

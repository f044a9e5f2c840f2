#pragma once

#include "core/types.hpp"

#include <string_view>
#include <vector>

namespace plansight {

/**
 * @brief Abstract diagnostic rule interface
 *
 * A rule inspects a canonical plan and appends zero or more issues.
 * Rules are independent of one another; the engine runs them in a fixed
 * order so the combined issue list is reproducible.
 */
class IDiagnosticRule {
public:
    virtual ~IDiagnosticRule() = default;

    /**
     * @brief Append this rule's findings for `plan` to `issues`
     */
    virtual void evaluate(const QueryPlan& plan, std::vector<Issue>& issues) const = 0;

    /**
     * @brief Rule identifier for logging
     */
    [[nodiscard]] virtual std::string_view name() const = 0;

    /**
     * @brief Extension attributes this rule reads from PlanNode::attributes
     */
    [[nodiscard]] virtual std::vector<std::string_view> attribute_keys() const { return {}; }
};

/**
 * @brief Rule applied to every node, visited in pre-order
 */
class INodeRule : public IDiagnosticRule {
public:
    void evaluate(const QueryPlan& plan, std::vector<Issue>& issues) const final;

protected:
    virtual void inspect(const PlanNode& node, std::vector<Issue>& issues) const = 0;
};

} // namespace plansight

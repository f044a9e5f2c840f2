#include "analyzer/plan_renderer.hpp"
#include "core/utils.hpp"

#include <format>
#include <utility>
#include <vector>

namespace plansight {

namespace {

std::string format_estimates(const PlanNode& node) {
    if (!node.startup_cost && !node.total_cost && !node.plan_rows && !node.plan_width) {
        return {};
    }
    return std::format("  (cost={:.2f}..{:.2f} rows={} width={})",
                       node.startup_cost.value_or(0.0),
                       node.total_cost.value_or(0.0),
                       utils::format_number(node.plan_rows.value_or(0.0)),
                       utils::format_number(node.plan_width.value_or(0.0)));
}

std::string format_actuals(const PlanNode& node) {
    if (!node.actual_startup_time && !node.actual_total_time &&
        !node.actual_rows && !node.actual_loops) {
        return {};
    }
    return std::format(" (actual time={:.3f}..{:.3f} rows={} loops={})",
                       node.actual_startup_time.value_or(0.0),
                       node.actual_total_time.value_or(0.0),
                       utils::format_number(node.actual_rows.value_or(0.0)),
                       utils::format_number(node.actual_loops.value_or(0.0)));
}

} // anonymous namespace

std::string PlanRenderer::render_node_line(const PlanNode& node) {
    std::string line = node.node_type;
    if (node.relation) {
        line += " on ";
        line += *node.relation;
    }
    line += format_estimates(node);
    line += format_actuals(node);
    return line;
}

std::string PlanRenderer::render(const QueryPlan& plan) {
    std::string out;

    // (node, depth); children pushed in reverse to keep execution order
    std::vector<std::pair<const PlanNode*, size_t>> stack;
    stack.emplace_back(&plan.plan, 0);
    while (!stack.empty()) {
        const auto [node, depth] = stack.back();
        stack.pop_back();

        if (depth > 0) {
            out.append((depth - 1) * 6 + 2, ' ');
            out += "->  ";
        }
        out += render_node_line(*node);
        out += '\n';

        for (auto it = node->children.rbegin(); it != node->children.rend(); ++it) {
            stack.emplace_back(&*it, depth + 1);
        }
    }

    out += std::format("Planning Time: {:.3f} ms\n", plan.planning_time);
    out += std::format("Execution Time: {:.3f} ms\n", plan.execution_time);
    return out;
}

} // namespace plansight

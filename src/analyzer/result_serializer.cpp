#include "analyzer/result_serializer.hpp"
#include "core/utils.hpp"

#include <array>
#include <format>
#include <string_view>

namespace plansight {

namespace {

// Canonical node fields; attributes with the same name are not written
constexpr std::array<std::string_view, 11> kNodeFields = {
    "nodeType", "relation", "startupCost", "totalCost", "planRows", "planWidth",
    "actualStartupTime", "actualTotalTime", "actualRows", "actualLoops", "children",
};

bool is_node_field(std::string_view key) {
    for (const auto f : kNodeFields) {
        if (f == key) return true;
    }
    return false;
}

std::string quoted(std::string_view s) {
    return std::format("\"{}\"", utils::escape_json(s));
}

void append_number(std::string& out, std::string_view key, const std::optional<double>& v) {
    if (!v) return;
    out += std::format(",\"{}\":{}", key, utils::format_number(*v));
}

void append_string(std::string& out, std::string_view key, const std::optional<std::string>& v) {
    if (!v) return;
    out += std::format(",\"{}\":{}", key, quoted(*v));
}

} // anonymous namespace

std::string ResultSerializer::to_json(const std::vector<std::string>& values) {
    std::string out = "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ',';
        out += quoted(values[i]);
    }
    out += ']';
    return out;
}

std::string ResultSerializer::to_json(const PlanNode& node) {
    std::string out = std::format("{{\"nodeType\":{}", quoted(node.node_type));
    append_string(out, "relation", node.relation);
    append_number(out, "startupCost", node.startup_cost);
    append_number(out, "totalCost", node.total_cost);
    append_number(out, "planRows", node.plan_rows);
    append_number(out, "planWidth", node.plan_width);
    append_number(out, "actualStartupTime", node.actual_startup_time);
    append_number(out, "actualTotalTime", node.actual_total_time);
    append_number(out, "actualRows", node.actual_rows);
    append_number(out, "actualLoops", node.actual_loops);

    for (const auto& [key, value] : node.attributes) {
        if (is_node_field(key)) continue;
        out += std::format(",{}:{}", quoted(key), value.dump());
    }

    if (!node.children.empty()) {
        out += ",\"children\":[";
        for (size_t i = 0; i < node.children.size(); ++i) {
            if (i > 0) out += ',';
            out += to_json(node.children[i]);
        }
        out += ']';
    }
    out += '}';
    return out;
}

std::string ResultSerializer::to_json(const QueryPlan& plan) {
    std::string out = std::format("{{\"executionTime\":{},\"planningTime\":{},\"plan\":{}",
                                  utils::format_number(plan.execution_time),
                                  utils::format_number(plan.planning_time),
                                  to_json(plan.plan));
    if (plan.triggers) {
        out += std::format(",\"triggers\":{}", plan.triggers->dump());
    }
    if (!plan.warnings.empty()) {
        out += std::format(",\"warnings\":{}", to_json(plan.warnings));
    }
    append_string(out, "query", plan.query);
    out += '}';
    return out;
}

std::string ResultSerializer::to_json(const Issue& issue) {
    std::string out = std::format("{{\"type\":\"{}\",\"description\":{},\"severity\":\"{}\"",
                                  issue_type_to_string(issue.type),
                                  quoted(issue.description),
                                  severity_to_string(issue.severity));
    append_string(out, "relatedNode", issue.related_node);
    append_string(out, "suggestedFix", issue.suggested_fix);
    out += '}';
    return out;
}

std::string ResultSerializer::to_json(const AnalysisResult& result) {
    std::string issues = "[";
    for (size_t i = 0; i < result.issues.size(); ++i) {
        if (i > 0) issues += ',';
        issues += to_json(result.issues[i]);
    }
    issues += ']';

    std::string out = std::format(
        "{{\"plan\":{},\"planText\":{},\"issues\":{},\"recommendations\":{},\"healthScore\":{}",
        to_json(result.plan), quoted(result.plan_text), issues,
        to_json(result.recommendations), result.health_score);
    append_number(out, "measuredExecutionTime", result.measured_execution_time);
    out += '}';
    return out;
}

} // namespace plansight

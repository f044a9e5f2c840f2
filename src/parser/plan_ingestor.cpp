#include "parser/plan_ingestor.hpp"
#include "parser/plan_keys.hpp"
#include "core/utils.hpp"

#include <array>
#include <format>

namespace plansight {

namespace {

constexpr std::array<std::string_view, 11> kMappedNodeKeys = {
    plan_keys::kNodeType,          plan_keys::kRelationName,
    plan_keys::kStartupCost,       plan_keys::kTotalCost,
    plan_keys::kPlanRows,          plan_keys::kPlanWidth,
    plan_keys::kActualStartupTime, plan_keys::kActualTotalTime,
    plan_keys::kActualRows,        plan_keys::kActualLoops,
    plan_keys::kPlans,
};

inline char ascii_lower(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : c;
}

inline char ascii_upper(char c) {
    return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 32) : c;
}

std::optional<std::string> non_empty_string(const JsonValue& v) {
    auto s = v.as_string();
    if (!s || s->empty()) return std::nullopt;
    return s;
}

} // anonymous namespace

QueryPlan PlanIngestor::degenerate_plan() {
    QueryPlan plan;
    plan.plan.node_type = std::string(plan_keys::kUnknownNodeType);
    return plan;
}

QueryPlan PlanIngestor::ingest_text(std::string_view json_text) {
    if (utils::trim(std::string(json_text)).empty()) {
        utils::log::warn("Plan ingest: empty input, using Unknown plan");
        return degenerate_plan();
    }

    JsonValue doc;
    try {
        doc = JsonValue::parse(json_text);
    } catch (const JsonValue::parse_error& e) {
        utils::log::warn(std::format("Plan ingest: {}, using Unknown plan", e.what()));
        return degenerate_plan();
    }
    return ingest(doc);
}

QueryPlan PlanIngestor::ingest(const JsonValue& raw) {
    JsonValue doc;
    if (raw.is_array() && raw.size() > 0) {
        doc = raw[size_t{0}];
    } else if (raw.is_object()) {
        doc = raw;
    }

    if (!doc.is_object()) {
        utils::log::warn("Plan ingest: input is not a plan object, using Unknown plan");
        return degenerate_plan();
    }

    QueryPlan plan;
    plan.execution_time = read_timing(doc, plan_keys::kExecution,
                                      plan_keys::kExecutionTime).value_or(0.0);
    plan.planning_time = read_timing(doc, plan_keys::kPlanning,
                                     plan_keys::kPlanningTime).value_or(0.0);

    const JsonValue root = doc[plan_keys::kPlan];
    if (root.is_object()) {
        plan.plan = parse_node(root);
    } else {
        utils::log::warn("Plan ingest: document has no Plan object, using Unknown root");
        plan.plan.node_type = std::string(plan_keys::kUnknownNodeType);
    }

    const JsonValue triggers = doc[plan_keys::kTriggers];
    if (!triggers.is_null()) {
        plan.triggers = triggers;
    }

    for (const auto& w : doc[plan_keys::kWarnings].elements()) {
        plan.warnings.push_back(w.is_string() ? *w.as_string() : w.dump());
    }

    plan.query = non_empty_string(doc[plan_keys::kQuery]);
    return plan;
}

std::optional<double> PlanIngestor::read_timing(const JsonValue& doc,
                                                std::string_view section,
                                                std::string_view key) {
    if (auto top = doc[key].as_number()) return top;
    return doc[section][key].as_number();
}

PlanNode PlanIngestor::parse_node(const JsonValue& node) {
    PlanNode out;
    if (!node.is_object()) {
        out.node_type = std::string(plan_keys::kUnknownNodeType);
        return out;
    }

    out.node_type = non_empty_string(node[plan_keys::kNodeType])
                        .value_or(std::string(plan_keys::kUnknownNodeType));
    out.relation = non_empty_string(node[plan_keys::kRelationName]);

    out.startup_cost        = node[plan_keys::kStartupCost].as_number();
    out.total_cost          = node[plan_keys::kTotalCost].as_number();
    out.plan_rows           = node[plan_keys::kPlanRows].as_number();
    out.plan_width          = node[plan_keys::kPlanWidth].as_number();
    out.actual_startup_time = node[plan_keys::kActualStartupTime].as_number();
    out.actual_total_time   = node[plan_keys::kActualTotalTime].as_number();
    out.actual_rows         = node[plan_keys::kActualRows].as_number();
    out.actual_loops        = node[plan_keys::kActualLoops].as_number();

    for (auto& [key, value] : node.items()) {
        if (is_mapped_key(key)) continue;
        out.attributes.insert_or_assign(normalize_key(key), std::move(value));
    }

    const JsonValue plans = node[plan_keys::kPlans];
    if (plans.is_array()) {
        const auto children = plans.elements();
        out.children.reserve(children.size());
        for (const auto& child : children) {
            out.children.push_back(parse_node(child));
        }
    }

    return out;
}

bool PlanIngestor::is_mapped_key(std::string_view key) {
    for (const auto mapped : kMappedNodeKeys) {
        if (mapped == key) return true;
    }
    return false;
}

std::string PlanIngestor::normalize_key(std::string_view key) {
    std::string result;
    result.reserve(key.size());

    bool word_start = false;
    for (const char c : key) {
        if (utils::is_space(static_cast<unsigned char>(c))) {
            word_start = !result.empty();
            continue;
        }
        if (result.empty()) {
            result += ascii_lower(c);
        } else if (word_start) {
            result += ascii_upper(c);
        } else {
            result += c;
        }
        word_start = false;
    }
    return result;
}

} // namespace plansight

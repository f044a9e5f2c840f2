#pragma once

#include "core/json.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace plansight {

// ============================================================================
// Basic Enums
// ============================================================================

// Ordered: LOW < MEDIUM < HIGH < CRITICAL
enum class Severity {
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

enum class IssueType {
    SEQUENTIAL_SCAN,
    EXPENSIVE_JOIN,
    ESTIMATION_ERROR,
    TEMPORARY_FILES,
    INEFFICIENT_INDEX,
    MISSING_PARALLELISM,
    HIGH_PLANNING_TIME
};

[[nodiscard]] inline constexpr std::string_view severity_to_string(Severity s) {
    switch (s) {
        case Severity::LOW:      return "low";
        case Severity::MEDIUM:   return "medium";
        case Severity::HIGH:     return "high";
        case Severity::CRITICAL: return "critical";
    }
    return "low";
}

[[nodiscard]] inline constexpr std::string_view issue_type_to_string(IssueType t) {
    switch (t) {
        case IssueType::SEQUENTIAL_SCAN:     return "sequential_scan";
        case IssueType::EXPENSIVE_JOIN:      return "expensive_join";
        case IssueType::ESTIMATION_ERROR:    return "estimation_error";
        case IssueType::TEMPORARY_FILES:     return "temporary_files";
        case IssueType::INEFFICIENT_INDEX:   return "inefficient_index";
        case IssueType::MISSING_PARALLELISM: return "missing_parallelism";
        case IssueType::HIGH_PLANNING_TIME:  return "high_planning_time";
    }
    return "unknown";
}

// ============================================================================
// Query Fingerprint
// ============================================================================

struct QueryFingerprint {
    uint64_t hash;              // xxHash64 of normalized query
    std::string normalized;     // Normalized query text (literals replaced)

    QueryFingerprint() : hash(0) {}
    QueryFingerprint(uint64_t h, std::string n) : hash(h), normalized(std::move(n)) {}
};

// ============================================================================
// Canonical Query Plan
// ============================================================================

/**
 * @brief One operator of a captured execution plan
 *
 * Statistics are optional: EXPLAIN without ANALYZE has no actual_* fields,
 * and engines differ in what they report. Keys the ingestor does not map
 * onto a field land in `attributes` under their camelCase name.
 */
struct PlanNode {
    std::string node_type = "Unknown";
    std::optional<std::string> relation;

    std::optional<double> startup_cost;
    std::optional<double> total_cost;
    std::optional<double> plan_rows;
    std::optional<double> plan_width;

    std::optional<double> actual_startup_time;  // ms
    std::optional<double> actual_total_time;    // ms
    std::optional<double> actual_rows;
    std::optional<double> actual_loops;

    std::vector<PlanNode> children;             // execution order
    std::map<std::string, JsonValue> attributes;

    // nullptr when the attribute was not reported
    [[nodiscard]] const JsonValue* attribute(std::string_view key) const {
        auto it = attributes.find(std::string(key));
        return it != attributes.end() ? &it->second : nullptr;
    }
};

struct QueryPlan {
    double execution_time = 0.0;                // ms
    double planning_time = 0.0;                 // ms
    PlanNode plan;
    std::optional<JsonValue> triggers;
    std::vector<std::string> warnings;
    std::optional<std::string> query;
};

// ============================================================================
// Diagnostics
// ============================================================================

struct Issue {
    IssueType type;
    std::string description;
    Severity severity;
    std::optional<std::string> related_node;    // display label of the operator
    std::optional<std::string> suggested_fix;

    bool operator==(const Issue&) const = default;
};

} // namespace plansight

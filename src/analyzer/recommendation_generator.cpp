#include "analyzer/recommendation_generator.hpp"

#include <algorithm>
#include <array>
#include <string_view>

namespace plansight {

namespace {

constexpr std::string_view kSeqScanPrefix = "Seq Scan on ";

struct Advice {
    IssueType type;
    std::string_view text;
};

// Emission order; sequential_scan is built separately
constexpr std::array<Advice, 5> kFixedAdvice = {{
    {IssueType::ESTIMATION_ERROR,
     "Run ANALYZE on tables with statistics errors to improve query planning"},
    {IssueType::EXPENSIVE_JOIN,
     "Review join conditions and add appropriate indexes for join columns"},
    {IssueType::TEMPORARY_FILES,
     "Increase work_mem setting or break down the query into smaller operations"},
    {IssueType::INEFFICIENT_INDEX,
     "Consider creating more specific indexes that better match query patterns"},
    {IssueType::MISSING_PARALLELISM,
     "Enable parallel query execution for this operation (increase max_parallel_workers)"},
}};

constexpr std::string_view kCachingAdvice = "Consider caching frequently accessed query results";

bool has_type(const std::vector<Issue>& issues, IssueType type) {
    return std::any_of(issues.begin(), issues.end(),
                       [type](const Issue& i) { return i.type == type; });
}

} // anonymous namespace

std::vector<std::string> RecommendationGenerator::generate(const QueryPlan& plan,
                                                           const std::vector<Issue>& issues) const {
    std::vector<std::string> recommendations;

    // Tables from "Seq Scan on <table>" labels, first-seen order, no repeats
    std::vector<std::string> tables;
    for (const auto& issue : issues) {
        if (issue.type != IssueType::SEQUENTIAL_SCAN || !issue.related_node) continue;
        std::string_view label = *issue.related_node;
        if (label.starts_with(kSeqScanPrefix)) label.remove_prefix(kSeqScanPrefix.size());
        if (label.empty()) continue;
        if (std::find(tables.begin(), tables.end(), label) == tables.end()) {
            tables.emplace_back(label);
        }
    }
    if (!tables.empty()) {
        std::string line = "Consider adding indexes for tables: ";
        for (size_t i = 0; i < tables.size(); ++i) {
            if (i > 0) line += ", ";
            line += tables[i];
        }
        recommendations.push_back(std::move(line));
    }

    for (const auto& advice : kFixedAdvice) {
        if (has_type(issues, advice.type)) {
            recommendations.emplace_back(advice.text);
        }
    }

    if (plan.execution_time > caching_min_execution_ms_) {
        recommendations.emplace_back(kCachingAdvice);
    }

    return recommendations;
}

} // namespace plansight

#pragma once

#include "analyzer/plan_analyzer.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>

namespace plansight {

/**
 * @brief What the storage layer keeps for one analyzed query
 *
 * Rows are grouped by `fingerprint.normalized` so the history of one
 * query shape can be compared across executions. Building the record is
 * pure; writing it somewhere is the caller's business.
 */
struct PersistenceRecord {
    std::string query_text;
    QueryFingerprint fingerprint;
    double execution_time = 0.0;    // ms
    AnalysisResult analysis;

    [[nodiscard]] static PersistenceRecord build(std::string_view query,
                                                 AnalysisResult analysis,
                                                 double execution_time_ms);

    /**
     * @brief Row payload: query_text, query_fingerprint, query_hash,
     * execution_time, query_plan, explain_analyze, analysis_result
     */
    [[nodiscard]] std::string to_json() const;
};

} // namespace plansight

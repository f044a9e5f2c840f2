#include "analyzer/persistence_record.hpp"
#include "analyzer/result_serializer.hpp"
#include "parser/fingerprinter.hpp"
#include "core/utils.hpp"

#include <format>

namespace plansight {

PersistenceRecord PersistenceRecord::build(std::string_view query, AnalysisResult analysis,
                                           double execution_time_ms) {
    PersistenceRecord record;
    record.query_text = std::string(query);
    record.fingerprint = QueryFingerprinter::fingerprint(query);
    record.execution_time = execution_time_ms;
    record.analysis = std::move(analysis);
    return record;
}

std::string PersistenceRecord::to_json() const {
    std::string issues = "[";
    for (size_t i = 0; i < analysis.issues.size(); ++i) {
        if (i > 0) issues += ',';
        issues += ResultSerializer::to_json(analysis.issues[i]);
    }
    issues += ']';

    return std::format(
        "{{\"query_text\":\"{}\",\"query_fingerprint\":\"{}\",\"query_hash\":\"{:016x}\","
        "\"execution_time\":{},\"query_plan\":{},\"explain_analyze\":\"{}\","
        "\"analysis_result\":{{\"issues\":{},\"recommendations\":{},\"healthScore\":{}}}}}",
        utils::escape_json(query_text),
        utils::escape_json(fingerprint.normalized),
        fingerprint.hash,
        utils::format_number(execution_time),
        ResultSerializer::to_json(analysis.plan),
        utils::escape_json(analysis.plan_text),
        issues,
        ResultSerializer::to_json(analysis.recommendations),
        analysis.health_score);
}

} // namespace plansight

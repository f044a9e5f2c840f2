#pragma once

#include "analyzer/plan_analyzer.hpp"
#include "analyzer/thresholds.hpp"

#include <toml.hpp>

#include <string>
#include <vector>

namespace plansight {

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// PlansightConfig - Complete parsed configuration
// ============================================================================

struct PlansightConfig {
    LoggingConfig logging;
    AnalyzerThresholds thresholds;
    SeverityWeights scoring;

    [[nodiscard]] PlanAnalyzer::Config analyzer_config() const {
        return PlanAnalyzer::Config{thresholds, scoring};
    }
};

// ============================================================================
// ConfigLoader - Extract typed config from TOML
// ============================================================================

/**
 * Recognized layout (every key optional; defaults from the structs above):
 *
 *   include = ["common.toml"]      # merged underneath this file
 *
 *   [logging]
 *   level = "info"                 # debug | info | warn | error
 *
 *   [thresholds]
 *   seq_scan_min_rows = 1000       # any AnalyzerThresholds field by name
 *
 *   [scoring]
 *   low = 5
 *   medium = 10
 *   high = 20
 *   critical = 40
 *
 * String values expand ${ENV_VAR}.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        PlansightConfig config;

        static LoadResult ok(PlansightConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to plansight.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Every constraint violation in `config`; empty when valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const PlansightConfig& config);

private:
    static PlansightConfig extract_all_sections(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static AnalyzerThresholds extract_thresholds(const toml::table& root);
    static SeverityWeights extract_scoring(const toml::table& root);

    static LoadResult validate_and_return(PlansightConfig config);
};

} // namespace plansight

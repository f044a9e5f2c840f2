#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <unordered_set>

namespace plansight {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        }
    }
}

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key) && base[key].is_table()) {
            merge_tables(*base[key].as_table(), *val.as_table());
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

/**
 * @brief Resolve include directives in a parsed TOML table.
 */
void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > 10) {
        throw std::runtime_error("Config include depth exceeds 10, possible circular include");
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (const auto& item : *inc_node.as_array()) {
            if (item.is_string()) {
                paths.emplace_back(item.as_string()->get());
            }
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        const std::string inc_dir = fs::path(abs_path).parent_path().string();
        resolve_includes(included, inc_dir, visited, depth + 1);

        // Included file is the base; the including file wins
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);

    namespace fs = std::filesystem;
    const std::string base_dir = fs::path(file_path).parent_path().string();
    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, base_dir, visited, 0);

    expand_env_vars_recursive(result);
    return result;
}

// Numeric key accepting either integer or float TOML values
void read_double(const toml::table& tbl, std::string_view key, double& out) {
    if (auto v = tbl[key].value<double>()) out = *v;
}

void read_int(const toml::table& tbl, std::string_view key, int& out) {
    if (auto v = tbl[key].value<int64_t>()) out = static_cast<int>(*v);
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or(cfg.level);
    return cfg;
}

AnalyzerThresholds ConfigLoader::extract_thresholds(const toml::table& root) {
    AnalyzerThresholds t;
    const auto* section = root["thresholds"].as_table();
    if (!section) return t;
    const auto& s = *section;

    read_double(s, "seq_scan_min_rows", t.seq_scan_min_rows);
    read_double(s, "seq_scan_min_time_ms", t.seq_scan_min_time_ms);
    read_double(s, "seq_scan_high_rows", t.seq_scan_high_rows);
    read_double(s, "join_min_rows", t.join_min_rows);
    read_double(s, "join_min_time_ms", t.join_min_time_ms);
    read_double(s, "join_high_time_ms", t.join_high_time_ms);
    read_double(s, "estimation_ratio_medium", t.estimation_ratio_medium);
    read_double(s, "estimation_ratio_high", t.estimation_ratio_high);
    read_double(s, "index_max_actual_rows", t.index_max_actual_rows);
    read_double(s, "index_min_plan_rows", t.index_min_plan_rows);
    read_double(s, "parallel_min_execution_ms", t.parallel_min_execution_ms);
    read_double(s, "planning_ratio", t.planning_ratio);
    read_double(s, "caching_min_execution_ms", t.caching_min_execution_ms);
    return t;
}

SeverityWeights ConfigLoader::extract_scoring(const toml::table& root) {
    SeverityWeights w;
    const auto* section = root["scoring"].as_table();
    if (!section) return w;
    const auto& s = *section;

    read_int(s, "low", w.low);
    read_int(s, "medium", w.medium);
    read_int(s, "high", w.high);
    read_int(s, "critical", w.critical);
    return w;
}

PlansightConfig ConfigLoader::extract_all_sections(const toml::table& root) {
    PlansightConfig config;
    config.logging = extract_logging(root);
    config.thresholds = extract_thresholds(root);
    config.scoring = extract_scoring(root);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(PlansightConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const PlansightConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be one of debug, info, warn, error, got '{}'",
            config.logging.level));
    }

    const auto& t = config.thresholds;
    const std::pair<std::string_view, double> non_negative[] = {
        {"seq_scan_min_rows", t.seq_scan_min_rows},
        {"seq_scan_min_time_ms", t.seq_scan_min_time_ms},
        {"seq_scan_high_rows", t.seq_scan_high_rows},
        {"join_min_rows", t.join_min_rows},
        {"join_min_time_ms", t.join_min_time_ms},
        {"join_high_time_ms", t.join_high_time_ms},
        {"index_max_actual_rows", t.index_max_actual_rows},
        {"index_min_plan_rows", t.index_min_plan_rows},
        {"parallel_min_execution_ms", t.parallel_min_execution_ms},
        {"caching_min_execution_ms", t.caching_min_execution_ms},
    };
    for (const auto& [name, value] : non_negative) {
        if (value < 0) {
            errors.push_back(std::format("thresholds.{} must be >= 0, got {}", name, value));
        }
    }

    if (t.estimation_ratio_medium <= 1.0) {
        errors.push_back(std::format(
            "thresholds.estimation_ratio_medium must be > 1, got {}", t.estimation_ratio_medium));
    }
    if (t.estimation_ratio_high < t.estimation_ratio_medium) {
        errors.push_back(std::format(
            "thresholds.estimation_ratio_high ({}) < estimation_ratio_medium ({})",
            t.estimation_ratio_high, t.estimation_ratio_medium));
    }
    if (t.planning_ratio <= 0) {
        errors.push_back(std::format("thresholds.planning_ratio must be > 0, got {}",
                                     t.planning_ratio));
    }

    const auto& w = config.scoring;
    const std::pair<std::string_view, int> weights[] = {
        {"low", w.low}, {"medium", w.medium}, {"high", w.high}, {"critical", w.critical},
    };
    for (const auto& [name, value] : weights) {
        if (value < 0) {
            errors.push_back(std::format("scoring.{} must be >= 0, got {}", name, value));
        }
    }

    return errors;
}

} // namespace plansight

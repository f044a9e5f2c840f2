#include "analyzer/persistence_record.hpp"
#include "analyzer/plan_analyzer.hpp"
#include "analyzer/result_serializer.hpp"
#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "parser/fingerprinter.hpp"

#include <charconv>
#include <format>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

using namespace plansight;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

constexpr std::string_view kUsage =
    "Usage: plansight [options] PLAN.json\n"
    "       plansight --fingerprint SQL\n"
    "\n"
    "Analyze an EXPLAIN (ANALYZE, FORMAT JSON) capture and print the diagnosis as JSON.\n"
    "PLAN.json may be '-' to read standard input.\n"
    "\n"
    "Options:\n"
    "  --config FILE         TOML configuration (thresholds, scoring, logging)\n"
    "  --text FILE           Text rendering of the plan to carry for display\n"
    "  --execution-ms N      Wall-clock execution time measured by the caller\n"
    "  --query SQL           Query text the plan was captured for\n"
    "  --record              Print the persistence record instead (needs --query)\n"
    "  --fingerprint SQL     Print the query fingerprint and its hash, then exit\n"
    "  --help                Show this message\n";

struct CliOptions {
    std::optional<std::string> config_file;
    std::optional<std::string> text_file;
    std::optional<double> execution_ms;
    std::optional<std::string> query;
    std::optional<std::string> fingerprint_sql;
    std::string plan_file;
    bool record = false;
    bool help = false;
};

Result<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        auto next_value = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) return std::nullopt;
            return std::string(argv[++i]);
        };

        if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--record") {
            opts.record = true;
        } else if (arg == "--config" || arg == "--text" || arg == "--query" ||
                   arg == "--fingerprint" || arg == "--execution-ms") {
            auto value = next_value();
            if (!value) {
                return Result<CliOptions>::error(ErrorCategory::USAGE_ERROR,
                                                 std::format("{} requires a value", arg));
            }
            if (arg == "--config") {
                opts.config_file = std::move(*value);
            } else if (arg == "--text") {
                opts.text_file = std::move(*value);
            } else if (arg == "--query") {
                opts.query = std::move(*value);
            } else if (arg == "--fingerprint") {
                opts.fingerprint_sql = std::move(*value);
            } else {
                double ms = 0.0;
                const auto* begin = value->data();
                const auto* end = begin + value->size();
                const auto [ptr, ec] = std::from_chars(begin, end, ms);
                if (ec != std::errc{} || ptr != end || ms < 0) {
                    return Result<CliOptions>::error(
                        ErrorCategory::USAGE_ERROR,
                        std::format("--execution-ms expects a non-negative number, got '{}'", *value));
                }
                opts.execution_ms = ms;
            }
        } else if (arg.size() > 1 && arg.starts_with("-")) {
            return Result<CliOptions>::error(ErrorCategory::USAGE_ERROR,
                                             std::format("Unknown option {}", arg));
        } else if (opts.plan_file.empty()) {
            opts.plan_file = std::string(arg);
        } else {
            return Result<CliOptions>::error(ErrorCategory::USAGE_ERROR,
                                             "Only one plan file may be given");
        }
    }

    if (!opts.help && !opts.fingerprint_sql && opts.plan_file.empty()) {
        return Result<CliOptions>::error(ErrorCategory::USAGE_ERROR, "No plan file given");
    }
    if (opts.record && !opts.query) {
        return Result<CliOptions>::error(ErrorCategory::USAGE_ERROR, "--record requires --query");
    }
    return Result<CliOptions>::ok(std::move(opts));
}

Result<std::string> read_input(const std::string& path) {
    if (path == "-") {
        std::ostringstream ss;
        ss << std::cin.rdbuf();
        return Result<std::string>::ok(ss.str());
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<std::string>::error(ErrorCategory::IO_ERROR,
                                          std::format("Cannot open {}", path));
    }
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return Result<std::string>::error(ErrorCategory::IO_ERROR,
                                          std::format("Failed reading {}", path));
    }
    return Result<std::string>::ok(std::move(content));
}

int run(const CliOptions& opts) {
    if (opts.fingerprint_sql) {
        const auto fp = QueryFingerprinter::fingerprint(*opts.fingerprint_sql);
        std::cout << std::format("{{\"fingerprint\":\"{}\",\"hash\":\"{:016x}\"}}\n",
                                 utils::escape_json(fp.normalized), fp.hash);
        return kExitOk;
    }

    PlansightConfig config;
    if (opts.config_file) {
        utils::log::info(std::format("Loading configuration from {}", *opts.config_file));
        auto loaded = ConfigLoader::load_from_file(*opts.config_file);
        if (!loaded.success) {
            utils::log::error(loaded.error_message);
            return kExitFailure;
        }
        config = std::move(loaded.config);
    }
    if (auto level = utils::log::parse_level(config.logging.level)) {
        utils::log::set_level(*level);
    }

    auto plan_json = read_input(opts.plan_file);
    if (plan_json.is_error()) {
        utils::log::error(std::format("[{}] {}", error_category_to_string(plan_json.error_category()),
                                      plan_json.error_message()));
        return kExitFailure;
    }

    std::string plan_text;
    if (opts.text_file) {
        auto text = read_input(*opts.text_file);
        if (text.is_error()) {
            utils::log::error(std::format("[{}] {}", error_category_to_string(text.error_category()),
                                          text.error_message()));
            return kExitFailure;
        }
        plan_text = std::move(text.value());
    }

    const PlanAnalyzer analyzer(config.analyzer_config());
    auto result = analyzer.analyze_json(plan_json.value(), std::move(plan_text), opts.execution_ms);
    utils::log::info(std::format("{}: {} issues, health score {}", opts.plan_file,
                                 result.issues.size(), result.health_score));

    if (opts.record) {
        const double exec_ms = opts.execution_ms.value_or(result.plan.execution_time);
        const auto record = PersistenceRecord::build(*opts.query, std::move(result), exec_ms);
        std::cout << record.to_json() << '\n';
    } else {
        std::cout << ResultSerializer::to_json(result) << '\n';
    }
    return kExitOk;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    auto parsed = parse_args(argc, argv);
    if (parsed.is_error()) {
        utils::log::error(parsed.error_message());
        std::cerr << kUsage;
        return kExitUsage;
    }
    if (parsed.value().help) {
        std::cout << kUsage;
        return kExitOk;
    }

    try {
        return run(parsed.value());
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return kExitFailure;
    }
}

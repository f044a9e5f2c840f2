#pragma once

#include "core/types.hpp"

namespace plansight {

/**
 * @brief Rule cutoffs for the diagnostic rules
 *
 * Hand-tuned heuristics, not calibrated against a workload. Defaults
 * reproduce the established behavior; [thresholds] in the config file
 * overrides them by field name.
 */
struct AnalyzerThresholds {
    // Sequential scan: rows > min_rows or time > min_time; HIGH above high_rows
    double seq_scan_min_rows = 1000;
    double seq_scan_min_time_ms = 100;
    double seq_scan_high_rows = 10000;

    // Join: rows > min_rows or time > min_time; HIGH above high_time
    double join_min_rows = 10000;
    double join_min_time_ms = 500;
    double join_high_time_ms = 1000;

    // actual/plan row ratio outside [1/x, x]
    double estimation_ratio_medium = 10;
    double estimation_ratio_high = 100;

    // Index scan returning < max_actual_rows while planned > min_plan_rows
    double index_max_actual_rows = 10;
    double index_min_plan_rows = 1000;

    double parallel_min_execution_ms = 1000;

    // planning_time > planning_ratio * execution_time
    double planning_ratio = 0.5;

    double caching_min_execution_ms = 1000;
};

/**
 * @brief Health score deduction per issue severity
 */
struct SeverityWeights {
    int low = 5;
    int medium = 10;
    int high = 20;
    int critical = 40;

    [[nodiscard]] int deduction(Severity s) const {
        switch (s) {
            case Severity::LOW:      return low;
            case Severity::MEDIUM:   return medium;
            case Severity::HIGH:     return high;
            case Severity::CRITICAL: return critical;
        }
        return 0;
    }
};

} // namespace plansight

#pragma once

#include "core/types.hpp"

#include <string>

namespace plansight {

/**
 * @brief Text rendering of a canonical plan, EXPLAIN ANALYZE style
 *
 *   Hash Join  (cost=1.00..20.50 rows=100 width=16) (actual time=0.100..4.200 rows=90 loops=1)
 *     ->  Seq Scan on orders  (cost=0.00..10.00 rows=500 width=8)
 *   Planning Time: 0.120 ms
 *   Execution Time: 4.500 ms
 *
 * Display only; nothing downstream parses it.
 */
class PlanRenderer {
public:
    [[nodiscard]] static std::string render(const QueryPlan& plan);

    [[nodiscard]] static std::string render_node_line(const PlanNode& node);
};

} // namespace plansight

#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <string>
#include <string_view>

namespace plansight {

/**
 * @brief Query fingerprinter - literal-stripping SQL normalization
 *
 * Groups structurally identical queries for the persistence layer.
 * Passes, in order:
 * - Standalone integer literals    -> N
 * - 'single-quoted' strings        -> S
 * - [array literals]               -> A
 * - {json literals}                -> J
 * - Collapse whitespace runs, trim
 *
 * Heuristic only: no SQL grammar, no connection. Re-applying it to its own
 * output is a no-op.
 *
 * Example:
 *   Input:  "SELECT *  FROM t WHERE id = 42 AND tags = '{a,b}'"
 *   Output: "SELECT * FROM t WHERE id = N AND tags = S"
 */
class QueryFingerprinter {
public:
    static constexpr char kIntegerPlaceholder = 'N';
    static constexpr char kStringPlaceholder = 'S';
    static constexpr char kArrayPlaceholder = 'A';
    static constexpr char kJsonPlaceholder = 'J';

    /**
     * @brief Compute fingerprint of SQL query
     * @param sql Raw SQL query string
     * @return QueryFingerprint with normalized query and xxHash64
     */
    [[nodiscard]] static QueryFingerprint fingerprint(std::string_view sql);

    /**
     * @brief Normalized text only (the grouping key)
     */
    [[nodiscard]] static std::string normalize(std::string_view sql);

private:
    static std::string replace_integers(std::string_view sql);

    /**
     * @brief Replace every open...close span with a placeholder
     *
     * The span ends at the first `close` after `open`; an `open` with no
     * later `close` is kept as is.
     */
    static std::string replace_delimited(std::string_view sql, char open, char close,
                                         char placeholder);

    static std::string collapse_whitespace(std::string_view sql);

    static uint64_t compute_hash(std::string_view data);
};

} // namespace plansight

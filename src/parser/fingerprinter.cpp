#include "parser/fingerprinter.hpp"
#include "core/utils.hpp"

#define XXH_INLINE_ALL
#include <xxhash.h>

namespace plansight {

// ============================================================================
// Character classification table. Word characters follow the regex notion
// of \w (ASCII letters, digits, underscore), which decides what counts as a
// standalone number.
// ============================================================================
namespace {

enum CharClass : uint8_t {
    CC_OTHER = 0,
    CC_DIGIT = 1,
    CC_WORD  = 2,   // letters and '_'
};

struct CharTable {
    uint8_t cls[256];

    constexpr CharTable() : cls{} {
        for (int i = 0; i < 256; ++i) cls[i] = CC_OTHER;
        for (int i = '0'; i <= '9'; ++i) cls[i] = CC_DIGIT;
        for (int i = 'a'; i <= 'z'; ++i) cls[i] = CC_WORD;
        for (int i = 'A'; i <= 'Z'; ++i) cls[i] = CC_WORD;
        cls['_'] = CC_WORD;
    }
};

static constexpr CharTable CT{};

inline bool ct_digit(unsigned char c) { return CT.cls[c] == CC_DIGIT; }
inline bool ct_word(unsigned char c)  { return CT.cls[c] != CC_OTHER; }

} // anonymous namespace

QueryFingerprint QueryFingerprinter::fingerprint(std::string_view sql) {
    std::string normalized = normalize(sql);
    const uint64_t hash = compute_hash(normalized);
    return QueryFingerprint(hash, std::move(normalized));
}

std::string QueryFingerprinter::normalize(std::string_view sql) {
    std::string s = replace_integers(sql);
    s = replace_delimited(s, '\'', '\'', kStringPlaceholder);
    s = replace_delimited(s, '[', ']', kArrayPlaceholder);
    s = replace_delimited(s, '{', '}', kJsonPlaceholder);
    return collapse_whitespace(s);
}

std::string QueryFingerprinter::replace_integers(std::string_view sql) {
    std::string result;
    result.reserve(sql.size());

    const size_t len = sql.size();
    size_t i = 0;
    while (i < len) {
        const auto c = static_cast<unsigned char>(sql[i]);
        if (!ct_digit(c)) {
            result += static_cast<char>(c);
            ++i;
            continue;
        }

        // Maximal digit run [i, end)
        size_t end = i;
        while (end < len && ct_digit(static_cast<unsigned char>(sql[end]))) ++end;

        const bool boundary_before = (i == 0) || !ct_word(static_cast<unsigned char>(sql[i - 1]));
        const bool boundary_after = (end == len) || !ct_word(static_cast<unsigned char>(sql[end]));

        if (boundary_before && boundary_after) {
            result += kIntegerPlaceholder;
        } else {
            result.append(sql.substr(i, end - i));
        }
        i = end;
    }
    return result;
}

std::string QueryFingerprinter::replace_delimited(std::string_view sql, char open, char close,
                                                  char placeholder) {
    std::string result;
    result.reserve(sql.size());

    size_t i = 0;
    while (i < sql.size()) {
        if (sql[i] != open) {
            result += sql[i++];
            continue;
        }
        const size_t closing = sql.find(close, i + 1);
        if (closing == std::string_view::npos) {
            // Unterminated: nothing after this point can match either
            result.append(sql.substr(i));
            break;
        }
        result += placeholder;
        i = closing + 1;
    }
    return result;
}

std::string QueryFingerprinter::collapse_whitespace(std::string_view sql) {
    std::string result;
    result.reserve(sql.size());

    bool pending_space = false;
    for (const char c : sql) {
        if (utils::is_space(static_cast<unsigned char>(c))) {
            pending_space = !result.empty();
            continue;
        }
        if (pending_space) {
            result += ' ';
            pending_space = false;
        }
        result += c;
    }
    return result;
}

uint64_t QueryFingerprinter::compute_hash(std::string_view data) {
    return XXH64(data.data(), data.size(), 0);
}

} // namespace plansight

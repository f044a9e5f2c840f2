#pragma once

#include <glaze/glaze.hpp>

#include <cmath>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace plansight {

/**
 * @brief Read-only JSON DOM value over glz::json_t
 *
 * Carries raw EXPLAIN output into the ingestor and engine-specific
 * attribute values on plan nodes. Stores json_t by value; accessors
 * return copies, so recursive walks never hold references into a
 * parent that may go away.
 */
class JsonValue {
public:
    using array_t = glz::json_t::array_t;
    using object_t = glz::json_t::object_t;

    struct parse_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // ===== Constructors =====

    JsonValue() = default;
    JsonValue(glz::json_t v) : data_(std::move(v)) {}
    JsonValue(std::nullptr_t) {}
    JsonValue(bool v) { data_ = v; }
    JsonValue(int v) { data_ = static_cast<double>(v); }
    JsonValue(long long v) { data_ = static_cast<double>(v); }
    JsonValue(double v) { data_ = v; }
    JsonValue(const char* v) { data_ = std::string(v); }
    JsonValue(const std::string& v) { data_ = v; }
    JsonValue(std::string&& v) { data_ = std::move(v); }

    // ===== Type Checks =====

    [[nodiscard]] bool is_null() const { return data_.is_null(); }
    [[nodiscard]] bool is_object() const { return data_.is_object(); }
    [[nodiscard]] bool is_array() const { return data_.is_array(); }
    [[nodiscard]] bool is_string() const { return data_.is_string(); }
    [[nodiscard]] bool is_number() const { return data_.is_number(); }
    [[nodiscard]] bool is_boolean() const { return data_.is_boolean(); }

    // ===== Container Properties =====

    [[nodiscard]] size_t size() const {
        if (data_.is_object()) return data_.get_object().size();
        if (data_.is_array()) return data_.get_array().size();
        return 0;
    }

    [[nodiscard]] bool contains(std::string_view key) const {
        if (!data_.is_object()) return false;
        const auto& obj = data_.get_object();
        return obj.find(std::string(key)) != obj.end();
    }

    /**
     * @brief Whether the value carries anything.
     *
     * False for null, false, 0, NaN, "" and empty arrays/objects; true
     * otherwise. Attribute checks such as "sort space was reported" use
     * this rather than mere key presence.
     */
    [[nodiscard]] bool is_truthy() const {
        if (data_.is_null()) return false;
        if (data_.is_boolean()) return data_.get<bool>();
        if (data_.is_number()) {
            const double d = data_.get<double>();
            return d != 0.0 && !std::isnan(d);
        }
        if (data_.is_string()) return !data_.get<std::string>().empty();
        return size() > 0;
    }

    // ===== Element Access (returns copy; null when missing) =====

    [[nodiscard]] JsonValue operator[](std::string_view key) const {
        if (!data_.is_object()) return {};
        const auto& obj = data_.get_object();
        auto it = obj.find(std::string(key));
        if (it != obj.end()) return JsonValue(it->second);
        return {};
    }

    [[nodiscard]] JsonValue operator[](size_t idx) const {
        if (!data_.is_array()) return {};
        const auto& arr = data_.get_array();
        if (idx < arr.size()) return JsonValue(arr[idx]);
        return {};
    }

    // ===== Typed Extraction (nullopt on type mismatch) =====

    [[nodiscard]] std::optional<double> as_number() const {
        if (!data_.is_number()) return std::nullopt;
        return data_.get<double>();
    }

    [[nodiscard]] std::optional<std::string> as_string() const {
        if (!data_.is_string()) return std::nullopt;
        return data_.get<std::string>();
    }

    // Array elements in order; empty for non-arrays
    [[nodiscard]] std::vector<JsonValue> elements() const {
        std::vector<JsonValue> out;
        if (!data_.is_array()) return out;
        const auto& arr = data_.get_array();
        out.reserve(arr.size());
        for (const auto& v : arr) out.emplace_back(v);
        return out;
    }

    // Object members as (key, value) pairs in key order; empty for non-objects
    [[nodiscard]] std::vector<std::pair<std::string, JsonValue>> items() const {
        std::vector<std::pair<std::string, JsonValue>> out;
        if (!data_.is_object()) return out;
        const auto& obj = data_.get_object();
        out.reserve(obj.size());
        for (const auto& [k, v] : obj) out.emplace_back(k, JsonValue(v));
        return out;
    }

    // ===== Parsing / Serialization =====

    [[nodiscard]] static JsonValue parse(std::string_view json_str) {
        glz::json_t result;
        std::string buffer(json_str);
        auto ec = glz::read_json(result, buffer);
        if (ec) {
            throw parse_error("JSON parse error");
        }
        return JsonValue(std::move(result));
    }

    // Compact JSON text; object members in key order
    [[nodiscard]] std::string dump() const {
        std::string out;
        dump_into(data_, out);
        return out;
    }

    [[nodiscard]] const glz::json_t& raw() const { return data_; }

private:
    static void dump_into(const glz::json_t& v, std::string& out);

    glz::json_t data_{};
};

} // namespace plansight

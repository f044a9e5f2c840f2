#include "core/json.hpp"
#include "core/utils.hpp"

namespace plansight {

void JsonValue::dump_into(const glz::json_t& v, std::string& out) {
    if (v.is_null()) {
        out += "null";
    } else if (v.is_boolean()) {
        out += v.get<bool>() ? "true" : "false";
    } else if (v.is_number()) {
        out += utils::format_number(v.get<double>());
    } else if (v.is_string()) {
        out += '"';
        out += utils::escape_json(v.get<std::string>());
        out += '"';
    } else if (v.is_array()) {
        out += '[';
        bool first = true;
        for (const auto& elem : v.get_array()) {
            if (!first) out += ',';
            first = false;
            dump_into(elem, out);
        }
        out += ']';
    } else if (v.is_object()) {
        out += '{';
        bool first = true;
        for (const auto& [key, elem] : v.get_object()) {
            if (!first) out += ',';
            first = false;
            out += '"';
            out += utils::escape_json(key);
            out += "\":";
            dump_into(elem, out);
        }
        out += '}';
    }
}

} // namespace plansight

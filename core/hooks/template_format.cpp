#include "hooks/template_format.hpp"

namespace helm {
namespace hooks {

bool format_template(const std::string &tmpl, const nlohmann::json &context, std::string &out, std::string &error) {
    std::string result;
    result.reserve(tmpl.size());

    size_t i = 0;
    while (i < tmpl.size()) {
        char c = tmpl[i];

        if (c == '}') {
            if (i + 1 < tmpl.size() && tmpl[i + 1] == '}') {
                result += '}';
                i += 2;
                continue;
            }
            error = "Single '}' encountered in format string";
            return false;
        }

        if (c != '{') {
            result += c;
            ++i;
            continue;
        }

        if (i + 1 < tmpl.size() && tmpl[i + 1] == '{') {
            result += '{';
            i += 2;
            continue;
        }

        size_t close = tmpl.find('}', i + 1);
        if (close == std::string::npos) {
            error = "Single '{' encountered in format string";
            return false;
        }

        std::string field = tmpl.substr(i + 1, close - i - 1);
        size_t spec = field.find_first_of(":!");
        if (spec != std::string::npos) {
            field.erase(spec);
        }
        if (field.empty()) {
            error = "Positional fields are not supported in hook templates";
            return false;
        }
        if (!context.is_object() || !context.contains(field)) {
            error = "Missing context key '" + field + "'";
            return false;
        }

        const auto &value = context[field];
        if (value.is_string()) {
            result += value.get<std::string>();
        } else {
            result += value.dump();
        }
        i = close + 1;
    }

    out = std::move(result);
    return true;
}

}  // namespace hooks
}  // namespace helm

#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace helm {
namespace hooks {

/**
 * Substitute {name} fields in a hook template with values from context.
 *
 * "{{" and "}}" produce literal braces. A format spec after ':' or a
 * conversion after '!' is accepted and ignored. String values are inserted
 * as-is; other values as compact JSON.
 *
 * Fails on a field missing from context, an empty field, or an unmatched
 * brace.
 */
bool format_template(const std::string &tmpl, const nlohmann::json &context, std::string &out, std::string &error);

}  // namespace hooks
}  // namespace helm

#pragma once

#include "fleetrun/engine/core.hpp"
#include <string>

namespace fleetrun {
namespace engine {

/**
 * Evaluator for the small expression language used by conditions,
 * while-loops and the calculate action.
 *
 * Input is expected to be already interpolated. Supported:
 * - logical `||`, `&&`, prefix `!`
 * - comparisons `== != < > <= >= contains startsWith endsWith`
 * - arithmetic `+ - * / %` with parentheses over numeric operands
 * - quoted strings, `true`, `false`, `null`, numbers, and bare text
 *
 * Bare text is compared as a string, so `hello world == hello world` is true.
 */
class ExpressionEvaluator {
public:
    static caf::expected<json> evaluate(const std::string& expression);

    // Applies one comparison operator. Unknown operators compare as false.
    static bool compare(const json& left, const std::string& op, const json& right);

    // Converts operand text to a value: quoted string, boolean, null, number or raw text
    static json parse_literal(const std::string& text);

    static bool is_truthy(const json& value);
};

// Renders a value the way it appears inside interpolated text
std::string display_string(const json& value);

// Parses a number from a value; returns false if it is not numeric
bool to_number(const json& value, double& out);

} // namespace engine
} // namespace fleetrun

#include "fleetrun/engine/expression.hpp"
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <vector>

namespace fleetrun {
namespace engine {

namespace {

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

json number_value(double value) {
    if (std::isfinite(value) && std::floor(value) == value && std::fabs(value) < 9e15) {
        return json(static_cast<int64_t>(value));
    }
    return json(value);
}

// Walks the text tracking quotes and parentheses; calls visit(i) for every
// position at nesting depth 0 outside quotes. visit returns true to stop.
template <class Visitor>
void scan_top_level(const std::string& s, Visitor visit) {
    char quote = 0;
    int depth = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (quote) {
            if (c == quote) quote = 0;
            continue;
        }
        if (c == '"' || c == '\'') {
            quote = c;
            continue;
        }
        if (c == '(') {
            ++depth;
            continue;
        }
        if (c == ')') {
            --depth;
            continue;
        }
        if (depth == 0 && visit(i)) {
            return;
        }
    }
}

std::vector<std::string> split_top_level(const std::string& s, const std::string& token) {
    std::vector<std::string> parts;
    size_t last = 0;
    size_t skip_until = 0;
    scan_top_level(s, [&](size_t i) {
        if (i < skip_until) return false;
        if (s.compare(i, token.size(), token) == 0) {
            parts.push_back(s.substr(last, i - last));
            last = i + token.size();
            skip_until = last;
        }
        return false;
    });
    parts.push_back(s.substr(last));
    return parts;
}

bool wrapped_in_parens(const std::string& s) {
    if (s.size() < 2 || s.front() != '(' || s.back() != ')') {
        return false;
    }
    int depth = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '(') ++depth;
        if (s[i] == ')') --depth;
        if (depth == 0 && i + 1 < s.size()) {
            return false;
        }
    }
    return true;
}

bool looks_arithmetic(const std::string& s) {
    bool has_digit = false;
    for (char c : s) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            has_digit = true;
        } else if (std::string(" +-*/%().").find(c) == std::string::npos) {
            return false;
        }
    }
    return has_digit;
}

struct ComparisonMatch {
    size_t position = std::string::npos;
    std::string op;
    size_t length = 0;
};

ComparisonMatch find_comparison(const std::string& s) {
    static const std::vector<std::string> word_ops = {"contains", "startsWith", "endsWith"};
    static const std::vector<std::string> symbol_ops = {"==", "!=", ">=", "<=", ">", "<"};

    ComparisonMatch match;
    scan_top_level(s, [&](size_t i) {
        if (s[i] == ' ') {
            for (const auto& op : word_ops) {
                std::string padded = " " + op + " ";
                if (s.compare(i, padded.size(), padded) == 0) {
                    match = {i + 1, op, op.size()};
                    return true;
                }
            }
            return false;
        }
        for (const auto& op : symbol_ops) {
            if (s.compare(i, op.size(), op) == 0) {
                match = {i, op, op.size()};
                return true;
            }
        }
        return false;
    });
    return match;
}

// Recursive-descent parser for numeric expressions
class ArithmeticParser {
public:
    explicit ArithmeticParser(const std::string& text) : text_(text) {}

    caf::expected<double> parse() {
        auto value = parse_sum();
        if (!value) {
            return value;
        }
        skip_spaces();
        if (pos_ != text_.size()) {
            return caf::make_error(caf::sec::invalid_argument,
                                   "Unexpected character in expression: " + text_.substr(pos_, 1));
        }
        return value;
    }

private:
    const std::string& text_;
    size_t pos_ = 0;

    void skip_spaces() {
        while (pos_ < text_.size() && text_[pos_] == ' ') ++pos_;
    }

    caf::expected<double> parse_sum() {
        auto left = parse_product();
        if (!left) return left;
        double value = *left;
        for (;;) {
            skip_spaces();
            if (pos_ >= text_.size() || (text_[pos_] != '+' && text_[pos_] != '-')) {
                return value;
            }
            char op = text_[pos_++];
            auto right = parse_product();
            if (!right) return right;
            value = op == '+' ? value + *right : value - *right;
        }
    }

    caf::expected<double> parse_product() {
        auto left = parse_unary();
        if (!left) return left;
        double value = *left;
        for (;;) {
            skip_spaces();
            if (pos_ >= text_.size() || std::string("*/%").find(text_[pos_]) == std::string::npos) {
                return value;
            }
            char op = text_[pos_++];
            auto right = parse_unary();
            if (!right) return right;
            if ((op == '/' || op == '%') && *right == 0.0) {
                return caf::make_error(caf::sec::invalid_argument, "Division by zero");
            }
            if (op == '*') {
                value *= *right;
            } else if (op == '/') {
                value /= *right;
            } else {
                value = std::fmod(value, *right);
            }
        }
    }

    caf::expected<double> parse_unary() {
        skip_spaces();
        if (pos_ < text_.size() && (text_[pos_] == '-' || text_[pos_] == '+')) {
            char sign = text_[pos_++];
            auto operand = parse_unary();
            if (!operand) return operand;
            return sign == '-' ? -*operand : *operand;
        }
        return parse_primary();
    }

    caf::expected<double> parse_primary() {
        skip_spaces();
        if (pos_ >= text_.size()) {
            return caf::make_error(caf::sec::invalid_argument, "Unexpected end of expression");
        }
        if (text_[pos_] == '(') {
            ++pos_;
            auto inner = parse_sum();
            if (!inner) return inner;
            skip_spaces();
            if (pos_ >= text_.size() || text_[pos_] != ')') {
                return caf::make_error(caf::sec::invalid_argument, "Missing closing parenthesis");
            }
            ++pos_;
            return inner;
        }
        const char* begin = text_.c_str() + pos_;
        char* end = nullptr;
        double value = std::strtod(begin, &end);
        if (end == begin) {
            return caf::make_error(caf::sec::invalid_argument,
                                   "Expected number at: " + text_.substr(pos_));
        }
        pos_ += static_cast<size_t>(end - begin);
        return value;
    }
};

caf::expected<json> evaluate_operand(const std::string& text) {
    std::string t = trim(text);
    if (looks_arithmetic(t)) {
        ArithmeticParser parser(t);
        auto value = parser.parse();
        if (!value) {
            return value.error();
        }
        return number_value(*value);
    }
    if (wrapped_in_parens(t)) {
        return ExpressionEvaluator::evaluate(t.substr(1, t.size() - 2));
    }
    return ExpressionEvaluator::parse_literal(t);
}

} // namespace

std::string display_string(const json& value) {
    switch (value.type()) {
        case json::value_t::string:
            return value.get<std::string>();
        case json::value_t::boolean:
            return value.get<bool>() ? "true" : "false";
        case json::value_t::number_integer:
            return std::to_string(value.get<int64_t>());
        case json::value_t::number_unsigned:
            return std::to_string(value.get<uint64_t>());
        case json::value_t::number_float: {
            double d = value.get<double>();
            if (std::isfinite(d) && std::floor(d) == d && std::fabs(d) < 1e15) {
                return std::to_string(static_cast<int64_t>(d));
            }
            return value.dump();
        }
        case json::value_t::null:
            return "null";
        default:
            return value.dump();
    }
}

bool to_number(const json& value, double& out) {
    if (value.is_number()) {
        out = value.get<double>();
        return true;
    }
    if (!value.is_string()) {
        return false;
    }
    std::string text = trim(value.get<std::string>());
    if (text.empty()) {
        return false;
    }
    char* end = nullptr;
    out = std::strtod(text.c_str(), &end);
    return end == text.c_str() + text.size();
}

json ExpressionEvaluator::parse_literal(const std::string& text) {
    std::string t = trim(text);
    if (t.size() >= 2 && (t.front() == '"' || t.front() == '\'') && t.back() == t.front()) {
        return t.substr(1, t.size() - 2);
    }
    if (t == "true") return true;
    if (t == "false") return false;
    if (t == "null") return nullptr;

    double number = 0;
    if (to_number(json(t), number)) {
        return number_value(number);
    }
    return t;
}

bool ExpressionEvaluator::is_truthy(const json& value) {
    switch (value.type()) {
        case json::value_t::null:
        case json::value_t::discarded:
            return false;
        case json::value_t::boolean:
            return value.get<bool>();
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
        case json::value_t::number_float: {
            double d = value.get<double>();
            return d != 0.0 && !std::isnan(d);
        }
        case json::value_t::string:
            return !value.get<std::string>().empty();
        default:
            return true;
    }
}

bool ExpressionEvaluator::compare(const json& left, const std::string& op, const json& right) {
    double l = 0;
    double r = 0;
    bool numeric = to_number(left, l) && to_number(right, r);

    if (op == "==" || op == "!=") {
        bool equal = numeric ? l == r : display_string(left) == display_string(right);
        return op == "==" ? equal : !equal;
    }
    if (op == "<") return numeric && l < r;
    if (op == ">") return numeric && l > r;
    if (op == "<=") return numeric && l <= r;
    if (op == ">=") return numeric && l >= r;

    std::string ls = display_string(left);
    std::string rs = display_string(right);
    if (op == "contains") {
        return ls.find(rs) != std::string::npos;
    }
    if (op == "startsWith") {
        return ls.compare(0, rs.size(), rs) == 0;
    }
    if (op == "endsWith") {
        return ls.size() >= rs.size() && ls.compare(ls.size() - rs.size(), rs.size(), rs) == 0;
    }
    return false;
}

caf::expected<json> ExpressionEvaluator::evaluate(const std::string& expression) {
    std::string e = trim(expression);
    if (e.empty()) {
        return json("");
    }

    auto ors = split_top_level(e, "||");
    if (ors.size() > 1) {
        for (const auto& part : ors) {
            auto value = evaluate(part);
            if (!value) return value;
            if (is_truthy(*value)) return json(true);
        }
        return json(false);
    }

    auto ands = split_top_level(e, "&&");
    if (ands.size() > 1) {
        for (const auto& part : ands) {
            auto value = evaluate(part);
            if (!value) return value;
            if (!is_truthy(*value)) return json(false);
        }
        return json(true);
    }

    if (e[0] == '!' && (e.size() == 1 || e[1] != '=')) {
        auto value = evaluate(e.substr(1));
        if (!value) return value;
        return json(!is_truthy(*value));
    }

    auto match = find_comparison(e);
    if (match.position != std::string::npos) {
        auto left = evaluate_operand(e.substr(0, match.position));
        if (!left) return left;
        auto right = evaluate_operand(e.substr(match.position + match.length));
        if (!right) return right;
        return json(compare(*left, match.op, *right));
    }

    return evaluate_operand(e);
}

} // namespace engine
} // namespace fleetrun

#include "fleetrun/engine/variable_store.hpp"
#include "fleetrun/engine/expression.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <functional>
#include <iomanip>
#include <random>
#include <regex>
#include <sstream>
#include <unordered_map>

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

std::vector<std::string> split(const std::string& s, char delimiter) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : s) {
        if (c == delimiter) {
            parts.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    parts.push_back(current);
    return parts;
}

// Longer index runs cannot address a real array element
constexpr size_t kMaxIndexDigits = 9;

// Splits "items[2][0]" into "items" and {2, 0}
bool parse_segment(const std::string& segment, std::string& key, std::vector<size_t>& indices) {
    size_t bracket = segment.find('[');
    key = segment.substr(0, bracket);
    indices.clear();
    while (bracket != std::string::npos) {
        size_t close = segment.find(']', bracket);
        if (close == std::string::npos) {
            return false;
        }
        std::string digits = segment.substr(bracket + 1, close - bracket - 1);
        if (digits.empty() || digits.size() > kMaxIndexDigits ||
            !std::all_of(digits.begin(), digits.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return false;
        }
        indices.push_back(static_cast<size_t>(std::stoul(digits)));
        bracket = segment.find('[', close);
    }
    return true;
}

std::optional<json> nested_value(const json& root, const std::vector<std::string>& path, size_t from) {
    const json* current = &root;
    for (size_t i = from; i < path.size(); ++i) {
        std::string key;
        std::vector<size_t> indices;
        if (!parse_segment(path[i], key, indices)) {
            return std::nullopt;
        }
        if (!key.empty()) {
            if (!current->is_object()) return std::nullopt;
            auto it = current->find(key);
            if (it == current->end()) return std::nullopt;
            current = &*it;
        }
        for (size_t index : indices) {
            if (!current->is_array() || index >= current->size()) return std::nullopt;
            current = &(*current)[index];
        }
    }
    return *current;
}

std::string format_time(const char* pattern, bool utc) {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf;
    if (utc) {
        gmtime_r(&now, &tm_buf);
    } else {
        localtime_r(&now, &tm_buf);
    }
    char buf[64];
    std::strftime(buf, sizeof(buf), pattern, &tm_buf);
    return buf;
}

std::mt19937_64& rng() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    return engine;
}

std::string make_uuid_v4() {
    std::uniform_int_distribution<int> nibble(0, 15);
    const char* hex = "0123456789abcdef";
    std::string pattern = "xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx";
    for (char& c : pattern) {
        if (c == 'x') {
            c = hex[nibble(rng())];
        } else if (c == 'y') {
            c = hex[(nibble(rng()) & 0x3) | 0x8];
        }
    }
    return pattern;
}

std::optional<double> leading_number(const json& value) {
    if (value.is_number()) {
        return value.get<double>();
    }
    std::string text = trim(display_string(value));
    char* end = nullptr;
    double number = std::strtod(text.c_str(), &end);
    if (end == text.c_str()) {
        return std::nullopt;
    }
    return number;
}

json numeric_or_null(std::optional<double> number) {
    if (!number || std::isnan(*number)) {
        return nullptr;
    }
    double d = *number;
    if (std::floor(d) == d && std::fabs(d) < 9e15) {
        return static_cast<int64_t>(d);
    }
    return d;
}

std::string url_encode(const std::string& value) {
    static const std::string unreserved = "-_.!~*'()";
    std::ostringstream out;
    for (unsigned char c : value) {
        if (std::isalnum(c) || unreserved.find(static_cast<char>(c)) != std::string::npos) {
            out << c;
        } else {
            out << '%' << std::uppercase << std::hex << std::setw(2) << std::setfill('0')
                << static_cast<int>(c) << std::nouppercase << std::dec;
        }
    }
    return out.str();
}

std::string url_decode(const std::string& value) {
    std::string out;
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '%' && i + 2 < value.size() &&
            std::isxdigit(static_cast<unsigned char>(value[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(value[i + 2]))) {
            out += static_cast<char>(std::stoi(value.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            out += value[i];
        }
    }
    return out;
}

const char* kBase64Alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string base64_encode(const std::string& input) {
    std::string out;
    int val = 0;
    int bits = -6;
    for (unsigned char c : input) {
        val = ((val << 8) + c) & 0xFFFFF;
        bits += 8;
        while (bits >= 0) {
            out.push_back(kBase64Alphabet[(val >> bits) & 0x3F]);
            bits -= 6;
        }
    }
    if (bits > -6) {
        out.push_back(kBase64Alphabet[((val << 8) >> (bits + 8)) & 0x3F]);
    }
    while (out.size() % 4) {
        out.push_back('=');
    }
    return out;
}

std::string base64_decode(const std::string& input) {
    std::string out;
    int val = 0;
    int bits = -8;
    for (unsigned char c : input) {
        const char* pos = std::strchr(kBase64Alphabet, c);
        if (c == '=' || pos == nullptr || c == '\0') {
            break;
        }
        val = ((val << 6) + static_cast<int>(pos - kBase64Alphabet)) & 0xFFFFF;
        bits += 6;
        if (bits >= 0) {
            out.push_back(static_cast<char>((val >> bits) & 0xFF));
            bits -= 8;
        }
    }
    return out;
}

using Transform = std::function<json(const json&, const std::vector<std::string>&)>;

std::string arg_or(const std::vector<std::string>& args, size_t index, const std::string& fallback) {
    return index < args.size() ? args[index] : fallback;
}

const std::unordered_map<std::string, Transform>& transform_table() {
    static const std::unordered_map<std::string, Transform> table = {
        // String transforms
        {"uppercase", [](const json& v, const std::vector<std::string>&) -> json {
            std::string s = display_string(v);
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            return s;
        }},
        {"lowercase", [](const json& v, const std::vector<std::string>&) -> json {
            std::string s = display_string(v);
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }},
        {"capitalize", [](const json& v, const std::vector<std::string>&) -> json {
            std::string s = display_string(v);
            bool word_start = true;
            for (char& c : s) {
                bool word_char = std::isalnum(static_cast<unsigned char>(c)) || c == '_';
                if (word_char && word_start) {
                    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
                }
                word_start = !word_char;
            }
            return s;
        }},
        {"trim", [](const json& v, const std::vector<std::string>&) -> json {
            return trim(display_string(v));
        }},
        {"truncate", [](const json& v, const std::vector<std::string>& args) -> json {
            std::string s = display_string(v);
            size_t length = 50;
            if (!args.empty()) {
                auto n = leading_number(json(args[0]));
                if (n && *n >= 0) length = static_cast<size_t>(*n);
            }
            return s.size() > length ? s.substr(0, length) + "..." : s;
        }},
        {"split", [](const json& v, const std::vector<std::string>& args) -> json {
            std::string s = display_string(v);
            std::string delimiter = arg_or(args, 0, ",");
            json parts = json::array();
            if (delimiter.empty()) {
                for (char c : s) parts.push_back(std::string(1, c));
            } else {
                size_t start = 0;
                size_t pos;
                while ((pos = s.find(delimiter, start)) != std::string::npos) {
                    parts.push_back(s.substr(start, pos - start));
                    start = pos + delimiter.size();
                }
                parts.push_back(s.substr(start));
            }
            if (args.size() > 1) {
                auto index = leading_number(json(args[1]));
                if (!index || *index < 0 || static_cast<size_t>(*index) >= parts.size()) {
                    return nullptr;
                }
                return parts[static_cast<size_t>(*index)];
            }
            return parts;
        }},
        {"replace", [](const json& v, const std::vector<std::string>& args) -> json {
            std::string s = display_string(v);
            try {
                return std::regex_replace(s, std::regex(arg_or(args, 0, "")), arg_or(args, 1, ""));
            } catch (const std::regex_error&) {
                return s;
            }
        }},
        {"regex", [](const json& v, const std::vector<std::string>& args) -> json {
            std::string s = display_string(v);
            try {
                std::smatch match;
                if (std::regex_search(s, match, std::regex(arg_or(args, 0, "")))) {
                    return match.str(0);
                }
            } catch (const std::regex_error&) {
                return nullptr;
            }
            return nullptr;
        }},
        {"length", [](const json& v, const std::vector<std::string>&) -> json {
            if (v.is_array()) return v.size();
            return display_string(v).size();
        }},
        {"reverse", [](const json& v, const std::vector<std::string>&) -> json {
            std::string s = display_string(v);
            std::reverse(s.begin(), s.end());
            return s;
        }},

        // Number transforms
        {"round", [](const json& v, const std::vector<std::string>& args) -> json {
            auto n = leading_number(v);
            if (!n) return nullptr;
            int decimals = 0;
            if (!args.empty()) {
                auto d = leading_number(json(args[0]));
                if (d) decimals = static_cast<int>(*d);
            }
            if (decimals <= 0) return numeric_or_null(std::round(*n));
            double factor = std::pow(10.0, decimals);
            return std::round(*n * factor) / factor;
        }},
        {"floor", [](const json& v, const std::vector<std::string>&) -> json {
            auto n = leading_number(v);
            return n ? numeric_or_null(std::floor(*n)) : json(nullptr);
        }},
        {"ceil", [](const json& v, const std::vector<std::string>&) -> json {
            auto n = leading_number(v);
            return n ? numeric_or_null(std::ceil(*n)) : json(nullptr);
        }},
        {"abs", [](const json& v, const std::vector<std::string>&) -> json {
            auto n = leading_number(v);
            return n ? numeric_or_null(std::fabs(*n)) : json(nullptr);
        }},
        {"pad", [](const json& v, const std::vector<std::string>& args) -> json {
            std::string s = display_string(v);
            auto n = leading_number(json(arg_or(args, 0, "0")));
            size_t width = n && *n > 0 ? static_cast<size_t>(*n) : 0;
            if (s.size() < width) s.insert(0, width - s.size(), '0');
            return s;
        }},
        {"number", [](const json& v, const std::vector<std::string>&) -> json {
            auto n = leading_number(v);
            if (!n) return nullptr;
            return *n;
        }},
        {"int", [](const json& v, const std::vector<std::string>&) -> json {
            auto n = leading_number(v);
            return n ? numeric_or_null(std::trunc(*n)) : json(nullptr);
        }},

        // Encoding transforms
        {"urlencode", [](const json& v, const std::vector<std::string>&) -> json {
            return url_encode(display_string(v));
        }},
        {"urldecode", [](const json& v, const std::vector<std::string>&) -> json {
            return url_decode(display_string(v));
        }},
        {"base64", [](const json& v, const std::vector<std::string>&) -> json {
            return base64_encode(display_string(v));
        }},
        {"base64decode", [](const json& v, const std::vector<std::string>&) -> json {
            return base64_decode(display_string(v));
        }},
        {"stringify", [](const json& v, const std::vector<std::string>&) -> json {
            return v.dump();
        }},
        {"jsonparse", [](const json& v, const std::vector<std::string>&) -> json {
            if (!v.is_string()) return v;
            json parsed = json::parse(v.get<std::string>(), nullptr, false);
            return parsed.is_discarded() ? v : parsed;
        }},

        // Array and object transforms
        {"first", [](const json& v, const std::vector<std::string>&) -> json {
            if (!v.is_array()) return v;
            return v.empty() ? json(nullptr) : v.front();
        }},
        {"last", [](const json& v, const std::vector<std::string>&) -> json {
            if (!v.is_array()) return v;
            return v.empty() ? json(nullptr) : v.back();
        }},
        {"join", [](const json& v, const std::vector<std::string>& args) -> json {
            if (!v.is_array()) return v;
            std::string delimiter = arg_or(args, 0, ", ");
            std::string out;
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) out += delimiter;
                out += display_string(v[i]);
            }
            return out;
        }},
        {"count", [](const json& v, const std::vector<std::string>&) -> json {
            return v.is_array() ? v.size() : static_cast<size_t>(1);
        }},
        {"keys", [](const json& v, const std::vector<std::string>&) -> json {
            json keys = json::array();
            if (v.is_object()) {
                for (auto it = v.begin(); it != v.end(); ++it) keys.push_back(it.key());
            }
            return keys;
        }},
        {"values", [](const json& v, const std::vector<std::string>&) -> json {
            if (!v.is_object()) return json::array({v});
            json values = json::array();
            for (const auto& item : v) values.push_back(item);
            return values;
        }},

        // Boolean transforms
        {"bool", [](const json& v, const std::vector<std::string>&) -> json {
            return ExpressionEvaluator::is_truthy(v);
        }},
        {"not", [](const json& v, const std::vector<std::string>&) -> json {
            return !ExpressionEvaluator::is_truthy(v);
        }},

        {"default", [](const json& v, const std::vector<std::string>& args) -> json {
            bool missing = v.is_null() || (v.is_string() && v.get<std::string>().empty());
            return missing ? json(arg_or(args, 0, "")) : v;
        }},
    };
    return table;
}

} // namespace

std::optional<json> builtin_variable(const std::string& name) {
    if (name == "timestamp") {
        return json(now_epoch_ms());
    }
    if (name == "date") {
        return json(format_time("%Y-%m-%d", true));
    }
    if (name == "time") {
        return json(format_time("%H:%M:%S", false));
    }
    if (name == "datetime") {
        return json(format_time("%Y-%m-%d %H:%M:%S", true));
    }
    if (name == "random") {
        std::uniform_int_distribution<int64_t> dist(0, 999999);
        return json(dist(rng()));
    }
    if (name == "uuid") {
        return json(make_uuid_v4());
    }
    return std::nullopt;
}

json apply_transforms(json value, const std::string& chain) {
    const auto& table = transform_table();
    for (const auto& raw : split(chain, '|')) {
        std::string transform = trim(raw);
        std::string name = transform;
        std::vector<std::string> args;

        size_t colon = transform.find(':');
        if (colon != std::string::npos) {
            name = trim(transform.substr(0, colon));
            for (const auto& arg : split(transform.substr(colon + 1), ':')) {
                args.push_back(trim(arg));
            }
        }

        auto it = table.find(name);
        if (it != table.end()) {
            value = it->second(value, args);
        }
    }
    return value;
}

VariableStore::VariableStore(const json& initial) {
    if (initial.is_object()) {
        for (auto it = initial.begin(); it != initial.end(); ++it) {
            variables_[it.key()] = it.value();
        }
    }
}

void VariableStore::set(const std::string& name, json value) {
    for (auto frame = frames_.rbegin(); frame != frames_.rend(); ++frame) {
        auto it = frame->locals.find(name);
        if (it != frame->locals.end()) {
            it->second = std::move(value);
            return;
        }
    }
    variables_[name] = std::move(value);
}

std::optional<json> VariableStore::get(const std::string& name) const {
    for (auto frame = frames_.rbegin(); frame != frames_.rend(); ++frame) {
        auto it = frame->locals.find(name);
        if (it != frame->locals.end()) {
            return it->second;
        }
    }
    auto it = variables_.find(name);
    if (it != variables_.end()) {
        return it->second;
    }

    std::vector<std::string> path = split(name, '.');
    std::string root_key;
    std::vector<size_t> root_indices;
    if (!parse_segment(path[0], root_key, root_indices)) {
        return std::nullopt;
    }

    if (root_indices.empty()) {
        if (root_key == "profile" && !profile_.is_null()) {
            return nested_value(profile_, path, 1);
        }
        if (root_key == "session" && !session_.is_null()) {
            return nested_value(session_, path, 1);
        }
        if (root_key == "loop" && !frames_.empty()) {
            return nested_value(frames_.back().context, path, 1);
        }
    }

    // Nested path into a custom variable
    if (path.size() == 1 && root_indices.empty()) {
        return std::nullopt;
    }
    std::optional<json> root;
    for (auto frame = frames_.rbegin(); frame != frames_.rend() && !root; ++frame) {
        auto local = frame->locals.find(root_key);
        if (local != frame->locals.end()) root = local->second;
    }
    if (!root) {
        auto base = variables_.find(root_key);
        if (base == variables_.end()) {
            return std::nullopt;
        }
        root = base->second;
    }

    // Re-apply the index suffix of the root segment, then walk the rest
    std::vector<std::string> rest = path;
    rest[0] = path[0].substr(root_key.size());
    return nested_value(*root, rest, 0);
}

bool VariableStore::has(const std::string& name) const {
    return get(name).has_value();
}

bool VariableStore::remove(const std::string& name) {
    return variables_.erase(name) > 0;
}

void VariableStore::clear() {
    variables_.clear();
}

void VariableStore::push_loop(json loop_context, const std::string& variable_name, json variable_value) {
    LoopFrame frame;
    frame.context = std::move(loop_context);
    if (!variable_name.empty()) {
        frame.locals[variable_name] = std::move(variable_value);
    }
    frames_.push_back(std::move(frame));
}

void VariableStore::pop_loop() {
    if (!frames_.empty()) {
        frames_.pop_back();
    }
}

std::optional<json> VariableStore::current_loop() const {
    if (frames_.empty()) {
        return std::nullopt;
    }
    return frames_.back().context;
}

json VariableStore::snapshot() const {
    json result = json::object();
    for (const auto& [key, value] : variables_) {
        result[key] = value;
    }
    for (const auto& frame : frames_) {
        for (const auto& [key, value] : frame.locals) {
            result[key] = value;
        }
    }
    return result;
}

std::optional<json> VariableStore::resolve_placeholder(const std::string& name) const {
    if (auto builtin = builtin_variable(name)) {
        return builtin;
    }
    return get(name);
}

std::string VariableStore::interpolate(const std::string& tmpl) const {
    std::string out;
    size_t pos = 0;
    while (pos < tmpl.size()) {
        size_t open = tmpl.find("{{", pos);
        if (open == std::string::npos) {
            out.append(tmpl, pos, std::string::npos);
            break;
        }
        size_t close = tmpl.find("}}", open + 2);
        if (close == std::string::npos) {
            out.append(tmpl, pos, std::string::npos);
            break;
        }
        out.append(tmpl, pos, open - pos);

        std::string content = tmpl.substr(open + 2, close - open - 2);
        std::string original = tmpl.substr(open, close - open + 2);
        if (content.empty() || content.find('}') != std::string::npos ||
            content.find('{') != std::string::npos) {
            out += "{{";
            pos = open + 2;
            continue;
        }

        std::string trimmed = trim(content);
        std::string name = trimmed;
        std::string transforms;
        size_t pipe = trimmed.find('|');
        if (pipe != std::string::npos) {
            name = trim(trimmed.substr(0, pipe));
            transforms = trim(trimmed.substr(pipe + 1));
        }

        std::optional<json> value = resolve_placeholder(name);
        if (!transforms.empty()) {
            json transformed = apply_transforms(value ? *value : json(nullptr), transforms);
            if (value || !transformed.is_null()) {
                value = transformed;
            }
        }

        out += value ? display_string(*value) : original;
        pos = close + 2;
    }
    return out;
}

json VariableStore::interpolate_value(const json& value) const {
    if (value.is_string()) {
        return interpolate(value.get<std::string>());
    }
    if (value.is_array()) {
        json result = json::array();
        for (const auto& item : value) {
            result.push_back(interpolate_value(item));
        }
        return result;
    }
    if (value.is_object()) {
        json result = json::object();
        for (auto it = value.begin(); it != value.end(); ++it) {
            result[it.key()] = interpolate_value(it.value());
        }
        return result;
    }
    return value;
}

caf::expected<json> VariableStore::try_evaluate(const std::string& expression) const {
    return ExpressionEvaluator::evaluate(interpolate(expression));
}

json VariableStore::evaluate(const std::string& expression, json fallback) const {
    auto result = try_evaluate(expression);
    if (!result) {
        if (observability_) {
            observability_->log_warn("Expression evaluation failed", log_context_, {
                {"expression", expression},
                {"error", error_message(result.error())}
            });
        }
        return fallback;
    }
    return *result;
}

bool VariableStore::evaluate_condition(const std::string& expression) const {
    return ExpressionEvaluator::is_truthy(evaluate(expression, false));
}

} // namespace engine
} // namespace fleetrun

#include "bookhound/config/ConfigLoader.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>
#include <string_view>

namespace bookhound::config {

namespace {

bool parse_floating_token(const char* begin, const char* end, double& value) {
    std::string buffer(begin, end);
    if (buffer.empty()) {
        return false;
    }
    char* parsed_end = nullptr;
    errno = 0;
    value = std::strtod(buffer.c_str(), &parsed_end);
    if (parsed_end != buffer.c_str() + buffer.size()) {
        return false;
    }
    return errno != ERANGE;
}

std::string trim_left(std::string value) {
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), [](unsigned char ch) {
                    return !std::isspace(ch);
                }));
    return value;
}

std::string trim_right(std::string value) {
    value.erase(std::find_if(value.rbegin(), value.rend(), [](unsigned char ch) {
                    return !std::isspace(ch);
                }).base(),
                value.end());
    return value;
}

std::string trim_copy(const std::string& value) {
    return trim_right(trim_left(value));
}

void append_utf8(std::string& out, unsigned int code_point) {
    if (code_point <= 0x7F) {
        out.push_back(static_cast<char>(code_point));
    } else if (code_point <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | ((code_point >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xE0 | ((code_point >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    }
}

class JsonParser {
public:
    explicit JsonParser(const std::string& text) : text_(text) {}

    Value parse() {
        skip_whitespace();
        Value value = parse_value();
        skip_whitespace();
        if (!at_end()) {
            throw ConfigError("E_CONFIG_PARSE", "Unexpected trailing content in JSON config");
        }
        return value;
    }

private:
    const std::string& text_;
    std::size_t position_{0};

    bool at_end() const { return position_ >= text_.size(); }
    char peek() const { return at_end() ? '\0' : text_[position_]; }
    char get() { return at_end() ? '\0' : text_[position_++]; }

    void skip_whitespace() {
        while (!at_end() && (peek() == ' ' || peek() == '\n' || peek() == '\r' || peek() == '\t')) {
            ++position_;
        }
    }

    Value parse_value() {
        skip_whitespace();
        if (at_end()) {
            throw ConfigError("E_CONFIG_PARSE", "Unexpected end of JSON while parsing value");
        }
        switch (peek()) {
            case '{':
                return parse_object();
            case '[':
                return parse_array();
            case '"':
                return Value(parse_string());
            case 't':
                expect_literal("true");
                return Value(true);
            case 'f':
                expect_literal("false");
                return Value(false);
            case 'n':
                expect_literal("null");
                return Value();
            default:
                break;
        }
        if (peek() == '-' || std::isdigit(static_cast<unsigned char>(peek()))) {
            return parse_number();
        }
        throw ConfigError("E_CONFIG_PARSE", "Unexpected token in JSON value");
    }

    void expect_literal(std::string_view literal) {
        if (text_.compare(position_, literal.size(), literal) != 0) {
            throw ConfigError("E_CONFIG_PARSE", "Invalid literal in JSON: expected " + std::string(literal));
        }
        position_ += literal.size();
    }

    Value parse_object() {
        Value object = Value::make_object();
        get();
        skip_whitespace();
        if (peek() == '}') {
            get();
            return object;
        }
        auto& fields = object.as_object();
        while (true) {
            skip_whitespace();
            if (peek() != '"') {
                throw ConfigError("E_CONFIG_PARSE", "Expected string key in JSON object");
            }
            std::string key = parse_string();
            skip_whitespace();
            if (get() != ':') {
                throw ConfigError("E_CONFIG_PARSE", "Expected ':' after key in JSON object");
            }
            fields[std::move(key)] = parse_value();
            skip_whitespace();
            const char ch = get();
            if (ch == '}') {
                return object;
            }
            if (ch != ',') {
                throw ConfigError("E_CONFIG_PARSE", "Expected ',' or '}' in JSON object");
            }
        }
    }

    Value parse_array() {
        Value array = Value::make_array();
        get();
        skip_whitespace();
        if (peek() == ']') {
            get();
            return array;
        }
        auto& elements = array.as_array();
        while (true) {
            elements.push_back(parse_value());
            skip_whitespace();
            const char ch = get();
            if (ch == ']') {
                return array;
            }
            if (ch != ',') {
                throw ConfigError("E_CONFIG_PARSE", "Expected ',' or ']' in JSON array");
            }
        }
    }

    std::string parse_string() {
        if (get() != '"') {
            throw ConfigError("E_CONFIG_PARSE", "Expected opening quote for JSON string");
        }
        std::string result;
        while (!at_end()) {
            const char ch = get();
            if (ch == '"') {
                return result;
            }
            if (ch != '\\') {
                if (static_cast<unsigned char>(ch) < 0x20) {
                    throw ConfigError("E_CONFIG_PARSE", "Control characters must be escaped in JSON strings");
                }
                result.push_back(ch);
                continue;
            }
            if (at_end()) {
                throw ConfigError("E_CONFIG_PARSE", "Incomplete escape sequence in JSON string");
            }
            const char escape = get();
            switch (escape) {
                case '"':
                case '\\':
                case '/':
                    result.push_back(escape);
                    break;
                case 'b':
                    result.push_back('\b');
                    break;
                case 'f':
                    result.push_back('\f');
                    break;
                case 'n':
                    result.push_back('\n');
                    break;
                case 'r':
                    result.push_back('\r');
                    break;
                case 't':
                    result.push_back('\t');
                    break;
                case 'u':
                    append_utf8(result, parse_hex4());
                    break;
                default:
                    throw ConfigError("E_CONFIG_PARSE", "Unsupported escape sequence in JSON string");
            }
        }
        throw ConfigError("E_CONFIG_PARSE", "Unterminated JSON string literal");
    }

    unsigned int parse_hex4() {
        if (position_ + 4 > text_.size()) {
            throw ConfigError("E_CONFIG_PARSE", "Incomplete unicode escape in JSON string");
        }
        unsigned int code_point = 0;
        const auto result = std::from_chars(text_.data() + position_, text_.data() + position_ + 4, code_point, 16);
        if (result.ec != std::errc{} || result.ptr != text_.data() + position_ + 4) {
            throw ConfigError("E_CONFIG_PARSE", "Invalid hex digit in unicode escape");
        }
        position_ += 4;
        return code_point;
    }

    Value parse_number() {
        const std::size_t start = position_;
        bool fractional = false;
        if (peek() == '-') {
            ++position_;
        }
        while (!at_end()) {
            const char ch = peek();
            if (ch == '.' || ch == 'e' || ch == 'E' || ((ch == '+' || ch == '-') && fractional)) {
                fractional = true;
            } else if (!std::isdigit(static_cast<unsigned char>(ch))) {
                break;
            }
            ++position_;
        }
        const char* begin = text_.data() + start;
        const char* end = text_.data() + position_;
        if (fractional) {
            double value{};
            if (!parse_floating_token(begin, end, value)) {
                throw ConfigError("E_CONFIG_PARSE", "Invalid floating point number in JSON");
            }
            return Value(value);
        }
        std::int64_t value{};
        const auto result = std::from_chars(begin, end, value);
        if (result.ec != std::errc{} || result.ptr != end) {
            throw ConfigError("E_CONFIG_PARSE", "Invalid integer number in JSON");
        }
        return Value(value);
    }
};

Value parse_yaml_scalar(const std::string& text) {
    const std::string trimmed = trim_copy(text);
    if (trimmed.empty() || trimmed == "null" || trimmed == "~") {
        return Value();
    }
    if (trimmed.size() >= 2 && ((trimmed.front() == '"' && trimmed.back() == '"') ||
                                (trimmed.front() == '\'' && trimmed.back() == '\''))) {
        if (trimmed.front() == '\'') {
            return Value(trimmed.substr(1, trimmed.size() - 2));
        }
        const Value parsed = JsonParser(trimmed).parse();
        if (!parsed.is_string()) {
            throw ConfigError("E_CONFIG_PARSE", "Expected string literal in YAML value");
        }
        return parsed;
    }
    if (trimmed == "true" || trimmed == "True") {
        return Value(true);
    }
    if (trimmed == "false" || trimmed == "False") {
        return Value(false);
    }

    const char* begin = trimmed.data() + ((trimmed.front() == '+') ? 1 : 0);
    const char* end = trimmed.data() + trimmed.size();
    std::int64_t integer{};
    const auto as_int = std::from_chars(begin, end, integer);
    if (as_int.ec == std::errc{} && as_int.ptr == end) {
        return Value(integer);
    }
    const bool numeric = std::all_of(begin, end, [](char ch) {
        return std::isdigit(static_cast<unsigned char>(ch)) || ch == '.' || ch == '-';
    });
    double floating{};
    if (numeric && parse_floating_token(begin, end, floating)) {
        return Value(floating);
    }
    return Value(trimmed);
}

std::string strip_yaml_comment(const std::string& line) {
    bool in_single = false;
    bool in_double = false;
    for (std::size_t i = 0; i < line.size(); ++i) {
        const char ch = line[i];
        if (ch == '"' && !in_single) {
            in_double = !in_double;
        } else if (ch == '\'' && !in_double) {
            in_single = !in_single;
        } else if (ch == '#' && !in_single && !in_double && (i == 0 || std::isspace(static_cast<unsigned char>(line[i - 1])))) {
            return trim_right(line.substr(0, i));
        }
    }
    return trim_right(line);
}

Value remove_key(const Value& object, const std::string& key) {
    Value filtered = Value::make_object();
    for (const auto& [name, value] : object.as_object()) {
        if (name != key) {
            filtered.as_object()[name] = value;
        }
    }
    return filtered;
}

Value resolve_profile(const Value& profiles, const std::string& profile_name, std::set<std::string>& visiting) {
    if (!profiles.is_object()) {
        throw ConfigError("E_CONFIG_STRUCTURE", "'profiles' section must be a mapping");
    }
    const auto it = profiles.as_object().find(profile_name);
    if (it == profiles.as_object().end()) {
        std::string names;
        for (const auto& [name, _] : profiles.as_object()) {
            names += names.empty() ? name : ", " + name;
        }
        throw ConfigError("E_CONFIG_PROFILE",
                          "Profile not found: " + profile_name,
                          "Available profiles: " + (names.empty() ? std::string{"<none>"} : names));
    }
    if (!it->second.is_object()) {
        throw ConfigError("E_CONFIG_STRUCTURE", "Profile must be a mapping: " + profile_name);
    }
    if (!visiting.insert(profile_name).second) {
        throw ConfigError("E_CONFIG_PROFILE", "Profile inheritance cycle detected at " + profile_name);
    }

    Value result = Value::make_object();
    const auto extends = it->second.as_object().find("extends");
    if (extends != it->second.as_object().end()) {
        if (!extends->second.is_string()) {
            throw ConfigError("E_CONFIG_PROFILE", "'extends' must be a string in profile " + profile_name);
        }
        result = resolve_profile(profiles, extends->second.string_value, visiting);
    }
    result = merge_objects(result, remove_key(it->second, "extends"));
    visiting.erase(profile_name);
    return result;
}

std::string join_path(const std::vector<std::string>& path) {
    if (path.empty()) {
        return "<root>";
    }
    std::string combined = path.front();
    for (std::size_t i = 1; i < path.size(); ++i) {
        combined += '.' + path[i];
    }
    return combined;
}

template <typename T>
std::optional<T> first_of(const Value& root,
                          std::initializer_list<std::vector<std::string>> paths,
                          std::optional<T> (*getter)(const Value&, const std::vector<std::string>&)) {
    for (const auto& path : paths) {
        if (auto value = getter(root, path)) {
            return value;
        }
    }
    return std::nullopt;
}

std::uint16_t require_port(std::int64_t value, const char* key) {
    if (value <= 0 || value > std::numeric_limits<std::uint16_t>::max()) {
        throw ConfigError("E_CONFIG_VALUE", std::string(key) + " must be between 1 and 65535");
    }
    return static_cast<std::uint16_t>(value);
}

std::chrono::milliseconds require_duration(double seconds, const char* key, bool allow_zero = false) {
    if (!std::isfinite(seconds) || seconds < 0.0 || (!allow_zero && seconds == 0.0)) {
        throw ConfigError("E_CONFIG_VALUE", std::string(key) + (allow_zero ? " must be non-negative" : " must be positive"));
    }
    return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(seconds * 1000.0)));
}

std::size_t require_count(std::int64_t value, const char* key) {
    if (value <= 0) {
        throw ConfigError("E_CONFIG_VALUE", std::string(key) + " must be positive");
    }
    return static_cast<std::size_t>(value);
}

std::chrono::seconds whole_seconds(std::chrono::milliseconds duration) {
    return std::max(std::chrono::seconds(1), std::chrono::ceil<std::chrono::seconds>(duration));
}

}  // namespace

Value Value::make_object() {
    Value value;
    value.type = ValueType::Object;
    return value;
}

Value Value::make_array() {
    Value value;
    value.type = ValueType::Array;
    return value;
}

std::map<std::string, Value>& Value::ensure_object() {
    if (type != ValueType::Object) {
        type = ValueType::Object;
        object_value.clear();
        array_value.clear();
        string_value.clear();
    }
    return object_value;
}

std::vector<Value>& Value::ensure_array() {
    if (type != ValueType::Array) {
        type = ValueType::Array;
        array_value.clear();
        object_value.clear();
        string_value.clear();
    }
    return array_value;
}

const std::map<std::string, Value>& Value::as_object() const {
    static const std::map<std::string, Value> empty{};
    return type == ValueType::Object ? object_value : empty;
}

const std::vector<Value>& Value::as_array() const {
    static const std::vector<Value> empty{};
    return type == ValueType::Array ? array_value : empty;
}

ConfigError::ConfigError(std::string c, std::string m, std::string h)
    : code(std::move(c)), message(std::move(m)), hint(std::move(h)) {
    formatted = code.empty() ? message : "[" + code + "] " + message;
}

Value parse_json(const std::string& text) {
    return JsonParser(text).parse();
}

Value parse_yaml(const std::string& text) {
    Value root = Value::make_object();
    struct Context {
        std::size_t indent;
        Value* node;
    };
    std::vector<Context> stack{{0, &root}};

    std::istringstream input(text);
    std::string raw;
    while (std::getline(input, raw)) {
        const std::string line = strip_yaml_comment(raw);
        if (line.empty()) {
            continue;
        }
        std::size_t indent = 0;
        while (indent < line.size() && line[indent] == ' ') {
            ++indent;
        }
        if (indent % 2 != 0) {
            throw ConfigError("E_CONFIG_PARSE", "YAML indentation must be multiples of two spaces");
        }
        const std::string content = line.substr(indent);

        while (!stack.empty() && indent < stack.back().indent) {
            stack.pop_back();
        }
        if (stack.empty()) {
            throw ConfigError("E_CONFIG_PARSE", "Invalid indentation in YAML config");
        }
        Value* current = stack.back().node;

        if (content.front() == '-') {
            const std::string item = trim_copy(content.substr(1));
            auto& array = current->ensure_array();
            if (item.empty()) {
                array.push_back(Value::make_object());
                stack.push_back({indent + 2, &array.back()});
                continue;
            }
            const auto colon = item.find(':');
            if (colon == std::string::npos) {
                array.push_back(parse_yaml_scalar(item));
                continue;
            }
            array.push_back(Value::make_object());
            auto& entry = array.back().as_object()[trim_copy(item.substr(0, colon))];
            const std::string value_part = trim_copy(item.substr(colon + 1));
            stack.push_back({indent + 2, &array.back()});
            if (value_part.empty()) {
                entry = Value::make_object();
                stack.push_back({indent + 4, &entry});
            } else {
                entry = parse_yaml_scalar(value_part);
            }
            continue;
        }

        const auto colon = content.find(':');
        if (colon == std::string::npos) {
            throw ConfigError("E_CONFIG_PARSE", "Expected ':' in YAML mapping entry");
        }
        const std::string key = trim_copy(content.substr(0, colon));
        const std::string value_part = trim_copy(content.substr(colon + 1));
        auto& object = current->ensure_object();
        if (value_part.empty()) {
            Value& child = object[key];
            if (child.is_null()) {
                child = Value::make_object();
            }
            stack.push_back({indent + 2, &child});
        } else {
            object[key] = parse_yaml_scalar(value_part);
        }
    }
    return root;
}

Value parse_document(const std::string& contents, const std::filesystem::path& origin) {
    const auto first = std::find_if(contents.begin(), contents.end(), [](unsigned char ch) {
        return !std::isspace(ch);
    });
    const bool looks_like_json = origin.extension() == ".json" ||
                                 (first != contents.end() && (*first == '{' || *first == '['));
    Value document = looks_like_json ? parse_json(contents) : parse_yaml(contents);
    if (!document.is_object()) {
        throw ConfigError("E_CONFIG_STRUCTURE", "Configuration root must be an object");
    }
    return document;
}

Value load_document(const std::filesystem::path& path) {
    const auto absolute = std::filesystem::absolute(path);
    std::ifstream input(absolute, std::ios::binary);
    if (!input) {
        throw ConfigError("E_CONFIG_NOT_FOUND",
                          "Configuration file not found: " + absolute.string(),
                          "Verify the path or provide an absolute path");
    }
    std::stringstream buffer;
    buffer << input.rdbuf();
    return parse_document(buffer.str(), path);
}

Value merge_objects(const Value& base, const Value& overlay) {
    if (!overlay.is_object()) {
        return overlay;
    }
    Value result = base.is_object() ? base : Value::make_object();
    auto& fields = result.as_object();
    for (const auto& [key, value] : overlay.as_object()) {
        const auto existing = fields.find(key);
        if (value.is_object() && existing != fields.end() && existing->second.is_object()) {
            existing->second = merge_objects(existing->second, value);
        } else {
            fields[key] = value;
        }
    }
    return result;
}

const Value* find_path(const Value& root, const std::vector<std::string>& path) {
    const Value* node = &root;
    for (const auto& segment : path) {
        if (!node->is_object()) {
            return nullptr;
        }
        const auto it = node->as_object().find(segment);
        if (it == node->as_object().end()) {
            return nullptr;
        }
        node = &it->second;
    }
    return node;
}

Value resolve_profile(const Value& profiles, const std::string& profile_name) {
    std::set<std::string> visiting;
    return resolve_profile(profiles, profile_name, visiting);
}

Value collect_environment_overrides(const Value& environment_node) {
    Value overrides = Value::make_object();
    for (const auto& [key, value] : environment_node.as_object()) {
        if (key == "profile") {
            continue;
        }
        if (key == "overrides" && value.is_object()) {
            overrides = merge_objects(overrides, value);
            continue;
        }
        overrides.as_object()[key] = value;
    }
    return overrides;
}

std::optional<std::string> get_string(const Value& root, const std::vector<std::string>& path) {
    const Value* node = find_path(root, path);
    if (!node || node->is_null()) {
        return std::nullopt;
    }
    if (node->is_string()) {
        return node->string_value;
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected string at config path " + join_path(path));
}

std::optional<bool> get_bool(const Value& root, const std::vector<std::string>& path) {
    const Value* node = find_path(root, path);
    if (!node || node->is_null()) {
        return std::nullopt;
    }
    if (node->is_boolean()) {
        return node->boolean_value;
    }
    if (node->is_string()) {
        std::string lowered = node->string_value;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
            return static_cast<char>(std::tolower(ch));
        });
        if (lowered == "true" || lowered == "yes" || lowered == "on") {
            return true;
        }
        if (lowered == "false" || lowered == "no" || lowered == "off") {
            return false;
        }
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected boolean at config path " + join_path(path));
}

std::optional<std::int64_t> get_int64(const Value& root, const std::vector<std::string>& path) {
    const Value* node = find_path(root, path);
    if (!node || node->is_null()) {
        return std::nullopt;
    }
    if (node->is_integer()) {
        return node->integer_value;
    }
    if (node->is_double()) {
        const double rounded = std::floor(node->double_value + 0.5);
        if (std::abs(node->double_value - rounded) < 1e-9) {
            return static_cast<std::int64_t>(rounded);
        }
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected integer at config path " + join_path(path));
}

std::optional<double> get_double(const Value& root, const std::vector<std::string>& path) {
    const Value* node = find_path(root, path);
    if (!node || node->is_null()) {
        return std::nullopt;
    }
    if (node->is_double()) {
        return node->double_value;
    }
    if (node->is_integer()) {
        return static_cast<double>(node->integer_value);
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected number at config path " + join_path(path));
}

std::optional<std::string> get_string_any(const Value& root, std::initializer_list<std::vector<std::string>> paths) {
    return first_of<std::string>(root, paths, &get_string);
}

std::optional<bool> get_bool_any(const Value& root, std::initializer_list<std::vector<std::string>> paths) {
    return first_of<bool>(root, paths, &get_bool);
}

std::optional<std::int64_t> get_int64_any(const Value& root, std::initializer_list<std::vector<std::string>> paths) {
    return first_of<std::int64_t>(root, paths, &get_int64);
}

std::optional<double> get_double_any(const Value& root, std::initializer_list<std::vector<std::string>> paths) {
    return first_of<double>(root, paths, &get_double);
}

void apply_profile(const Value& profile, Config& config) {
    if (!profile.is_object()) {
        throw ConfigError("E_CONFIG_STRUCTURE", "Profile configuration must be a mapping");
    }

    if (auto server = get_string_any(profile, {{"irc", "server"}, {"irc", "host"}})) {
        if (server->empty()) {
            throw ConfigError("E_CONFIG_VALUE", "irc.server must not be empty");
        }
        config.server_host = *server;
    }
    if (auto port = get_int64(profile, {"irc", "port"})) {
        config.server_port = require_port(*port, "irc.port");
    }
    if (auto tls = get_bool_any(profile, {{"irc", "tls"}, {"irc", "use_tls"}})) {
        config.use_tls = *tls;
    }
    if (auto channel = get_string(profile, {"irc", "channel"})) {
        if (channel->size() < 2 || (channel->front() != '#' && channel->front() != '&')) {
            throw ConfigError("E_CONFIG_VALUE", "irc.channel must start with '#' or '&'", "Example: #ebooks");
        }
        config.channel = *channel;
    }
    if (auto bot = get_string_any(profile, {{"irc", "search_bot"}, {"irc", "search-bot"}})) {
        config.search_bot = *bot;
    }
    if (auto agent = get_string_any(profile, {{"irc", "user_agent"}, {"irc", "user-agent"}})) {
        config.user_agent = *agent;
    }
    if (auto nickname = get_string(profile, {"irc", "nickname"})) {
        config.nickname = *nickname;
    }
    if (auto seed = get_int64_any(profile, {{"irc", "identity_seed"}, {"identity", "seed"}})) {
        if (*seed < 0 || *seed > std::numeric_limits<std::uint32_t>::max()) {
            throw ConfigError("E_CONFIG_VALUE", "irc.identity_seed must fit within 32 bits");
        }
        config.identity_seed = static_cast<std::uint32_t>(*seed);
    }

    if (auto value = get_double(profile, {"timeouts", "connect"})) {
        config.connect_timeout = whole_seconds(require_duration(*value, "timeouts.connect"));
    }
    if (auto value = get_double(profile, {"timeouts", "response"})) {
        config.response_timeout = whole_seconds(require_duration(*value, "timeouts.response"));
    }
    if (auto value = get_double(profile, {"timeouts", "transfer"})) {
        config.transfer_timeout = whole_seconds(require_duration(*value, "timeouts.transfer"));
    }
    if (auto value = get_double_any(profile, {{"timeouts", "fallback_attempt"}, {"timeouts", "fallback-attempt"}})) {
        config.fallback_attempt_timeout = whole_seconds(require_duration(*value, "timeouts.fallback_attempt"));
    }
    if (auto value = get_double(profile, {"timeouts", "join"})) {
        config.join_timeout = require_duration(*value, "timeouts.join");
    }
    if (auto value = get_double_any(profile, {{"rate_limit", "command_interval"}, {"rate-limit", "command-interval"}})) {
        const auto interval = require_duration(*value, "rate_limit.command_interval", true);
        if (interval < kDefaultCommandInterval) {
            throw ConfigError("E_CONFIG_VALUE",
                              "rate_limit.command_interval must be at least " +
                                  std::to_string(kDefaultCommandInterval.count()) + " seconds",
                              "The network kicks clients that send commands faster than this");
        }
        config.command_interval = interval;
    }

    if (auto value = get_double(profile, {"search", "window"})) {
        config.search_window = require_duration(*value, "search.window");
    }
    if (auto value = get_double_any(profile, {{"search", "quiet_period"}, {"search", "quiet-period"}})) {
        config.search_quiet_period = require_duration(*value, "search.quiet_period");
    }
    if (auto value = get_int64_any(profile, {{"search", "max_results"}, {"search", "max-results"}})) {
        config.search_max_results = require_count(*value, "search.max_results");
    }
    if (auto value = get_int64(profile, {"search", "author_limit"})) {
        config.author_result_limit = require_count(*value, "search.author_limit");
    }
    if (auto value = get_int64(profile, {"search", "title_limit"})) {
        config.title_result_limit = require_count(*value, "search.title_limit");
    }

    if (auto directory = get_string_any(profile, {{"downloads", "directory"}, {"downloads", "dir"}})) {
        config.download_directory = *directory;
    }
    if (auto chunk = get_int64(profile, {"downloads", "chunk_bytes"})) {
        config.transfer_chunk_bytes = require_count(*chunk, "downloads.chunk_bytes");
    }

    if (auto host = get_string(profile, {"control", "host"})) {
        config.control_host = *host;
    }
    if (auto port = get_int64(profile, {"control", "port"})) {
        config.control_port = require_port(*port, "control.port");
    }
    if (auto token = get_string(profile, {"control", "token"})) {
        config.control_token = *token;
    }
}

void load_configuration(const LoadOptions& options, Config& config) {
    const Value document = load_document(options.config_path);
    const Value* profiles = find_path(document, {"profiles"});
    if (!profiles) {
        throw ConfigError("E_CONFIG_STRUCTURE",
                          "Configuration file is missing 'profiles' section",
                          "Define at least a 'default' profile under 'profiles'");
    }

    std::string selected = options.profile_name.value_or("default");
    Value overrides = Value::make_object();
    if (options.environment) {
        const Value* environments = find_path(document, {"environments"});
        if (!environments || environments->is_null()) {
            throw ConfigError("E_CONFIG_ENVIRONMENT",
                              "Environment section not defined while --env was provided",
                              "Add an 'environments' map to the configuration file");
        }
        if (!environments->is_object()) {
            throw ConfigError("E_CONFIG_ENVIRONMENT", "'environments' section must be a mapping");
        }
        const auto it = environments->as_object().find(*options.environment);
        if (it == environments->as_object().end()) {
            throw ConfigError("E_CONFIG_ENVIRONMENT", "Environment not found: " + *options.environment);
        }
        if (!it->second.is_object()) {
            throw ConfigError("E_CONFIG_ENVIRONMENT", "Environment entry must be a mapping: " + *options.environment);
        }
        if (!options.profile_name) {
            if (auto profile = get_string(it->second, {"profile"})) {
                selected = *profile;
            }
        }
        overrides = collect_environment_overrides(it->second);
    }

    apply_profile(merge_objects(resolve_profile(*profiles, selected), overrides), config);
}

}  // namespace bookhound::config

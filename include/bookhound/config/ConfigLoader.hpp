#pragma once

#include "bookhound/Config.hpp"

#include <cstdint>
#include <exception>
#include <filesystem>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace bookhound::config {

enum class ValueType {
    Null,
    Boolean,
    Integer,
    Double,
    String,
    Object,
    Array
};

struct Value {
    ValueType type{ValueType::Null};
    bool boolean_value{false};
    std::int64_t integer_value{0};
    double double_value{0.0};
    std::string string_value;
    std::map<std::string, Value> object_value;
    std::vector<Value> array_value;

    Value() = default;
    explicit Value(bool value) : type(ValueType::Boolean), boolean_value(value) {}
    explicit Value(std::int64_t value) : type(ValueType::Integer), integer_value(value) {}
    explicit Value(double value) : type(ValueType::Double), double_value(value) {}
    explicit Value(std::string value) : type(ValueType::String), string_value(std::move(value)) {}
    Value(const char* value) : Value(std::string(value)) {}

    static Value make_object();
    static Value make_array();

    bool is_null() const { return type == ValueType::Null; }
    bool is_boolean() const { return type == ValueType::Boolean; }
    bool is_integer() const { return type == ValueType::Integer; }
    bool is_double() const { return type == ValueType::Double; }
    bool is_number() const { return is_integer() || is_double(); }
    bool is_string() const { return type == ValueType::String; }
    bool is_object() const { return type == ValueType::Object; }
    bool is_array() const { return type == ValueType::Array; }

    std::map<std::string, Value>& ensure_object();
    std::vector<Value>& ensure_array();

    const std::map<std::string, Value>& as_object() const;
    std::map<std::string, Value>& as_object() { return ensure_object(); }
    const std::vector<Value>& as_array() const;
    std::vector<Value>& as_array() { return ensure_array(); }
};

struct ConfigError : public std::exception {
    std::string code;
    std::string message;
    std::string hint;
    std::string formatted;

    ConfigError(std::string c, std::string m, std::string h = {});

    const char* what() const noexcept override { return formatted.c_str(); }
};

Value parse_json(const std::string& text);

// Indentation-based subset: nested mappings, `- item` lists, quoted and bare
// scalars, `#` comments.
Value parse_yaml(const std::string& text);

// JSON when the extension is .json or the first non-blank byte opens an object or array.
Value parse_document(const std::string& contents, const std::filesystem::path& origin = {});
Value load_document(const std::filesystem::path& path);

Value merge_objects(const Value& base, const Value& overlay);
const Value* find_path(const Value& root, const std::vector<std::string>& path);

// Follows `extends` chains; cycles are rejected.
Value resolve_profile(const Value& profiles, const std::string& profile_name);
Value collect_environment_overrides(const Value& environment_node);

std::optional<std::string> get_string(const Value& root, const std::vector<std::string>& path);
std::optional<bool> get_bool(const Value& root, const std::vector<std::string>& path);
std::optional<std::int64_t> get_int64(const Value& root, const std::vector<std::string>& path);
std::optional<double> get_double(const Value& root, const std::vector<std::string>& path);

std::optional<std::string> get_string_any(const Value& root, std::initializer_list<std::vector<std::string>> paths);
std::optional<bool> get_bool_any(const Value& root, std::initializer_list<std::vector<std::string>> paths);
std::optional<std::int64_t> get_int64_any(const Value& root, std::initializer_list<std::vector<std::string>> paths);
std::optional<double> get_double_any(const Value& root, std::initializer_list<std::vector<std::string>> paths);

struct LoadOptions {
    std::filesystem::path config_path;
    std::optional<std::string> profile_name{};
    std::optional<std::string> environment{};
};

// Overwrites the fields of `config` named by the resolved profile. Durations
// are seconds and may be fractional.
void apply_profile(const Value& profile, Config& config);

// Reads the document, resolves the selected profile (default "default"),
// merges the environment overrides and applies the result.
void load_configuration(const LoadOptions& options, Config& config);

}  // namespace bookhound::config

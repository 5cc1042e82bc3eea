/**
 * @file config_loader.cpp
 * @brief YAML and JSON configuration loading
 *
 * YAML documents are parsed with yaml-cpp and converted to nlohmann::json so
 * both formats go through one key table and one set of type checks.
 */

#include "kcenon/sftp_stress/config/config_loader.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <iterator>
#include <limits>
#include <optional>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace kcenon::sftp_stress {

namespace {

using json = nlohmann::json;

auto mismatch(std::string_view key, std::string_view expected) -> unexpected {
    return unexpected(error(error_code::config_type_mismatch,
                            std::string(key) + ": expected " + std::string(expected)));
}

auto out_of_range(std::string_view key, std::string_view detail) -> unexpected {
    return unexpected(error(error_code::config_invalid,
                            std::string(key) + ": " + std::string(detail)));
}

auto read_string(std::string_view key, const json& value, std::string& out) -> result<void> {
    if (!value.is_string()) {
        return mismatch(key, "string");
    }
    out = value.get<std::string>();
    return {};
}

auto read_unsigned(std::string_view key, const json& value, uint64_t& out) -> result<void> {
    if (value.is_number_unsigned()) {
        out = value.get<uint64_t>();
        return {};
    }
    if (value.is_number_integer()) {
        return out_of_range(key, "must not be negative");
    }
    return mismatch(key, "non-negative integer");
}

auto read_int(std::string_view key, const json& value, int& out) -> result<void> {
    if (!value.is_number_integer()) {
        return mismatch(key, "integer");
    }
    auto v = value.get<int64_t>();
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
        return out_of_range(key, "out of range");
    }
    out = static_cast<int>(v);
    return {};
}

// =============================================================================
// YAML -> JSON
// =============================================================================

auto is_yaml_null(std::string_view s) -> bool {
    return s.empty() || s == "~" || s == "null" || s == "Null" || s == "NULL";
}

// YAML 1.1 booleans, as accepted by common YAML loaders
auto yaml_bool(std::string_view s) -> std::optional<bool> {
    static constexpr std::string_view truthy[] = {"true", "True", "TRUE", "yes", "Yes",
                                                  "YES",  "on",   "On",   "ON"};
    static constexpr std::string_view falsy[] = {"false", "False", "FALSE", "no", "No",
                                                 "NO",    "off",   "Off",   "OFF"};
    if (std::find(std::begin(truthy), std::end(truthy), s) != std::end(truthy)) {
        return true;
    }
    if (std::find(std::begin(falsy), std::end(falsy), s) != std::end(falsy)) {
        return false;
    }
    return std::nullopt;
}

auto yaml_integer(std::string_view s) -> std::optional<json> {
    std::string_view digits = s;
    bool negative = false;
    if (!digits.empty() && (digits.front() == '-' || digits.front() == '+')) {
        negative = digits.front() == '-';
        digits.remove_prefix(1);
    }
    int base = 10;
    if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'o')) {
        base = digits[1] == 'x' ? 16 : 8;
        digits.remove_prefix(2);
    }
    if (digits.empty()) {
        return std::nullopt;
    }

    uint64_t magnitude = 0;
    auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), magnitude, base);
    if (ec != std::errc() || end != digits.data() + digits.size()) {
        return std::nullopt;
    }
    if (!negative) {
        return json(magnitude);
    }
    if (magnitude > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return std::nullopt;
    }
    return json(-static_cast<int64_t>(magnitude));
}

auto yaml_float(std::string_view s) -> std::optional<json> {
    if (s.empty() || !(std::isdigit(static_cast<unsigned char>(s.front())) ||
                       s.front() == '-' || s.front() == '+' || s.front() == '.')) {
        return std::nullopt;
    }
    std::string text(s);
    errno = 0;
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (errno != 0 || end != text.c_str() + text.size()) {
        return std::nullopt;
    }
    return json(value);
}

/**
 * @brief Resolve a YAML scalar to the JSON type it denotes
 *
 * Quoted scalars are always strings; plain scalars resolve to null, boolean,
 * integer or float before falling back to string.
 */
auto scalar_to_json(const YAML::Node& node) -> json {
    const auto& text = node.Scalar();
    if (node.Tag() != "?") {
        return json(text);
    }
    if (is_yaml_null(text)) {
        return json(nullptr);
    }
    if (auto flag = yaml_bool(text)) {
        return json(*flag);
    }
    if (auto integer = yaml_integer(text)) {
        return *integer;
    }
    if (auto real = yaml_float(text)) {
        return *real;
    }
    return json(text);
}

auto yaml_to_json(const YAML::Node& node) -> result<json> {
    switch (node.Type()) {
        case YAML::NodeType::Undefined:
        case YAML::NodeType::Null:
            return json(nullptr);
        case YAML::NodeType::Scalar:
            return scalar_to_json(node);
        case YAML::NodeType::Sequence: {
            json array = json::array();
            for (const auto& item : node) {
                auto converted = yaml_to_json(item);
                if (!converted) {
                    return converted;
                }
                array.push_back(std::move(converted).value());
            }
            return array;
        }
        case YAML::NodeType::Map: {
            json object = json::object();
            for (const auto& item : node) {
                if (!item.first.IsScalar()) {
                    return unexpected(error(error_code::config_type_mismatch,
                                            "mapping keys must be scalars"));
                }
                auto converted = yaml_to_json(item.second);
                if (!converted) {
                    return converted;
                }
                object[item.first.Scalar()] = std::move(converted).value();
            }
            return object;
        }
    }
    return unexpected(error(error_code::config_parse_error, "unsupported YAML node"));
}

auto parse_document(std::string_view text) -> result<json> {
    auto first = text.find_first_not_of(" \t\r\n");
    if (first != std::string_view::npos && (text[first] == '{' || text[first] == '[')) {
        // Strict JSON first; flow-style YAML falls through
        auto document = json::parse(text.begin(), text.end(), nullptr, false);
        if (!document.is_discarded()) {
            return document;
        }
    }

    YAML::Node root;
    try {
        root = YAML::Load(std::string(text));
    } catch (const YAML::Exception& e) {
        return unexpected(error(error_code::config_parse_error, e.what()));
    }
    return yaml_to_json(root);
}

// =============================================================================
// Key table
// =============================================================================

using setter = std::function<result<void>(std::string_view, const json&, run_config&)>;

struct key_entry {
    std::string_view name;
    setter apply;
};

auto key_table() -> const std::vector<key_entry>& {
    static const std::vector<key_entry> table = {
        {"host",
         [](std::string_view k, const json& v, run_config& c) { return read_string(k, v, c.host); }},
        {"port",
         [](std::string_view k, const json& v, run_config& c) -> result<void> {
             uint64_t port = 0;
             if (auto r = read_unsigned(k, v, port); !r) {
                 return r;
             }
             if (port == 0 || port > 65535) {
                 return out_of_range(k, "must be in 1..65535");
             }
             c.port = static_cast<uint16_t>(port);
             return {};
         }},
        {"username",
         [](std::string_view k, const json& v, run_config& c) {
             return read_string(k, v, c.username);
         }},
        {"root_dir",
         [](std::string_view k, const json& v, run_config& c) {
             return read_string(k, v, c.remote_root);
         }},
        {"ssh_private_key_path",
         [](std::string_view k, const json& v, run_config& c) {
             return read_string(k, v, c.private_key_path);
         }},
        {"ssh_private_key_passphrase",
         [](std::string_view k, const json& v, run_config& c) -> result<void> {
             if (v.is_null()) {
                 c.private_key_passphrase.reset();
                 return {};
             }
             std::string phrase;
             if (auto r = read_string(k, v, phrase); !r) {
                 return mismatch(k, "string or null");
             }
             c.private_key_passphrase = std::move(phrase);
             return {};
         }},
        {"min_test_file_size_bytes",
         [](std::string_view k, const json& v, run_config& c) {
             return read_unsigned(k, v, c.min_file_size);
         }},
        {"max_test_file_size_bytes",
         [](std::string_view k, const json& v, run_config& c) {
             return read_unsigned(k, v, c.max_file_size);
         }},
        {"num_test_files",
         [](std::string_view k, const json& v, run_config& c) -> result<void> {
             uint64_t n = 0;
             if (auto r = read_unsigned(k, v, n); !r) {
                 return r;
             }
             c.num_files = static_cast<std::size_t>(n);
             return {};
         }},
        {"connect_timeout_seconds",
         [](std::string_view k, const json& v, run_config& c) {
             return read_int(k, v, c.connect_timeout_seconds);
         }},
        {"transfer_timeout_seconds",
         [](std::string_view k, const json& v, run_config& c) {
             return read_int(k, v, c.transfer_timeout_seconds);
         }},
        {"sftp_threads",
         [](std::string_view k, const json& v, run_config& c) {
             return read_int(k, v, c.concurrency);
         }},
        {"sftp_sleep_interval",
         [](std::string_view k, const json& v, run_config& c) -> result<void> {
             if (!v.is_number()) {
                 return mismatch(k, "number");
             }
             c.sleep_interval_seconds = v.get<double>();
             return {};
         }},
        {"keep_alive_enabled",
         [](std::string_view k, const json& v, run_config& c) -> result<void> {
             if (v.is_boolean()) {
                 c.keep_alive = v.get<bool>();
                 return {};
             }
             if (v.is_number_integer()) {
                 auto flag = v.get<int64_t>();
                 if (flag != 0 && flag != 1) {
                     return out_of_range(k, "must be 0 or 1");
                 }
                 c.keep_alive = flag == 1;
                 return {};
             }
             return mismatch(k, "boolean or 0/1");
         }},
        {"retry_attempts",
         [](std::string_view k, const json& v, run_config& c) {
             return read_int(k, v, c.retry_attempts);
         }},
    };
    return table;
}

}  // namespace

config_loader::config_loader(unknown_key_policy policy) : policy_(policy) {}

auto config_loader::load_file(const std::filesystem::path& path, const run_config& base) const
    -> result<run_config> {
    std::ifstream in(path);
    if (!in) {
        return unexpected(error(error_code::config_file_error,
                                "cannot open configuration file " + path.string()));
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return unexpected(error(error_code::config_file_error,
                                "cannot read configuration file " + path.string()));
    }

    auto parsed = parse_string(buffer.str(), base);
    if (!parsed) {
        return unexpected(error(parsed.error().code,
                                path.string() + ": " + parsed.error().message));
    }
    return parsed;
}

auto config_loader::parse_string(std::string_view text, const run_config& base) const
    -> result<run_config> {
    if (text.find_first_not_of(" \t\r\n") == std::string_view::npos) {
        // Empty document: base values only
        return base;
    }

    auto parsed = parse_document(text);
    if (!parsed) {
        return unexpected(parsed.error());
    }
    const auto& document = parsed.value();

    run_config config = base;
    if (document.is_null()) {
        return config;
    }
    if (!document.is_object()) {
        return unexpected(error(error_code::config_type_mismatch,
                                "top level must be an object"));
    }

    const auto& table = key_table();
    for (const auto& [key, value] : document.items()) {
        auto entry = std::find_if(table.begin(), table.end(),
                                  [&key](const key_entry& e) { return e.name == key; });
        if (entry == table.end()) {
            if (policy_ == unknown_key_policy::reject) {
                return unexpected(error(error_code::config_unknown_key, "unknown key: " + key));
            }
            continue;
        }
        if (auto applied = entry->apply(entry->name, value, config); !applied) {
            return unexpected(applied.error());
        }
    }
    return config;
}

auto config_loader::known_keys() -> std::vector<std::string_view> {
    std::vector<std::string_view> keys;
    for (const auto& entry : key_table()) {
        keys.push_back(entry.name);
    }
    return keys;
}

}  // namespace kcenon::sftp_stress

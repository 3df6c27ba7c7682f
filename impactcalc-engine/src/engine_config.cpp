#include "engine_config.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace impactcalc {

namespace {

// String values may reference environment variables
std::string get_string(const json& j, const char* key) {
    return expand_environment_variables(j.at(key).get<std::string>());
}

} // anonymous namespace

EngineConfig::EngineConfig()
    : floor_epsilon(DEFAULT_FLOOR_EPSILON),
      parallel(true),
      max_threads(0),
      treat_warnings_as_errors(false),
      alignment_policy(AlignmentPolicy::Intersection),
      unit_conversions(),
      logging() {}

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++;

        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++;
        }

        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        std::string var_name = result.substr(name_start, pos - name_start);

        if (braces) {
            if (pos >= result.size() || result[pos] != '}') {
                throw ConfigParseError("Unterminated variable reference in: " + value);
            }
            pos++;
        }

        if (var_name.empty()) {
            // A lone '$' is literal
            pos = start + 1;
            continue;
        }

        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

void validate_engine_config(const EngineConfig& config) {
    if (!std::isfinite(config.floor_epsilon) || config.floor_epsilon < 0.0) {
        throw ConfigParseError("floor_epsilon must be a non-negative finite number");
    }
    if (config.max_threads < 0) {
        throw ConfigParseError("max_threads must not be negative");
    }
    for (const auto& c : config.unit_conversions) {
        if (c.from.empty() || c.to.empty()) {
            throw ConfigParseError("unit conversion requires both 'from' and 'to'");
        }
        if (!(c.factor > 0.0) || !std::isfinite(c.factor)) {
            throw ConfigParseError("unit conversion '" + c.from + "' -> '" + c.to +
                                   "' must have a positive factor");
        }
    }

    // Conflicting pairs and non-identity self-conversions are only caught
    // once the whole table is assembled
    try {
        UnitConversionTable table(config.unit_conversions);
    } catch (const InvalidInputError& e) {
        throw ConfigParseError(std::string("unit_conversions: ") + e.what());
    }
}

EngineConfig parse_engine_config_from_string(const std::string& json_string) {
    EngineConfig config;

    try {
        json j = json::parse(json_string);

        if (!j.is_object()) {
            throw ConfigParseError("Engine configuration must be a JSON object");
        }

        if (j.contains("floor_epsilon")) {
            config.floor_epsilon = j["floor_epsilon"].get<double>();
        }
        if (j.contains("parallel")) {
            config.parallel = j["parallel"].get<bool>();
        }
        if (j.contains("max_threads")) {
            config.max_threads = j["max_threads"].get<int>();
        }
        if (j.contains("treat_warnings_as_errors")) {
            config.treat_warnings_as_errors = j["treat_warnings_as_errors"].get<bool>();
        }
        if (j.contains("alignment_policy")) {
            config.alignment_policy = string_to_alignment_policy(get_string(j, "alignment_policy"));
        }

        if (j.contains("unit_conversions")) {
            for (const auto& conv_json : j["unit_conversions"]) {
                if (!conv_json.contains("from") || !conv_json.contains("to") ||
                    !conv_json.contains("factor")) {
                    throw ConfigParseError("unit conversion requires 'from', 'to' and 'factor'");
                }
                config.unit_conversions.emplace_back(
                    get_string(conv_json, "from"),
                    get_string(conv_json, "to"),
                    conv_json["factor"].get<double>());
            }
        }

        if (j.contains("logging")) {
            const auto& log_json = j["logging"];
            if (log_json.contains("level")) {
                config.logging.min_level = string_to_level(log_json["level"].get<std::string>());
            }
            if (log_json.contains("console")) {
                config.logging.enable_console = log_json["console"].get<bool>();
            }
            if (log_json.contains("file")) {
                config.logging.enable_file = true;
                config.logging.log_file_path = get_string(log_json, "file");
            }
            if (log_json.contains("json")) {
                config.logging.enable_json = log_json["json"].get<bool>();
            }
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }

    validate_engine_config(config);

    return config;
}

EngineConfig parse_engine_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    EngineConfig config = parse_engine_config_from_string(buffer.str());

    if (config.logging.enable_file) {
        fs::path log_path(config.logging.log_file_path);
        if (log_path.is_relative()) {
            config.logging.log_file_path =
                (fs::path(file_path).parent_path() / log_path).string();
        }
    }

    return config;
}

} // namespace impactcalc

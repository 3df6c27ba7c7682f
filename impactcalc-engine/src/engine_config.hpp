#ifndef IMPACTCALC_ENGINE_CONFIG_HPP
#define IMPACTCALC_ENGINE_CONFIG_HPP

#include "conventional.hpp"
#include "logger.hpp"
#include "unit_aligner.hpp"
#include <string>
#include <vector>

namespace impactcalc {

/**
 * @brief Settings for one ImpactEngine instance
 *
 * Passed to the engine by value; the engine never reads process-wide state
 * for its analytical behaviour.
 */
struct EngineConfig {
    double floor_epsilon;                        ///< TAM - adoption values below this are floored to 0
    bool parallel;                               ///< Fan compute_impact_all out across threads
    int max_threads;                             ///< 0 = runtime default
    bool treat_warnings_as_errors;               ///< Adoption bound violations fail the metric
    AlignmentPolicy alignment_policy;            ///< Used by ImpactEngine::compare_impacts
    std::vector<UnitConversion> unit_conversions;  ///< Declared conversions
    LoggerConfig logging;                        ///< Applied by the caller via Logger::configure

    EngineConfig();
};

/**
 * @brief Validates an engine configuration
 *
 * @throws ConfigParseError for a negative or non-finite floor_epsilon, a
 *         negative max_threads or a non-positive conversion factor
 */
void validate_engine_config(const EngineConfig& config);

/**
 * @brief Parses an engine configuration from a JSON string
 *
 * Recognised keys (all optional):
 *   floor_epsilon, parallel, max_threads, treat_warnings_as_errors,
 *   alignment_policy, unit_conversions [{from, to, factor}],
 *   logging {level, console, file, json}
 *
 * @throws ConfigParseError if JSON is invalid or a value is out of range
 */
EngineConfig parse_engine_config_from_string(const std::string& json_string);

/**
 * @brief Parses an engine configuration from a JSON file
 *
 * A relative logging.file is resolved against the config file's directory.
 *
 * @throws ConfigParseError if the file cannot be read or its content is invalid
 */
EngineConfig parse_engine_config_from_file(const std::string& file_path);

/**
 * @brief Expands ${VAR_NAME} and $VAR_NAME references from the environment
 *
 * Unset variables expand to the empty string.
 */
std::string expand_environment_variables(const std::string& value);

} // namespace impactcalc

#endif // IMPACTCALC_ENGINE_CONFIG_HPP

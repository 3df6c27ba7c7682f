/**
 * @file logger.hpp
 * @brief Structured logging for the impact engine with JSON output
 *
 * The Logger provides:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted or plain text lines
 * - Context tracking (scenario, metric, phase)
 * - Domain events: impact start/complete, adoption warnings, metric failures,
 *   batch summaries
 *
 * The logger is safe to call from the worker threads compute_impact_all
 * fans out to.
 */

#ifndef IMPACTCALC_LOGGER_HPP
#define IMPACTCALC_LOGGER_HPP

#include "adoption_trajectory.hpp"
#include "errors.hpp"
#include "time_series.hpp"
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace impactcalc {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Intermediate trajectories, per-year detail
    INFO,    ///< Computation start/end, batch summaries
    WARN,    ///< Adoption bound violations and other non-fatal issues
    ERROR    ///< Metric failures
};

/**
 * @brief Convert log level to string
 */
inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse log level from string
 * @throws ConfigParseError for an unknown name
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    throw ConfigParseError("Unknown log level: " + level_str);
}

/**
 * @brief What is being computed when an event is logged
 */
struct ImpactContext {
    std::string scenario;            ///< Scenario name
    std::string metric;              ///< Metric name, empty for scenario-wide events
    std::string phase;               ///< validate, derive, metric, difference, batch

    ImpactContext() = default;

    ImpactContext(const std::string& scenario_name, const std::string& metric_name)
        : scenario(scenario_name), metric(metric_name), phase("") {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)
    size_t max_warnings_per_event;   ///< Warnings itemised in one adoption_warning event

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("impactcalc.log"),
          enable_json(true),
          max_warnings_per_event(5) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   Logger::get_instance().configure(config);
 *
 *   ImpactContext ctx("PDS2", "emissions");
 *   Logger::get_instance().log_impact_start(ctx, 31);
 *   @endcode
 */
class Logger {
public:
    /**
     * @brief Get singleton logger instance
     */
    static Logger& get_instance();

    /**
     * @brief Configure logger with new settings
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log the start of one scenario/metric impact computation
     *
     * @param ctx Execution context
     * @param horizon_years Number of years in the market horizon
     */
    void log_impact_start(const ImpactContext& ctx, size_t horizon_years);

    /**
     * @brief Log a finished impact trajectory
     *
     * @param ctx Execution context
     * @param impact Impact trajectory (scenario - reference)
     * @param elapsed_ms Computation time
     */
    void log_impact_complete(const ImpactContext& ctx, const TimeSeries& impact, double elapsed_ms);

    /**
     * @brief Log adoption soft-bound violations (one event per trajectory)
     *
     * @param ctx Execution context
     * @param role Which trajectory was validated
     * @param warnings Violations returned by validate_against()
     */
    void log_adoption_warnings(
        const ImpactContext& ctx,
        AdoptionRole role,
        const std::vector<AdoptionWarning>& warnings
    );

    /**
     * @brief Log a metric that failed inside a batch
     */
    void log_metric_failure(const ImpactContext& ctx, ErrorKind kind, const std::string& message);

    /**
     * @brief Log the summary of compute_impact_all
     */
    void log_batch_complete(
        const ImpactContext& ctx,
        size_t succeeded,
        size_t failed,
        double elapsed_ms
    );

    /**
     * @brief Log a trajectory at DEBUG level (skipped entirely above DEBUG)
     */
    void log_trajectory(const ImpactContext& ctx, const TimeSeries& series);

    /**
     * @brief Flush all log outputs
     */
    void flush();

    void set_min_level(LogLevel level);
    LogLevel get_min_level() const;

private:
    Logger();
    ~Logger();

    // Disable copy and move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;
    mutable std::mutex mutex_;

    // Helper methods
    std::map<std::string, std::string> base_fields(const std::string& event, const ImpactContext& ctx) const;
    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

} // namespace impactcalc

#endif // IMPACTCALC_LOGGER_HPP

/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace impactcalc {

namespace {

std::string format_double(double value) {
    std::ostringstream oss;
    oss << std::setprecision(10) << value;
    return oss.str();
}

} // anonymous namespace

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    file_stream_.reset();

    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

std::map<std::string, std::string> Logger::base_fields(
    const std::string& event,
    const ImpactContext& ctx
) const {
    std::map<std::string, std::string> fields;
    fields["event"] = event;
    fields["scenario"] = ctx.scenario;
    if (!ctx.metric.empty()) {
        fields["metric"] = ctx.metric;
    }
    if (!ctx.phase.empty()) {
        fields["phase"] = ctx.phase;
    }
    return fields;
}

void Logger::log_impact_start(const ImpactContext& ctx, size_t horizon_years) {
    auto fields = base_fields("impact_start", ctx);
    fields["horizon_years"] = std::to_string(horizon_years);

    log(LogLevel::INFO, "Starting impact computation", fields);
}

void Logger::log_impact_complete(const ImpactContext& ctx, const TimeSeries& impact, double elapsed_ms) {
    auto fields = base_fields("impact_complete", ctx);
    fields["unit"] = impact.unit();
    fields["years"] = std::to_string(impact.size());
    fields["total"] = format_double(impact.total());
    fields["elapsed_ms"] = format_double(elapsed_ms);
    if (!impact.empty()) {
        fields["first_year"] = std::to_string(impact.first_year());
        fields["last_year"] = std::to_string(impact.last_year());
    }

    log(LogLevel::INFO, "Impact computed", fields);
}

void Logger::log_adoption_warnings(
    const ImpactContext& ctx,
    AdoptionRole role,
    const std::vector<AdoptionWarning>& warnings
) {
    if (warnings.empty()) {
        return;
    }

    auto fields = base_fields("adoption_warning", ctx);
    fields["role"] = adoption_role_to_string(role);
    fields["warning_count"] = std::to_string(warnings.size());

    size_t max_items = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        max_items = config_.max_warnings_per_event;
    }

    size_t itemised = std::min(warnings.size(), max_items);
    for (size_t i = 0; i < itemised; ++i) {
        fields["warning_" + std::to_string(i)] = warnings[i].describe();
    }
    if (itemised < warnings.size()) {
        fields["truncated"] = "true";
    }

    log(LogLevel::WARN, "Adoption outside market bounds", fields);
}

void Logger::log_metric_failure(const ImpactContext& ctx, ErrorKind kind, const std::string& message) {
    auto fields = base_fields("metric_failure", ctx);
    fields["error_kind"] = error_kind_to_string(kind);
    fields["error_message"] = message;

    log(LogLevel::ERROR, "Metric impact failed", fields);
}

void Logger::log_batch_complete(
    const ImpactContext& ctx,
    size_t succeeded,
    size_t failed,
    double elapsed_ms
) {
    auto fields = base_fields("batch_complete", ctx);
    fields["succeeded"] = std::to_string(succeeded);
    fields["failed"] = std::to_string(failed);
    fields["elapsed_ms"] = format_double(elapsed_ms);

    log(failed == 0 ? LogLevel::INFO : LogLevel::WARN, "Impact batch completed", fields);
}

void Logger::log_trajectory(const ImpactContext& ctx, const TimeSeries& series) {
    if (get_min_level() > LogLevel::DEBUG) {
        return;
    }

    auto fields = base_fields("trajectory", ctx);
    fields["name"] = series.name();
    fields["unit"] = series.unit();

    std::ostringstream oss;
    for (size_t i = 0; i < series.size(); ++i) {
        if (i > 0) oss << " ";
        oss << series.years()[i] << ":" << format_double(series.values()[i]);
    }
    fields["values"] = oss.str();

    log(LogLevel::DEBUG, "Trajectory", fields);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Skip if below minimum level
    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        std::map<std::string, std::string> json_fields = fields;
        json_fields["timestamp"] = get_timestamp();
        json_fields["level"] = level_to_string(level);
        json_fields["message"] = message;
        output = format_json(json_fields);
    } else {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;

        if (!fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }

        output = oss.str();
    }

    write_output(output);
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    for (const auto& [key, value] : fields) {
        if (!first) oss << ",";
        oss << "\"" << escape_json_string(key) << "\":\"" << escape_json_string(value) << "\"";
        first = false;
    }

    oss << "}";
    return oss.str();
}

std::string Logger::escape_json_string(const std::string& str) const {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace impactcalc

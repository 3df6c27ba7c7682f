/**
 * @file errors.hpp
 * @brief Exception hierarchy for the impact engine
 *
 * Every failure the engine reports derives from ImpactError and carries an
 * ErrorKind so batch results and log lines can name the failure without
 * re-throwing.
 */

#ifndef IMPACTCALC_ERRORS_HPP
#define IMPACTCALC_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace impactcalc {

/**
 * @brief Failure categories reported by the engine
 */
enum class ErrorKind {
    MissingYear,             ///< Lookup of a year the series does not hold
    UnitMismatch,            ///< Strict arithmetic between series of different units
    YearRangeMismatch,       ///< Strict arithmetic between series with different years
    IncompatibleUnits,       ///< Alignment with no declared unit conversion
    EmptyIntersection,       ///< Alignment of series that share no years
    InconsistentHorizon,     ///< Market / projected / reference horizons disagree
    MissingCoefficientYear,  ///< Coefficient series does not cover an adoption year
    InvalidInput,            ///< Construction contract violated
    Configuration,           ///< Engine configuration is invalid
    Internal                 ///< Anything else caught at a batch boundary
};

/**
 * @brief Convert error kind to its stable name
 */
inline std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MissingYear: return "MissingYear";
        case ErrorKind::UnitMismatch: return "UnitMismatch";
        case ErrorKind::YearRangeMismatch: return "YearRangeMismatch";
        case ErrorKind::IncompatibleUnits: return "IncompatibleUnits";
        case ErrorKind::EmptyIntersection: return "EmptyIntersection";
        case ErrorKind::InconsistentHorizon: return "InconsistentHorizon";
        case ErrorKind::MissingCoefficientYear: return "MissingCoefficientYear";
        case ErrorKind::InvalidInput: return "InvalidInput";
        case ErrorKind::Configuration: return "Configuration";
        case ErrorKind::Internal: return "Internal";
        default: return "Unknown";
    }
}

/**
 * @brief Base exception for all engine errors
 */
class ImpactError : public std::runtime_error {
public:
    ImpactError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class MissingYearError : public ImpactError {
public:
    MissingYearError(const std::string& series_name, int year)
        : ImpactError(ErrorKind::MissingYear,
                      "Missing year " + std::to_string(year) + " in series '" + series_name + "'"),
          year_(year) {}

    int year() const { return year_; }

private:
    int year_;
};

class UnitMismatchError : public ImpactError {
public:
    explicit UnitMismatchError(const std::string& message)
        : ImpactError(ErrorKind::UnitMismatch, "Unit mismatch: " + message) {}
};

class YearRangeMismatchError : public ImpactError {
public:
    explicit YearRangeMismatchError(const std::string& message)
        : ImpactError(ErrorKind::YearRangeMismatch, "Year range mismatch: " + message) {}
};

class IncompatibleUnitsError : public ImpactError {
public:
    IncompatibleUnitsError(const std::string& from_unit, const std::string& to_unit)
        : ImpactError(ErrorKind::IncompatibleUnits,
                      "Incompatible units: no conversion from '" + from_unit +
                      "' to '" + to_unit + "'") {}
};

class EmptyIntersectionError : public ImpactError {
public:
    EmptyIntersectionError(const std::string& first, const std::string& second)
        : ImpactError(ErrorKind::EmptyIntersection,
                      "Series '" + first + "' and '" + second + "' share no years") {}
};

class InconsistentHorizonError : public ImpactError {
public:
    explicit InconsistentHorizonError(const std::string& message)
        : ImpactError(ErrorKind::InconsistentHorizon, "Inconsistent horizon: " + message) {}
};

class MissingCoefficientYearError : public ImpactError {
public:
    MissingCoefficientYearError(const std::string& metric, const std::string& side, int year)
        : ImpactError(ErrorKind::MissingCoefficientYear,
                      "Metric '" + metric + "': " + side + " coefficient has no value for year " +
                      std::to_string(year)),
          year_(year) {}

    int year() const { return year_; }

private:
    int year_;
};

class InvalidInputError : public ImpactError {
public:
    explicit InvalidInputError(const std::string& message)
        : ImpactError(ErrorKind::InvalidInput, "Invalid input: " + message) {}
};

/**
 * @brief Exception thrown when engine configuration parsing fails
 */
class ConfigParseError : public ImpactError {
public:
    explicit ConfigParseError(const std::string& message)
        : ImpactError(ErrorKind::Configuration, message) {}
};

} // namespace impactcalc

#endif // IMPACTCALC_ERRORS_HPP

/**
 * @file Error.hpp
 * @brief Structured error type with source location tracking.
 *
 * Defines the library error codes and a lightweight Error value type
 * carrying the code, a human-readable message, the source location where
 * the error was raised and, for sample-rate mismatches, the pair of rates
 * so the caller can decide to resample the offending file.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef AUR_CORE_ERROR_HPP
    #define AUR_CORE_ERROR_HPP

    #include "Types.hpp"

    #include <expected>
    #include <optional>
    #include <source_location>
    #include <string>
    #include <string_view>
    #include <utility>

namespace aur::core {

/**
 * @brief Library-wide error code enumeration.
 */
enum class ErrorCode : u16 {
    kNone = 0,

    kIoError,
    kInvalidFileFormat,
    kInvalidSampleRate,
    kInvalidLength,
};

/**
 * @brief Returns a short human-readable label for the given error code.
 */
[[nodiscard]] constexpr std::string_view errorCodeName(ErrorCode code) noexcept
{
    switch (code) {
        case ErrorCode::kNone:              return "None";
        case ErrorCode::kIoError:           return "IoError";
        case ErrorCode::kInvalidFileFormat: return "InvalidFileFormat";
        case ErrorCode::kInvalidSampleRate: return "InvalidSampleRate";
        case ErrorCode::kInvalidLength:     return "InvalidLength";
    }
    return "Unknown";
}

/**
 * @brief Observed and required sample rates of a rejected resource.
 */
struct SampleRatePair {
    u32 actual;
    u32 required;
};

/**
 * @brief Structured error value carrying a code, message, and origin.
 *
 * Intended to be stored inside Expected<T>.
 */
class Error final {
public:
    /**
     * @brief Construct an error from a code and message.
     * @param code    Enumerated error code.
     * @param message Human-readable description.
     * @param loc     Source location (auto-filled by the compiler).
     */
    explicit Error(
        ErrorCode code,
        std::string message,
        std::source_location loc = std::source_location::current()
    ) : _code(code), _message(std::move(message)), _location(loc) {}

    /**
     * @brief Construct a kInvalidSampleRate error carrying both rates.
     */
    explicit Error(
        SampleRatePair rates,
        std::string message,
        std::source_location loc = std::source_location::current()
    ) : _code(ErrorCode::kInvalidSampleRate), _message(std::move(message)),
        _location(loc), _sampleRates(rates) {}

    [[nodiscard]] ErrorCode                     code()        const { return _code; }
    [[nodiscard]] const std::string &           message()     const { return _message; }
    [[nodiscard]] std::source_location          location()    const { return _location; }
    [[nodiscard]] std::optional<SampleRatePair> sampleRates() const { return _sampleRates; }

    /**
     * @brief Formats the error as "[Code] message (file:line)".
     */
    [[nodiscard]] std::string format() const;

private:
    ErrorCode                     _code;
    std::string                   _message;
    std::source_location          _location;
    std::optional<SampleRatePair> _sampleRates;
};

/// @brief Convenience alias for std::unexpected<Error>.
using Unexpected = std::unexpected<Error>;

/// @brief Factory function to create an unexpected error.
/// @param code Error code.
/// @param message Human-readable description.
/// @param loc Source location (auto-filled).
/// @return std::unexpected<Error>.
[[nodiscard]] inline auto makeError(
    ErrorCode code,
    std::string message,
    std::source_location loc = std::source_location::current())
{
    return std::unexpected<Error>(Error{code, std::move(message), loc});
}

/// @brief Factory for a sample-rate mismatch carrying both rates.
[[nodiscard]] inline auto makeSampleRateError(
    u32 actual,
    u32 required,
    std::string message,
    std::source_location loc = std::source_location::current())
{
    return std::unexpected<Error>(Error{SampleRatePair{actual, required}, std::move(message), loc});
}

} // namespace aur::core

#endif // AUR_CORE_ERROR_HPP

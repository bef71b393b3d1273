/**
 * @file Log.hpp
 * @brief Logging façade with runtime severity filtering.
 *
 * Provides a static Log class backed by an injectable ILogger interface.
 * The default implementation writes to stderr.  A custom logger can be
 * installed via Log::setLogger(), typically by the host audio context.
 *
 * Nothing on the per-block render path may log: the sink is free to
 * allocate and lock.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef AUR_CORE_LOG_HPP
    #define AUR_CORE_LOG_HPP

    #include "Types.hpp"

    #include <string_view>

namespace aur::core {

/**
 * @brief Severity levels for log messages.
 */
enum class LogLevel : u8 {
    kDebug = 0,
    kInfo,
    kWarn,
    kError,
    kFatal
};

/**
 * @brief Abstract sink for log messages.
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    /**
     * @brief Write a log entry.
     * @param level   Severity.
     * @param tag     Subsystem tag (e.g. "HRTF", "DSP", "AUDIO").
     * @param message Formatted message body.
     */
    virtual void write(LogLevel level, std::string_view tag, std::string_view message) = 0;
};

/**
 * @brief Static logging façade used throughout the library.
 *
 * Thread-safe provided the installed ILogger is thread-safe.
 */
class Log final {
public:
    Log() = delete;

    /// @brief Installs @p logger, or restores the stderr sink when null.
    static void setLogger(ILogger *logger);
    static void setMinLevel(LogLevel level);
    [[nodiscard]] static LogLevel minLevel();

    static void debug(std::string_view tag, std::string_view msg);
    static void info (std::string_view tag, std::string_view msg);
    static void warn (std::string_view tag, std::string_view msg);
    static void error(std::string_view tag, std::string_view msg);
    static void fatal(std::string_view tag, std::string_view msg);
};

} // namespace aur::core

#endif // AUR_CORE_LOG_HPP

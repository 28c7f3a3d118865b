/**
 * @file Log.hpp
 * @brief Minimal logging façade with runtime severity filtering.
 *
 * Provides a static Log class backed by an injectable ILogger interface.
 * The default implementation writes to stderr.  A custom logger can be
 * installed via Log::setLogger() before any controller is started; the
 * producer thread logs through whichever sink is active.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef BTPAD_CORE_LOG_HPP
    #define BTPAD_CORE_LOG_HPP

    #include "Types.hpp"

    #include <string_view>

namespace btpad::core {

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
 *
 * Implementations must be thread-safe: the controller's producer thread
 * and the polling thread may log concurrently.
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    /**
     * @brief Write a log entry.
     * @param level   Severity.
     * @param tag     Subsystem tag (e.g. "input", "mapping").
     * @param message Formatted message body.
     */
    virtual void write(LogLevel level, std::string_view tag, std::string_view message) = 0;
};

/**
 * @brief Static logging façade used throughout the library.
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

    static void debug(std::string_view msg) { debug("btpad", msg); }
    static void info (std::string_view msg) { info ("btpad", msg); }
    static void warn (std::string_view msg) { warn ("btpad", msg); }
    static void error(std::string_view msg) { error("btpad", msg); }
    static void fatal(std::string_view msg) { fatal("btpad", msg); }
};

} // namespace btpad::core

#endif // BTPAD_CORE_LOG_HPP

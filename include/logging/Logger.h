#pragma once

#include <unistd.h>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <cerrno>

#include "core/Flags.h"

/**
 * @brief Process-local logging system.
 *
 * Log lines are written to stderr so that they never interleave with the
 * rendered command output. Lines carry a level and a color-coded source tag.
 */
namespace Logger {
    /**
     * @brief Log severity levels.
     */
    enum class Level {
        DEBUG, ///< Detailed technical information
        INFO,  ///< Business logic events
        WARN,  ///< Rejected operations and recoverable input problems
        ERROR  ///< Error conditions
    };

    /**
     * @brief Log message source identifiers.
     */
    enum class Source : uint8_t {
        Orchestrator, ///< Booking state transitions
        Session,      ///< Command loop and I/O
        Other         ///< Entry point and utilities
    };

    namespace detail {
        constexpr const char *names[] = {"DEBUG", "INFO ", "WARN ", "ERROR"};

        inline const char *getTagColor(Source source, Level level) {
            if (level == Level::ERROR) return "\033[31m";
            if (level == Level::WARN) return "\033[33m";
            switch (source) {
                case Source::Orchestrator: return "\033[36m";
                case Source::Session: return "\033[32m";
                default: return "\033[37m";
            }
        }

        /** True when stderr is a terminal; colors are suppressed otherwise. */
        bool colorEnabled();

        /** Write a fully formatted line to stderr, retrying on EINTR. */
        void emit(const char *buf, size_t len);

        template<typename... Args>
        void logDirect(const Source source, Level level, const char *tag, const char *message, Args... args) {
            char buf[512];
            const bool color = colorEnabled();
            int n = snprintf(buf, sizeof(buf), "%s[%s] [%s]%s ",
                             color ? getTagColor(source, level) : "",
                             names[static_cast<int>(level)],
                             tag,
                             color ? "\033[0m" : "");
            if (n < 0) return;
            if constexpr (sizeof...(args) == 0) {
                n += snprintf(buf + n, sizeof(buf) - n, "%s", message);
            } else {
                n += snprintf(buf + n, sizeof(buf) - n, message, args...);
            }
            // Truncated output: keep room for the newline
            if (n < 0 || static_cast<size_t>(n) >= sizeof(buf) - 1) {
                n = static_cast<int>(sizeof(buf)) - 2;
            }
            buf[n++] = '\n';
            emit(buf, static_cast<size_t>(n));
        }
    }

    /**
     * @brief Log a debug message.
     * @param source Source identifier
     * @param tag Short identifier (e.g., "Orchestrator")
     * @param message Format string (printf-style)
     * @param args Format arguments
     *
     * Debug messages are for technical details, disabled by default.
     */
    template<typename... Args>
    void debug(Source source, const char *tag, const char *message, Args... args) {
        if constexpr (Flags::Logging::IS_DEBUG_ENABLED) {
            detail::logDirect(source, Level::DEBUG, tag, message, args...);
        }
    }

    /**
     * @brief Log an info message.
     * @param source Source identifier
     * @param tag Short identifier
     * @param message Format string (printf-style)
     * @param args Format arguments
     */
    template<typename... Args>
    void info(Source source, const char *tag, const char *message, Args... args) {
        if constexpr (Flags::Logging::IS_INFO_ENABLED) {
            detail::logDirect(source, Level::INFO, tag, message, args...);
        }
    }

    /**
     * @brief Log a warning message.
     * @param source Source identifier
     * @param tag Short identifier
     * @param message Format string (printf-style)
     * @param args Format arguments
     */
    template<typename... Args>
    void warn(Source source, const char *tag, const char *message, Args... args) {
        if constexpr (Flags::Logging::IS_WARN_ENABLED) {
            detail::logDirect(source, Level::WARN, tag, message, args...);
        }
    }

    /**
     * @brief Log an error message.
     * @param source Source identifier
     * @param tag Short identifier
     * @param message Format string (printf-style)
     * @param args Format arguments
     */
    template<typename... Args>
    void error(Source source, const char *tag, const char *message, Args... args) {
        if constexpr (Flags::Logging::IS_ERROR_ENABLED) {
            detail::logDirect(source, Level::ERROR, tag, message, args...);
        }
    }

    /**
     * @brief Log a POSIX error with errno description.
     * @param source Source identifier
     * @param tag Short identifier
     * @param message Context message
     *
     * Appends strerror(errno) to the message.
     */
    inline void perror(Source source, const char *tag, const char *message) {
        if constexpr (Flags::Logging::IS_ERROR_ENABLED) {
            detail::logDirect(source, Level::ERROR, tag, "%s: %s", message, strerror(errno));
        }
    }
}

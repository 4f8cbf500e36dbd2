/*
* @license
* (C) zachbabanov
*
*/

#ifndef PEERLINK_LOGGER_HPP
#define PEERLINK_LOGGER_HPP

#pragma once

#include <fstream>
#include <iterator>
#include <string>
#include <chrono>
#include <atomic>
#include <mutex>
#include <ctime>

#include <fmt/core.h>

namespace peerlink::log {

/**
 * @brief Log level enumeration
 */
    enum class Level {
        TRACE = 0,
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

/**
 * @brief Categories to attach to each log line.
 */
    enum class Category {
        GENERAL,
        SIGNALING,
        SESSION,
        VIDEO,
        BITRATE,
        CONTROL,
        NETWORK
    };

    /// Parse "trace" / "debug" / "info" / "warn" / "error" (case-insensitive). Returns false on unknown input.
    bool parse_level(const std::string &s, Level &out);

    const char *level_name(Level l);

/**
 * @brief Thread-safe singleton logger using fmt for formatting.
 *
 * Usage:
 *   LOG_SIG_INFO("connected to {}:{}", host, port);
 */
    class Logger {
    public:
        static Logger &instance();

        /// Set global minimal log level (messages below will be ignored)
        void set_level(Level l);
        Level level() const;

        /// Open file to duplicate logs into
        bool open_logfile(const std::string &path);

        /// Close log file
        void close_logfile();

        /// Core logging call: prints a ready message
        void log(Level lvl, Category cat, const std::string &msg, const char *file = nullptr, int line = 0);

        /**
         * @brief logf - formats the message with fmt and forwards it to log().
         *
         * The level check happens before formatting so disabled TRACE lines in hot loops cost nothing.
         */
        template<typename... Args>
        void logf(Level lvl, Category cat, const char *file, int line, const char *fmt_str, Args&&... args) {
            if (lvl < min_level_.load(std::memory_order_relaxed)) return;
            std::string msg;
            if (fmt_str && fmt_str[0] != '\0') {
                try {
                    fmt::vformat_to(std::back_inserter(msg), fmt::string_view(fmt_str), fmt::make_format_args(args...));
                } catch (const std::exception &e) {
                    msg = std::string("[format_error:") + e.what() + "] " + fmt_str;
                }
            }
            log(lvl, cat, msg, file, line);
        }

    private:
        Logger();
        ~Logger();

        std::mutex mtx_;
        std::ofstream file_;
        std::atomic<Level> min_level_;

        std::string timestamp_now();

        // non-copyable
        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;
    };

#define PEERLINK_LOG_(lvl, cat, fmt, ...) peerlink::log::Logger::instance().logf(peerlink::log::Level::lvl, peerlink::log::Category::cat, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

// Convenience macros for easy calls (automatically add file:line)
#define LOG_GEN_TRACE(fmt, ...) PEERLINK_LOG_(TRACE, GENERAL, fmt, ##__VA_ARGS__)
#define LOG_GEN_DEBUG(fmt, ...) PEERLINK_LOG_(DEBUG, GENERAL, fmt, ##__VA_ARGS__)
#define LOG_GEN_INFO(fmt, ...)  PEERLINK_LOG_(INFO,  GENERAL, fmt, ##__VA_ARGS__)
#define LOG_GEN_WARN(fmt, ...)  PEERLINK_LOG_(WARN,  GENERAL, fmt, ##__VA_ARGS__)
#define LOG_GEN_ERROR(fmt, ...) PEERLINK_LOG_(ERROR, GENERAL, fmt, ##__VA_ARGS__)

#define LOG_SIG_TRACE(fmt, ...) PEERLINK_LOG_(TRACE, SIGNALING, fmt, ##__VA_ARGS__)
#define LOG_SIG_DEBUG(fmt, ...) PEERLINK_LOG_(DEBUG, SIGNALING, fmt, ##__VA_ARGS__)
#define LOG_SIG_INFO(fmt, ...)  PEERLINK_LOG_(INFO,  SIGNALING, fmt, ##__VA_ARGS__)
#define LOG_SIG_WARN(fmt, ...)  PEERLINK_LOG_(WARN,  SIGNALING, fmt, ##__VA_ARGS__)
#define LOG_SIG_ERROR(fmt, ...) PEERLINK_LOG_(ERROR, SIGNALING, fmt, ##__VA_ARGS__)

#define LOG_SESSION_TRACE(fmt, ...) PEERLINK_LOG_(TRACE, SESSION, fmt, ##__VA_ARGS__)
#define LOG_SESSION_DEBUG(fmt, ...) PEERLINK_LOG_(DEBUG, SESSION, fmt, ##__VA_ARGS__)
#define LOG_SESSION_INFO(fmt, ...)  PEERLINK_LOG_(INFO,  SESSION, fmt, ##__VA_ARGS__)
#define LOG_SESSION_WARN(fmt, ...)  PEERLINK_LOG_(WARN,  SESSION, fmt, ##__VA_ARGS__)
#define LOG_SESSION_ERROR(fmt, ...) PEERLINK_LOG_(ERROR, SESSION, fmt, ##__VA_ARGS__)

#define LOG_VIDEO_TRACE(fmt, ...) PEERLINK_LOG_(TRACE, VIDEO, fmt, ##__VA_ARGS__)
#define LOG_VIDEO_DEBUG(fmt, ...) PEERLINK_LOG_(DEBUG, VIDEO, fmt, ##__VA_ARGS__)
#define LOG_VIDEO_INFO(fmt, ...)  PEERLINK_LOG_(INFO,  VIDEO, fmt, ##__VA_ARGS__)
#define LOG_VIDEO_WARN(fmt, ...)  PEERLINK_LOG_(WARN,  VIDEO, fmt, ##__VA_ARGS__)
#define LOG_VIDEO_ERROR(fmt, ...) PEERLINK_LOG_(ERROR, VIDEO, fmt, ##__VA_ARGS__)

#define LOG_ABR_TRACE(fmt, ...) PEERLINK_LOG_(TRACE, BITRATE, fmt, ##__VA_ARGS__)
#define LOG_ABR_DEBUG(fmt, ...) PEERLINK_LOG_(DEBUG, BITRATE, fmt, ##__VA_ARGS__)
#define LOG_ABR_INFO(fmt, ...)  PEERLINK_LOG_(INFO,  BITRATE, fmt, ##__VA_ARGS__)
#define LOG_ABR_WARN(fmt, ...)  PEERLINK_LOG_(WARN,  BITRATE, fmt, ##__VA_ARGS__)
#define LOG_ABR_ERROR(fmt, ...) PEERLINK_LOG_(ERROR, BITRATE, fmt, ##__VA_ARGS__)

#define LOG_CTRL_TRACE(fmt, ...) PEERLINK_LOG_(TRACE, CONTROL, fmt, ##__VA_ARGS__)
#define LOG_CTRL_DEBUG(fmt, ...) PEERLINK_LOG_(DEBUG, CONTROL, fmt, ##__VA_ARGS__)
#define LOG_CTRL_INFO(fmt, ...)  PEERLINK_LOG_(INFO,  CONTROL, fmt, ##__VA_ARGS__)
#define LOG_CTRL_WARN(fmt, ...)  PEERLINK_LOG_(WARN,  CONTROL, fmt, ##__VA_ARGS__)
#define LOG_CTRL_ERROR(fmt, ...) PEERLINK_LOG_(ERROR, CONTROL, fmt, ##__VA_ARGS__)

#define LOG_NET_TRACE(fmt, ...) PEERLINK_LOG_(TRACE, NETWORK, fmt, ##__VA_ARGS__)
#define LOG_NET_DEBUG(fmt, ...) PEERLINK_LOG_(DEBUG, NETWORK, fmt, ##__VA_ARGS__)
#define LOG_NET_INFO(fmt, ...)  PEERLINK_LOG_(INFO,  NETWORK, fmt, ##__VA_ARGS__)
#define LOG_NET_WARN(fmt, ...)  PEERLINK_LOG_(WARN,  NETWORK, fmt, ##__VA_ARGS__)
#define LOG_NET_ERROR(fmt, ...) PEERLINK_LOG_(ERROR, NETWORK, fmt, ##__VA_ARGS__)

} // namespace peerlink::log

#endif // PEERLINK_LOGGER_HPP

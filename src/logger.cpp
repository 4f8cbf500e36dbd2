#include <peerlink/logger.hpp>
#include <fmt/core.h>
#include <fmt/chrono.h>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstring>

namespace peerlink::log {

    bool parse_level(const std::string &s, Level &out) {
        std::string v = s;
        std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return (char)std::tolower(c); });
        if (v == "trace") out = Level::TRACE;
        else if (v == "debug") out = Level::DEBUG;
        else if (v == "info") out = Level::INFO;
        else if (v == "warn" || v == "warning") out = Level::WARN;
        else if (v == "error") out = Level::ERROR;
        else return false;
        return true;
    }

    const char *level_name(Level l) {
        switch (l) {
            case Level::TRACE: return "TRACE";
            case Level::DEBUG: return "DEBUG";
            case Level::INFO:  return "INFO ";
            case Level::WARN:  return "WARN ";
            case Level::ERROR: return "ERROR";
        }
        return "?????";
    }

    static const char *category_name(Category c) {
        switch (c) {
            case Category::GENERAL:   return "GEN";
            case Category::SIGNALING: return "SIG";
            case Category::SESSION:   return "SESSION";
            case Category::VIDEO:     return "VIDEO";
            case Category::BITRATE:   return "ABR";
            case Category::CONTROL:   return "CTRL";
            case Category::NETWORK:   return "NET";
        }
        return "GEN";
    }

    Logger &Logger::instance() {
        static Logger lg;
        return lg;
    }

    Logger::Logger() : min_level_(Level::INFO) {}

    Logger::~Logger() {
        if (file_.is_open()) file_.close();
    }

    void Logger::set_level(Level l) {
        min_level_.store(l);
    }

    Level Logger::level() const {
        return min_level_.load();
    }

    bool Logger::open_logfile(const std::string &path) {
        std::lock_guard<std::mutex> lk(mtx_);
        if (file_.is_open()) file_.close();
        file_.open(path, std::ios::out | std::ios::app);
        return file_.is_open();
    }

    void Logger::close_logfile() {
        std::lock_guard<std::mutex> lk(mtx_);
        if (file_.is_open()) file_.close();
    }

    std::string Logger::timestamp_now() {
        using namespace std::chrono;
        auto now = system_clock::now();
        auto itt = system_clock::to_time_t(now);
        std::tm tm{};
        localtime_r(&itt, &tm);
        auto us = duration_cast<microseconds>(now.time_since_epoch()) % 1000000;
        return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:06}", tm, static_cast<int>(us.count()));
    }

    void Logger::log(Level lvl, Category cat, const std::string &msg, const char *file, int line) {
        if (lvl < min_level_.load()) return;

        std::string ts = timestamp_now();

        std::string location;
        if (file) {
            const char *fname = file;
            const char *p = std::strrchr(file, '/');
            if (p) fname = p + 1;
            location = fmt::format(" ({}:{})", fname, line);
        }

        // Compose final line
        std::string out = fmt::format("{} [{}] {{{}}}{} - {}\n", ts, level_name(lvl), category_name(cat), location, msg);

        // Output under lock
        std::lock_guard<std::mutex> lk(mtx_);
        std::fwrite(out.data(), 1, out.size(), stdout);
        std::fflush(stdout);
        if (file_.is_open()) {
            file_ << out;
            file_.flush();
        }
    }

} // namespace peerlink::log

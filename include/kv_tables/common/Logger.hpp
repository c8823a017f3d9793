#pragma once
#ifndef _KV_TABLES_LOGGER_HPP_INCLUDED
#define _KV_TABLES_LOGGER_HPP_INCLUDED

/// \file Logger.hpp
/// \brief Minimal process-wide logger built on {fmt}.

namespace kvt {

    /// \enum LogLevel
    /// \brief Severity of a log record.
    ///
    /// - Trace: per-entry table operations.
    /// - Debug: table lifecycle (create, attach, destroy) and cursor lifecycle.
    /// - Info:  environment open/close.
    /// - Warn:  tolerated failures, e.g. a cleanup step that could not complete.
    /// - Error: an operation failed inside the storage backend.
    enum class LogLevel {
        Trace = 0,
        Debug = 1,
        Info  = 2,
        Warn  = 3,
        Error = 4,
        Off   = 5
    };

    /// \brief Returns a fixed-width name of the level.
    inline const char* to_str(LogLevel level) noexcept {
        switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO ";
        case LogLevel::Warn:  return "WARN ";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   return "OFF  ";
        };
        return "?    ";
    }

    /// \class Logger
    /// \brief Writes formatted records to stderr.
    ///
    /// The level check is lock-free; writing a record takes a mutex so that
    /// lines from different threads never interleave.
    class Logger {
    public:
        /// \brief Returns the process-wide instance.
        static Logger& instance() {
            static Logger logger;
            return logger;
        }

        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        void set_level(LogLevel level) noexcept {
            m_level.store(level, std::memory_order_relaxed);
        }

        LogLevel level() const noexcept {
            return m_level.load(std::memory_order_relaxed);
        }

        bool enabled(LogLevel level) const noexcept {
            return level >= this->level() && level != LogLevel::Off;
        }

        /// \brief Formats and writes one record.
        /// \param level Severity of the record.
        /// \param file Source file of the call site.
        /// \param line Source line of the call site.
        template <typename... Args>
        void log(LogLevel level, const char* file, int line,
                 fmt::format_string<Args...> format_str, Args&&... args) {
            if (!enabled(level)) return;
            std::string msg;
            try {
                msg = fmt::format(format_str, std::forward<Args>(args)...);
            } catch (const std::exception& e) {
                msg = fmt::format("LOG FORMAT ERROR: {}", e.what());
            }
            write(level, file, line, msg);
        }

    private:
        Logger() = default;

        void write(LogLevel level, const char* file, int line, const std::string& msg) {
            const auto now = std::chrono::system_clock::now();
            const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()).count() % 1000;
            const std::time_t tt = std::chrono::system_clock::to_time_t(now);
            std::tm tm_buf{};
#           ifdef _WIN32
            localtime_s(&tm_buf, &tt);
#           else
            localtime_r(&tt, &tm_buf);
#           endif
            const char* base = std::strrchr(file, '/');
            base = base ? base + 1 : file;
            std::lock_guard<std::mutex> lock(m_mutex);
            fmt::print(stderr, "{:%Y-%m-%d %H:%M:%S}.{:03d} [{}] {}:{} {}\n",
                       tm_buf, static_cast<int>(ms), to_str(level), base, line, msg);
        }

        std::atomic<LogLevel> m_level{LogLevel::Warn};
        std::mutex m_mutex;
    };

} // namespace kvt

#define KVT_LOG(level, ...)                                                      \
    do {                                                                         \
        auto& kvt_logger_ = ::kvt::Logger::instance();                           \
        if (kvt_logger_.enabled(level)) {                                        \
            kvt_logger_.log(level, __FILE__, __LINE__, __VA_ARGS__);             \
        }                                                                        \
    } while (0)

#define KVT_LOG_TRACE(...) KVT_LOG(::kvt::LogLevel::Trace, __VA_ARGS__)
#define KVT_LOG_DEBUG(...) KVT_LOG(::kvt::LogLevel::Debug, __VA_ARGS__)
#define KVT_LOG_INFO(...)  KVT_LOG(::kvt::LogLevel::Info, __VA_ARGS__)
#define KVT_LOG_WARN(...)  KVT_LOG(::kvt::LogLevel::Warn, __VA_ARGS__)
#define KVT_LOG_ERROR(...) KVT_LOG(::kvt::LogLevel::Error, __VA_ARGS__)

#endif // _KV_TABLES_LOGGER_HPP_INCLUDED

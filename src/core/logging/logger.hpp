#pragma once
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>

namespace popper::core::logging {

    // 1. Log levels, least to most severe. ACTION_INFO carries output
    //    produced on behalf of actions and is hidden by --quiet.
    enum class LogLevel {
        DEBUG,
        ACTION_INFO,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global Logger Setup
    class Logger {
    public:
        // Singleton access so the whole app shares one logger
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_invocation_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            invocation_id_ = id;
        }

        void set_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            level_ = level;
        }

        LogLevel level() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return level_;
        }

        bool enabled(LogLevel level) const {
            std::lock_guard<std::mutex> lock(mutex_);
            return static_cast<int>(level) >= static_cast<int>(level_);
        }

        // Mirrors every emitted line into `path` (append mode) until detached.
        // Attaching the same path twice is a no-op.
        bool attach_log_file(const std::filesystem::path& path) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (file_.is_open() && file_path_ == path) {
                return true;
            }
            if (file_.is_open()) {
                file_.close();
            }
            file_.open(path, std::ios::app);
            if (!file_.is_open()) {
                file_path_.clear();
                return false;
            }
            file_path_ = path;
            return true;
        }

        void detach_log_file() {
            std::lock_guard<std::mutex> lock(mutex_);
            if (file_.is_open()) {
                file_.close();
            }
            file_path_.clear();
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_); // Thread safety!
            if (static_cast<int>(level) < static_cast<int>(level_)) {
                return;
            }

            const std::string line = "[" + level_to_string(level) + "] " +
                                     (invocation_id_.empty() ? "" : "[" + invocation_id_ + "] ") +
                                     message;
            std::cout << line << std::endl;
            if (file_.is_open()) {
                file_ << line << std::endl;
            }
        }

    private:
        Logger() = default;
        mutable std::mutex mutex_;
        std::string invocation_id_;
        LogLevel level_ = LogLevel::ACTION_INFO;
        std::ofstream file_;
        std::filesystem::path file_path_;

        std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG:       return "DEBUG";
                case LogLevel::ACTION_INFO: return "ACTN ";
                case LogLevel::INFO:        return "INFO ";
                case LogLevel::WARN:        return "WARN ";
                case LogLevel::ERROR:       return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    // 3. Helper macros for clean syntax everywhere else in the code
    #define LOG_DEBUG(msg)       popper::core::logging::Logger::get().log(popper::core::logging::LogLevel::DEBUG, msg)
    #define LOG_ACTION_INFO(msg) popper::core::logging::Logger::get().log(popper::core::logging::LogLevel::ACTION_INFO, msg)
    #define LOG_INFO(msg)        popper::core::logging::Logger::get().log(popper::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)        popper::core::logging::Logger::get().log(popper::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg)       popper::core::logging::Logger::get().log(popper::core::logging::LogLevel::ERROR, msg)

} // namespace popper::core::logging

#pragma once

#include "common/RingBuffer.hpp"
#include "common/Utils.hpp"
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>

namespace tsepush {

    enum class LogLevel : uint8_t {
        DEBUG,
        INFO,
        WARNING,
        ERROR
    };

    struct LogEntry {
        int64_t timestamp_us;
        LogLevel level;
        char message[256]; // Fixed size message, longer ones are truncated
    };

    class AsyncLogger {
    public:
        static AsyncLogger& instance() {
            static AsyncLogger instance;
            return instance;
        }

        // Function: start
        // Description: Starts the writer thread.
        // Inputs: filename - Log file, appended to. Empty or "-" writes to stderr.
        void start(const std::string& filename) {
            if (running_.exchange(true)) return;
            filename_ = filename;
            thread_ = std::thread(&AsyncLogger::run, this);
        }

        void stop() {
            running_ = false;
            if (thread_.joinable()) {
                thread_.join();
            }
        }

        void set_level(LogLevel level) {
            level_.store(level, std::memory_order_relaxed);
        }

        bool enabled(LogLevel level) const {
            return static_cast<uint8_t>(level) >= static_cast<uint8_t>(level_.load(std::memory_order_relaxed));
        }

        template<typename... Args>
        void log(LogLevel level, const char* fmt, Args... args) {
            if (!enabled(level)) return;
            LogEntry entry;
            entry.timestamp_us = utils::wall_clock_us();
            entry.level = level;
            snprintf(entry.message, sizeof(entry.message), fmt, args...);

            // Non-blocking push. If full, the entry is dropped.
            if (!buffer_.push(entry)) {
                dropped_.fetch_add(1, std::memory_order_relaxed);
            }
        }

        // Overload for no args to fix -Wformat-security
        void log(LogLevel level, const char* msg) {
            if (!enabled(level)) return;
            LogEntry entry;
            entry.timestamp_us = utils::wall_clock_us();
            entry.level = level;
            strncpy(entry.message, msg, sizeof(entry.message) - 1);
            entry.message[sizeof(entry.message) - 1] = '\0';

            if (!buffer_.push(entry)) {
                dropped_.fetch_add(1, std::memory_order_relaxed);
            }
        }

        uint64_t dropped() const {
            return dropped_.load(std::memory_order_relaxed);
        }

    private:
        AsyncLogger() : running_(false), level_(LogLevel::INFO) {}
        ~AsyncLogger() { stop(); }

        void run() {
            std::ofstream file;
            if (!filename_.empty() && filename_ != "-") {
                file.open(filename_, std::ios::out | std::ios::app);
                if (!file.is_open()) {
                    std::cerr << "[Logger] Cannot open " << filename_ << ", writing to stderr" << std::endl;
                }
            }
            std::ostream& out = file.is_open() ? static_cast<std::ostream&>(file) : std::cerr;

            LogEntry entry;
            char stamp[40];
            while (running_ || !buffer_.isEmpty()) {
                if (buffer_.pop(entry)) {
                    // Format: <timestamp> [Level] Message
                    utils::format_log_timestamp(entry.timestamp_us, stamp, sizeof(stamp));
                    out << stamp << " ";
                    switch (entry.level) {
                        case LogLevel::DEBUG: out << "[DEBUG] "; break;
                        case LogLevel::INFO: out << "[INFO] "; break;
                        case LogLevel::WARNING: out << "[WARN] "; break;
                        case LogLevel::ERROR: out << "[ERROR] "; break;
                    }
                    out << entry.message << "\n";
                } else {
                    out.flush();
                    std::this_thread::sleep_for(std::chrono::milliseconds(10));
                }
            }
            out.flush();
        }

        RingBuffer<LogEntry, 8192> buffer_; // 8192 * 320 bytes ~= 2.5MB
        std::atomic<bool> running_;
        std::atomic<LogLevel> level_;
        std::atomic<uint64_t> dropped_{0};
        std::thread thread_;
        std::string filename_;
    };

}

// Macro for easy usage
#define LOG_DEBUG(fmt, ...) tsepush::AsyncLogger::instance().log(tsepush::LogLevel::DEBUG, fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...) tsepush::AsyncLogger::instance().log(tsepush::LogLevel::INFO, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...) tsepush::AsyncLogger::instance().log(tsepush::LogLevel::WARNING, fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) tsepush::AsyncLogger::instance().log(tsepush::LogLevel::ERROR, fmt, ##__VA_ARGS__)

/**
 * tritpow Logger
 *
 * File-based logging for long-running searches and backend diagnosis.
 * Logs to ~/.tritpow/tritpow.log (or a configured directory) with timestamps
 * and rotation. Logging is a no-op until init() succeeds.
 */

#pragma once

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <string>

namespace tritpow {

class Logger {
public:
    enum class Level {
        DEBUG,
        INFO,
        WARN,
        ERR,    // Named ERR to avoid Windows ERROR macro conflict
        FATAL
    };

    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    bool init(const std::string& log_dir = "") {
        std::lock_guard<std::mutex> lock(mutex_);

        if (initialized_) {
            log_file_.close();
            initialized_ = false;
        }

        // Determine log directory
        std::string dir = log_dir;
        if (dir.empty()) {
            const char* home = nullptr;
#ifdef _WIN32
            home = std::getenv("USERPROFILE");
#else
            home = std::getenv("HOME");
#endif
            dir = home ? std::string(home) + "/.tritpow" : ".";
        }

        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            return false;
        }

        log_path_ = dir + "/tritpow.log";

        // Rotate log if too large (> 10MB)
        if (std::filesystem::exists(log_path_, ec)) {
            auto size = std::filesystem::file_size(log_path_, ec);
            if (!ec && size > 10 * 1024 * 1024) {
                std::string backup = log_path_ + ".old";
                std::filesystem::remove(backup, ec);
                std::filesystem::rename(log_path_, backup, ec);
            }
        }

        log_file_.open(log_path_, std::ios::app);
        if (!log_file_.is_open()) {
            return false;
        }

        initialized_ = true;

        // Write directly, we already hold the mutex
        log_file_ << timestamp() << " [INFO ] === tritpow logger started ===\n";
        log_file_.flush();

        return true;
    }

    void set_min_level(Level level) { min_level_ = level; }

    void log(Level level, const std::string& message) {
        if (!initialized_ || level < min_level_) return;

        std::lock_guard<std::mutex> lock(mutex_);
        log_file_ << timestamp() << " [" << level_str(level) << "] " << message << "\n";
        log_file_.flush();
    }

    void log_engine_start(const std::string& backend, int grid_width, int grid_height) {
        std::stringstream ss;
        ss << "ENGINE_START: Backend=" << backend
           << ", Grid=" << grid_width << "x" << grid_height
           << ", LanesPerRound=" << (static_cast<uint64_t>(grid_height) * 32);
        log(Level::INFO, ss.str());
    }

    void log_job_queued(uint64_t job_id, int min_weight, size_t queue_depth) {
        std::stringstream ss;
        ss << "JOB_QUEUED: Job=" << job_id << ", MWM=" << min_weight << ", Queue=" << queue_depth;
        log(Level::INFO, ss.str());
    }

    void log_job_started(uint64_t job_id, int64_t offset, uint64_t resumed_rounds) {
        std::stringstream ss;
        ss << "JOB_STARTED: Job=" << job_id << ", Offset=" << offset;
        if (resumed_rounds > 0) ss << ", ResumedAtRound=" << resumed_rounds;
        log(Level::INFO, ss.str());
    }

    void log_nonce_found(uint64_t job_id, uint64_t rounds, const std::string& nonce, double elapsed_sec) {
        std::stringstream ss;
        ss << "FOUND: Job=" << job_id << ", Rounds=" << rounds
           << ", Nonce=" << nonce
           << ", ElapsedSec=" << std::fixed << std::setprecision(3) << elapsed_sec;
        log(Level::INFO, ss.str());
    }

    void log_job_parked(uint64_t job_id, uint64_t rounds) {
        std::stringstream ss;
        ss << "JOB_PARKED: Job=" << job_id << ", Rounds=" << rounds;
        log(Level::INFO, ss.str());
    }

    void log_backend_error(const std::string& backend, const std::string& error_msg) {
        std::stringstream ss;
        ss << "BACKEND_ERROR: " << backend << " - " << error_msg;
        log(Level::ERR, ss.str());
    }

    std::string get_log_path() const { return log_path_; }

    ~Logger() {
        if (initialized_) {
            log(Level::INFO, "=== tritpow logger stopped ===");
            log_file_.close();
        }
    }

private:
    Logger() : initialized_(false), min_level_(Level::DEBUG) {}

    // Delete copy/move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    static std::string timestamp() {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::stringstream ss;
        ss << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S")
           << "." << std::setfill('0') << std::setw(3) << ms.count();
        return ss.str();
    }

    static const char* level_str(Level level) {
        switch (level) {
            case Level::DEBUG: return "DEBUG";
            case Level::INFO:  return "INFO ";
            case Level::WARN:  return "WARN ";
            case Level::ERR:   return "ERROR";
            case Level::FATAL: return "FATAL";
            default: return "?????";
        }
    }

    bool initialized_;
    Level min_level_;
    std::string log_path_;
    std::ofstream log_file_;
    std::mutex mutex_;
};

// Convenience macros
#define LOG_INFO(msg)  tritpow::Logger::instance().log(tritpow::Logger::Level::INFO, msg)
#define LOG_WARN(msg)  tritpow::Logger::instance().log(tritpow::Logger::Level::WARN, msg)
#define LOG_ERROR(msg) tritpow::Logger::instance().log(tritpow::Logger::Level::ERR, msg)
#define LOG_DEBUG(msg) tritpow::Logger::instance().log(tritpow::Logger::Level::DEBUG, msg)

}  // namespace tritpow

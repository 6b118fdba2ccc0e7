// include/basis_trade/core/logger.hpp
#pragma once

#include <atomic>
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include "basis_trade/core/config_base.hpp"

namespace basis_trade {

/**
 * @brief Log levels for different types of messages
 */
enum class LogLevel {
    TRACE,    // Detailed debug information
    DEBUG,    // General debug information
    INFO,     // General information
    WARNING,  // Warnings that don't affect operation
    ERR,      // Errors that affect operation but don't stop the run
    FATAL     // Critical errors
};

/**
 * @brief Log destination type
 */
enum class LogDestination {
    CONSOLE,
    FILE,
    BOTH
};

std::string level_to_string(LogLevel level);
std::string log_destination_to_string(LogDestination dest);

/**
 * @brief Parse a level name ("TRACE" ... "FATAL")
 * @return The matching level, or `fallback` for unknown names
 */
LogLevel level_from_string(const std::string& name, LogLevel fallback);

/**
 * @brief Configuration for the logger
 */
struct LoggerConfig : public ConfigBase {
    LogLevel min_level{LogLevel::INFO};
    LogDestination destination{LogDestination::CONSOLE};
    std::string log_directory{"logs"};
    std::string filename_prefix{"basis_trade"};
    bool include_timestamp{true};
    bool include_level{true};
    size_t max_file_size{50 * 1024 * 1024};  // 50MB
    size_t max_files{10};

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Thread-safe logging singleton
 */
class Logger {
public:
    static Logger& instance();

    /**
     * @brief Initialize the logger with configuration
     * @param config Logger configuration
     * @throws std::runtime_error if the log directory or file cannot be created
     */
    void initialize(const LoggerConfig& config);

    /**
     * @brief Reset the logger for testing
     */
    static void reset_for_tests();

    /**
     * @brief Log a message with specified level
     */
    void log(LogLevel level, const std::string& message);

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.min_level = level;
    }

    LogLevel get_min_level() const {
        return config_.min_level;
    }

    bool is_initialized() const {
        return initialized_.load(std::memory_order_acquire);
    }

    /**
     * @brief Tag subsequent messages from the calling thread with a component name
     */
    static void register_component(const std::string& component) {
        current_component_ = component;
    }

    static const std::string& current_component() {
        return current_component_;
    }

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    void open_log_file();
    void enforce_retention();
    void rotate_log_files();
    void write_to_file_unsafe(const std::string& message);
    void write_to_console_unsafe(const std::string& message);
    std::string format_message(LogLevel level, const std::string& message) const;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::ofstream log_file_;
    std::atomic<bool> initialized_{false};
    static thread_local std::string current_component_;

    std::string current_session_timestamp_;  // YYYYMMDD_HHMMSS
    int current_part_number_{1};
};

/**
 * @brief Tags the calling thread with a component until the scope ends,
 * then puts the previous tag back
 */
class ScopedLogComponent {
public:
    explicit ScopedLogComponent(const std::string& component)
        : previous_(Logger::current_component()) {
        Logger::register_component(component);
    }

    ~ScopedLogComponent() {
        Logger::register_component(previous_);
    }

    ScopedLogComponent(const ScopedLogComponent&) = delete;
    ScopedLogComponent& operator=(const ScopedLogComponent&) = delete;

private:
    std::string previous_;
};

/**
 * @brief Convenience macro for logging
 * Usage: LOG(LogLevel::INFO, "Message: " << variable)
 */
#define LOG(level, message)                                                    \
    do {                                                                       \
        if (level >= ::basis_trade::Logger::instance().get_min_level()) {      \
            std::ostringstream os;                                             \
            os << message;                                                     \
            ::basis_trade::Logger::instance().log(level, os.str());            \
        }                                                                      \
    } while (0)

#define TRACE(message) LOG(::basis_trade::LogLevel::TRACE, message)
#define DEBUG(message) LOG(::basis_trade::LogLevel::DEBUG, message)
#define INFO(message) LOG(::basis_trade::LogLevel::INFO, message)
#define WARN(message) LOG(::basis_trade::LogLevel::WARNING, message)
#define ERROR(message) LOG(::basis_trade::LogLevel::ERR, message)
#define FATAL(message) LOG(::basis_trade::LogLevel::FATAL, message)

}  // namespace basis_trade

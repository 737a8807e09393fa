#pragma once

#include <array>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>

namespace mepg {
namespace logging {

enum class LogLevel {
    TRACE = 0,  // Per-node traversal detail
    DEBUG = 1,  // Stage internals
    INFO = 2,   // Stage summaries and repairs
    WARN = 3,   // Soft constraint violations
    ERROR = 4,  // Failures
    OFF = 5     // Disable logging
};

enum class LogOutput {
    CONSOLE,  // Standard error, stdout carries the CLI summary
    FILE,
    BUFFER,   // In-memory, inspected by tests
    NONE
};

std::string log_level_to_string(LogLevel level);

/**
 * @brief Process-wide logger shared by every pipeline stage
 *
 * Lines read `<time> [LEVEL] [Component] message arg1 arg2 ...`. The logger
 * also counts emitted lines per level since the last configure() so callers
 * can report how many warnings a run produced.
 */
class Logger {
  public:
    static Logger& getInstance();

    Logger(Logger const&) = delete;
    Logger& operator=(Logger const&) = delete;

    /**
     * @brief Configure level and destination, resetting the counters
     * @param filename Log file, used only with LogOutput::FILE
     */
    void configure(LogLevel level, LogOutput output, std::string const& filename = "");

    void setComponent(std::string const& name);
    std::string getComponent() const;

    LogLevel getLevel() const noexcept { return current_level_; }
    LogOutput getOutput() const noexcept { return output_type_; }

    bool isEnabled(LogLevel level) const noexcept {
        return level >= current_level_ && level != LogLevel::OFF && output_type_ != LogOutput::NONE;
    }

    template <typename... Args>
    void log(LogLevel level, std::string const& message, Args&&... args) {
        if (!isEnabled(level)) return;

        std::ostringstream oss;
        oss << message;
        if constexpr (sizeof...(args) > 0) {
            ((oss << " " << args), ...);
        }
        writeMessage(level, oss.str());
    }

    /**
     * @brief Lines written at a level since the last configure()
     */
    size_t messageCount(LogLevel level) const;

    void flush();

    std::string getBuffer() const;
    void clearBuffer();

  private:
    Logger() = default;

    void writeMessage(LogLevel level, std::string const& line);

    LogLevel current_level_ = LogLevel::INFO;
    LogOutput output_type_ = LogOutput::CONSOLE;
    std::unique_ptr<std::ofstream> file_stream_;
    std::ostringstream buffer_;
    std::string component_name_;
    std::array<size_t, 5> counts_{};
    mutable std::mutex mutex_;
};

/**
 * @brief Sets the component tag for a scope and restores the previous one
 */
class ComponentScope {
  public:
    ComponentScope(Logger& logger, std::string const& component)
        : logger_(logger), previous_(logger.getComponent()) {
        logger_.setComponent(component);
    }
    ~ComponentScope() { logger_.setComponent(previous_); }

    ComponentScope(ComponentScope const&) = delete;
    ComponentScope& operator=(ComponentScope const&) = delete;

  private:
    Logger& logger_;
    std::string previous_;
};

#define LOG_TRACE(logger, ...)                                         \
    do {                                                               \
        if (logger.isEnabled(::mepg::logging::LogLevel::TRACE))        \
            logger.log(::mepg::logging::LogLevel::TRACE, __VA_ARGS__); \
    } while (0)

#define LOG_DEBUG(logger, ...)                                         \
    do {                                                               \
        if (logger.isEnabled(::mepg::logging::LogLevel::DEBUG))        \
            logger.log(::mepg::logging::LogLevel::DEBUG, __VA_ARGS__); \
    } while (0)

#define LOG_INFO(logger, ...)                                         \
    do {                                                              \
        if (logger.isEnabled(::mepg::logging::LogLevel::INFO))        \
            logger.log(::mepg::logging::LogLevel::INFO, __VA_ARGS__); \
    } while (0)

#define LOG_WARN(logger, ...)                                         \
    do {                                                              \
        if (logger.isEnabled(::mepg::logging::LogLevel::WARN))        \
            logger.log(::mepg::logging::LogLevel::WARN, __VA_ARGS__); \
    } while (0)

#define LOG_ERROR(logger, ...)                                         \
    do {                                                               \
        if (logger.isEnabled(::mepg::logging::LogLevel::ERROR))        \
            logger.log(::mepg::logging::LogLevel::ERROR, __VA_ARGS__); \
    } while (0)

extern Logger& global_logger;

}  // namespace logging
}  // namespace mepg

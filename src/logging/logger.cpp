#include "mepg/logging/logger.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace mepg {
namespace logging {

namespace {

std::string timestamp() {
    auto const now = std::chrono::system_clock::now();
    auto const seconds = std::chrono::system_clock::to_time_t(now);
    auto const ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::ostringstream oss;
    oss << std::put_time(std::localtime(&seconds), "%Y-%m-%d %H:%M:%S") << "." << std::setfill('0')
        << std::setw(3) << ms;
    return oss.str();
}

}  // namespace

std::string log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:
            return "TRACE";
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::WARN:
            return "WARN";
        case LogLevel::ERROR:
            return "ERROR";
        case LogLevel::OFF:
            return "OFF";
        default:
            return "UNKNOWN";
    }
}

Logger& global_logger = Logger::getInstance();

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::configure(LogLevel level, LogOutput output, std::string const& filename) {
    std::lock_guard<std::mutex> lock(mutex_);

    current_level_ = level;
    output_type_ = output;
    counts_.fill(0);
    file_stream_.reset();

    if (output != LogOutput::FILE) return;

    std::string const path = filename.empty() ? "mepg.log" : filename;
    file_stream_ = std::make_unique<std::ofstream>(path, std::ios::app);
    if (!file_stream_->is_open()) {
        file_stream_.reset();
        output_type_ = LogOutput::CONSOLE;
        std::cerr << "Warning: Cannot open log file '" << path
                  << "', falling back to console output" << std::endl;
    }
}

void Logger::setComponent(std::string const& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    component_name_ = name;
}

std::string Logger::getComponent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return component_name_;
}

size_t Logger::messageCount(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto const index = static_cast<size_t>(level);
    return index < counts_.size() ? counts_[index] : 0;
}

void Logger::writeMessage(LogLevel level, std::string const& line) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::ostringstream formatted;
    formatted << timestamp() << " [" << log_level_to_string(level) << "]";
    if (!component_name_.empty()) {
        formatted << " [" << component_name_ << "]";
    }
    formatted << " " << line;

    switch (output_type_) {
        case LogOutput::CONSOLE:
            std::cerr << formatted.str() << std::endl;
            break;
        case LogOutput::FILE:
            *file_stream_ << formatted.str() << '\n';
            break;
        case LogOutput::BUFFER:
            buffer_ << formatted.str() << '\n';
            break;
        case LogOutput::NONE:
            return;
    }
    ++counts_[static_cast<size_t>(level)];
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_stream_) {
        file_stream_->flush();
    } else if (output_type_ == LogOutput::CONSOLE) {
        std::cerr.flush();
    }
}

std::string Logger::getBuffer() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_.str();
}

void Logger::clearBuffer() {
    std::lock_guard<std::mutex> lock(mutex_);
    buffer_.str("");
    buffer_.clear();
}

}  // namespace logging
}  // namespace mepg

#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

#include "mepg/logging/logger.h"

namespace mepg {
namespace logging {

/**
 * @brief Logging presets for the generator, its tests and embedding code
 */
class LogConfig {
  public:
    // DEBUG to the console, used by the CLI in verbose mode
    static void forDevelopment() { Logger::getInstance().configure(LogLevel::DEBUG, LogOutput::CONSOLE); }

    // INFO into the in-memory buffer
    static void forTesting() { Logger::getInstance().configure(LogLevel::INFO, LogOutput::BUFFER); }

    static void forProduction(std::string const& logfile = "mepg.log") {
        Logger::getInstance().configure(LogLevel::WARN, LogOutput::FILE, logfile);
    }

    static void forQuiet() { Logger::getInstance().configure(LogLevel::OFF, LogOutput::NONE); }

    /**
     * @brief Parse a level name, case insensitive; WARNING is accepted for WARN
     * @return fallback when the name is not recognized
     */
    static LogLevel parseLevel(std::string const& level_str, LogLevel fallback = LogLevel::INFO) {
        auto const name = upper(level_str);
        if (name == "TRACE") return LogLevel::TRACE;
        if (name == "DEBUG") return LogLevel::DEBUG;
        if (name == "INFO") return LogLevel::INFO;
        if (name == "WARN" || name == "WARNING") return LogLevel::WARN;
        if (name == "ERROR") return LogLevel::ERROR;
        if (name == "OFF") return LogLevel::OFF;
        return fallback;
    }

    static LogOutput parseOutput(std::string const& output_str,
                                 LogOutput fallback = LogOutput::CONSOLE) {
        auto const name = upper(output_str);
        if (name == "CONSOLE") return LogOutput::CONSOLE;
        if (name == "FILE") return LogOutput::FILE;
        if (name == "BUFFER") return LogOutput::BUFFER;
        if (name == "NONE") return LogOutput::NONE;
        return fallback;
    }

    /**
     * @brief Configure from MEPG_LOG_LEVEL, MEPG_LOG_OUTPUT and MEPG_LOG_FILE
     * @param default_level Level used when MEPG_LOG_LEVEL is unset or unknown
     */
    static void fromEnvironment(LogLevel default_level = LogLevel::WARN) {
        char const* level_env = std::getenv("MEPG_LOG_LEVEL");
        char const* output_env = std::getenv("MEPG_LOG_OUTPUT");
        char const* file_env = std::getenv("MEPG_LOG_FILE");

        LogLevel const level = level_env ? parseLevel(level_env, default_level) : default_level;
        LogOutput const output = output_env ? parseOutput(output_env) : LogOutput::CONSOLE;
        Logger::getInstance().configure(level, output, file_env ? file_env : "mepg.log");
    }

  private:
    static std::string upper(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return text;
    }
};

}  // namespace logging
}  // namespace mepg

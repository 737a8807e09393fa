#include "mepg/logging/log_config.h"
#include "mepg/logging/logger.h"

#include "test_framework.h"

using namespace mepg::logging;

void test_log_level_parsing() {
    ASSERT_TRUE(LogConfig::parseLevel("DEBUG") == LogLevel::DEBUG);
    ASSERT_TRUE(LogConfig::parseLevel("debug") == LogLevel::DEBUG);
    ASSERT_TRUE(LogConfig::parseLevel("Warning") == LogLevel::WARN);
    ASSERT_TRUE(LogConfig::parseLevel("OFF") == LogLevel::OFF);
    ASSERT_TRUE(LogConfig::parseLevel("verbose", LogLevel::WARN) == LogLevel::WARN);
    ASSERT_TRUE(LogConfig::parseOutput("buffer") == LogOutput::BUFFER);
    ASSERT_TRUE(LogConfig::parseOutput("syslog") == LogOutput::CONSOLE);
    ASSERT_EQ("WARN", log_level_to_string(LogLevel::WARN));
}

void test_buffered_logging() {
    auto& logger = Logger::getInstance();
    LogConfig::forTesting();
    logger.clearBuffer();
    {
        ComponentScope scope(logger, "GraphBuilder");
        LOG_INFO(logger, "Built graph with", 10, "nodes");
        LOG_DEBUG(logger, "Below the configured level");
    }

    auto const buffer = logger.getBuffer();
    ASSERT_TRUE(buffer.find("[INFO] [GraphBuilder] Built graph with 10 nodes") != std::string::npos);
    ASSERT_TRUE(buffer.find("Below the configured level") == std::string::npos);

    logger.clearBuffer();
    LogConfig::forQuiet();
    LOG_ERROR(logger, "Dropped");
    ASSERT_TRUE(logger.getBuffer().empty());
}

void test_component_scope_restores_previous() {
    auto& logger = Logger::getInstance();
    logger.setComponent("Outer");
    {
        ComponentScope outer(logger, "TopologySynthesizer");
        {
            ComponentScope inner(logger, "VoltagePropagator");
            ASSERT_EQ("VoltagePropagator", logger.getComponent());
        }
        ASSERT_EQ("TopologySynthesizer", logger.getComponent());
    }
    ASSERT_EQ("Outer", logger.getComponent());
    logger.setComponent("");
}

void test_message_counts() {
    auto& logger = Logger::getInstance();
    LogConfig::forTesting();

    LOG_WARN(logger, "No panelboard available for", "load_001");
    LOG_WARN(logger, "Transformer", "transformer_001", "feeds transformer", "transformer_002");
    LOG_INFO(logger, "Repaired feed of", "load_002");
    LOG_DEBUG(logger, "Not emitted");

    ASSERT_EQ(2u, logger.messageCount(LogLevel::WARN));
    ASSERT_EQ(1u, logger.messageCount(LogLevel::INFO));
    ASSERT_EQ(0u, logger.messageCount(LogLevel::DEBUG));

    LogConfig::forQuiet();
    ASSERT_EQ(0u, logger.messageCount(LogLevel::WARN));
    logger.clearBuffer();
}

void register_logging_tests(TestRunner& runner) {
    runner.add_test("Log Level Parsing", test_log_level_parsing);
    runner.add_test("Buffered Logging", test_buffered_logging);
    runner.add_test("Component Scope Restores Previous", test_component_scope_restores_previous);
    runner.add_test("Message Counts", test_message_counts);
}

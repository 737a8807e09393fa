#include <iostream>

#include "mepg/logging/log_config.h"

#include "test_framework.h"

// Forward declarations of test registration functions
void register_logging_tests(TestRunner& runner);
void register_building_profile_tests(TestRunner& runner);
void register_core_strategy_tests(TestRunner& runner);
void register_requirement_analyzer_tests(TestRunner& runner);
void register_node_decision_planner_tests(TestRunner& runner);
void register_graph_tests(TestRunner& runner);
void register_voltage_propagator_tests(TestRunner& runner);
void register_constraint_validator_tests(TestRunner& runner);
void register_risk_scorer_tests(TestRunner& runner);
void register_io_tests(TestRunner& runner);

int main(int argc, char* argv[]) {
    mepg::logging::LogConfig::forQuiet();

    TestRunner runner;
    if (argc > 1) runner.set_filter(argv[1]);

    // Register all test suites
    register_logging_tests(runner);
    register_building_profile_tests(runner);
    register_core_strategy_tests(runner);
    register_requirement_analyzer_tests(runner);
    register_node_decision_planner_tests(runner);
    register_graph_tests(runner);
    register_voltage_propagator_tests(runner);
    register_constraint_validator_tests(runner);
    register_risk_scorer_tests(runner);
    register_io_tests(runner);

    // Run all tests
    runner.run_all();

    return runner.get_failed_count();
}

#include "mepg/logging/log_config.h"

#include "../unit/test_framework.h"

// Forward declarations of test registration functions
void register_validation_tests(TestRunner& runner);

int main(int argc, char* argv[]) {
    std::cout << "MEPG Electrical Topology Synthesizer - Validation Tests\n" << std::endl;

    mepg::logging::LogConfig::forQuiet();

    TestRunner runner;
    if (argc > 1) runner.set_filter(argv[1]);

    // Register validation test suites
    register_validation_tests(runner);

    // Run all tests
    runner.run_all();

    return runner.get_failed_count();
}

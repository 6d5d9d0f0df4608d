#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <iostream>

// Test categories can be run individually using:
// ./unit_tests --gtest_filter="CalculatorTest*"
// ./unit_tests --gtest_filter="MetricsPipelineTest*"
// etc.

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    std::cout << "Running GaitKeeper Test Suite" << std::endl;
    std::cout << "=============================" << std::endl;

    // Pipeline and service chatter is not useful in test output
    spdlog::set_level(spdlog::level::warn);

    int result = RUN_ALL_TESTS();

    if (result == 0) {
        std::cout << "\nAll tests passed!" << std::endl;
    } else {
        std::cout << "\nTests failed!" << std::endl;
    }

    return result;
}

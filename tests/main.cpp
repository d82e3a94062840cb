#include <gtest/gtest.h>
#include <iostream>

#include "core/Logger.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    // Keep mode/gesture chatter out of the test report
    core::Logger::setLevel(core::LogLevel::WARN);

    std::cout << "=== HandParticles Test Suite ===" << std::endl;

    return RUN_ALL_TESTS();
}

#include <gtest/gtest.h>
#include <iostream>

#include "logger.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    // no sinks: library logging stays out of the test output
    Logger::clear_sinks();

    return RUN_ALL_TESTS();
}

#include <gtest/gtest.h>
#include "common/logger.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    Logger::setConsoleOutput(false);
    return RUN_ALL_TESTS();
}

/**
 * @file test_main.cpp
 * @brief GoogleTest main entry point
 *
 * Build: cmake --build . --target patchmaker_tests
 * Run:   ./patchmaker_tests
 */

#include <gtest/gtest.h>

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

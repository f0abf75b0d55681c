/**
 * @file test_main.cpp
 * @brief GoogleTest main entry point
 *
 * Suites register themselves through TEST(); the options loader suite is a
 * separate Catch2 binary (paramtree_config_tests).
 *
 * Build: cmake --build . --target paramtree_tests
 * Run:   ./paramtree_tests
 *
 * @copyright (c) 2026. MIT License.
 */

#include <gtest/gtest.h>

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

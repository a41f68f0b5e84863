/**
 * @file test_main.cpp
 * @brief Google Test entry point for the DocRecon unit tests
 */

#include <gtest/gtest.h>
#include <iostream>

int main(int argc, char** argv) {
    std::cout << "========================================" << std::endl;
    std::cout << "DocRecon - Unit Tests" << std::endl;
    std::cout << "========================================" << std::endl;

    ::testing::InitGoogleTest(&argc, argv);

    return RUN_ALL_TESTS();
}

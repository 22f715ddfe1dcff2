/**
 * @file test_main.cpp
 * @brief Google Test entry point for the core library tests
 */

#include <gtest/gtest.h>
#include <iostream>

int main(int argc, char** argv) {
    std::cout << "========================================" << std::endl;
    std::cout << "Passport OCR Core - Unit Tests" << std::endl;
    std::cout << "========================================" << std::endl;

    ::testing::InitGoogleTest(&argc, argv);

    return RUN_ALL_TESTS();
}

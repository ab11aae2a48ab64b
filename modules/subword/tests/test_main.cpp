/**
 * @file test_main.cpp
 * @brief Test runner entry point
 */

#include "test_precomp.hpp"

#include <opencv2/core/utils/logger.hpp>

int main(int argc, char** argv) {
    cv::utils::logging::setLogLevel(cv::utils::logging::LOG_LEVEL_WARNING);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

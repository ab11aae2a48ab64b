/**
 * @file precomp.hpp
 * @brief Common includes for the subword module sources
 */

#ifndef OPENCV_SUBWORD_PRECOMP_HPP
#define OPENCV_SUBWORD_PRECOMP_HPP

#include <opencv2/core.hpp>
#include <opencv2/core/utils/logger.hpp>
#include <opencv2/subword.hpp>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#endif // OPENCV_SUBWORD_PRECOMP_HPP

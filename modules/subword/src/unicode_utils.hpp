/**
 * @file unicode_utils.hpp
 * @brief UTF-8 validation and character splitting
 */

#ifndef OPENCV_SUBWORD_UNICODE_UTILS_HPP
#define OPENCV_SUBWORD_UNICODE_UTILS_HPP

#include <string>
#include <vector>

namespace cv {
namespace subword {

/** @brief Byte written after every span in character-level modes; never valid in UTF-8 */
const char END_OF_WORD = '\xFF';

/** @brief Display form of END_OF_WORD */
const char* const END_OF_WORD_DISPLAY = "</w>";

/** @brief True when the whole string is well-formed UTF-8 */
bool isValidUtf8(const std::string& text);

/**
 * @brief Throws ERR_INVALID_INPUT when the string is not well-formed UTF-8
 * @param text Text to check
 * @param context Short description used in the error message
 */
void checkUtf8(const std::string& text, const char* context);

/**
 * @brief Byte length of the UTF-8 character starting at pos
 * @return 0 when the bytes at pos do not form a valid character
 */
size_t utf8CharLength(const std::string& text, size_t pos);

/** @brief Splits well-formed UTF-8 into single characters */
std::vector<std::string> splitUtf8(const std::string& text);

/** @brief Number of characters in well-formed UTF-8 */
size_t utf8Length(const std::string& text);

}} // namespace cv::subword

#endif // OPENCV_SUBWORD_UNICODE_UTILS_HPP

/**
 * @file byte_level.hpp
 * @brief Reversible byte <-> printable character mapping
 *
 * Every byte value 0-255 is assigned one printable, non-whitespace Unicode
 * character. Printable Latin-1 characters map to themselves, with the
 * exception of the quote and backslash characters; all remaining bytes are
 * shifted to code points starting at U+0100. The mapping is used only to
 * render token content readably (token display and model files), never to
 * decide segmentation.
 */

#ifndef OPENCV_SUBWORD_BYTE_LEVEL_HPP
#define OPENCV_SUBWORD_BYTE_LEVEL_HPP

#include <string>
#include <vector>

namespace cv {
namespace subword {

/** @brief Code point assigned to each byte value */
const std::vector<int>& byteToCodePoint();

/** @brief Renders raw bytes as a UTF-8 string of display characters */
std::string bytesToDisplay(const std::string& bytes);

/**
 * @brief Inverse of bytesToDisplay
 * @param display UTF-8 display string
 * @param bytes Receives the raw bytes
 * @return false if the input holds a character outside the display alphabet
 */
bool displayToBytes(const std::string& display, std::string& bytes);

}} // namespace cv::subword

#endif // OPENCV_SUBWORD_BYTE_LEVEL_HPP

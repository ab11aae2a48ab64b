/**
 * @file unicode_utils.cpp
 * @brief UTF-8 validation and character splitting
 */

#include "precomp.hpp"
#include "unicode_utils.hpp"

#include <unicode/utf8.h>

namespace cv {
namespace subword {

bool isValidUtf8(const std::string& text) {
    const uint8_t* s = reinterpret_cast<const uint8_t*>(text.data());
    const int32_t length = static_cast<int32_t>(text.size());
    int32_t i = 0;
    while (i < length) {
        UChar32 c;
        U8_NEXT(s, i, length, c);
        if (c < 0) {
            return false;
        }
    }
    return true;
}

void checkUtf8(const std::string& text, const char* context) {
    if (!isValidUtf8(text)) {
        CV_Error(ERR_INVALID_INPUT, cv::format("Malformed UTF-8 in %s", context));
    }
}

size_t utf8CharLength(const std::string& text, size_t pos) {
    if (pos >= text.size()) {
        return 0;
    }
    const uint8_t* s = reinterpret_cast<const uint8_t*>(text.data());
    const int32_t length = static_cast<int32_t>(text.size());
    int32_t i = static_cast<int32_t>(pos);
    UChar32 c;
    U8_NEXT(s, i, length, c);
    if (c < 0) {
        return 0;
    }
    return static_cast<size_t>(i) - pos;
}

std::vector<std::string> splitUtf8(const std::string& text) {
    std::vector<std::string> chars;
    chars.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        size_t len = utf8CharLength(text, pos);
        if (len == 0) {
            CV_Error(ERR_INVALID_INPUT, "Malformed UTF-8 sequence");
        }
        chars.push_back(text.substr(pos, len));
        pos += len;
    }
    return chars;
}

size_t utf8Length(const std::string& text) {
    const uint8_t* s = reinterpret_cast<const uint8_t*>(text.data());
    const int32_t length = static_cast<int32_t>(text.size());
    size_t count = 0;
    int32_t i = 0;
    while (i < length) {
        U8_FWD_1(s, i, length);
        ++count;
    }
    return count;
}

}} // namespace cv::subword

/**
 * @file byte_level.cpp
 * @brief Byte to printable code point mapping used for display and persistence
 */

#include "precomp.hpp"
#include "byte_level.hpp"

#include <unicode/utf8.h>

namespace cv {
namespace subword {

namespace {

bool isSelfMapped(int b) {
    if (b == '"' || b == '\'' || b == '\\') {
        return false;
    }
    return (b >= '!' && b <= '~') || (b >= 0xA1 && b <= 0xAC) || (b >= 0xAE && b <= 0xFF);
}

std::vector<int> buildByteTable() {
    std::vector<int> table(256);
    int shifted = 0;
    for (int b = 0; b < 256; ++b) {
        table[b] = isSelfMapped(b) ? b : 256 + shifted++;
    }
    return table;
}

std::unordered_map<UChar32, unsigned char> buildReverseTable() {
    const std::vector<int>& forward = byteToCodePoint();
    std::unordered_map<UChar32, unsigned char> reverse;
    for (int b = 0; b < 256; ++b) {
        reverse.emplace(forward[b], static_cast<unsigned char>(b));
    }
    return reverse;
}

} // namespace

const std::vector<int>& byteToCodePoint() {
    static const std::vector<int> table = buildByteTable();
    return table;
}

std::string bytesToDisplay(const std::string& bytes) {
    const std::vector<int>& table = byteToCodePoint();
    std::string out;
    out.reserve(bytes.size() * 2);
    for (unsigned char b : bytes) {
        uint8_t buf[U8_MAX_LENGTH];
        int32_t len = 0;
        U8_APPEND_UNSAFE(buf, len, table[b]);
        out.append(reinterpret_cast<const char*>(buf), len);
    }
    return out;
}

bool displayToBytes(const std::string& display, std::string& bytes) {
    static const std::unordered_map<UChar32, unsigned char> reverse = buildReverseTable();
    const uint8_t* s = reinterpret_cast<const uint8_t*>(display.data());
    const int32_t length = static_cast<int32_t>(display.size());
    std::string out;
    out.reserve(display.size());
    int32_t i = 0;
    while (i < length) {
        UChar32 c;
        U8_NEXT(s, i, length, c);
        if (c < 0) {
            return false;
        }
        auto it = reverse.find(c);
        if (it == reverse.end()) {
            return false;
        }
        out.push_back(static_cast<char>(it->second));
    }
    bytes.swap(out);
    return true;
}

}} // namespace cv::subword

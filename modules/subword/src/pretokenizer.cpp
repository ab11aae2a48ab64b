/**
 * @file pretokenizer.cpp
 * @brief ICU regular expression pretokenization
 */

#include "precomp.hpp"
#include "pretokenizer.hpp"

#include <unicode/utext.h>

namespace cv {
namespace subword {

namespace {

struct UTextDeleter {
    void operator()(UText* text) const { utext_close(text); }
};

typedef std::unique_ptr<UText, UTextDeleter> UTextPtr;

} // namespace

String defaultPretokenizePattern() {
    return "'(?i:[sdmt]|ll|ve|re)|[^\\r\\n\\p{L}\\p{N}]?+\\p{L}+|\\p{N}{1,3}"
           "| ?[^\\s\\p{L}\\p{N}]++[\\r\\n]*|\\s*[\\r\\n]|\\s+(?!\\S)|\\s+";
}

Pretokenizer::Pretokenizer(const String& pattern)
    : pattern_(pattern) {
    if (pattern_.empty()) {
        return;
    }

    UErrorCode status = U_ZERO_ERROR;
    UParseError parseError;
    regex_.reset(icu::RegexPattern::compile(icu::UnicodeString::fromUTF8(pattern_), 0, parseError, status));
    if (U_FAILURE(status) || !regex_) {
        regex_.reset();
        CV_Error(Error::StsBadArg, cv::format("Invalid pretokenization pattern at offset %d: %s",
                                              parseError.offset, u_errorName(status)));
    }
}

void Pretokenizer::split(const std::string& text, std::vector<std::string>& spans) const {
    if (text.empty()) {
        return;
    }
    if (!regex_) {
        spans.push_back(text);
        return;
    }

    UErrorCode status = U_ZERO_ERROR;
    UTextPtr input(utext_openUTF8(NULL, text.data(), static_cast<int64_t>(text.size()), &status));
    std::unique_ptr<icu::RegexMatcher> matcher(regex_->matcher(status));
    if (U_FAILURE(status)) {
        CV_Error(Error::StsError, cv::format("Could not create regex matcher: %s", u_errorName(status)));
    }
    matcher->reset(input.get());

    // Native indices of a UTF-8 UText are byte offsets
    size_t last = 0;
    while (matcher->find()) {
        const int64_t start = matcher->start64(status);
        const int64_t end = matcher->end64(status);
        if (U_FAILURE(status)) {
            CV_Error(Error::StsError, cv::format("Regex matching failed: %s", u_errorName(status)));
        }
        if (static_cast<size_t>(start) > last) {
            spans.push_back(text.substr(last, static_cast<size_t>(start) - last));
        }
        if (end > start) {
            spans.push_back(text.substr(static_cast<size_t>(start), static_cast<size_t>(end - start)));
        }
        last = static_cast<size_t>(end);
    }
    if (last < text.size()) {
        spans.push_back(text.substr(last));
    }
}

}} // namespace cv::subword

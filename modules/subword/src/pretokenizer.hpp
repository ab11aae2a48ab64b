/**
 * @file pretokenizer.hpp
 * @brief Regular-expression splitter turning raw text into word-like spans
 */

#ifndef OPENCV_SUBWORD_PRETOKENIZER_HPP
#define OPENCV_SUBWORD_PRETOKENIZER_HPP

#include <opencv2/core.hpp>
#include <unicode/regex.h>

#include <memory>
#include <string>
#include <vector>

namespace cv {
namespace subword {

/**
 * @brief Splits text into spans with an ICU regular expression
 *
 * Text between matches is kept as separate spans, so concatenating the spans
 * always reproduces the input. An empty pattern yields the whole text as one
 * span. split() may be called from several threads at once.
 */
class Pretokenizer {
public:
    /**
     * @brief Compiles the pattern
     * @param pattern ICU regular expression; an empty string disables splitting
     */
    explicit Pretokenizer(const String& pattern);

    /**
     * @brief Appends the spans of the text to the output
     * @param text Well-formed UTF-8 text
     * @param spans Output span list
     */
    void split(const std::string& text, std::vector<std::string>& spans) const;

    const String& pattern() const { return pattern_; }

private:
    String pattern_;
    std::unique_ptr<icu::RegexPattern> regex_;
};

}} // namespace cv::subword

#endif // OPENCV_SUBWORD_PRETOKENIZER_HPP

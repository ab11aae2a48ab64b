/**
 * @file bbpe_tokenizer.hpp
 * @brief Byte-level Byte-Pair Encoding tokenizer
 */

#ifndef OPENCV_SUBWORD_BBPE_TOKENIZER_HPP
#define OPENCV_SUBWORD_BBPE_TOKENIZER_HPP

#include "bpe_tokenizer.hpp"

namespace cv {
namespace subword {

/**
 * @brief BPE over raw bytes
 *
 * Identifiers 0-255 are the single bytes, so any input can be encoded
 * without an unknown token, including before training. Token text is shown
 * in the byte-level display alphabet.
 */
class BBPETokenizer : public BPETokenizer {
public:
    explicit BBPETokenizer(const TokenizerParams& params);

    TokenizerType getType() const override { return TOKENIZER_BBPE; }

protected:
    const char* typeName() const override { return "bbpe"; }
    SymbolUnit symbolUnit() const override { return UNIT_BYTE; }
    bool usesEndOfWord() const override { return false; }
    bool usesUnkToken() const override { return false; }

    std::vector<std::string> buildAlphabet(const std::vector<SpanCount>& spans) const override;
    void encodeSpan(const std::string& span, std::vector<int>& ids) const override;
    void onModelChanged() override;

    std::string toDisplay(const std::string& content) const override;
    bool fromDisplay(const std::string& text, std::string& content) const override;

private:
    int byteIds_[256];
};

}} // namespace cv::subword

#endif // OPENCV_SUBWORD_BBPE_TOKENIZER_HPP

/**
 * @file wordpiece_tokenizer.hpp
 * @brief WordPiece tokenizer with likelihood-driven training
 */

#ifndef OPENCV_SUBWORD_WORDPIECE_TOKENIZER_HPP
#define OPENCV_SUBWORD_WORDPIECE_TOKENIZER_HPP

#include "tokenizer_base.hpp"

namespace cv {
namespace subword {

/**
 * @brief Implementation of WordPiece tokenizer
 *
 * Training merges the pair with the highest
 * freq(pair) / (freq(first) * freq(second)) ratio, keeping symbol
 * frequencies up to date after each merge. Encoding is greedy longest match
 * over the vocabulary trie; a position no entry covers yields the unknown
 * token and advances one character.
 */
class WordPieceTokenizer : public TokenizerBase {
public:
    /**
     * @brief Constructor for WordPiece tokenizer
     * @param params Configuration
     */
    explicit WordPieceTokenizer(const TokenizerParams& params);

    TokenizerType getType() const override { return TOKENIZER_WORDPIECE; }

protected:
    const char* typeName() const override { return "wordpiece"; }
    bool usesEndOfWord() const override { return true; }

    void learn(const std::vector<SpanCount>& spans,
               const std::vector<std::string>& alphabet,
               size_t targetSize,
               Model& model,
               TrainReport& report) const override;

    void encodeSpan(const std::string& span, std::vector<int>& ids) const override;
    void onModelChanged() override;

private:
    Trie vocab_;
};

}} // namespace cv::subword

#endif // OPENCV_SUBWORD_WORDPIECE_TOKENIZER_HPP

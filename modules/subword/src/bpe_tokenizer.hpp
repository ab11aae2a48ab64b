/**
 * @file bpe_tokenizer.hpp
 * @brief Character-level Byte-Pair Encoding tokenizer
 */

#ifndef OPENCV_SUBWORD_BPE_TOKENIZER_HPP
#define OPENCV_SUBWORD_BPE_TOKENIZER_HPP

#include "tokenizer_base.hpp"

#include <unordered_map>
#include <vector>

namespace cv {
namespace subword {

/**
 * @brief Implementation of Byte-Pair Encoding (BPE) over UTF-8 characters
 *
 * Training repeatedly merges the most frequent adjacent symbol pair. Every
 * span ends with an end-of-word symbol, so merges never cross span
 * boundaries. Encoding replays the learned rules in rank order; characters
 * absent from the vocabulary become the unknown token.
 */
class BPETokenizer : public TokenizerBase {
public:
    /**
     * @brief Constructor for BPE tokenizer
     * @param params Configuration
     */
    explicit BPETokenizer(const TokenizerParams& params);

    TokenizerType getType() const override { return TOKENIZER_BPE; }

protected:
    const char* typeName() const override { return "bpe"; }
    bool usesEndOfWord() const override { return true; }

    void learn(const std::vector<SpanCount>& spans,
               const std::vector<std::string>& alphabet,
               size_t targetSize,
               Model& model,
               TrainReport& report) const override;

    void encodeSpan(const std::string& span, std::vector<int>& ids) const override;
    void onModelChanged() override;

    /** @brief Applies the learned rules to initial symbol ids, lowest rank first */
    void applyMerges(std::vector<int>& ids) const;

private:
    struct RankedMerge {
        int rank;
        int merged;
    };

    // (left, right) -> rule rank and result
    std::unordered_map<SymbolPair, RankedMerge, SymbolPairHash> merges_;
    int endOfWordId_;
};

}} // namespace cv::subword

#endif // OPENCV_SUBWORD_BPE_TOKENIZER_HPP

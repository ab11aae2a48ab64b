/**
 * @file unigram_tokenizer.hpp
 * @brief Unigram language-model tokenizer
 */

#ifndef OPENCV_SUBWORD_UNIGRAM_TOKENIZER_HPP
#define OPENCV_SUBWORD_UNIGRAM_TOKENIZER_HPP

#include "tokenizer_base.hpp"

namespace cv {
namespace subword {

/**
 * @brief Implementation of Unigram tokenizer
 *
 * Each vocabulary entry carries a log-probability. Encoding picks the
 * segmentation of every span with the highest summed log-probability
 * (Viterbi over the span lattice). Characters absent from the vocabulary
 * are covered by the unknown token, scored below every real piece.
 */
class UnigramTokenizer : public TokenizerBase {
public:
    /**
     * @brief Constructor for an untrained Unigram tokenizer
     * @param params Configuration
     */
    explicit UnigramTokenizer(const TokenizerParams& params);

    /**
     * @brief Constructor from a scored vocabulary
     * @param pieces Vocabulary entries, well-formed UTF-8 and unique
     * @param logProbs Log-probability of each entry
     * @param params Configuration
     */
    UnigramTokenizer(const std::vector<String>& pieces,
                     const std::vector<double>& logProbs,
                     const TokenizerParams& params);

    TokenizerType getType() const override { return TOKENIZER_UNIGRAM; }

protected:
    const char* typeName() const override { return "unigram"; }
    bool seedsByMerging() const override { return false; }

    void learn(const std::vector<SpanCount>& spans,
               const std::vector<std::string>& alphabet,
               size_t targetSize,
               Model& model,
               TrainReport& report) const override;

    void encodeSpan(const std::string& span, std::vector<int>& ids) const override;
    void onModelChanged() override;

private:
    Trie pieces_;
    double unkScore_;
};

}} // namespace cv::subword

#endif // OPENCV_SUBWORD_UNIGRAM_TOKENIZER_HPP

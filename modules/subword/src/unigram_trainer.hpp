/**
 * @file unigram_trainer.hpp
 * @brief EM training with loss-based pruning for Unigram vocabularies
 */

#ifndef OPENCV_SUBWORD_UNIGRAM_TRAINER_HPP
#define OPENCV_SUBWORD_UNIGRAM_TRAINER_HPP

#include <opencv2/subword.hpp>

#include <string>
#include <vector>

#include "corpus_scanner.hpp"
#include "trie.hpp"

namespace cv {
namespace subword {

/** @brief Scored pieces produced by UnigramTrainer, ordered by decreasing log-probability */
struct UnigramPieces {
    std::vector<std::string> pieces;
    std::vector<double> logProbs;
    TrainStatus status;
    size_t rounds;
};

/**
 * @brief Shrinks a seed vocabulary to the target size by expectation-maximization
 *
 * Each round runs a few E-steps (parallel Viterbi segmentation of every span,
 * counting piece usages) and M-steps (log(usage / total)), then removes the
 * multi-character pieces whose removal costs the least likelihood. The loss
 * of a piece is usage * (logp(piece) - best score of its own content without
 * it). Single characters and seeded pieces are never removed.
 */
class UnigramTrainer {
public:
    explicit UnigramTrainer(const TokenizerParams& params);

    /**
     * @brief Trains the vocabulary
     * @param spans Counted corpus spans
     * @param alphabet Sorted single characters, all of which are kept
     * @param seeds Multi-character pieces that are kept as well
     * @param targetPieces Requested number of pieces
     */
    UnigramPieces train(const std::vector<SpanCount>& spans,
                        const std::vector<std::string>& alphabet,
                        const std::vector<std::string>& seeds,
                        size_t targetPieces);

private:
    void seed(const std::vector<SpanCount>& spans,
              const std::vector<std::string>& alphabet,
              const std::vector<std::string>& seeds);
    void rebuildTrie();
    std::vector<int64_t> expectation(const std::vector<SpanCount>& spans, double& logLikelihood) const;
    void maximization(const std::vector<int64_t>& usage);
    std::vector<double> pruningLoss(const std::vector<int64_t>& usage) const;
    void prune(const std::vector<double>& loss, size_t count);

    TokenizerParams params_;
    std::vector<std::string> pieces_;
    std::vector<double> logProbs_;
    std::vector<bool> pinned_;  //!< Never pruned
    Trie trie_;
};

}} // namespace cv::subword

#endif // OPENCV_SUBWORD_UNIGRAM_TRAINER_HPP

/**
 * @file merge_trainer.hpp
 * @brief Pair-merge training loop shared by BPE, BBPE and WordPiece
 */

#ifndef OPENCV_SUBWORD_MERGE_TRAINER_HPP
#define OPENCV_SUBWORD_MERGE_TRAINER_HPP

#include <opencv2/subword.hpp>

#include <queue>
#include <unordered_map>
#include <vector>

#include "corpus_scanner.hpp"
#include "symbol_table.hpp"

namespace cv {
namespace subword {

/** @brief Score used to rank merge candidates */
enum MergeObjective {
    MERGE_BY_FREQUENCY,  //!< freq(pair)
    MERGE_BY_LIKELIHOOD  //!< freq(pair) / (freq(first) * freq(second))
};

/** @brief Output of a merge training run */
struct MergeResult {
    std::vector<MergeRule> rules;  //!< Rules in the order they were learned
    std::vector<double> scores;    //!< One score per symbol of the final table
    TrainStatus status;
    size_t rounds;
};

/**
 * @brief Greedy merge trainer with incremental pair bookkeeping
 *
 * Pair counts and the words holding each pair are built once, in parallel.
 * After every merge only the words that contain the merged pair are
 * rewritten and only their neighbour pairs are updated. Candidates live in
 * an arena of MergeJob records ordered by a max-heap; a job is trusted only
 * if it is the latest one issued for its pair and its score still matches
 * the current counts, otherwise it is discarded or re-issued.
 *
 * Ties are broken by the smaller (first, second) identifier pair.
 */
class MergeTrainer {
public:
    MergeTrainer(MergeObjective objective, size_t minPairFrequency, int numThreads);

    /**
     * @brief Runs merges until the table holds targetSymbols distinct symbols
     * @param symbols Initial alphabet; merged symbols are appended to it
     * @param words Initial symbol sequences; rewritten in place
     * @param targetSymbols Requested number of distinct symbols
     */
    MergeResult train(SymbolTable& symbols, std::vector<Word>& words, size_t targetSymbols);

private:
    struct MergeJob {
        SymbolPair pair;
        double score;
    };

    struct PairState {
        int64_t count;
        size_t latestJob;
        std::vector<size_t> words;  //!< May hold stale or repeated entries
    };

    struct JobOrder {
        const std::vector<MergeJob>* jobs;
        bool operator()(size_t lhs, size_t rhs) const;
    };

    void countPairs(const std::vector<Word>& words);
    double score(const SymbolPair& pair, int64_t count) const;
    void pushJob(const SymbolPair& pair, PairState& state);
    bool popBest(size_t& jobIndex);
    void applyMerge(std::vector<Word>& words, const SymbolPair& pair, int merged);
    void registerPair(const SymbolPair& pair);

    MergeObjective objective_;
    int64_t minPairFrequency_;
    int numThreads_;

    std::vector<MergeJob> jobs_;
    std::priority_queue<size_t, std::vector<size_t>, JobOrder> heap_;
    std::unordered_map<SymbolPair, PairState, SymbolPairHash> pairs_;
    std::vector<int64_t> symbolFreq_;
    std::unordered_map<int, std::vector<SymbolPair> > pairsBySymbol_;
};

}} // namespace cv::subword

#endif // OPENCV_SUBWORD_MERGE_TRAINER_HPP

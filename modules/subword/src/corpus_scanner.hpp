/**
 * @file corpus_scanner.hpp
 * @brief Span counting and per-span symbol sequences for training
 */

#ifndef OPENCV_SUBWORD_CORPUS_SCANNER_HPP
#define OPENCV_SUBWORD_CORPUS_SCANNER_HPP

#include <opencv2/core.hpp>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "pretokenizer.hpp"
#include "symbol_table.hpp"

namespace cv {
namespace subword {

typedef std::pair<int, int> SymbolPair;

struct SymbolPairHash {
    size_t operator()(const SymbolPair& p) const {
        return std::hash<uint64_t>()((static_cast<uint64_t>(static_cast<uint32_t>(p.first)) << 32) |
                                     static_cast<uint32_t>(p.second));
    }
};

/** @brief A distinct span of the corpus and the number of times it occurs */
struct SpanCount {
    std::string text;
    int64_t count;
};

/** @brief How spans are cut into initial symbols */
enum SymbolUnit {
    UNIT_CHARACTER,  //!< One symbol per UTF-8 character
    UNIT_BYTE        //!< One symbol per byte
};

/**
 * @brief Training-time view of a distinct span
 */
struct Word {
    std::vector<int> symbols;
    int64_t count;

    /**
     * @brief Replaces non-overlapping left-to-right occurrences of (left, right) by merged
     *
     * For every replaced occurrence the affected neighbour pairs are reported
     * with an unweighted delta: -1 for a pair that disappeared and +1 for a
     * pair that appeared. The merged pair itself is not reported.
     * @return Number of replaced occurrences
     */
    int merge(int left, int right, int merged, std::vector<std::pair<SymbolPair, int> >& changes);
};

/**
 * @brief Pretokenizes the corpus and counts identical spans
 *
 * In character mode every text must be well-formed UTF-8 and ERR_INVALID_INPUT
 * is raised otherwise. In byte mode a text that is not UTF-8 becomes a single
 * span without regex splitting.
 * @return Distinct spans sorted by content
 */
std::vector<SpanCount> scanCorpus(const std::vector<String>& corpus,
                                  const Pretokenizer& pretokenizer,
                                  SymbolUnit unit,
                                  int numThreads);

/**
 * @brief Sorted set of single characters present in the spans or in the extra list
 * @param spans Counted spans
 * @param extra Additional characters; multi-character entries contribute each character
 */
std::vector<std::string> collectCharacters(const std::vector<SpanCount>& spans,
                                           const std::vector<String>& extra);

/**
 * @brief Builds the initial symbol sequence of every span
 * @param spans Counted spans
 * @param symbols Table holding every initial symbol
 * @param unit Character or byte splitting
 * @param endOfWord Append the END_OF_WORD symbol to each span
 */
std::vector<Word> buildWords(const std::vector<SpanCount>& spans,
                             const SymbolTable& symbols,
                             SymbolUnit unit,
                             bool endOfWord);

}} // namespace cv::subword

#endif // OPENCV_SUBWORD_CORPUS_SCANNER_HPP

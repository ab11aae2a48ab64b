/**
 * @file lattice.hpp
 * @brief Segmentation lattice and Viterbi search for Unigram models
 */

#ifndef OPENCV_SUBWORD_LATTICE_HPP
#define OPENCV_SUBWORD_LATTICE_HPP

#include <string>
#include <vector>

#include "trie.hpp"

namespace cv {
namespace subword {

/**
 * @brief Graph of all vocabulary-consistent segmentations of one string
 *
 * Nodes are byte offsets 0..length; an edge covers [begin, begin + length)
 * and carries the log-probability of one vocabulary entry.
 */
class Lattice {
public:
    explicit Lattice(const std::string& text);

    const std::string& text() const { return text_; }

    /** @brief Adds an edge for the entry id covering [begin, begin + length) */
    void insert(size_t begin, size_t length, int id, double score);

    /**
     * @brief Maximum-score path from offset 0 to the end of the text
     *
     * Among paths of equal score the one whose last edge is longer wins,
     * then the one whose last edge content is lexicographically smaller.
     * @param total Optional; receives the summed score of the path
     * @return Entry identifiers along the path
     */
    std::vector<int> viterbi(double* total = NULL) const;

private:
    struct Edge {
        size_t begin;
        size_t length;
        int id;
        double score;
    };

    std::string text_;
    std::vector<std::vector<Edge> > endingAt_;
};

/**
 * @brief Fills a lattice from a trie of scored pieces
 *
 * Wherever no single-character piece starts at a character boundary, an
 * edge for unkId with unkScore covers that character, so a path always
 * exists.
 * @param lattice Lattice over well-formed UTF-8 text
 * @param pieces Trie mapping piece content to identifiers
 * @param scores Log-probability per identifier
 * @param unkId Identifier used for uncovered characters
 * @param unkScore Score of the unknown edge
 * @param excludedId Identifier skipped during the search, or -1
 */
void populateLattice(Lattice& lattice, const Trie& pieces, const std::vector<double>& scores,
                     int unkId, double unkScore, int excludedId = -1);

}} // namespace cv::subword

#endif // OPENCV_SUBWORD_LATTICE_HPP

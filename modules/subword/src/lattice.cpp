/**
 * @file lattice.cpp
 * @brief Segmentation lattice and Viterbi search
 */

#include "precomp.hpp"
#include "lattice.hpp"
#include "unicode_utils.hpp"

#include <limits>

namespace cv {
namespace subword {

Lattice::Lattice(const std::string& text)
    : text_(text), endingAt_(text.size() + 1) {
}

void Lattice::insert(size_t begin, size_t length, int id, double score) {
    CV_Assert(length > 0 && begin + length <= text_.size());
    Edge edge;
    edge.begin = begin;
    edge.length = length;
    edge.id = id;
    edge.score = score;
    endingAt_[begin + length].push_back(edge);
}

std::vector<int> Lattice::viterbi(double* total) const {
    const double NEG_INF = -std::numeric_limits<double>::infinity();
    const size_t n = text_.size();
    std::vector<double> best(n + 1, NEG_INF);
    std::vector<const Edge*> back(n + 1, NULL);
    best[0] = 0.0;

    for (size_t end = 1; end <= n; ++end) {
        for (const Edge& edge : endingAt_[end]) {
            if (best[edge.begin] == NEG_INF) {
                continue;
            }
            const double candidate = best[edge.begin] + edge.score;
            const Edge* current = back[end];
            bool better = current == NULL || candidate > best[end];
            if (!better && candidate == best[end]) {
                if (edge.length != current->length) {
                    better = edge.length > current->length;
                } else {
                    int order = text_.compare(edge.begin, edge.length, text_, current->begin, current->length);
                    better = order < 0 || (order == 0 && edge.id < current->id);
                }
            }
            if (better) {
                best[end] = candidate;
                back[end] = &edge;
            }
        }
    }

    if (n > 0 && back[n] == NULL) {
        CV_Error(Error::StsError, "No segmentation covers the input");
    }

    std::vector<int> path;
    for (size_t pos = n; pos > 0; pos = back[pos]->begin) {
        path.push_back(back[pos]->id);
    }
    std::reverse(path.begin(), path.end());
    if (total) {
        *total = best[n];
    }
    return path;
}

void populateLattice(Lattice& lattice, const Trie& pieces, const std::vector<double>& scores,
                     int unkId, double unkScore, int excludedId) {
    const std::string& text = lattice.text();
    std::vector<std::pair<int, size_t> > matches;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t charLength = utf8CharLength(text, pos);
        if (charLength == 0) {
            charLength = 1;
        }
        bool covered = false;
        pieces.commonPrefixSearch(text, pos, matches);
        for (const auto& match : matches) {
            if (match.first == excludedId) {
                continue;
            }
            lattice.insert(pos, match.second, match.first, scores[match.first]);
            if (match.second == charLength) {
                covered = true;
            }
        }
        if (!covered) {
            lattice.insert(pos, charLength, unkId, unkScore);
        }
        pos += charLength;
    }
}

}} // namespace cv::subword

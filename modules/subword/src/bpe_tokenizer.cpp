/**
 * @file bpe_tokenizer.cpp
 * @brief Implementation of the character-level Byte-Pair Encoding tokenizer
 *
 * Training delegates to the shared merge trainer with raw pair frequency as
 * the score. Encoding splits each span into characters plus the end-of-word
 * symbol and applies merges by ascending rule rank.
 */

#include "precomp.hpp"
#include "bpe_tokenizer.hpp"
#include "unicode_utils.hpp"

#include <climits>

namespace cv {
namespace subword {

BPETokenizer::BPETokenizer(const TokenizerParams& params)
    : TokenizerBase(params), endOfWordId_(-1) {
    // An untrained model only knows the unknown token
    Model model;
    model.unkId = model.symbols.add(params_.unkToken);
    model.scores.push_back(0.0);
    model.specialIds.push_back(model.unkId);
    setModel(model);
}

void BPETokenizer::learn(const std::vector<SpanCount>& spans,
                         const std::vector<std::string>& alphabet,
                         size_t targetSize,
                         Model& model,
                         TrainReport& report) const {
    learnByMerging(spans, alphabet, targetSize, MERGE_BY_FREQUENCY, model, report);
}

void BPETokenizer::onModelChanged() {
    merges_.clear();
    for (size_t i = 0; i < model_.merges.size(); ++i) {
        const MergeRule& rule = model_.merges[i];
        RankedMerge ranked;
        ranked.rank = static_cast<int>(i);
        ranked.merged = rule.merged;
        // A pair that re-formed later keeps its first rank
        merges_.emplace(SymbolPair(rule.left, rule.right), ranked);
    }
    endOfWordId_ = model_.symbols.find(std::string(1, END_OF_WORD));
}

void BPETokenizer::applyMerges(std::vector<int>& ids) const {
    while (ids.size() > 1) {
        // Find the best merge
        int bestRank = INT_MAX;
        size_t bestIdx = 0;
        int bestMerged = -1;
        for (size_t i = 0; i + 1 < ids.size(); ++i) {
            auto it = merges_.find(SymbolPair(ids[i], ids[i + 1]));
            if (it != merges_.end() && it->second.rank < bestRank) {
                bestRank = it->second.rank;
                bestIdx = i;
                bestMerged = it->second.merged;
            }
        }
        if (bestMerged < 0) {
            break;
        }
        ids[bestIdx] = bestMerged;
        ids.erase(ids.begin() + bestIdx + 1);
    }
}

void BPETokenizer::encodeSpan(const std::string& span, std::vector<int>& ids) const {
    std::vector<int> symbols;
    for (const auto& c : splitUtf8(span)) {
        const int id = model_.symbols.find(c);
        symbols.push_back(id >= 0 && !isSpecial(id) ? id : model_.unkId);
    }
    if (endOfWordId_ >= 0) {
        symbols.push_back(endOfWordId_);
    }
    applyMerges(symbols);
    ids.insert(ids.end(), symbols.begin(), symbols.end());
}

Ptr<Tokenizer> createBPETokenizer(const TokenizerParams& params) {
    return makePtr<BPETokenizer>(params);
}

}} // namespace cv::subword

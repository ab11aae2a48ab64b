/**
 * @file wordpiece_tokenizer.cpp
 * @brief Implementation of the WordPiece tokenizer
 */

#include "precomp.hpp"
#include "wordpiece_tokenizer.hpp"
#include "unicode_utils.hpp"

namespace cv {
namespace subword {

WordPieceTokenizer::WordPieceTokenizer(const TokenizerParams& params)
    : TokenizerBase(params) {
    Model model;
    model.unkId = model.symbols.add(params_.unkToken);
    model.scores.push_back(0.0);
    model.specialIds.push_back(model.unkId);
    setModel(model);
}

void WordPieceTokenizer::learn(const std::vector<SpanCount>& spans,
                               const std::vector<std::string>& alphabet,
                               size_t targetSize,
                               Model& model,
                               TrainReport& report) const {
    learnByMerging(spans, alphabet, targetSize, MERGE_BY_LIKELIHOOD, model, report);
}

void WordPieceTokenizer::onModelChanged() {
    vocab_.clear();
    const std::vector<std::string>& contents = model_.symbols.contents();
    for (size_t id = 0; id < contents.size(); ++id) {
        if (!isSpecial(static_cast<int>(id))) {
            vocab_.insert(contents[id], static_cast<int>(id));
        }
    }
}

void WordPieceTokenizer::encodeSpan(const std::string& span, std::vector<int>& ids) const {
    const std::string word = span + END_OF_WORD;
    size_t pos = 0;
    while (pos < word.size()) {
        int id = -1;
        size_t length = 0;
        if (vocab_.longestMatch(word, pos, id, length)) {
            ids.push_back(id);
            pos += length;
            continue;
        }
        if (pos + 1 == word.size()) {
            // Only the end-of-word marker is left and the vocabulary lacks it
            break;
        }
        ids.push_back(model_.unkId);
        pos += utf8CharLength(word, pos);
    }
}

Ptr<Tokenizer> createWordPieceTokenizer(const TokenizerParams& params) {
    return makePtr<WordPieceTokenizer>(params);
}

}} // namespace cv::subword

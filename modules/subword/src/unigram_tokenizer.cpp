/**
 * @file unigram_tokenizer.cpp
 * @brief Implementation of the Unigram tokenizer
 *
 * Training runs the EM pruner over the counted spans; encoding runs Viterbi
 * over a lattice built from the piece trie.
 */

#include "precomp.hpp"
#include "unigram_tokenizer.hpp"
#include "lattice.hpp"
#include "unicode_utils.hpp"
#include "unigram_trainer.hpp"

#include <limits>

namespace cv {
namespace subword {

namespace {

// Gap between the lowest piece score and the unknown-token edge
const double UNK_PENALTY = 10.0;

} // namespace

UnigramTokenizer::UnigramTokenizer(const TokenizerParams& params)
    : TokenizerBase(params), unkScore_(-UNK_PENALTY) {
    Model model;
    model.unkId = model.symbols.add(params_.unkToken);
    model.scores.push_back(0.0);
    model.specialIds.push_back(model.unkId);
    setModel(model);
}

UnigramTokenizer::UnigramTokenizer(const std::vector<String>& pieces,
                                   const std::vector<double>& logProbs,
                                   const TokenizerParams& params)
    : TokenizerBase(params), unkScore_(-UNK_PENALTY) {
    if (pieces.empty() || pieces.size() != logProbs.size()) {
        CV_Error(Error::StsBadArg, "Unigram vocabulary needs one log-probability per piece");
    }

    Model model;
    for (size_t i = 0; i < pieces.size(); ++i) {
        if (pieces[i].empty()) {
            CV_Error(Error::StsBadArg, "Unigram pieces must not be empty");
        }
        checkUtf8(pieces[i], "unigram piece");
        if (model.symbols.add(pieces[i]) < 0) {
            CV_Error(Error::StsBadArg, "Duplicate unigram piece: " + pieces[i]);
        }
        model.scores.push_back(logProbs[i]);
    }

    model.unkId = model.symbols.find(params_.unkToken);
    if (model.unkId < 0) {
        model.unkId = model.symbols.add(params_.unkToken);
        model.scores.push_back(0.0);
    }
    model.specialIds.push_back(model.unkId);
    setModel(model);
}

void UnigramTokenizer::learn(const std::vector<SpanCount>& spans,
                             const std::vector<std::string>& alphabet,
                             size_t targetSize,
                             Model& model,
                             TrainReport& report) const {
    UnigramTrainer trainer(params_);
    UnigramPieces result = trainer.train(spans, alphabet, seedSymbols(alphabet), targetSize);
    for (size_t i = 0; i < result.pieces.size(); ++i) {
        model.symbols.add(result.pieces[i]);
        model.scores.push_back(result.logProbs[i]);
    }
    report.status = result.status;
    report.rounds = result.rounds;
}

void UnigramTokenizer::onModelChanged() {
    pieces_.clear();
    double minScore = std::numeric_limits<double>::infinity();
    const std::vector<std::string>& contents = model_.symbols.contents();
    for (size_t id = 0; id < contents.size(); ++id) {
        if (isSpecial(static_cast<int>(id))) {
            continue;
        }
        pieces_.insert(contents[id], static_cast<int>(id));
        minScore = std::min(minScore, model_.scores[id]);
    }
    unkScore_ = (minScore == std::numeric_limits<double>::infinity() ? 0.0 : minScore) - UNK_PENALTY;
}

void UnigramTokenizer::encodeSpan(const std::string& span, std::vector<int>& ids) const {
    Lattice lattice(span);
    populateLattice(lattice, pieces_, model_.scores, model_.unkId, unkScore_);
    std::vector<int> path = lattice.viterbi();
    ids.insert(ids.end(), path.begin(), path.end());
}

Ptr<Tokenizer> createUnigramTokenizer(const TokenizerParams& params) {
    return makePtr<UnigramTokenizer>(params);
}

Ptr<Tokenizer> createUnigramTokenizer(const std::vector<String>& pieces,
                                      const std::vector<double>& logProbs,
                                      const TokenizerParams& params) {
    return makePtr<UnigramTokenizer>(pieces, logProbs, params);
}

}} // namespace cv::subword

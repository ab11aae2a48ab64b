/**
 * @file unigram_trainer.cpp
 * @brief EM training and loss-based pruning of Unigram vocabularies
 */

#include "precomp.hpp"
#include "unigram_trainer.hpp"
#include "byte_level.hpp"
#include "lattice.hpp"
#include "parallel_shards.hpp"
#include "unicode_utils.hpp"

#include <cmath>
#include <numeric>
#include <unordered_set>

namespace cv {
namespace subword {

namespace {

typedef std::unordered_map<std::string, int64_t> SubstringCounts;

struct SeedCandidate {
    std::string content;
    int64_t count;
    int64_t weight;
};

} // namespace

UnigramTrainer::UnigramTrainer(const TokenizerParams& params)
    : params_(params) {
}

void UnigramTrainer::seed(const std::vector<SpanCount>& spans,
                          const std::vector<std::string>& alphabet,
                          const std::vector<std::string>& seeds) {
    const size_t maxLength = std::max<size_t>(params_.maxSubwordLength, 1);

    ShardPlan plan(spans.size(), params_.numThreads);
    std::vector<SubstringCounts> local(plan.size());
    plan.run([&](size_t shard, size_t begin, size_t end) {
        SubstringCounts& counts = local[shard];
        std::vector<size_t> offsets;
        for (size_t s = begin; s < end; ++s) {
            const std::string& text = spans[s].text;
            offsets.clear();
            for (size_t pos = 0; pos < text.size(); pos += std::max<size_t>(utf8CharLength(text, pos), 1)) {
                offsets.push_back(pos);
            }
            offsets.push_back(text.size());
            const size_t chars = offsets.size() - 1;
            for (size_t i = 0; i < chars; ++i) {
                for (size_t len = 1; len <= maxLength && i + len <= chars; ++len) {
                    counts[text.substr(offsets[i], offsets[i + len] - offsets[i])] += spans[s].count;
                }
            }
        }
    });

    SubstringCounts counts;
    for (const auto& shardCounts : local) {
        for (const auto& entry : shardCounts) {
            counts[entry.first] += entry.second;
        }
    }

    pieces_.clear();
    pinned_.clear();
    std::vector<int64_t> pieceCounts;
    for (const auto& c : alphabet) {
        auto it = counts.find(c);
        pieces_.push_back(c);
        pinned_.push_back(true);
        pieceCounts.push_back(it != counts.end() ? it->second : 0);
    }
    std::unordered_set<std::string> seeded(seeds.begin(), seeds.end());
    for (const auto& s : seeds) {
        auto it = counts.find(s);
        pieces_.push_back(s);
        pinned_.push_back(true);
        pieceCounts.push_back(it != counts.end() ? it->second : 0);
    }

    std::vector<SeedCandidate> candidates;
    for (const auto& entry : counts) {
        const size_t len = utf8Length(entry.first);
        if (len < 2 || seeded.count(entry.first)) {
            continue;
        }
        candidates.push_back(SeedCandidate{entry.first, entry.second,
                                           entry.second * static_cast<int64_t>(len)});
    }
    std::sort(candidates.begin(), candidates.end(), [](const SeedCandidate& a, const SeedCandidate& b) {
        if (a.weight != b.weight) {
            return a.weight > b.weight;
        }
        return a.content < b.content;
    });
    if (candidates.size() > params_.unigramSeedSize) {
        candidates.resize(params_.unigramSeedSize);
    }
    for (const auto& candidate : candidates) {
        pieces_.push_back(candidate.content);
        pinned_.push_back(false);
        pieceCounts.push_back(candidate.count);
    }

    const double total = static_cast<double>(std::accumulate(pieceCounts.begin(), pieceCounts.end(), int64_t(0)));
    logProbs_.resize(pieces_.size());
    for (size_t i = 0; i < pieces_.size(); ++i) {
        const double count = pieceCounts[i] > 0 ? static_cast<double>(pieceCounts[i]) : 0.5;
        logProbs_[i] = std::log(count / total);
    }
    rebuildTrie();
}

void UnigramTrainer::rebuildTrie() {
    trie_.clear();
    for (size_t i = 0; i < pieces_.size(); ++i) {
        trie_.insert(pieces_[i], static_cast<int>(i));
    }
}

std::vector<int64_t> UnigramTrainer::expectation(const std::vector<SpanCount>& spans, double& logLikelihood) const {
    ShardPlan plan(spans.size(), params_.numThreads);
    std::vector<std::vector<int64_t> > localUsage(plan.size());
    std::vector<double> localLikelihood(plan.size(), 0.0);
    plan.run([&](size_t shard, size_t begin, size_t end) {
        std::vector<int64_t>& usage = localUsage[shard];
        usage.assign(pieces_.size(), 0);
        for (size_t s = begin; s < end; ++s) {
            Lattice lattice(spans[s].text);
            populateLattice(lattice, trie_, logProbs_, -1, 0.0);
            double score = 0.0;
            for (int id : lattice.viterbi(&score)) {
                CV_Assert(id >= 0);
                usage[id] += spans[s].count;
            }
            localLikelihood[shard] += score * static_cast<double>(spans[s].count);
        }
    });

    std::vector<int64_t> usage(pieces_.size(), 0);
    logLikelihood = 0.0;
    for (size_t shard = 0; shard < plan.size(); ++shard) {
        for (size_t i = 0; i < usage.size(); ++i) {
            usage[i] += localUsage[shard][i];
        }
        logLikelihood += localLikelihood[shard];
    }
    return usage;
}

void UnigramTrainer::maximization(const std::vector<int64_t>& usage) {
    const int64_t total = std::accumulate(usage.begin(), usage.end(), int64_t(0));
    const double denominator = static_cast<double>(std::max<int64_t>(total, 1));
    const double floorScore = std::log(0.5 / denominator);
    for (size_t i = 0; i < pieces_.size(); ++i) {
        logProbs_[i] = usage[i] > 0 ? std::log(static_cast<double>(usage[i]) / denominator) : floorScore;
    }
}

std::vector<double> UnigramTrainer::pruningLoss(const std::vector<int64_t>& usage) const {
    std::vector<double> loss(pieces_.size(), 0.0);
    ShardPlan plan(pieces_.size(), params_.numThreads);
    plan.run([&](size_t, size_t begin, size_t end) {
        for (size_t i = begin; i < end; ++i) {
            if (pinned_[i] || usage[i] == 0) {
                continue;
            }
            Lattice lattice(pieces_[i]);
            populateLattice(lattice, trie_, logProbs_, -1, 0.0, static_cast<int>(i));
            double alternative = 0.0;
            lattice.viterbi(&alternative);
            loss[i] = static_cast<double>(usage[i]) * (logProbs_[i] - alternative);
        }
    });
    return loss;
}

void UnigramTrainer::prune(const std::vector<double>& loss, size_t count) {
    std::vector<size_t> order;
    for (size_t i = 0; i < pieces_.size(); ++i) {
        if (!pinned_[i]) {
            order.push_back(i);
        }
    }
    std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        if (loss[a] != loss[b]) {
            return loss[a] < loss[b];
        }
        return pieces_[a] < pieces_[b];
    });
    count = std::min(count, order.size());

    std::vector<bool> removed(pieces_.size(), false);
    for (size_t k = 0; k < count; ++k) {
        removed[order[k]] = true;
        CV_LOG_DEBUG(NULL, "Pruning '" << bytesToDisplay(pieces_[order[k]]) << "' (loss " << loss[order[k]] << ")");
    }

    std::vector<std::string> pieces;
    std::vector<double> logProbs;
    std::vector<bool> pinned;
    for (size_t i = 0; i < pieces_.size(); ++i) {
        if (!removed[i]) {
            pieces.push_back(pieces_[i]);
            logProbs.push_back(logProbs_[i]);
            pinned.push_back(pinned_[i]);
        }
    }
    pieces_.swap(pieces);
    logProbs_.swap(logProbs);
    pinned_.swap(pinned);
    rebuildTrie();
}

UnigramPieces UnigramTrainer::train(const std::vector<SpanCount>& spans,
                                    const std::vector<std::string>& alphabet,
                                    const std::vector<std::string>& seeds,
                                    size_t targetPieces) {
    seed(spans, alphabet, seeds);
    CV_LOG_INFO(NULL, "Unigram training: " << spans.size() << " distinct spans, "
                << pieces_.size() << " seed pieces, target " << targetPieces);

    UnigramPieces result;
    result.rounds = 0;
    result.status = pieces_.size() >= targetPieces ? TRAIN_TARGET_REACHED : TRAIN_NO_MERGEABLE_CANDIDATES;

    const int iterations = std::max(params_.unigramEmIterations, 1);
    const size_t initialSize = pieces_.size();
    const size_t budget = initialSize > targetPieces ? initialSize - targetPieces : 0;
    size_t nextReport = 1;
    double logLikelihood = 0.0;

    while (pieces_.size() > targetPieces) {
        std::vector<int64_t> usage;
        for (int it = 0; it < iterations; ++it) {
            usage = expectation(spans, logLikelihood);
            maximization(usage);
        }
        CV_LOG_DEBUG(NULL, "Unigram round " << result.rounds + 1 << ": " << pieces_.size()
                     << " pieces, log-likelihood " << logLikelihood);

        size_t batch = params_.unigramPruneBatch > 0 ? params_.unigramPruneBatch
                                                     : std::max<size_t>(pieces_.size() / 10, 1);
        batch = std::min(batch, pieces_.size() - targetPieces);
        const size_t before = pieces_.size();
        prune(pruningLoss(usage), batch);
        ++result.rounds;
        if (pieces_.size() == before) {
            CV_LOG_WARNING(NULL, "Unigram training: only single characters and seeded pieces remain, stopping at "
                           << pieces_.size() << " pieces");
            result.status = TRAIN_NO_MERGEABLE_CANDIDATES;
            break;
        }

        const size_t removed = initialSize - pieces_.size();
        while (nextReport <= 10 && removed * 10 >= budget * nextReport) {
            CV_LOG_INFO(NULL, "Unigram training progress: " << nextReport * 10 << "% ("
                        << pieces_.size() << " pieces after " << result.rounds << " rounds)");
            ++nextReport;
        }
    }

    // Final re-estimation under the pruned vocabulary
    maximization(expectation(spans, logLikelihood));

    std::vector<size_t> order(pieces_.size());
    std::iota(order.begin(), order.end(), size_t(0));
    std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        if (logProbs_[a] != logProbs_[b]) {
            return logProbs_[a] > logProbs_[b];
        }
        return pieces_[a] < pieces_[b];
    });
    for (size_t i : order) {
        result.pieces.push_back(pieces_[i]);
        result.logProbs.push_back(logProbs_[i]);
    }

    if (result.status == TRAIN_NO_MERGEABLE_CANDIDATES) {
        CV_LOG_WARNING(NULL, "Unigram training ended below target: " << result.pieces.size()
                       << " of " << targetPieces << " pieces");
    }
    CV_LOG_INFO(NULL, "Unigram training finished after " << result.rounds << " rounds, "
                << result.pieces.size() << " pieces, log-likelihood " << logLikelihood);
    return result;
}

}} // namespace cv::subword

/**
 * @file merge_trainer.cpp
 * @brief Priority-queue driven merge learning shared by BPE, BBPE and WordPiece
 */

#include "precomp.hpp"
#include "merge_trainer.hpp"
#include "byte_level.hpp"
#include "parallel_shards.hpp"

namespace cv {
namespace subword {

namespace {

const size_t NO_JOB = static_cast<size_t>(-1);

typedef std::unordered_map<SymbolPair, int64_t, SymbolPairHash> PairCountMap;
typedef std::unordered_map<SymbolPair, std::vector<size_t>, SymbolPairHash> PairWordsMap;

void sortUnique(std::vector<size_t>& v) {
    std::sort(v.begin(), v.end());
    v.erase(std::unique(v.begin(), v.end()), v.end());
}

void sortUnique(std::vector<SymbolPair>& v) {
    std::sort(v.begin(), v.end());
    v.erase(std::unique(v.begin(), v.end()), v.end());
}

} // namespace

bool MergeTrainer::JobOrder::operator()(size_t lhs, size_t rhs) const {
    const MergeJob& a = (*jobs)[lhs];
    const MergeJob& b = (*jobs)[rhs];
    if (a.score != b.score) {
        return a.score < b.score;
    }
    // Smaller pair wins, so it must compare as "greater" in the max-heap
    return a.pair > b.pair;
}

MergeTrainer::MergeTrainer(MergeObjective objective, size_t minPairFrequency, int numThreads)
    : objective_(objective),
      minPairFrequency_(static_cast<int64_t>(minPairFrequency)),
      numThreads_(numThreads),
      heap_(JobOrder{&jobs_}) {
}

double MergeTrainer::score(const SymbolPair& pair, int64_t count) const {
    if (objective_ == MERGE_BY_FREQUENCY) {
        return static_cast<double>(count);
    }
    const double left = static_cast<double>(symbolFreq_[pair.first]);
    const double right = static_cast<double>(symbolFreq_[pair.second]);
    return static_cast<double>(count) / (left * right);
}

void MergeTrainer::pushJob(const SymbolPair& pair, PairState& state) {
    MergeJob job;
    job.pair = pair;
    job.score = score(pair, state.count);
    state.latestJob = jobs_.size();
    jobs_.push_back(job);
    heap_.push(state.latestJob);
}

void MergeTrainer::registerPair(const SymbolPair& pair) {
    if (objective_ != MERGE_BY_LIKELIHOOD) {
        return;
    }
    pairsBySymbol_[pair.first].push_back(pair);
    if (pair.second != pair.first) {
        pairsBySymbol_[pair.second].push_back(pair);
    }
}

void MergeTrainer::countPairs(const std::vector<Word>& words) {
    ShardPlan plan(words.size(), numThreads_);
    std::vector<PairCountMap> localCounts(plan.size());
    std::vector<PairWordsMap> localWords(plan.size());
    plan.run([&](size_t shard, size_t begin, size_t end) {
        PairCountMap& counts = localCounts[shard];
        PairWordsMap& where = localWords[shard];
        for (size_t w = begin; w < end; ++w) {
            const std::vector<int>& symbols = words[w].symbols;
            for (size_t i = 0; i + 1 < symbols.size(); ++i) {
                SymbolPair pair(symbols[i], symbols[i + 1]);
                counts[pair] += words[w].count;
                where[pair].push_back(w);
            }
        }
    });

    for (size_t shard = 0; shard < plan.size(); ++shard) {
        for (const auto& entry : localCounts[shard]) {
            auto it = pairs_.find(entry.first);
            if (it == pairs_.end()) {
                it = pairs_.emplace(entry.first, PairState{0, NO_JOB, std::vector<size_t>()}).first;
                registerPair(entry.first);
            }
            it->second.count += entry.second;
        }
        for (auto& entry : localWords[shard]) {
            std::vector<size_t>& dst = pairs_.at(entry.first).words;
            dst.insert(dst.end(), entry.second.begin(), entry.second.end());
        }
    }
}

bool MergeTrainer::popBest(size_t& jobIndex) {
    while (!heap_.empty()) {
        const size_t index = heap_.top();
        heap_.pop();

        const MergeJob job = jobs_[index];
        auto it = pairs_.find(job.pair);
        if (it == pairs_.end() || it->second.latestJob != index) {
            continue;
        }
        PairState& state = it->second;

        // Scores only drop between pushes; re-issue the job with its current value
        const double current = score(job.pair, state.count);
        if (current != job.score) {
            pushJob(job.pair, state);
            continue;
        }

        if (state.count <= minPairFrequency_) {
            if (objective_ == MERGE_BY_FREQUENCY) {
                return false;
            }
            continue;
        }

        jobIndex = index;
        return true;
    }
    return false;
}

void MergeTrainer::applyMerge(std::vector<Word>& words, const SymbolPair& pair, int merged) {
    std::vector<size_t> positions;
    {
        auto it = pairs_.find(pair);
        CV_Assert(it != pairs_.end());
        positions.swap(it->second.words);
        pairs_.erase(it);
    }
    sortUnique(positions);

    struct ShardDelta {
        std::vector<std::pair<SymbolPair, int64_t> > deltas;
        std::vector<std::pair<SymbolPair, size_t> > added;
        int64_t replaced;
    };

    ShardPlan plan(positions.size(), numThreads_);
    std::vector<ShardDelta> local(plan.size());
    plan.run([&](size_t shard, size_t begin, size_t end) {
        ShardDelta& out = local[shard];
        out.replaced = 0;
        std::vector<std::pair<SymbolPair, int> > changes;
        for (size_t k = begin; k < end; ++k) {
            const size_t w = positions[k];
            Word& word = words[w];
            changes.clear();
            const int replaced = word.merge(pair.first, pair.second, merged, changes);
            out.replaced += replaced * word.count;
            for (const auto& change : changes) {
                out.deltas.push_back(std::make_pair(change.first, change.second * word.count));
                if (change.second > 0) {
                    out.added.push_back(std::make_pair(change.first, w));
                }
            }
        }
    });

    if (static_cast<size_t>(merged) >= symbolFreq_.size()) {
        symbolFreq_.resize(merged + 1, 0);
    }

    std::vector<SymbolPair> touched;
    std::vector<SymbolPair> increased;
    for (const ShardDelta& shard : local) {
        symbolFreq_[pair.first] -= shard.replaced;
        symbolFreq_[pair.second] -= shard.replaced;
        symbolFreq_[merged] += shard.replaced;

        for (const auto& delta : shard.deltas) {
            auto it = pairs_.find(delta.first);
            if (it == pairs_.end()) {
                it = pairs_.emplace(delta.first, PairState{0, NO_JOB, std::vector<size_t>()}).first;
                registerPair(delta.first);
            }
            it->second.count += delta.second;
            touched.push_back(delta.first);
            if (delta.second > 0) {
                increased.push_back(delta.first);
            }
        }
        for (const auto& entry : shard.added) {
            pairs_.at(entry.first).words.push_back(entry.second);
        }
    }

    sortUnique(touched);
    for (const auto& p : touched) {
        auto it = pairs_.find(p);
        CV_Assert(it != pairs_.end() && it->second.count >= 0);
        if (it->second.count == 0) {
            pairs_.erase(it);
        }
    }

    if (objective_ == MERGE_BY_LIKELIHOOD) {
        // freq(first) and freq(second) shrank, so every pair holding them scores higher now
        const int sides[2] = { pair.first, pair.second };
        for (int side : sides) {
            auto bucket = pairsBySymbol_.find(side);
            if (bucket == pairsBySymbol_.end()) {
                continue;
            }
            std::vector<SymbolPair> alive;
            for (const auto& p : bucket->second) {
                if (pairs_.count(p)) {
                    alive.push_back(p);
                }
            }
            sortUnique(alive);
            bucket->second = alive;
            increased.insert(increased.end(), alive.begin(), alive.end());
        }
    }

    sortUnique(increased);
    for (const auto& p : increased) {
        auto it = pairs_.find(p);
        if (it != pairs_.end()) {
            pushJob(p, it->second);
        }
    }
}

MergeResult MergeTrainer::train(SymbolTable& symbols, std::vector<Word>& words, size_t targetSymbols) {
    jobs_.clear();
    heap_ = std::priority_queue<size_t, std::vector<size_t>, JobOrder>(JobOrder{&jobs_});
    pairs_.clear();
    pairsBySymbol_.clear();

    symbolFreq_.assign(symbols.size(), 0);
    for (const auto& word : words) {
        for (int s : word.symbols) {
            symbolFreq_[s] += word.count;
        }
    }

    MergeResult result;
    result.status = TRAIN_TARGET_REACHED;
    result.rounds = 0;
    const double initialScore = objective_ == MERGE_BY_FREQUENCY ? 1.0 : 0.0;
    result.scores.assign(symbols.size(), initialScore);

    if (symbols.size() >= targetSymbols) {
        return result;
    }

    countPairs(words);
    for (auto& entry : pairs_) {
        pushJob(entry.first, entry.second);
    }

    const size_t budget = targetSymbols - symbols.size();
    const size_t startSize = symbols.size();
    size_t nextReport = 1;
    CV_LOG_INFO(NULL, "Merge training: " << words.size() << " distinct spans, "
                << pairs_.size() << " candidate pairs, " << budget << " symbols to learn");

    while (symbols.size() < targetSymbols) {
        size_t jobIndex = 0;
        if (!popBest(jobIndex)) {
            result.status = TRAIN_NO_MERGEABLE_CANDIDATES;
            break;
        }
        const MergeJob job = jobs_[jobIndex];
        const SymbolPair pair = job.pair;

        const std::string content = symbols.content(pair.first) + symbols.content(pair.second);
        int merged = symbols.find(content);
        if (merged < 0) {
            merged = symbols.add(content);
            result.scores.push_back(objective_ == MERGE_BY_FREQUENCY ? 1.0 : job.score);
        }
        result.rules.push_back(MergeRule(pair.first, pair.second, merged));
        CV_LOG_DEBUG(NULL, "Merge " << result.rules.size() << ": '" << bytesToDisplay(symbols.content(pair.first))
                     << "' + '" << bytesToDisplay(symbols.content(pair.second)) << "' -> " << merged
                     << " (score " << job.score << ")");

        applyMerge(words, pair, merged);
        ++result.rounds;

        const size_t learned = symbols.size() - startSize;
        while (nextReport <= 10 && learned * 10 >= budget * nextReport) {
            CV_LOG_INFO(NULL, "Merge training progress: " << nextReport * 10 << "% ("
                        << learned << "/" << budget << " symbols, " << result.rounds << " merges)");
            ++nextReport;
        }
    }

    if (result.status == TRAIN_NO_MERGEABLE_CANDIDATES) {
        CV_LOG_WARNING(NULL, "Merge training stopped early at " << symbols.size() << " of "
                       << targetSymbols << " symbols: no mergeable pairs left");
    }
    CV_LOG_INFO(NULL, "Merge training finished after " << result.rounds << " merges, "
                << symbols.size() << " symbols");
    return result;
}

}} // namespace cv::subword

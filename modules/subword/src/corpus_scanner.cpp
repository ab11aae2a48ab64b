/**
 * @file corpus_scanner.cpp
 * @brief Parallel span counting and word construction for training
 */

#include "precomp.hpp"
#include "corpus_scanner.hpp"
#include "parallel_shards.hpp"
#include "unicode_utils.hpp"

#include <set>

namespace cv {
namespace subword {

int Word::merge(int left, int right, int merged, std::vector<std::pair<SymbolPair, int> >& changes) {
    const SymbolPair target(left, right);
    auto report = [&](int a, int b, int delta) {
        SymbolPair pair(a, b);
        if (pair != target) {
            changes.push_back(std::make_pair(pair, delta));
        }
    };

    std::vector<int> out;
    out.reserve(symbols.size());
    int replaced = 0;
    size_t i = 0;
    while (i < symbols.size()) {
        if (i + 1 < symbols.size() && symbols[i] == left && symbols[i + 1] == right) {
            if (!out.empty()) {
                // The left neighbour may already be a fresh merge from this pass
                report(out.back(), left, -1);
                report(out.back(), merged, 1);
            }
            if (i + 2 < symbols.size()) {
                report(right, symbols[i + 2], -1);
                report(merged, symbols[i + 2], 1);
            }
            out.push_back(merged);
            ++replaced;
            i += 2;
        } else {
            out.push_back(symbols[i]);
            ++i;
        }
    }
    if (replaced > 0) {
        symbols.swap(out);
    }
    return replaced;
}

std::vector<SpanCount> scanCorpus(const std::vector<String>& corpus,
                                  const Pretokenizer& pretokenizer,
                                  SymbolUnit unit,
                                  int numThreads) {
    typedef std::unordered_map<std::string, int64_t> SpanMap;

    ShardPlan plan(corpus.size(), numThreads);
    std::vector<SpanMap> local(plan.size());
    plan.run([&](size_t shard, size_t begin, size_t end) {
        SpanMap& counts = local[shard];
        std::vector<std::string> spans;
        for (size_t i = begin; i < end; ++i) {
            const std::string& text = corpus[i];
            spans.clear();
            if (unit == UNIT_CHARACTER) {
                checkUtf8(text, "training corpus");
                pretokenizer.split(text, spans);
            } else if (isValidUtf8(text)) {
                pretokenizer.split(text, spans);
            } else if (!text.empty()) {
                spans.push_back(text);
            }
            for (const auto& span : spans) {
                ++counts[span];
            }
        }
    });

    SpanMap total;
    for (const auto& counts : local) {
        for (const auto& entry : counts) {
            total[entry.first] += entry.second;
        }
    }

    std::vector<SpanCount> result;
    result.reserve(total.size());
    for (const auto& entry : total) {
        result.push_back(SpanCount{entry.first, entry.second});
    }
    std::sort(result.begin(), result.end(), [](const SpanCount& a, const SpanCount& b) {
        return a.text < b.text;
    });
    return result;
}

std::vector<std::string> collectCharacters(const std::vector<SpanCount>& spans,
                                           const std::vector<String>& extra) {
    std::set<std::string> chars;
    for (const auto& span : spans) {
        for (auto& c : splitUtf8(span.text)) {
            chars.insert(c);
        }
    }
    for (const auto& entry : extra) {
        checkUtf8(entry, "initial alphabet");
        for (auto& c : splitUtf8(entry)) {
            chars.insert(c);
        }
    }
    return std::vector<std::string>(chars.begin(), chars.end());
}

std::vector<Word> buildWords(const std::vector<SpanCount>& spans,
                             const SymbolTable& symbols,
                             SymbolUnit unit,
                             bool endOfWord) {
    std::vector<Word> words(spans.size());
    for (size_t i = 0; i < spans.size(); ++i) {
        Word& word = words[i];
        word.count = spans[i].count;
        const std::string& text = spans[i].text;
        if (unit == UNIT_BYTE) {
            word.symbols.reserve(text.size());
            for (char b : text) {
                word.symbols.push_back(symbols.find(std::string(1, b)));
            }
        } else {
            for (const auto& c : splitUtf8(text)) {
                word.symbols.push_back(symbols.find(c));
            }
            if (endOfWord) {
                word.symbols.push_back(symbols.find(std::string(1, END_OF_WORD)));
            }
        }
        CV_Assert(std::find(word.symbols.begin(), word.symbols.end(), -1) == word.symbols.end());
    }
    return words;
}

}} // namespace cv::subword

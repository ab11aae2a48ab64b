/**
 * @file tokenizer_base.cpp
 * @brief Training driver, special tokens, lookups and persistence shared by all tokenizers
 */

#include "precomp.hpp"
#include "tokenizer_base.hpp"
#include "byte_level.hpp"
#include "unicode_utils.hpp"

#include <set>

namespace cv {
namespace subword {

TokenizerBase::TokenizerBase(const TokenizerParams& params)
    : params_(params), pretokenizer_(params.pattern) {
}

std::vector<std::string> TokenizerBase::buildAlphabet(const std::vector<SpanCount>& spans) const {
    std::vector<String> extra = params_.initialAlphabet;
    for (const auto& entry : params_.initialVocabulary) {
        if (symbolUnit() == UNIT_CHARACTER) {
            checkUtf8(entry, "initial vocabulary");
        }
        extra.push_back(entry);
    }
    std::vector<std::string> alphabet = collectCharacters(spans, extra);
    if (usesEndOfWord()) {
        // 0xFF sorts after every UTF-8 lead byte, so the table stays ordered
        alphabet.push_back(std::string(1, END_OF_WORD));
    }
    return alphabet;
}

std::vector<std::string> TokenizerBase::splitUnits(const std::string& text) const {
    if (symbolUnit() == UNIT_CHARACTER) {
        return splitUtf8(text);
    }
    std::vector<std::string> units;
    for (char c : text) {
        units.push_back(std::string(1, c));
    }
    return units;
}

std::vector<std::string> TokenizerBase::seedSymbols(const std::vector<std::string>& alphabet) const {
    std::set<std::string> known(alphabet.begin(), alphabet.end());
    std::vector<std::string> seeds;
    for (const auto& entry : params_.initialVocabulary) {
        const std::vector<std::string> units = splitUnits(entry);
        if (units.size() < 2) {
            continue;
        }
        if (!seedsByMerging()) {
            if (known.insert(entry).second) {
                seeds.push_back(entry);
            }
            continue;
        }
        std::string prefix = units[0];
        for (size_t i = 1; i < units.size(); ++i) {
            prefix += units[i];
            if (known.insert(prefix).second) {
                seeds.push_back(prefix);
            }
        }
    }
    return seeds;
}

void TokenizerBase::learnByMerging(const std::vector<SpanCount>& spans,
                                   const std::vector<std::string>& alphabet,
                                   size_t targetSize,
                                   MergeObjective objective,
                                   Model& model,
                                   TrainReport& report) const {
    for (const auto& symbol : alphabet) {
        model.symbols.add(symbol);
    }

    // Each seeded symbol is its prefix followed by one unit, and the prefix is already present
    std::vector<MergeRule> seedRules;
    for (const auto& content : seedSymbols(alphabet)) {
        const std::string last = splitUnits(content).back();
        const int left = model.symbols.find(content.substr(0, content.size() - last.size()));
        const int right = model.symbols.find(last);
        CV_Assert(left >= 0 && right >= 0);
        seedRules.push_back(MergeRule(left, right, model.symbols.add(content)));
    }

    std::vector<Word> words = buildWords(spans, model.symbols, symbolUnit(), usesEndOfWord());
    if (!seedRules.empty()) {
        std::vector<std::pair<SymbolPair, int> > changes;
        for (const auto& rule : seedRules) {
            for (auto& word : words) {
                changes.clear();
                word.merge(rule.left, rule.right, rule.merged, changes);
            }
        }
        CV_LOG_INFO(NULL, "Seeded " << seedRules.size() << " symbols from the initial vocabulary");
    }

    MergeTrainer trainer(objective, params_.minPairFrequency, params_.numThreads);
    MergeResult result = trainer.train(model.symbols, words, targetSize);
    model.merges.swap(seedRules);
    model.merges.insert(model.merges.end(), result.rules.begin(), result.rules.end());
    model.scores.swap(result.scores);
    report.status = result.status;
    report.rounds = result.rounds;
}

TrainReport TokenizerBase::train(const std::vector<String>& corpus,
                                 size_t targetVocabSize,
                                 const std::vector<String>& specialTokens) {
    if (corpus.empty()) {
        CV_Error(ERR_EMPTY_CORPUS, "Training corpus is empty");
    }

    std::vector<SpanCount> spans = scanCorpus(corpus, pretokenizer_, symbolUnit(), params_.numThreads);
    if (spans.empty()) {
        CV_Error(ERR_EMPTY_CORPUS, "Training corpus contains no text");
    }

    std::vector<std::string> specials;
    if (usesUnkToken()) {
        if (params_.unkToken.empty()) {
            CV_Error(Error::StsBadArg, "Unknown token must not be empty");
        }
        specials.push_back(params_.unkToken);
    }
    for (const auto& token : specialTokens) {
        if (token.empty()) {
            CV_Error(Error::StsBadArg, "Special tokens must not be empty");
        }
        if (symbolUnit() == UNIT_CHARACTER) {
            checkUtf8(token, "special token");
        }
        if (std::find(specials.begin(), specials.end(), token) != specials.end()) {
            CV_LOG_WARNING(NULL, "Ignoring repeated special token '" << token << "'");
            continue;
        }
        specials.push_back(token);
    }

    std::vector<std::string> alphabet = buildAlphabet(spans);
    const size_t mandatory = alphabet.size() + seedSymbols(alphabet).size();
    if (targetVocabSize <= mandatory + specials.size()) {
        CV_Error(ERR_VOCAB_TARGET_TOO_SMALL,
                 cv::format("Target vocabulary size %zu must exceed the %zu mandatory symbols and %zu special tokens",
                            targetVocabSize, mandatory, specials.size()));
    }

    CV_LOG_INFO(NULL, "Training " << typeName() << " tokenizer: " << corpus.size() << " texts, "
                << spans.size() << " distinct spans, alphabet " << alphabet.size()
                << ", target " << targetVocabSize);

    Model model;
    TrainReport report;
    learn(spans, alphabet, targetVocabSize - specials.size(), model, report);
    CV_Assert(model.scores.size() == model.symbols.size());

    for (size_t i = 0; i < specials.size(); ++i) {
        const bool isUnk = usesUnkToken() && i == 0;
        int id = model.symbols.add(specials[i]);
        if (id < 0) {
            if (!isUnk) {
                CV_LOG_WARNING(NULL, "Special token '" << specials[i] << "' collides with a learned token and is rejected");
                continue;
            }
            id = model.symbols.find(specials[i]);
            CV_LOG_WARNING(NULL, "Unknown token '" << specials[i] << "' was learned from the corpus; reusing id " << id);
        } else {
            model.scores.push_back(0.0);
        }
        model.specialIds.push_back(id);
        if (isUnk) {
            model.unkId = id;
        }
    }

    report.vocabSize = model.symbols.size();
    if (report.vocabSize < targetVocabSize) {
        // Rejected special tokens leave the vocabulary short as well
        report.status = TRAIN_NO_MERGEABLE_CANDIDATES;
    }
    setModel(model);

    CV_LOG_INFO(NULL, "Trained " << typeName() << " tokenizer: vocabulary " << report.vocabSize
                << ", " << report.rounds << " rounds"
                << (report.status == TRAIN_NO_MERGEABLE_CANDIDATES ? " (stopped early)" : ""));
    return report;
}

void TokenizerBase::setModel(Model& model) {
    std::swap(model_, model);
    specialTrie_.clear();
    for (int id : model_.specialIds) {
        specialTrie_.insert(model_.symbols.content(id), id);
    }
    onModelChanged();
}

bool TokenizerBase::isSpecial(int id) const {
    return std::find(model_.specialIds.begin(), model_.specialIds.end(), id) != model_.specialIds.end();
}

void TokenizerBase::encodeOrdinary(const std::string& text, std::vector<int>& ids) const {
    if (text.empty()) {
        return;
    }
    std::vector<std::string> spans;
    if (symbolUnit() == UNIT_CHARACTER) {
        checkUtf8(text, "input text");
        pretokenizer_.split(text, spans);
    } else if (isValidUtf8(text)) {
        pretokenizer_.split(text, spans);
    } else {
        spans.push_back(text);
    }
    for (const auto& span : spans) {
        encodeSpan(span, ids);
    }
}

std::vector<int> TokenizerBase::encode(const String& text) const {
    std::vector<int> ids;
    if (model_.specialIds.empty()) {
        encodeOrdinary(text, ids);
        return ids;
    }

    // Special tokens are matched longest first and never split
    size_t segmentStart = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        int id = -1;
        size_t length = 0;
        if (specialTrie_.longestMatch(text, pos, id, length)) {
            encodeOrdinary(text.substr(segmentStart, pos - segmentStart), ids);
            ids.push_back(id);
            pos += length;
            segmentStart = pos;
        } else {
            ++pos;
        }
    }
    encodeOrdinary(text.substr(segmentStart), ids);
    return ids;
}

String TokenizerBase::decode(const std::vector<int>& tokens) const {
    std::string result;
    for (int id : tokens) {
        if (!model_.symbols.contains(id)) {
            CV_Error(ERR_UNKNOWN_IDENTIFIER, cv::format("Unknown token id %d", id));
        }
        const std::string& content = model_.symbols.content(id);
        if (usesEndOfWord() && !isSpecial(id)) {
            for (char c : content) {
                if (c != END_OF_WORD) {
                    result.push_back(c);
                }
            }
        } else {
            result += content;
        }
    }
    return result;
}

size_t TokenizerBase::getVocabSize() const {
    return model_.symbols.size();
}

std::string TokenizerBase::toDisplay(const std::string& content) const {
    if (usesEndOfWord() && !content.empty() && content.back() == END_OF_WORD) {
        return content.substr(0, content.size() - 1) + END_OF_WORD_DISPLAY;
    }
    return content;
}

bool TokenizerBase::fromDisplay(const std::string& text, std::string& content) const {
    const std::string marker(END_OF_WORD_DISPLAY);
    if (usesEndOfWord() && text.size() >= marker.size() &&
        text.compare(text.size() - marker.size(), marker.size(), marker) == 0) {
        content = text.substr(0, text.size() - marker.size()) + END_OF_WORD;
    } else {
        content = text;
    }
    return true;
}

String TokenizerBase::getTokenText(int tokenId) const {
    if (!model_.symbols.contains(tokenId)) {
        CV_Error(ERR_UNKNOWN_IDENTIFIER, cv::format("Unknown token id %d", tokenId));
    }
    const std::string& content = model_.symbols.content(tokenId);
    return isSpecial(tokenId) ? content : toDisplay(content);
}

int TokenizerBase::getTokenId(const String& tokenText) const {
    for (int id : model_.specialIds) {
        if (model_.symbols.content(id) == tokenText) {
            return id;
        }
    }
    std::string content;
    if (!fromDisplay(tokenText, content)) {
        return -1;
    }
    const int id = model_.symbols.find(content);
    return (id >= 0 && !isSpecial(id)) ? id : -1;
}

std::vector<String> TokenizerBase::getVocabulary() const {
    return model_.symbols.contents();
}

std::vector<MergeRule> TokenizerBase::getMerges() const {
    return model_.merges;
}

std::vector<double> TokenizerBase::getScores() const {
    return model_.scores;
}

std::vector<int> TokenizerBase::getSpecialTokenIds() const {
    return model_.specialIds;
}

int TokenizerBase::getUnkTokenId() const {
    return model_.unkId;
}

TokenizerParams TokenizerBase::getParams() const {
    return params_;
}

void TokenizerBase::save(const String& filename) const {
    FileStorage fs(filename, FileStorage::WRITE);
    if (!fs.isOpened()) {
        CV_Error(Error::StsError, "Could not open file for writing: " + filename);
    }

    fs << "tokenizer_type" << typeName();

    fs << "params" << "{";
    params_.write(fs);
    fs << "}";

    // Byte-level display keeps whitespace, control and marker bytes intact in every format
    fs << "vocab" << "[";
    for (const auto& content : model_.symbols.contents()) {
        fs << bytesToDisplay(content);
    }
    fs << "]";

    fs << "scores" << model_.scores;

    std::vector<int> merges;
    merges.reserve(model_.merges.size() * 3);
    for (const auto& rule : model_.merges) {
        merges.push_back(rule.left);
        merges.push_back(rule.right);
        merges.push_back(rule.merged);
    }
    fs << "merges" << merges;
    fs << "special_ids" << model_.specialIds;
    fs << "unk_id" << model_.unkId;
}

void TokenizerBase::readModel(const FileNode& root) {
    FileNode vocabNode = root["vocab"];
    if (!vocabNode.isSeq() || vocabNode.size() == 0) {
        CV_Error(ERR_BAD_MODEL, "Model file has no vocabulary");
    }

    Model model;
    for (FileNodeIterator it = vocabNode.begin(); it != vocabNode.end(); ++it) {
        if (!(*it).isString()) {
            CV_Error(ERR_BAD_MODEL, "Vocabulary entries must be strings");
        }
        std::string content;
        if (!displayToBytes((std::string)*it, content) || content.empty()) {
            CV_Error(ERR_BAD_MODEL, "Malformed vocabulary entry: " + (std::string)*it);
        }
        if (model.symbols.add(content) < 0) {
            CV_Error(ERR_BAD_MODEL, "Duplicate vocabulary entry: " + (std::string)*it);
        }
    }
    const int vocabSize = static_cast<int>(model.symbols.size());
    if (symbolUnit() == UNIT_BYTE) {
        for (int b = 0; b < 256; ++b) {
            if (model.symbols.find(std::string(1, static_cast<char>(b))) < 0) {
                CV_Error(ERR_BAD_MODEL, cv::format("Byte-level vocabulary lacks byte 0x%02X", b));
            }
        }
    }

    if (root["scores"].isNone() || root["merges"].isNone() || root["special_ids"].isNone() || root["unk_id"].isNone()) {
        CV_Error(ERR_BAD_MODEL, "Model file is missing scores, merges, special_ids or unk_id");
    }
    root["scores"] >> model.scores;
    if (model.scores.size() != model.symbols.size()) {
        CV_Error(ERR_BAD_MODEL, "Score count does not match vocabulary size");
    }

    std::vector<int> merges;
    root["merges"] >> merges;
    if (merges.size() % 3 != 0) {
        CV_Error(ERR_BAD_MODEL, "Merge list must hold (left, right, merged) triples");
    }
    for (size_t i = 0; i < merges.size(); i += 3) {
        MergeRule rule(merges[i], merges[i + 1], merges[i + 2]);
        if (!model.symbols.contains(rule.left) || !model.symbols.contains(rule.right) ||
            !model.symbols.contains(rule.merged) ||
            model.symbols.content(rule.left) + model.symbols.content(rule.right) != model.symbols.content(rule.merged)) {
            CV_Error(ERR_BAD_MODEL, cv::format("Inconsistent merge rule #%zu", i / 3));
        }
        model.merges.push_back(rule);
    }

    root["special_ids"] >> model.specialIds;
    for (int id : model.specialIds) {
        if (id < 0 || id >= vocabSize) {
            CV_Error(ERR_BAD_MODEL, cv::format("Special token id %d out of range", id));
        }
    }

    root["unk_id"] >> model.unkId;
    if (usesUnkToken() ? !model.symbols.contains(model.unkId) : model.unkId != -1) {
        CV_Error(ERR_BAD_MODEL, cv::format("Invalid unknown token id %d", model.unkId));
    }

    setModel(model);
}

}} // namespace cv::subword

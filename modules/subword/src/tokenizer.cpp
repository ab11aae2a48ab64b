/**
 * @file tokenizer.cpp
 * @brief Tokenizer interface defaults, configuration I/O and type dispatch
 *
 * Implements the parts of the public API that are shared by every variant:
 * batch encoding and decoding on top of the per-text calls, TokenizerParams
 * serialization, alphabet files, and creation/loading by tokenizer type.
 */

#include "precomp.hpp"
#include "tokenizer_base.hpp"
#include "bpe_tokenizer.hpp"
#include "bbpe_tokenizer.hpp"
#include "wordpiece_tokenizer.hpp"
#include "unigram_tokenizer.hpp"
#include "byte_level.hpp"
#include "parallel_shards.hpp"

#include <fstream>

namespace cv {
namespace subword {

namespace {

std::string readDisplayString(const FileNode& node, const char* name) {
    std::string content;
    if (!node.isString() || !displayToBytes((std::string)node, content)) {
        CV_Error(ERR_BAD_MODEL, cv::format("Malformed parameter '%s'", name));
    }
    return content;
}

const char* typeToName(TokenizerType type) {
    switch (type) {
        case TOKENIZER_BPE: return "bpe";
        case TOKENIZER_BBPE: return "bbpe";
        case TOKENIZER_WORDPIECE: return "wordpiece";
        case TOKENIZER_UNIGRAM: return "unigram";
    }
    return "";
}

// Non-empty lines with surrounding whitespace removed
std::vector<String> readLines(const String& filename, const char* what) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        CV_Error(Error::StsError, cv::format("Could not open %s file: %s", what, filename.c_str()));
    }

    std::vector<String> lines;
    std::string line;
    while (std::getline(file, line)) {
        const size_t first = line.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) {
            continue;
        }
        const size_t last = line.find_last_not_of(" \t\r\n");
        lines.push_back(line.substr(first, last - first + 1));
    }
    return lines;
}

} // namespace

TokenizerParams::TokenizerParams()
    : minPairFrequency(0),
      maxSubwordLength(16),
      pattern(defaultPretokenizePattern()),
      numThreads(-1),
      unkToken("<unk>"),
      unigramSeedSize(100000),
      unigramPruneBatch(0),
      unigramEmIterations(2) {
}

void TokenizerParams::read(const FileNode& fn) {
    if (!fn["min_pair_frequency"].empty())
        minPairFrequency = static_cast<size_t>((int)fn["min_pair_frequency"]);
    if (!fn["max_subword_length"].empty())
        maxSubwordLength = static_cast<size_t>((int)fn["max_subword_length"]);
    if (!fn["pattern"].empty())
        pattern = readDisplayString(fn["pattern"], "pattern");
    if (!fn["num_threads"].empty())
        numThreads = (int)fn["num_threads"];
    if (!fn["unk_token"].empty())
        unkToken = readDisplayString(fn["unk_token"], "unk_token");
    if (!fn["initial_alphabet"].empty()) {
        FileNode alphabet = fn["initial_alphabet"];
        initialAlphabet.clear();
        for (FileNodeIterator it = alphabet.begin(); it != alphabet.end(); ++it) {
            initialAlphabet.push_back(readDisplayString(*it, "initial_alphabet"));
        }
    }
    if (!fn["initial_vocabulary"].empty()) {
        FileNode vocabulary = fn["initial_vocabulary"];
        initialVocabulary.clear();
        for (FileNodeIterator it = vocabulary.begin(); it != vocabulary.end(); ++it) {
            initialVocabulary.push_back(readDisplayString(*it, "initial_vocabulary"));
        }
    }
    if (!fn["unigram_seed_size"].empty())
        unigramSeedSize = static_cast<size_t>((int)fn["unigram_seed_size"]);
    if (!fn["unigram_prune_batch"].empty())
        unigramPruneBatch = static_cast<size_t>((int)fn["unigram_prune_batch"]);
    if (!fn["unigram_em_iterations"].empty())
        unigramEmIterations = (int)fn["unigram_em_iterations"];
}

void TokenizerParams::write(FileStorage& fs) const {
    fs << "min_pair_frequency" << static_cast<int>(minPairFrequency);
    fs << "max_subword_length" << static_cast<int>(maxSubwordLength);
    // Strings go through the byte-level display form so quotes and backslashes survive
    fs << "pattern" << bytesToDisplay(pattern);
    fs << "num_threads" << numThreads;
    fs << "unk_token" << bytesToDisplay(unkToken);
    fs << "initial_alphabet" << "[";
    for (const auto& symbol : initialAlphabet) {
        fs << bytesToDisplay(symbol);
    }
    fs << "]";
    fs << "initial_vocabulary" << "[";
    for (const auto& token : initialVocabulary) {
        fs << bytesToDisplay(token);
    }
    fs << "]";
    fs << "unigram_seed_size" << static_cast<int>(unigramSeedSize);
    fs << "unigram_prune_batch" << static_cast<int>(unigramPruneBatch);
    fs << "unigram_em_iterations" << unigramEmIterations;
}

std::vector<String> readAlphabetFile(const String& filename) {
    return readLines(filename, "alphabet");
}

std::vector<String> readVocabularyFile(const String& filename) {
    return readLines(filename, "vocabulary");
}

std::vector<std::vector<int> > Tokenizer::encodeBatch(const std::vector<String>& texts) const {
    std::vector<std::vector<int> > result(texts.size());
    ShardPlan plan(texts.size(), getParams().numThreads);
    plan.run([&](size_t, size_t begin, size_t end) {
        for (size_t i = begin; i < end; ++i) {
            result[i] = encode(texts[i]);
        }
    });
    return result;
}

std::vector<String> Tokenizer::decodeBatch(const std::vector<std::vector<int> >& tokens) const {
    std::vector<String> result(tokens.size());
    ShardPlan plan(tokens.size(), getParams().numThreads);
    plan.run([&](size_t, size_t begin, size_t end) {
        for (size_t i = begin; i < end; ++i) {
            result[i] = decode(tokens[i]);
        }
    });
    return result;
}

Ptr<TokenizerBase> createTokenizerBase(TokenizerType type, const TokenizerParams& params) {
    switch (type) {
        case TOKENIZER_BPE: return makePtr<BPETokenizer>(params);
        case TOKENIZER_BBPE: return makePtr<BBPETokenizer>(params);
        case TOKENIZER_WORDPIECE: return makePtr<WordPieceTokenizer>(params);
        case TOKENIZER_UNIGRAM: return makePtr<UnigramTokenizer>(params);
    }
    CV_Error(Error::StsBadArg, cv::format("Unknown tokenizer type %d", (int)type));
}

Ptr<Tokenizer> Tokenizer::create(TokenizerType type, const TokenizerParams& params) {
    return createTokenizerBase(type, params);
}

Ptr<Tokenizer> Tokenizer::load(const String& filename) {
    FileStorage fs(filename, FileStorage::READ);
    if (!fs.isOpened()) {
        CV_Error(Error::StsError, "Could not open tokenizer file: " + filename);
    }

    std::string tokenizerType;
    fs["tokenizer_type"] >> tokenizerType;

    TokenizerType type;
    if (tokenizerType == typeToName(TOKENIZER_BPE)) {
        type = TOKENIZER_BPE;
    } else if (tokenizerType == typeToName(TOKENIZER_BBPE)) {
        type = TOKENIZER_BBPE;
    } else if (tokenizerType == typeToName(TOKENIZER_WORDPIECE)) {
        type = TOKENIZER_WORDPIECE;
    } else if (tokenizerType == typeToName(TOKENIZER_UNIGRAM)) {
        type = TOKENIZER_UNIGRAM;
    } else {
        CV_Error(ERR_BAD_MODEL, "Unknown tokenizer type: " + tokenizerType);
    }

    TokenizerParams params;
    FileNode paramsNode = fs["params"];
    if (paramsNode.isMap()) {
        params.read(paramsNode);
    }

    Ptr<TokenizerBase> tokenizer = createTokenizerBase(type, params);
    tokenizer->readModel(fs.root());
    return tokenizer;
}

}} // namespace cv::subword

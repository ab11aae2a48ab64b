/**
 * @file tokenizer_demo.cpp
 * @brief Demo application showcasing subword tokenizer training and usage
 *
 * Trains a tokenizer of the requested type on a text file (one document per
 * line), or loads a saved one, then encodes and decodes a sample text.
 */

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include <opencv2/core/utils/logger.hpp>
#include <opencv2/subword.hpp>

const char* keys =
    "{ help h      |     | Print help message }"
    "{ @tokenizer  | bpe | Tokenizer type (bpe, bbpe, wordpiece or unigram) }"
    "{ @corpus     |     | Training corpus, one document per line }"
    "{ @text       |     | Text to tokenize (if not provided, will use a sample text) }"
    "{ vocab_size  | 1000| Target vocabulary size, special tokens included }"
    "{ special     |     | Comma-separated special tokens }"
    "{ alphabet    |     | File with one initial alphabet symbol per line }"
    "{ vocabulary  |     | File with one whole token per line kept in the trained vocabulary }"
    "{ min_freq    | 0   | Pairs occurring this often or less are never merged }"
    "{ threads     | -1  | Worker threads (-1 uses every core) }"
    "{ display     |     | Display tokens and their IDs }"
    "{ verbose v   |     | Log training progress }"
    "{ save s      |     | Save the tokenizer to a file }"
    "{ load l      |     | Load a tokenizer from a file }";

void printHelp() {
    std::cout << "This sample trains subword tokenizers and uses them to encode and decode text.\n\n"
              << "Usage examples:\n"
              << "  example_subword_tokenizer_demo bpe corpus.txt \"Hello world!\" --vocab_size=500\n"
              << "  example_subword_tokenizer_demo unigram corpus.txt --special=<s>,</s> --save=tok.yml\n"
              << "  example_subword_tokenizer_demo --load=tok.yml \"Hello world!\" --display\n";
}

static std::vector<std::string> splitList(const std::string& list) {
    std::vector<std::string> items;
    size_t start = 0;
    while (start <= list.size()) {
        size_t end = list.find(',', start);
        if (end == std::string::npos)
            end = list.size();
        if (end > start)
            items.push_back(list.substr(start, end - start));
        start = end + 1;
    }
    return items;
}

static std::vector<std::string> readCorpus(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        CV_Error(cv::Error::StsError, "Could not open corpus file: " + path);
    }
    std::vector<std::string> corpus;
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty())
            corpus.push_back(line);
    }
    return corpus;
}

static bool parseType(std::string name, cv::subword::TokenizerType& type) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c){ return std::tolower(c); });
    if (name == "bpe") type = cv::subword::TOKENIZER_BPE;
    else if (name == "bbpe") type = cv::subword::TOKENIZER_BBPE;
    else if (name == "wordpiece") type = cv::subword::TOKENIZER_WORDPIECE;
    else if (name == "unigram") type = cv::subword::TOKENIZER_UNIGRAM;
    else return false;
    return true;
}

int main(int argc, char** argv) {
    cv::CommandLineParser parser(argc, argv, keys);
    parser.about("OpenCV Subword Tokenizer Demo");

    if (parser.has("help")) {
        parser.printMessage();
        printHelp();
        return 0;
    }
    if (parser.has("verbose")) {
        cv::utils::logging::setLogLevel(cv::utils::logging::LOG_LEVEL_INFO);
    }

    cv::Ptr<cv::subword::Tokenizer> tokenizer;
    if (parser.has("load")) {
        std::string load_path = parser.get<std::string>("load");
        std::cout << "Loading tokenizer from: " << load_path << std::endl;

        try {
            tokenizer = cv::subword::Tokenizer::load(load_path);
            std::cout << "Tokenizer loaded successfully with vocabulary size: "
                      << tokenizer->getVocabSize() << std::endl;
        } catch (const cv::Exception& e) {
            std::cerr << "Error loading tokenizer: " << e.what() << std::endl;
            return -1;
        }
    } else {
        cv::subword::TokenizerType type;
        std::string tokenizer_type = parser.get<std::string>("@tokenizer");
        if (!parseType(tokenizer_type, type)) {
            std::cerr << "Unknown tokenizer type: " << tokenizer_type << std::endl;
            return -1;
        }
        if (!parser.has("@corpus")) {
            std::cerr << "Training corpus must be specified" << std::endl;
            parser.printMessage();
            return -1;
        }

        try {
            cv::subword::TokenizerParams params;
            params.minPairFrequency = static_cast<size_t>(parser.get<int>("min_freq"));
            params.numThreads = parser.get<int>("threads");
            if (parser.has("alphabet"))
                params.initialAlphabet = cv::subword::readAlphabetFile(parser.get<std::string>("alphabet"));
            if (parser.has("vocabulary"))
                params.initialVocabulary = cv::subword::readVocabularyFile(parser.get<std::string>("vocabulary"));

            std::vector<std::string> corpus = readCorpus(parser.get<std::string>("@corpus"));
            std::vector<std::string> specials = splitList(parser.get<std::string>("special"));
            const size_t vocab_size = static_cast<size_t>(parser.get<int>("vocab_size"));

            std::cout << "Training " << tokenizer_type << " tokenizer on " << corpus.size()
                      << " documents, target vocabulary size " << vocab_size << std::endl;
            tokenizer = cv::subword::Tokenizer::create(type, params);
            cv::subword::TrainReport report = tokenizer->train(corpus, vocab_size, specials);

            std::cout << "Training finished after " << report.rounds << " rounds with vocabulary size "
                      << report.vocabSize
                      << (report.status == cv::subword::TRAIN_TARGET_REACHED ? "" : " (corpus exhausted)")
                      << std::endl;
        } catch (const cv::Exception& e) {
            std::cerr << "Error training tokenizer: " << e.what() << std::endl;
            return -1;
        }
    }

    // Save the tokenizer if requested
    if (parser.has("save")) {
        std::string save_path = parser.get<std::string>("save");
        std::cout << "Saving tokenizer to: " << save_path << std::endl;

        try {
            tokenizer->save(save_path);
            std::cout << "Tokenizer saved successfully" << std::endl;
        } catch (const cv::Exception& e) {
            std::cerr << "Error saving tokenizer: " << e.what() << std::endl;
            return -1;
        }
    }

    std::string text;
    if (parser.has("@text")) {
        text = parser.get<std::string>("@text");
    } else {
        text = "Hello world! This is the OpenCV subword tokenizer demo.";
    }

    std::cout << "\nInput text: " << text << std::endl;

    try {
        std::vector<int> tokens = tokenizer->encode(text);
        std::cout << "Encoded into " << tokens.size() << " tokens" << std::endl;

        if (parser.has("display")) {
            for (size_t i = 0; i < tokens.size(); ++i) {
                std::cout << "  " << tokens[i] << "\t" << tokenizer->getTokenText(tokens[i]) << std::endl;
            }
        }

        std::string decoded = tokenizer->decode(tokens);
        std::cout << "Decoded text: " << decoded << std::endl;
    } catch (const cv::Exception& e) {
        std::cerr << "Error during tokenization: " << e.what() << std::endl;
        return -1;
    }

    return 0;
}

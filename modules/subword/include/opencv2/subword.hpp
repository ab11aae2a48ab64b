#ifndef OPENCV_SUBWORD_HPP
#define OPENCV_SUBWORD_HPP

#include <opencv2/core.hpp>
#include <string>
#include <vector>

/**
 * @defgroup subword Subword tokenization
 *
 * Training and runtime engine for four interchangeable subword algorithms:
 * character-level BPE, byte-level BPE (BBPE), WordPiece and Unigram.
 */

namespace cv {
namespace subword {

//! @addtogroup subword
//! @{

/**
 * @brief Algorithm selected when a tokenizer is constructed
 */
enum TokenizerType {
    TOKENIZER_BPE = 0,        //!< Character-level byte pair encoding
    TOKENIZER_BBPE = 1,       //!< Byte-level byte pair encoding
    TOKENIZER_WORDPIECE = 2,  //!< Likelihood-driven merge selection with greedy longest-match encode
    TOKENIZER_UNIGRAM = 3     //!< Unigram language model with Viterbi encode
};

/**
 * @brief Error codes carried by cv::Exception::code for tokenizer failures
 */
enum TokenizerErrorCode {
    ERR_EMPTY_CORPUS = -1001,            //!< No spans were supplied for training
    ERR_VOCAB_TARGET_TOO_SMALL = -1002,  //!< Target does not exceed the mandatory alphabet
    ERR_INVALID_INPUT = -1003,           //!< Malformed UTF-8 in a character-level mode
    ERR_UNKNOWN_IDENTIFIER = -1004,      //!< Identifier outside the trained vocabulary
    ERR_BAD_MODEL = -1005                //!< Saved model is missing fields or inconsistent
};

/**
 * @brief Terminal condition of a training run
 */
enum TrainStatus {
    TRAIN_TARGET_REACHED = 0,          //!< Vocabulary reached the requested size
    TRAIN_NO_MERGEABLE_CANDIDATES = 1  //!< Corpus ran out of candidates before the target
};

/**
 * @brief Outcome of Tokenizer::train
 */
struct CV_EXPORTS_W_SIMPLE TrainReport {
    TrainReport() : status(TRAIN_TARGET_REACHED), vocabSize(0), rounds(0) {}

    int status;        //!< One of TrainStatus
    size_t vocabSize;  //!< Final vocabulary size, special tokens included
    size_t rounds;     //!< Merge rounds (BPE/BBPE/WordPiece) or prune rounds (Unigram)
};

/**
 * @brief One composition rule: left followed by right becomes merged
 */
struct CV_EXPORTS_W_SIMPLE MergeRule {
    MergeRule() : left(-1), right(-1), merged(-1) {}
    MergeRule(int l, int r, int m) : left(l), right(r), merged(m) {}

    int left;
    int right;
    int merged;
};

/**
 * @brief Training and runtime configuration shared by all tokenizer variants
 */
struct CV_EXPORTS_W_SIMPLE TokenizerParams {
    CV_WRAP TokenizerParams();

    size_t minPairFrequency;      //!< Candidates with pair frequency <= this value are never merged
    size_t maxSubwordLength;      //!< Longest Unigram seed piece, in characters
    String pattern;               //!< ICU regular expression splitting text into spans; empty disables splitting
    int numThreads;               //!< Worker threads; values <= 0 select hardware concurrency
    String unkToken;              //!< Unknown token for BPE, WordPiece and Unigram
    std::vector<String> initialAlphabet;  //!< Characters always present in the single-symbol alphabet
    std::vector<String> initialVocabulary;  //!< Whole tokens always present in the trained vocabulary
    size_t unigramSeedSize;       //!< Maximum number of multi-character Unigram seed pieces
    size_t unigramPruneBatch;     //!< Pieces pruned per round; 0 selects 10% of the vocabulary
    int unigramEmIterations;      //!< EM passes performed before each pruning step

    /** @brief Reads the parameters from a file node written by write() */
    void read(const FileNode& fn);

    /** @brief Writes the parameters into an open file storage */
    void write(FileStorage& fs) const;
};

/**
 * @brief Default pretokenization pattern (GPT-4 style split)
 */
CV_EXPORTS String defaultPretokenizePattern();

/**
 * @brief Reads an alphabet file holding one symbol per line
 * @param filename Path to the file
 * @return Non-empty, trimmed lines in file order
 */
CV_EXPORTS_W std::vector<String> readAlphabetFile(const String& filename);

/**
 * @brief Reads a vocabulary file holding one whole token per line
 *
 * The result is meant for TokenizerParams::initialVocabulary. Unlike an
 * alphabet entry, a multi-character line such as "Li" becomes a single token.
 * @param filename Path to the file
 * @return Non-empty, trimmed lines in file order
 */
CV_EXPORTS_W std::vector<String> readVocabularyFile(const String& filename);

/**
 * @brief Base class for all trainable tokenizers
 *
 * A tokenizer owns its vocabulary, rule list and special tokens. After train()
 * returns, all const members are safe to call concurrently.
 */
class CV_EXPORTS_W Tokenizer {
public:
    /** @brief Virtual destructor */
    virtual ~Tokenizer() = default;

    /**
     * @brief Learns a vocabulary from a corpus, replacing the current model
     * @param corpus Training texts; each text is pretokenized into spans
     * @param targetVocabSize Requested vocabulary size, special tokens included
     * @param specialTokens Reserved strings appended after the learned vocabulary
     * @return Report describing how training ended
     */
    CV_WRAP virtual TrainReport train(const std::vector<String>& corpus,
                                      size_t targetVocabSize,
                                      const std::vector<String>& specialTokens = std::vector<String>()) = 0;

    /**
     * @brief Encodes a string into tokens
     * @param text Text to encode
     * @return Vector of token IDs
     */
    CV_WRAP virtual std::vector<int> encode(const String& text) const = 0;

    /**
     * @brief Batch encodes multiple strings into tokens
     * @param texts Vector of texts to encode
     * @return Vector of vectors of token IDs
     */
    CV_WRAP virtual std::vector<std::vector<int> > encodeBatch(const std::vector<String>& texts) const;

    /**
     * @brief Decodes a sequence of tokens back into text
     * @param tokens Vector of token IDs
     * @return Decoded text
     */
    CV_WRAP virtual String decode(const std::vector<int>& tokens) const = 0;

    /**
     * @brief Batch decodes token sequences
     * @param tokens Vector of token ID sequences
     * @return Decoded texts
     */
    CV_WRAP virtual std::vector<String> decodeBatch(const std::vector<std::vector<int> >& tokens) const;

    /**
     * @brief Get the vocabulary size
     * @return Number of tokens in vocabulary
     */
    CV_WRAP virtual size_t getVocabSize() const = 0;

    /**
     * @brief Get token text for a token ID
     * @param tokenId Token ID
     * @return Token text; word-final symbols carry a trailing "</w>"
     */
    CV_WRAP virtual String getTokenText(int tokenId) const = 0;

    /**
     * @brief Get token ID for a token text
     * @param tokenText Token text in the form returned by getTokenText()
     * @return Token ID or -1 if not found
     */
    CV_WRAP virtual int getTokenId(const String& tokenText) const = 0;

    /** @brief Algorithm implemented by this tokenizer */
    CV_WRAP virtual TokenizerType getType() const = 0;

    /** @brief Raw token contents indexed by token ID */
    CV_WRAP virtual std::vector<String> getVocabulary() const = 0;

    /** @brief Learned rules in application order; empty for Unigram */
    CV_WRAP virtual std::vector<MergeRule> getMerges() const = 0;

    /** @brief Per-token scores (log-probabilities for Unigram, merge scores for WordPiece, 1 for BPE) */
    CV_WRAP virtual std::vector<double> getScores() const = 0;

    /** @brief Identifiers of the special tokens, in insertion order */
    CV_WRAP virtual std::vector<int> getSpecialTokenIds() const = 0;

    /** @brief Identifier of the unknown token, or -1 when the variant has none */
    CV_WRAP virtual int getUnkTokenId() const = 0;

    /** @brief Configuration the tokenizer was created with */
    CV_WRAP virtual TokenizerParams getParams() const = 0;

    /**
     * @brief Save tokenizer to a file
     * @param filename Path to save tokenizer (.yml, .json or .xml)
     */
    CV_WRAP virtual void save(const String& filename) const = 0;

    /**
     * @brief Create a tokenizer from a saved file
     * @param filename Path to saved tokenizer
     * @return Created tokenizer
     */
    CV_WRAP static Ptr<Tokenizer> load(const String& filename);

    /**
     * @brief Create an untrained tokenizer of the given type
     * @param type Algorithm to use
     * @param params Configuration
     * @return Created tokenizer
     */
    CV_WRAP static Ptr<Tokenizer> create(TokenizerType type, const TokenizerParams& params = TokenizerParams());
};

/**
 * @brief Factory function to create a character-level BPE tokenizer
 * @param params Configuration
 * @return Smart pointer to the created tokenizer
 */
CV_EXPORTS_W Ptr<Tokenizer> createBPETokenizer(const TokenizerParams& params = TokenizerParams());

/**
 * @brief Factory function to create a byte-level BPE tokenizer
 *
 * The tokenizer starts with the 256 single-byte tokens and can encode any
 * input before training.
 * @param params Configuration
 * @return Smart pointer to the created tokenizer
 */
CV_EXPORTS_W Ptr<Tokenizer> createBBPETokenizer(const TokenizerParams& params = TokenizerParams());

/**
 * @brief Factory function to create a WordPiece tokenizer
 * @param params Configuration
 * @return Smart pointer to the created tokenizer
 */
CV_EXPORTS_W Ptr<Tokenizer> createWordPieceTokenizer(const TokenizerParams& params = TokenizerParams());

/**
 * @brief Factory function to create a Unigram tokenizer
 * @param params Configuration
 * @return Smart pointer to the created tokenizer
 */
CV_EXPORTS_W Ptr<Tokenizer> createUnigramTokenizer(const TokenizerParams& params = TokenizerParams());

/**
 * @brief Factory function to create a Unigram tokenizer from a scored vocabulary
 * @param pieces Vocabulary entries
 * @param logProbs Natural-log probability of each entry
 * @param params Configuration
 * @return Smart pointer to the created tokenizer
 */
CV_EXPORTS_W Ptr<Tokenizer> createUnigramTokenizer(const std::vector<String>& pieces,
                                                  const std::vector<double>& logProbs,
                                                  const TokenizerParams& params = TokenizerParams());

//! @}

}} // namespace cv::subword

#endif // OPENCV_SUBWORD_HPP

/**
 * @file tokenizer_base.hpp
 * @brief Shared vocabulary ownership, special tokens and persistence for all variants
 */

#ifndef OPENCV_SUBWORD_TOKENIZER_BASE_HPP
#define OPENCV_SUBWORD_TOKENIZER_BASE_HPP

#include <opencv2/subword.hpp>

#include <string>
#include <vector>

#include "corpus_scanner.hpp"
#include "merge_trainer.hpp"
#include "pretokenizer.hpp"
#include "symbol_table.hpp"
#include "trie.hpp"

namespace cv {
namespace subword {

/**
 * @brief Common part of the four tokenizer variants
 *
 * Owns the trained model and implements everything that does not depend on
 * the algorithm: corpus scanning, special-token injection and recognition,
 * identifier lookups, decoding and FileStorage persistence. Variants supply
 * the vocabulary learner and the per-span encoder.
 *
 * train() works on a local Model and swaps it in only after success.
 */
class TokenizerBase : public Tokenizer {
public:
    TrainReport train(const std::vector<String>& corpus,
                      size_t targetVocabSize,
                      const std::vector<String>& specialTokens) override;

    std::vector<int> encode(const String& text) const override;
    String decode(const std::vector<int>& tokens) const override;

    size_t getVocabSize() const override;
    String getTokenText(int tokenId) const override;
    int getTokenId(const String& tokenText) const override;

    std::vector<String> getVocabulary() const override;
    std::vector<MergeRule> getMerges() const override;
    std::vector<double> getScores() const override;
    std::vector<int> getSpecialTokenIds() const override;
    int getUnkTokenId() const override;
    TokenizerParams getParams() const override;

    void save(const String& filename) const override;

    /**
     * @brief Replaces the model with the one stored under a root node written by save()
     * @param root Root node of the model file
     */
    void readModel(const FileNode& root);

protected:
    /** @brief Everything a trained tokenizer keeps */
    struct Model {
        Model() : unkId(-1) {}

        SymbolTable symbols;            //!< Learned entries first, special tokens last
        std::vector<MergeRule> merges;  //!< Empty for Unigram
        std::vector<double> scores;     //!< One per symbol
        std::vector<int> specialIds;
        int unkId;
    };

    explicit TokenizerBase(const TokenizerParams& params);

    /** @brief Short name stored in model files */
    virtual const char* typeName() const = 0;

    /** @brief Splitting unit of spans */
    virtual SymbolUnit symbolUnit() const { return UNIT_CHARACTER; }

    /** @brief True when spans end with the END_OF_WORD symbol */
    virtual bool usesEndOfWord() const { return false; }

    /** @brief True when params.unkToken is injected as the first special token */
    virtual bool usesUnkToken() const { return true; }

    /** @brief Mandatory single symbols of the vocabulary, sorted by content */
    virtual std::vector<std::string> buildAlphabet(const std::vector<SpanCount>& spans) const;

    /**
     * @brief True when initialVocabulary entries are built from their units by merge rules
     *
     * Merge variants then also keep every intermediate prefix of an entry;
     * otherwise entries are inserted whole.
     */
    virtual bool seedsByMerging() const { return true; }

    /**
     * @brief Multi-unit symbols contributed by params.initialVocabulary
     *
     * Ordered so that with seedsByMerging() every entry follows its prefix.
     * Entries already in the alphabet and repeated entries are skipped.
     */
    std::vector<std::string> seedSymbols(const std::vector<std::string>& alphabet) const;

    /** @brief Splits text into symbolUnit() units */
    std::vector<std::string> splitUnits(const std::string& text) const;

    /**
     * @brief Learns the algorithm-derived part of the vocabulary
     * @param spans Counted corpus spans
     * @param alphabet Result of buildAlphabet()
     * @param targetSize Requested size without special tokens
     * @param model Receives symbols, merges and scores
     * @param report Receives status and rounds
     */
    virtual void learn(const std::vector<SpanCount>& spans,
                       const std::vector<std::string>& alphabet,
                       size_t targetSize,
                       Model& model,
                       TrainReport& report) const = 0;

    /** @brief Appends the identifiers of one pretokenized span */
    virtual void encodeSpan(const std::string& span, std::vector<int>& ids) const = 0;

    /** @brief Rebuilds variant lookup structures after model_ changed */
    virtual void onModelChanged() = 0;

    /** @brief Readable form of non-special token content */
    virtual std::string toDisplay(const std::string& content) const;

    /** @brief Inverse of toDisplay(); false when the text is not a valid display form */
    virtual bool fromDisplay(const std::string& text, std::string& content) const;

    /**
     * @brief Merge training shared by BPE, BBPE and WordPiece
     *
     * Seeded entries get their rules first, so merges hold the seed rules
     * followed by the learned ones; report.rounds counts learned rules only.
     */
    void learnByMerging(const std::vector<SpanCount>& spans,
                        const std::vector<std::string>& alphabet,
                        size_t targetSize,
                        MergeObjective objective,
                        Model& model,
                        TrainReport& report) const;

    /**
     * @brief Installs a model and refreshes all lookups
     *
     * Must be called from the most-derived constructor or later.
     */
    void setModel(Model& model);

    bool isSpecial(int id) const;

    Model model_;
    TokenizerParams params_;
    Pretokenizer pretokenizer_;

private:
    void encodeOrdinary(const std::string& text, std::vector<int>& ids) const;

    Trie specialTrie_;
};

/** @brief Creates an untrained tokenizer of the given type */
Ptr<TokenizerBase> createTokenizerBase(TokenizerType type, const TokenizerParams& params);

}} // namespace cv::subword

#endif // OPENCV_SUBWORD_TOKENIZER_BASE_HPP

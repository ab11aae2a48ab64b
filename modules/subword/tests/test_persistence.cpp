/**
 * @file test_persistence.cpp
 * @brief Save/load tests for every tokenizer type and for TokenizerParams
 */

#include "test_precomp.hpp"
#include <fstream>

namespace opencv_test {
namespace {

// Helper function to create a temporary file with content
std::string createTempFile(const std::string& content, const std::string& extension = ".yml") {
    const std::string tempFileName = cv::tempfile(extension.c_str());
    std::ofstream file(tempFileName);
    file << content;
    file.close();
    return tempFileName;
}

const std::vector<String> PERSISTENCE_CORPUS = {
    "Hello world, it's 2025!",
    "quotes \"inside\" and back\\slashes",
    "tabs\tand\nnewlines  with   spaces",
    "caf\xC3\xA9 na\xC3\xAFve \xE2\x82\xAC 100",
    "Hello again world"
};

typedef std::tuple<TokenizerType, std::string> SaveLoadParams;

class TokenizerSaveLoad : public testing::TestWithParam<SaveLoadParams> {};

TEST_P(TokenizerSaveLoad, RoundTripPreservesModel) {
    const TokenizerType type = std::get<0>(GetParam());
    const std::string extension = std::get<1>(GetParam());

    TokenizerParams params;
    params.minPairFrequency = 0;
    params.initialAlphabet = {"\"", "\\"};
    Ptr<Tokenizer> tokenizer = Tokenizer::create(type, params);
    const size_t target = type == TOKENIZER_BBPE ? 300 : 70;
    tokenizer->train(PERSISTENCE_CORPUS, target, {"<|endoftext|>"});

    std::string saveFile = cv::tempfile(extension.c_str());
    tokenizer->save(saveFile);
    Ptr<Tokenizer> loaded = Tokenizer::load(saveFile);
    std::remove(saveFile.c_str());

    ASSERT_FALSE(loaded.empty());
    EXPECT_EQ(tokenizer->getType(), loaded->getType());
    EXPECT_EQ(tokenizer->getVocabulary(), loaded->getVocabulary());
    EXPECT_EQ(tokenizer->getSpecialTokenIds(), loaded->getSpecialTokenIds());
    EXPECT_EQ(tokenizer->getUnkTokenId(), loaded->getUnkTokenId());

    std::vector<double> scores = tokenizer->getScores(), loadedScores = loaded->getScores();
    ASSERT_EQ(scores.size(), loadedScores.size());
    for (size_t i = 0; i < scores.size(); ++i) {
        EXPECT_DOUBLE_EQ(scores[i], loadedScores[i]);
    }

    std::vector<MergeRule> merges = tokenizer->getMerges(), loadedMerges = loaded->getMerges();
    ASSERT_EQ(merges.size(), loadedMerges.size());
    for (size_t i = 0; i < merges.size(); ++i) {
        EXPECT_EQ(merges[i].left, loadedMerges[i].left);
        EXPECT_EQ(merges[i].right, loadedMerges[i].right);
        EXPECT_EQ(merges[i].merged, loadedMerges[i].merged);
    }

    TokenizerParams loadedParams = loaded->getParams();
    EXPECT_EQ(params.pattern, loadedParams.pattern);
    EXPECT_EQ(params.unkToken, loadedParams.unkToken);
    EXPECT_EQ(params.initialAlphabet, loadedParams.initialAlphabet);

    for (const auto& text : PERSISTENCE_CORPUS) {
        EXPECT_EQ(tokenizer->encode(text), loaded->encode(text));
    }
    const String withSpecial = "Hello<|endoftext|>world \"x\"";
    EXPECT_EQ(tokenizer->encode(withSpecial), loaded->encode(withSpecial));
    EXPECT_EQ(tokenizer->decode(tokenizer->encode(withSpecial)), loaded->decode(loaded->encode(withSpecial)));
}

INSTANTIATE_TEST_SUITE_P(Subword, TokenizerSaveLoad,
    testing::Combine(
        testing::Values(TOKENIZER_BPE, TOKENIZER_BBPE, TOKENIZER_WORDPIECE, TOKENIZER_UNIGRAM),
        testing::Values(std::string(".yml"), std::string(".json"))));

TEST(TokenizerPersistence, UntrainedBBPESurvivesSaveLoad) {
    Ptr<Tokenizer> tokenizer = createBBPETokenizer();
    std::string saveFile = cv::tempfile(".yml");
    tokenizer->save(saveFile);
    Ptr<Tokenizer> loaded = Tokenizer::load(saveFile);
    std::remove(saveFile.c_str());

    EXPECT_EQ(256u, loaded->getVocabSize());
    EXPECT_EQ(-1, loaded->getUnkTokenId());
    const std::string raw("\x00\"\\\xFF", 4);
    EXPECT_EQ(raw, loaded->decode(loaded->encode(raw)));
}

TEST(TokenizerPersistence, ParamsRoundTrip) {
    TokenizerParams params;
    params.minPairFrequency = 3;
    params.maxSubwordLength = 7;
    params.pattern = "\\s+|[^\\s]+";
    params.numThreads = 2;
    params.unkToken = "[UNK]";
    params.initialAlphabet = {"x", "\xC3\xA9", " "};
    params.initialVocabulary = {"Li", "\"q\"", "a b"};
    params.unigramSeedSize = 500;
    params.unigramPruneBatch = 4;
    params.unigramEmIterations = 3;

    std::string file = cv::tempfile(".yml");
    {
        FileStorage fs(file, FileStorage::WRITE);
        fs << "params" << "{";
        params.write(fs);
        fs << "}";
    }
    TokenizerParams loaded;
    {
        FileStorage fs(file, FileStorage::READ);
        loaded.read(fs["params"]);
    }
    std::remove(file.c_str());

    EXPECT_EQ(params.minPairFrequency, loaded.minPairFrequency);
    EXPECT_EQ(params.maxSubwordLength, loaded.maxSubwordLength);
    EXPECT_EQ(params.pattern, loaded.pattern);
    EXPECT_EQ(params.numThreads, loaded.numThreads);
    EXPECT_EQ(params.unkToken, loaded.unkToken);
    EXPECT_EQ(params.initialAlphabet, loaded.initialAlphabet);
    EXPECT_EQ(params.initialVocabulary, loaded.initialVocabulary);
    EXPECT_EQ(params.unigramSeedSize, loaded.unigramSeedSize);
    EXPECT_EQ(params.unigramPruneBatch, loaded.unigramPruneBatch);
    EXPECT_EQ(params.unigramEmIterations, loaded.unigramEmIterations);
}

TEST(TokenizerPersistence, RejectsBadModels) {
    const std::string unknownType = createTempFile(
        "%YAML:1.0\n---\ntokenizer_type: morpheme\nvocab: [ a ]\n");
    EXPECT_SUBWORD_ERROR(Tokenizer::load(unknownType), ERR_BAD_MODEL);
    std::remove(unknownType.c_str());

    const std::string noVocab = createTempFile(
        "%YAML:1.0\n---\ntokenizer_type: bpe\nscores: [ 1. ]\n");
    EXPECT_SUBWORD_ERROR(Tokenizer::load(noVocab), ERR_BAD_MODEL);
    std::remove(noVocab.c_str());

    const std::string badMerge = createTempFile(
        "%YAML:1.0\n---\ntokenizer_type: bpe\nvocab: [ a, b, \"<unk>\" ]\nscores: [ 1., 1., 1. ]\n"
        "merges: [ 0, 1, 5 ]\nspecial_ids: [ 2 ]\nunk_id: 2\n");
    EXPECT_SUBWORD_ERROR(Tokenizer::load(badMerge), ERR_BAD_MODEL);
    std::remove(badMerge.c_str());

    const std::string badScores = createTempFile(
        "%YAML:1.0\n---\ntokenizer_type: wordpiece\nvocab: [ a, b, \"<unk>\" ]\nscores: [ 1. ]\n"
        "merges: []\nspecial_ids: [ 2 ]\nunk_id: 2\n");
    EXPECT_SUBWORD_ERROR(Tokenizer::load(badScores), ERR_BAD_MODEL);
    std::remove(badScores.c_str());

    const std::string shortByteTable = createTempFile(
        "%YAML:1.0\n---\ntokenizer_type: bbpe\nvocab: [ a, b ]\nscores: [ 1., 1. ]\n"
        "merges: []\nspecial_ids: []\nunk_id: -1\n");
    EXPECT_SUBWORD_ERROR(Tokenizer::load(shortByteTable), ERR_BAD_MODEL);
    std::remove(shortByteTable.c_str());
}

TEST(TokenizerPersistence, MissingFileIsReported) {
    const std::string path = cv::tempfile(".yml");
    EXPECT_SUBWORD_ERROR(Tokenizer::load(path), cv::Error::StsError);
}

}} // namespace opencv_test::<anonymous>

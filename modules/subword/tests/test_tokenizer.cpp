/**
 * @file test_tokenizer.cpp
 * @brief Tests for BPE and byte-level BPE tokenizers and the shared tokenizer behaviour
 *
 * Covers training scenarios with literal expected rule lists, encoding and
 * decoding, special tokens, error codes, batch processing and thread-count
 * independence.
 */

#include "test_precomp.hpp"

namespace opencv_test {
namespace {

const std::vector<String> CLASSIC_CORPUS = {"low", "lower", "newest", "widest"};

std::vector<String> generatedCorpus(size_t count) {
    const char* words[] = {"lower", "newest", "widest", "low", "slow", "slowest", "wider",
                           "new", "news", "snow", "tower", "west", "wise", "owl"};
    const size_t n = sizeof(words) / sizeof(words[0]);
    std::vector<String> corpus;
    for (size_t i = 0; i < count; ++i) {
        corpus.push_back(String(words[(i * 7) % n]) + " " + words[(i * 3 + 1) % n] + " " +
                         words[(i * 11 + 5) % n] + ".");
    }
    return corpus;
}

void expectSameModel(const Ptr<Tokenizer>& a, const Ptr<Tokenizer>& b) {
    EXPECT_EQ(a->getType(), b->getType());
    EXPECT_EQ(a->getVocabulary(), b->getVocabulary());
    EXPECT_EQ(a->getSpecialTokenIds(), b->getSpecialTokenIds());
    EXPECT_EQ(a->getUnkTokenId(), b->getUnkTokenId());

    std::vector<double> scoresA = a->getScores(), scoresB = b->getScores();
    ASSERT_EQ(scoresA.size(), scoresB.size());
    for (size_t i = 0; i < scoresA.size(); ++i) {
        EXPECT_DOUBLE_EQ(scoresA[i], scoresB[i]) << "score " << i;
    }

    std::vector<MergeRule> mergesA = a->getMerges(), mergesB = b->getMerges();
    ASSERT_EQ(mergesA.size(), mergesB.size());
    for (size_t i = 0; i < mergesA.size(); ++i) {
        EXPECT_EQ(mergesA[i].left, mergesB[i].left) << "rule " << i;
        EXPECT_EQ(mergesA[i].right, mergesB[i].right) << "rule " << i;
        EXPECT_EQ(mergesA[i].merged, mergesB[i].merged) << "rule " << i;
    }
}

class TokenizerTest : public testing::Test {
protected:
    void SetUp() override {
        bpe = createBPETokenizer();
        // Alphabet d e i l n o r s t w </w> = 11, plus <unk>, plus two merges
        report = bpe->train(CLASSIC_CORPUS, 14);
    }

    Ptr<Tokenizer> bpe;
    TrainReport report;
};

TEST_F(TokenizerTest, BPEClassicCorpusLearnsExpectedRules) {
    EXPECT_EQ(TRAIN_TARGET_REACHED, report.status);
    EXPECT_EQ(14u, report.vocabSize);
    EXPECT_EQ(2u, report.rounds);
    EXPECT_EQ(14u, bpe->getVocabSize());

    std::vector<MergeRule> merges = bpe->getMerges();
    ASSERT_EQ(2u, merges.size());

    EXPECT_EQ("e", bpe->getTokenText(merges[0].left));
    EXPECT_EQ("s", bpe->getTokenText(merges[0].right));
    EXPECT_EQ("es", bpe->getTokenText(merges[0].merged));
    EXPECT_EQ(11, merges[0].merged);

    EXPECT_EQ("l", bpe->getTokenText(merges[1].left));
    EXPECT_EQ("o", bpe->getTokenText(merges[1].right));
    EXPECT_EQ("lo", bpe->getTokenText(merges[1].merged));
    EXPECT_EQ(12, merges[1].merged);

    EXPECT_EQ(13, bpe->getUnkTokenId());
    EXPECT_EQ(std::vector<int>({13}), bpe->getSpecialTokenIds());
    EXPECT_EQ("<unk>", bpe->getTokenText(13));
}

TEST_F(TokenizerTest, BPEAlphabetIsOrderedByContent) {
    const char* expected[] = {"d", "e", "i", "l", "n", "o", "r", "s", "t", "w", "</w>"};
    for (int id = 0; id < 11; ++id) {
        EXPECT_EQ(expected[id], bpe->getTokenText(id));
        EXPECT_EQ(id, bpe->getTokenId(expected[id]));
    }
    EXPECT_EQ(std::string(1, '\xFF'), bpe->getVocabulary()[10]);
    EXPECT_EQ(-1, bpe->getTokenId("xyz"));
}

TEST_F(TokenizerTest, BPEEncodeAppliesRulesInOrder) {
    // l o w e s t </w> -> (e,s) -> (l,o)
    std::vector<int> tokens = bpe->encode("lowest");
    EXPECT_EQ(std::vector<int>({12, 9, 11, 8, 10}), tokens);
    EXPECT_EQ("lowest", bpe->decode(tokens));
}

TEST_F(TokenizerTest, BPEUnknownCharactersMapToUnk) {
    std::vector<int> tokens = bpe->encode("lox");
    EXPECT_EQ(std::vector<int>({12, 13, 10}), tokens);
    EXPECT_EQ("lo<unk>", bpe->decode(tokens));
}

TEST_F(TokenizerTest, BPERuleListGrowsOncePerRound) {
    Ptr<Tokenizer> tokenizer = createBPETokenizer();
    for (size_t target = 13; target <= 18; ++target) {
        TrainReport r = tokenizer->train(CLASSIC_CORPUS, target);
        EXPECT_EQ(r.rounds, tokenizer->getMerges().size());
        EXPECT_EQ(target - 12, tokenizer->getMerges().size());
        EXPECT_EQ(target, tokenizer->getVocabSize());
    }
}

TEST_F(TokenizerTest, BPERoundTripOnCoveredText) {
    Ptr<Tokenizer> tokenizer = createBPETokenizer();
    std::vector<String> corpus = generatedCorpus(200);
    tokenizer->train(corpus, 80);

    const char* texts[] = {"slow owl", "lower west", "news. snow", ""};
    for (const char* text : texts) {
        EXPECT_EQ(String(text), tokenizer->decode(tokenizer->encode(text)));
    }
    EXPECT_LT(tokenizer->encode("slowest newest").size(), String("slowest newest").size());
}

TEST_F(TokenizerTest, BPEMinPairFrequencyStopsEarly) {
    TokenizerParams params;
    params.minPairFrequency = 1;
    Ptr<Tokenizer> tokenizer = createBPETokenizer(params);

    // (a,b) and (ab,</w>) occur twice, everything else once
    TrainReport r = tokenizer->train({"ab", "ab", "cd"}, 20);
    EXPECT_EQ(TRAIN_NO_MERGEABLE_CANDIDATES, r.status);
    EXPECT_EQ(2u, r.rounds);
    EXPECT_EQ(8u, r.vocabSize);
    EXPECT_EQ(8u, tokenizer->getVocabSize());
    EXPECT_EQ("ab</w>", tokenizer->getTokenText(tokenizer->getMerges()[1].merged));
}

TEST_F(TokenizerTest, SpecialTokensFollowLearnedVocabulary) {
    Ptr<Tokenizer> tokenizer = createBPETokenizer();
    TrainReport r = tokenizer->train(CLASSIC_CORPUS, 16, {"<s>", "</s>"});
    EXPECT_EQ(16u, r.vocabSize);
    EXPECT_EQ(std::vector<int>({13, 14, 15}), tokenizer->getSpecialTokenIds());
    EXPECT_EQ(14, tokenizer->getTokenId("<s>"));
    EXPECT_EQ(15, tokenizer->getTokenId("</s>"));

    std::vector<int> tokens = tokenizer->encode("<s>low</s>");
    EXPECT_EQ(std::vector<int>({14, 12, 9, 10, 15}), tokens);
    EXPECT_EQ("<s>low</s>", tokenizer->decode(tokens));
}

TEST_F(TokenizerTest, CollidingSpecialTokenIsRejected) {
    Ptr<Tokenizer> tokenizer = createBPETokenizer();
    TrainReport r = tokenizer->train(CLASSIC_CORPUS, 15, {"es"});
    EXPECT_EQ(TRAIN_NO_MERGEABLE_CANDIDATES, r.status);
    EXPECT_EQ(14u, r.vocabSize);
    EXPECT_EQ(std::vector<int>({13}), tokenizer->getSpecialTokenIds());
    EXPECT_EQ(11, tokenizer->getTokenId("es"));
}

TEST_F(TokenizerTest, InitialAlphabetExtendsCoverage) {
    TokenizerParams params;
    params.initialAlphabet = {"z", "\xC3\xA9"};
    Ptr<Tokenizer> tokenizer = createBPETokenizer(params);
    tokenizer->train({"ab"}, 8);

    EXPECT_GE(tokenizer->getTokenId("z"), 0);
    EXPECT_GE(tokenizer->getTokenId("\xC3\xA9"), 0);
    std::vector<int> tokens = tokenizer->encode("z\xC3\xA9");
    EXPECT_EQ("z\xC3\xA9", tokenizer->decode(tokens));
    EXPECT_EQ(std::find(tokens.begin(), tokens.end(), tokenizer->getUnkTokenId()), tokens.end());
}

TEST_F(TokenizerTest, ReadAlphabetFileTrimsLines) {
    const std::string path = cv::tempfile(".txt");
    {
        std::ofstream file(path);
        file << "x\n\n  y \r\n\xC3\xA9\n";
    }
    std::vector<String> alphabet = readAlphabetFile(path);
    std::remove(path.c_str());

    EXPECT_EQ(std::vector<String>({"x", "y", "\xC3\xA9"}), alphabet);
    EXPECT_SUBWORD_ERROR(readAlphabetFile(path), cv::Error::StsError);
}

TEST_F(TokenizerTest, InitialVocabularyKeepsWholeTokens) {
    TokenizerParams params;
    params.initialVocabulary = {"Li"};
    Ptr<Tokenizer> tokenizer = createBPETokenizer(params);

    // Alphabet L a b i </w> is 0..4, the seeded "Li" is 5
    TrainReport r = tokenizer->train({"ab"}, 10);
    EXPECT_EQ(5, tokenizer->getTokenId("Li"));
    std::vector<MergeRule> merges = tokenizer->getMerges();
    ASSERT_EQ(3u, merges.size());
    EXPECT_EQ(0, merges[0].left);
    EXPECT_EQ(3, merges[0].right);
    EXPECT_EQ(5, merges[0].merged);
    EXPECT_EQ(2u, r.rounds);
    EXPECT_EQ(9u, r.vocabSize);

    std::vector<int> tokens = tokenizer->encode("Li");
    EXPECT_EQ(std::vector<int>({5, 4}), tokens);
    EXPECT_EQ("Li", tokenizer->decode(tokens));
    EXPECT_EQ(std::vector<int>({5, 2, 4}), tokenizer->encode("Lib"));
}

TEST_F(TokenizerTest, InitialVocabularyCountsTowardTarget) {
    TokenizerParams params;
    params.initialVocabulary = {"xyz", "Li"};
    Ptr<Tokenizer> tokenizer = createBPETokenizer(params);

    // a b L i x y z </w> + xy xyz Li + <unk>
    EXPECT_SUBWORD_ERROR(tokenizer->train({"ab"}, 12), ERR_VOCAB_TARGET_TOO_SMALL);
    TrainReport r = tokenizer->train({"ab"}, 13);
    EXPECT_EQ(TRAIN_TARGET_REACHED, r.status);
    EXPECT_EQ(13u, tokenizer->getVocabSize());
    EXPECT_GE(tokenizer->getTokenId("xy"), 0);

    std::vector<int> tokens = tokenizer->encode("xyz");
    ASSERT_EQ(2u, tokens.size());
    EXPECT_EQ(tokenizer->getTokenId("xyz"), tokens[0]);

    params.initialVocabulary = {"ok", "bad\xC3"};
    EXPECT_SUBWORD_ERROR(createBPETokenizer(params)->train({"ab"}, 20), ERR_INVALID_INPUT);
}

TEST_F(TokenizerTest, BBPEInitialVocabularyEncodesAsOneId) {
    TokenizerParams params;
    params.initialVocabulary = {"Li", "\xE9\x94\x82"};
    Ptr<Tokenizer> tokenizer = createBBPETokenizer(params);
    tokenizer->train({"hello hello"}, 262);

    std::vector<int> tokens = tokenizer->encode("Li");
    ASSERT_EQ(1u, tokens.size());
    EXPECT_EQ(tokenizer->getTokenId("Li"), tokens[0]);
    EXPECT_GE(tokens[0], 256);

    tokens = tokenizer->encode("\xE9\x94\x82");
    ASSERT_EQ(1u, tokens.size());
    EXPECT_EQ("\xE9\x94\x82", tokenizer->decode(tokens));
}

TEST_F(TokenizerTest, ReadVocabularyFileKeepsWholeLines) {
    const std::string path = cv::tempfile(".txt");
    {
        std::ofstream file(path);
        file << "Li\n  He \r\n\n\xE9\x94\x82\n";
    }
    std::vector<String> vocabulary = readVocabularyFile(path);
    std::remove(path.c_str());

    EXPECT_EQ(std::vector<String>({"Li", "He", "\xE9\x94\x82"}), vocabulary);
    EXPECT_SUBWORD_ERROR(readVocabularyFile(path), cv::Error::StsError);
}

TEST_F(TokenizerTest, UntrainedCharacterTokenizerOnlyKnowsUnk) {
    Ptr<Tokenizer> tokenizer = createBPETokenizer();
    EXPECT_EQ(1u, tokenizer->getVocabSize());
    EXPECT_EQ(0, tokenizer->getUnkTokenId());
    EXPECT_EQ(std::vector<int>({0, 0}), tokenizer->encode("ab"));
}

TEST_F(TokenizerTest, BBPEEncodesBytesBeforeTraining) {
    Ptr<Tokenizer> tokenizer = createBBPETokenizer();
    EXPECT_EQ(256u, tokenizer->getVocabSize());
    EXPECT_EQ(-1, tokenizer->getUnkTokenId());

    std::vector<int> tokens = tokenizer->encode("\xC3\xA9");
    EXPECT_EQ(std::vector<int>({0xC3, 0xA9}), tokens);
    EXPECT_EQ("\xC3\xA9", tokenizer->decode(tokens));

    EXPECT_EQ("\xC4\xA0", tokenizer->getTokenText(' '));
    EXPECT_EQ(' ', tokenizer->getTokenId("\xC4\xA0"));
    EXPECT_EQ("a", tokenizer->getTokenText('a'));
}

TEST_F(TokenizerTest, BBPENeverRejectsBytes) {
    Ptr<Tokenizer> tokenizer = createBBPETokenizer();
    const std::string raw("\xFF\xFE\x00\x80", 4);
    std::vector<int> tokens = tokenizer->encode(raw);
    EXPECT_EQ(std::vector<int>({0xFF, 0xFE, 0x00, 0x80}), tokens);
    EXPECT_EQ(raw, tokenizer->decode(tokens));
}

TEST_F(TokenizerTest, BBPEReportsExhaustedCorpus) {
    Ptr<Tokenizer> tokenizer = createBBPETokenizer();
    TrainReport r = tokenizer->train({"aaaa", "aaaa"}, 260);

    EXPECT_EQ(TRAIN_NO_MERGEABLE_CANDIDATES, r.status);
    EXPECT_EQ(258u, r.vocabSize);
    std::vector<MergeRule> merges = tokenizer->getMerges();
    ASSERT_EQ(2u, merges.size());
    EXPECT_EQ('a', merges[0].left);
    EXPECT_EQ('a', merges[0].right);
    EXPECT_EQ(256, merges[0].merged);
    EXPECT_EQ(256, merges[1].left);
    EXPECT_EQ(256, merges[1].right);
    EXPECT_EQ(257, merges[1].merged);

    std::vector<int> tokens = tokenizer->encode("aaaaa");
    EXPECT_EQ(std::vector<int>({257, 'a'}), tokens);
    EXPECT_EQ("aaaaa", tokenizer->decode(tokens));
}

TEST_F(TokenizerTest, BBPETrainsOnNonUtf8Input) {
    Ptr<Tokenizer> tokenizer = createBBPETokenizer();
    const std::string raw("\xFF\xFE\xFF\xFE", 4);
    TrainReport r = tokenizer->train({raw, "hello hello"}, 258);
    EXPECT_EQ(TRAIN_TARGET_REACHED, r.status);
    EXPECT_EQ(raw, tokenizer->decode(tokenizer->encode(raw)));
}

TEST_F(TokenizerTest, TrainingErrors) {
    Ptr<Tokenizer> tokenizer = createBPETokenizer();
    EXPECT_SUBWORD_ERROR(tokenizer->train(std::vector<String>(), 100), ERR_EMPTY_CORPUS);
    EXPECT_SUBWORD_ERROR(tokenizer->train({"", ""}, 100), ERR_EMPTY_CORPUS);

    // l o w </w> + <unk>
    EXPECT_SUBWORD_ERROR(tokenizer->train({"low"}, 5), ERR_VOCAB_TARGET_TOO_SMALL);
    EXPECT_NO_THROW(tokenizer->train({"low"}, 6));

    EXPECT_SUBWORD_ERROR(createBBPETokenizer()->train({"abc"}, 256), ERR_VOCAB_TARGET_TOO_SMALL);
    EXPECT_SUBWORD_ERROR(tokenizer->train({"ok", "bad\xC3"}, 100), ERR_INVALID_INPUT);
}

TEST_F(TokenizerTest, FailedTrainingKeepsPreviousModel) {
    const std::vector<int> before = bpe->encode("lowest");
    EXPECT_SUBWORD_ERROR(bpe->train({"fine", "\xC3\x28"}, 30), ERR_INVALID_INPUT);
    EXPECT_SUBWORD_ERROR(bpe->train({"low"}, 3), ERR_VOCAB_TARGET_TOO_SMALL);
    EXPECT_EQ(14u, bpe->getVocabSize());
    EXPECT_EQ(before, bpe->encode("lowest"));
}

TEST_F(TokenizerTest, EncodeAndDecodeErrors) {
    EXPECT_SUBWORD_ERROR(bpe->encode("lo\xC3"), ERR_INVALID_INPUT);
    EXPECT_SUBWORD_ERROR(bpe->decode({0, 14}), ERR_UNKNOWN_IDENTIFIER);
    EXPECT_SUBWORD_ERROR(bpe->decode({-1}), ERR_UNKNOWN_IDENTIFIER);
    EXPECT_SUBWORD_ERROR(bpe->getTokenText(100), ERR_UNKNOWN_IDENTIFIER);
}

TEST_F(TokenizerTest, BatchEncoding) {
    std::vector<String> texts = {"lowest", "newer widest", "", "slow", "<unk>low"};
    std::vector<std::vector<int> > batchTokens = bpe->encodeBatch(texts);

    ASSERT_EQ(texts.size(), batchTokens.size());
    for (size_t i = 0; i < texts.size(); i++) {
        EXPECT_EQ(bpe->encode(texts[i]), batchTokens[i]);
    }

    std::vector<String> decoded = bpe->decodeBatch(batchTokens);
    ASSERT_EQ(texts.size(), decoded.size());
    for (size_t i = 0; i < texts.size(); i++) {
        EXPECT_EQ(bpe->decode(batchTokens[i]), decoded[i]);
    }
}

TEST_F(TokenizerTest, BatchEncodingPropagatesErrors) {
    std::vector<String> texts(32, "lowest");
    texts[17] = "bad\xC3";
    EXPECT_SUBWORD_ERROR(bpe->encodeBatch(texts), ERR_INVALID_INPUT);
    EXPECT_SUBWORD_ERROR(bpe->decodeBatch({{0}, {999}}), ERR_UNKNOWN_IDENTIFIER);
}

TEST_F(TokenizerTest, TrainingDoesNotDependOnThreadCount) {
    const std::vector<String> corpus = generatedCorpus(300);
    const TokenizerType types[] = {TOKENIZER_BPE, TOKENIZER_BBPE, TOKENIZER_WORDPIECE, TOKENIZER_UNIGRAM};
    for (TokenizerType type : types) {
        TokenizerParams single;
        single.numThreads = 1;
        TokenizerParams multi;
        multi.numThreads = 4;

        Ptr<Tokenizer> a = Tokenizer::create(type, single);
        Ptr<Tokenizer> b = Tokenizer::create(type, multi);
        const size_t target = type == TOKENIZER_BBPE ? 300 : 60;
        TrainReport ra = a->train(corpus, target);
        TrainReport rb = b->train(corpus, target);

        SCOPED_TRACE(cv::format("tokenizer type %d", (int)type));
        EXPECT_EQ(ra.status, rb.status);
        EXPECT_EQ(ra.rounds, rb.rounds);
        expectSameModel(a, b);
        EXPECT_EQ(a->encode("slowest owl tower"), b->encode("slowest owl tower"));
    }
}

TEST_F(TokenizerTest, CreateDispatchesOnType) {
    EXPECT_EQ(TOKENIZER_BPE, Tokenizer::create(TOKENIZER_BPE)->getType());
    EXPECT_EQ(TOKENIZER_BBPE, Tokenizer::create(TOKENIZER_BBPE)->getType());
    EXPECT_EQ(TOKENIZER_WORDPIECE, Tokenizer::create(TOKENIZER_WORDPIECE)->getType());
    EXPECT_EQ(TOKENIZER_UNIGRAM, Tokenizer::create(TOKENIZER_UNIGRAM)->getType());

    TokenizerParams params;
    params.pattern = "(";
    EXPECT_SUBWORD_ERROR(Tokenizer::create(TOKENIZER_BPE, params), cv::Error::StsBadArg);
}

}} // namespace opencv_test::<anonymous>

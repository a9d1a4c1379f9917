#include <gtest/gtest.h>
#include "tfidf/Errors.hpp"
#include "tfidf/TfidfGuesser.hpp"

#include <sstream>
#include <stdexcept>
#include <thread>

using namespace tfidf;

static GuesserConfig small_config() {
    GuesserConfig cfg;
    cfg.max_vocab_size = 50;
    cfg.unk_cutoff = 1;
    return cfg;
}

class GuesserTest : public ::testing::Test {
protected:
    void SetUp() override {
        guesser.train({"the cat sat", "the dog ran", "cats and dogs"}, {"A", "B", "C"});
    }

    TfidfGuesser guesser{small_config(), Analyzer::treebank_lower()};
};

TEST_F(GuesserTest, ExactQueryMatchesItsDocument) {
    Guess g = guesser.guess("the cat sat");
    EXPECT_EQ(g.guess, "A");
    EXPECT_EQ(g.question, "the cat sat");
    EXPECT_EQ(g.row, 0u);
    EXPECT_NEAR(g.confidence, 1.0, 1e-9);
}

TEST_F(GuesserTest, EmptyQueryTiesToFirstRow) {
    Guess g = guesser.guess("");
    EXPECT_EQ(g.guess, "A");
    EXPECT_EQ(g.confidence, 0.0);
}

TEST_F(GuesserTest, PartialQueryFindsClosest) {
    EXPECT_EQ(guesser.guess("where did the dog go").guess, "B");
    EXPECT_EQ(guesser.guess("Cats AND dogs!").guess, "C");
}

TEST_F(GuesserTest, TrainedShape) {
    EXPECT_EQ(guesser.state(), GuesserState::Trained);
    EXPECT_EQ(guesser.matrix().rows(), 3u);
    EXPECT_EQ(guesser.matrix().cols(), guesser.vocabulary().size());
    EXPECT_EQ(guesser.doc_frequencies().total_documents(), 3u);
    EXPECT_EQ(guesser.vocab_key(guesser.vocab_lookup("dog")), "dog");
    EXPECT_DOUBLE_EQ(guesser.global_freq(guesser.vocab_lookup("the")), 2.0 / 9.0);
}

TEST_F(GuesserTest, ConfidenceStaysInUnitInterval) {
    for (const char* q : {"the", "cat", "zebra", "the the the dog", "and sat ran"}) {
        Guess g = guesser.guess(q);
        EXPECT_GE(g.confidence, 0.0) << q;
        EXPECT_LE(g.confidence, 1.0) << q;
    }
}

TEST_F(GuesserTest, OnlyTopOneIsSupported) {
    EXPECT_EQ(guesser.guess("the cat sat", 1).size(), 1u);
    EXPECT_THROW(guesser.guess("the cat sat", 2), std::invalid_argument);
}

TEST_F(GuesserTest, RetrainRequiresFreshInstance) {
    EXPECT_THROW(guesser.train({"x"}, {"y"}), InvalidStateError);
    EXPECT_THROW(guesser.vocab_seen("x"), InvalidStateError);
    EXPECT_THROW(guesser.scan_document("x", "y"), InvalidStateError);
}

TEST(GuesserSingleDocTest, OnlyRowAlwaysWins) {
    TfidfGuesser g(small_config(), Analyzer::treebank_lower());
    g.train({"the quick brown fox"}, {"fox"});

    for (const char* q : {"quick", "brown fox jumps", "nothing in common", "the quick brown fox"}) {
        Guess r = g.guess(q);
        EXPECT_EQ(r.guess, "fox");
        EXPECT_GE(r.confidence, 0.0);
        EXPECT_LE(r.confidence, 1.0);
    }
}

TEST(GuesserStateTest, StepwiseTransitions) {
    TfidfGuesser g(small_config(), Analyzer::treebank_lower());
    EXPECT_EQ(g.state(), GuesserState::Empty);
    EXPECT_THROW(g.scan_document("a", "A"), InvalidStateError);
    EXPECT_THROW(g.finalize_docs(0), InvalidStateError);
    EXPECT_THROW(g.guess("a"), InvalidStateError);
    EXPECT_THROW(g.embed("a"), InvalidStateError);
    EXPECT_THROW(g.vocab_lookup("a"), InvalidStateError);

    g.vocab_seen("a", 2);
    EXPECT_EQ(g.state(), GuesserState::VocabBuilding);

    g.finalize_vocab();
    EXPECT_EQ(g.state(), GuesserState::VocabFinal);
    EXPECT_THROW(g.vocab_seen("b"), InvalidStateError);
    EXPECT_THROW(g.finalize_vocab(), InvalidStateError);
    EXPECT_THROW(g.inv_docfreq(0), InvalidStateError);

    g.scan_document("a b", "A");
    EXPECT_EQ(g.state(), GuesserState::DocFreqScanning);

    g.finalize_docs(1);
    EXPECT_EQ(g.state(), GuesserState::Trained);
    EXPECT_THROW(g.scan_document("a", "A"), InvalidStateError);
    EXPECT_NO_THROW(g.inv_docfreq(0));
}

TEST(GuesserStateTest, DocumentCountMismatchIsFatal) {
    TfidfGuesser g(small_config(), Analyzer::treebank_lower());
    g.vocab_seen("a");
    g.finalize_vocab();
    g.scan_document("a", "A");
    EXPECT_THROW(g.finalize_docs(2), DocumentCountMismatchError);
    EXPECT_NE(g.state(), GuesserState::Trained);
}

TEST(GuesserStateTest, StepwiseTrainingBuildsMatrix) {
    const std::vector<std::string> qs = {"the cat sat", "the dog ran", "cats and dogs"};
    const std::vector<std::string> as = {"A", "B", "C"};
    Analyzer analyzer = Analyzer::treebank_lower();

    TfidfGuesser g(small_config(), analyzer);
    for (const auto& q : qs) {
        for (const auto& t : analyzer.analyze(q)) g.vocab_seen(t);
    }
    g.finalize_vocab();
    for (size_t i = 0; i < qs.size(); ++i) g.scan_document(qs[i], as[i]);
    g.finalize_docs(qs.size());

    ASSERT_EQ(g.state(), GuesserState::Trained);
    EXPECT_EQ(g.matrix().rows(), qs.size());
    EXPECT_EQ(g.questions(), qs);
    EXPECT_EQ(g.answers(), as);

    Guess r = g.guess("the dog ran");
    EXPECT_EQ(r.guess, "B");
    EXPECT_NEAR(r.confidence, 1.0, 1e-9);

    TfidfGuesser batch(small_config(), analyzer);
    batch.train(qs, as);
    EXPECT_TRUE(g.matrix() == batch.matrix());
}

TEST(GuesserStateTest, SkippingScansNeedsEmptyVocabulary) {
    TfidfGuesser g(small_config(), Analyzer::treebank_lower());
    g.vocab_seen("a");
    g.finalize_vocab();
    EXPECT_THROW(g.finalize_docs(0), InvalidStateError);
    EXPECT_EQ(g.state(), GuesserState::VocabFinal);

    TfidfGuesser empty(small_config(), Analyzer::treebank_lower());
    empty.finalize_vocab();
    EXPECT_NO_THROW(empty.finalize_docs(0));
    EXPECT_EQ(empty.state(), GuesserState::Trained);
}

TEST(GuesserStateTest, MismatchedLabelsRejected) {
    TfidfGuesser g(small_config(), Analyzer::treebank_lower());
    EXPECT_THROW(g.train({"a", "b"}, {"x"}), std::invalid_argument);
    EXPECT_EQ(g.state(), GuesserState::Empty);
}

TEST(GuesserStateTest, MissingTokenizerRejected) {
    EXPECT_THROW({ TfidfGuesser g(small_config(), Analyzer{}); }, std::invalid_argument);
}

TEST(GuesserStateTest, EmptyCorpusCannotAnswer) {
    TfidfGuesser g(small_config(), Analyzer::treebank_lower());
    g.train({}, {});
    EXPECT_EQ(g.state(), GuesserState::Trained);
    EXPECT_EQ(g.vocabulary().size(), 1u);
    EXPECT_THROW(g.guess("anything"), EmptyCorpusError);
}

TEST(GuesserStateTest, CapacityErrorSurfacesFromTraining) {
    GuesserConfig cfg;
    cfg.max_vocab_size = 3;
    cfg.unk_cutoff = 1;
    TfidfGuesser g(cfg, Analyzer::treebank_lower());
    EXPECT_THROW(g.train({"one two three"}, {"x"}), CapacityError);
}

TEST(GuesserThreadsTest, ParallelMatrixMatchesSerial) {
    std::vector<std::string> qs, as;
    for (int i = 0; i < 40; ++i) {
        qs.push_back("doc " + std::to_string(i) + " shares words with doc " + std::to_string(i % 7));
        as.push_back("label" + std::to_string(i));
    }

    GuesserConfig serial = small_config();
    serial.max_vocab_size = 1000;
    GuesserConfig parallel = serial;
    parallel.threads = 4;

    TfidfGuesser a(serial, Analyzer::treebank_lower());
    TfidfGuesser b(parallel, Analyzer::treebank_lower());
    a.train(qs, as);
    b.train(qs, as);

    EXPECT_TRUE(a.matrix() == b.matrix());
    EXPECT_EQ(a.guess("doc 12 shares").row, b.guess("doc 12 shares").row);
}

TEST(GuesserLogTest, DiagnosticsGoToConfiguredStream) {
    std::ostringstream log;
    GuesserConfig cfg = small_config();
    cfg.log = &log;

    TfidfGuesser g(cfg, Analyzer::treebank_lower());
    g.train({"the cat sat", "the dog ran"}, {"A", "B"});
    g.guess("cat");

    const std::string out = log.str();
    EXPECT_NE(out.find("[vocab]"), std::string::npos);
    EXPECT_NE(out.find("[docs]"), std::string::npos);
    EXPECT_NE(out.find("document matrix is 2 by"), std::string::npos);
    EXPECT_NE(out.find("[guess] best match row 0"), std::string::npos);
}

TEST(GuesserLogTest, ConcurrentGuessesWriteWholeLines) {
    std::ostringstream log;
    GuesserConfig cfg = small_config();
    cfg.log = &log;

    TfidfGuesser g(cfg, Analyzer::treebank_lower());
    g.train({"the cat sat", "the dog ran", "cats and dogs"}, {"A", "B", "C"});
    log.str("");

    const int kThreads = 4;
    const int kPerThread = 50;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&g]() {
            for (int i = 0; i < kPerThread; ++i) g.guess("the dog ran");
        });
    }
    for (auto& t : threads) t.join();

    std::istringstream lines(log.str());
    std::string line;
    int count = 0;
    while (std::getline(lines, line)) {
        EXPECT_EQ(line.rfind("[guess] best match row 1, similarity ", 0), 0u) << line;
        ++count;
    }
    EXPECT_EQ(count, kThreads * kPerThread);
}

TEST(GuesserMoveTest, MovedGuesserKeepsWorking) {
    TfidfGuesser g(small_config(), Analyzer::treebank_lower());
    g.train({"red apple", "green pear", "yellow banana"}, {"apple", "pear", "banana"});

    const Guess before = g.guess("a green pear");
    EXPECT_EQ(before.guess, "pear");
    EXPECT_GT(before.confidence, 0.0);

    TfidfGuesser moved = std::move(g);
    const Guess after = moved.guess("a green pear");
    EXPECT_EQ(after.guess, before.guess);
    EXPECT_EQ(after.row, before.row);
    EXPECT_EQ(after.confidence, before.confidence);
}

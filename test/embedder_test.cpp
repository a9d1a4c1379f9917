#include <gtest/gtest.h>
#include "tfidf/Embedder.hpp"
#include "tfidf/Errors.hpp"

#include <cmath>
#include <memory>

using namespace tfidf;

class EmbedderTest : public ::testing::Test {
protected:
    void SetUp() override {
        analyzer = Analyzer::treebank_lower();
        for (const auto& doc : corpus) {
            for (const auto& t : analyzer.analyze(doc)) vocab.observe(t);
        }
        vocab.finalize(50, 1);

        docs = std::make_unique<DocFrequencyTracker>(vocab);
        for (const auto& doc : corpus) docs->scan(doc, analyzer);
        docs->finalize();
    }

    std::vector<std::string> corpus = {"the cat sat", "the dog ran", "cats and dogs"};
    Analyzer analyzer;
    Vocabulary vocab;
    std::unique_ptr<DocFrequencyTracker> docs;
};

TEST_F(EmbedderTest, RequiresFinalizedDocuments) {
    DocFrequencyTracker open(vocab);
    Embedder emb(vocab, open, analyzer);
    EXPECT_THROW(emb.embed("the cat"), InvalidStateError);
    EXPECT_THROW(emb.inverse_document_frequency(0), InvalidStateError);
}

TEST_F(EmbedderTest, WeightsAreTermFrequencyTimesIdf) {
    Embedder emb(vocab, *docs, analyzer);
    std::vector<double> v = emb.embed("the cat sat");

    ASSERT_EQ(v.size(), vocab.size());
    const double idf1 = std::log10(3.0 / 2.0); // df = 1 of 3 docs
    EXPECT_DOUBLE_EQ(v[vocab.lookup("the")], 0.0); // df = 2 -> log10(3/3)
    EXPECT_DOUBLE_EQ(v[vocab.lookup("cat")], idf1 / 3.0);
    EXPECT_DOUBLE_EQ(v[vocab.lookup("sat")], idf1 / 3.0);
    EXPECT_DOUBLE_EQ(v[vocab.lookup("dog")], 0.0);
}

TEST_F(EmbedderTest, RepeatedTokensRaiseTermFrequency) {
    Embedder emb(vocab, *docs, analyzer);
    std::vector<double> v = emb.embed("dog dog ran");
    const double idf1 = std::log10(3.0 / 2.0);
    EXPECT_DOUBLE_EQ(v[vocab.lookup("dog")], 2.0 * idf1 / 3.0);
    EXPECT_DOUBLE_EQ(v[vocab.lookup("ran")], idf1 / 3.0);
}

TEST_F(EmbedderTest, UnknownTokensCountTowardsLength) {
    Embedder emb(vocab, *docs, analyzer);
    std::vector<double> v = emb.embed("cat zebra");
    EXPECT_DOUBLE_EQ(v[vocab.lookup("cat")], 0.5 * std::log10(3.0 / 2.0));
    EXPECT_EQ(v[vocab.unk_id()], 0.0); // <UNK> never appeared in training
}

TEST_F(EmbedderTest, EmptyTextIsZeroVector) {
    Embedder emb(vocab, *docs, analyzer);
    std::vector<double> v = emb.embed("");
    ASSERT_EQ(v.size(), vocab.size());
    for (double x : v) EXPECT_EQ(x, 0.0);
}

TEST_F(EmbedderTest, Deterministic) {
    Embedder emb(vocab, *docs, analyzer);
    EXPECT_EQ(emb.embed("the dog and the cat"), emb.embed("the dog and the cat"));
}

TEST_F(EmbedderTest, DocTfidfKeysByIdAndRawToken) {
    Embedder emb(vocab, *docs, analyzer);
    auto d = emb.doc_tfidf("The cat");

    ASSERT_EQ(d.size(), 2u);
    const uint32_t the = vocab.lookup("the");
    const uint32_t cat = vocab.lookup("cat");
    ASSERT_TRUE(d.count({the, "The"}));
    ASSERT_TRUE(d.count({cat, "cat"}));
    EXPECT_DOUBLE_EQ(d.at({the, "The"}), 0.0);
    EXPECT_DOUBLE_EQ(d.at({cat, "cat"}), 0.5 * std::log10(3.0 / 2.0));
}

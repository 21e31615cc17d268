/**
 * @file test_similarity.cpp
 * @brief Information content, similarity measures and lemmatized lookups
 */

#include "fixtures/session_fixture.hpp"
#include <core/errors.hpp>
#include <query/information_content.hpp>
#include <query/morphy.hpp>
#include <query/similarity.hpp>
#include <query/taxonomy.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>

using namespace Lexicore;

namespace {

std::vector<std::string> word_ids(const std::vector<Word>& items) {
    std::vector<std::string> out;
    for (const auto& item : items) out.push_back(item.id);
    return out;
}

} // namespace

class SimilarityTest : public Fixtures::SessionTest {
protected:
    void SetUp() override {
        Fixtures::SessionTest::SetUp();
        add_xml("mini-en.xml", Fixtures::MINI_EN);
        add_xml("mini-fr.xml", Fixtures::MINI_FR);
        wn = std::make_unique<Wordnet>(*session, "mini-en");
    }

    void TearDown() override {
        wn.reset();
        Fixtures::SessionTest::TearDown();
    }

    Synset get(const std::string& id) {
        auto ss = wn->synset(id);
        if (!ss) throw std::runtime_error("missing synset " + id);
        return *ss;
    }

    IcWeights corpus_ic() {
        return compute_ic(*wn, {"cat", "cats", "animal", "Dog"});
    }

    std::unique_ptr<Wordnet> wn;
};

TEST_F(SimilarityTest, WuPalmer) {
    EXPECT_DOUBLE_EQ(wup_similarity(*wn, get("ss-cat"), get("ss-dog")), 0.75);
    EXPECT_DOUBLE_EQ(wup_similarity(*wn, get("ss-cat"), get("ss-animal")), 2.0 / 3.0);
    EXPECT_DOUBLE_EQ(wup_similarity(*wn, get("ss-cat"), get("ss-cat")), 1.0);
    EXPECT_DOUBLE_EQ(wup_similarity(*wn, get("ss-run-move"), get("ss-run-operate")), 0.0);
    EXPECT_THROW(wup_similarity(*wn, get("ss-cat"), get("ss-big")), Error);
}

TEST_F(SimilarityTest, LeacockChodorow) {
    int depth = taxonomy_depth(*wn, PartOfSpeech::Noun);
    EXPECT_DOUBLE_EQ(lch_similarity(*wn, get("ss-cat"), get("ss-dog"), depth), std::log(2.0));
    EXPECT_DOUBLE_EQ(lch_similarity(*wn, get("ss-cat"), get("ss-cat"), depth), std::log(6.0));
    EXPECT_DOUBLE_EQ(lch_similarity(*wn, get("ss-big"), get("ss-small"), 1), 0.0);
    EXPECT_THROW(lch_similarity(*wn, get("ss-cat"), get("ss-dog"), 0), Error);
}

TEST_F(SimilarityTest, ComputedWeightsPropagateToHypernyms) {
    auto ic = corpus_ic();
    const auto& nouns = ic.tables.at("n");
    EXPECT_DOUBLE_EQ(nouns.total, 5.0);
    EXPECT_DOUBLE_EQ(nouns.weights.at("ss-cat"), 3.0);
    EXPECT_DOUBLE_EQ(nouns.weights.at("ss-dog"), 2.0);
    EXPECT_DOUBLE_EQ(nouns.weights.at("ss-mammal"), 4.0);
    EXPECT_DOUBLE_EQ(nouns.weights.at("ss-animal"), 5.0);
    EXPECT_DOUBLE_EQ(nouns.weights.at("ss-entity"), 5.0);
    EXPECT_DOUBLE_EQ(ic.tables.at("v").weights.at("ss-run-move"), 1.0);
    EXPECT_DOUBLE_EQ(ic.tables.at("a").total, 1.0);

    EXPECT_DOUBLE_EQ(synset_probability(get("ss-mammal"), ic), 0.8);
    EXPECT_DOUBLE_EQ(information_content(get("ss-entity"), ic), 0.0);
    EXPECT_DOUBLE_EQ(information_content(get("ss-cat"), ic), -std::log(0.6));
}

TEST_F(SimilarityTest, UndistributedWeightCountsEverySynset) {
    // "run" names two verb synsets; without distribution each gets the full count.
    auto split = compute_ic(*wn, {"run"}, true, 0.0);
    auto whole = compute_ic(*wn, {"run"}, false, 0.0);
    EXPECT_DOUBLE_EQ(split.tables.at("v").weights.at("ss-run-move"), 0.5);
    EXPECT_DOUBLE_EQ(whole.tables.at("v").weights.at("ss-run-move"), 1.0);
    EXPECT_DOUBLE_EQ(whole.tables.at("v").total, 2.0);
}

TEST_F(SimilarityTest, InformationContentMeasures) {
    auto ic = corpus_ic();
    auto cat = get("ss-cat");
    auto dog = get("ss-dog");

    EXPECT_DOUBLE_EQ(res_similarity(*wn, cat, dog, ic), -std::log(0.8));
    EXPECT_DOUBLE_EQ(res_similarity(*wn, cat, get("ss-entity"), ic), 0.0);
    EXPECT_NEAR(jcn_similarity(*wn, cat, dog, ic), 1.0 / std::log(8.0 / 3.0), 1e-12);
    EXPECT_NEAR(lin_similarity(*wn, cat, dog, ic), 2.0 * std::log(1.25) / std::log(25.0 / 6.0), 1e-12);

    EXPECT_DOUBLE_EQ(jcn_similarity(*wn, cat, cat, ic), 1.0);
    EXPECT_DOUBLE_EQ(lin_similarity(*wn, cat, cat, ic), 1.0);
    EXPECT_DOUBLE_EQ(res_similarity(*wn, get("ss-big"), get("ss-small"), ic), 0.0);
    EXPECT_THROW(lin_similarity(*wn, cat, get("ss-run-move"), ic), Error);
}

TEST_F(SimilarityTest, LoadsIcFile) {
    auto file = tmp.write("ic-mini.dat", "wnver::test\n1n 10 ROOT\n2n 4\n7v 3 ROOT\n");
    auto ic = load_ic(*wn, file, [](unsigned long offset, char pos) -> std::string {
        if (pos == 'n') return offset == 1 ? "ss-entity" : "ss-animal";
        return "ss-run-move";
    });
    EXPECT_DOUBLE_EQ(ic.tables.at("n").total, 10.0);
    EXPECT_DOUBLE_EQ(ic.tables.at("v").total, 3.0);
    EXPECT_DOUBLE_EQ(synset_probability(get("ss-animal"), ic), 0.4);
    EXPECT_DOUBLE_EQ(synset_probability(get("ss-mammal"), ic), 0.0);
    EXPECT_DOUBLE_EQ(information_content(get("ss-entity"), ic), 0.0);

    auto by_offset = load_ic(*wn, file);
    EXPECT_DOUBLE_EQ(by_offset.tables.at("n").weights.at("mini-en-00000002-n"), 4.0);
}

TEST_F(SimilarityTest, IcFileErrors) {
    EXPECT_THROW(load_ic(*wn, tmp.path() / "missing.dat"), NotFoundError);
    EXPECT_THROW(load_ic(*wn, tmp.write("a.dat", "header\n1n\n")), ParseError);
    EXPECT_THROW(load_ic(*wn, tmp.write("b.dat", "header\nxn 4\n")), ParseError);
    EXPECT_THROW(load_ic(*wn, tmp.write("c.dat", "header\n1q 4\n")), ParseError);
    EXPECT_THROW(load_ic(*wn, tmp.write("d.dat", "header\n1n four\n")), ParseError);
    EXPECT_THROW(load_ic(*wn, tmp.write("e.dat", "header\n1n 4 LEAF\n")), ParseError);

    Wordnet both(*session);
    EXPECT_THROW(load_ic(both, tmp.write("f.dat", "header\n1n 4\n")), Error);
}

TEST_F(SimilarityTest, MorphyOverWordnetKeepsKnownLemmas) {
    Morphy morphy(*wn);
    EXPECT_TRUE(morphy.initialized());
    EXPECT_EQ(morphy.analyze("cats", PartOfSpeech::Noun).at("n"), std::set<std::string>{"cat"});
    EXPECT_EQ(morphy.analyze("runs", PartOfSpeech::Verb).at("v"), std::set<std::string>{"run"});
    EXPECT_EQ(morphy.analyze("smaller", PartOfSpeech::Adjective).at("a"), std::set<std::string>{"small"});

    auto result = morphy.analyze("mammals");
    EXPECT_EQ(result.count(""), 0u);
    EXPECT_EQ(result.at("n"), std::set<std::string>{"mammal"});
    EXPECT_TRUE(result.at("v").empty());
    EXPECT_TRUE(result.at("a").empty());
    EXPECT_TRUE(result.at("r").empty());
}

TEST_F(SimilarityTest, LemmatizerFallbackFindsBaseForms) {
    EXPECT_TRUE(wn->words("mammals").empty());

    WordnetOptions options;
    options.lemmatizer = Morphy(*wn);
    Wordnet lemmatized(*session, "mini-en", "", options);

    EXPECT_EQ(word_ids(lemmatized.words("mammals")), std::vector<std::string>{"w-mammal"});
    EXPECT_EQ(word_ids(lemmatized.words("smaller", PartOfSpeech::Adjective)), std::vector<std::string>{"w-small"});
    EXPECT_EQ(lemmatized.synsets("dogs").size(), 0u);  // lemma is "Dog"
    ASSERT_EQ(lemmatized.senses("runs").size(), 2u);
    EXPECT_EQ(word_ids(lemmatized.words("cats")), std::vector<std::string>{"w-cat"});

    options.search_all_forms = false;
    Wordnet exact(*session, "mini-en", "", options);
    EXPECT_TRUE(exact.words("mammals").empty());
}

TEST_F(SimilarityTest, NormalizerAppliesBeforeLookup) {
    WordnetOptions options;
    options.normalizer = [](const std::string& form) {
        std::string out = form;
        std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::tolower(c); });
        return out;
    };
    Wordnet folded(*session, "mini-en", "", options);

    EXPECT_EQ(word_ids(folded.words("CAT")), std::vector<std::string>{"w-cat"});
    EXPECT_TRUE(folded.words("Dog").empty());
    EXPECT_EQ(folded.words().size(), wn->words().size());
}

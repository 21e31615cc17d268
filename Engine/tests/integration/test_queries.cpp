/**
 * @file test_queries.cpp
 * @brief Wordnet query façade over an installed English/French pair
 */

#include "fixtures/session_fixture.hpp"
#include <query/wordnet.hpp>
#include <algorithm>

using namespace Lexicore;

namespace {

template <typename T>
std::vector<std::string> ids(const std::vector<T>& items) {
    std::vector<std::string> out;
    for (const auto& item : items) out.push_back(item.id);
    return out;
}

} // namespace

class QueryTest : public Fixtures::SessionTest {
protected:
    void SetUp() override {
        Fixtures::SessionTest::SetUp();
        add_xml("mini-en.xml", Fixtures::MINI_EN);
        add_xml("mini-fr.xml", Fixtures::MINI_FR);
    }
};

TEST_F(QueryTest, UnknownFormGivesEmptyResults) {
    Wordnet wn(*session);
    EXPECT_TRUE(wn.words("zebra").empty());
    EXPECT_TRUE(wn.senses("zebra").empty());
    EXPECT_TRUE(wn.synsets("zebra").empty());
    EXPECT_FALSE(wn.word("w-zebra").has_value());
    EXPECT_FALSE(wn.synset("ss-zebra").has_value());
    EXPECT_FALSE(wn.ili("i0").has_value());
}

TEST_F(QueryTest, FanOutGroupsByInstallOrder) {
    Wordnet wn(*session);
    EXPECT_EQ(ids(wn.words("animal")), (std::vector<std::string>{"w-animal", "fr-animal"}));

    auto lexicons = wn.lexicons();
    ASSERT_EQ(lexicons.size(), 2u);
    EXPECT_EQ(lexicons[0].lexicon.id, "mini-en");
    EXPECT_EQ(lexicons[1].lexicon.id, "mini-fr");
    EXPECT_LT(lexicons[0].rowid, lexicons[1].rowid);
}

TEST_F(QueryTest, LemmaMatchIsExact) {
    Wordnet wn(*session);
    EXPECT_EQ(ids(wn.words("Dog")), std::vector<std::string>{"w-Dog"});
    EXPECT_TRUE(wn.words("dog").empty());
}

TEST_F(QueryTest, OtherFormsMatch) {
    Wordnet wn(*session);
    EXPECT_EQ(ids(wn.words("cats")), std::vector<std::string>{"w-cat"});
    EXPECT_EQ(ids(wn.synsets("cats")), std::vector<std::string>{"ss-cat"});
}

TEST_F(QueryTest, PosFilter) {
    Wordnet wn(*session);
    EXPECT_EQ(ids(wn.synsets("run", PartOfSpeech::Verb)),
              (std::vector<std::string>{"ss-run-move", "ss-run-operate"}));
    EXPECT_TRUE(wn.synsets("run", PartOfSpeech::Noun).empty());
    EXPECT_EQ(wn.synsets("", PartOfSpeech::Adjective).size(), 2u);
}

TEST_F(QueryTest, SensesFollowRank) {
    Wordnet wn(*session);
    auto senses = wn.senses("run");
    EXPECT_EQ(ids(senses), (std::vector<std::string>{"s-run-2", "s-run-1"}));
    EXPECT_EQ(senses[0].rank, 0);
    EXPECT_EQ(senses[0].synset, "ss-run-move");
}

TEST_F(QueryTest, WordRoundTripsDetails) {
    auto cat = Wordnet(*session).word("w-cat");
    ASSERT_TRUE(cat.has_value());
    EXPECT_EQ(cat->lexicon, "mini-en");
    ASSERT_EQ(cat->forms.size(), 1u);
    EXPECT_EQ(cat->forms[0].tags, (std::vector<Tag>{{"number", "plural"}}));
    ASSERT_EQ(cat->pronunciations.size(), 1u);
    EXPECT_EQ(cat->pronunciations[0].variety, "GB");

    auto sense = Wordnet(*session).sense("s-cat-1");
    ASSERT_TRUE(sense.has_value());
    EXPECT_EQ(sense->sensekey, "cat%1:05:00::");
    EXPECT_EQ(sense->counts, std::vector<int>{18});
}

TEST_F(QueryTest, DefinitionsKeepWhitespace) {
    Wordnet wn(*session);
    EXPECT_EQ(wn.definition("ss-cat"), "  feline mammal usually having thick soft fur  ");
    EXPECT_FALSE(wn.definition("ss-dog").has_value());
    EXPECT_FALSE(wn.definition("ss-missing").has_value());
}

TEST_F(QueryTest, IliGathersEveryLexicon) {
    auto result = Wordnet(*session).ili("i46360");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->entry.status, "presupposed");
    EXPECT_EQ(ids(result->synsets), (std::vector<std::string>{"ss-cat", "fr-ss-chat"}));

    EXPECT_EQ(ids(Wordnet(*session).synsets_by_ili("i35563")),
              (std::vector<std::string>{"ss-animal", "fr-ss-animal"}));
}

TEST_F(QueryTest, HyponymsAreDerivedFromHypernyms) {
    Wordnet wn(*session);
    auto mammal = wn.synset("ss-mammal");
    ASSERT_TRUE(mammal.has_value());
    EXPECT_EQ(ids(wn.hyponyms(*mammal)), (std::vector<std::string>{"ss-cat", "ss-dog"}));
    EXPECT_EQ(ids(wn.hypernyms(*mammal)), std::vector<std::string>{"ss-animal"});
    EXPECT_EQ(ids(wn.related(*mammal, "hyponym")), (std::vector<std::string>{"ss-cat", "ss-dog"}));

    auto entity = wn.synset("ss-entity");
    ASSERT_TRUE(entity.has_value());
    EXPECT_TRUE(wn.hypernyms(*entity).empty());
}

TEST_F(QueryTest, RelationsStayInsideTheLexicon) {
    Wordnet wn(*session);
    auto animal = wn.synset("ss-animal");
    ASSERT_TRUE(animal.has_value());
    EXPECT_EQ(ids(wn.hyponyms(*animal)), std::vector<std::string>{"ss-mammal"});

    auto fr_animal = wn.synset("fr-ss-animal");
    ASSERT_TRUE(fr_animal.has_value());
    EXPECT_EQ(ids(wn.hyponyms(*fr_animal)), std::vector<std::string>{"fr-ss-chat"});
}

TEST_F(QueryTest, SymmetricSenseRelationWorksBothWays) {
    Wordnet wn(*session);
    auto big = wn.sense("s-big-1");
    auto small = wn.sense("s-small-1");
    ASSERT_TRUE(big && small);
    EXPECT_EQ(ids(wn.sense_related(*big, "antonym")), std::vector<std::string>{"s-small-1"});
    EXPECT_EQ(ids(wn.sense_related(*small, "antonym")), std::vector<std::string>{"s-big-1"});
}

TEST_F(QueryTest, TranslateHopsThroughIli) {
    Wordnet wn(*session);
    auto cat = wn.synset("ss-cat");
    ASSERT_TRUE(cat.has_value());
    EXPECT_EQ(ids(wn.translate(*cat, "mini-fr")), std::vector<std::string>{"fr-ss-chat"});
    EXPECT_TRUE(wn.translate(*cat, "absent").empty());

    auto mammal = wn.synset("ss-mammal");
    EXPECT_TRUE(wn.translate(*mammal, "mini-fr").empty());
}

TEST_F(QueryTest, LexiconFilter) {
    EXPECT_EQ(ids(Wordnet(*session, "mini-fr").words("animal")), std::vector<std::string>{"fr-animal"});
    EXPECT_EQ(ids(Wordnet(*session, "mini-en:2.0").words("animal")), std::vector<std::string>{"w-animal"});
    EXPECT_TRUE(Wordnet(*session, "mini-en:9.9").words("animal").empty());
    EXPECT_EQ(Wordnet(*session, "mini-fr mini-en").words("animal").size(), 2u);
    EXPECT_TRUE(Wordnet(*session, "unknown").words("animal").empty());
    EXPECT_FALSE(Wordnet(*session, "mini-fr").synset("ss-cat").has_value());
}

TEST_F(QueryTest, LanguageFilter) {
    Wordnet fr(*session, "*", "fr");
    EXPECT_EQ(ids(fr.words("animal")), std::vector<std::string>{"fr-animal"});
    EXPECT_EQ(fr.definition("fr-ss-chat"), "mammifère félin");

    auto result = fr.ili("i46360");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(ids(result->synsets), std::vector<std::string>{"fr-ss-chat"});
}

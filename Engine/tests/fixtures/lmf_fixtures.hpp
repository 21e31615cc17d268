/**
 * @file lmf_fixtures.hpp
 * @brief Inline WN-LMF documents and a scratch-directory helper shared by the test suites
 */

#pragma once

#include <session/config.hpp>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <unistd.h>

namespace Lexicore::Fixtures {

#define LMF_HEADER \
    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n" \
    "<!DOCTYPE LexicalResource SYSTEM \"http://globalwordnet.github.io/schemas/WN-LMF-1.3.dtd\">\n" \
    "<LexicalResource xmlns:dc=\"https://globalwordnet.github.io/schemas/dc/\">\n"

// Two words sensing into one defined synset.
inline const std::string CAT_FELINE =
    LMF_HEADER
    R"(  <Lexicon id="test-en" label="Test English" language="en" email="test@example.com"
           license="https://creativecommons.org/licenses/by/4.0/" version="1.0">
    <LexicalEntry id="w-cat">
      <Lemma writtenForm="cat" partOfSpeech="n"/>
      <Sense id="s-cat-1" synset="ss-cat"/>
    </LexicalEntry>
    <LexicalEntry id="w-feline">
      <Lemma writtenForm="feline" partOfSpeech="n"/>
      <Sense id="s-feline-1" synset="ss-cat"/>
    </LexicalEntry>
    <Synset id="ss-cat" ili="i46360" partOfSpeech="n">
      <Definition>feline mammal usually having thick soft fur</Definition>
    </Synset>
  </Lexicon>
</LexicalResource>
)";

// Small taxonomy: entity > animal > mammal > {cat, dog}, plus verbs and
// adjectives for rank, form and sense-relation lookups. Only hypernym edges
// and one antonym direction are stated.
inline const std::string MINI_EN =
    LMF_HEADER
    R"(  <Lexicon id="mini-en" label="Mini English" language="en" email="mini@example.com"
           license="https://creativecommons.org/licenses/by/4.0/" version="2.0"
           url="https://example.com/mini" citation="Mini, 2024">
    <LexicalEntry id="w-entity">
      <Lemma writtenForm="entity" partOfSpeech="n"/>
      <Sense id="s-entity-1" synset="ss-entity"/>
    </LexicalEntry>
    <LexicalEntry id="w-animal">
      <Lemma writtenForm="animal" partOfSpeech="n"/>
      <Sense id="s-animal-1" synset="ss-animal"/>
    </LexicalEntry>
    <LexicalEntry id="w-mammal">
      <Lemma writtenForm="mammal" partOfSpeech="n"/>
      <Sense id="s-mammal-1" synset="ss-mammal"/>
    </LexicalEntry>
    <LexicalEntry id="w-cat">
      <Lemma writtenForm="cat" partOfSpeech="n">
        <Pronunciation variety="GB">kæt</Pronunciation>
      </Lemma>
      <Form writtenForm="cats">
        <Tag category="number">plural</Tag>
      </Form>
      <Sense id="s-cat-1" synset="ss-cat" dc:identifier="cat%1:05:00::">
        <Example>the cat sat on the mat</Example>
        <Count>18</Count>
      </Sense>
    </LexicalEntry>
    <LexicalEntry id="w-Dog">
      <Lemma writtenForm="Dog" partOfSpeech="n"/>
      <Sense id="s-Dog-1" synset="ss-dog"/>
    </LexicalEntry>
    <LexicalEntry id="w-run">
      <Lemma writtenForm="run" partOfSpeech="v"/>
      <Sense id="s-run-2" synset="ss-run-move"/>
      <Sense id="s-run-1" synset="ss-run-operate"/>
    </LexicalEntry>
    <LexicalEntry id="w-big">
      <Lemma writtenForm="big" partOfSpeech="a"/>
      <Sense id="s-big-1" synset="ss-big">
        <SenseRelation relType="antonym" target="s-small-1"/>
      </Sense>
    </LexicalEntry>
    <LexicalEntry id="w-small">
      <Lemma writtenForm="small" partOfSpeech="a"/>
      <Sense id="s-small-1" synset="ss-small"/>
    </LexicalEntry>
    <Synset id="ss-entity" ili="i35545" partOfSpeech="n">
      <Definition>that which is perceived to have its own distinct existence</Definition>
    </Synset>
    <Synset id="ss-animal" ili="i35563" partOfSpeech="n">
      <Definition>a living organism</Definition>
      <SynsetRelation relType="hypernym" target="ss-entity"/>
    </Synset>
    <Synset id="ss-mammal" partOfSpeech="n">
      <Definition>a warm-blooded vertebrate</Definition>
      <SynsetRelation relType="hypernym" target="ss-animal"/>
    </Synset>
    <Synset id="ss-cat" ili="i46360" partOfSpeech="n">
      <Definition>  feline mammal usually having thick soft fur  </Definition>
      <Example>cats purr</Example>
      <SynsetRelation relType="hypernym" target="ss-mammal"/>
    </Synset>
    <Synset id="ss-dog" ili="i46361" partOfSpeech="n">
      <SynsetRelation relType="hypernym" target="ss-mammal"/>
    </Synset>
    <Synset id="ss-run-move" partOfSpeech="v">
      <Definition>move fast by using the legs</Definition>
    </Synset>
    <Synset id="ss-run-operate" partOfSpeech="v">
      <Definition>be operating</Definition>
    </Synset>
    <Synset id="ss-big" partOfSpeech="a">
      <Definition>above average in size</Definition>
    </Synset>
    <Synset id="ss-small" partOfSpeech="a">
      <Definition>below average in size</Definition>
    </Synset>
  </Lexicon>
</LexicalResource>
)";

// Second language sharing ss-cat's ILI.
inline const std::string MINI_FR =
    LMF_HEADER
    R"(  <Lexicon id="mini-fr" label="Mini Français" language="fr" email="mini@example.com"
           license="https://creativecommons.org/licenses/by/4.0/" version="1.0">
    <LexicalEntry id="fr-chat">
      <Lemma writtenForm="chat" partOfSpeech="n"/>
      <Sense id="fr-chat-1" synset="fr-ss-chat"/>
    </LexicalEntry>
    <LexicalEntry id="fr-animal">
      <Lemma writtenForm="animal" partOfSpeech="n"/>
      <Sense id="fr-animal-1" synset="fr-ss-animal"/>
    </LexicalEntry>
    <Synset id="fr-ss-chat" ili="i46360" partOfSpeech="n">
      <Definition language="fr">mammifère félin</Definition>
      <SynsetRelation relType="hypernym" target="fr-ss-animal"/>
    </Synset>
    <Synset id="fr-ss-animal" ili="i35563" partOfSpeech="n"/>
  </Lexicon>
</LexicalResource>
)";

inline const std::string ILI_TSV =
    "ili\tstatus\tdefinition\n"
    "i35545\tstandard\tthat which is perceived to have its own distinct existence\n"
    "i46360\tstandard\tfeline mammal usually having thick soft fur\n"
    "i99999\tdeprecated\t\n";

/// Wraps a Lexicon body in the document header.
inline std::string lmf_document(const std::string& lexicon_body) {
    return std::string(LMF_HEADER) + lexicon_body + "</LexicalResource>\n";
}

/// Opening Lexicon tag with all required attributes.
inline std::string lexicon_open(const std::string& id = "bad-en") {
    return "<Lexicon id=\"" + id + "\" label=\"Bad\" language=\"en\" email=\"bad@example.com\" "
           "license=\"https://example.com/license\" version=\"1.0\">\n";
}

#undef LMF_HEADER

/**
 * @brief Unique scratch directory removed on destruction.
 */
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("lexicore-test-" + std::to_string(::getpid()) + "-" + std::to_string(stamp) + "-" +
                 std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::filesystem::path write(const std::string& name, const std::string& content) const {
        auto file = path_ / name;
        std::filesystem::create_directories(file.parent_path());
        std::ofstream out(file, std::ios::binary);
        out << content;
        return file;
    }

    /// Config rooted at <tmp>/data with network-free defaults.
    Config config() const {
        Config config;
        config.data_dir = path_ / "data";
        return config;
    }

private:
    std::filesystem::path path_;
};

} // namespace Lexicore::Fixtures

/**
 * @file wordnet.hpp
 * @brief Read-only query façade over a session's store
 *
 * A Wordnet is a view of selected lexicons:
 *   "*"            every installed lexicon (default)
 *   "oewn omw-fr"  a space-separated list of ids, optionally "id:version"
 *
 * Multi-lexicon queries run lexicon by lexicon in installation order; a
 * lexicon whose lookup fails is logged and left out of the merged result.
 * Results are grouped by lexicon, then ordered by id.
 *
 * Form lookups pass through the optional normalizer first. When a form finds
 * nothing and a lemmatizer is set, its candidate lemmas are looked up instead.
 */

#pragma once

#include <core/types.hpp>
#include <export.hpp>
#include <session/session.hpp>
#include <storage/entity_reader.hpp>
#include <storage/statistics.hpp>
#include <functional>
#include <initializer_list>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace Lexicore {

/// An ILI entry and every installed synset linked to it.
struct IliResult {
    IliEntry entry;
    std::vector<Synset> synsets;
};

/// Part-of-speech code -> candidate lemmas; "" holds candidates with no part of speech.
using LemmaCandidates = std::map<std::string, std::set<std::string>>;

struct WordnetOptions {
    std::function<std::string(const std::string&)> normalizer;
    std::function<LemmaCandidates(const std::string&, std::optional<PartOfSpeech>)> lemmatizer;
    bool search_all_forms = true;   // false disables the lemmatizer fallback
};

class LEXICORE_API Wordnet {
public:
    explicit Wordnet(Session& session, std::string lexicon = "*", std::string lang = "",
                     WordnetOptions options = {});

    const std::string& lexicon_filter() const { return lexicon_; }
    const std::string& language() const { return lang_; }

    /// Selected lexicons, installation order.
    std::vector<LexiconInfo> lexicons();

    // ========================================================================
    // Entity lookup
    // ========================================================================

    /// Words whose lemma or any other form equals form; every word when form is empty.
    std::vector<Word> words(const std::string& form = "", std::optional<PartOfSpeech> pos = std::nullopt);
    std::vector<Sense> senses(const std::string& form = "", std::optional<PartOfSpeech> pos = std::nullopt);
    std::vector<Synset> synsets(const std::string& form = "", std::optional<PartOfSpeech> pos = std::nullopt);
    std::vector<Synset> synsets_by_ili(const std::string& ili);

    std::optional<Word> word(const std::string& id);
    std::optional<Sense> sense(const std::string& id);
    std::optional<Synset> synset(const std::string& id);

    /// The entry plus the synsets of all selected lexicons that share it.
    std::optional<IliResult> ili(const std::string& id);

    /// All ILI entries, optionally only those with the given status.
    std::vector<IliEntry> ilis(const std::string& status = "");

    /**
     * @brief First definition of a synset, preferring the view's language.
     * @return std::nullopt when the synset is unknown or has no definition
     */
    std::optional<std::string> definition(const std::string& synset_id);

    // ========================================================================
    // Relations (lexicon-scoped; inverse edges included)
    // ========================================================================

    std::vector<Synset> related(const Synset& synset, const std::string& type);

    /// hypernym + instance_hypernym
    std::vector<Synset> hypernyms(const Synset& synset);

    /// hyponym + instance_hyponym
    std::vector<Synset> hyponyms(const Synset& synset);

    std::vector<Sense> sense_related(const Sense& sense, const std::string& type);

    /// Synsets of another lexicon sharing this synset's ILI.
    std::vector<Synset> translate(const Synset& synset, const std::string& lexicon);

    // ========================================================================
    // Analytics
    // ========================================================================

    StoreTotals stats();
    DataQuality data_quality(const std::string& lexicon = "");
    std::map<std::string, long long> pos_distribution(const std::string& lexicon = "");
    std::optional<LexiconStats> lexicon_stats(const std::string& id);
    SynsetSizeStats synset_sizes(const std::string& lexicon = "");

private:
    using LexiconVisitor = std::function<void(EntityReader&, const LexiconInfo&)>;

    /// Runs fn once per selected lexicon inside one read snapshot.
    void each_lexicon(const LexiconVisitor& fn);

    std::vector<LexiconInfo> select(EntityReader& reader);

    std::string normalize(const std::string& form) const;

    /// Lemmatizer candidates for an already normalized form; empty when the fallback is off.
    std::vector<std::string> lemma_forms(const std::string& form, std::optional<PartOfSpeech> pos) const;

    std::vector<Word> find_words(const std::vector<std::string>& forms, std::optional<PartOfSpeech> pos);
    std::vector<Sense> find_senses(const std::vector<std::string>& forms, std::optional<PartOfSpeech> pos);
    std::vector<Synset> find_synsets(const std::vector<std::string>& forms, std::optional<PartOfSpeech> pos);
    std::vector<Synset> related_any(const Synset& synset, std::initializer_list<const char*> types);

    Session& session_;
    std::string lexicon_;
    std::string lang_;
    WordnetOptions options_;
};

} // namespace Lexicore

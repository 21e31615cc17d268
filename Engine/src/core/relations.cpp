/**
 * @file relations.cpp
 * @brief WN-LMF 1.3 relation table
 */

#include <core/relations.hpp>
#include <algorithm>
#include <iterator>

namespace Lexicore {

namespace {

struct RelationInfo {
    std::string_view name;
    std::string_view inverse;   // empty: no inverse
    bool synset;
    bool sense;
};

constexpr RelationInfo kRelations[] = {
    {"hypernym",                  "hyponym",                   true,  false},
    {"hyponym",                   "hypernym",                  true,  false},
    {"instance_hypernym",         "instance_hyponym",          true,  false},
    {"instance_hyponym",          "instance_hypernym",         true,  false},
    {"meronym",                   "holonym",                   true,  false},
    {"holonym",                   "meronym",                   true,  false},
    {"mero_location",             "holo_location",             true,  false},
    {"holo_location",             "mero_location",             true,  false},
    {"mero_member",               "holo_member",               true,  false},
    {"holo_member",               "mero_member",               true,  false},
    {"mero_part",                 "holo_part",                 true,  false},
    {"holo_part",                 "mero_part",                 true,  false},
    {"mero_portion",              "holo_portion",              true,  false},
    {"holo_portion",              "mero_portion",              true,  false},
    {"mero_substance",            "holo_substance",            true,  false},
    {"holo_substance",            "mero_substance",            true,  false},
    {"entails",                   "is_entailed_by",            true,  false},
    {"is_entailed_by",            "entails",                   true,  false},
    {"causes",                    "is_caused_by",              true,  false},
    {"is_caused_by",              "causes",                    true,  false},
    {"subevent",                  "is_subevent_of",            true,  false},
    {"is_subevent_of",            "subevent",                  true,  false},
    {"state_of",                  "be_in_state",               true,  false},
    {"be_in_state",               "state_of",                  true,  false},
    {"manner_of",                 "in_manner",                 true,  false},
    {"in_manner",                 "manner_of",                 true,  false},
    {"restricts",                 "restricted_by",             true,  false},
    {"restricted_by",             "restricts",                 true,  false},
    {"classifies",                "classified_by",             true,  false},
    {"classified_by",             "classifies",                true,  false},
    {"attribute",                 "attribute",                 true,  false},
    {"eq_synonym",                "eq_synonym",                true,  false},
    {"ir_synonym",                "ir_synonym",                true,  false},
    {"role",                      "involved",                  true,  false},
    {"involved",                  "role",                      true,  false},
    {"agent",                     "involved_agent",            true,  true },
    {"involved_agent",            "agent",                     true,  true },
    {"patient",                   "involved_patient",          true,  false},
    {"involved_patient",          "patient",                   true,  false},
    {"result",                    "involved_result",           true,  true },
    {"involved_result",           "result",                    true,  true },
    {"instrument",                "involved_instrument",       true,  true },
    {"involved_instrument",       "instrument",                true,  true },
    {"location",                  "involved_location",         true,  true },
    {"involved_location",         "location",                  true,  true },
    {"direction",                 "involved_direction",        true,  false},
    {"involved_direction",        "direction",                 true,  false},
    {"target_direction",          "involved_target_direction", true,  false},
    {"involved_target_direction", "target_direction",          true,  false},
    {"source_direction",          "involved_source_direction", true,  false},
    {"involved_source_direction", "source_direction",          true,  false},
    {"co_agent_patient",          "co_patient_agent",          true,  false},
    {"co_patient_agent",          "co_agent_patient",          true,  false},
    {"co_agent_instrument",       "co_instrument_agent",       true,  false},
    {"co_instrument_agent",       "co_agent_instrument",       true,  false},
    {"co_agent_result",           "co_result_agent",           true,  false},
    {"co_result_agent",           "co_agent_result",           true,  false},
    {"co_patient_instrument",     "co_instrument_patient",     true,  false},
    {"co_instrument_patient",     "co_patient_instrument",     true,  false},
    {"co_result_instrument",      "co_instrument_result",      true,  false},
    {"co_instrument_result",      "co_result_instrument",      true,  false},
    {"co_role",                   "co_role",                   true,  false},

    // Valid on both synsets and senses
    {"antonym",                   "antonym",                   true,  true },
    {"anto_gradable",             "anto_gradable",             true,  true },
    {"anto_simple",               "anto_simple",               true,  true },
    {"anto_converse",             "anto_converse",             true,  true },
    {"also",                      "also",                      true,  true },
    {"similar",                   "similar",                   true,  true },
    {"domain_topic",              "has_domain_topic",          true,  true },
    {"has_domain_topic",          "domain_topic",              true,  true },
    {"domain_region",             "has_domain_region",         true,  true },
    {"has_domain_region",         "domain_region",             true,  true },
    {"exemplifies",               "is_exemplified_by",         true,  true },
    {"is_exemplified_by",         "exemplifies",               true,  true },
    {"feminine",                  "has_feminine",              true,  true },
    {"has_feminine",              "feminine",                  true,  true },
    {"masculine",                 "has_masculine",             true,  true },
    {"has_masculine",             "masculine",                 true,  true },
    {"young",                     "has_young",                 true,  true },
    {"has_young",                 "young",                     true,  true },
    {"diminutive",                "has_diminutive",            true,  true },
    {"has_diminutive",            "diminutive",                true,  true },
    {"augmentative",              "has_augmentative",          true,  true },
    {"has_augmentative",          "augmentative",              true,  true },
    {"other",                     "",                          true,  true },

    // Sense-only
    {"derivation",                "derivation",                false, true },
    {"pertainym",                 "",                          false, true },
    {"participle",                "",                          false, true },
    {"metaphor",                  "has_metaphor",              false, true },
    {"has_metaphor",              "metaphor",                  false, true },
    {"metonym",                   "has_metonym",               false, true },
    {"has_metonym",               "metonym",                   false, true },
    {"simple_aspect_ip",          "simple_aspect_pi",          false, true },
    {"simple_aspect_pi",          "simple_aspect_ip",          false, true },
    {"secondary_aspect_ip",       "secondary_aspect_pi",       false, true },
    {"secondary_aspect_pi",       "secondary_aspect_ip",       false, true },
    {"material",                  "",                          false, true },
    {"event",                     "",                          false, true },
    {"by_means_of",               "",                          false, true },
    {"undergoer",                 "",                          false, true },
    {"property",                  "",                          false, true },
    {"state",                     "",                          false, true },
    {"uses",                      "",                          false, true },
    {"destination",               "",                          false, true },
    {"body_part",                 "",                          false, true },
    {"vehicle",                   "",                          false, true },
};

const RelationInfo* lookup(std::string_view type) {
    auto it = std::find_if(std::begin(kRelations), std::end(kRelations),
                           [&](const RelationInfo& r) { return r.name == type; });
    return it == std::end(kRelations) ? nullptr : &*it;
}

} // namespace

bool is_known_relation(std::string_view type, RelationScope scope) {
    const RelationInfo* info = lookup(type);
    if (!info) return false;
    return scope == RelationScope::Synset ? info->synset : info->sense;
}

std::optional<std::string_view> inverse_relation(std::string_view type) {
    const RelationInfo* info = lookup(type);
    if (!info || info->inverse.empty()) return std::nullopt;
    return info->inverse;
}

bool is_symmetric_relation(std::string_view type) {
    const RelationInfo* info = lookup(type);
    return info && info->inverse == info->name;
}

std::vector<std::string_view> relation_types(RelationScope scope) {
    std::vector<std::string_view> out;
    for (const auto& r : kRelations) {
        if (scope == RelationScope::Synset ? r.synset : r.sense) out.push_back(r.name);
    }
    return out;
}

} // namespace Lexicore

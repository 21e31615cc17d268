/**
 * @file lmf_parser.cpp
 * @brief Parse sources and the collecting sink
 */

#include <lmf/lmf_parser.hpp>
#include <core/errors.hpp>
#include <fstream>
#include <sstream>

namespace Lexicore {

ParseSource ParseSource::from_file(const std::filesystem::path& path) {
    ParseSource src;
    src.path_ = path;
    src.name_ = path.string();
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    src.size_hint_ = ec ? 0 : static_cast<std::size_t>(size);
    return src;
}

ParseSource ParseSource::from_stream(std::istream& in, std::string name) {
    ParseSource src;
    src.name_ = std::move(name);
    src.stream_ = &in;
    return src;
}

ParseSource ParseSource::from_string(std::string xml, std::string name) {
    ParseSource src;
    src.name_ = std::move(name);
    src.size_hint_ = xml.size();
    src.owned_ = std::make_unique<std::istringstream>(std::move(xml));
    src.stream_ = src.owned_.get();
    return src;
}

std::istream& ParseSource::stream() {
    if (!stream_) {
        auto file = std::make_unique<std::ifstream>(path_, std::ios::binary);
        if (!*file) {
            throw Error("Cannot open LMF source: " + path_.string());
        }
        owned_ = std::move(file);
        stream_ = owned_.get();
    }
    return *stream_;
}

void DocumentCollector::on_lexicon_begin(const Lexicon& lexicon) {
    doc_.lexicons.push_back(lexicon);
}

void DocumentCollector::on_word(Word&& word) {
    doc_.words.push_back(std::move(word));
}

void DocumentCollector::on_sense(Sense&& sense) {
    doc_.senses.push_back(std::move(sense));
}

void DocumentCollector::on_synset(Synset&& synset) {
    if (!synset.ili.empty() && seen_ili_.insert(synset.ili).second) {
        doc_.ili_refs.push_back(synset.ili);
    }
    doc_.synsets.push_back(std::move(synset));
}

} // namespace Lexicore

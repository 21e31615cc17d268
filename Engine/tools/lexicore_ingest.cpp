// lexicore_ingest.cpp
// Installs an LMF file, archive, directory or indexed project into a data directory
// and reports store statistics.

#include <core/errors.hpp>
#include <ingestion/ingestor.hpp>
#include <lmf/parser_registry.hpp>
#include <query/wordnet.hpp>
#include <session/session.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>

#include <cstdio>
#include <filesystem>
#include <iostream>
#include <string>

namespace {

void usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " <file|dir|project[:version]> [--data DIR] [--force] [--parser NAME]"
              << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    using namespace Lexicore;
    if (argc < 2) { usage(argv[0]); return 1; }

    std::string target;
    std::string data_dir;
    std::string parser_name;
    bool force = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--force") force = true;
        else if (arg == "--data" && i + 1 < argc) data_dir = argv[++i];
        else if (arg == "--parser" && i + 1 < argc) parser_name = argv[++i];
        else if (arg == "-h" || arg == "--help") { usage(argv[0]); return 0; }
        else if (target.empty()) target = arg;
        else { usage(argv[0]); return 1; }
    }
    if (target.empty()) { usage(argv[0]); return 1; }

    Timer total_timer;
    try {
        Config config = Config::load_from_env();
        if (!data_dir.empty()) config.data_dir = data_dir;
        Session session(config);
        Ingestor ingestor(session);

        AddOptions options;
        options.force = force;
        if (!parser_name.empty()) {
            auto kind = parser_kind_from_name(parser_name);
            if (!kind) throw ConfigurationError("Unknown parser '" + parser_name + "'");
            options.parser = *kind;
        }

        Timer progress_timer;
        options.on_progress = [&](std::size_t done, std::size_t total) {
            if (total == 0 || progress_timer.elapsed_ms() < 1000.0) return;
            progress_timer.reset();
            Logger::info("  parsed " + std::to_string(done * 100 / total) + "%");
        };

        IngestionStats stats = std::filesystem::exists(target)
            ? ingestor.add(target, options)
            : ingestor.add_project(target, options);

        Wordnet wn(session);
        StoreTotals totals = wn.stats();
        DataQuality quality = wn.data_quality();

        std::cout << "Lexicons added:  " << stats.lexicons.size() << " (parse " << stats.parse_ms
                  << "ms, write " << stats.write_ms << "ms)" << std::endl;
        std::cout << "Store totals:    " << totals.total_lexicons << " lexicons, "
                  << totals.total_words << " words, " << totals.total_senses << " senses, "
                  << totals.total_synsets << " synsets, " << totals.total_ilis << " ILI entries" << std::endl;
        char coverage[32];
        std::snprintf(coverage, sizeof(coverage), "%.1f%%", quality.ili_coverage_percent);
        std::cout << "ILI coverage:    " << coverage << ", " << quality.synsets_without_definitions
                  << " synsets without definitions, " << quality.empty_synsets << " empty synsets" << std::endl;
        std::cout << "Total time:      " << total_timer.pretty() << std::endl;
    } catch (const LockedError& e) {
        Logger::error(std::string(e.what()) + " (another process is writing to this data directory)");
        return 3;
    } catch (const Error& e) {
        Logger::error(e.what());
        return 2;
    } catch (const std::exception& e) {
        Logger::error(std::string("Unexpected failure: ") + e.what());
        return 2;
    }
    return 0;
}

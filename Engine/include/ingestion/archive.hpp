/**
 * @file archive.hpp
 * @brief gzip/xz decompression, tar extraction and payload discovery
 */

#pragma once

#include <export.hpp>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace Lexicore {

enum class Compression { None, Gzip, Xz };

/// Sniffs magic bytes; None for anything unrecognized.
LEXICORE_API Compression detect_compression(const std::filesystem::path& path);

/**
 * @brief Sequential reader yielding the decompressed bytes of a file.
 *
 * Concatenated gzip members and xz streams are read through.
 */
class LEXICORE_API DecompressingReader {
public:
    explicit DecompressingReader(const std::filesystem::path& path);
    ~DecompressingReader();

    DecompressingReader(const DecompressingReader&) = delete;
    DecompressingReader& operator=(const DecompressingReader&) = delete;

    /// Fills up to size bytes; returns 0 only at end of data. Throws ArchiveError.
    std::size_t read(char* data, std::size_t size);

    /// Reads exactly size bytes unless the data ends first.
    std::size_t read_full(char* data, std::size_t size);

    Compression compression() const { return compression_; }

private:
    struct Codec;

    std::size_t fill_input();

    std::filesystem::path path_;
    std::ifstream in_;
    Compression compression_;
    std::unique_ptr<Codec> codec_;
    std::vector<unsigned char> input_;
    bool input_eof_ = false;
    bool finished_ = false;
};

/// True when a 512-byte block carries a valid ustar/GNU header checksum.
LEXICORE_API bool is_tar_header(const char* block);

/**
 * @brief Unpack an archive into dest_dir.
 *
 * Tar payloads (optionally gzip/xz compressed) are unpacked entry by entry;
 * a compressed single file is written as dest_dir/<name without .gz/.xz>.
 * Entries with absolute paths or ".." components are rejected.
 *
 * @return regular files written, in archive order
 * @throws ArchiveError on corrupt data or unsafe entries
 */
LEXICORE_API std::vector<std::filesystem::path>
extract_archive(const std::filesystem::path& archive, const std::filesystem::path& dest_dir);

/**
 * @brief Regular files under dir whose name ends with one of extensions,
 * sorted by path.
 */
LEXICORE_API std::vector<std::filesystem::path>
find_payloads(const std::filesystem::path& dir, const std::vector<std::string>& extensions);

/// Strips a trailing .gz/.xz/.tar/.tgz/.txz from a file name.
LEXICORE_API std::string archive_stem(const std::filesystem::path& path);

} // namespace Lexicore

/**
 * @file blake3_pipeline.hpp
 * @brief BLAKE3 digests for download cache keys and archive verification
 */

#pragma once

#include <export.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

extern "C" {
#include <blake3.h>
}

namespace Lexicore {

/**
 * @brief Full-length (256-bit) BLAKE3 hashing of buffers and files.
 */
class LEXICORE_API BLAKE3Pipeline {
public:
    static constexpr std::size_t HASH_SIZE = BLAKE3_OUT_LEN;
    using Hash = std::array<std::uint8_t, HASH_SIZE>;

    static Hash hash(const void* data, std::size_t len);

    static Hash hash(std::string_view str) {
        return hash(str.data(), str.size());
    }

    /**
     * @brief Hash a file in fixed-size chunks without loading it.
     * @throws Error when the file cannot be read
     */
    static Hash hash_file(const std::filesystem::path& path);

    /// Lowercase hex, 64 characters.
    static std::string to_hex(const Hash& hash);

    /**
     * @brief Parse a 64-character hex digest (either case).
     * @throws Error on bad length or non-hex characters
     */
    static Hash from_hex(std::string_view hex);

    /// Short stable key for cache file names (first 16 hex chars).
    static std::string short_key(std::string_view str) {
        return to_hex(hash(str)).substr(0, 16);
    }
};

} // namespace Lexicore

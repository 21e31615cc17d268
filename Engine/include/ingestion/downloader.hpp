/**
 * @file downloader.hpp
 * @brief libcurl file fetcher with timeout, cancellation and atomic placement
 */

#pragma once

#include <export.hpp>
#include <atomic>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace Lexicore {

struct DownloadOptions {
    bool force = false;

    /// Whole-transfer limit; 0 takes Config::download_timeout_ms in Ingestor, no limit otherwise.
    long timeout_ms = 0;

    /// Extra attempts per url after a retryable failure; negative takes Config::download_retries.
    int retries = -1;

    /// Polled during the transfer; setting it aborts with NetworkError::Kind::Cancelled.
    const std::atomic<bool>* cancel = nullptr;

    /// (bytes received, total bytes or 0 when unknown)
    std::function<void(std::size_t, std::size_t)> on_progress;
};

/**
 * @brief Fetches urls to a destination path.
 *
 * Bytes are written to "<dest>.part" and renamed onto dest only after the
 * transfer succeeds, so dest never holds a partial file.
 */
class LEXICORE_API Downloader {
public:
    Downloader();

    /**
     * @brief Fetch one url.
     * @throws NetworkError (Transport, Timeout, Cancelled or Http)
     */
    void fetch(const std::string& url, const std::filesystem::path& dest,
               const DownloadOptions& options) const;

    /**
     * @brief Try each url in order with the configured retries.
     *
     * Cancellation stops immediately; any other failure moves on to the
     * next url. The last error is rethrown when all urls fail.
     * @return the url that succeeded
     */
    std::string fetch_any(const std::vector<std::string>& urls, const std::filesystem::path& dest,
                          const DownloadOptions& options) const;
};

} // namespace Lexicore

/**
 * @file downloader.cpp
 * @brief libcurl transfers
 */

#include <ingestion/downloader.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <curl/curl.h>
#include <algorithm>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>

namespace Lexicore {

namespace {

struct TransferContext {
    std::ofstream* out;
    const DownloadOptions* options;
    bool write_failed = false;
};

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    size_t bytes = size * nmemb;
    ctx->out->write(ptr, static_cast<std::streamsize>(bytes));
    if (!*ctx->out) {
        ctx->write_failed = true;
        return 0;
    }
    return bytes;
}

int progress_cb(void* userdata, curl_off_t dltotal, curl_off_t dlnow, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    if (ctx->options->cancel && ctx->options->cancel->load()) {
        return 1;
    }
    if (ctx->options->on_progress) {
        ctx->options->on_progress(static_cast<std::size_t>(dlnow), static_cast<std::size_t>(dltotal));
    }
    return 0;
}

void remove_quietly(const std::filesystem::path& p) {
    std::error_code ec;
    std::filesystem::remove(p, ec);
}

} // namespace

Downloader::Downloader() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

void Downloader::fetch(const std::string& url, const std::filesystem::path& dest,
                       const DownloadOptions& options) const {
    if (options.cancel && options.cancel->load()) {
        throw NetworkError("Download cancelled: " + url, NetworkError::Kind::Cancelled);
    }

    auto part = dest;
    part += ".part";

    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        throw NetworkError("curl_easy_init failed", NetworkError::Kind::Transport);
    }

    std::optional<NetworkError> failure;
    {
        std::ofstream out(part, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw Error("Cannot write download file: " + part.string());
        }

        TransferContext ctx{&out, &options};
        char errbuf[CURL_ERROR_SIZE] = {0};

        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, options.timeout_ms);
        curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "lexicore/1.0");
        curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progress_cb);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);

        CURLcode rc = curl_easy_perform(curl.get());
        std::string detail = errbuf[0] ? errbuf : curl_easy_strerror(rc);

        long status = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);

        if (rc == CURLE_ABORTED_BY_CALLBACK) {
            failure.emplace("Download cancelled: " + url, NetworkError::Kind::Cancelled);
        } else if (rc == CURLE_OPERATION_TIMEDOUT) {
            failure.emplace("Download timed out: " + url, NetworkError::Kind::Timeout);
        } else if (rc == CURLE_WRITE_ERROR && ctx.write_failed) {
            out.close();
            remove_quietly(part);
            throw Error("Disk write failed while downloading to " + part.string());
        } else if (rc != CURLE_OK) {
            failure.emplace("Download failed (" + detail + "): " + url, NetworkError::Kind::Transport);
        } else if (status >= 400) {
            failure.emplace("HTTP " + std::to_string(status) + " for " + url,
                            NetworkError::Kind::Http, status);
        }

        out.close();
        if (!failure && !out) {
            failure.emplace("Could not finish writing " + part.string(), NetworkError::Kind::Transport);
        }
    }

    if (failure) {
        remove_quietly(part);
        throw *failure;
    }

    std::error_code ec;
    std::filesystem::rename(part, dest, ec);
    if (ec) {
        remove_quietly(part);
        throw Error("Cannot move download into place: " + dest.string() + ": " + ec.message());
    }
}

std::string Downloader::fetch_any(const std::vector<std::string>& urls, const std::filesystem::path& dest,
                                  const DownloadOptions& options) const {
    if (urls.empty()) {
        throw NetworkError("No urls to download", NetworkError::Kind::Transport);
    }

    std::optional<NetworkError> last;
    for (const auto& url : urls) {
        int attempts = 1 + std::max(options.retries, 0);
        for (int attempt = 0; attempt < attempts; ++attempt) {
            try {
                Logger::step("Downloading " + url);
                fetch(url, dest, options);
                return url;
            } catch (const NetworkError& e) {
                if (e.cancelled()) throw;
                Logger::warn(e.what());
                last = e;
                if (!e.retryable()) break;
            }
        }
    }
    throw *last;
}

} // namespace Lexicore

#include "offline_maps/tile_fetcher.hpp"

#include <fstream>
#include <mutex>

#include <curl/curl.h>

namespace offline_maps {

namespace {

std::once_flag curl_once_flag;

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    const size_t total_size = size * nmemb;
    auto* file = static_cast<std::ofstream*>(userp);
    file->write(static_cast<char*>(contents), static_cast<std::streamsize>(total_size));
    return file->good() ? total_size : 0;
}

void discard_partial_file(const std::filesystem::path& path_partial, spdlog::logger& logger) {
    std::error_code error_remove;
    std::filesystem::remove(path_partial, error_remove);
    if (error_remove) {
        logger.warn("Unable to discard partial tile {}: {}", path_partial.string(), error_remove.message());
    }
}

}  // namespace

CurlTileFetcher::CurlTileFetcher(CurlFetcherConfig config)
    : config_(std::move(config)),
      logger_(get_logger()) {
    std::call_once(curl_once_flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

CurlTileFetcher::~CurlTileFetcher() = default;

bool CurlTileFetcher::fetch(const std::string& url, const std::filesystem::path& destination) {
    std::error_code error_directory;
    std::filesystem::create_directories(destination.parent_path(), error_directory);
    if (error_directory) {
        logger_->error("Unable to create tile directory {}: {}", destination.parent_path().string(), error_directory.message());
        return false;
    }

    CURL* curl = curl_easy_init();
    if (curl == nullptr) {
        logger_->error("curl_easy_init failed for {}", url);
        return false;
    }

    std::filesystem::path path_partial = destination;
    path_partial += k_partial_tile_suffix;

    CURLcode result = CURLE_OK;
    long response_code = 0;
    bool written = false;
    {
        std::ofstream file(path_partial, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            curl_easy_cleanup(curl);
            logger_->error("Unable to open {} for writing", path_partial.string());
            return false;
        }

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &file);
        curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(config_.request_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, config_.max_redirects);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        result = curl_easy_perform(curl);
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response_code);
        curl_easy_cleanup(curl);
        file.flush();
        written = file.good();
    }

    if (result != CURLE_OK || response_code != 200 || !written) {
        logger_->debug(
            R"({{"component":"fetcher","url":"{}","curl":"{}","http":{},"written":{}}})",
            url,
            curl_easy_strerror(result),
            response_code,
            written
        );
        discard_partial_file(path_partial, *logger_);
        return false;
    }

    std::error_code error_rename;
    std::filesystem::rename(path_partial, destination, error_rename);
    if (error_rename) {
        logger_->error("Unable to commit tile {}: {}", destination.string(), error_rename.message());
        discard_partial_file(path_partial, *logger_);
        return false;
    }
    return true;
}

}  // namespace offline_maps

// === Tile Fetcher ============================================================
//
// Abstraction over "download this URL into this file". The scheduler calls
// `fetch` concurrently from several threads, so implementations must be
// re-entrant. `CurlTileFetcher` is the production implementation.

#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

#include "offline_maps/logging.hpp"

namespace offline_maps {

/** @brief Downloads a single tile to a local path. */
class TileFetcher {
  public:
    virtual ~TileFetcher() = default;

    /**
     * @brief Fetch @p url into @p destination.
     * @return true on HTTP 200 with the payload fully written; false otherwise.
     *         Implementations report failure through the return value only
     *         and leave an existing @p destination untouched on failure.
     */
    virtual bool fetch(const std::string& url, const std::filesystem::path& destination) = 0;
};

/** @brief Suffix of the sibling file a tile is streamed into before commit. */
inline constexpr char k_partial_tile_suffix[] = ".part";

/** @brief libcurl-backed options. */
struct CurlFetcherConfig final {
    std::string user_agent{};
    std::chrono::seconds request_timeout{30};
    long max_redirects{5};
};

/** @brief HTTP(S) tile fetcher built on libcurl easy handles. */
class CurlTileFetcher final : public TileFetcher {
  public:
    explicit CurlTileFetcher(CurlFetcherConfig config);
    ~CurlTileFetcher() override;

    CurlTileFetcher(const CurlTileFetcher&) = delete;
    CurlTileFetcher& operator=(const CurlTileFetcher&) = delete;

    bool fetch(const std::string& url, const std::filesystem::path& destination) override;

  private:
    CurlFetcherConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace offline_maps

// === Errors ==================================================================
//
// Exception taxonomy surfaced by the offline map engine. Every engine failure
// derives from `OfflineMapError` and carries an `ErrorCode` so callers can
// branch without string matching. Storage and parse failures are raised by
// the persistence layer and absorbed (logged) by the engine components.

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace offline_maps {

/** @brief Machine-readable classification of engine failures. */
enum class ErrorCode {
    AlreadyDownloading,
    QuotaExceeded,
    Timeout,
    PartialFailure,
    Cancelled,
    StorageError,
    ParseError
};

std::string_view to_string(ErrorCode code) noexcept;

/** @brief Base class for every exception thrown by the engine. */
class OfflineMapError : public std::runtime_error {
  public:
    OfflineMapError(ErrorCode code, const std::string& message);

    [[nodiscard]] ErrorCode code() const noexcept;

  private:
    ErrorCode code_;
};

/** @brief A download for the same region id is already queued or running. */
class AlreadyDownloadingError final : public OfflineMapError {
  public:
    explicit AlreadyDownloadingError(const std::string& region_id);
};

/** @brief Admitting the region would push the estimated cache over quota. */
class QuotaExceededError final : public OfflineMapError {
  public:
    QuotaExceededError(double limit_mb, double current_mb, double requested_mb);

    [[nodiscard]] double limit_mb() const noexcept;
    [[nodiscard]] double current_mb() const noexcept;
    [[nodiscard]] double requested_mb() const noexcept;

  private:
    double limit_mb_;
    double current_mb_;
    double requested_mb_;
};

/** @brief The region did not settle before the hard download deadline. */
class DownloadTimeoutError final : public OfflineMapError {
  public:
    DownloadTimeoutError(const std::string& region_id, long long timeout_seconds);
};

/** @brief Too many tiles failed for the region to be usable. */
class DownloadFailedError final : public OfflineMapError {
  public:
    DownloadFailedError(std::size_t failed_tiles, std::size_t total_tiles);

    [[nodiscard]] std::size_t failed_tiles() const noexcept;
    [[nodiscard]] std::size_t total_tiles() const noexcept;

  private:
    std::size_t failed_tiles_;
    std::size_t total_tiles_;
};

/** @brief The download was withdrawn (region deleted or engine stopped). */
class DownloadCancelledError final : public OfflineMapError {
  public:
    DownloadCancelledError(const std::string& region_id, const std::string& reason);
};

/** @brief Durable key-value read or write failed. */
class StorageError final : public OfflineMapError {
  public:
    explicit StorageError(const std::string& message);
};

/** @brief Persisted payload could not be decoded. */
class ParseError final : public OfflineMapError {
  public:
    explicit ParseError(const std::string& message);
};

}  // namespace offline_maps

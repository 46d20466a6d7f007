#include "offline_maps/errors.hpp"

#include <fmt/format.h>

namespace offline_maps {

std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::AlreadyDownloading:
            return "AlreadyDownloading";
        case ErrorCode::QuotaExceeded:
            return "QuotaExceeded";
        case ErrorCode::Timeout:
            return "Timeout";
        case ErrorCode::PartialFailure:
            return "PartialFailure";
        case ErrorCode::Cancelled:
            return "Cancelled";
        case ErrorCode::StorageError:
            return "StorageError";
        case ErrorCode::ParseError:
            return "ParseError";
    }
    return "Unknown";
}

OfflineMapError::OfflineMapError(ErrorCode code, const std::string& message)
    : std::runtime_error(message),
      code_(code) {}

ErrorCode OfflineMapError::code() const noexcept {
    return code_;
}

AlreadyDownloadingError::AlreadyDownloadingError(const std::string& region_id)
    : OfflineMapError(ErrorCode::AlreadyDownloading, fmt::format("Region {} is already downloading", region_id)) {}

QuotaExceededError::QuotaExceededError(double limit_mb, double current_mb, double requested_mb)
    : OfflineMapError(ErrorCode::QuotaExceeded,
                      fmt::format("Quota exceeded: limit {} MB, current {} MB, requested {} MB",
                                  limit_mb,
                                  current_mb,
                                  requested_mb)),
      limit_mb_(limit_mb),
      current_mb_(current_mb),
      requested_mb_(requested_mb) {}

double QuotaExceededError::limit_mb() const noexcept {
    return limit_mb_;
}

double QuotaExceededError::current_mb() const noexcept {
    return current_mb_;
}

double QuotaExceededError::requested_mb() const noexcept {
    return requested_mb_;
}

DownloadTimeoutError::DownloadTimeoutError(const std::string& region_id, long long timeout_seconds)
    : OfflineMapError(ErrorCode::Timeout,
                      fmt::format("Timeout: region {} did not finish within {} s", region_id, timeout_seconds)) {}

DownloadFailedError::DownloadFailedError(std::size_t failed_tiles, std::size_t total_tiles)
    : OfflineMapError(ErrorCode::PartialFailure, fmt::format("Download failed: {}/{} tiles", failed_tiles, total_tiles)),
      failed_tiles_(failed_tiles),
      total_tiles_(total_tiles) {}

std::size_t DownloadFailedError::failed_tiles() const noexcept {
    return failed_tiles_;
}

std::size_t DownloadFailedError::total_tiles() const noexcept {
    return total_tiles_;
}

DownloadCancelledError::DownloadCancelledError(const std::string& region_id, const std::string& reason)
    : OfflineMapError(ErrorCode::Cancelled, fmt::format("Download of region {} cancelled: {}", region_id, reason)) {}

StorageError::StorageError(const std::string& message)
    : OfflineMapError(ErrorCode::StorageError, message) {}

ParseError::ParseError(const std::string& message)
    : OfflineMapError(ErrorCode::ParseError, message) {}

}  // namespace offline_maps

// === Progress Notifier =======================================================
//
// Thread-safe observer list that fans region download progress out to every
// registered listener. A throwing listener is logged and skipped; it never
// interrupts the download or the remaining listeners.

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "offline_maps/logging.hpp"

namespace offline_maps {

/** @brief Callback receiving `(region_id, progress_percent)`. */
using ProgressListener = std::function<void(const std::string&, int)>;

/** @brief Handle returned on registration, used to unregister. */
using ListenerId = std::uint64_t;

/** @brief Observer list for download progress events. */
class ProgressNotifier final {
  public:
    ProgressNotifier();

    /** @brief Register @p listener and return its handle. */
    ListenerId add_listener(ProgressListener listener);
    /** @brief Unregister a listener; returns false for unknown handles. */
    bool remove_listener(ListenerId listener_id);
    /** @brief Invoke every listener with @p region_id and @p progress. */
    void notify(const std::string& region_id, int progress);
    /** @brief Number of registered listeners. */
    [[nodiscard]] std::size_t listener_count() const;

  private:
    mutable std::mutex mutex_;
    ListenerId next_listener_id_{1};
    std::vector<std::pair<ListenerId, ProgressListener>> list_listeners_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace offline_maps

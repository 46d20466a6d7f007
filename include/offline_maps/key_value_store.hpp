// === Key-Value Store =========================================================
//
// Durable string-to-string storage used for every persisted record (regions,
// tile lists, auto-update settings, snapshot payloads and catalogs). The
// abstract interface lets tests substitute an in-memory store; the file-backed
// implementation maps each key to one file under a root directory.

#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "offline_maps/logging.hpp"

namespace offline_maps {

/**
 * @brief Durable key-value storage contract.
 *
 * Implementations must be safe to call from multiple threads and signal I/O
 * failures by throwing `StorageError`.
 */
class KeyValueStore {
  public:
    virtual ~KeyValueStore() = default;

    /** @brief Value stored under @p key, or nullopt when absent. */
    [[nodiscard]] virtual std::optional<std::string> get(const std::string& key) const = 0;
    /** @brief Insert or replace the value stored under @p key. */
    virtual void set(const std::string& key, const std::string& value) = 0;
    /** @brief Remove @p key; removing a missing key is not an error. */
    virtual void remove(const std::string& key) = 0;
};

/** @brief Stores each key as `<root>/<percent-encoded key>.json`. */
class FileKeyValueStore final : public KeyValueStore {
  public:
    explicit FileKeyValueStore(std::filesystem::path root_directory);

    [[nodiscard]] std::optional<std::string> get(const std::string& key) const override;
    void set(const std::string& key, const std::string& value) override;
    void remove(const std::string& key) override;

    /** @brief Directory holding the stored records. */
    [[nodiscard]] const std::filesystem::path& root_directory() const noexcept;

  private:
    [[nodiscard]] std::filesystem::path path_for(const std::string& key) const;

    std::filesystem::path root_directory_;
    mutable std::mutex mutex_;
    std::shared_ptr<spdlog::logger> logger_;
};

/** @brief Encode @p key into a file-system-safe name. */
[[nodiscard]] std::string encode_storage_key(const std::string& key);

}  // namespace offline_maps

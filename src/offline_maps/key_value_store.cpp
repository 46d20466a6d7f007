#include "offline_maps/key_value_store.hpp"

#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>

#include <fmt/format.h>

#include "offline_maps/errors.hpp"

namespace offline_maps {

namespace {
constexpr char k_record_extension[] = ".json";
constexpr char k_temp_suffix[] = ".tmp";
}  // namespace

std::string encode_storage_key(const std::string& key) {
    std::string encoded;
    encoded.reserve(key.size());
    for (const char character : key) {
        const auto byte = static_cast<unsigned char>(character);
        if (std::isalnum(byte) != 0 || character == '_' || character == '-' || character == '.') {
            encoded.push_back(character);
        } else {
            encoded += fmt::format("%{:02X}", static_cast<unsigned int>(byte));
        }
    }
    return encoded;
}

FileKeyValueStore::FileKeyValueStore(std::filesystem::path root_directory)
    : root_directory_(std::move(root_directory)),
      logger_(get_logger()) {
    std::error_code error_directory;
    std::filesystem::create_directories(root_directory_, error_directory);
    if (error_directory) {
        throw StorageError("Unable to create storage directory at " + root_directory_.string());
    }
    logger_->debug("Key-value store rooted at {}", root_directory_.string());
}

std::optional<std::string> FileKeyValueStore::get(const std::string& key) const {
    std::scoped_lock lock(mutex_);
    const std::filesystem::path path_record = path_for(key);
    std::error_code error_exists;
    if (!std::filesystem::exists(path_record, error_exists)) {
        if (error_exists) {
            throw StorageError(fmt::format("Unable to stat {}: {}", path_record.string(), error_exists.message()));
        }
        return std::nullopt;
    }

    std::ifstream input(path_record, std::ios::binary);
    if (!input.is_open()) {
        throw StorageError("Unable to open " + path_record.string() + " for reading");
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    if (input.bad()) {
        throw StorageError("Failed reading " + path_record.string());
    }
    return buffer.str();
}

void FileKeyValueStore::set(const std::string& key, const std::string& value) {
    std::scoped_lock lock(mutex_);
    const std::filesystem::path path_record = path_for(key);
    std::filesystem::path path_temp = path_record;
    path_temp += k_temp_suffix;

    {
        std::ofstream output(path_temp, std::ios::binary | std::ios::trunc);
        if (!output.is_open()) {
            throw StorageError("Unable to open " + path_temp.string() + " for writing");
        }
        output.write(value.data(), static_cast<std::streamsize>(value.size()));
        output.flush();
        if (!output) {
            throw StorageError("Failed writing " + path_temp.string());
        }
    }

    std::error_code error_rename;
    std::filesystem::rename(path_temp, path_record, error_rename);
    if (error_rename) {
        std::error_code error_cleanup;
        std::filesystem::remove(path_temp, error_cleanup);
        if (error_cleanup) {
            logger_->warn("Unable to remove temporary record {}: {}", path_temp.string(), error_cleanup.message());
        }
        throw StorageError(fmt::format("Unable to commit {}: {}", path_record.string(), error_rename.message()));
    }
}

void FileKeyValueStore::remove(const std::string& key) {
    std::scoped_lock lock(mutex_);
    const std::filesystem::path path_record = path_for(key);
    std::error_code error_remove;
    std::filesystem::remove(path_record, error_remove);
    if (error_remove) {
        throw StorageError(fmt::format("Unable to remove {}: {}", path_record.string(), error_remove.message()));
    }
}

const std::filesystem::path& FileKeyValueStore::root_directory() const noexcept {
    return root_directory_;
}

std::filesystem::path FileKeyValueStore::path_for(const std::string& key) const {
    return root_directory_ / (encode_storage_key(key) + k_record_extension);
}

}  // namespace offline_maps

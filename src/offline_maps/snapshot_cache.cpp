#include "offline_maps/snapshot_cache.hpp"

#include "offline_maps/errors.hpp"
#include "offline_maps/json_codec.hpp"

namespace offline_maps {

SnapshotCache::SnapshotCache(KeyValueStore& store)
    : store_(store),
      logger_(get_logger()) {}

std::optional<MapCacheInfo> SnapshotCache::save(const MapGraph& graph, const std::string& name) {
    std::scoped_lock lock(mutex_);
    MapCacheInfo info{};
    info.timestamp = now_timestamp();
    info.name = name;
    info.node_count = graph.nodes.size();
    info.road_segment_count = graph.road_segments.size();

    try {
        // Both payloads are encoded before either key is written.
        const std::string payload = encode_json(graph);
        info.size = payload.size();
        const std::string info_payload = encode_json(info);
        store_.set(k_snapshot_data_key, payload);
        store_.set(k_snapshot_info_key, info_payload);
    } catch (const OfflineMapError& exc) {
        logger_->error(R"({{"component":"snapshot","name":"{}","action":"save","error":"{}"}})", name, exc.what());
        return std::nullopt;
    }

    SnapshotCatalog catalog = cache_list_locked();
    catalog[name] = info;
    try {
        store_.set(k_snapshot_catalog_key, encode_json(catalog));
    } catch (const OfflineMapError& exc) {
        logger_->error(R"({{"component":"snapshot","name":"{}","action":"update_catalog","error":"{}"}})", name, exc.what());
    }

    logger_->info(
        R"({{"component":"snapshot","name":"{}","action":"save","nodes":{},"road_segments":{},"bytes":{}}})",
        name,
        info.node_count,
        info.road_segment_count,
        info.size
    );
    return info;
}

std::optional<MapGraph> SnapshotCache::load() const {
    std::scoped_lock lock(mutex_);
    try {
        const std::optional<std::string> payload = store_.get(k_snapshot_data_key);
        if (!payload.has_value()) {
            return std::nullopt;
        }
        MapGraph graph = decode_json<MapGraph>(payload.value());
        logger_->info("Loaded cached map graph: {} nodes, {} road segments", graph.nodes.size(), graph.road_segments.size());
        return graph;
    } catch (const OfflineMapError& exc) {
        logger_->error(R"({{"component":"snapshot","action":"load","error":"{}"}})", exc.what());
    }
    return std::nullopt;
}

std::optional<MapCacheInfo> SnapshotCache::cache_info() const {
    std::scoped_lock lock(mutex_);
    return cache_info_locked();
}

SnapshotCatalog SnapshotCache::cache_list() const {
    std::scoped_lock lock(mutex_);
    return cache_list_locked();
}

SnapshotCacheStatus SnapshotCache::cache_status() const {
    const SnapshotCatalog catalog = cache_list();
    SnapshotCacheStatus status{};
    status.item_count = catalog.size();
    for (const auto& [name, info] : catalog) {
        status.total_size += info.size;
        if (!status.last_updated.has_value() || info.timestamp > status.last_updated.value()) {
            status.last_updated = info.timestamp;
        }
    }
    return status;
}

bool SnapshotCache::clear(const std::optional<std::string>& name) {
    std::scoped_lock lock(mutex_);
    try {
        if (name.has_value()) {
            SnapshotCatalog catalog = cache_list_locked();
            if (catalog.erase(name.value()) > 0) {
                store_.set(k_snapshot_catalog_key, encode_json(catalog));
            }
            const std::optional<MapCacheInfo> current = cache_info_locked();
            if (current.has_value() && current->name == name.value()) {
                store_.remove(k_snapshot_data_key);
                store_.remove(k_snapshot_info_key);
            }
            logger_->info(R"({{"component":"snapshot","name":"{}","action":"clear"}})", name.value());
        } else {
            store_.remove(k_snapshot_data_key);
            store_.remove(k_snapshot_info_key);
            store_.remove(k_snapshot_catalog_key);
            logger_->info(R"({"component":"snapshot","action":"clear_all"})");
        }
    } catch (const OfflineMapError& exc) {
        logger_->error(R"({{"component":"snapshot","action":"clear","error":"{}"}})", exc.what());
        return false;
    }
    return true;
}

SnapshotCatalog SnapshotCache::cache_list_locked() const {
    try {
        const std::optional<std::string> payload = store_.get(k_snapshot_catalog_key);
        if (!payload.has_value()) {
            return {};
        }
        return decode_json<SnapshotCatalog>(payload.value());
    } catch (const OfflineMapError& exc) {
        logger_->error(R"({{"component":"snapshot","action":"read_catalog","error":"{}"}})", exc.what());
    }
    return {};
}

std::optional<MapCacheInfo> SnapshotCache::cache_info_locked() const {
    try {
        const std::optional<std::string> payload = store_.get(k_snapshot_info_key);
        if (!payload.has_value()) {
            return std::nullopt;
        }
        return decode_json<MapCacheInfo>(payload.value());
    } catch (const OfflineMapError& exc) {
        logger_->error(R"({{"component":"snapshot","action":"read_info","error":"{}"}})", exc.what());
    }
    return std::nullopt;
}

}  // namespace offline_maps

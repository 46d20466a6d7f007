#include "offline_maps/progress_notifier.hpp"

#include <algorithm>
#include <exception>

namespace offline_maps {

ProgressNotifier::ProgressNotifier()
    : logger_(get_logger()) {}

ListenerId ProgressNotifier::add_listener(ProgressListener listener) {
    std::scoped_lock lock(mutex_);
    const ListenerId listener_id = next_listener_id_++;
    list_listeners_.emplace_back(listener_id, std::move(listener));
    return listener_id;
}

bool ProgressNotifier::remove_listener(ListenerId listener_id) {
    std::scoped_lock lock(mutex_);
    const auto iterator_listener = std::find_if(
        list_listeners_.begin(),
        list_listeners_.end(),
        [listener_id](const auto& entry) { return entry.first == listener_id; }
    );
    if (iterator_listener == list_listeners_.end()) {
        return false;
    }
    list_listeners_.erase(iterator_listener);
    return true;
}

void ProgressNotifier::notify(const std::string& region_id, int progress) {
    std::vector<std::pair<ListenerId, ProgressListener>> snapshot;
    {
        std::scoped_lock lock(mutex_);
        snapshot = list_listeners_;
    }

    for (const auto& [listener_id, listener] : snapshot) {
        try {
            listener(region_id, progress);
        } catch (const std::exception& exc) {
            logger_->error(
                R"({{"component":"progress","listener":{},"region":"{}","error":"{}"}})",
                listener_id,
                region_id,
                exc.what()
            );
        } catch (...) {
            logger_->error(
                R"({{"component":"progress","listener":{},"region":"{}","error":"non-standard exception"}})",
                listener_id,
                region_id
            );
        }
    }
}

std::size_t ProgressNotifier::listener_count() const {
    std::scoped_lock lock(mutex_);
    return list_listeners_.size();
}

}  // namespace offline_maps

#include "offline_maps/types.hpp"

namespace offline_maps {

std::string_view to_string(RegionStatus status) noexcept {
    switch (status) {
        case RegionStatus::None:
            return "none";
        case RegionStatus::Downloading:
            return "downloading";
        case RegionStatus::Available:
            return "available";
        case RegionStatus::Outdated:
            return "outdated";
        case RegionStatus::Error:
            return "error";
    }
    return "none";
}

std::optional<RegionStatus> region_status_from_string(std::string_view value) noexcept {
    if (value == "none") {
        return RegionStatus::None;
    }
    if (value == "downloading") {
        return RegionStatus::Downloading;
    }
    if (value == "available") {
        return RegionStatus::Available;
    }
    if (value == "outdated") {
        return RegionStatus::Outdated;
    }
    if (value == "error") {
        return RegionStatus::Error;
    }
    return std::nullopt;
}

std::string_view to_string(UpdateInterval interval) noexcept {
    switch (interval) {
        case UpdateInterval::Daily:
            return "daily";
        case UpdateInterval::Weekly:
            return "weekly";
        case UpdateInterval::Monthly:
            return "monthly";
        case UpdateInterval::Never:
            return "never";
    }
    return "never";
}

std::optional<UpdateInterval> update_interval_from_string(std::string_view value) noexcept {
    if (value == "daily") {
        return UpdateInterval::Daily;
    }
    if (value == "weekly") {
        return UpdateInterval::Weekly;
    }
    if (value == "monthly") {
        return UpdateInterval::Monthly;
    }
    if (value == "never") {
        return UpdateInterval::Never;
    }
    return std::nullopt;
}

std::string_view to_string(NetworkClass network_class) noexcept {
    switch (network_class) {
        case NetworkClass::Wifi:
            return "wifi";
        case NetworkClass::Cellular:
            return "cellular";
        case NetworkClass::Offline:
            return "offline";
    }
    return "offline";
}

std::optional<NetworkClass> network_class_from_string(std::string_view value) noexcept {
    if (value == "wifi") {
        return NetworkClass::Wifi;
    }
    if (value == "cellular") {
        return NetworkClass::Cellular;
    }
    if (value == "offline" || value == "none") {
        return NetworkClass::Offline;
    }
    return std::nullopt;
}

}  // namespace offline_maps

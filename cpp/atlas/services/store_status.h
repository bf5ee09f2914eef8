#pragma once

#include <cstdint>

enum class StoreStatus : std::uint32_t {
    Ok = 0,
    NotFound = 1,
    Rejected = 2,
    Conflict = 3,
    Unavailable = 4,
};

inline const char* storeStatusName(StoreStatus status) {
    switch (status) {
        case StoreStatus::Ok: return "ok";
        case StoreStatus::NotFound: return "not-found";
        case StoreStatus::Rejected: return "rejected";
        case StoreStatus::Conflict: return "conflict";
        case StoreStatus::Unavailable: return "unavailable";
    }
    return "unknown";
}

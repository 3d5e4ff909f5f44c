#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace faultline {

// The two independently operated clusters under test.
enum class StoreId { MongoDB = 0, Cassandra = 1 };

inline constexpr std::array<StoreId, 2> kAllStores{StoreId::MongoDB, StoreId::Cassandra};

constexpr std::size_t storeIndex(StoreId id) {
    return static_cast<std::size_t>(id);
}

// Key used in API payloads and reports
constexpr const char* storeKey(StoreId id) {
    switch (id) {
        case StoreId::MongoDB: return "mongodb";
        case StoreId::Cassandra: return "cassandra";
    }
    return "unknown";
}

constexpr const char* storeDisplayName(StoreId id) {
    switch (id) {
        case StoreId::MongoDB: return "MongoDB";
        case StoreId::Cassandra: return "Cassandra";
    }
    return "Unknown";
}

inline std::optional<StoreId> storeFromKey(std::string_view key) {
    for (auto id : kAllStores) {
        if (key == storeKey(id))
            return id;
    }
    return std::nullopt;
}

} // namespace faultline

#pragma once
#ifndef LRU_STORE_JSON_H
#define LRU_STORE_JSON_H

#include "lru/lru_store.h"

#include <nlohmann/json.hpp>

namespace lru {

/**
 * Render a store as
 *   {"capacity": N, "filled": M, "entries": [[key, value], ...]}
 * with entries oldest first. Rendering goes through items(), so it never
 * changes recency. Key and Value must themselves be convertible to JSON.
 */
template <typename Key, typename Value, typename Hash, typename KeyEqual>
void to_json(nlohmann::json& j, const LruStore<Key, Value, Hash, KeyEqual>& store) {
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& [key, value] : store.items()) {
        entries.push_back(nlohmann::json::array({key, value}));
    }

    j = nlohmann::json{
        {"capacity", store.capacity()},
        {"filled", store.filled()},
        {"entries", std::move(entries)}
    };
}

} // namespace lru

#endif // LRU_STORE_JSON_H

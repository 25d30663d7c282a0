/**
 * @file LruCache.hpp
 * @brief Fixed-capacity key/value cache with least-recently-used eviction.
 */

#pragma once

#include <cstddef>
#include <list>
#include <optional>
#include <unordered_map>
#include <utility>

namespace timenotes::infrastructure {

/**
 * @class LruCache
 * @brief Inserting into a full cache evicts the entry that was least recently put or read.
 *
 * Not thread-safe; owners serialize access.
 */
template<typename Key, typename Value>
class LruCache {
public:
    explicit LruCache(size_t capacity) : m_capacity(capacity == 0 ? 1 : capacity) {}

    void Put(const Key& key, Value value) {
        auto it = m_index.find(key);
        if (it != m_index.end()) {
            it->second->second = std::move(value);
            m_order.splice(m_order.begin(), m_order, it->second);
            return;
        }
        if (m_order.size() >= m_capacity) {
            m_index.erase(m_order.back().first);
            m_order.pop_back();
        }
        m_order.emplace_front(key, std::move(value));
        m_index[key] = m_order.begin();
    }

    /** @brief Returns the value and marks it most recently used. */
    std::optional<Value> Get(const Key& key) {
        auto it = m_index.find(key);
        if (it == m_index.end()) {
            return std::nullopt;
        }
        m_order.splice(m_order.begin(), m_order, it->second);
        return it->second->second;
    }

    /** @brief Membership test that does not change recency. */
    bool Contains(const Key& key) const {
        return m_index.find(key) != m_index.end();
    }

    size_t Size() const { return m_order.size(); }
    size_t Capacity() const { return m_capacity; }

private:
    using Entry = std::pair<Key, Value>;

    size_t m_capacity;
    std::list<Entry> m_order;
    std::unordered_map<Key, typename std::list<Entry>::iterator> m_index;
};

} // namespace timenotes::infrastructure

/** \file LruCache.hpp
 *  Bounded, thread-safe LRU map with optional per-entry expiry.
 *  Expiry is checked lazily on lookup; there is no background sweep.
 */
#pragma once
#include <QMutex>
#include <QMutexLocker>
#include <QDateTime>
#include <functional>
#include <list>
#include <optional>
#include <unordered_map>
#include <utility>

namespace QtPdfTemplate::cache {

/** Hit/miss counters, mainly for diagnostics and tests. */
struct CacheStats {
    quint64 hits{0};
    quint64 misses{0};
    quint64 evictions{0};
    quint64 expirations{0};
};

template <typename Key, typename Value>
class LruCache {
public:
    /** Millisecond clock; injectable so expiry can be driven deterministically. */
    using Clock = std::function<qint64()>;

    static Clock systemClock() { return []{ return QDateTime::currentMSecsSinceEpoch(); }; }

    /** capacity <= 0 disables storage entirely (every lookup misses). */
    explicit LruCache(int capacity, Clock clock = systemClock())
        : m_capacity(capacity), m_clock(std::move(clock)) {}

    LruCache(const LruCache &) = delete;
    LruCache & operator=(const LruCache &) = delete;

    /** Returns a copy of the value and marks the key most recently used. Expired entries are removed and miss. */
    std::optional<Value> get(const Key &key) {
        QMutexLocker lock(&m_mutex);
        auto it = m_index.find(key);
        if(it == m_index.end()) { ++m_stats.misses; return std::nullopt; }
        auto node = it->second;
        if(node->expiresAtMs > 0 && node->expiresAtMs <= m_clock()) {
            m_order.erase(node);
            m_index.erase(it);
            ++m_stats.expirations;
            ++m_stats.misses;
            return std::nullopt;
        }
        m_order.splice(m_order.begin(), m_order, node);
        ++m_stats.hits;
        return node->value;
    }

    /** Insert or replace. ttlMs <= 0 means the entry never expires. Evicts least recently used entries past capacity. */
    void put(const Key &key, Value value, qint64 ttlMs = 0) {
        QMutexLocker lock(&m_mutex);
        if(m_capacity <= 0) return;
        const qint64 expiresAt = ttlMs > 0 ? m_clock() + ttlMs : 0;
        auto it = m_index.find(key);
        if(it != m_index.end()) {
            it->second->value = std::move(value);
            it->second->expiresAtMs = expiresAt;
            m_order.splice(m_order.begin(), m_order, it->second);
            return;
        }
        m_order.push_front(Node{key, std::move(value), expiresAt});
        m_index.emplace(key, m_order.begin());
        while(static_cast<int>(m_order.size()) > m_capacity) {
            m_index.erase(m_order.back().key);
            m_order.pop_back();
            ++m_stats.evictions;
        }
    }

    void clear() {
        QMutexLocker lock(&m_mutex);
        m_order.clear();
        m_index.clear();
    }

    int size() const { QMutexLocker lock(&m_mutex); return static_cast<int>(m_order.size()); }
    int capacity() const { return m_capacity; }
    CacheStats stats() const { QMutexLocker lock(&m_mutex); return m_stats; }

private:
    struct Node {
        Key key;
        Value value;
        qint64 expiresAtMs;
    };

    const int m_capacity;
    Clock m_clock;
    mutable QMutex m_mutex;
    std::list<Node> m_order; // front = most recently used
    std::unordered_map<Key, typename std::list<Node>::iterator> m_index;
    CacheStats m_stats;
};

} // namespace QtPdfTemplate::cache

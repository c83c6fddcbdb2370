// LRU cache: recency order, capacity bound, lazy TTL expiry with an injected clock, counters
#include "cache/LruCache.hpp"
#include <QString>
#include <cassert>
#include <iostream>

using QtPdfTemplate::cache::LruCache;

int main() {
    qint64 now = 1000;
    auto clock = [&now]{ return now; };

    // Eviction follows recency, not insertion order
    {
        LruCache<QString, int> c(2, clock);
        c.put("a", 1);
        c.put("b", 2);
        assert(c.get("a").value() == 1); // a becomes most recent
        c.put("c", 3);                   // evicts b
        assert(!c.get("b").has_value());
        assert(c.get("a").value() == 1);
        assert(c.get("c").value() == 3);
        assert(c.size() == 2);
        assert(c.stats().evictions == 1);
    }
    // Re-inserting refreshes value and recency
    {
        LruCache<QString, int> c(2, clock);
        c.put("a", 1);
        c.put("b", 2);
        c.put("a", 10);
        c.put("c", 3); // evicts b
        assert(c.get("a").value() == 10);
        assert(!c.get("b").has_value());
    }
    // TTL: entries expire lazily on lookup and count as misses
    {
        LruCache<QString, QString> c(4, clock);
        c.put("k", "v", 500);
        c.put("forever", "x");
        now += 499;
        assert(c.get("k").value() == "v");
        now += 1;
        assert(!c.get("k").has_value());
        assert(c.size() == 1);
        assert(c.get("forever").value() == "x");
        const auto s = c.stats();
        assert(s.expirations == 1);
        assert(s.hits == 2);
        assert(s.misses == 1);
    }
    // Capacity 0 stores nothing; clear empties
    {
        LruCache<QString, int> off(0, clock);
        off.put("a", 1);
        assert(off.size() == 0 && !off.get("a").has_value());

        LruCache<QString, int> c(3, clock);
        c.put("a", 1);
        c.put("b", 2);
        assert(c.size() == 2);
        c.clear();
        assert(c.size() == 0);
    }
    std::cout << "lru_cache_test passed" << std::endl;
    return 0;
}

//
//  Map wrapper where we can iterate through
//  items in insertion-order.
//

#pragma once

#include <algorithm>
#include <functional>
#include <map>
#include <vector>

namespace fuzzpatch {

template <typename K, typename V>
struct OrderedMap {
    std::map<K, V> m_;

    // Keys in insert-order
    std::vector<K> keys_;

    void
    insert(const K& key, V value) {
        if (!contains(key)) {
            keys_.push_back(key);
        }
        m_[key] = std::move(value);
    }

    bool
    remove(const K& key) {
        if (!contains(key)) {
            return false;
        }
        keys_.erase(std::remove(keys_.begin(), keys_.end(), key), keys_.end());
        m_.erase(key);
        return true;
    }

    V&
    operator[](const K& key) {
        if (!contains(key)) {
            keys_.push_back(key);
        }
        return m_[key];
    }

    std::size_t
    size() const {
        return m_.size();
    }

    bool
    contains(const K& key) const {
        return m_.contains(key);
    }

    const std::vector<K>&
    keys() const {
        return keys_;
    }

    void
    for_each(std::function<void(const K&, V&)> cb) {
        for (const auto& k : keys_) {
            cb(k, m_[k]);
        }
    }
};

}  // namespace fuzzpatch

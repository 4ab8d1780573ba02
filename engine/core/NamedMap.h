// Insertion-ordered map keyed by name.
#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace Scox {

// Entries are stored densely in insertion order (display order) with a hash
// index on the key. Pointers returned by find() are invalidated by insert().
template <typename T>
class NamedMap {
public:
    using Entry = std::pair<std::string, T>;

    T& insert(const std::string& key, T value) {
        auto it = index_.find(key);
        if (it != index_.end()) {
            entries_[it->second].second = std::move(value);
            return entries_[it->second].second;
        }
        index_.emplace(key, entries_.size());
        entries_.emplace_back(key, std::move(value));
        return entries_.back().second;
    }

    T* find(const std::string& key) {
        auto it = index_.find(key);
        return it != index_.end() ? &entries_[it->second].second : nullptr;
    }

    const T* find(const std::string& key) const {
        auto it = index_.find(key);
        return it != index_.end() ? &entries_[it->second].second : nullptr;
    }

    bool contains(const std::string& key) const { return index_.count(key) > 0; }

    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    auto begin() { return entries_.begin(); }
    auto end() { return entries_.end(); }
    auto begin() const { return entries_.begin(); }
    auto end() const { return entries_.end(); }

private:
    std::vector<Entry> entries_;
    std::unordered_map<std::string, std::size_t> index_;
};

}  // namespace Scox

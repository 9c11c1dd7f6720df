#pragma once
#include "position.hpp"
#include <string>
#include <vector>
#include <variant>
#include <optional>
#include <utility>

namespace relex {

// Group key: numeric index or group name
using GroupKey = std::variant<int, std::string>;

inline bool is_named(const GroupKey& key) {
    return std::holds_alternative<std::string>(key);
}

inline std::string key_to_string(const GroupKey& key) {
    if (auto* name = std::get_if<std::string>(&key)) return *name;
    return std::to_string(std::get<int>(key));
}

// Insertion-ordered map keyed by GroupKey.
// Keeps the order the engine reported the groups in (a named group's name
// entry comes right before its index entry).
template <typename T>
class GroupTable {
public:
    using value_type = std::pair<GroupKey, T>;
    using const_iterator = typename std::vector<value_type>::const_iterator;

    GroupTable() = default;

    // Insert, or overwrite the value in place when the key exists
    void set(const GroupKey& key, T value) {
        for (auto& entry : entries_) {
            if (entry.first == key) {
                entry.second = std::move(value);
                return;
            }
        }
        entries_.emplace_back(key, std::move(value));
    }

    bool contains(const GroupKey& key) const {
        return find(key) != nullptr;
    }

    // nullptr when the key is absent
    const T* find(const GroupKey& key) const {
        for (const auto& entry : entries_) {
            if (entry.first == key) return &entry.second;
        }
        return nullptr;
    }

    // Subset with string keys only
    GroupTable named() const {
        GroupTable result;
        for (const auto& entry : entries_) {
            if (is_named(entry.first)) result.entries_.push_back(entry);
        }
        return result;
    }

    // Subset with integer keys only
    GroupTable indexed() const {
        GroupTable result;
        for (const auto& entry : entries_) {
            if (!is_named(entry.first)) result.entries_.push_back(entry);
        }
        return result;
    }

    // Copy without the given key
    GroupTable without(const GroupKey& key) const {
        GroupTable result;
        for (const auto& entry : entries_) {
            if (entry.first != key) result.entries_.push_back(entry);
        }
        return result;
    }

    std::vector<GroupKey> keys() const {
        std::vector<GroupKey> result;
        for (const auto& entry : entries_) result.push_back(entry.first);
        return result;
    }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

    bool operator==(const GroupTable& other) const { return entries_ == other.entries_; }
    bool operator!=(const GroupTable& other) const { return !(*this == other); }

private:
    std::vector<value_type> entries_;
};

// Captured text per group; nullopt for a group that did not participate
using GroupMap = GroupTable<std::optional<std::string>>;
using PositionMap = GroupTable<Position>;

} // namespace relex

#pragma once

#include "topomap/core/Types.h"

#include <algorithm>
#include <optional>
#include <unordered_map>
#include <vector>

namespace topomap {

/// Unbounded integer grid storing values only for occupied cells.
/// A missing key means the cell is empty.
///
/// The list helpers (appendUnique / removeValue) are only usable when V is a
/// std::vector; they keep each value at most once per cell and drop the
/// cell when its list becomes empty.
template <typename V>
class SparseGrid {
public:
    using Storage = std::unordered_map<GridPos, V, GridPosHash>;

    std::optional<V> get(const GridPos& pos) const {
        auto it = cells_.find(pos);
        if (it == cells_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    /// Pointer to the stored value or nullptr; invalidated by any mutation
    const V* find(const GridPos& pos) const {
        auto it = cells_.find(pos);
        return it != cells_.end() ? &it->second : nullptr;
    }

    void set(const GridPos& pos, V value) { cells_[pos] = std::move(value); }
    void remove(const GridPos& pos) { cells_.erase(pos); }
    bool contains(const GridPos& pos) const { return cells_.find(pos) != cells_.end(); }

    std::size_t size() const { return cells_.size(); }
    bool empty() const { return cells_.empty(); }
    void clear() { cells_.clear(); }

    const Storage& cells() const { return cells_; }

    /// Append to the list at pos unless already present.
    /// @return true if the value was added
    template <typename T>
    bool appendUnique(const GridPos& pos, const T& value) {
        auto& list = cells_[pos];
        if (std::find(list.begin(), list.end(), value) != list.end()) {
            return false;
        }
        list.push_back(value);
        return true;
    }

    /// Remove every occurrence of value from the list at pos
    template <typename T>
    void removeValue(const GridPos& pos, const T& value) {
        auto it = cells_.find(pos);
        if (it == cells_.end()) {
            return;
        }
        auto& list = it->second;
        list.erase(std::remove(list.begin(), list.end(), value), list.end());
        if (list.empty()) {
            cells_.erase(it);
        }
    }

private:
    Storage cells_;
};

}  // namespace topomap

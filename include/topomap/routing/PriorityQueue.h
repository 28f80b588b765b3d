#pragma once

#include <algorithm>
#include <optional>
#include <utility>
#include <vector>

namespace topomap {

/// Binary min-heap keyed by an integer priority.
/// Equal priorities come out in heap order, which is not stable.
template <typename T>
class PriorityQueue {
public:
    void push(T value, int priority) {
        heap_.push_back({priority, std::move(value)});
        std::push_heap(heap_.begin(), heap_.end(), Greater{});
    }

    /// Remove and return the lowest-priority element
    std::optional<T> popMin() {
        if (heap_.empty()) {
            return std::nullopt;
        }
        std::pop_heap(heap_.begin(), heap_.end(), Greater{});
        T value = std::move(heap_.back().value);
        heap_.pop_back();
        return value;
    }

    bool empty() const { return heap_.empty(); }
    std::size_t size() const { return heap_.size(); }
    void clear() { heap_.clear(); }

private:
    struct Item {
        int priority;
        T value;
    };

    struct Greater {
        bool operator()(const Item& a, const Item& b) const {
            return a.priority > b.priority;
        }
    };

    std::vector<Item> heap_;
};

}  // namespace topomap

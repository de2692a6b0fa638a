#pragma once

#include "search/step.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace astar {

// ─── Frontier ──────────────────────────────────────────────────
// Open list of a search. Steps are ordered by (f, sequence): lowest f
// first, equal f in discovery order. The ordered list is kept in
// reverse so the minimum sits at the back. A node → entry index answers
// membership by node identity independently of cost order.

template <typename Node, typename Cost = NodeCost<Node>>
class Frontier {
public:
    explicit Frontier(const StepArena<Node, Cost>& arena) : arena_(arena) {}

    bool empty() const { return entries_.empty(); }
    size_t size() const { return entries_.size(); }

    /// Insert a step. Throws if a step for the same node is already open.
    void push(StepId id) {
        const auto& step = arena_.at(id);
        Entry entry{step.totalCost(), step.sequence, id};
        if (!index_.emplace(step.node, entry).second) {
            throw std::runtime_error("Frontier already holds a step for node of step " +
                                     std::to_string(id));
        }
        insertSorted(entry);
    }

    /// Remove and return the step with the lowest (f, sequence).
    StepId popMin() {
        if (entries_.empty()) {
            throw std::out_of_range("popMin on an empty frontier");
        }
        Entry entry = entries_.back();
        entries_.pop_back();
        index_.erase(arena_[entry.step].node);
        return entry.step;
    }

    /// Open step for `node`, if any.
    std::optional<StepId> find(const Node& node) const {
        auto it = index_.find(node);
        if (it == index_.end()) return std::nullopt;
        return it->second.step;
    }

    bool contains(const Node& node) const { return index_.count(node) > 0; }

    /// Move an open step to the position matching its current f.
    /// Call after the arena relaxed it.
    void reposition(StepId id) {
        const auto& step = arena_.at(id);
        auto it = index_.find(step.node);
        if (it == index_.end() || it->second.step != id) {
            throw std::runtime_error("Step is not open: " + std::to_string(id));
        }

        auto pos = std::lower_bound(entries_.begin(), entries_.end(), it->second, extractedLater);
        if (pos == entries_.end() || pos->step != id) {
            throw std::runtime_error("Open step lost its place in cost order: " + std::to_string(id));
        }
        entries_.erase(pos);

        it->second.total = step.totalCost();
        insertSorted(it->second);
    }

private:
    struct Entry {
        Cost total{};
        uint64_t sequence = 0;
        StepId step = kNoStep;
    };

    const StepArena<Node, Cost>& arena_;
    std::vector<Entry> entries_;                 // descending: minimum at back()
    std::unordered_map<Node, Entry> index_;

    static bool extractedLater(const Entry& a, const Entry& b) {
        if (a.total != b.total) return a.total > b.total;
        return a.sequence > b.sequence;
    }

    void insertSorted(const Entry& entry) {
        auto pos = std::upper_bound(entries_.begin(), entries_.end(), entry, extractedLater);
        entries_.insert(pos, entry);
    }
};

} // namespace astar

#pragma once
// Composite-key index: mix(a, b) on one axis -> posting of slots
//
// SP keys hold object slots, PO keys hold subject slots and OS keys hold
// predicate slots. Distinct pairs may collide on one key; the engine checks
// every candidate against the canonical triple set before returning it.

#include "posting.hpp"
#include "rmx.hpp"
#include <unordered_map>
#include <utility>

namespace tristore {

class CompositeIndex {
public:
    explicit CompositeIndex(const rmx::Axis& axis) : axis_(&axis) {}

    Id128 key(const Id128& a, const Id128& b) const {
        return rmx::mix(a, b, *axis_);
    }

    // true if the slot was not already under this key.
    // A throw leaves the index unchanged.
    bool add(const Id128& a, const Id128& b, uint32_t slot) {
        Id128 k = key(a, b);
        auto it = postings_.find(k);
        if (it != postings_.end()) return it->second.add(slot);

        Posting posting;
        posting.add(slot);
        postings_.emplace(k, std::move(posting));
        return true;
    }

    // Drops the key once its posting is empty
    void remove(const Id128& a, const Id128& b, uint32_t slot) {
        auto it = postings_.find(key(a, b));
        if (it == postings_.end()) return;
        it->second.remove(slot);
        if (it->second.empty()) postings_.erase(it);
    }

    // nullptr if the pair was never indexed
    const Posting* find(const Id128& a, const Id128& b) const {
        auto it = postings_.find(key(a, b));
        return it == postings_.end() ? nullptr : &it->second;
    }

    size_t key_count() const { return postings_.size(); }

    // Slots across all keys; equals the triple count when no keys collide
    size_t entry_count() const {
        size_t total = 0;
        for (const auto& [key, posting] : postings_) {
            total += posting.cardinality();
        }
        return total;
    }

    size_t memory_bytes() const {
        size_t bytes = postings_.size() * (sizeof(Id128) + sizeof(Posting) + 32);
        for (const auto& [key, posting] : postings_) {
            bytes += posting.memory_bytes();
        }
        return bytes;
    }

    void reserve(size_t n) { postings_.reserve(n); }

private:
    const rmx::Axis* axis_;
    std::unordered_map<Id128, Posting, Id128Hash> postings_;
};

} // namespace tristore

#pragma once
// Term dictionary: interns terms into dense 32-bit slots
//
// Postings store slots rather than terms. The dictionary owns one copy of
// each distinct term and resolves slots back to it. Terms are keyed by
// (kind, id): an entity and a literal never share a slot, even with equal ids.

#include "error.hpp"
#include "types.hpp"
#include <cstdint>
#include <limits>
#include <optional>
#include <unordered_map>
#include <vector>

namespace tristore {

constexpr uint32_t MAX_SLOTS = std::numeric_limits<uint32_t>::max();

struct TermKey {
    uint8_t kind;
    Id128 id;

    bool operator==(const TermKey& other) const {
        return kind == other.kind && id == other.id;
    }
};

struct TermKeyHash {
    size_t operator()(const TermKey& k) const {
        return Id128Hash{}(k.id) ^ (static_cast<size_t>(k.kind) * 0x9E3779B97F4A7C15ULL);
    }
};

template <typename Term>
class TermDictionary {
public:
    // Get or create slot for term
    uint32_t get_or_create(const Term& term) {
        TermKey k = key_of(term);
        auto it = slots_.find(k);
        if (it != slots_.end()) return it->second;

        if (terms_.size() >= MAX_SLOTS) {
            throw StoreError("term dictionary is full");
        }
        uint32_t slot = static_cast<uint32_t>(terms_.size());
        terms_.push_back(term);
        try {
            slots_.emplace(k, slot);
        } catch (...) {
            terms_.pop_back();
            throw;
        }
        return slot;
    }

    std::optional<uint32_t> find(const Term& term) const {
        auto it = slots_.find(key_of(term));
        if (it == slots_.end()) return std::nullopt;
        return it->second;
    }

    const Term& get(uint32_t slot) const {
        return terms_[slot];
    }

    size_t size() const { return terms_.size(); }

    void reserve(size_t n) {
        terms_.reserve(n);
        slots_.reserve(n);
    }

    size_t memory_bytes() const {
        return terms_.capacity() * sizeof(Term) +
               slots_.size() * (sizeof(TermKey) + sizeof(uint32_t) + 32);
    }

private:
    // term_kind is found by ADL next to each term type
    static TermKey key_of(const Term& term) {
        return {term_kind(term), term.id()};
    }

    std::vector<Term> terms_;
    std::unordered_map<TermKey, uint32_t, TermKeyHash> slots_;
};

} // namespace tristore

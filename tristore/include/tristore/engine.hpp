#pragma once
// Index engine: canonical triple set plus derived indices
//
// Layout:
//   terms_       Value -> slot (subjects and objects share one dictionary)
//   predicates_  Predicate -> slot
//   triples_     insertion log, position -> Triple
//   positions_   (s, p, o) slots -> position, the canonical set
//
// Derived state, updated together on every net-new insert:
//   sp_  mix_SP(s, p) -> object slots
//   po_  mix_PO(p, o) -> subject slots
//   os_  mix_OS(o, s) -> predicate slots
//   by_subject_ / by_predicate_ / by_object_  slot -> triple positions
//
// Not synchronized. TripleStore holds the lock around every call.

#include "composite_index.hpp"
#include "dictionary.hpp"
#include "posting.hpp"
#include "triple.hpp"
#include <algorithm>
#include <functional>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tristore {

// A stored triple as dictionary slots
struct SlotTriple {
    uint32_t s;
    uint32_t p;
    uint32_t o;

    bool operator==(const SlotTriple& other) const {
        return s == other.s && p == other.p && o == other.o;
    }
};

struct SlotTripleHash {
    size_t operator()(const SlotTriple& t) const {
        uint64_t a = (static_cast<uint64_t>(t.s) << 32) | t.p;
        return std::hash<uint64_t>{}(rmx::fmix64(a ^ rmx::fmix64(t.o)));
    }
};

struct EngineStats {
    size_t triples = 0;
    size_t subjects = 0;
    size_t terms = 0;
    size_t predicates = 0;
    size_t sp_keys = 0;
    size_t po_keys = 0;
    size_t os_keys = 0;
    size_t memory_bytes = 0;
};

class IndexEngine {
public:
    explicit IndexEngine(bool verify_candidates = true)
        : verify_(verify_candidates), sp_(rmx::SP), po_(rmx::PO), os_(rmx::OS) {}

    void reserve(size_t n) {
        triples_.reserve(n);
        positions_.reserve(n);
        terms_.reserve(n);
        sp_.reserve(n);
        po_.reserve(n);
        os_.reserve(n);
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Writes
    // ═══════════════════════════════════════════════════════════════════════

    // Returns false if the triple was already stored (no change).
    // A throw leaves the log, the canonical set and every index as they were.
    bool insert(const Triple& triple) {
        return apply_insert(triple).has_value();
    }

    // Inserts in order and returns the number of net-new triples.
    // All or nothing: a throw undoes every triple this call added.
    size_t insert_all(const std::vector<Triple>& batch) {
        std::vector<InsertRecord> journal;
        journal.reserve(batch.size());
        std::optional<Entity> saved_subject = last_subject_;

        try {
            for (const auto& t : batch) {
                if (auto record = apply_insert(t)) journal.push_back(*record);
            }
        } catch (...) {
            for (auto it = journal.rbegin(); it != journal.rend(); ++it) {
                revert(*it);
            }
            last_subject_ = std::move(saved_subject);
            throw;
        }
        return journal.size();
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Membership and scans
    // ═══════════════════════════════════════════════════════════════════════

    bool contains(const Triple& triple) const {
        return find_slots(triple.s(), triple.p(), triple.o()).has_value();
    }

    bool contains(const Subject& s, const Predicate& p, const Value& o) const {
        return find_slots(s, p, o).has_value();
    }

    size_t size() const { return triples_.size(); }
    bool empty() const { return triples_.empty(); }
    size_t subject_count() const { return by_subject_.size(); }

    // Insertion order
    const std::vector<Triple>& triples() const { return triples_; }

    const Entity& last_added() const {
        if (!last_subject_) throw EmptyStoreError();
        return *last_subject_;
    }

    std::vector<Triple> with_subject(const Subject& s) const {
        auto slot = terms_.find(s.value());
        return slot ? at_positions(by_subject_, *slot) : std::vector<Triple>{};
    }

    std::vector<Triple> with_predicate(const Predicate& p) const {
        auto slot = predicates_.find(p);
        return slot ? at_positions(by_predicate_, *slot) : std::vector<Triple>{};
    }

    std::vector<Triple> with_object(const Value& o) const {
        auto slot = terms_.find(o);
        return slot ? at_positions(by_object_, *slot) : std::vector<Triple>{};
    }

    // O(triples with subject s)
    Attributes attributes_of(const Subject& s) const {
        Attributes result;
        for (const auto& t : with_subject(s)) {
            result[t.p()].insert(t.o());
        }
        return result;
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Two-bound lookups through the composite-key indices
    // ═══════════════════════════════════════════════════════════════════════

    // (s, p, ?) via SP
    ValueSet objects(const Subject& s, const Predicate& p) const {
        ValueSet result;
        const Posting* posting = sp_.find(s.id(), p.id());
        if (!posting) return result;

        auto s_slot = terms_.find(s.value());
        auto p_slot = predicates_.find(p);
        if (!s_slot || !p_slot) return result;

        for (uint32_t o : posting->to_vector()) {
            if (stored({*s_slot, *p_slot, o})) result.insert(terms_.get(o));
        }
        return result;
    }

    // (?, p, o) via PO
    SubjectSet subjects(const Predicate& p, const Value& o) const {
        SubjectSet result;
        const Posting* posting = po_.find(p.id(), o.id());
        if (!posting) return result;

        auto p_slot = predicates_.find(p);
        auto o_slot = terms_.find(o);
        if (!p_slot || !o_slot) return result;

        for (uint32_t s : posting->to_vector()) {
            if (stored({s, *p_slot, *o_slot})) result.insert(Subject(terms_.get(s)));
        }
        return result;
    }

    // (s, ?, o) via OS
    PredicateSet predicates(const Subject& s, const Value& o) const {
        PredicateSet result;
        const Posting* posting = os_.find(o.id(), s.id());
        if (!posting) return result;

        auto s_slot = terms_.find(s.value());
        auto o_slot = terms_.find(o);
        if (!s_slot || !o_slot) return result;

        for (uint32_t p : posting->to_vector()) {
            if (stored({*s_slot, p, *o_slot})) result.insert(predicates_.get(p));
        }
        return result;
    }

    // Subjects satisfying every (p, o) clause, in slot order.
    // Postings are intersected smallest first; an empty clause list yields nothing.
    std::vector<Subject> subjects_matching(const Filter& filter) const {
        std::vector<Subject> result;
        if (filter.empty()) return result;

        std::vector<const Posting*> postings;
        postings.reserve(filter.size());
        for (const auto& [p, o] : filter) {
            const Posting* posting = po_.find(p.id(), o.id());
            if (!posting) return result;
            postings.push_back(posting);
        }
        std::sort(postings.begin(), postings.end(),
                  [](const Posting* a, const Posting* b) {
                      return a->cardinality() < b->cardinality();
                  });

        Posting candidates = *postings.front();
        for (size_t i = 1; i < postings.size() && !candidates.empty(); ++i) {
            candidates.intersect(*postings[i]);
        }

        // Clause slots for verification; an unknown term means no match
        std::vector<std::pair<uint32_t, uint32_t>> clauses;
        clauses.reserve(filter.size());
        for (const auto& [p, o] : filter) {
            auto p_slot = predicates_.find(p);
            auto o_slot = terms_.find(o);
            if (!p_slot || !o_slot) return result;
            clauses.emplace_back(*p_slot, *o_slot);
        }

        for (uint32_t s : candidates.to_vector()) {
            bool ok = std::all_of(clauses.begin(), clauses.end(),
                                  [&](const std::pair<uint32_t, uint32_t>& c) {
                                      return stored({s, c.first, c.second});
                                  });
            if (ok) result.emplace_back(terms_.get(s));
        }
        return result;
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Statistics
    // ═══════════════════════════════════════════════════════════════════════

    EngineStats stats() const {
        EngineStats st;
        st.triples = triples_.size();
        st.subjects = by_subject_.size();
        st.terms = terms_.size();
        st.predicates = predicates_.size();
        st.sp_keys = sp_.key_count();
        st.po_keys = po_.key_count();
        st.os_keys = os_.key_count();

        size_t bytes = triples_.capacity() * sizeof(Triple) +
                       positions_.size() * (sizeof(SlotTriple) + sizeof(uint32_t) + 32);
        bytes += terms_.memory_bytes() + predicates_.memory_bytes();
        bytes += sp_.memory_bytes() + po_.memory_bytes() + os_.memory_bytes();
        for (const auto* aux : {&by_subject_, &by_predicate_, &by_object_}) {
            for (const auto& [slot, posting] : *aux) {
                bytes += sizeof(uint32_t) + sizeof(Posting) + posting.memory_bytes();
            }
        }
        st.memory_bytes = bytes;
        return st;
    }

    // Read-only views, for consistency checks
    const CompositeIndex& sp_index() const { return sp_; }
    const CompositeIndex& po_index() const { return po_; }
    const CompositeIndex& os_index() const { return os_; }

private:
    using AuxIndex = std::unordered_map<uint32_t, Posting>;

    // What one net-new insert changed; enough to undo it
    struct InsertRecord {
        SlotTriple slots;
        uint32_t pos;
        bool sp_added = false;
        bool po_added = false;
        bool os_added = false;
    };

    std::optional<InsertRecord> apply_insert(const Triple& triple) {
        if (contains(triple)) return std::nullopt;
        if (triples_.size() >= MAX_SLOTS) {
            throw StoreError("triple store is full");
        }

        std::optional<Entity> subject;
        if (const Entity* e = triple.s().entity()) subject = *e;

        InsertRecord record{{terms_.get_or_create(triple.s().value()),
                             predicates_.get_or_create(triple.p()),
                             terms_.get_or_create(triple.o())},
                            static_cast<uint32_t>(triples_.size())};

        // Log first: indices refer to positions in it
        triples_.push_back(triple);
        try {
            positions_.emplace(record.slots, record.pos);

            const Id128& s = triple.s().id();
            const Id128& p = triple.p().id();
            const Id128& o = triple.o().id();
            record.sp_added = sp_.add(s, p, record.slots.o);
            record.po_added = po_.add(p, o, record.slots.s);
            record.os_added = os_.add(o, s, record.slots.p);

            add_position(by_subject_, record.slots.s, record.pos);
            add_position(by_predicate_, record.slots.p, record.pos);
            add_position(by_object_, record.slots.o, record.pos);
        } catch (...) {
            revert(record);
            throw;
        }

        if (subject) last_subject_.swap(subject);
        return record;
    }

    // Undoes the most recent insert. Dictionary slots stay allocated.
    void revert(const InsertRecord& record) {
        const Triple& t = triples_[record.pos];
        const Id128& s = t.s().id();
        const Id128& p = t.p().id();
        const Id128& o = t.o().id();

        remove_position(by_object_, record.slots.o, record.pos);
        remove_position(by_predicate_, record.slots.p, record.pos);
        remove_position(by_subject_, record.slots.s, record.pos);
        if (record.os_added) os_.remove(o, s, record.slots.p);
        if (record.po_added) po_.remove(p, o, record.slots.s);
        if (record.sp_added) sp_.remove(s, p, record.slots.o);
        positions_.erase(record.slots);
        triples_.pop_back();
    }

    static void add_position(AuxIndex& index, uint32_t slot, uint32_t pos) {
        auto it = index.find(slot);
        if (it != index.end()) {
            it->second.add(pos);
            return;
        }
        Posting posting;
        posting.add(pos);
        index.emplace(slot, std::move(posting));
    }

    static void remove_position(AuxIndex& index, uint32_t slot, uint32_t pos) {
        auto it = index.find(slot);
        if (it == index.end()) return;
        it->second.remove(pos);
        if (it->second.empty()) index.erase(it);
    }

    std::optional<SlotTriple> find_slots(const Subject& s, const Predicate& p,
                                         const Value& o) const {
        auto s_slot = terms_.find(s.value());
        if (!s_slot) return std::nullopt;
        auto p_slot = predicates_.find(p);
        if (!p_slot) return std::nullopt;
        auto o_slot = terms_.find(o);
        if (!o_slot) return std::nullopt;

        SlotTriple st{*s_slot, *p_slot, *o_slot};
        if (positions_.count(st) == 0) return std::nullopt;
        return st;
    }

    // Candidate check against the canonical set
    bool stored(const SlotTriple& st) const {
        return !verify_ || positions_.count(st) > 0;
    }

    std::vector<Triple> at_positions(const AuxIndex& index, uint32_t slot) const {
        std::vector<Triple> result;
        auto it = index.find(slot);
        if (it == index.end()) return result;

        result.reserve(it->second.cardinality());
        for (uint32_t pos : it->second.to_vector()) {
            result.push_back(triples_[pos]);
        }
        return result;
    }

    bool verify_;

    TermDictionary<Value> terms_;
    TermDictionary<Predicate> predicates_;

    std::vector<Triple> triples_;
    std::unordered_map<SlotTriple, uint32_t, SlotTripleHash> positions_;

    CompositeIndex sp_;
    CompositeIndex po_;
    CompositeIndex os_;

    AuxIndex by_subject_;
    AuxIndex by_predicate_;
    AuxIndex by_object_;

    std::optional<Entity> last_subject_;
};

} // namespace tristore

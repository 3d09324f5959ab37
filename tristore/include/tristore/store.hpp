#pragma once
// TripleStore: the public face of the engine
//
// One shared_mutex covers the canonical set, every index and the insertion
// log. Reads take it shared; every write, single or batch, takes it
// exclusively for validation plus index updates, so no reader ever sees a
// partially indexed triple.

#include "batch.hpp"
#include "config.hpp"
#include "engine.hpp"
#include "json.hpp"
#include "query.hpp"
#include "validation.hpp"
#include "version.hpp"
#include <iostream>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <sstream>
#include <vector>

namespace tristore {

class TripleStore {
public:
    explicit TripleStore(StoreConfig config = {})
        : config_(std::move(config)), engine_(config_.verify_candidates) {
        if (config_.reserve_triples > 0) {
            engine_.reserve(config_.reserve_triples);
        }
        if (config_.verbose) {
            std::cerr << "[TripleStore] " << config_.name << ": created"
                      << (config_.verify_candidates ? "" : " (candidate verification off)")
                      << "\n";
        }
    }

    TripleStore(const TripleStore&) = delete;
    TripleStore& operator=(const TripleStore&) = delete;

    const StoreConfig& config() const { return config_; }

    // ═══════════════════════════════════════════════════════════════════════
    // Validation registry
    // ═══════════════════════════════════════════════════════════════════════

    void set_check(const Predicate& p, Validator check) {
        std::unique_lock lock(mutex_);
        registry_.set_check(p, std::move(check));
    }

    bool clear_check(const Predicate& p) {
        std::unique_lock lock(mutex_);
        return registry_.clear_check(p);
    }

    bool has_check(const Predicate& p) const {
        std::shared_lock lock(mutex_);
        return registry_.has_check(p);
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Writes
    // ═══════════════════════════════════════════════════════════════════════

    // false if the triple was already stored.
    // Throws ValidationError / UnknownSubject without changing anything.
    bool insert(const Triple& triple) {
        std::unique_lock lock(mutex_);
        check(triple, nullptr);
        return engine_.insert(triple);
    }

    bool insert(const Subject& s, const Predicate& p, const Value& o) {
        return insert(Triple(s, p, o));
    }

    // One fresh entity per row, returned in row order
    std::vector<Entity> create_subjects_with(const Columns& columns) {
        Batch batch = Batch::create_subjects_with(columns);
        apply(batch, "create_subjects_with");
        return batch.created;
    }

    // Every subject x every object under p; returns the number of new triples
    size_t add_all(const std::vector<Subject>& subjects,
                   const std::vector<Value>& objects,
                   const Predicate& p) {
        return apply(Batch::add_all(subjects, objects, p), "add_all");
    }

    size_t add_all(const std::vector<Entity>& subjects,
                   const std::vector<Value>& objects,
                   const Predicate& p) {
        return add_all(as_subjects(subjects), objects, p);
    }

    // Copies an attribute map onto every subject; returns the number of new triples
    size_t set_all(const std::vector<Subject>& subjects, const Attributes& attributes) {
        return apply(Batch::set_all(subjects, attributes), "set_all");
    }

    size_t set_all(const std::vector<Entity>& subjects, const Attributes& attributes) {
        return set_all(as_subjects(subjects), attributes);
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Reads
    // ═══════════════════════════════════════════════════════════════════════

    bool contains(const Triple& triple) const {
        std::shared_lock lock(mutex_);
        return engine_.contains(triple);
    }

    bool contains(const Subject& s, const Predicate& p, const Value& o) const {
        std::shared_lock lock(mutex_);
        return engine_.contains(s, p, o);
    }

    size_t size() const {
        std::shared_lock lock(mutex_);
        return engine_.size();
    }

    bool empty() const {
        std::shared_lock lock(mutex_);
        return engine_.empty();
    }

    size_t subject_count() const {
        std::shared_lock lock(mutex_);
        return engine_.subject_count();
    }

    // Snapshot in insertion order
    std::vector<Triple> triples() const {
        std::shared_lock lock(mutex_);
        return engine_.triples();
    }

    // Visits every triple once, in insertion order, under the shared lock.
    // fn must not write to the store.
    template <typename Fn>
    void for_each(Fn&& fn) const {
        std::shared_lock lock(mutex_);
        for (const auto& t : engine_.triples()) fn(t);
    }

    Attributes attributes_of(const Subject& s) const {
        std::shared_lock lock(mutex_);
        return engine_.attributes_of(s);
    }

    Entity last_added() const {
        std::shared_lock lock(mutex_);
        return engine_.last_added();
    }

    EntitySet get_all(const Filter& filter) const {
        std::shared_lock lock(mutex_);
        return QueryEvaluator(engine_).get_all(filter);
    }

    Entity get(const Filter& filter) const {
        std::shared_lock lock(mutex_);
        return QueryEvaluator(engine_).get(filter);
    }

    std::optional<Entity> find_entity(const Filter& filter) const {
        std::shared_lock lock(mutex_);
        return QueryEvaluator(engine_).find(filter);
    }

    EntitySet get_which(const Predicate& p, const Value& o) const {
        std::shared_lock lock(mutex_);
        return QueryEvaluator(engine_).get_which(p, o);
    }

    std::vector<Triple> match(const Pattern& pattern) const {
        std::shared_lock lock(mutex_);
        return QueryEvaluator(engine_).match(pattern);
    }

    ValueSet objects(const Subject& s, const Predicate& p) const {
        std::shared_lock lock(mutex_);
        return engine_.objects(s, p);
    }

    SubjectSet subjects(const Predicate& p, const Value& o) const {
        std::shared_lock lock(mutex_);
        return engine_.subjects(p, o);
    }

    PredicateSet predicates(const Subject& s, const Value& o) const {
        std::shared_lock lock(mutex_);
        return engine_.predicates(s, o);
    }

    EngineStats stats() const {
        std::shared_lock lock(mutex_);
        return engine_.stats();
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Dumps
    // ═══════════════════════════════════════════════════════════════════════

    json to_json() const {
        std::shared_lock lock(mutex_);
        EngineStats st = engine_.stats();

        json rows = json::array();
        for (const auto& t : engine_.triples()) {
            json entry;
            tristore::to_json(entry, t);
            rows.push_back(std::move(entry));
        }
        return {
            {"name", config_.name},
            {"version", version::string()},
            {"triples", std::move(rows)},
            {"stats", {
                {"triples", st.triples},
                {"subjects", st.subjects},
                {"terms", st.terms},
                {"predicates", st.predicates},
                {"sp_keys", st.sp_keys},
                {"po_keys", st.po_keys},
                {"os_keys", st.os_keys},
                {"memory_bytes", st.memory_bytes}
            }}
        };
    }

    // "s p o" per line, insertion order
    std::string str() const {
        std::ostringstream ss;
        ss << *this;
        return ss.str();
    }

    friend std::ostream& operator<<(std::ostream& os, const TripleStore& store) {
        std::shared_lock lock(store.mutex_);
        for (const auto& t : store.engine_.triples()) {
            os << t.s() << " " << t.p() << " " << t.o() << "\n";
        }
        return os;
    }

private:
    // Caller holds the exclusive lock. pending: triples of the same batch
    // that precede this one and may serve as reified subjects.
    void check(const Triple& triple, const TripleSet* pending) const {
        if (const Triple* reified = triple.s().triple()) {
            bool known = engine_.contains(*reified) ||
                         (pending && pending->count(*reified) > 0);
            if (!known) {
                log("unknown subject " + reified->to_string());
                throw UnknownSubject("Specified subject (Triple) was not found in the store: " +
                                     reified->to_string());
            }
        }
        if (!registry_.accepts(triple.p(), triple.o())) {
            log("rejected " + triple.to_string());
            throw ValidationError(triple.o().to_string() +
                                  " does not match the criteria for predicate " +
                                  triple.p().to_string());
        }
    }

    // Checks the whole batch, then inserts it all or nothing; returns net-new count
    size_t apply(const Batch& batch, const char* what) {
        std::unique_lock lock(mutex_);

        if (engine_.size() + batch.size() > MAX_SLOTS) {
            throw StoreError(std::string(what) + ": batch would overflow the store");
        }

        TripleSet pending;
        for (const auto& t : batch.triples) {
            check(t, &pending);
            pending.insert(t);
        }

        size_t added = engine_.insert_all(batch.triples);

        if (config_.verbose) {
            std::cerr << "[TripleStore] " << config_.name << ": " << what << " added "
                      << added << "/" << batch.size() << " triples\n";
        }
        return added;
    }

    void log(const std::string& message) const {
        if (config_.verbose) {
            std::cerr << "[TripleStore] " << config_.name << ": " << message << "\n";
        }
    }

    static std::vector<Subject> as_subjects(const std::vector<Entity>& entities) {
        return std::vector<Subject>(entities.begin(), entities.end());
    }

    StoreConfig config_;
    mutable std::shared_mutex mutex_;
    ValidationRegistry registry_;
    IndexEngine engine_;
};

} // namespace tristore

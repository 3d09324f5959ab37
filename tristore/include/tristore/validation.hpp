#pragma once
// Validation registry: per-predicate object checks consulted on insert
//
// A check registered with set_check() wins over the predicate's own
// validate capability. Neither present: accept.

#include "triple.hpp"
#include <unordered_map>

namespace tristore {

class ValidationRegistry {
public:
    // Replaces any prior check for p. Existing triples are not re-checked.
    void set_check(const Predicate& p, Validator check) {
        if (!check) {
            checks_.erase(p.id());
            return;
        }
        checks_[p.id()] = std::move(check);
    }

    bool clear_check(const Predicate& p) {
        return checks_.erase(p.id()) > 0;
    }

    bool has_check(const Predicate& p) const {
        return checks_.count(p.id()) > 0;
    }

    // Exceptions thrown by a check propagate to the caller
    bool accepts(const Predicate& p, const Value& object) const {
        auto it = checks_.find(p.id());
        if (it != checks_.end()) return it->second(object);
        return p.validate(object);
    }

    size_t size() const { return checks_.size(); }

private:
    std::unordered_map<Id128, Validator, Id128Hash> checks_;
};

} // namespace tristore

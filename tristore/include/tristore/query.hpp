#pragma once
// Query evaluator: filters and patterns over the index engine
//
// Filters are conjunctions of (predicate, object) clauses resolved through
// the PO index. Patterns bind any subset of (s, p, o) and are answered by
// the cheapest structure for the bound terms:
//
//   s p o   canonical membership
//   s p ?   SP index          ? p o   PO index          s ? o   OS index
//   s ? ?   subject posting   ? p ?   predicate posting  ? ? o   object posting
//   ? ? ?   full scan

#include "engine.hpp"
#include <optional>
#include <vector>

namespace tristore {

struct Pattern {
    std::optional<Subject> s;
    std::optional<Predicate> p;
    std::optional<Value> o;

    int bound() const {
        return (s ? 1 : 0) + (p ? 1 : 0) + (o ? 1 : 0);
    }
};

class QueryEvaluator {
public:
    explicit QueryEvaluator(const IndexEngine& engine) : engine_(engine) {}

    // Entity subjects matching every clause. Throws EmptyQueryError on {}.
    EntitySet get_all(const Filter& filter) const {
        if (filter.empty()) throw EmptyQueryError();

        EntitySet result;
        for (const auto& subject : engine_.subjects_matching(filter)) {
            if (const Entity* e = subject.entity()) result.insert(*e);
        }
        return result;
    }

    // The single entity matching every clause
    Entity get(const Filter& filter) const {
        auto matches = matching_entities(filter);
        if (matches.empty()) {
            throw NoResultError("no entity matches " + describe(filter));
        }
        if (matches.size() > 1) {
            throw AmbiguousResultError(std::to_string(matches.size()) +
                                       " entities match " + describe(filter),
                                       matches.size());
        }
        return matches.front();
    }

    // Like get(), but nullopt when nothing matches. Still throws on ambiguity.
    std::optional<Entity> find(const Filter& filter) const {
        auto matches = matching_entities(filter);
        if (matches.empty()) return std::nullopt;
        if (matches.size() > 1) {
            throw AmbiguousResultError(std::to_string(matches.size()) +
                                       " entities match " + describe(filter),
                                       matches.size());
        }
        return matches.front();
    }

    EntitySet get_which(const Predicate& p, const Value& o) const {
        return get_all(Filter{{p, o}});
    }

    std::vector<Triple> match(const Pattern& q) const {
        const auto& s = q.s;
        const auto& p = q.p;
        const auto& o = q.o;

        if (s && p && o) {
            if (engine_.contains(*s, *p, *o)) return {Triple(*s, *p, *o)};
            return {};
        }

        std::vector<Triple> result;
        if (s && p) {
            for (const auto& v : engine_.objects(*s, *p)) result.emplace_back(*s, *p, v);
            return result;
        }
        if (p && o) {
            for (const auto& v : engine_.subjects(*p, *o)) result.emplace_back(v, *p, *o);
            return result;
        }
        if (s && o) {
            for (const auto& v : engine_.predicates(*s, *o)) result.emplace_back(*s, v, *o);
            return result;
        }

        if (s) return engine_.with_subject(*s);
        if (p) return engine_.with_predicate(*p);
        if (o) return engine_.with_object(*o);
        return engine_.triples();
    }

private:
    std::vector<Entity> matching_entities(const Filter& filter) const {
        if (filter.empty()) throw EmptyQueryError();

        std::vector<Entity> result;
        for (const auto& subject : engine_.subjects_matching(filter)) {
            if (const Entity* e = subject.entity()) result.push_back(*e);
        }
        return result;
    }

    static std::string describe(const Filter& filter) {
        std::string out = "{";
        for (size_t i = 0; i < filter.size(); ++i) {
            if (i > 0) out += ", ";
            out += filter[i].first.to_string() + ": " + filter[i].second.to_string();
        }
        return out + "}";
    }

    const IndexEngine& engine_;
};

} // namespace tristore

#pragma once
// Terms: entities and predicates
//
// Entities are the things facts are about. Most are anonymous; some carry
// a name and a locator. Two entities are the same entity iff their ids match.
//
// Predicates are relation kinds. A predicate is a plain value (id, name,
// optional validator) that callers hold on to and reuse across triples.

#include "types.hpp"
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace tristore {

class Value;

// Object acceptance test. Empty: accept anything.
using Validator = std::function<bool(const Value&)>;

// Names follow identifier rules: [A-Za-z_][A-Za-z0-9_]*
inline bool is_identifier(const std::string& s) {
    if (s.empty()) return false;
    auto head = [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
    };
    if (!head(s[0])) return false;
    for (size_t i = 1; i < s.size(); ++i) {
        char c = s[i];
        if (!head(c) && !(c >= '0' && c <= '9')) return false;
    }
    return true;
}

class Entity {
public:
    // Anonymous entity with a fresh id
    Entity() : id_(Id128::generate()) {}

    explicit Entity(std::string name)
        : id_(Id128::generate()), name_(checked_name(std::move(name))) {}

    explicit Entity(Id128 id,
                    std::optional<std::string> name = std::nullopt,
                    std::optional<std::string> url = std::nullopt)
        : id_(id), url_(std::move(url)) {
        if (name) name_ = checked_name(std::move(*name));
    }

    const Id128& id() const { return id_; }
    const std::optional<std::string>& name() const { return name_; }
    const std::optional<std::string>& url() const { return url_; }

    bool operator==(const Entity& other) const { return id_ == other.id_; }
    bool operator!=(const Entity& other) const { return id_ != other.id_; }
    bool operator<(const Entity& other) const { return id_ < other.id_; }

    // Name if present, else "_" + first 5 chars of the id
    std::string to_string() const {
        if (name_) return *name_;
        return "_" + id_.to_string().substr(0, 5);
    }

    // E(name='..', id_='..', url='..'), absent parts omitted
    std::string repr() const {
        std::string out = "E(";
        if (name_) out += "name='" + *name_ + "', ";
        out += "id_='" + id_.to_string() + "'";
        if (url_) out += ", url='" + *url_ + "'";
        out += ")";
        return out;
    }

private:
    static std::string checked_name(std::string name) {
        if (!is_identifier(name)) throw InvalidName(name);
        return name;
    }

    Id128 id_;
    std::optional<std::string> name_;
    std::optional<std::string> url_;
};

using EntityHash = TermHash<Entity>;

// A relation kind: what used to be a predicate subclass
struct PredicateKind {
    std::string name;
    Validator validate;
};

class Predicate {
public:
    explicit Predicate(std::string name, Validator validate = {})
        : id_(Id128::generate()), name_(std::move(name)), validate_(std::move(validate)) {}

    Predicate(Id128 id, std::string name, Validator validate = {})
        : id_(id), name_(std::move(name)), validate_(std::move(validate)) {}

    const Id128& id() const { return id_; }
    const std::string& name() const { return name_; }
    bool has_validator() const { return static_cast<bool>(validate_); }

    // Defined in triple.hpp
    bool validate(const Value& value) const;

    bool operator==(const Predicate& other) const { return id_ == other.id_; }
    bool operator!=(const Predicate& other) const { return id_ != other.id_; }
    bool operator<(const Predicate& other) const { return id_ < other.id_; }

    std::string to_string() const { return name_; }

private:
    Id128 id_;
    std::string name_;
    Validator validate_;
};

using PredicateHash = TermHash<Predicate>;

// Entity from optional parts; a malformed id throws InvalidIdentifier
inline Entity new_entity(std::optional<std::string> name = std::nullopt,
                         std::optional<std::string> id = std::nullopt,
                         std::optional<std::string> url = std::nullopt) {
    Id128 parsed = id ? Id128::parse(*id) : Id128::generate();
    return Entity(parsed, std::move(name), std::move(url));
}

// Fresh predicate of a kind; the name defaults to the kind's name
inline Predicate new_predicate(const PredicateKind& kind,
                               std::optional<std::string> name = std::nullopt) {
    return Predicate(name ? std::move(*name) : kind.name, kind.validate);
}

} // namespace tristore

#pragma once
// Values, subjects and triples
//
// A Value is anything that can sit in the object position: an entity,
// a literal (string, bool, integer, real) or a whole triple. Each value
// carries a deterministic 128-bit term id so it can take part in composite
// keys exactly like an entity does.
//
// A Subject is an entity or a triple (reification: a fact about a fact).

#include "entity.hpp"
#include "rmx.hpp"
#include <cmath>
#include <cstdint>
#include <cstring>
#include <limits>
#include <memory>
#include <ostream>
#include <sstream>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

namespace tristore {

class Triple;

// Literal tags fed into the literal hash
enum class LiteralTag : uint64_t {
    String = 0x73,
    Bool = 0x62,
    Integer = 0x69,
    Real = 0x72
};

class Value {
public:
    enum class Kind : uint8_t { Entity, String, Bool, Integer, Real, Triple };

    Value(tristore::Entity entity) : id_(entity.id()), data_(std::move(entity)) {}
    Value(const char* s) : Value(std::string(s)) {}
    Value(std::string s)
        : id_(rmx::hash_bytes(s.data(), s.size(), static_cast<uint64_t>(LiteralTag::String))),
          data_(std::move(s)) {}
    Value(bool b) : id_(bool_id(b)), data_(b) {}
    Value(int i) : Value(static_cast<int64_t>(i)) {}
    Value(int64_t i)
        : id_(rmx::hash_bytes(&i, sizeof(i), static_cast<uint64_t>(LiteralTag::Integer))),
          data_(i) {}
    Value(double d) : id_(real_id(d)), data_(d) {}
    Value(const tristore::Triple& triple);
    Value(std::shared_ptr<const tristore::Triple> triple);

    Kind kind() const { return static_cast<Kind>(data_.index()); }
    const Id128& id() const { return id_; }

    bool is_entity() const { return kind() == Kind::Entity; }
    bool is_triple() const { return kind() == Kind::Triple; }
    bool is_literal() const { return !is_entity() && !is_triple(); }

    // nullptr when the value is of another kind
    const tristore::Entity* entity() const { return std::get_if<tristore::Entity>(&data_); }
    const std::string* string() const { return std::get_if<std::string>(&data_); }
    const bool* boolean() const { return std::get_if<bool>(&data_); }
    const int64_t* integer() const { return std::get_if<int64_t>(&data_); }
    const double* real() const { return std::get_if<double>(&data_); }
    const tristore::Triple* triple() const {
        auto* p = std::get_if<std::shared_ptr<const tristore::Triple>>(&data_);
        return p ? p->get() : nullptr;
    }

    bool operator==(const Value& other) const {
        return kind() == other.kind() && id_ == other.id_;
    }
    bool operator!=(const Value& other) const { return !(*this == other); }

    std::string to_string() const;

    static const char* kind_name(Kind kind) {
        switch (kind) {
            case Kind::Entity: return "entity";
            case Kind::String: return "string";
            case Kind::Bool: return "bool";
            case Kind::Integer: return "integer";
            case Kind::Real: return "real";
            case Kind::Triple: return "triple";
        }
        return "unknown";
    }

private:
    static Id128 bool_id(bool b) {
        unsigned char byte = b ? 1 : 0;
        return rmx::hash_bytes(&byte, 1, static_cast<uint64_t>(LiteralTag::Bool));
    }

    static Id128 real_id(double d) {
        if (d == 0.0) d = 0.0;                       // -0.0 == 0.0
        if (std::isnan(d)) d = std::numeric_limits<double>::quiet_NaN();
        unsigned char bytes[sizeof(double)];
        std::memcpy(bytes, &d, sizeof(d));
        return rmx::hash_bytes(bytes, sizeof(bytes), static_cast<uint64_t>(LiteralTag::Real));
    }

    Id128 id_;
    std::variant<tristore::Entity, std::string, bool, int64_t, double,
                 std::shared_ptr<const tristore::Triple>> data_;
};

using ValueHash = TermHash<Value>;

// Dictionary kind tags: predicates are 0, values follow their Kind
inline uint8_t term_kind(const Predicate&) { return 0; }
inline uint8_t term_kind(const Value& v) { return static_cast<uint8_t>(1 + static_cast<uint8_t>(v.kind())); }

// Entity or reified triple in subject position
class Subject {
public:
    Subject(tristore::Entity entity) : value_(std::move(entity)) {}
    Subject(const tristore::Triple& triple) : value_(triple) {}
    Subject(std::shared_ptr<const tristore::Triple> triple) : value_(std::move(triple)) {}

    // Throws InvalidArgument for literals
    explicit Subject(Value value) : value_(std::move(value)) {
        if (value_.is_literal()) {
            throw InvalidArgument("subject is neither a triple nor an entity: " +
                                  value_.to_string());
        }
    }

    const Id128& id() const { return value_.id(); }
    const Value& value() const { return value_; }

    bool is_entity() const { return value_.is_entity(); }
    bool is_triple() const { return value_.is_triple(); }
    const tristore::Entity* entity() const { return value_.entity(); }
    const tristore::Triple* triple() const { return value_.triple(); }

    bool operator==(const Subject& other) const { return value_ == other.value_; }
    bool operator!=(const Subject& other) const { return value_ != other.value_; }

    std::string to_string() const { return value_.to_string(); }

private:
    Value value_;
};

using SubjectHash = TermHash<Subject>;

class Triple {
public:
    Triple(Subject s, Predicate p, Value o)
        : s_(std::move(s)), p_(std::move(p)), o_(std::move(o)),
          id_(rmx::mix(rmx::mix(s_.id(), p_.id(), rmx::REIFY), o_.id(), rmx::REIFY)) {}

    const Subject& s() const { return s_; }
    const Predicate& p() const { return p_; }
    const Value& o() const { return o_; }

    // Term id when the triple itself is used as subject or object
    const Id128& id() const { return id_; }

    bool operator==(const Triple& other) const {
        return s_ == other.s_ && p_ == other.p_ && o_ == other.o_;
    }
    bool operator!=(const Triple& other) const { return !(*this == other); }

    std::string to_string() const {
        return "Triple(s=" + s_.to_string() + ", p=" + p_.to_string() +
               ", o=" + o_.to_string() + ")";
    }

private:
    Subject s_;
    Predicate p_;
    Value o_;
    Id128 id_;
};

using TripleHash = TermHash<Triple>;

// Result and argument collections
using EntitySet = std::unordered_set<Entity, EntityHash>;
using ValueSet = std::unordered_set<Value, ValueHash>;
using SubjectSet = std::unordered_set<Subject, SubjectHash>;
using PredicateSet = std::unordered_set<Predicate, PredicateHash>;
using TripleSet = std::unordered_set<Triple, TripleHash>;

// predicate -> objects of one subject
using Attributes = std::unordered_map<Predicate, ValueSet, PredicateHash>;

// (predicate, object) clauses, all of which must hold
using Filter = std::vector<std::pair<Predicate, Value>>;

// predicate -> one object per new subject (or one object for all of them)
using Columns = std::vector<std::pair<Predicate, std::vector<Value>>>;

// ═══════════════════════════════════════════════════════════════════════
// Definitions that need Triple complete
// ═══════════════════════════════════════════════════════════════════════

inline Value::Value(const tristore::Triple& triple)
    : id_(triple.id()), data_(std::make_shared<const tristore::Triple>(triple)) {}

inline Value::Value(std::shared_ptr<const tristore::Triple> triple)
    : id_(triple ? triple->id() : Id128{}), data_(std::move(triple)) {
    if (!this->triple()) throw InvalidArgument("null triple value");
}

inline std::string Value::to_string() const {
    switch (kind()) {
        case Kind::Entity: return entity()->to_string();
        case Kind::String: return *string();
        case Kind::Bool: return *boolean() ? "true" : "false";
        case Kind::Integer: return std::to_string(*integer());
        case Kind::Real: {
            std::ostringstream ss;
            ss << *real();
            return ss.str();
        }
        case Kind::Triple: return triple()->to_string();
    }
    return "";
}

inline bool Predicate::validate(const Value& value) const {
    return !validate_ || validate_(value);
}

inline std::ostream& operator<<(std::ostream& os, const Entity& e) { return os << e.to_string(); }
inline std::ostream& operator<<(std::ostream& os, const Predicate& p) { return os << p.to_string(); }
inline std::ostream& operator<<(std::ostream& os, const Value& v) { return os << v.to_string(); }
inline std::ostream& operator<<(std::ostream& os, const Subject& s) { return os << s.to_string(); }
inline std::ostream& operator<<(std::ostream& os, const Triple& t) { return os << t.to_string(); }

} // namespace tristore

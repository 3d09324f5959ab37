#pragma once
// Errors raised by the store
//
// All of them are local and recoverable: a failed insert or query
// never leaves the indices half-updated.

#include <stdexcept>
#include <string>

namespace tristore {

class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& message)
        : std::runtime_error(message) {}
};

// Explicit identifier is not a well-formed 128-bit UUID
class InvalidIdentifier : public StoreError {
public:
    explicit InvalidIdentifier(const std::string& text)
        : StoreError("invalid identifier: '" + text + "'") {}
};

// Entity name is not an identifier
class InvalidName : public StoreError {
public:
    explicit InvalidName(const std::string& name)
        : StoreError("'" + name + "' is not an identifier") {}
};

// Malformed batch or subject argument
class InvalidArgument : public StoreError {
public:
    explicit InvalidArgument(const std::string& message)
        : StoreError(message) {}
};

// A predicate's validator rejected the object of an insert
class ValidationError : public StoreError {
public:
    explicit ValidationError(const std::string& message)
        : StoreError(message) {}
};

// Reified subject is not stored
class UnknownSubject : public StoreError {
public:
    explicit UnknownSubject(const std::string& message)
        : StoreError(message) {}
};

// Filter query without clauses
class EmptyQueryError : public StoreError {
public:
    EmptyQueryError()
        : StoreError("query filter has no clauses") {}
};

class NoResultError : public StoreError {
public:
    explicit NoResultError(const std::string& message)
        : StoreError(message) {}
};

class AmbiguousResultError : public StoreError {
public:
    AmbiguousResultError(const std::string& message, size_t matches)
        : StoreError(message), matches_(matches) {}

    size_t matches() const { return matches_; }

private:
    size_t matches_;
};

// last_added() before any entity was inserted as a subject
class EmptyStoreError : public StoreError {
public:
    EmptyStoreError()
        : StoreError("no entity has been added to the store yet") {}
};

} // namespace tristore

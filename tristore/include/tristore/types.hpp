#pragma once
// Core types: 128-bit identifiers
//
// Every term the store touches (entity, predicate, literal, reified
// triple) is addressed by an Id128. Composite index keys are Id128s too.

#include "error.hpp"
#include <cstdint>
#include <cstdio>
#include <functional>
#include <mutex>
#include <optional>
#include <random>
#include <string>

namespace tristore {

// UUID - 128-bit identifier
struct Id128 {
    uint64_t high = 0;
    uint64_t low = 0;

    // Fresh random identifier (thread-safe)
    static Id128 generate() {
        static std::mutex mutex;
        static std::mt19937_64 gen = [] {
            std::random_device rd;
            std::seed_seq seq{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
            return std::mt19937_64(seq);
        }();
        std::lock_guard<std::mutex> lock(mutex);
        uint64_t h = gen();
        uint64_t l = gen();
        return {h, l};
    }

    bool operator==(const Id128& other) const {
        return high == other.high && low == other.low;
    }

    bool operator!=(const Id128& other) const {
        return !(*this == other);
    }

    bool operator<(const Id128& other) const {
        return high < other.high || (high == other.high && low < other.low);
    }

    Id128 operator^(const Id128& other) const {
        return {high ^ other.high, low ^ other.low};
    }

    std::string to_string() const {
        char buf[37];
        snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                 (uint32_t)(high >> 32),
                 (uint16_t)(high >> 16),
                 (uint16_t)high,
                 (uint16_t)(low >> 48),
                 (unsigned long long)(low & 0xFFFFFFFFFFFFULL));
        return buf;
    }

    // Parse xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx (either case)
    static std::optional<Id128> from_string(const std::string& s) {
        if (s.size() != 36) return std::nullopt;

        Id128 id;
        int nibbles = 0;
        for (size_t i = 0; i < s.size(); ++i) {
            char c = s[i];
            if (i == 8 || i == 13 || i == 18 || i == 23) {
                if (c != '-') return std::nullopt;
                continue;
            }
            int v = hex_value(c);
            if (v < 0) return std::nullopt;
            if (nibbles < 16) {
                id.high = (id.high << 4) | static_cast<uint64_t>(v);
            } else {
                id.low = (id.low << 4) | static_cast<uint64_t>(v);
            }
            ++nibbles;
        }
        return id;
    }

    static Id128 parse(const std::string& s) {
        auto id = from_string(s);
        if (!id) throw InvalidIdentifier(s);
        return *id;
    }

    bool valid() const { return high != 0 || low != 0; }

private:
    static int hex_value(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
};

// Hash function for Id128 (for use in unordered containers)
struct Id128Hash {
    size_t operator()(const Id128& id) const {
        return std::hash<uint64_t>{}(id.high) ^ (std::hash<uint64_t>{}(id.low) << 1);
    }
};

// Hash any term by its identifier
template <typename Term>
struct TermHash {
    size_t operator()(const Term& term) const {
        return Id128Hash{}(term.id());
    }
};

} // namespace tristore

#pragma once
// Batch planning: expand bulk writes into concrete triples
//
// Planning has no side effects on the store. TripleStore checks the whole
// plan and then applies it under one lock, so a batch lands completely or
// not at all.

#include "triple.hpp"
#include <algorithm>
#include <vector>

namespace tristore {

struct Batch {
    std::vector<Triple> triples;
    std::vector<Entity> created;     // Fresh subjects, in row order

    size_t size() const { return triples.size(); }
    bool empty() const { return triples.empty(); }

    // One fresh entity per row. A column of length 1 is broadcast to every
    // row; any other column supplies one value per row.
    static Batch create_subjects_with(const Columns& columns) {
        Batch batch;
        if (columns.empty()) return batch;

        size_t rows = 0;
        for (const auto& [p, values] : columns) {
            if (values.empty()) {
                throw InvalidArgument("no values given for predicate " + p.to_string());
            }
            rows = std::max(rows, values.size());
        }
        for (const auto& [p, values] : columns) {
            if (values.size() != 1 && values.size() != rows) {
                throw InvalidArgument("predicate " + p.to_string() + " has " +
                                      std::to_string(values.size()) + " values, expected 1 or " +
                                      std::to_string(rows));
            }
        }

        batch.created.reserve(rows);
        batch.triples.reserve(rows * columns.size());
        for (size_t row = 0; row < rows; ++row) {
            Entity subject;
            for (const auto& [p, values] : columns) {
                const Value& o = values.size() == 1 ? values.front() : values[row];
                batch.triples.emplace_back(subject, p, o);
            }
            batch.created.push_back(subject);
        }
        return batch;
    }

    // subjects x objects under one predicate
    static Batch add_all(const std::vector<Subject>& subjects,
                         const std::vector<Value>& objects,
                         const Predicate& p) {
        Batch batch;
        batch.triples.reserve(subjects.size() * objects.size());
        for (const auto& s : subjects) {
            for (const auto& o : objects) {
                batch.triples.emplace_back(s, p, o);
            }
        }
        return batch;
    }

    // Every (p, o) of the attribute map onto every subject
    static Batch set_all(const std::vector<Subject>& subjects,
                         const Attributes& attributes) {
        Batch batch;
        for (const auto& s : subjects) {
            for (const auto& [p, objects] : attributes) {
                for (const auto& o : objects) {
                    batch.triples.emplace_back(s, p, o);
                }
            }
        }
        return batch;
    }
};

} // namespace tristore

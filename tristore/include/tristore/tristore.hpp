#pragma once
// Tristore: an embeddable semantic triplestore
//
// - Terms: entities, predicates, literal values, reified triples
// - RMX: order-sensitive 128-bit composite keys
// - Engine: canonical triple set with SP / PO / OS indices
// - Query: filters, patterns and batch writes
// - Store: locking, validation, logging

#include "version.hpp"
#include "error.hpp"
#include "types.hpp"
#include "rmx.hpp"
#include "entity.hpp"
#include "triple.hpp"
#include "engine.hpp"
#include "query.hpp"
#include "batch.hpp"
#include "json.hpp"
#include "store.hpp"

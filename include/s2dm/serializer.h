#pragma once
// ═══════════════════════════════════════════════════════════════════
//  s2dm/serializer.h — Canonical flat and grouped serializations
// ═══════════════════════════════════════════════════════════════════
//
//  Both forms are pure functions of the triple set: the same set always
//  produces the same bytes regardless of emission order. The statements
//  are ordered here and written by serd.
//
//  Flat (N-Triples):  one `<s> <p> o .` line per distinct triple in the
//                     canonical order, each line newline-terminated.
//  Grouped (Turtle):  @prefix block, then one abbreviated block per
//                     subject in the same subject order, predicates in a
//                     fixed order.
//
// ═══════════════════════════════════════════════════════════════════

#include "config.h"
#include "triple.h"
#include <map>
#include <string>

namespace s2dm::rdf {

// prefix -> namespace IRI; std::map keeps declarations sorted
using PrefixMap = std::map<std::string, std::string>;

// rdf, skos, s2dm and the configured user prefix
PrefixMap prefixesFor(const MaterializerConfig& config);

std::string serializeNTriples(const TripleSet& triples);

std::string serializeTurtle(const TripleSet& triples, const PrefixMap& prefixes);

inline std::string serializeTurtle(const TripleSet& triples, const MaterializerConfig& config) {
    return serializeTurtle(triples, prefixesFor(config));
}

} // namespace s2dm::rdf

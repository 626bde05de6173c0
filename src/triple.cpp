// ═══════════════════════════════════════════════════════════════════
//  src/triple.cpp — Canonical triple order
// ═══════════════════════════════════════════════════════════════════

#include "s2dm/triple.h"

#include <algorithm>

namespace s2dm::rdf {

namespace {

// Sort keys only; the serializers do the real N-Triples escaping
std::string iriKey(const std::string& iri) {
    return "<" + iri + ">";
}

std::string objectKey(const Term& term) {
    if (term.isIri()) return iriKey(term.value);
    std::string out = "\"" + term.value + "\"";
    if (!term.language.empty()) out += "@" + term.language;
    return out;
}

} // namespace

int compareTriples(const Triple& a, const Triple& b) {
    // "<" + iri + ">" compares like the bare IRI except where one IRI is a
    // prefix of the other, so compare the bracketed forms
    if (int c = iriKey(a.subject).compare(iriKey(b.subject)); c != 0) return c;
    if (int c = iriKey(a.predicate).compare(iriKey(b.predicate)); c != 0) return c;
    return objectKey(a.object).compare(objectKey(b.object));
}

bool TripleSet::contains(const Triple& triple) const {
    return std::find(triples_.begin(), triples_.end(), triple) != triples_.end();
}

std::vector<Triple> TripleSet::sorted() const {
    std::vector<Triple> out = triples_;
    std::sort(out.begin(), out.end(), tripleLess);
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

} // namespace s2dm::rdf

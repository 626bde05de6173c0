#pragma once
// ═══════════════════════════════════════════════════════════════════
//  s2dm/triple.h — RDF terms, triples and the emitted triple set
// ═══════════════════════════════════════════════════════════════════

#include <iterator>
#include <string>
#include <vector>

namespace s2dm::rdf {

// ── Object term: an IRI or a literal with optional language tag ──
struct Term {
    enum class Kind { Iri, Literal };

    Kind kind = Kind::Iri;
    std::string value;
    std::string language;   // literals only; empty for plain literals

    static Term iri(std::string value) { return {Kind::Iri, std::move(value), {}}; }
    static Term literal(std::string value, std::string language = {}) {
        return {Kind::Literal, std::move(value), std::move(language)};
    }

    bool isIri() const { return kind == Kind::Iri; }
    bool isLiteral() const { return kind == Kind::Literal; }

    bool operator==(const Term&) const = default;
};

struct Triple {
    std::string subject;
    std::string predicate;
    Term object;

    bool operator==(const Triple&) const = default;
};

// The one ordering used by every serializer: byte-wise over `<subject>`,
// then `<predicate>`, then the object (`<iri>` or `"literal"@lang`).
int compareTriples(const Triple& a, const Triple& b);

inline bool tripleLess(const Triple& a, const Triple& b) {
    return compareTriples(a, b) < 0;
}

// ═══════════════════════════════════════════
//  class TripleSet
//  Append-only until handed to a serializer. Order of insertion carries
//  no meaning; serializers impose the canonical order.
// ═══════════════════════════════════════════
class TripleSet {
public:
    TripleSet() = default;
    explicit TripleSet(std::vector<Triple> triples) : triples_(std::move(triples)) {}

    void add(Triple triple) { triples_.push_back(std::move(triple)); }

    void add(std::string subject, std::string predicate, Term object) {
        triples_.push_back({std::move(subject), std::move(predicate), std::move(object)});
    }

    void append(std::vector<Triple>&& triples) {
        triples_.insert(triples_.end(),
                        std::make_move_iterator(triples.begin()),
                        std::make_move_iterator(triples.end()));
    }

    bool contains(const Triple& triple) const;

    // Canonically ordered copy with exact duplicates removed
    std::vector<Triple> sorted() const;

    const std::vector<Triple>& triples() const { return triples_; }
    std::size_t size() const { return triples_.size(); }
    bool empty() const { return triples_.empty(); }

    auto begin() const { return triples_.begin(); }
    auto end() const { return triples_.end(); }

private:
    std::vector<Triple> triples_;
};

} // namespace s2dm::rdf

// ═══════════════════════════════════════════════════════════════════
//  src/serializer.cpp — Canonical flat and grouped serializations
// ═══════════════════════════════════════════════════════════════════

#include "s2dm/serializer.h"
#include "s2dm/vocab.h"

#include <serd/serd.h>

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <vector>

namespace s2dm::rdf {

namespace {

const uint8_t* bytes(const std::string& s) {
    return reinterpret_cast<const uint8_t*>(s.c_str());
}

SerdNode uriNode(const std::string& iri) {
    return serd_node_from_string(SERD_URI, bytes(iri));
}

SerdNode literalNode(const std::string& value) {
    return serd_node_from_substring(SERD_LITERAL, bytes(value), value.size());
}

size_t appendToString(const void* buf, size_t len, void* stream) {
    static_cast<std::string*>(stream)->append(static_cast<const char*>(buf), len);
    return len;
}

void check(SerdStatus status, const char* what) {
    if (status != SERD_SUCCESS) {
        throw std::runtime_error(std::string("serd: ") + what + " failed: " +
                                 reinterpret_cast<const char*>(serd_strerror(status)));
    }
}

// ═══════════════════════════════════════════
//  class StringWriter
//  Owns a SerdEnv and a SerdWriter that appends to a std::string.
// ═══════════════════════════════════════════
class StringWriter {
public:
    StringWriter(SerdSyntax syntax, SerdStyle style, const PrefixMap& prefixes)
        : env_(serd_env_new(nullptr), &serd_env_free),
          writer_(nullptr, &serd_writer_free) {
        if (!env_) throw std::runtime_error("serd: cannot create environment");
        for (auto& [prefix, ns] : prefixes) {
            check(serd_env_set_prefix_from_strings(env_.get(), bytes(prefix), bytes(ns)),
                  "prefix");
        }
        writer_.reset(serd_writer_new(syntax, style, env_.get(), nullptr, appendToString, &out_));
        if (!writer_) throw std::runtime_error("serd: cannot create writer");
    }

    // Emits the @prefix block in map order (Turtle only)
    void declarePrefixes(const PrefixMap& prefixes) {
        for (auto& [prefix, ns] : prefixes) {
            SerdNode name = serd_node_from_string(SERD_LITERAL, bytes(prefix));
            SerdNode uri = uriNode(ns);
            check(serd_writer_set_prefix(writer_.get(), &name, &uri), "prefix declaration");
        }
    }

    void write(const Triple& t) {
        SerdNode subject = uriNode(t.subject);
        SerdNode predicate = uriNode(t.predicate);
        SerdNode object = t.object.isIri() ? uriNode(t.object.value) : literalNode(t.object.value);
        SerdNode lang = serd_node_from_string(SERD_LITERAL, bytes(t.object.language));
        const SerdNode* langPtr = t.object.isLiteral() && !t.object.language.empty() ? &lang : nullptr;

        check(serd_writer_write_statement(writer_.get(), 0, nullptr, &subject, &predicate,
                                          &object, nullptr, langPtr),
              "statement");
    }

    std::string finish() {
        check(serd_writer_finish(writer_.get()), "finish");
        return std::move(out_);
    }

private:
    std::string out_;
    std::unique_ptr<SerdEnv, decltype(&serd_env_free)> env_;
    std::unique_ptr<SerdWriter, decltype(&serd_writer_free)> writer_;
};

// Predicate position inside a subject block
int predicateRank(const std::string& predicate) {
    static const std::vector<std::string> order = {
        vocab::rdfType(),
        vocab::prefLabel(),
        vocab::definition(),
        vocab::hasField(),
        vocab::hasOutputType(),
        vocab::usesTypeWrapperPattern(),
        vocab::hasUnionMember(),
        vocab::hasEnumValue(),
    };
    auto it = std::find(order.begin(), order.end(), predicate);
    return it == order.end() ? static_cast<int>(order.size()) : static_cast<int>(it - order.begin());
}

} // namespace

PrefixMap prefixesFor(const MaterializerConfig& config) {
    return {
        {"rdf", std::string(vocab::RDF)},
        {"skos", std::string(vocab::SKOS)},
        {"s2dm", std::string(vocab::S2DM)},
        {config.prefix, config.namespaceIri},
    };
}

std::string serializeNTriples(const TripleSet& triples) {
    StringWriter writer(SERD_NTRIPLES, static_cast<SerdStyle>(0), {});
    for (auto& t : triples.sorted()) writer.write(t);
    return writer.finish();
}

std::string serializeTurtle(const TripleSet& triples, const PrefixMap& prefixes) {
    StringWriter writer(SERD_TURTLE,
                        static_cast<SerdStyle>(SERD_STYLE_ABBREVIATED | SERD_STYLE_CURIED),
                        prefixes);
    writer.declarePrefixes(prefixes);

    // Subjects stay in canonical order; within a subject, predicates by
    // rank. Stable so objects of one predicate keep canonical order.
    auto sorted = triples.sorted();
    std::stable_sort(sorted.begin(), sorted.end(), [](const Triple& a, const Triple& b) {
        if (a.subject != b.subject) return compareTriples(a, b) < 0;
        int ra = predicateRank(a.predicate);
        int rb = predicateRank(b.predicate);
        if (ra != rb) return ra < rb;
        return a.predicate < b.predicate;
    });

    for (auto& t : sorted) writer.write(t);
    return writer.finish();
}

} // namespace s2dm::rdf

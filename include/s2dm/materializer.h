#pragma once
// ═══════════════════════════════════════════════════════════════════
//  s2dm/materializer.h — Schema-to-graph triple emission
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    rdf::Materializer materializer(MaterializerConfig::from(ns));
//    auto result = materializer.materialize(model);
//    auto nt  = rdf::serializeNTriples(result.triples);
//    auto ttl = rdf::serializeTurtle(result.triples, result.config);
//
//  Every retained type definition is emitted independently (in parallel
//  unless the configuration says otherwise); results are merged into one
//  TripleSet before anyone sorts or writes it. Any classification or
//  naming failure aborts the whole run.
//
// ═══════════════════════════════════════════════════════════════════

#include "config.h"
#include "schema.h"
#include "triple.h"
#include "uri.h"
#include <functional>
#include <string>
#include <vector>

namespace s2dm::rdf {

struct MaterializeResult {
    TripleSet triples;
    MaterializerConfig config;
    std::size_t retainedTypes = 0;
    bool emptySchema = false;      // no retained definitions; artifacts are empty
};

// Extra triples for custom directives. Receives the retained definitions
// and the configuration; called once after the built-in emission.
using DirectiveTripleHandler =
    std::function<std::vector<Triple>(const SchemaModel& retained, const MaterializerConfig& config)>;

class Materializer {
public:
    // Throws ConfigError if the configuration is invalid
    explicit Materializer(MaterializerConfig config);

    Materializer& onDirectives(DirectiveTripleHandler handler) {
        directiveHandler_ = std::move(handler);
        return *this;
    }

    const MaterializerConfig& config() const { return config_; }

    MaterializeResult materialize(const SchemaModel& schema) const;

    // Triples for one definition; a pure function of `def` and the config
    std::vector<Triple> emitType(const TypeDefinition& def) const;

private:
    MaterializerConfig config_;
    UriGenerator uris_;
    DirectiveTripleHandler directiveHandler_;

    void checkDefinitions(const SchemaModel& schema) const;
    void checkRootReferences(const SchemaModel& schema) const;
    std::vector<Triple> emitAll(const std::vector<const TypeDefinition*>& retained) const;
};

// One-shot convenience wrapper
MaterializeResult materializeSchema(const SchemaModel& schema, const MaterializerConfig& config);

} // namespace s2dm::rdf

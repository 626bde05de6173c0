#pragma once
// ═══════════════════════════════════════════════════════════════════
//  s2dm/config.h — Materializer configuration
// ═══════════════════════════════════════════════════════════════════
//
//  The configuration is an immutable value threaded through every
//  component call; nothing reads global state.
//
//  Usage:
//    auto cfg = MaterializerConfig::from("https://covesa.org/s2dm/mydomain#");
//    auto fromFile = loadConfigFile("s2dm-rdf.json");
//
//  JSON form:
//    { "namespace": "https://example.org/vss#", "prefix": "vss",
//      "language": "en", "rootReferencePolicy": "emit", "parallel": true }
//
// ═══════════════════════════════════════════════════════════════════

#include "errors.h"
#include "json_utils.h"
#include <string>
#include <string_view>

namespace s2dm {

// What to do with a field whose output type is a root operation type
enum class RootReferencePolicy {
    Emit,     // emit the hasOutputType reference, suppress the definition
    Reject    // fail the run with RootTypeReference
};

NLOHMANN_JSON_SERIALIZE_ENUM(RootReferencePolicy, {
    {RootReferencePolicy::Emit, "emit"},
    {RootReferencePolicy::Reject, "reject"},
})

struct MaterializerConfig {
    std::string namespaceIri;
    std::string prefix = "ns";
    std::string language = "en";
    RootReferencePolicy rootReferencePolicy = RootReferencePolicy::Emit;
    bool parallel = true;

    static MaterializerConfig from(std::string namespaceIri,
                                   std::string prefix = "ns",
                                   std::string language = "en") {
        MaterializerConfig cfg;
        cfg.namespaceIri = std::move(namespaceIri);
        cfg.prefix = std::move(prefix);
        cfg.language = std::move(language);
        return cfg;
    }

    // Throws ConfigError describing the first invalid setting
    void validate() const;
};

// ── Individual checks (exposed for the CLI and tests) ──
bool isValidNamespaceIri(std::string_view iri);
bool isValidPrefix(std::string_view prefix);
bool isValidLanguageTag(std::string_view tag);

// Parse a JSON configuration document; missing keys keep defaults
MaterializerConfig parseConfig(const JsonValue& json);

// Read and parse a JSON configuration file. Throws ConfigError.
MaterializerConfig loadConfigFile(const std::string& path);

} // namespace s2dm

#pragma once
// ═══════════════════════════════════════════════════════════════════
//  s2dm/vocab.h — Fixed RDF, SKOS and s2dm vocabulary terms
// ═══════════════════════════════════════════════════════════════════

#include <string>
#include <string_view>

namespace s2dm::vocab {

inline constexpr std::string_view RDF  = "http://www.w3.org/1999/02/22-rdf-syntax-ns#";
inline constexpr std::string_view SKOS = "http://www.w3.org/2004/02/skos/core#";
inline constexpr std::string_view S2DM = "https://covesa.global/models/s2dm#";

inline std::string rdf(std::string_view local)  { return std::string(RDF) + std::string(local); }
inline std::string skos(std::string_view local) { return std::string(SKOS) + std::string(local); }
inline std::string s2dm(std::string_view local) { return std::string(S2DM) + std::string(local); }

// ── Predicates ──
inline const std::string& rdfType() { static const std::string v = rdf("type"); return v; }
inline const std::string& prefLabel() { static const std::string v = skos("prefLabel"); return v; }
inline const std::string& definition() { static const std::string v = skos("definition"); return v; }
inline const std::string& skosConcept() { static const std::string v = skos("Concept"); return v; }

inline const std::string& hasField() { static const std::string v = s2dm("hasField"); return v; }
inline const std::string& hasOutputType() { static const std::string v = s2dm("hasOutputType"); return v; }
inline const std::string& usesTypeWrapperPattern() {
    static const std::string v = s2dm("usesTypeWrapperPattern");
    return v;
}
inline const std::string& hasUnionMember() { static const std::string v = s2dm("hasUnionMember"); return v; }
inline const std::string& hasEnumValue() { static const std::string v = s2dm("hasEnumValue"); return v; }

} // namespace s2dm::vocab

#pragma once
// ═══════════════════════════════════════════════════════════════════
//  s2dm/uri.h — Concept URI generation
// ═══════════════════════════════════════════════════════════════════
//
//  URI convention (kept exactly for downstream consumers):
//    type        {namespace}{TypeName}
//    field       {namespace}{TypeName}.{fieldName}
//    enum value  {namespace}{EnumName}.{ValueName}
//
//  Built-in scalars (Int, Float, String, Boolean, ID) resolve to the s2dm
//  vocabulary, never to the user namespace.
//
//  Each name segment is percent-escaped byte by byte outside the set
//  [A-Za-z0-9_~-]. Segments containing '.', '/', '#' or '?' would make
//  the qualified path ambiguous and are rejected with InvalidIdentifier,
//  which keeps generation injective.
//
// ═══════════════════════════════════════════════════════════════════

#include "errors.h"
#include <string>
#include <string_view>

namespace s2dm::rdf {

// Escape one name segment. `path` is the qualified path reported on error.
std::string escapeSegment(std::string_view segment, std::string_view path);

class UriGenerator {
public:
    explicit UriGenerator(std::string namespaceIri);

    const std::string& namespaceIri() const { return namespace_; }

    // `path` names the referencing element in errors; defaults to the type
    std::string typeUri(std::string_view typeName, std::string_view path = {}) const;

    // Field or enum value of `ownerName`
    std::string memberUri(std::string_view ownerName, std::string_view memberName) const;

    // Output type of a field: built-in scalars map to s2dm terms
    std::string outputTypeUri(std::string_view typeName, std::string_view path = {}) const;

private:
    std::string namespace_;
};

} // namespace s2dm::rdf

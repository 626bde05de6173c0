#pragma once
// ═══════════════════════════════════════════════════════════════════
//  s2dm/artifacts.h — Writing the two output artifacts
// ═══════════════════════════════════════════════════════════════════
//
//  Both serializations are produced in memory first; files are written
//  under temporary names and renamed into place only when both writes
//  have succeeded.
//
// ═══════════════════════════════════════════════════════════════════

#include "materializer.h"
#include <string>

namespace s2dm::rdf {

struct ArtifactPaths {
    std::string ntriples;   // <outputDir>/<baseName>.nt
    std::string turtle;     // <outputDir>/<baseName>.ttl
};

// Creates `outputDir` if needed. Throws std::runtime_error on I/O failure.
// Both forms are staged as dot-prefixed .tmp files, then renamed .ttl
// first and .nt last. If the .nt rename fails the new .ttl is removed, so
// a failed run leaves no .ttl and any previous .nt untouched.
ArtifactPaths writeArtifacts(const MaterializeResult& result,
                             const std::string& outputDir,
                             const std::string& baseName = "schema");

} // namespace s2dm::rdf

#pragma once
// ═══════════════════════════════════════════════════════════════════
//  s2dm/schema_loader.h — Resolving schema sources into one model
// ═══════════════════════════════════════════════════════════════════
//
//  A source is a .graphql/.gql file, a directory (searched recursively,
//  files taken in sorted path order), an http:// URL, or a single .json
//  file holding an already-normalized model (see schema_json.h).
//  SDL sources are concatenated and parsed as one document, so a type
//  may be extended in a different file than the one defining it.
//
// ═══════════════════════════════════════════════════════════════════

#include "errors.h"
#include "schema.h"
#include <string>
#include <vector>

namespace s2dm::sdl {

// Expand directories to their SDL files; URLs and files pass through.
// Throws SourceError for paths that do not exist.
std::vector<std::string> resolveSources(const std::vector<std::string>& sources);

// Throws SourceError, SchemaParseError
SchemaModel loadSchema(const std::vector<std::string>& sources);

// Throws SourceError
SchemaModel loadSchemaModelJson(const std::string& path);

} // namespace s2dm::sdl

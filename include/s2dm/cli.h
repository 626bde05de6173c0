#pragma once
// ═══════════════════════════════════════════════════════════════════
//  s2dm/cli.h — The s2dm-rdf command line
// ═══════════════════════════════════════════════════════════════════

namespace s2dm::cli {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;   // schema, config, materialization or I/O error
constexpr int kExitUsage = 2;     // bad or missing arguments

// Parses argv, materializes the schema and writes <output>/schema.{nt,ttl}.
// Diagnostics go through console; returns the process exit code.
int run(int argc, char** argv);

} // namespace s2dm::cli

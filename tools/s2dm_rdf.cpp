// ═══════════════════════════════════════════════════════════════════
//  s2dm_rdf.cpp — Materialize a GraphQL schema as SKOS/s2dm RDF
// ═══════════════════════════════════════════════════════════════════
//
//  s2dm-rdf -s schema/ -s extra.graphql -o out \
//           --namespace https://covesa.org/s2dm/mydomain# --prefix ns
//
//  Writes out/schema.nt (sorted N-Triples) and out/schema.ttl (Turtle).
//
// ═══════════════════════════════════════════════════════════════════

#include "s2dm/cli.h"
#include "s2dm/console.h"

#include <unistd.h>

int main(int argc, char** argv) {
    s2dm::console::setColors(isatty(STDERR_FILENO) && isatty(STDOUT_FILENO));
    return s2dm::cli::run(argc, argv);
}

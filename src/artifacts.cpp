// ═══════════════════════════════════════════════════════════════════
//  src/artifacts.cpp — Writing the two output artifacts
// ═══════════════════════════════════════════════════════════════════

#include "s2dm/artifacts.h"
#include "s2dm/console.h"
#include "s2dm/fs.h"
#include "s2dm/path.h"
#include "s2dm/serializer.h"

#include <filesystem>

namespace s2dm::rdf {

namespace {

void removeQuietly(const std::string& file) {
    std::error_code ec;
    std::filesystem::remove(file, ec);
}

} // namespace

ArtifactPaths writeArtifacts(const MaterializeResult& result,
                             const std::string& outputDir,
                             const std::string& baseName) {
    auto nt = serializeNTriples(result.triples);
    auto ttl = serializeTurtle(result.triples, result.config);

    fs::mkdirSync(outputDir, true);

    ArtifactPaths paths{path::join(outputDir, baseName + ".nt"),
                        path::join(outputDir, baseName + ".ttl")};
    auto ntTmp = path::join(outputDir, "." + baseName + ".nt.tmp");
    auto ttlTmp = path::join(outputDir, "." + baseName + ".ttl.tmp");

    try {
        fs::writeFileSync(ntTmp, nt);
        fs::writeFileSync(ttlTmp, ttl);
    } catch (const std::exception&) {
        removeQuietly(ntTmp);
        removeQuietly(ttlTmp);
        throw;
    }

    // .nt is the canonical artifact and goes last: it never appears
    // beside a .ttl from another run
    try {
        fs::renameSync(ttlTmp, paths.turtle);
    } catch (const std::filesystem::filesystem_error&) {
        removeQuietly(ntTmp);
        removeQuietly(ttlTmp);
        throw;
    }
    try {
        fs::renameSync(ntTmp, paths.ntriples);
    } catch (const std::filesystem::filesystem_error&) {
        removeQuietly(ntTmp);
        removeQuietly(paths.turtle);
        throw;
    }

    console::debug("Wrote", paths.ntriples, "and", paths.turtle);
    return paths;
}

} // namespace s2dm::rdf

// ═══════════════════════════════════════════════════════════════════
//  src/schema_loader.cpp — Resolving schema sources into one model
// ═══════════════════════════════════════════════════════════════════

#include "s2dm/schema_loader.h"
#include "s2dm/console.h"
#include "s2dm/fetch.h"
#include "s2dm/fs.h"
#include "s2dm/path.h"
#include "s2dm/schema_json.h"
#include "s2dm/sdl_parser.h"

#include <algorithm>

namespace s2dm::sdl {

namespace {

const std::vector<std::string> kSdlExtensions = {".graphql", ".gql"};

struct Chunk {
    std::string source;      // file path or URL
    std::size_t firstLine;   // 1-based line of the chunk in the combined document
};

std::size_t countLines(const std::string& text) {
    return static_cast<std::size_t>(std::count(text.begin(), text.end(), '\n'));
}

std::string readSource(const std::string& source) {
    if (path::isUrl(source)) {
        console::debug("Downloading schema", source);
        auto resp = fetch::get(source);
        if (!resp.ok()) {
            throw SourceError("Failed to download '" + source + "': " +
                              (resp.status ? std::to_string(resp.status) + " " : std::string()) +
                              resp.statusText);
        }
        return resp.body;
    }
    try {
        return fs::readFileSync(source);
    } catch (const std::runtime_error& e) {
        throw SourceError(e.what());
    }
}

} // namespace

std::vector<std::string> resolveSources(const std::vector<std::string>& sources) {
    std::vector<std::string> resolved;
    for (auto& source : sources) {
        if (path::isUrl(source)) {
            resolved.push_back(source);
        } else if (!fs::existsSync(source)) {
            throw SourceError("Path '" + source + "' does not exist.");
        } else if (fs::isDirectorySync(source)) {
            auto files = fs::walkSync(source, kSdlExtensions);
            if (files.empty()) {
                console::warn("No GraphQL files found in", source);
            }
            resolved.insert(resolved.end(), files.begin(), files.end());
        } else {
            resolved.push_back(source);
        }
    }
    return resolved;
}

SchemaModel loadSchemaModelJson(const std::string& file) {
    try {
        return JsonValue::parse(readSource(file)).get<SchemaModel>();
    } catch (const nlohmann::json::exception& e) {
        throw SourceError("Invalid schema model '" + file + "': " + e.what());
    } catch (const std::invalid_argument& e) {
        throw SourceError("Invalid schema model '" + file + "': " + e.what());
    }
}

SchemaModel loadSchema(const std::vector<std::string>& sources) {
    auto resolved = resolveSources(sources);

    std::vector<std::string> models;
    std::vector<std::string> sdl;
    for (auto& source : resolved) {
        (path::extname(source) == ".json" ? models : sdl).push_back(source);
    }
    if (!models.empty()) {
        if (models.size() > 1 || !sdl.empty()) {
            throw SourceError("A JSON schema model must be the only schema source");
        }
        return loadSchemaModelJson(models.front());
    }
    if (sdl.empty()) {
        throw SourceError("No schema sources given");
    }

    std::string document;
    std::vector<Chunk> chunks;
    std::size_t line = 1;
    for (auto& source : sdl) {
        auto text = readSource(source);
        if (text.empty() || text.back() != '\n') text += '\n';
        chunks.push_back({source, line});
        line += countLines(text);
        document += text;
    }

    try {
        auto model = parseSchema(document);
        console::debug("Loaded", model.size(), "type definitions from", sdl.size(), "sources");
        return model;
    } catch (const SchemaParseError& e) {
        // report the position inside the file that holds it
        auto it = std::find_if(chunks.rbegin(), chunks.rend(),
                               [&](const Chunk& c) { return c.firstLine <= e.line(); });
        if (it == chunks.rend()) throw;
        throw SchemaParseError(e.message(), e.line() - it->firstLine + 1, e.column(), it->source);
    }
}

} // namespace s2dm::sdl

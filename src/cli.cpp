// ═══════════════════════════════════════════════════════════════════
//  src/cli.cpp — Argument parsing and the materialize-and-write run
// ═══════════════════════════════════════════════════════════════════

#include "s2dm/cli.h"
#include "s2dm/s2dm.h"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace s2dm::cli {

namespace {

struct Options {
    std::vector<std::string> schemas;
    std::string output;
    std::optional<std::string> namespaceIri;
    std::optional<std::string> prefix;
    std::optional<std::string> language;
    std::optional<std::string> configFile;
    bool rejectRootReferences = false;
    bool sequential = false;
    bool help = false;
    console::Level level = console::Level::Info;
};

void printUsage(std::ostream& os) {
    os << "Usage: s2dm-rdf -s <schema> [-s <schema>...] -o <dir> --namespace <iri>\n"
          "                [--prefix ns] [--language en] [--config file.json]\n"
          "                [--reject-root-references] [--sequential] [--quiet|--verbose]\n"
          "\n"
          "  -s, --schema       GraphQL file, directory, URL or JSON model (repeatable)\n"
          "  -o, --output       Output directory for schema.nt and schema.ttl\n"
          "      --namespace    Namespace IRI for concept URIs (e.g. https://covesa.org/s2dm/mydomain#)\n"
          "      --prefix       Prefix for concept URIs in Turtle (default: ns)\n"
          "      --language     BCP 47 language tag for prefLabels (default: en)\n"
          "      --config       JSON configuration file; flags override its values\n"
          "      --reject-root-references\n"
          "                     Fail when a field's output type is a root operation type\n"
          "      --sequential   Emit triples on a single thread\n"
          "  -q, --quiet        Only report warnings and errors\n"
          "  -v, --verbose      Report per-type progress\n";
}

// Returns nullopt after printing a usage error
std::optional<Options> parseArgs(int argc, char** argv) {
    Options opts;
    auto value = [&](int& i, const std::string& flag) -> std::optional<std::string> {
        if (i + 1 >= argc) {
            console::error("Option", flag, "requires a value");
            return std::nullopt;
        }
        return std::string(argv[++i]);
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::optional<std::string> v;
        if (arg == "-s" || arg == "--schema") {
            if (!(v = value(i, arg))) return std::nullopt;
            opts.schemas.push_back(*v);
        } else if (arg == "-o" || arg == "--output") {
            if (!(v = value(i, arg))) return std::nullopt;
            opts.output = *v;
        } else if (arg == "--namespace") {
            if (!(opts.namespaceIri = value(i, arg))) return std::nullopt;
        } else if (arg == "--prefix") {
            if (!(opts.prefix = value(i, arg))) return std::nullopt;
        } else if (arg == "--language") {
            if (!(opts.language = value(i, arg))) return std::nullopt;
        } else if (arg == "--config") {
            if (!(opts.configFile = value(i, arg))) return std::nullopt;
        } else if (arg == "--reject-root-references") {
            opts.rejectRootReferences = true;
        } else if (arg == "--sequential") {
            opts.sequential = true;
        } else if (arg == "-q" || arg == "--quiet") {
            opts.level = console::Level::Warn;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.level = console::Level::Debug;
        } else if (arg == "-h" || arg == "--help") {
            opts.help = true;
            return opts;
        } else {
            console::error("Unknown option", arg);
            return std::nullopt;
        }
    }

    if (opts.schemas.empty() || opts.output.empty()) {
        console::error("--schema and --output are required");
        return std::nullopt;
    }
    return opts;
}

MaterializerConfig buildConfig(const Options& opts) {
    MaterializerConfig cfg = opts.configFile ? loadConfigFile(*opts.configFile) : MaterializerConfig{};
    if (opts.namespaceIri) cfg.namespaceIri = *opts.namespaceIri;
    if (opts.prefix) cfg.prefix = *opts.prefix;
    if (opts.language) cfg.language = *opts.language;
    if (opts.rejectRootReferences) cfg.rootReferencePolicy = RootReferencePolicy::Reject;
    if (opts.sequential) cfg.parallel = false;
    if (cfg.namespaceIri.empty()) {
        throw ConfigError("--namespace is required");
    }
    cfg.validate();
    return cfg;
}

} // namespace

int run(int argc, char** argv) {
    auto opts = parseArgs(argc, argv);
    if (!opts) {
        printUsage(std::cerr);
        return kExitUsage;
    }
    if (opts->help) {
        printUsage(std::cout);
        return kExitOk;
    }
    console::setLevel(opts->level);

    try {
        auto config = buildConfig(*opts);

        console::time("materialize");
        auto model = sdl::loadSchema(opts->schemas);
        auto result = rdf::Materializer(config).materialize(model);
        auto paths = rdf::writeArtifacts(result, opts->output, "schema");
        console::timeEnd("materialize");

        console::success("RDF artifacts written to", paths.ntriples, "and", paths.turtle);
        return kExitOk;
    } catch (const MaterializeError& e) {
        console::error(e.what());
    } catch (const SchemaParseError& e) {
        console::error(e.what());
    } catch (const SourceError& e) {
        console::error(e.what());
    } catch (const ConfigError& e) {
        console::error(e.what());
    } catch (const std::exception& e) {
        console::error("Failed to write RDF artifacts:", e.what());
    }
    return kExitFailure;
}

} // namespace s2dm::cli

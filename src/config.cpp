// ═══════════════════════════════════════════════════════════════════
//  src/config.cpp — Configuration validation and JSON loading
// ═══════════════════════════════════════════════════════════════════

#include "s2dm/config.h"
#include "s2dm/fs.h"

#include <regex>

namespace s2dm {

namespace {

bool isAlpha(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }
bool isDigit(char c) { return c >= '0' && c <= '9'; }

} // namespace

bool isValidNamespaceIri(std::string_view iri) {
    auto colon = iri.find(':');
    if (colon == std::string_view::npos || colon == 0 || colon + 1 >= iri.size()) {
        return false;
    }
    // scheme = ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )
    if (!isAlpha(iri[0])) return false;
    for (std::size_t i = 1; i < colon; ++i) {
        char c = iri[i];
        if (!isAlpha(c) && !isDigit(c) && c != '+' && c != '-' && c != '.') return false;
    }
    for (char c : iri) {
        auto u = static_cast<unsigned char>(c);
        if (u <= 0x20 || c == '<' || c == '>' || c == '"' || c == '{' || c == '}' ||
            c == '|' || c == '^' || c == '`' || c == '\\') {
            return false;
        }
    }
    char last = iri.back();
    return last == '#' || last == '/';
}

bool isValidPrefix(std::string_view prefix) {
    // Turtle PN_PREFIX restricted to ASCII
    static const std::regex re(R"(^[A-Za-z]([A-Za-z0-9_.\-]*[A-Za-z0-9_\-])?$)");
    return std::regex_match(prefix.begin(), prefix.end(), re);
}

bool isValidLanguageTag(std::string_view tag) {
    static const std::regex re(R"(^[A-Za-z]{2,8}(-[A-Za-z0-9]{1,8})*$)");
    return std::regex_match(tag.begin(), tag.end(), re);
}

void MaterializerConfig::validate() const {
    if (!isValidNamespaceIri(namespaceIri)) {
        throw ConfigError("Invalid namespace '" + namespaceIri +
                          "': expected an absolute IRI ending with '#' or '/'");
    }
    if (!isValidPrefix(prefix)) {
        throw ConfigError("Invalid prefix '" + prefix + "'");
    }
    if (prefix == "rdf" || prefix == "skos" || prefix == "s2dm") {
        throw ConfigError("Prefix '" + prefix + "' is reserved");
    }
    if (!isValidLanguageTag(language)) {
        throw ConfigError("Invalid BCP 47 language tag '" + language + "'");
    }
}

MaterializerConfig parseConfig(const JsonValue& json) {
    if (!json.isObject()) {
        throw ConfigError("Configuration must be a JSON object");
    }
    MaterializerConfig cfg;
    try {
        cfg.namespaceIri = json.get<std::string>("namespace", cfg.namespaceIri);
        cfg.prefix = json.get<std::string>("prefix", cfg.prefix);
        cfg.language = json.get<std::string>("language", cfg.language);
        cfg.parallel = json.get<bool>("parallel", cfg.parallel);
        if (json.has("rootReferencePolicy")) {
            auto policy = json.get<std::string>("rootReferencePolicy", "emit");
            if (policy != "emit" && policy != "reject") {
                throw ConfigError("rootReferencePolicy must be 'emit' or 'reject', got '" + policy + "'");
            }
            cfg.rootReferencePolicy = json["rootReferencePolicy"].get<RootReferencePolicy>();
        }
    } catch (const nlohmann::json::type_error& e) {
        throw ConfigError(std::string("Invalid configuration value: ") + e.what());
    }
    return cfg;
}

MaterializerConfig loadConfigFile(const std::string& path) {
    if (!fs::existsSync(path)) {
        throw ConfigError("Configuration file '" + path + "' does not exist");
    }
    try {
        return parseConfig(JsonValue::parse(fs::readFileSync(path)));
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Cannot parse configuration '" + path + "': " + e.what());
    }
}

} // namespace s2dm

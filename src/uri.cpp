// ═══════════════════════════════════════════════════════════════════
//  src/uri.cpp — Concept URI generation
// ═══════════════════════════════════════════════════════════════════

#include "s2dm/uri.h"
#include "s2dm/schema.h"
#include "s2dm/vocab.h"

namespace s2dm::rdf {

namespace {

bool isUnreserved(unsigned char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '_' || c == '-' || c == '~';
}

} // namespace

std::string escapeSegment(std::string_view segment, std::string_view path) {
    if (segment.empty()) {
        throw MaterializeError(ErrorKind::InvalidIdentifier, std::string(path), "empty name");
    }

    static constexpr char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(segment.size());
    for (char ch : segment) {
        auto c = static_cast<unsigned char>(ch);
        if (c == '.' || c == '/' || c == '#' || c == '?') {
            throw MaterializeError(ErrorKind::InvalidIdentifier, std::string(path),
                std::string("name contains path separator '") + ch + "'");
        }
        if (isUnreserved(c)) {
            out += ch;
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

UriGenerator::UriGenerator(std::string namespaceIri) : namespace_(std::move(namespaceIri)) {
    if (namespace_.empty()) {
        throw ConfigError("namespace IRI must not be empty");
    }
}

std::string UriGenerator::typeUri(std::string_view typeName, std::string_view path) const {
    return namespace_ + escapeSegment(typeName, path.empty() ? typeName : path);
}

std::string UriGenerator::memberUri(std::string_view ownerName, std::string_view memberName) const {
    std::string path = std::string(ownerName) + "." + std::string(memberName);
    return namespace_ + escapeSegment(ownerName, path) + "." + escapeSegment(memberName, path);
}

std::string UriGenerator::outputTypeUri(std::string_view typeName, std::string_view path) const {
    if (isBuiltinScalar(typeName)) {
        return vocab::s2dm(typeName);
    }
    return typeUri(typeName, path);
}

} // namespace s2dm::rdf

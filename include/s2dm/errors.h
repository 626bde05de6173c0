#pragma once
// ═══════════════════════════════════════════════════════════════════
//  s2dm/errors.h — Exception types raised by the materialization engine
// ═══════════════════════════════════════════════════════════════════
//
//  Every failure is terminal for a run. Errors carry the qualified path
//  (or raw signature) of the offending schema element so the source
//  schema can be corrected directly.
//
// ═══════════════════════════════════════════════════════════════════

#include <stdexcept>
#include <string>

namespace s2dm {

// ── Materialization error kinds ──
enum class ErrorKind {
    UnsupportedShape,      // type signature outside the six wrapper patterns
    InvalidIdentifier,     // name cannot be written as an IRI path segment
    DuplicateDefinition,   // two elements resolve to one qualified path
    RootTypeReference      // field typed as a root operation type (reject policy)
};

inline const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnsupportedShape:    return "UnsupportedShape";
        case ErrorKind::InvalidIdentifier:   return "InvalidIdentifier";
        case ErrorKind::DuplicateDefinition: return "DuplicateDefinition";
        case ErrorKind::RootTypeReference:   return "RootTypeReference";
    }
    return "Unknown";
}

// ═══════════════════════════════════════════
//  class MaterializeError
//  Raised by the classifier, URI generator and triple emitter.
// ═══════════════════════════════════════════
class MaterializeError : public std::runtime_error {
public:
    MaterializeError(ErrorKind kind, std::string path, const std::string& message)
        : std::runtime_error(std::string(errorKindName(kind)) + " at '" + path + "': " + message),
          kind_(kind), path_(std::move(path)) {}

    ErrorKind kind() const { return kind_; }
    const std::string& path() const { return path_; }

private:
    ErrorKind kind_;
    std::string path_;
};

// ═══════════════════════════════════════════
//  class SchemaParseError
//  Raised by the SDL reader; line/column are 1-based and `source`
//  names the file when the loader knows it.
// ═══════════════════════════════════════════
class SchemaParseError : public std::runtime_error {
public:
    SchemaParseError(const std::string& message, std::size_t line, std::size_t column,
                     const std::string& source = {})
        : std::runtime_error("Syntax error at " + (source.empty() ? std::string() : source + ":") +
                             std::to_string(line) + ":" + std::to_string(column) + ": " + message),
          message_(message), line_(line), column_(column), source_(source) {}

    const std::string& message() const { return message_; }
    std::size_t line() const { return line_; }
    std::size_t column() const { return column_; }
    const std::string& source() const { return source_; }

private:
    std::string message_;
    std::size_t line_;
    std::size_t column_;
    std::string source_;
};

// ── Unreadable schema source (missing path, failed download, bad model JSON) ──
class SourceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ── Invalid namespace, prefix or language tag ──
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace s2dm

#pragma once
// ═══════════════════════════════════════════════════════════════════
//  s2dm/sdl_parser.h — GraphQL SDL reader producing a SchemaModel
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    auto model = sdl::parseSchema(R"(
//        type Cabin { doors: [Door] }
//        type Door { isOpen: Boolean }
//    )");
//
//  Covers type system definitions and extensions. Field arguments,
//  default values and directive definitions are read and discarded;
//  applied directive names are kept on fields. The reader does not
//  validate the schema (unknown type references are accepted).
//
// ═══════════════════════════════════════════════════════════════════

#include "errors.h"
#include "schema.h"
#include <cstddef>
#include <string>
#include <vector>

namespace s2dm::sdl {

namespace detail {

class SdlParser {
public:
    explicit SdlParser(const std::string& source)
        : source_(source), pos_(0) {}

    // Throws SchemaParseError
    SchemaModel parse();

private:
    struct PendingExtension {
        TypeDefinition def;
        std::size_t pos;
    };

    std::string source_;
    std::size_t pos_;
    SchemaModel model_;
    std::vector<PendingExtension> extensions_;
    bool sawSchemaDefinition_ = false;

    char peek() const {
        return pos_ < source_.size() ? source_[pos_] : '\0';
    }

    char advance() {
        return pos_ < source_.size() ? source_[pos_++] : '\0';
    }

    bool atEnd() {
        skipWhitespace();
        return pos_ >= source_.size();
    }

    [[noreturn]] void fail(const std::string& message) const { failAt(pos_, message); }
    [[noreturn]] void failAt(std::size_t pos, const std::string& message) const;

    void skipWhitespace();
    void expect(char c);
    bool consume(char c);
    bool isIdentStart(char c) const;
    bool isIdentChar(char c) const;
    std::string parseIdentifier();
    std::string peekIdentifier();

    std::string parseString();
    std::string parseBlockString();
    std::string parseOptionalDescription();

    void skipBalanced(char open, char close);
    void skipValue();
    void skipDirectiveDefinition();
    std::vector<std::string> parseDirectives();
    std::vector<std::string> parseImplements();

    TypeRef parseType();
    std::vector<FieldDefinition> parseFieldsDefinition(const std::string& owner, bool input);
    std::vector<EnumValueDefinition> parseEnumValues(const std::string& owner);
    std::vector<std::string> parseUnionMembers();

    TypeDefinition parseTypeDefinition(const std::string& keyword, std::string description);
    void parseSchemaDefinition(bool extension);
    void applyExtensions();
};

} // namespace detail

// Parse one SDL document
SchemaModel parseSchema(const std::string& source);

} // namespace s2dm::sdl

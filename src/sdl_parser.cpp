// ═══════════════════════════════════════════════════════════════════
//  src/sdl_parser.cpp — GraphQL SDL reader
// ═══════════════════════════════════════════════════════════════════

#include "s2dm/sdl_parser.h"

#include <algorithm>

namespace s2dm::sdl {

namespace detail {

void SdlParser::failAt(std::size_t pos, const std::string& message) const {
    std::size_t line = 1;
    std::size_t column = 1;
    for (std::size_t i = 0; i < pos && i < source_.size(); ++i) {
        if (source_[i] == '\n') {
            ++line;
            column = 1;
        } else {
            ++column;
        }
    }
    throw SchemaParseError(message, line, column);
}

// Whitespace, commas, BOM and '#' comments are insignificant
void SdlParser::skipWhitespace() {
    while (pos_ < source_.size()) {
        char c = source_[pos_];
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == ',') {
            pos_++;
        } else if (c == '#') {
            while (pos_ < source_.size() && source_[pos_] != '\n') pos_++;
        } else if (source_.compare(pos_, 3, "\xEF\xBB\xBF") == 0) {
            pos_ += 3;
        } else {
            break;
        }
    }
}

void SdlParser::expect(char c) {
    skipWhitespace();
    if (peek() != c) {
        fail(std::string("Expected '") + c + "'");
    }
    advance();
}

bool SdlParser::consume(char c) {
    skipWhitespace();
    if (peek() == c) {
        advance();
        return true;
    }
    return false;
}

bool SdlParser::isIdentStart(char c) const {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

bool SdlParser::isIdentChar(char c) const {
    return isIdentStart(c) || (c >= '0' && c <= '9');
}

std::string SdlParser::parseIdentifier() {
    skipWhitespace();
    if (!isIdentStart(peek())) {
        fail("Expected name");
    }
    std::string result;
    while (pos_ < source_.size() && isIdentChar(source_[pos_])) {
        result += source_[pos_++];
    }
    return result;
}

std::string SdlParser::peekIdentifier() {
    skipWhitespace();
    std::size_t p = pos_;
    std::string result;
    while (p < source_.size() && isIdentChar(source_[p])) {
        result += source_[p++];
    }
    return result;
}

// ── Strings ──

std::string SdlParser::parseString() {
    skipWhitespace();
    if (source_.compare(pos_, 3, "\"\"\"") == 0) {
        return parseBlockString();
    }
    std::size_t start = pos_;
    expect('"');
    std::string result;
    while (peek() != '"') {
        if (peek() == '\0' || peek() == '\n') {
            failAt(start, "Unterminated string");
        }
        if (peek() == '\\') {
            advance();
            char esc = advance();
            switch (esc) {
                case 'n': result += '\n'; break;
                case 't': result += '\t'; break;
                case 'r': result += '\r'; break;
                case 'b': result += '\b'; break;
                case 'f': result += '\f'; break;
                case '"': result += '"'; break;
                case '\\': result += '\\'; break;
                case '/': result += '/'; break;
                case 'u': {
                    // \uXXXX, BMP only, encoded as UTF-8
                    unsigned long cp = 0;
                    for (int k = 0; k < 4; ++k) {
                        char h = advance();
                        cp <<= 4;
                        if (h >= '0' && h <= '9') cp |= static_cast<unsigned long>(h - '0');
                        else if (h >= 'a' && h <= 'f') cp |= static_cast<unsigned long>(h - 'a' + 10);
                        else if (h >= 'A' && h <= 'F') cp |= static_cast<unsigned long>(h - 'A' + 10);
                        else fail("Invalid unicode escape");
                    }
                    if (cp < 0x80) {
                        result += static_cast<char>(cp);
                    } else if (cp < 0x800) {
                        result += static_cast<char>(0xC0 | (cp >> 6));
                        result += static_cast<char>(0x80 | (cp & 0x3F));
                    } else {
                        result += static_cast<char>(0xE0 | (cp >> 12));
                        result += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
                        result += static_cast<char>(0x80 | (cp & 0x3F));
                    }
                    break;
                }
                default: fail(std::string("Invalid escape '\\") + esc + "'");
            }
        } else {
            result += advance();
        }
    }
    advance();
    return result;
}

// Block string with common indentation and blank edge lines removed
std::string SdlParser::parseBlockString() {
    std::size_t start = pos_;
    pos_ += 3;
    std::string raw;
    while (true) {
        if (pos_ >= source_.size()) failAt(start, "Unterminated block string");
        if (source_.compare(pos_, 4, "\\\"\"\"") == 0) {
            raw += "\"\"\"";
            pos_ += 4;
        } else if (source_.compare(pos_, 3, "\"\"\"") == 0) {
            pos_ += 3;
            break;
        } else {
            raw += source_[pos_++];
        }
    }

    std::vector<std::string> lines;
    std::size_t lineStart = 0;
    for (std::size_t i = 0; i <= raw.size(); ++i) {
        if (i == raw.size() || raw[i] == '\n') {
            std::string line = raw.substr(lineStart, i - lineStart);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            lines.push_back(line);
            lineStart = i + 1;
        }
    }

    auto indentOf = [](const std::string& line) {
        std::size_t n = 0;
        while (n < line.size() && (line[n] == ' ' || line[n] == '\t')) ++n;
        return n;
    };

    std::size_t common = std::string::npos;
    for (std::size_t i = 1; i < lines.size(); ++i) {
        std::size_t indent = indentOf(lines[i]);
        if (indent < lines[i].size()) common = std::min(common, indent);
    }
    if (common != std::string::npos) {
        for (std::size_t i = 1; i < lines.size(); ++i) {
            lines[i] = lines[i].size() >= common ? lines[i].substr(common) : std::string();
        }
    }

    auto blank = [&](const std::string& line) { return indentOf(line) == line.size(); };
    while (!lines.empty() && blank(lines.front())) lines.erase(lines.begin());
    while (!lines.empty() && blank(lines.back())) lines.pop_back();

    std::string result;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) result += '\n';
        result += lines[i];
    }
    return result;
}

std::string SdlParser::parseOptionalDescription() {
    skipWhitespace();
    return peek() == '"' ? parseString() : std::string();
}

// ── Skipped constructs ──

void SdlParser::skipBalanced(char open, char close) {
    expect(open);
    int depth = 1;
    while (depth > 0) {
        skipWhitespace();
        char c = peek();
        if (c == '\0') fail(std::string("Expected '") + close + "'");
        if (c == '"') {
            parseString();
            continue;
        }
        advance();
        if (c == open) depth++;
        if (c == close) depth--;
    }
}

void SdlParser::skipValue() {
    skipWhitespace();
    char c = peek();
    if (c == '"') {
        parseString();
    } else if (c == '[') {
        skipBalanced('[', ']');
    } else if (c == '{') {
        skipBalanced('{', '}');
    } else if (c == '$') {
        advance();
        parseIdentifier();
    } else if (c == '-' || (c >= '0' && c <= '9')) {
        advance();
        while (isIdentChar(peek()) || peek() == '.' || peek() == '+' || peek() == '-') advance();
    } else {
        parseIdentifier();   // true, false, null or an enum value
    }
}

std::vector<std::string> SdlParser::parseDirectives() {
    std::vector<std::string> names;
    while (consume('@')) {
        names.push_back(parseIdentifier());
        skipWhitespace();
        if (peek() == '(') skipBalanced('(', ')');
    }
    return names;
}

// directive @name(args) repeatable on LOCATION | LOCATION
void SdlParser::skipDirectiveDefinition() {
    expect('@');
    parseIdentifier();
    skipWhitespace();
    if (peek() == '(') skipBalanced('(', ')');
    if (peekIdentifier() == "repeatable") parseIdentifier();
    if (parseIdentifier() != "on") fail("Expected 'on'");
    consume('|');
    parseIdentifier();
    while (consume('|')) parseIdentifier();
}

std::vector<std::string> SdlParser::parseImplements() {
    std::vector<std::string> names;
    if (peekIdentifier() != "implements") return names;
    parseIdentifier();
    consume('&');
    names.push_back(parseIdentifier());
    while (consume('&')) names.push_back(parseIdentifier());
    return names;
}

// ── Types and members ──

TypeRef SdlParser::parseType() {
    TypeRef ref;
    if (consume('[')) {
        ref = parseType();
        expect(']');
        ref.modifiers.push_back(TypeModifier::List);
    } else {
        ref.name = parseIdentifier();
    }
    if (consume('!')) {
        ref.modifiers.push_back(TypeModifier::NonNull);
    }
    return ref;
}

std::vector<FieldDefinition> SdlParser::parseFieldsDefinition(const std::string& owner, bool input) {
    std::vector<FieldDefinition> fields;
    skipWhitespace();
    if (peek() != '{') return fields;
    expect('{');
    while (!consume('}')) {
        if (atEnd()) fail("Expected '}'");
        FieldDefinition field;
        field.description = parseOptionalDescription();
        field.name = parseIdentifier();
        field.ownerName = owner;
        skipWhitespace();
        if (!input && peek() == '(') skipBalanced('(', ')');
        expect(':');
        field.type = parseType();
        if (input && consume('=')) skipValue();
        field.directives = parseDirectives();
        fields.push_back(std::move(field));
    }
    return fields;
}

std::vector<EnumValueDefinition> SdlParser::parseEnumValues(const std::string& owner) {
    std::vector<EnumValueDefinition> values;
    skipWhitespace();
    if (peek() != '{') return values;
    expect('{');
    while (!consume('}')) {
        if (atEnd()) fail("Expected '}'");
        EnumValueDefinition value;
        value.description = parseOptionalDescription();
        value.name = parseIdentifier();
        value.ownerName = owner;
        parseDirectives();
        values.push_back(std::move(value));
    }
    return values;
}

std::vector<std::string> SdlParser::parseUnionMembers() {
    std::vector<std::string> members;
    if (!consume('=')) return members;
    consume('|');
    members.push_back(parseIdentifier());
    while (consume('|')) members.push_back(parseIdentifier());
    return members;
}

TypeDefinition SdlParser::parseTypeDefinition(const std::string& keyword, std::string description) {
    auto name = parseIdentifier();

    if (keyword == "type") {
        ObjectTypeDefinition def{name, std::move(description), {}, {}};
        def.interfaces = parseImplements();
        parseDirectives();
        def.fields = parseFieldsDefinition(name, false);
        return def;
    }
    if (keyword == "interface") {
        InterfaceTypeDefinition def{name, std::move(description), {}, {}};
        def.interfaces = parseImplements();
        parseDirectives();
        def.fields = parseFieldsDefinition(name, false);
        return def;
    }
    if (keyword == "input") {
        InputObjectTypeDefinition def{name, std::move(description), {}};
        parseDirectives();
        def.fields = parseFieldsDefinition(name, true);
        return def;
    }
    if (keyword == "union") {
        UnionTypeDefinition def{name, std::move(description), {}};
        parseDirectives();
        def.members = parseUnionMembers();
        return def;
    }
    if (keyword == "enum") {
        EnumTypeDefinition def{name, std::move(description), {}};
        parseDirectives();
        def.values = parseEnumValues(name);
        return def;
    }
    ScalarTypeDefinition def{name, std::move(description)};
    parseDirectives();
    return def;
}

// schema { query: Q mutation: M subscription: S }
void SdlParser::parseSchemaDefinition(bool extension) {
    parseDirectives();
    skipWhitespace();
    if (peek() != '{') {
        if (extension) return;
        fail("Expected '{'");
    }
    if (!extension && !sawSchemaDefinition_) {
        // an explicit schema definition replaces the conventional names
        model_.roots() = RootOperationTypes{"", "", ""};
    }
    sawSchemaDefinition_ = true;

    expect('{');
    while (!consume('}')) {
        if (atEnd()) fail("Expected '}'");
        std::size_t at = pos_;
        auto operation = parseIdentifier();
        expect(':');
        auto typeName = parseIdentifier();
        if (operation == "query") model_.roots().query = typeName;
        else if (operation == "mutation") model_.roots().mutation = typeName;
        else if (operation == "subscription") model_.roots().subscription = typeName;
        else failAt(at, "Unknown operation type '" + operation + "'");
    }
}

void SdlParser::applyExtensions() {
    for (auto& ext : extensions_) {
        const auto& name = nameOf(ext.def);
        TypeDefinition* target = nullptr;
        for (auto& t : model_.types()) {
            if (nameOf(t) == name) target = &t;
        }
        if (!target) {
            failAt(ext.pos, "Cannot extend unknown type '" + name + "'");
        }
        if (kindOf(*target) != kindOf(ext.def)) {
            failAt(ext.pos, "Extension of '" + name + "' does not match its kind");
        }

        std::visit(Overloaded{
            [&](ObjectTypeDefinition& t) {
                auto& e = std::get<ObjectTypeDefinition>(ext.def);
                t.interfaces.insert(t.interfaces.end(), e.interfaces.begin(), e.interfaces.end());
                t.fields.insert(t.fields.end(), e.fields.begin(), e.fields.end());
            },
            [&](InterfaceTypeDefinition& t) {
                auto& e = std::get<InterfaceTypeDefinition>(ext.def);
                t.interfaces.insert(t.interfaces.end(), e.interfaces.begin(), e.interfaces.end());
                t.fields.insert(t.fields.end(), e.fields.begin(), e.fields.end());
            },
            [&](InputObjectTypeDefinition& t) {
                auto& e = std::get<InputObjectTypeDefinition>(ext.def);
                t.fields.insert(t.fields.end(), e.fields.begin(), e.fields.end());
            },
            [&](UnionTypeDefinition& t) {
                auto& e = std::get<UnionTypeDefinition>(ext.def);
                t.members.insert(t.members.end(), e.members.begin(), e.members.end());
            },
            [&](EnumTypeDefinition& t) {
                auto& e = std::get<EnumTypeDefinition>(ext.def);
                t.values.insert(t.values.end(), e.values.begin(), e.values.end());
            },
            [](ScalarTypeDefinition&) {},
        }, *target);
    }
    extensions_.clear();
}

SchemaModel SdlParser::parse() {
    while (!atEnd()) {
        std::size_t at = pos_;
        auto description = parseOptionalDescription();
        auto keyword = parseIdentifier();

        bool extension = false;
        if (keyword == "extend") {
            extension = true;
            skipWhitespace();
            at = pos_;
            keyword = parseIdentifier();
        }

        if (keyword == "schema") {
            parseSchemaDefinition(extension);
        } else if (keyword == "directive" && !extension) {
            skipDirectiveDefinition();
        } else if (keyword == "type" || keyword == "interface" || keyword == "input" ||
                   keyword == "union" || keyword == "enum" || keyword == "scalar") {
            auto def = parseTypeDefinition(keyword, std::move(description));
            if (extension) {
                extensions_.push_back({std::move(def), at});
            } else {
                model_.add(std::move(def));
            }
        } else {
            failAt(at, "Unexpected '" + keyword + "'");
        }
    }

    applyExtensions();
    return std::move(model_);
}

} // namespace detail

SchemaModel parseSchema(const std::string& source) {
    return detail::SdlParser(source).parse();
}

} // namespace s2dm::sdl

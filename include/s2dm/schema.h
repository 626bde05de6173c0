#pragma once
// ═══════════════════════════════════════════════════════════════════
//  s2dm/schema.h — Normalized GraphQL schema model
// ═══════════════════════════════════════════════════════════════════
//
//  The model is what the SDL reader (or an external parser, through the
//  JSON form in schema_json.h) hands to the materializer. It is a closed
//  set of six definition kinds held in a std::variant, so every visitor
//  over TypeDefinition must handle each kind.
//
//  Usage:
//    SchemaModel model;
//    model.add(EnumTypeDefinition{"CabinKindEnum", "", {{"SUV"}, {"VAN"}}});
//    model.roots().query = "RootQuery";
//
// ═══════════════════════════════════════════════════════════════════

#include <algorithm>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace s2dm {

// ── Helper for std::visit with a set of lambdas ──
template <typename... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

// ═══════════════════════════════════════════
//  Type references
// ═══════════════════════════════════════════

enum class TypeModifier { NonNull, List };

// A field's raw output-type signature. Modifiers are ordered innermost to
// outermost: `[Door!]!` is {"Door", {NonNull, List, NonNull}}.
struct TypeRef {
    std::string name;
    std::vector<TypeModifier> modifiers;

    // Render back to SDL notation
    std::string toString() const {
        std::string out = name;
        for (auto m : modifiers) {
            if (m == TypeModifier::NonNull) out += '!';
            else out = "[" + out + "]";
        }
        return out;
    }

    bool operator==(const TypeRef&) const = default;
};

// ═══════════════════════════════════════════
//  Children of type definitions
// ═══════════════════════════════════════════

struct FieldDefinition {
    std::string name;
    std::string ownerName;
    TypeRef type;
    std::vector<std::string> directives;   // applied directive names, without '@'
    std::string description;

    bool hasDirective(std::string_view directive) const {
        return std::find(directives.begin(), directives.end(), directive) != directives.end();
    }

    std::string qualifiedName() const { return ownerName + "." + name; }
};

struct EnumValueDefinition {
    std::string name;
    std::string ownerName;
    std::string description;

    std::string qualifiedName() const { return ownerName + "." + name; }
};

// ═══════════════════════════════════════════
//  The six definition kinds
// ═══════════════════════════════════════════

struct ObjectTypeDefinition {
    std::string name;
    std::string description;
    std::vector<FieldDefinition> fields;
    std::vector<std::string> interfaces;
};

struct InterfaceTypeDefinition {
    std::string name;
    std::string description;
    std::vector<FieldDefinition> fields;
    std::vector<std::string> interfaces;
};

struct InputObjectTypeDefinition {
    std::string name;
    std::string description;
    std::vector<FieldDefinition> fields;
};

struct UnionTypeDefinition {
    std::string name;
    std::string description;
    std::vector<std::string> members;
};

struct EnumTypeDefinition {
    std::string name;
    std::string description;
    std::vector<EnumValueDefinition> values;
};

struct ScalarTypeDefinition {
    std::string name;
    std::string description;
};

using TypeDefinition = std::variant<ObjectTypeDefinition,
                                    InterfaceTypeDefinition,
                                    InputObjectTypeDefinition,
                                    UnionTypeDefinition,
                                    EnumTypeDefinition,
                                    ScalarTypeDefinition>;

enum class TypeKind { Object, Interface, InputObject, Union, Enum, Scalar };

inline TypeKind kindOf(const TypeDefinition& def) {
    return std::visit(Overloaded{
        [](const ObjectTypeDefinition&)      { return TypeKind::Object; },
        [](const InterfaceTypeDefinition&)   { return TypeKind::Interface; },
        [](const InputObjectTypeDefinition&) { return TypeKind::InputObject; },
        [](const UnionTypeDefinition&)       { return TypeKind::Union; },
        [](const EnumTypeDefinition&)        { return TypeKind::Enum; },
        [](const ScalarTypeDefinition&)      { return TypeKind::Scalar; },
    }, def);
}

inline const char* kindName(TypeKind kind) {
    switch (kind) {
        case TypeKind::Object:      return "type";
        case TypeKind::Interface:   return "interface";
        case TypeKind::InputObject: return "input";
        case TypeKind::Union:       return "union";
        case TypeKind::Enum:        return "enum";
        case TypeKind::Scalar:      return "scalar";
    }
    return "unknown";
}

inline const std::string& nameOf(const TypeDefinition& def) {
    return std::visit([](const auto& d) -> const std::string& { return d.name; }, def);
}

// ── Built-in scalars and reserved names ──
inline bool isBuiltinScalar(std::string_view name) {
    return name == "Int" || name == "Float" || name == "String" ||
           name == "Boolean" || name == "ID";
}

inline bool isIntrospectionName(std::string_view name) {
    return name.size() >= 2 && name[0] == '_' && name[1] == '_';
}

// ═══════════════════════════════════════════
//  Root operation types
// ═══════════════════════════════════════════
struct RootOperationTypes {
    std::string query = "Query";
    std::string mutation = "Mutation";
    std::string subscription = "Subscription";

    bool contains(std::string_view name) const {
        return !name.empty() && (name == query || name == mutation || name == subscription);
    }
};

// ═══════════════════════════════════════════
//  class SchemaModel
//  Type definitions in declaration order plus the root operation names.
// ═══════════════════════════════════════════
class SchemaModel {
public:
    // Children with no owner name are adopted by the added definition
    SchemaModel& add(TypeDefinition def) {
        std::visit(Overloaded{
            [](UnionTypeDefinition&) {},
            [](ScalarTypeDefinition&) {},
            [](EnumTypeDefinition& e) {
                for (auto& v : e.values) if (v.ownerName.empty()) v.ownerName = e.name;
            },
            [](auto& container) {
                for (auto& f : container.fields) if (f.ownerName.empty()) f.ownerName = container.name;
            },
        }, def);
        types_.push_back(std::move(def));
        return *this;
    }

    const std::vector<TypeDefinition>& types() const { return types_; }
    std::vector<TypeDefinition>& types() { return types_; }

    const RootOperationTypes& roots() const { return roots_; }
    RootOperationTypes& roots() { return roots_; }

    const TypeDefinition* find(std::string_view name) const {
        for (auto& t : types_) {
            if (nameOf(t) == name) return &t;
        }
        return nullptr;
    }

    // Root operation types and introspection types contribute no triples
    bool isExcluded(std::string_view name) const {
        return roots_.contains(name) || isIntrospectionName(name);
    }

    std::size_t size() const { return types_.size(); }
    bool empty() const { return types_.empty(); }

private:
    std::vector<TypeDefinition> types_;
    RootOperationTypes roots_;
};

} // namespace s2dm

#pragma once
// ═══════════════════════════════════════════════════════════════════
//  s2dm/schema_json.h — JSON form of the normalized schema model
// ═══════════════════════════════════════════════════════════════════
//
//  Lets an external parser hand over an already-normalized schema:
//
//    {
//      "roots": { "query": "Query", "mutation": "", "subscription": "" },
//      "types": [
//        { "kind": "OBJECT", "name": "Cabin", "description": "",
//          "fields": [ { "name": "doors",
//                        "type": { "name": "Door", "modifiers": ["LIST"] } } ] },
//        { "kind": "ENUM", "name": "CabinKindEnum",
//          "values": [ { "name": "SUV" }, { "name": "VAN" } ] }
//      ]
//    }
//
//  Modifiers are listed innermost to outermost. Kinds use the GraphQL
//  introspection names (OBJECT, INTERFACE, INPUT_OBJECT, UNION, ENUM,
//  SCALAR).
//
// ═══════════════════════════════════════════════════════════════════

#include "json_utils.h"
#include "schema.h"
#include <stdexcept>
#include <string>

namespace s2dm {

// Not NLOHMANN_JSON_SERIALIZE_ENUM: that maps unknown strings to the first
// enumerator, and a misspelled modifier must not silently become NON_NULL
inline void to_json(nlohmann::json& j, TypeModifier m) {
    j = m == TypeModifier::NonNull ? "NON_NULL" : "LIST";
}

inline void from_json(const nlohmann::json& j, TypeModifier& m) {
    auto s = j.get<std::string>();
    if (s == "NON_NULL") {
        m = TypeModifier::NonNull;
    } else if (s == "LIST") {
        m = TypeModifier::List;
    } else {
        throw std::invalid_argument("unknown type modifier '" + s + "'");
    }
}

S2DM_SERIALIZE(TypeRef, name, modifiers)
S2DM_SERIALIZE(FieldDefinition, name, ownerName, type, directives, description)
S2DM_SERIALIZE(EnumValueDefinition, name, ownerName, description)
S2DM_SERIALIZE(RootOperationTypes, query, mutation, subscription)

inline const char* introspectionKind(TypeKind kind) {
    switch (kind) {
        case TypeKind::Object:      return "OBJECT";
        case TypeKind::Interface:   return "INTERFACE";
        case TypeKind::InputObject: return "INPUT_OBJECT";
        case TypeKind::Union:       return "UNION";
        case TypeKind::Enum:        return "ENUM";
        case TypeKind::Scalar:      return "SCALAR";
    }
    return "SCALAR";
}

} // namespace s2dm

// std::variant is not found by ADL, so TypeDefinition gets a serializer
namespace nlohmann {

template <>
struct adl_serializer<s2dm::TypeDefinition> {
    static void to_json(json& j, const s2dm::TypeDefinition& def) {
        j = json{{"kind", s2dm::introspectionKind(s2dm::kindOf(def))},
                 {"name", s2dm::nameOf(def)}};
        std::visit(s2dm::Overloaded{
            [&](const s2dm::ObjectTypeDefinition& t) {
                j["description"] = t.description;
                j["fields"] = t.fields;
                j["interfaces"] = t.interfaces;
            },
            [&](const s2dm::InterfaceTypeDefinition& t) {
                j["description"] = t.description;
                j["fields"] = t.fields;
                j["interfaces"] = t.interfaces;
            },
            [&](const s2dm::InputObjectTypeDefinition& t) {
                j["description"] = t.description;
                j["fields"] = t.fields;
            },
            [&](const s2dm::UnionTypeDefinition& t) {
                j["description"] = t.description;
                j["members"] = t.members;
            },
            [&](const s2dm::EnumTypeDefinition& t) {
                j["description"] = t.description;
                j["values"] = t.values;
            },
            [&](const s2dm::ScalarTypeDefinition& t) {
                j["description"] = t.description;
            },
        }, def);
    }

    // Throws std::invalid_argument for an unknown kind, json errors otherwise
    static void from_json(const json& j, s2dm::TypeDefinition& def) {
        auto kind = j.at("kind").get<std::string>();
        auto name = j.at("name").get<std::string>();
        auto description = j.value("description", std::string());
        auto list = [&](const char* key) {
            return j.value(key, json::array());
        };

        if (kind == "OBJECT") {
            def = s2dm::ObjectTypeDefinition{name, description,
                list("fields").get<std::vector<s2dm::FieldDefinition>>(),
                list("interfaces").get<std::vector<std::string>>()};
        } else if (kind == "INTERFACE") {
            def = s2dm::InterfaceTypeDefinition{name, description,
                list("fields").get<std::vector<s2dm::FieldDefinition>>(),
                list("interfaces").get<std::vector<std::string>>()};
        } else if (kind == "INPUT_OBJECT") {
            def = s2dm::InputObjectTypeDefinition{name, description,
                list("fields").get<std::vector<s2dm::FieldDefinition>>()};
        } else if (kind == "UNION") {
            def = s2dm::UnionTypeDefinition{name, description,
                list("members").get<std::vector<std::string>>()};
        } else if (kind == "ENUM") {
            def = s2dm::EnumTypeDefinition{name, description,
                list("values").get<std::vector<s2dm::EnumValueDefinition>>()};
        } else if (kind == "SCALAR") {
            def = s2dm::ScalarTypeDefinition{name, description};
        } else {
            throw std::invalid_argument("unknown type kind '" + kind + "' for '" + name + "'");
        }
    }
};

} // namespace nlohmann

namespace s2dm {

inline void to_json(nlohmann::json& j, const SchemaModel& model) {
    j = nlohmann::json{{"roots", model.roots()}, {"types", model.types()}};
}

inline void from_json(const nlohmann::json& j, SchemaModel& model) {
    model = SchemaModel();
    if (j.contains("roots")) {
        model.roots() = j.at("roots").get<RootOperationTypes>();
    }
    for (auto& t : j.value("types", nlohmann::json::array())) {
        model.add(t.get<TypeDefinition>());
    }
}

} // namespace s2dm

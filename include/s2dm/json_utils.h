#pragma once
// ═══════════════════════════════════════════════════════════════════
//  s2dm/json_utils.h — JSON access for configuration and schema models
// ═══════════════════════════════════════════════════════════════════
//  Uses nlohmann/json. JsonValue gives lenient subscript access (missing
//  keys read as null) and typed getters with defaults; S2DM_SERIALIZE
//  makes plain model structs convertible without touching their headers.
// ═══════════════════════════════════════════════════════════════════

#include <nlohmann/json.hpp>
#include <concepts>
#include <string>

namespace s2dm {

// ─────────────────────────────────────────────
//  Macro: S2DM_SERIALIZE
//  Non-intrusive to_json/from_json for a struct; absent keys keep the
//  member's default. Must be expanded in the struct's namespace.
//
//  Usage:
//    S2DM_SERIALIZE(EnumValueDefinition, name, ownerName, description)
// ─────────────────────────────────────────────
#define S2DM_SERIALIZE(Type, ...) \
    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Type, __VA_ARGS__)

// ─────────────────────────────────────────────
//  Concept: JsonDeserializable
//  Any type T that nlohmann::json can convert to.
// ─────────────────────────────────────────────
template <typename T>
concept JsonDeserializable = requires(nlohmann::json j) {
    { j.get<T>() } -> std::same_as<T>;
};

// ─────────────────────────────────────────────
//  class JsonValue
//  Read-mostly wrapper around nlohmann::json.
// ─────────────────────────────────────────────
class JsonValue {
public:
    JsonValue() : data_(nlohmann::json::object()) {}
    JsonValue(const nlohmann::json& j) : data_(j) {}
    JsonValue(nlohmann::json&& j) : data_(std::move(j)) {}

    // Throws nlohmann::json::parse_error on malformed input
    static JsonValue parse(const std::string& text) {
        return JsonValue(nlohmann::json::parse(text));
    }

    // ── Subscript Access ──
    JsonValue operator[](const std::string& key) const {
        if (data_.is_object() && data_.contains(key)) {
            return JsonValue(data_[key]);
        }
        return JsonValue(nlohmann::json(nullptr));
    }

    JsonValue operator[](const char* key) const {
        return operator[](std::string(key));
    }

    // ── Typed Getters ──
    template <JsonDeserializable T>
    T get() const {
        return data_.get<T>();
    }

    // Missing or null keys yield the default; a present value of the
    // wrong type throws nlohmann::json::type_error.
    template <JsonDeserializable T>
    T get(const std::string& key, const T& defaultValue) const {
        if (!data_.is_object() || !data_.contains(key) || data_.at(key).is_null()) {
            return defaultValue;
        }
        return data_.at(key).get<T>();
    }

    // ── Inspection ──
    bool isNull() const { return data_.is_null(); }
    bool isObject() const { return data_.is_object(); }
    bool isArray() const { return data_.is_array(); }
    bool isString() const { return data_.is_string(); }
    bool isBool() const { return data_.is_boolean(); }
    bool has(const std::string& key) const { return data_.is_object() && data_.contains(key); }
    std::size_t size() const { return data_.size(); }

    // ── Serialization ──
    std::string dump(int indent = -1) const { return data_.dump(indent); }

    // ── Access underlying nlohmann::json ──
    const nlohmann::json& raw() const { return data_; }

    auto begin() const { return data_.begin(); }
    auto end() const { return data_.end(); }

private:
    nlohmann::json data_;
};

} // namespace s2dm

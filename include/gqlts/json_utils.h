#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlts/json_utils.h — JSON access helpers for raw configuration
// ═══════════════════════════════════════════════════════════════════
//  Thin layer over nlohmann/json. Raw generator configuration arrives
//  as a JSON object; JsonValue gives the resolver a forgiving,
//  null-propagating view over it.
// ═══════════════════════════════════════════════════════════════════

#include <nlohmann/json.hpp>
#include <string>
#include <utility>

namespace gqlts {

// ─────────────────────────────────────────────
//  Macro: GQLTS_SERIALIZE
//  Makes a struct serializable to/from JSON.
//
//  Usage:
//    struct Entry {
//        std::string name;
//        int order;
//        GQLTS_SERIALIZE(Entry, name, order)
//    };
// ─────────────────────────────────────────────
#define GQLTS_SERIALIZE(Type, ...) \
    NLOHMANN_DEFINE_TYPE_INTRUSIVE(Type, __VA_ARGS__)

// ─────────────────────────────────────────────
//  class JsonValue
//  Wraps nlohmann::json with an ergonomic API.
//  Missing keys read as null instead of throwing.
// ─────────────────────────────────────────────
class JsonValue {
public:
    JsonValue() : data_(nlohmann::json::object()) {}
    JsonValue(const nlohmann::json& j) : data_(j) {}
    JsonValue(nlohmann::json&& j) : data_(std::move(j)) {}

    // Construct from initializer list (e.g., {{"key", "value"}}); a list
    // of key/value pairs becomes an object, as with nlohmann::json.
    JsonValue(nlohmann::json::initializer_list_t init)
        : data_(nlohmann::json(init)) {}

    // ── Subscript Access ──
    JsonValue operator[](const std::string& key) const {
        if (data_.is_object() && data_.contains(key)) {
            return JsonValue(data_[key]);
        }
        return JsonValue(nlohmann::json(nullptr));
    }

    // Overload for string literals to avoid ambiguity with implicit numeric conversions
    JsonValue operator[](const char* key) const {
        return operator[](std::string(key));
    }

    // ── Typed Getter ──
    template <typename T>
    T get() const {
        return data_.get<T>();
    }

    // ── Inspection ──
    bool isNull() const { return data_.is_null(); }
    bool isObject() const { return data_.is_object(); }
    bool isString() const { return data_.is_string(); }
    bool isBool() const { return data_.is_boolean(); }

    // ── Serialization ──
    std::string dump(int indent = -1) const { return data_.dump(indent); }

    // ── Iteration over object members ──
    auto items() const { return data_.items(); }

private:
    nlohmann::json data_;
};

} // namespace gqlts

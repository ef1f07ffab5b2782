#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlts/wrappers.h — Wrapper Type Registry
// ═══════════════════════════════════════════════════════════════════
//
//  Owns the four generic aliases every rendered field may lean on:
//
//    Maybe<T>               nullable output value
//    InputMaybe<T>          nullable input value
//    FieldWrapper<T>        innermost value of an output field
//    EntireFieldWrapper<T>  whole output field type
//
//  Renderers call wrap(); after the walk, materialize() turns every
//  referenced alias into one declaration, dependencies first. Override
//  bodies are only checked at that point.
//
// ═══════════════════════════════════════════════════════════════════

#include "config.h"
#include "declaration.h"
#include "errors.h"
#include <array>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace gqlts {

enum class WrapperKind { Maybe, InputMaybe, FieldWrapper, EntireFieldWrapper };

class WrapperRegistry {
public:
    explicit WrapperRegistry(const RenderConfig& config);

    // "Alias<inner>"; marks the alias as referenced.
    std::string wrap(WrapperKind kind, const std::string& inner);

    bool isReferenced(WrapperKind kind) const;
    const std::string& body(WrapperKind kind) const;

    // Aliases named inside `kind`'s body, in materialization order.
    std::vector<WrapperKind> dependencies(WrapperKind kind) const;

    static std::string_view aliasName(WrapperKind kind);
    static std::string_view optionName(WrapperKind kind);
    static const std::array<WrapperKind, 4>& all();

    struct Materialized {
        std::vector<Declaration> declarations;   // dependency-ordered
        std::vector<ConfigurationError> errors;
        std::set<std::string> failed;           // alias names that could not be emitted
    };

    Materialized materialize() const;

private:
    struct Entry {
        std::string body;
        bool referenced = false;
    };

    std::array<Entry, 4> entries_;
    bool noExport_;

    static std::size_t slot(WrapperKind kind) { return static_cast<std::size_t>(kind); }
};

} // namespace gqlts

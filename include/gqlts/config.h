#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlts/config.h — Raw configuration → resolved RenderConfig
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    auto config = config::resolve(JsonValue({
//        {"avoidOptionals", {{"field", true}}},
//        {"enumsAsTypes", true},
//    }));
//
//  Shorthand shapes (bool-or-record, overlapping enum flags) are
//  settled here once; everything downstream reads plain fields.
//
// ═══════════════════════════════════════════════════════════════════

#include "json_utils.h"
#include <map>
#include <string>
#include <string_view>

namespace gqlts {

// ── Which declaration sites may carry the '?' marker ──
struct AvoidOptionals {
    bool field = false;         // output fields
    bool inputValue = false;    // input object fields
    bool object = false;        // field arguments
    bool defaultValue = false;  // input positions that declare a default value

    bool operator==(const AvoidOptionals&) const = default;
};

// ── Exactly one enum representation per run ──
enum class EnumMode {
    Enum,         // export enum E { ... }
    ConstEnum,    // export const enum E { ... }
    StringUnion,  // export type E = 'A' | 'B'
    ConstObject,  // export const E = { ... } as const + derived type
};

enum class TypeFilter { All, EnumsAndScalarsOnly, EnumsOnly };

std::string_view toString(EnumMode mode);
std::string_view toString(TypeFilter filter);

struct RenderConfig {
    AvoidOptionals avoidOptionals;
    EnumMode enumMode = EnumMode::Enum;
    bool numericEnums = false;  // only ever true in Enum / ConstEnum mode
    TypeFilter typeFilter = TypeFilter::All;

    bool futureProofEnums = false;
    bool futureProofUnions = false;
    bool immutableTypes = false;
    bool noExport = false;
    bool disableDescriptions = false;
    bool useImplementingTypes = false;
    bool wrapFieldDefinitions = false;
    bool wrapEntireFieldDefinitions = false;
    bool allowEnumStringTypes = false;
    bool skipTypename = false;
    bool nonOptionalTypename = false;

    std::string maybeValue = "T | null";
    std::string inputMaybeValue = "Maybe<T>";
    std::string fieldWrapperValue = "T";
    std::string entireFieldWrapperValue = "T | Promise<T> | (() => T | Promise<T>)";
    std::string defaultScalarType = "any";

    std::map<std::string, std::string> scalars;                            // scalar → TS type
    std::map<std::string, std::map<std::string, std::string>> enumValues;  // enum → member → literal
};

namespace config {

// Resolve a raw configuration object. Missing options take their
// defaults; an option of the wrong JSON type throws ConfigurationError.
RenderConfig resolve(const JsonValue& raw);

} // namespace config

} // namespace gqlts

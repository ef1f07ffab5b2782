// ═══════════════════════════════════════════════════════════════════
//  src/config.cpp — Config Resolver
// ═══════════════════════════════════════════════════════════════════

#include "gqlts/config.h"
#include "gqlts/console.h"
#include "gqlts/errors.h"

#include <set>

namespace gqlts {

std::string_view toString(EnumMode mode) {
    switch (mode) {
        case EnumMode::Enum:        return "enum";
        case EnumMode::ConstEnum:   return "constEnum";
        case EnumMode::StringUnion: return "stringUnion";
        case EnumMode::ConstObject: return "constObject";
    }
    return "unknown";
}

std::string_view toString(TypeFilter filter) {
    switch (filter) {
        case TypeFilter::All:                 return "all";
        case TypeFilter::EnumsAndScalarsOnly: return "enumsAndScalarsOnly";
        case TypeFilter::EnumsOnly:           return "enumsOnly";
    }
    return "unknown";
}

namespace config {

namespace {

const std::set<std::string>& knownOptions() {
    static const std::set<std::string> names = {
        "avoidOptionals", "constEnums", "enumsAsTypes", "numericEnums",
        "futureProofEnums", "futureProofUnions", "enumsAsConst", "onlyEnums",
        "onlyOperationTypes", "immutableTypes", "maybeValue", "inputMaybeValue",
        "noExport", "disableDescriptions", "useImplementingTypes",
        "wrapFieldDefinitions", "fieldWrapperValue", "wrapEntireFieldDefinitions",
        "entireFieldWrapperValue", "allowEnumStringTypes", "skipTypename",
        "nonOptionalTypename", "scalars", "defaultScalarType", "enumValues",
    };
    return names;
}

bool readBool(const JsonValue& raw, const std::string& option) {
    auto value = raw[option];
    if (value.isNull()) return false;
    if (!value.isBool()) {
        throw ConfigurationError(option, value.dump(), "expected a boolean");
    }
    return value.get<bool>();
}

void readString(const JsonValue& raw, const std::string& option, std::string& target) {
    auto value = raw[option];
    if (value.isNull()) return;
    if (!value.isString()) {
        throw ConfigurationError(option, value.dump(), "expected a string");
    }
    target = value.get<std::string>();
}

AvoidOptionals readAvoidOptionals(const JsonValue& raw) {
    auto value = raw["avoidOptionals"];
    AvoidOptionals result;
    if (value.isNull()) return result;

    if (value.isBool()) {
        bool all = value.get<bool>();
        return {all, all, all, all};
    }
    if (!value.isObject()) {
        throw ConfigurationError("avoidOptionals", value.dump(), "expected a boolean or an object");
    }

    auto category = [&](const char* key, bool& target) {
        auto entry = value[key];
        if (entry.isNull()) return;
        if (!entry.isBool()) {
            throw ConfigurationError(std::string("avoidOptionals.") + key, entry.dump(),
                                     "expected a boolean");
        }
        target = entry.get<bool>();
    };
    category("field", result.field);
    category("inputValue", result.inputValue);
    category("object", result.object);
    category("defaultValue", result.defaultValue);
    return result;
}

std::map<std::string, std::string> readScalars(const JsonValue& raw) {
    std::map<std::string, std::string> result;
    auto value = raw["scalars"];
    if (value.isNull()) return result;
    if (!value.isObject()) {
        throw ConfigurationError("scalars", value.dump(), "expected an object");
    }
    for (auto& [name, type] : value.items()) {
        if (!type.is_string()) {
            throw ConfigurationError("scalars." + name, type.dump(), "expected a string");
        }
        result[name] = type.get<std::string>();
    }
    return result;
}

std::map<std::string, std::map<std::string, std::string>> readEnumValues(const JsonValue& raw) {
    std::map<std::string, std::map<std::string, std::string>> result;
    auto value = raw["enumValues"];
    if (value.isNull()) return result;
    if (!value.isObject()) {
        throw ConfigurationError("enumValues", value.dump(), "expected an object");
    }
    for (auto& [enumName, members] : value.items()) {
        if (!members.is_object()) {
            throw ConfigurationError("enumValues." + enumName, members.dump(), "expected an object");
        }
        for (auto& [member, literal] : members.items()) {
            if (!literal.is_string()) {
                throw ConfigurationError("enumValues." + enumName + "." + member, literal.dump(),
                                         "expected a string");
            }
            result[enumName][member] = literal.get<std::string>();
        }
    }
    return result;
}

} // namespace

RenderConfig resolve(const JsonValue& raw) {
    RenderConfig config;
    if (raw.isNull()) return config;
    if (!raw.isObject()) {
        throw ConfigurationError("config", raw.dump(), "expected an object");
    }

    for (auto& [key, value] : raw.items()) {
        if (!knownOptions().count(key)) {
            console::debug("ignoring unrecognized option", key);
        }
    }

    config.avoidOptionals = readAvoidOptionals(raw);

    // ── Enum representation: enumsAsTypes > enumsAsConst > constEnums > enum ──
    bool enumsAsTypes = readBool(raw, "enumsAsTypes");
    bool enumsAsConst = readBool(raw, "enumsAsConst");
    bool constEnums = readBool(raw, "constEnums");
    bool numericEnums = readBool(raw, "numericEnums");
    if (enumsAsTypes) {
        config.enumMode = EnumMode::StringUnion;
    } else if (enumsAsConst) {
        config.enumMode = EnumMode::ConstObject;
    } else if (constEnums) {
        config.enumMode = EnumMode::ConstEnum;
    } else {
        config.enumMode = EnumMode::Enum;
    }
    config.numericEnums = numericEnums &&
        (config.enumMode == EnumMode::Enum || config.enumMode == EnumMode::ConstEnum);

    // ── Output filter: the narrower onlyEnums wins ──
    bool onlyEnums = readBool(raw, "onlyEnums");
    bool onlyOperationTypes = readBool(raw, "onlyOperationTypes");
    if (onlyEnums) {
        config.typeFilter = TypeFilter::EnumsOnly;
    } else if (onlyOperationTypes) {
        config.typeFilter = TypeFilter::EnumsAndScalarsOnly;
    }

    config.futureProofEnums = readBool(raw, "futureProofEnums");
    config.futureProofUnions = readBool(raw, "futureProofUnions");
    config.immutableTypes = readBool(raw, "immutableTypes");
    config.noExport = readBool(raw, "noExport");
    config.disableDescriptions = readBool(raw, "disableDescriptions");
    config.useImplementingTypes = readBool(raw, "useImplementingTypes");
    config.wrapFieldDefinitions = readBool(raw, "wrapFieldDefinitions");
    config.wrapEntireFieldDefinitions = readBool(raw, "wrapEntireFieldDefinitions");
    config.allowEnumStringTypes = readBool(raw, "allowEnumStringTypes");
    config.skipTypename = readBool(raw, "skipTypename");
    config.nonOptionalTypename = readBool(raw, "nonOptionalTypename");

    // Overrides are validated later, and only if the alias is used.
    readString(raw, "maybeValue", config.maybeValue);
    readString(raw, "inputMaybeValue", config.inputMaybeValue);
    readString(raw, "fieldWrapperValue", config.fieldWrapperValue);
    readString(raw, "entireFieldWrapperValue", config.entireFieldWrapperValue);
    readString(raw, "defaultScalarType", config.defaultScalarType);

    config.scalars = readScalars(raw);
    config.enumValues = readEnumValues(raw);
    return config;
}

} // namespace config

} // namespace gqlts

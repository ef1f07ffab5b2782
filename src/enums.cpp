// ═══════════════════════════════════════════════════════════════════
//  src/enums.cpp — Enum Renderer
// ═══════════════════════════════════════════════════════════════════
//
//  Enum / ConstEnum    export enum Color { RED = 'RED', ... }
//  StringUnion         export type Color = 'RED' | 'GREEN';
//  ConstObject         export const Color = { RED: 'RED' } as const;
//                      export type Color = typeof Color[keyof typeof Color];
//
// ═══════════════════════════════════════════════════════════════════

#include "gqlts/enums.h"

#include <stdexcept>

namespace gqlts {

std::string EnumRenderer::outputName(const SchemaTypeDef& type) const {
    return type.name;
}

std::string EnumRenderer::referenceType(const SchemaTypeDef& type) const {
    auto name = outputName(type);
    if (config_.allowEnumStringTypes && config_.enumMode == EnumMode::Enum && !config_.numericEnums) {
        return name + " | `${" + name + "}`";
    }
    return name;
}

std::string EnumRenderer::memberValue(const SchemaTypeDef& type, const EnumValueDef& value) const {
    auto perEnum = config_.enumValues.find(type.name);
    if (perEnum != config_.enumValues.end()) {
        auto literal = perEnum->second.find(value.name);
        if (literal != perEnum->second.end()) return literal->second;
    }
    return value.value.empty() ? value.name : value.value;
}

std::string EnumRenderer::sentinelName(const SchemaTypeDef& type) const {
    std::vector<std::string> taken;
    for (auto& value : type.values) {
        taken.push_back(value.name);
        taken.push_back(memberValue(type, value));
    }
    return text::uniqueName(text::FutureAddedValue, taken);
}

std::string EnumRenderer::valueComment(const EnumValueDef& value) const {
    if (config_.disableDescriptions) return "";
    return text::comment(value.description, 2);
}

Declaration EnumRenderer::render(const SchemaTypeDef& type) const {
    if (type.kind != TypeKind::Enum) {
        throw std::invalid_argument("EnumRenderer::render on " + std::string(toString(type.kind)) +
                                    " type '" + type.name + "'");
    }

    Declaration decl;
    decl.name = outputName(type);
    decl.kind = DeclarationKind::Enum;
    if (!config_.disableDescriptions) decl.body = text::comment(type.description);

    switch (config_.enumMode) {
        case EnumMode::Enum:
        case EnumMode::ConstEnum:
            decl.body += renderEnum(type);
            break;
        case EnumMode::StringUnion:
            decl.body += renderStringUnion(type);
            break;
        case EnumMode::ConstObject:
            decl.body += renderConstObject(type);
            break;
    }
    return decl;
}

std::string EnumRenderer::renderEnum(const SchemaTypeDef& type) const {
    std::string out = text::exportPrefix(config_.noExport);
    if (config_.enumMode == EnumMode::ConstEnum) out += "const ";
    out += "enum " + outputName(type) + " {\n";

    std::size_t index = 0;
    auto member = [&](const std::string& key, const std::string& literal) {
        out += "  " + key + " = ";
        out += config_.numericEnums ? std::to_string(index) : text::quote(literal);
        out += ",\n";
        index++;
    };

    for (auto& value : type.values) {
        out += valueComment(value);
        member(value.name, memberValue(type, value));
    }
    if (config_.futureProofEnums) {
        auto sentinel = sentinelName(type);
        member(sentinel, sentinel);
    }

    out += "}";
    return out;
}

std::string EnumRenderer::renderStringUnion(const SchemaTypeDef& type) const {
    std::vector<std::string> arms;
    for (auto& value : type.values) arms.push_back(text::quote(memberValue(type, value)));
    if (config_.futureProofEnums) arms.push_back(text::quote(sentinelName(type)));

    std::string out = text::exportPrefix(config_.noExport) + "type " + outputName(type) + " =";
    if (arms.empty()) return out + " never;";
    for (std::size_t i = 0; i < arms.size(); ++i) {
        out += i == 0 ? " " : " | ";
        out += arms[i];
    }
    return out + ";";
}

std::string EnumRenderer::renderConstObject(const SchemaTypeDef& type) const {
    auto name = outputName(type);
    auto exported = text::exportPrefix(config_.noExport);

    std::string out = exported + "const " + name + " = {\n";
    for (auto& value : type.values) {
        out += valueComment(value);
        out += "  " + value.name + ": " + text::quote(memberValue(type, value)) + ",\n";
    }
    if (config_.futureProofEnums) {
        auto sentinel = sentinelName(type);
        out += "  " + sentinel + ": " + text::quote(sentinel) + ",\n";
    }
    out += "} as const;\n\n";
    out += exported + "type " + name + " = typeof " + name + "[keyof typeof " + name + "];";
    return out;
}

} // namespace gqlts

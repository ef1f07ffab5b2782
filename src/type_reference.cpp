// ═══════════════════════════════════════════════════════════════════
//  src/type_reference.cpp — Type Reference Renderer
// ═══════════════════════════════════════════════════════════════════

#include "gqlts/type_reference.h"
#include "gqlts/errors.h"

#include <functional>

namespace gqlts {

TypeReferenceRenderer::TypeReferenceRenderer(const Schema& schema, const RenderConfig& config,
                                             WrapperRegistry& wrappers, const EnumRenderer& enums)
    : schema_(schema), config_(config), wrappers_(wrappers), enums_(enums) {}

std::string TypeReferenceRenderer::wrapWith(WrapperKind kind, const std::string& inner,
                                            std::set<std::string>& used) {
    used.insert(std::string(WrapperRegistry::aliasName(kind)));
    return wrappers_.wrap(kind, inner);
}

std::string TypeReferenceRenderer::leafType(const std::string& name,
                                            const std::string& referencedFrom) const {
    auto* type = schema_.find(name);
    if (!type) {
        if (Schema::isBuiltInScalar(name)) return "Scalars['" + name + "']";
        throw UnresolvedReferenceError(name, referencedFrom);
    }

    switch (type->kind) {
        case TypeKind::Scalar:
            return "Scalars['" + name + "']";
        case TypeKind::Enum:
            return enums_.referenceType(*type);
        case TypeKind::Interface: {
            if (!config_.useImplementingTypes) return name;
            auto implementations = schema_.implementationsOf(name);
            if (implementations.empty()) return name;

            std::vector<std::string> members;
            for (auto* impl : implementations) members.push_back(impl->name);
            std::string out;
            for (auto& member : members) {
                if (!out.empty()) out += " | ";
                out += member;
            }
            if (config_.futureProofUnions) out += " | " + text::futureProofArm(members);
            return out;
        }
        case TypeKind::Object:
        case TypeKind::Union:
        case TypeKind::InputObject:
            return name;
    }
    return name;
}

std::string TypeReferenceRenderer::renderType(const TypeReference& ref, FieldRole role,
                                              std::set<std::string>& used,
                                              const std::string& referencedFrom) {
    bool output = role == FieldRole::Output;
    auto maybe = output ? WrapperKind::Maybe : WrapperKind::InputMaybe;

    std::function<std::string(const TypeReference&)> render = [&](const TypeReference& level) {
        std::string inner;
        if (level.kind == TypeReference::Kind::Named) {
            inner = leafType(level.name, referencedFrom);
            if (output && config_.wrapFieldDefinitions) {
                inner = wrapWith(WrapperKind::FieldWrapper, inner, used);
            }
        } else {
            inner = (config_.immutableTypes ? "ReadonlyArray<" : "Array<") +
                    render(*level.ofType) + ">";
        }
        return level.nullable ? wrapWith(maybe, inner, used) : inner;
    };

    auto result = render(ref);
    if (output && config_.wrapEntireFieldDefinitions) {
        result = wrapWith(WrapperKind::EntireFieldWrapper, result, used);
    }
    return result;
}

bool TypeReferenceRenderer::isOptional(const FieldDef& field) const {
    auto& avoid = config_.avoidOptionals;
    bool avoidCategory = false;
    switch (field.role) {
        case FieldRole::Output:     avoidCategory = avoid.field; break;
        case FieldRole::InputField: avoidCategory = avoid.inputValue; break;
        case FieldRole::Argument:   avoidCategory = avoid.object; break;
    }

    if (field.type.nullable && !avoidCategory) return true;
    return field.isInputPosition() && field.defaultValue.has_value() && !avoid.defaultValue;
}

std::string TypeReferenceRenderer::renderMember(const FieldDef& field, std::set<std::string>& used,
                                                const std::string& owner) {
    auto type = renderType(field.type, field.role, used, owner + "." + field.name);

    std::string out;
    if (!config_.disableDescriptions) out += text::comment(field.description, 2);
    out += "  ";
    if (config_.immutableTypes) out += "readonly ";
    out += field.name;
    if (isOptional(field)) out += "?";
    out += ": " + type + ";\n";
    return out;
}

} // namespace gqlts

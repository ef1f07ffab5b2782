// ═══════════════════════════════════════════════════════════════════
//  src/emitter.cpp — Declaration Emitter
// ═══════════════════════════════════════════════════════════════════

#include "gqlts/emitter.h"
#include "gqlts/console.h"
#include "gqlts/enums.h"
#include "gqlts/type_reference.h"
#include "gqlts/wrappers.h"

#include <cctype>
#include <map>

namespace gqlts {

namespace {

const std::map<std::string, std::string>& builtInScalarTypes() {
    static const std::map<std::string, std::string> types = {
        {"ID", "string"},
        {"String", "string"},
        {"Boolean", "boolean"},
        {"Int", "number"},
        {"Float", "number"},
    };
    return types;
}

std::string capitalize(std::string name) {
    if (!name.empty()) {
        name[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(name[0])));
    }
    return name;
}

// ═══════════════════════════════════════════
//  DeclarationBuilder
//  Per-run state: the registry and the renderers sharing it.
// ═══════════════════════════════════════════
class DeclarationBuilder {
public:
    DeclarationBuilder(const Schema& schema, const RenderConfig& config)
        : schema_(schema),
          config_(config),
          wrappers_(config),
          enums_(config),
          types_(schema, config, wrappers_, enums_) {}

    WrapperRegistry& wrappers() { return wrappers_; }

    void build(TypeKind kind, std::vector<Declaration>& out) {
        if (kind == TypeKind::Scalar) {
            out.push_back(scalars());
            return;
        }

        for (auto* type : schema_.ofKind(kind)) {
            switch (kind) {
                case TypeKind::Enum:
                    out.push_back(enums_.render(*type));
                    break;
                case TypeKind::InputObject:
                    out.push_back(fieldContainer(*type, DeclarationKind::InputObject, false));
                    break;
                case TypeKind::Object:
                    out.push_back(fieldContainer(*type, DeclarationKind::Object, !config_.skipTypename));
                    arguments(*type, out);
                    break;
                case TypeKind::Interface:
                    out.push_back(fieldContainer(*type, DeclarationKind::Interface, false));
                    arguments(*type, out);
                    break;
                case TypeKind::Union:
                    out.push_back(unionType(*type));
                    break;
                case TypeKind::Scalar:
                    break;
            }
        }
    }

private:
    const Schema& schema_;
    const RenderConfig& config_;
    WrapperRegistry wrappers_;
    EnumRenderer enums_;
    TypeReferenceRenderer types_;

    std::string heading(const std::string& description) const {
        return config_.disableDescriptions ? "" : text::comment(description);
    }

    // ── export type Scalars = { ID: string; ... }; ──
    Declaration scalars() const {
        std::vector<std::pair<std::string, std::string>> entries;  // name, description
        for (auto& name : Schema::builtInScalars()) {
            auto* def = schema_.find(name);
            entries.emplace_back(name, def ? def->description : "");
        }
        for (auto* def : schema_.ofKind(TypeKind::Scalar)) {
            if (!Schema::isBuiltInScalar(def->name)) entries.emplace_back(def->name, def->description);
        }

        Declaration decl;
        decl.name = "Scalars";
        decl.kind = DeclarationKind::Scalars;
        decl.body = heading("All built-in and custom scalars, mapped to their actual values");
        decl.body += text::exportPrefix(config_.noExport) + "type Scalars = {\n";
        for (auto& [name, description] : entries) {
            std::string mapped = config_.defaultScalarType;
            if (auto it = config_.scalars.find(name); it != config_.scalars.end()) {
                mapped = it->second;
            } else if (auto builtIn = builtInScalarTypes().find(name); builtIn != builtInScalarTypes().end()) {
                mapped = builtIn->second;
            }
            if (!config_.disableDescriptions) decl.body += text::comment(description, 2);
            decl.body += "  " + name + ": " + mapped + ";\n";
        }
        decl.body += "};";
        return decl;
    }

    // Objects, interfaces and input objects: one member per field.
    Declaration fieldContainer(const SchemaTypeDef& type, DeclarationKind kind, bool typename_) {
        Declaration decl;
        decl.name = type.name;
        decl.kind = kind;
        decl.body = heading(type.description);
        decl.body += text::exportPrefix(config_.noExport) + "type " + type.name + " = {\n";

        if (typename_) {
            decl.body += "  ";
            if (config_.immutableTypes) decl.body += "readonly ";
            decl.body += config_.nonOptionalTypename ? "__typename: " : "__typename?: ";
            decl.body += text::quote(type.name) + ";\n";
        }
        for (auto& field : type.fields) {
            decl.body += types_.renderMember(field, decl.wrappers, type.name);
        }

        decl.body += "};";
        return decl;
    }

    // ── export type UserFriendsArgs = { ... }; one per field with arguments ──
    void arguments(const SchemaTypeDef& type, std::vector<Declaration>& out) {
        for (auto& field : type.fields) {
            if (field.arguments.empty()) continue;

            Declaration decl;
            decl.name = type.name + capitalize(field.name) + "Args";
            decl.kind = DeclarationKind::Arguments;
            decl.body = text::exportPrefix(config_.noExport) + "type " + decl.name + " = {\n";
            for (auto& arg : field.arguments) {
                decl.body += types_.renderMember(arg, decl.wrappers, type.name + "." + field.name);
            }
            decl.body += "};";
            out.push_back(std::move(decl));
        }
    }

    Declaration unionType(const SchemaTypeDef& type) const {
        for (auto& member : type.members) {
            if (!schema_.find(member)) throw UnresolvedReferenceError(member, type.name);
        }

        std::vector<std::string> arms = type.members;
        if (config_.futureProofUnions) arms.push_back(text::futureProofArm(type.members));

        Declaration decl;
        decl.name = type.name;
        decl.kind = DeclarationKind::Union;
        decl.body = heading(type.description);
        decl.body += text::exportPrefix(config_.noExport) + "type " + type.name + " =";
        if (arms.empty()) decl.body += " never";
        for (std::size_t i = 0; i < arms.size(); ++i) {
            decl.body += i == 0 ? " " : " | ";
            decl.body += arms[i];
        }
        decl.body += ";";
        return decl;
    }
};

} // namespace

// ═══════════════════════════════════════════
//  EmitResult
// ═══════════════════════════════════════════

std::string EmitResult::source() const {
    std::string out;
    bool inAliases = true;
    for (auto& decl : declarations) {
        bool alias = decl.kind == DeclarationKind::Alias;
        if (!out.empty()) {
            out += (alias && inAliases) ? "\n" : "\n\n";
        }
        inAliases = inAliases && alias;
        out += decl.body;
    }
    if (!out.empty()) out += "\n";
    return out;
}

nlohmann::json EmitResult::toJson() const {
    nlohmann::json errorList = nlohmann::json::array();
    for (auto& e : errors) {
        errorList.push_back({
            {"option", e.option()},
            {"value", e.value()},
            {"message", e.what()},
        });
    }
    return {
        {"declarations", declarations},
        {"errors", errorList},
    };
}

// ═══════════════════════════════════════════
//  Emitter
// ═══════════════════════════════════════════

Emitter::Emitter(const Schema& schema, RenderConfig config)
    : schema_(schema), config_(std::move(config)) {}

const std::vector<TypeKind>& Emitter::categoryOrder() {
    static const std::vector<TypeKind> order = {
        TypeKind::Scalar, TypeKind::Enum, TypeKind::InputObject,
        TypeKind::Object, TypeKind::Interface, TypeKind::Union,
    };
    return order;
}

bool Emitter::permits(TypeKind kind) const {
    switch (config_.typeFilter) {
        case TypeFilter::All:
            return true;
        case TypeFilter::EnumsAndScalarsOnly:
            return kind == TypeKind::Enum || kind == TypeKind::Scalar;
        case TypeFilter::EnumsOnly:
            return kind == TypeKind::Enum;
    }
    return true;
}

EmitResult Emitter::emit() const {
    DeclarationBuilder builder(schema_, config_);

    std::vector<Declaration> typeDeclarations;
    for (auto kind : categoryOrder()) {
        if (permits(kind)) builder.build(kind, typeDeclarations);
    }

    auto aliases = builder.wrappers().materialize();

    EmitResult result;
    result.declarations = std::move(aliases.declarations);
    result.errors = std::move(aliases.errors);

    std::size_t dropped = 0;
    for (auto& decl : typeDeclarations) {
        bool broken = false;
        for (auto& name : decl.wrappers) {
            if (aliases.failed.count(name)) broken = true;
        }
        if (broken) {
            console::debug("skipping", decl.name, "- it references a rejected alias");
            dropped++;
            continue;
        }
        result.declarations.push_back(std::move(decl));
    }

    for (auto& e : result.errors) console::warn(e.what());
    console::debug("emitted", result.declarations.size(), "declarations,", dropped, "skipped,",
                   result.errors.size(), "configuration error(s)");
    return result;
}

std::string generate(const Schema& schema, const JsonValue& rawConfig) {
    Emitter emitter(schema, config::resolve(rawConfig));
    auto result = emitter.emit();
    if (!result.ok()) throw ConfigurationErrors(result.errors);
    return result.source();
}

} // namespace gqlts

#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlts/type_reference.h — Type Reference Renderer
// ═══════════════════════════════════════════════════════════════════
//
//  Renders one field's GraphQL type into TypeScript, innermost first:
//
//    leaf              Scalars['String'] | Color | User | A | B
//    FieldWrapper      FieldWrapper<leaf>            (output, opt-in)
//    list levels       Array<...> / ReadonlyArray<...>
//    nullable levels   Maybe<...> / InputMaybe<...>
//    EntireFieldWrapper<...>                         (output, opt-in)
//
//  The declaration-site '?' is decided separately by isOptional().
//
// ═══════════════════════════════════════════════════════════════════

#include "config.h"
#include "enums.h"
#include "schema.h"
#include "wrappers.h"
#include <set>
#include <string>

namespace gqlts {

class TypeReferenceRenderer {
public:
    TypeReferenceRenderer(const Schema& schema, const RenderConfig& config,
                          WrapperRegistry& wrappers, const EnumRenderer& enums);

    // Full type text for `ref` in a position of `role`. Alias names used
    // are added to `used`; `referencedFrom` names the field for errors.
    // Throws UnresolvedReferenceError for an unknown leaf type.
    std::string renderType(const TypeReference& ref, FieldRole role,
                           std::set<std::string>& used, const std::string& referencedFrom);

    // Whether the member carries '?', per its role's avoidOptionals category.
    bool isOptional(const FieldDef& field) const;

    // "  readonly name?: Type;\n", preceded by the field description.
    std::string renderMember(const FieldDef& field, std::set<std::string>& used,
                             const std::string& owner);

private:
    const Schema& schema_;
    const RenderConfig& config_;
    WrapperRegistry& wrappers_;
    const EnumRenderer& enums_;

    std::string leafType(const std::string& name, const std::string& referencedFrom) const;
    std::string wrapWith(WrapperKind kind, const std::string& inner, std::set<std::string>& used);
};

} // namespace gqlts

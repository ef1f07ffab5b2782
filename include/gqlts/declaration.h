#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlts/declaration.h — Output units and text helpers
// ═══════════════════════════════════════════════════════════════════

#include "json_utils.h"
#include <set>
#include <string>
#include <vector>

namespace gqlts {

enum class DeclarationKind { Alias, Scalars, Enum, InputObject, Object, Arguments, Interface, Union };

NLOHMANN_JSON_SERIALIZE_ENUM(DeclarationKind, {
    {DeclarationKind::Alias, "alias"},
    {DeclarationKind::Scalars, "scalars"},
    {DeclarationKind::Enum, "enum"},
    {DeclarationKind::InputObject, "inputObject"},
    {DeclarationKind::Object, "object"},
    {DeclarationKind::Arguments, "arguments"},
    {DeclarationKind::Interface, "interface"},
    {DeclarationKind::Union, "union"},
})

// ── One top-level declaration; never mutated once built ──
struct Declaration {
    std::string name;
    DeclarationKind kind = DeclarationKind::Object;
    std::string body;                // complete text: comment, export, declaration
    std::set<std::string> wrappers;  // alias names the body references

    GQLTS_SERIALIZE(Declaration, name, kind, body, wrappers)
};

namespace text {

// Name of the catch-all enum member / union arm.
inline constexpr const char* FutureAddedValue = "FUTURE_ADDED_VALUE";

// `base`, or `base` + 1, 2, ... for the first candidate not in `taken`.
std::string uniqueName(const std::string& base, const std::vector<std::string>& taken);

// Catch-all union arm: { __typename?: 'FUTURE_ADDED_VALUE' }, disambiguated
// against the union's member names.
std::string futureProofArm(const std::vector<std::string>& members);

// Doc comment for `description`, indented by `indent` spaces; empty if no description.
std::string comment(const std::string& description, int indent = 0);

// Single-quoted TypeScript string literal.
std::string quote(const std::string& value);

// "export " unless noExport.
inline std::string exportPrefix(bool noExport) { return noExport ? "" : "export "; }

} // namespace text

} // namespace gqlts

#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlts/enums.h — Enum Renderer
// ═══════════════════════════════════════════════════════════════════

#include "config.h"
#include "declaration.h"
#include "schema.h"
#include <string>
#include <vector>

namespace gqlts {

class EnumRenderer {
public:
    explicit EnumRenderer(const RenderConfig& config) : config_(config) {}

    // One declaration in the resolved EnumMode.
    Declaration render(const SchemaTypeDef& type) const;

    // Name fields use to refer to the enum.
    std::string outputName(const SchemaTypeDef& type) const;

    // Type text for a field of this enum type (adds the template-literal
    // string form under allowEnumStringTypes).
    std::string referenceType(const SchemaTypeDef& type) const;

    // Literal emitted for one member, after enumValues overrides.
    std::string memberValue(const SchemaTypeDef& type, const EnumValueDef& value) const;

    // FUTURE_ADDED_VALUE, disambiguated against member names and values.
    std::string sentinelName(const SchemaTypeDef& type) const;

private:
    const RenderConfig& config_;

    std::string renderEnum(const SchemaTypeDef& type) const;
    std::string renderStringUnion(const SchemaTypeDef& type) const;
    std::string renderConstObject(const SchemaTypeDef& type) const;
    std::string valueComment(const EnumValueDef& value) const;
};

} // namespace gqlts

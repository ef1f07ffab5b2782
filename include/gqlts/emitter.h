#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlts/emitter.h — Declaration Emitter
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    auto config = config::resolve(JsonValue({{"enumsAsTypes", true}}));
//    Emitter emitter(schema, config);
//    auto result = emitter.emit();
//    if (result.ok()) std::cout << result.source();
//
//  Or in one step, throwing ConfigurationErrors on any collected error:
//    std::string ts = generate(schema, {{"avoidOptionals", true}});
//
// ═══════════════════════════════════════════════════════════════════

#include "config.h"
#include "declaration.h"
#include "errors.h"
#include "json_utils.h"
#include "schema.h"
#include <string>
#include <vector>

namespace gqlts {

struct EmitResult {
    std::vector<Declaration> declarations;   // aliases first, then category order
    std::vector<ConfigurationError> errors;  // declarations hit by these are absent

    bool ok() const { return errors.empty(); }

    // Aliases one per line, a blank line, then the remaining
    // declarations separated by blank lines.
    std::string source() const;

    // Manifest: { "declarations": [...], "errors": [...] }
    nlohmann::json toJson() const;
};

class Emitter {
public:
    Emitter(const Schema& schema, RenderConfig config);

    // Throws UnresolvedReferenceError; ConfigurationErrors from alias
    // overrides are collected into the result instead.
    EmitResult emit() const;

    const RenderConfig& config() const { return config_; }

    // Walk order of the type categories.
    static const std::vector<TypeKind>& categoryOrder();

private:
    const Schema& schema_;
    RenderConfig config_;

    bool permits(TypeKind kind) const;
};

// Resolve `rawConfig`, emit, and return the source text. Throws
// ConfigurationErrors if any ConfigurationError was collected.
std::string generate(const Schema& schema, const JsonValue& rawConfig = JsonValue());

} // namespace gqlts

#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlts/type_expression.h — TypeScript type-expression recognizer
// ═══════════════════════════════════════════════════════════════════
//
//  Used to vet user-supplied alias bodies (maybeValue and friends)
//  before they are written out:
//
//    checkTypeExpression("T | null")            → std::nullopt
//    checkTypeExpression("T | | null")          → "expected a type at ..."
//
//  Recognition only; nothing is evaluated or resolved.
//
// ═══════════════════════════════════════════════════════════════════

#include <optional>
#include <string>

namespace gqlts {

// std::nullopt when `source` parses as a type expression, otherwise a
// message describing the first problem and its offset.
std::optional<std::string> checkTypeExpression(const std::string& source);

} // namespace gqlts

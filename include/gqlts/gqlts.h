#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlts/gqlts.h — Umbrella header for the gqlts type generator
// ═══════════════════════════════════════════════════════════════════
//
//  #include "gqlts/gqlts.h"
//  using namespace gqlts;
//
//  This single include gives you:
//    • SchemaBuilder, Schema, TypeReference
//    • config::resolve(), RenderConfig
//    • Emitter, EmitResult, generate()
//    • ConfigurationError(s), UnresolvedReferenceError
//    • console::debug(), info(), warn(), error()
//    • JsonValue, GQLTS_SERIALIZE
//
// ═══════════════════════════════════════════════════════════════════

// Core
#include "json_utils.h"
#include "console.h"
#include "errors.h"

// Schema model
#include "schema.h"

// Rendering
#include "config.h"
#include "declaration.h"
#include "type_expression.h"
#include "wrappers.h"
#include "enums.h"
#include "type_reference.h"
#include "emitter.h"

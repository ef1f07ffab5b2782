// ═══════════════════════════════════════════════════════════════════
//  generate_types.cpp — Render a sample schema to TypeScript
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    generate_types                    default configuration
//    generate_types config.json        options from a JSON file
//    generate_types config.json --json declaration manifest instead
//
//  This example demonstrates:
//    • Building a type graph with SchemaBuilder
//    • Resolving raw JSON configuration
//    • Handling collected and fatal generation errors
//
// ═══════════════════════════════════════════════════════════════════

#include "gqlts/gqlts.h"

#include <fstream>
#include <iostream>
#include <string>

using namespace gqlts;

static Schema sampleSchema() {
    return SchemaBuilder()
        .scalar("DateTime", "ISO-8601 timestamp")
        .enumType("Role", {"ADMIN", "EDITOR", "VIEWER"}, "Access level of a user")
        .inputType("UserFilter")
            .field("role", "Role")
            .field("search", "String")
            .field("limit", "Int!").defaultValue("20")
        .interfaceType("Node")
            .field("id", "ID!")
        .objectType("User", {"Node"}, "A registered account")
            .field("id", "ID!")
            .field("name", "String", "Display name")
            .field("role", "Role!")
            .field("createdAt", "DateTime!")
            .field("friends", "[User!]!")
                .argument("first", "Int", "10")
        .objectType("Post", {"Node"})
            .field("id", "ID!")
            .field("title", "String!")
            .field("author", "User")
        .objectType("Query")
            .field("node", "Node")
                .argument("id", "ID!")
            .field("users", "[User]")
                .argument("filter", "UserFilter")
            .field("search", "[SearchResult!]!")
                .argument("term", "String!")
        .unionType("SearchResult", {"User", "Post"})
        .build();
}

int main(int argc, char** argv) {
    JsonValue rawConfig;
    bool manifest = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--json") {
            manifest = true;
            continue;
        }
        std::ifstream in(arg);
        if (!in) {
            console::error("cannot open config file", arg);
            return 2;
        }
        try {
            rawConfig = JsonValue(nlohmann::json::parse(in));
        } catch (const nlohmann::json::parse_error& e) {
            console::error("invalid JSON in", arg + ":", e.what());
            return 2;
        }
    }

    try {
        auto schema = sampleSchema();
        Emitter emitter(schema, config::resolve(rawConfig));
        auto result = emitter.emit();

        if (manifest) {
            std::cout << result.toJson().dump(2) << std::endl;
        } else {
            std::cout << result.source();
        }
        return result.ok() ? 0 : 1;
    } catch (const ConfigurationError& e) {
        console::error(e.what());
        return 1;
    } catch (const UnresolvedReferenceError& e) {
        console::error(e.what());
        return 1;
    }
}

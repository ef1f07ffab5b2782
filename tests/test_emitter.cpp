// ═══════════════════════════════════════════════════════════════════
//  test_emitter.cpp — Declaration Emitter end-to-end tests
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include "gqlts/console.h"
#include "gqlts/emitter.h"
#include <algorithm>

using namespace gqlts;

namespace {

Schema sampleSchema() {
    return SchemaBuilder()
        .scalar("DateTime", "ISO timestamp")
        .enumType("Role", {"ADMIN", "VIEWER"})
        .inputType("UserFilter")
            .field("role", "Role")
            .field("limit", "Int!").defaultValue("20")
        .interfaceType("Node")
            .field("id", "ID!")
        .objectType("User", {"Node"}, "A registered account")
            .field("id", "ID!")
            .field("name", "String")
            .field("friends", "[User!]!")
                .argument("first", "Int")
        .unionType("SearchResult", {"User"})
        .build();
}

// Same types as sampleSchema(), declared in the opposite order.
Schema reversedSchema() {
    return SchemaBuilder()
        .unionType("SearchResult", {"User"})
        .objectType("User", {"Node"}, "A registered account")
            .field("id", "ID!")
            .field("name", "String")
            .field("friends", "[User!]!")
                .argument("first", "Int")
        .interfaceType("Node")
            .field("id", "ID!")
        .inputType("UserFilter")
            .field("role", "Role")
            .field("limit", "Int!").defaultValue("20")
        .enumType("Role", {"ADMIN", "VIEWER"})
        .scalar("DateTime", "ISO timestamp")
        .build();
}

EmitResult emitWith(const Schema& schema, const nlohmann::json& raw = nlohmann::json::object()) {
    return Emitter(schema, config::resolve(JsonValue(raw))).emit();
}

std::vector<std::string> namesOf(const EmitResult& result) {
    std::vector<std::string> names;
    for (auto& d : result.declarations) names.push_back(d.name);
    return names;
}

std::size_t countOf(const std::string& haystack, const std::string& needle) {
    std::size_t count = 0;
    for (auto pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        count++;
    }
    return count;
}

// Keep warnings about rejected overrides out of the test log.
class EmitterTest : public ::testing::Test {
protected:
    void SetUp() override {
        previous_ = console::level();
        console::setLevel(console::Level::Silent);
    }
    void TearDown() override { console::setLevel(previous_); }

private:
    console::Level previous_ = console::Level::Info;
};

} // namespace

// ═══════════════════════════════════════════
//  Whole-output tests
// ═══════════════════════════════════════════

TEST_F(EmitterTest, DefaultConfigurationOutput) {
    auto result = emitWith(sampleSchema());
    ASSERT_TRUE(result.ok());

    EXPECT_EQ(result.source(),
        "export type Maybe<T> = T | null;\n"
        "export type InputMaybe<T> = Maybe<T>;\n"
        "\n"
        "/** All built-in and custom scalars, mapped to their actual values */\n"
        "export type Scalars = {\n"
        "  ID: string;\n"
        "  String: string;\n"
        "  Boolean: boolean;\n"
        "  Int: number;\n"
        "  Float: number;\n"
        "  /** ISO timestamp */\n"
        "  DateTime: any;\n"
        "};\n"
        "\n"
        "export enum Role {\n"
        "  ADMIN = 'ADMIN',\n"
        "  VIEWER = 'VIEWER',\n"
        "}\n"
        "\n"
        "export type UserFilter = {\n"
        "  role?: InputMaybe<Role>;\n"
        "  limit?: Scalars['Int'];\n"
        "};\n"
        "\n"
        "/** A registered account */\n"
        "export type User = {\n"
        "  __typename?: 'User';\n"
        "  id: Scalars['ID'];\n"
        "  name?: Maybe<Scalars['String']>;\n"
        "  friends: Array<User>;\n"
        "};\n"
        "\n"
        "export type UserFriendsArgs = {\n"
        "  first?: InputMaybe<Scalars['Int']>;\n"
        "};\n"
        "\n"
        "export type Node = {\n"
        "  id: Scalars['ID'];\n"
        "};\n"
        "\n"
        "export type SearchResult = User;\n");
}

TEST_F(EmitterTest, DeclarationMetadata) {
    auto result = emitWith(sampleSchema());

    EXPECT_EQ(namesOf(result), (std::vector<std::string>{
        "Maybe", "InputMaybe", "Scalars", "Role", "UserFilter", "User", "UserFriendsArgs",
        "Node", "SearchResult"}));

    auto& user = result.declarations[5];
    EXPECT_EQ(user.kind, DeclarationKind::Object);
    EXPECT_EQ(user.wrappers, std::set<std::string>{"Maybe"});

    auto& args = result.declarations[6];
    EXPECT_EQ(args.kind, DeclarationKind::Arguments);
    EXPECT_EQ(args.wrappers, std::set<std::string>{"InputMaybe"});
}

TEST_F(EmitterTest, EmptySchemaStillDeclaresScalars) {
    auto result = emitWith(Schema());
    EXPECT_EQ(namesOf(result), std::vector<std::string>{"Scalars"});
}

// ═══════════════════════════════════════════
//  Determinism and ordering
// ═══════════════════════════════════════════

TEST_F(EmitterTest, RepeatedRunsAreByteIdentical) {
    auto schema = sampleSchema();
    nlohmann::json raw = {{"futureProofEnums", true}, {"futureProofUnions", true},
                          {"useImplementingTypes", true}, {"wrapEntireFieldDefinitions", true}};

    Emitter emitter(schema, config::resolve(JsonValue(raw)));
    EXPECT_EQ(emitter.emit().source(), emitter.emit().source());
    EXPECT_EQ(emitWith(schema, raw).source(), emitWith(schema, raw).source());
}

TEST_F(EmitterTest, InputOrderDoesNotChangeOutput) {
    EXPECT_EQ(emitWith(sampleSchema()).source(), emitWith(reversedSchema()).source());
}

TEST_F(EmitterTest, CategoriesAppearInFixedOrder) {
    auto schema = SchemaBuilder()
        .unionType("U", {"B", "A"})
        .objectType("B").field("x", "Int")
        .enumType("E2", {"X"})
        .interfaceType("I").field("x", "Int")
        .inputType("In").field("x", "Int")
        .scalar("S")
        .objectType("A").field("x", "Int")
        .enumType("E1", {"X"})
        .build();

    auto result = emitWith(schema);
    auto rank = [](DeclarationKind kind) {
        switch (kind) {
            case DeclarationKind::Alias:       return 0;
            case DeclarationKind::Scalars:     return 1;
            case DeclarationKind::Enum:        return 2;
            case DeclarationKind::InputObject: return 3;
            case DeclarationKind::Object:
            case DeclarationKind::Arguments:   return 4;
            case DeclarationKind::Interface:   return 5;
            case DeclarationKind::Union:       return 6;
        }
        return 7;
    };

    std::vector<int> ranks;
    for (auto& d : result.declarations) ranks.push_back(rank(d.kind));
    EXPECT_TRUE(std::is_sorted(ranks.begin(), ranks.end()));
    EXPECT_EQ(namesOf(result), (std::vector<std::string>{
        "Maybe", "InputMaybe", "Scalars", "E1", "E2", "In", "A", "B", "I", "U"}));

    // union members keep their declared order
    EXPECT_EQ(result.declarations.back().body, "export type U = B | A;");
}

// ═══════════════════════════════════════════
//  Wrapper aliases
// ═══════════════════════════════════════════

TEST_F(EmitterTest, MaybeAliasIsEmittedOnceBeforeItsUsers) {
    auto schema = SchemaBuilder()
        .objectType("A").field("one", "String")
        .objectType("B").field("two", "Int")
        .interfaceType("C").field("three", "Boolean")
        .build();

    auto source = emitWith(schema).source();
    EXPECT_EQ(countOf(source, "type Maybe<T>"), 1u);
    EXPECT_EQ(countOf(source, "Maybe<"), 4u);
    EXPECT_LT(source.find("type Maybe<T>"), source.find("one?: Maybe<"));
    EXPECT_EQ(source.find("InputMaybe"), std::string::npos);
}

TEST_F(EmitterTest, UnreferencedAliasesAreNotEmitted) {
    auto schema = SchemaBuilder()
        .objectType("A").field("id", "ID!")
        .build();

    auto result = emitWith(schema);
    EXPECT_EQ(namesOf(result), (std::vector<std::string>{"Scalars", "A"}));
}

TEST_F(EmitterTest, EntireFieldWrapperAlias) {
    auto schema = SchemaBuilder()
        .objectType("A").field("id", "ID!")
        .build();

    auto source = emitWith(schema, {{"wrapEntireFieldDefinitions", true},
                                    {"entireFieldWrapperValue", "T | (() => T)"}}).source();
    EXPECT_EQ(source.rfind("export type EntireFieldWrapper<T> = T | (() => T);\n\n", 0), 0u);
    EXPECT_NE(source.find("  id: EntireFieldWrapper<Scalars['ID']>;\n"), std::string::npos);
}

TEST_F(EmitterTest, MaybeOverride) {
    auto schema = SchemaBuilder().objectType("A").field("n", "Int").build();
    auto source = emitWith(schema, {{"maybeValue", "T | null | undefined"}}).source();
    EXPECT_EQ(source.rfind("export type Maybe<T> = T | null | undefined;\n", 0), 0u);
}

// ═══════════════════════════════════════════
//  Configuration errors
// ═══════════════════════════════════════════

TEST_F(EmitterTest, InvalidOverrideDropsOnlyReferencingDeclarations) {
    auto result = emitWith(sampleSchema(), {{"inputMaybeValue", "T | | null"}});

    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.errors[0].option(), "inputMaybeValue");
    EXPECT_EQ(result.errors[0].value(), "T | | null");

    EXPECT_EQ(namesOf(result), (std::vector<std::string>{
        "Maybe", "Scalars", "Role", "User", "Node", "SearchResult"}));
}

TEST_F(EmitterTest, InvalidOverrideThatNobodyUsesIsIgnored) {
    auto result = emitWith(sampleSchema(), {{"entireFieldWrapperValue", "T |"}});
    EXPECT_TRUE(result.ok());
}

TEST_F(EmitterTest, GenerateThrowsAggregatedErrors) {
    auto schema = sampleSchema();
    try {
        generate(schema, JsonValue(nlohmann::json{
            {"inputMaybeValue", "(T"},
            {"wrapFieldDefinitions", true},
            {"fieldWrapperValue", "Lazy<T"},
        }));
        FAIL() << "expected ConfigurationErrors";
    } catch (const ConfigurationErrors& e) {
        ASSERT_EQ(e.errors().size(), 2u);
        EXPECT_EQ(e.errors()[0].option(), "inputMaybeValue");
        EXPECT_EQ(e.errors()[1].option(), "fieldWrapperValue");
        EXPECT_NE(std::string(e.what()).find("2 configuration error(s)"), std::string::npos);
    }
}

TEST_F(EmitterTest, GenerateReturnsSourceWhenClean) {
    auto schema = sampleSchema();
    EXPECT_EQ(generate(schema), emitWith(schema).source());
}

TEST_F(EmitterTest, GenerateAcceptsInlineConfiguration) {
    auto schema = sampleSchema();
    auto source = generate(schema, {{"enumsAsTypes", true}});
    EXPECT_NE(source.find("export type Role = 'ADMIN' | 'VIEWER';"), std::string::npos);
    EXPECT_EQ(source, emitWith(schema, {{"enumsAsTypes", true}}).source());

    auto strict = generate(schema, {{"avoidOptionals", {{"field", true}}}, {"enumsAsTypes", true}});
    EXPECT_NE(strict.find("  name: Maybe<Scalars['String']>;\n"), std::string::npos);
}

TEST_F(EmitterTest, UnresolvedFieldTypeAbortsTheRun) {
    auto schema = SchemaBuilder()
        .objectType("A").field("ok", "Int")
        .objectType("B").field("ghost", "Ghost")
        .build();

    try {
        emitWith(schema);
        FAIL() << "expected UnresolvedReferenceError";
    } catch (const UnresolvedReferenceError& e) {
        EXPECT_EQ(e.typeName(), "Ghost");
        EXPECT_EQ(e.referencedFrom(), "B.ghost");
    }
}

TEST_F(EmitterTest, UnresolvedArgumentAndUnionMemberAbortTheRun) {
    auto badArg = SchemaBuilder()
        .objectType("A").field("f", "Int").argument("x", "Missing")
        .build();
    EXPECT_THROW(emitWith(badArg), UnresolvedReferenceError);

    auto badUnion = SchemaBuilder().unionType("U", {"Nope"}).build();
    EXPECT_THROW(emitWith(badUnion), UnresolvedReferenceError);
}

TEST_F(EmitterTest, FilteredCategoriesAreNotChecked) {
    auto schema = SchemaBuilder()
        .enumType("E", {"A"})
        .objectType("B").field("ghost", "Ghost")
        .build();
    EXPECT_NO_THROW(emitWith(schema, {{"onlyEnums", true}}));
}

// ═══════════════════════════════════════════
//  Filters
// ═══════════════════════════════════════════

TEST_F(EmitterTest, OnlyEnumsKeepsExactlyTheEnums) {
    auto schema = SchemaBuilder()
        .scalar("Date")
        .enumType("Color", {"RED"})
        .enumType("Size", {"S", "M"})
        .objectType("A").field("a", "String")
        .objectType("B").field("b", "Date")
        .objectType("C").field("c", "Color")
        .build();

    auto result = emitWith(schema, {{"onlyEnums", true}});
    ASSERT_EQ(result.declarations.size(), 2u);
    EXPECT_EQ(namesOf(result), (std::vector<std::string>{"Color", "Size"}));
    for (auto& d : result.declarations) EXPECT_EQ(d.kind, DeclarationKind::Enum);
}

TEST_F(EmitterTest, OnlyOperationTypesKeepsEnumsAndScalars) {
    auto result = emitWith(sampleSchema(), {{"onlyOperationTypes", true}});
    EXPECT_EQ(namesOf(result), (std::vector<std::string>{"Scalars", "Role"}));
}

TEST_F(EmitterTest, OnlyEnumsWinsWhenBothFiltersAreSet) {
    auto result = emitWith(sampleSchema(), {{"onlyEnums", true}, {"onlyOperationTypes", true}});
    EXPECT_EQ(namesOf(result), std::vector<std::string>{"Role"});
}

// ═══════════════════════════════════════════
//  Uniform switches
// ═══════════════════════════════════════════

TEST_F(EmitterTest, NoExportRemovesEveryExport) {
    auto source = emitWith(sampleSchema(), {{"noExport", true}, {"enumsAsConst", true}}).source();
    EXPECT_EQ(source.find("export"), std::string::npos);
    EXPECT_NE(source.find("type Maybe<T> = T | null;"), std::string::npos);
    EXPECT_NE(source.find("const Role = {"), std::string::npos);
}

TEST_F(EmitterTest, DisableDescriptionsRemovesEveryComment) {
    auto source = emitWith(sampleSchema(), {{"disableDescriptions", true}}).source();
    EXPECT_EQ(source.find("/**"), std::string::npos);
    EXPECT_EQ(source.rfind("export type Maybe<T> = T | null;\n", 0), 0u);
}

TEST_F(EmitterTest, ImmutableTypes) {
    auto source = emitWith(sampleSchema(), {{"immutableTypes", true}}).source();
    EXPECT_NE(source.find("  readonly __typename?: 'User';\n"), std::string::npos);
    EXPECT_NE(source.find("  readonly friends: ReadonlyArray<User>;\n"), std::string::npos);
    EXPECT_NE(source.find("  readonly first?: InputMaybe<Scalars['Int']>;\n"), std::string::npos);
    EXPECT_NE(source.find("  ID: string;\n"), std::string::npos);
}

TEST_F(EmitterTest, TypenameOptions) {
    auto schema = SchemaBuilder().objectType("A").field("id", "ID!").build();

    EXPECT_NE(emitWith(schema, {{"nonOptionalTypename", true}}).source().find("  __typename: 'A';\n"),
              std::string::npos);
    EXPECT_EQ(emitWith(schema, {{"skipTypename", true}}).source().find("__typename"),
              std::string::npos);
}

TEST_F(EmitterTest, ScalarMappings) {
    auto source = emitWith(sampleSchema(), {
        {"scalars", {{"DateTime", "string"}, {"ID", "number"}}},
        {"defaultScalarType", "unknown"},
    }).source();
    EXPECT_NE(source.find("  ID: number;\n"), std::string::npos);
    EXPECT_NE(source.find("  DateTime: string;\n"), std::string::npos);

    auto schema = SchemaBuilder().scalar("JSON").build();
    EXPECT_NE(emitWith(schema, {{"defaultScalarType", "unknown"}}).source().find("  JSON: unknown;\n"),
              std::string::npos);
}

// ═══════════════════════════════════════════
//  Unions and interfaces
// ═══════════════════════════════════════════

TEST_F(EmitterTest, FutureProofUnions) {
    auto schema = SchemaBuilder()
        .objectType("FUTURE_ADDED_VALUE").field("x", "Int")
        .objectType("Post").field("x", "Int")
        .unionType("Feed", {"Post", "FUTURE_ADDED_VALUE"})
        .build();

    auto result = emitWith(schema, {{"futureProofUnions", true}});
    EXPECT_EQ(result.declarations.back().body,
              "export type Feed = Post | FUTURE_ADDED_VALUE | { __typename?: 'FUTURE_ADDED_VALUE1' };");
}

TEST_F(EmitterTest, UseImplementingTypesSubstitutesUseSitesOnly) {
    auto schema = SchemaBuilder()
        .interfaceType("Node").field("id", "ID!")
        .objectType("User", {"Node"}).field("id", "ID!")
        .objectType("Query")
            .field("node", "Node")
        .build();

    auto source = emitWith(schema, {{"useImplementingTypes", true}}).source();
    EXPECT_NE(source.find("  node?: Maybe<User>;\n"), std::string::npos);
    EXPECT_NE(source.find("export type Node = {\n  id: Scalars['ID'];\n};"), std::string::npos);
}

TEST_F(EmitterTest, InterfaceArgumentsGetTheirOwnDeclaration) {
    auto schema = SchemaBuilder()
        .interfaceType("Searchable")
            .field("matches", "Boolean!")
                .argument("term", "String!")
                .argument("fuzzy", "Boolean", "false")
        .build();

    auto result = emitWith(schema, {{"avoidOptionals", {{"object", true}}}});
    EXPECT_EQ(result.declarations.back().name, "SearchableMatchesArgs");
    EXPECT_EQ(result.declarations.back().body,
              "export type SearchableMatchesArgs = {\n"
              "  term: Scalars['String'];\n"
              "  fuzzy?: InputMaybe<Scalars['Boolean']>;\n"
              "};");
}

// ═══════════════════════════════════════════
//  Scenario: nullable field and avoidOptionals.field
// ═══════════════════════════════════════════

TEST_F(EmitterTest, NullableFieldWithAndWithoutAvoidOptionals) {
    auto schema = SchemaBuilder().objectType("Person").field("name", "String").build();

    EXPECT_NE(emitWith(schema).source().find("  name?: Maybe<Scalars['String']>;\n"),
              std::string::npos);
    EXPECT_NE(emitWith(schema, {{"avoidOptionals", {{"field", true}}}})
                  .source().find("  name: Maybe<Scalars['String']>;\n"),
              std::string::npos);
}

// ═══════════════════════════════════════════
//  Manifest
// ═══════════════════════════════════════════

TEST_F(EmitterTest, JsonManifest) {
    auto j = emitWith(sampleSchema(), {{"inputMaybeValue", "T |"}}).toJson();

    ASSERT_TRUE(j["declarations"].is_array());
    EXPECT_EQ(j["declarations"][0]["name"], "Maybe");
    EXPECT_EQ(j["declarations"][0]["kind"], "alias");
    ASSERT_EQ(j["errors"].size(), 1u);
    EXPECT_EQ(j["errors"][0]["option"], "inputMaybeValue");
    EXPECT_EQ(j["errors"][0]["value"], "T |");
}

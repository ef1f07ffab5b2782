#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlts/schema.h — In-memory GraphQL type graph
// ═══════════════════════════════════════════════════════════════════
//
//  The generator borrows a Schema for the duration of one run and
//  never mutates it. Graphs are usually assembled with SchemaBuilder:
//
//    auto schema = SchemaBuilder()
//        .scalar("DateTime")
//        .enumType("Color", {"RED", "GREEN", "BLUE"})
//        .objectType("User")
//            .field("id", "ID!")
//            .field("friends", "[User!]")
//                .argument("first", "Int", "10")
//        .build();
//
// ═══════════════════════════════════════════════════════════════════

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace gqlts {

enum class TypeKind { Scalar, Enum, Object, Interface, Union, InputObject };

std::string_view toString(TypeKind kind);

// ─────────────────────────────────────────────
//  TypeReference
//  { named: Name } | { list: TypeReference }, each level nullable
//  unless marked required ('!').
// ─────────────────────────────────────────────
struct TypeReference {
    enum class Kind { Named, List };

    Kind kind = Kind::Named;
    std::string name;                             // Named only
    std::shared_ptr<const TypeReference> ofType;  // List only
    bool nullable = true;

    static TypeReference named(std::string name, bool nullable = true);
    static TypeReference listOf(TypeReference inner, bool nullable = true);

    // Parse GraphQL notation: "String", "ID!", "[[Int!]]!".
    // Throws std::invalid_argument on malformed input.
    static TypeReference parse(const std::string& notation);

    TypeReference required() const {
        TypeReference copy = *this;
        copy.nullable = false;
        return copy;
    }

    bool isList() const { return kind == Kind::List; }
    const std::string& leafName() const;
    std::string toString() const;
};

// ── Where a field sits decides Maybe vs InputMaybe and its optionality category ──
enum class FieldRole { Output, InputField, Argument };

struct FieldDef {
    std::string name;
    TypeReference type;
    FieldRole role = FieldRole::Output;
    std::string description;
    std::optional<std::string> defaultValue;  // input positions only
    std::vector<FieldDef> arguments;          // output fields only

    bool isInputPosition() const { return role != FieldRole::Output; }
};

struct EnumValueDef {
    std::string name;
    std::string value;  // literal emitted for the member; defaults to name
    std::string description;
};

struct SchemaTypeDef {
    TypeKind kind = TypeKind::Object;
    std::string name;
    std::string description;
    std::vector<FieldDef> fields;          // object, interface, input object
    std::vector<EnumValueDef> values;      // enum
    std::vector<std::string> members;      // union
    std::vector<std::string> interfaces;   // object
};

// ═══════════════════════════════════════════
//  class Schema
//  Named types in insertion order plus a name index.
// ═══════════════════════════════════════════
class Schema {
public:
    // Throws std::invalid_argument if the name is already taken.
    Schema& add(SchemaTypeDef type);

    const SchemaTypeDef* find(std::string_view name) const;
    const std::vector<SchemaTypeDef>& types() const { return types_; }

    // Types of one category, ordered by name.
    std::vector<const SchemaTypeDef*> ofKind(TypeKind kind) const;

    // Object types declaring `interfaceName` in their implements list, ordered by name.
    std::vector<const SchemaTypeDef*> implementationsOf(std::string_view interfaceName) const;

    static bool isBuiltInScalar(std::string_view name);
    static const std::vector<std::string>& builtInScalars();

private:
    std::vector<SchemaTypeDef> types_;
    std::unordered_map<std::string, std::size_t> index_;
};

// ═══════════════════════════════════════════
//  class SchemaBuilder
//  Fluent construction. field()/value()/argument() apply to the most
//  recently opened type (or field); misuse throws std::logic_error.
// ═══════════════════════════════════════════
class SchemaBuilder {
public:
    SchemaBuilder& scalar(const std::string& name, const std::string& description = "");
    SchemaBuilder& enumType(const std::string& name, const std::vector<std::string>& values = {},
                            const std::string& description = "");
    SchemaBuilder& objectType(const std::string& name, const std::vector<std::string>& implements = {},
                              const std::string& description = "");
    SchemaBuilder& interfaceType(const std::string& name, const std::string& description = "");
    SchemaBuilder& inputType(const std::string& name, const std::string& description = "");
    SchemaBuilder& unionType(const std::string& name, const std::vector<std::string>& members,
                             const std::string& description = "");

    // ── Members of the current type ──
    SchemaBuilder& field(const std::string& name, const std::string& type,
                         const std::string& description = "");
    SchemaBuilder& value(const std::string& name, const std::string& description = "");
    SchemaBuilder& value(const std::string& name, const std::string& literal,
                         const std::string& description);

    // ── Modifiers of the current field ──
    SchemaBuilder& argument(const std::string& name, const std::string& type,
                            std::optional<std::string> defaultValue = std::nullopt);
    SchemaBuilder& defaultValue(const std::string& value);

    Schema build() const;

private:
    std::vector<SchemaTypeDef> types_;

    SchemaBuilder& open(TypeKind kind, const std::string& name, const std::string& description);
    SchemaTypeDef& current(const char* operation);
    FieldDef& currentField(const char* operation);
};

} // namespace gqlts

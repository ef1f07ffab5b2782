// ═══════════════════════════════════════════════════════════════════
//  src/schema.cpp — Type graph, builder and type-notation parser
// ═══════════════════════════════════════════════════════════════════

#include "gqlts/schema.h"

#include <algorithm>
#include <stdexcept>

namespace gqlts {

std::string_view toString(TypeKind kind) {
    switch (kind) {
        case TypeKind::Scalar:      return "scalar";
        case TypeKind::Enum:        return "enum";
        case TypeKind::Object:      return "object";
        case TypeKind::Interface:   return "interface";
        case TypeKind::Union:       return "union";
        case TypeKind::InputObject: return "inputObject";
    }
    return "unknown";
}

namespace detail {

// ═══════════════════════════════════════════
//  TypeNotationParser
//  Grammar:  type := (Name | '[' type ']') '!'?
// ═══════════════════════════════════════════
class TypeNotationParser {
public:
    explicit TypeNotationParser(const std::string& source)
        : source_(source), pos_(0) {}

    TypeReference parse() {
        auto result = parseType();
        skipWhitespace();
        if (pos_ != source_.size()) {
            fail("unexpected '" + std::string(1, source_[pos_]) + "'");
        }
        return result;
    }

private:
    const std::string& source_;
    std::size_t pos_;

    char peek() const {
        return pos_ < source_.size() ? source_[pos_] : '\0';
    }

    char advance() {
        return pos_ < source_.size() ? source_[pos_++] : '\0';
    }

    void skipWhitespace() {
        while (pos_ < source_.size() && (source_[pos_] == ' ' || source_[pos_] == '\t')) {
            pos_++;
        }
    }

    [[noreturn]] void fail(const std::string& what) const {
        throw std::invalid_argument("Invalid type reference '" + source_ + "' at position " +
                                    std::to_string(pos_) + ": " + what);
    }

    static bool isNameStart(char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
    }

    static bool isNameChar(char c) {
        return isNameStart(c) || (c >= '0' && c <= '9');
    }

    TypeReference parseType() {
        skipWhitespace();
        TypeReference ref;
        if (peek() == '[') {
            advance();
            auto inner = parseType();
            skipWhitespace();
            if (advance() != ']') fail("expected ']'");
            ref = TypeReference::listOf(std::move(inner));
        } else if (isNameStart(peek())) {
            std::string name;
            while (isNameChar(peek())) name += advance();
            ref = TypeReference::named(std::move(name));
        } else {
            fail("expected type name or '['");
        }

        skipWhitespace();
        if (peek() == '!') {
            advance();
            ref.nullable = false;
        }
        return ref;
    }
};

} // namespace detail

// ═══════════════════════════════════════════
//  TypeReference
// ═══════════════════════════════════════════

TypeReference TypeReference::named(std::string name, bool nullable) {
    TypeReference ref;
    ref.kind = Kind::Named;
    ref.name = std::move(name);
    ref.nullable = nullable;
    return ref;
}

TypeReference TypeReference::listOf(TypeReference inner, bool nullable) {
    TypeReference ref;
    ref.kind = Kind::List;
    ref.ofType = std::make_shared<const TypeReference>(std::move(inner));
    ref.nullable = nullable;
    return ref;
}

TypeReference TypeReference::parse(const std::string& notation) {
    return detail::TypeNotationParser(notation).parse();
}

const std::string& TypeReference::leafName() const {
    const TypeReference* ref = this;
    while (ref->kind == Kind::List) ref = ref->ofType.get();
    return ref->name;
}

std::string TypeReference::toString() const {
    std::string text = kind == Kind::List ? "[" + ofType->toString() + "]" : name;
    if (!nullable) text += '!';
    return text;
}

// ═══════════════════════════════════════════
//  Schema
// ═══════════════════════════════════════════

Schema& Schema::add(SchemaTypeDef type) {
    if (type.name.empty()) {
        throw std::invalid_argument("Schema type without a name");
    }
    if (index_.count(type.name)) {
        throw std::invalid_argument("Duplicate schema type '" + type.name + "'");
    }
    index_.emplace(type.name, types_.size());
    types_.push_back(std::move(type));
    return *this;
}

const SchemaTypeDef* Schema::find(std::string_view name) const {
    auto it = index_.find(std::string(name));
    return it == index_.end() ? nullptr : &types_[it->second];
}

std::vector<const SchemaTypeDef*> Schema::ofKind(TypeKind kind) const {
    std::vector<const SchemaTypeDef*> result;
    for (auto& type : types_) {
        if (type.kind == kind) result.push_back(&type);
    }
    std::sort(result.begin(), result.end(),
              [](const SchemaTypeDef* a, const SchemaTypeDef* b) { return a->name < b->name; });
    return result;
}

std::vector<const SchemaTypeDef*> Schema::implementationsOf(std::string_view interfaceName) const {
    std::vector<const SchemaTypeDef*> result;
    for (auto* type : ofKind(TypeKind::Object)) {
        auto& ifaces = type->interfaces;
        if (std::find(ifaces.begin(), ifaces.end(), interfaceName) != ifaces.end()) {
            result.push_back(type);
        }
    }
    return result;
}

const std::vector<std::string>& Schema::builtInScalars() {
    static const std::vector<std::string> names = {"ID", "String", "Boolean", "Int", "Float"};
    return names;
}

bool Schema::isBuiltInScalar(std::string_view name) {
    auto& names = builtInScalars();
    return std::find(names.begin(), names.end(), name) != names.end();
}

// ═══════════════════════════════════════════
//  SchemaBuilder
// ═══════════════════════════════════════════

SchemaBuilder& SchemaBuilder::open(TypeKind kind, const std::string& name,
                                   const std::string& description) {
    SchemaTypeDef type;
    type.kind = kind;
    type.name = name;
    type.description = description;
    types_.push_back(std::move(type));
    return *this;
}

SchemaTypeDef& SchemaBuilder::current(const char* operation) {
    if (types_.empty()) {
        throw std::logic_error(std::string(operation) + "() called before any type was opened");
    }
    return types_.back();
}

FieldDef& SchemaBuilder::currentField(const char* operation) {
    auto& type = current(operation);
    if (type.fields.empty()) {
        throw std::logic_error(std::string(operation) + "() called before any field of '" +
                               type.name + "'");
    }
    return type.fields.back();
}

SchemaBuilder& SchemaBuilder::scalar(const std::string& name, const std::string& description) {
    return open(TypeKind::Scalar, name, description);
}

SchemaBuilder& SchemaBuilder::enumType(const std::string& name, const std::vector<std::string>& values,
                                       const std::string& description) {
    open(TypeKind::Enum, name, description);
    for (auto& v : values) value(v);
    return *this;
}

SchemaBuilder& SchemaBuilder::objectType(const std::string& name,
                                         const std::vector<std::string>& implements,
                                         const std::string& description) {
    open(TypeKind::Object, name, description);
    types_.back().interfaces = implements;
    return *this;
}

SchemaBuilder& SchemaBuilder::interfaceType(const std::string& name, const std::string& description) {
    return open(TypeKind::Interface, name, description);
}

SchemaBuilder& SchemaBuilder::inputType(const std::string& name, const std::string& description) {
    return open(TypeKind::InputObject, name, description);
}

SchemaBuilder& SchemaBuilder::unionType(const std::string& name, const std::vector<std::string>& members,
                                        const std::string& description) {
    open(TypeKind::Union, name, description);
    types_.back().members = members;
    return *this;
}

SchemaBuilder& SchemaBuilder::field(const std::string& name, const std::string& type,
                                    const std::string& description) {
    auto& owner = current("field");
    FieldDef def;
    def.name = name;
    def.type = TypeReference::parse(type);
    def.description = description;
    switch (owner.kind) {
        case TypeKind::Object:
        case TypeKind::Interface:
            def.role = FieldRole::Output;
            break;
        case TypeKind::InputObject:
            def.role = FieldRole::InputField;
            break;
        default:
            throw std::logic_error("field() on " + std::string(toString(owner.kind)) +
                                   " type '" + owner.name + "'");
    }
    owner.fields.push_back(std::move(def));
    return *this;
}

SchemaBuilder& SchemaBuilder::value(const std::string& name, const std::string& description) {
    return value(name, name, description);
}

SchemaBuilder& SchemaBuilder::value(const std::string& name, const std::string& literal,
                                    const std::string& description) {
    auto& owner = current("value");
    if (owner.kind != TypeKind::Enum) {
        throw std::logic_error("value() on non-enum type '" + owner.name + "'");
    }
    owner.values.push_back({name, literal, description});
    return *this;
}

SchemaBuilder& SchemaBuilder::argument(const std::string& name, const std::string& type,
                                       std::optional<std::string> defaultValue) {
    auto& field = currentField("argument");
    if (field.role != FieldRole::Output) {
        throw std::logic_error("argument() on input field '" + field.name + "'");
    }
    FieldDef arg;
    arg.name = name;
    arg.type = TypeReference::parse(type);
    arg.role = FieldRole::Argument;
    arg.defaultValue = std::move(defaultValue);
    field.arguments.push_back(std::move(arg));
    return *this;
}

SchemaBuilder& SchemaBuilder::defaultValue(const std::string& value) {
    auto& field = currentField("defaultValue");
    if (!field.isInputPosition()) {
        throw std::logic_error("defaultValue() on output field '" + field.name + "'");
    }
    field.defaultValue = value;
    return *this;
}

Schema SchemaBuilder::build() const {
    Schema schema;
    for (auto& type : types_) schema.add(type);
    return schema;
}

} // namespace gqlts

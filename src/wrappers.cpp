// ═══════════════════════════════════════════════════════════════════
//  src/wrappers.cpp — Wrapper alias bookkeeping and materialization
// ═══════════════════════════════════════════════════════════════════

#include "gqlts/wrappers.h"
#include "gqlts/type_expression.h"

#include <functional>

namespace gqlts {

namespace {

// Identifiers appearing in `body`, outside string literals.
std::set<std::string> identifiersIn(const std::string& body) {
    std::set<std::string> names;
    auto isIdentChar = [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
               (c >= '0' && c <= '9') || c == '_' || c == '$';
    };

    std::size_t i = 0;
    while (i < body.size()) {
        char c = body[i];
        if (c == '\'' || c == '"' || c == '`') {
            for (++i; i < body.size() && body[i] != c; ++i) {
                if (body[i] == '\\') ++i;
            }
            ++i;
        } else if (isIdentChar(c)) {
            std::size_t start = i;
            while (i < body.size() && isIdentChar(body[i])) ++i;
            names.insert(body.substr(start, i - start));
        } else {
            ++i;
        }
    }
    return names;
}

} // namespace

WrapperRegistry::WrapperRegistry(const RenderConfig& config)
    : noExport_(config.noExport) {
    entries_[slot(WrapperKind::Maybe)].body = config.maybeValue;
    entries_[slot(WrapperKind::InputMaybe)].body = config.inputMaybeValue;
    entries_[slot(WrapperKind::FieldWrapper)].body = config.fieldWrapperValue;
    entries_[slot(WrapperKind::EntireFieldWrapper)].body = config.entireFieldWrapperValue;
}

const std::array<WrapperKind, 4>& WrapperRegistry::all() {
    static const std::array<WrapperKind, 4> kinds = {
        WrapperKind::Maybe, WrapperKind::InputMaybe,
        WrapperKind::FieldWrapper, WrapperKind::EntireFieldWrapper,
    };
    return kinds;
}

std::string_view WrapperRegistry::aliasName(WrapperKind kind) {
    switch (kind) {
        case WrapperKind::Maybe:              return "Maybe";
        case WrapperKind::InputMaybe:         return "InputMaybe";
        case WrapperKind::FieldWrapper:       return "FieldWrapper";
        case WrapperKind::EntireFieldWrapper: return "EntireFieldWrapper";
    }
    return "";
}

std::string_view WrapperRegistry::optionName(WrapperKind kind) {
    switch (kind) {
        case WrapperKind::Maybe:              return "maybeValue";
        case WrapperKind::InputMaybe:         return "inputMaybeValue";
        case WrapperKind::FieldWrapper:       return "fieldWrapperValue";
        case WrapperKind::EntireFieldWrapper: return "entireFieldWrapperValue";
    }
    return "";
}

std::string WrapperRegistry::wrap(WrapperKind kind, const std::string& inner) {
    entries_[slot(kind)].referenced = true;
    return std::string(aliasName(kind)) + "<" + inner + ">";
}

bool WrapperRegistry::isReferenced(WrapperKind kind) const {
    return entries_[slot(kind)].referenced;
}

const std::string& WrapperRegistry::body(WrapperKind kind) const {
    return entries_[slot(kind)].body;
}

std::vector<WrapperKind> WrapperRegistry::dependencies(WrapperKind kind) const {
    auto names = identifiersIn(body(kind));
    std::vector<WrapperKind> deps;
    for (auto other : all()) {
        if (names.count(std::string(aliasName(other)))) deps.push_back(other);
    }
    return deps;
}

WrapperRegistry::Materialized WrapperRegistry::materialize() const {
    enum class State { Unvisited, Visiting, Done };

    Materialized result;
    std::array<State, 4> state{};
    state.fill(State::Unvisited);

    std::function<bool(WrapperKind)> visit = [&](WrapperKind kind) -> bool {
        auto name = std::string(aliasName(kind));
        if (state[slot(kind)] == State::Done) return !result.failed.count(name);
        state[slot(kind)] = State::Visiting;

        auto fail = [&]() {
            result.failed.insert(name);
            state[slot(kind)] = State::Done;
            return false;
        };

        if (auto problem = checkTypeExpression(body(kind))) {
            result.errors.emplace_back(std::string(optionName(kind)), body(kind),
                                       "not a valid type expression: " + *problem);
            return fail();
        }

        Declaration decl;
        decl.name = name;
        decl.kind = DeclarationKind::Alias;
        for (auto dep : dependencies(kind)) {
            auto depName = std::string(aliasName(dep));
            if (state[slot(dep)] == State::Visiting) {
                result.errors.emplace_back(std::string(optionName(kind)), body(kind),
                                           "alias '" + name + "' refers back to '" + depName + "'");
                return fail();
            }
            if (!visit(dep)) return fail();
            decl.wrappers.insert(depName);
        }

        decl.body = text::exportPrefix(noExport_) + "type " + name + "<T> = " + body(kind) + ";";
        result.declarations.push_back(std::move(decl));
        state[slot(kind)] = State::Done;
        return true;
    };

    for (auto kind : all()) {
        if (isReferenced(kind)) visit(kind);
    }
    return result;
}

} // namespace gqlts

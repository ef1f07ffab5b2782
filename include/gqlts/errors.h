#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlts/errors.h — Error taxonomy of the declaration generator
// ═══════════════════════════════════════════════════════════════════
//
//  ConfigurationError        an option value is unusable (wrong JSON type,
//                            or an alias override that is not a valid
//                            type expression). Collected per alias by the
//                            emitter; unrelated declarations still emit.
//  ConfigurationErrors       every ConfigurationError of one run, thrown
//                            together by generate().
//  UnresolvedReferenceError  a type reference names a type the schema
//                            does not contain. Fatal for the whole run.
//
// ═══════════════════════════════════════════════════════════════════

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace gqlts {

class ConfigurationError : public std::runtime_error {
public:
    ConfigurationError(std::string option, std::string value, const std::string& reason)
        : std::runtime_error("Invalid value for option '" + option + "' (" + value + "): " + reason),
          option_(std::move(option)),
          value_(std::move(value)),
          reason_(reason) {}

    const std::string& option() const { return option_; }
    const std::string& value() const { return value_; }
    const std::string& reason() const { return reason_; }

private:
    std::string option_;
    std::string value_;
    std::string reason_;
};

class ConfigurationErrors : public std::runtime_error {
public:
    explicit ConfigurationErrors(std::vector<ConfigurationError> errors)
        : std::runtime_error(summarize(errors)), errors_(std::move(errors)) {}

    const std::vector<ConfigurationError>& errors() const { return errors_; }

private:
    std::vector<ConfigurationError> errors_;

    static std::string summarize(const std::vector<ConfigurationError>& errors) {
        std::string msg = std::to_string(errors.size()) + " configuration error(s)";
        for (auto& e : errors) {
            msg += "\n  - ";
            msg += e.what();
        }
        return msg;
    }
};

class UnresolvedReferenceError : public std::runtime_error {
public:
    UnresolvedReferenceError(std::string typeName, std::string referencedFrom)
        : std::runtime_error("Unknown type '" + typeName + "' referenced from '" + referencedFrom + "'"),
          typeName_(std::move(typeName)),
          referencedFrom_(std::move(referencedFrom)) {}

    const std::string& typeName() const { return typeName_; }
    const std::string& referencedFrom() const { return referencedFrom_; }

private:
    std::string typeName_;
    std::string referencedFrom_;
};

} // namespace gqlts

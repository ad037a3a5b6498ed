#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <variant>
#include <cstdint>
#include "signal_registry.hpp"

// A signal value. std::monostate is the explicit null written when an input is missing.
using SignalValue = std::variant<std::monostate, int64_t, double, bool, std::string>;

// Numeric view of a value: ints and bools widen to double, null and text give nullopt
std::optional<double> numericValue(const SignalValue& value);

// Entity id of the single global-tier entry
inline const std::string GLOBAL_ENTITY = "codebase";

// Store of every signal of one run, written progressively by the fusion stages.
// Entries are additive: a (scope, entity, signal) triple is written at most once.
class SignalField {
public:
    using SignalMap = std::map<std::string, SignalValue>;
    using EntityMap = std::map<std::string, SignalMap>;

    explicit SignalField(SignalRegistry registry = SignalRegistry::createDefault());

    // Restrict writes to signals declared for this stage. Until the first call
    // every declared signal may be written.
    void beginStage(Stage stage);
    std::optional<Stage> currentStage() const { return currentStage_; }

    // Write a signal once. Throws SignalFieldError on an undeclared signal, a value
    // of the wrong type, a signal owned by another stage, or a second write.
    void set(SignalScope scope, const std::string& entity, const std::string& name, SignalValue value);

    void setFile(const std::string& path, const std::string& name, SignalValue value) {
        set(SignalScope::File, path, name, std::move(value));
    }
    void setDirectory(const std::string& dir, const std::string& name, SignalValue value) {
        set(SignalScope::Directory, dir, name, std::move(value));
    }
    void setModule(const std::string& module, const std::string& name, SignalValue value) {
        set(SignalScope::Module, module, name, std::move(value));
    }
    void setGlobal(const std::string& name, SignalValue value) {
        set(SignalScope::Global, GLOBAL_ENTITY, name, std::move(value));
    }

    // nullptr when never written
    const SignalValue* get(SignalScope scope, const std::string& entity, const std::string& name) const;
    bool has(SignalScope scope, const std::string& entity, const std::string& name) const;

    // nullopt when never written, written as null, or not numeric
    std::optional<double> number(SignalScope scope, const std::string& entity, const std::string& name) const;
    std::optional<std::string> text(SignalScope scope, const std::string& entity, const std::string& name) const;

    std::optional<double> fileNumber(const std::string& path, const std::string& name) const {
        return number(SignalScope::File, path, name);
    }
    std::optional<double> moduleNumber(const std::string& module, const std::string& name) const {
        return number(SignalScope::Module, module, name);
    }
    std::optional<double> globalNumber(const std::string& name) const {
        return number(SignalScope::Global, GLOBAL_ENTITY, name);
    }

    // Percentile of a percentileable file signal, written once in the Normalize stage.
    // A null percentile means "not computed" (ABSOLUTE tier or missing raw value).
    void setPercentile(const std::string& path, const std::string& name, std::optional<double> value);
    std::optional<double> percentile(const std::string& path, const std::string& name) const;
    bool hasPercentile(const std::string& path, const std::string& name) const;

    const EntityMap& entities(SignalScope scope) const;
    std::vector<std::string> entityIds(SignalScope scope) const;
    const std::map<std::string, std::map<std::string, std::optional<double>>>& percentiles() const {
        return percentiles_;
    }

    const SignalRegistry& registry() const { return registry_; }

    // Total number of written values across the four tiers
    size_t valueCount() const;

private:
    SignalRegistry registry_;
    std::optional<Stage> currentStage_;
    std::map<SignalScope, EntityMap> tiers_;
    std::map<std::string, std::map<std::string, std::optional<double>>> percentiles_;

    const SignalMeta& requireMeta(SignalScope scope, const std::string& name) const;
};

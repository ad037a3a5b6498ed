#include "signal_field.hpp"
#include <cmath>

namespace {

bool matchesType(SignalType type, const SignalValue& value) {
    if (std::holds_alternative<std::monostate>(value)) {
        return true;
    }
    switch (type) {
        case SignalType::Int: return std::holds_alternative<int64_t>(value);
        case SignalType::Float: return std::holds_alternative<double>(value);
        case SignalType::Bool: return std::holds_alternative<bool>(value);
        case SignalType::Text: return std::holds_alternative<std::string>(value);
    }
    return false;
}

const SignalField::EntityMap& emptyEntities() {
    static const SignalField::EntityMap empty;
    return empty;
}

} // namespace

std::optional<double> numericValue(const SignalValue& value) {
    if (const auto* i = std::get_if<int64_t>(&value)) {
        return static_cast<double>(*i);
    }
    if (const auto* d = std::get_if<double>(&value)) {
        return *d;
    }
    if (const auto* b = std::get_if<bool>(&value)) {
        return *b ? 1.0 : 0.0;
    }
    return std::nullopt;
}

SignalField::SignalField(SignalRegistry registry)
    : registry_(std::move(registry)) {}

void SignalField::beginStage(Stage stage) {
    if (currentStage_ && static_cast<int>(stage) <= static_cast<int>(*currentStage_)) {
        throw SignalFieldError("Stage " + stageToString(stage) + " cannot follow " +
                               stageToString(*currentStage_));
    }
    currentStage_ = stage;
}

const SignalMeta& SignalField::requireMeta(SignalScope scope, const std::string& name) const {
    const SignalMeta* meta = registry_.find(scope, name);
    if (!meta) {
        throw SignalFieldError("Undeclared " + scopeToString(scope) + " signal: " + name);
    }
    return *meta;
}

void SignalField::set(SignalScope scope, const std::string& entity,
                      const std::string& name, SignalValue value) {
    const SignalMeta& meta = requireMeta(scope, name);

    if (currentStage_ && meta.stage != *currentStage_) {
        throw SignalFieldError("Signal " + name + " belongs to stage " + stageToString(meta.stage) +
                               ", not " + stageToString(*currentStage_));
    }
    if (!matchesType(meta.type, value)) {
        throw SignalFieldError("Signal " + name + " expects a " + signalTypeToString(meta.type) + " value");
    }
    if (const auto* d = std::get_if<double>(&value); d && !std::isfinite(*d)) {
        // Non-finite numbers carry no information downstream
        value = std::monostate{};
    }

    auto& signals = tiers_[scope][entity];
    if (!signals.emplace(name, std::move(value)).second) {
        throw SignalFieldError("Signal " + name + " already written for " + entity);
    }
}

const SignalValue* SignalField::get(SignalScope scope, const std::string& entity,
                                    const std::string& name) const {
    auto tier = tiers_.find(scope);
    if (tier == tiers_.end()) {
        return nullptr;
    }
    auto ent = tier->second.find(entity);
    if (ent == tier->second.end()) {
        return nullptr;
    }
    auto it = ent->second.find(name);
    return it == ent->second.end() ? nullptr : &it->second;
}

bool SignalField::has(SignalScope scope, const std::string& entity, const std::string& name) const {
    return get(scope, entity, name) != nullptr;
}

std::optional<double> SignalField::number(SignalScope scope, const std::string& entity,
                                          const std::string& name) const {
    const SignalValue* value = get(scope, entity, name);
    return value ? numericValue(*value) : std::nullopt;
}

std::optional<std::string> SignalField::text(SignalScope scope, const std::string& entity,
                                             const std::string& name) const {
    const SignalValue* value = get(scope, entity, name);
    if (!value) {
        return std::nullopt;
    }
    if (const auto* s = std::get_if<std::string>(value)) {
        return *s;
    }
    return std::nullopt;
}

void SignalField::setPercentile(const std::string& path, const std::string& name,
                                std::optional<double> value) {
    const SignalMeta& meta = requireMeta(SignalScope::File, name);
    if (!meta.percentileable) {
        throw SignalFieldError("Signal " + name + " is not percentileable");
    }
    if (currentStage_ && *currentStage_ != Stage::Normalize) {
        throw SignalFieldError("Percentiles are written only by the normalize stage");
    }
    if (!percentiles_[path].emplace(name, value).second) {
        throw SignalFieldError("Percentile of " + name + " already written for " + path);
    }
}

std::optional<double> SignalField::percentile(const std::string& path, const std::string& name) const {
    auto file = percentiles_.find(path);
    if (file == percentiles_.end()) {
        return std::nullopt;
    }
    auto it = file->second.find(name);
    return it == file->second.end() ? std::nullopt : it->second;
}

bool SignalField::hasPercentile(const std::string& path, const std::string& name) const {
    auto file = percentiles_.find(path);
    return file != percentiles_.end() && file->second.count(name) > 0;
}

const SignalField::EntityMap& SignalField::entities(SignalScope scope) const {
    auto it = tiers_.find(scope);
    return it == tiers_.end() ? emptyEntities() : it->second;
}

std::vector<std::string> SignalField::entityIds(SignalScope scope) const {
    std::vector<std::string> ids;
    for (const auto& [id, signals] : entities(scope)) {
        ids.push_back(id);
    }
    return ids;
}

size_t SignalField::valueCount() const {
    size_t count = 0;
    for (const auto& [scope, entities] : tiers_) {
        for (const auto& [id, signals] : entities) {
            count += signals.size();
        }
    }
    return count;
}

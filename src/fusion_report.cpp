#include "fusion_report.hpp"
#include "display_scale.hpp"
#include <algorithm>
#include <type_traits>
#include <variant>

using json = nlohmann::json;

FusionReport::FusionReport(const FusionResult& result, size_t topN)
    : result_(result), topN_(topN) {}

json FusionReport::valueToJson(const SignalValue& value) {
    return std::visit([](const auto& v) -> json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return nullptr;
        } else {
            return v;
        }
    }, value);
}

json FusionReport::toJson() const {
    json report;
    report["tier"] = tierToString(result_.provenance.tier);
    report["provenance"] = provenanceJson();

    json files = tierJson(SignalScope::File);
    json percentiles = percentilesJson();
    for (auto it = files.begin(); it != files.end(); ++it) {
        auto found = percentiles.find(it.key());
        it.value()["percentiles"] = found != percentiles.end() ? *found : json::object();
    }
    report["files"] = files;
    report["directories"] = tierJson(SignalScope::Directory);
    report["modules"] = tierJson(SignalScope::Module);
    report["global"] = tierJson(SignalScope::Global).value(GLOBAL_ENTITY, json::object());

    report["communities"] = {
        {"modularity", result_.modularity},
        {"members", result_.communities}
    };

    report["bands"] = bandsJson();
    report["top_risk"] = rankingJson("risk_score");
    report["top_delta_h"] = rankingJson("delta_h");

    return report;
}

std::string FusionReport::dump() const {
    return toJson().dump(2);
}

std::vector<std::pair<std::string, double>> FusionReport::topFiles(const std::string& signal) const {
    std::vector<std::pair<std::string, double>> ranked;
    for (const auto& [path, signals] : result_.field.entities(SignalScope::File)) {
        if (auto value = result_.field.fileNumber(path, signal)) {
            ranked.emplace_back(path, *value);
        }
    }

    std::sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
        if (a.second != b.second) {
            return a.second > b.second;
        }
        return a.first < b.first;
    });

    if (ranked.size() > topN_) {
        ranked.resize(topN_);
    }
    return ranked;
}

json FusionReport::provenanceJson() const {
    const Provenance& p = result_.provenance;

    json stages = json::array();
    for (Stage stage : p.stagesCompleted) {
        stages.push_back(stageToString(stage));
    }

    json durations = json::object();
    for (const auto& [stage, elapsed] : p.stageDurations) {
        durations[stageToString(stage)] = elapsed.count();
    }

    return {
        {"tier", tierToString(p.tier)},
        {"approximate", p.approximate},
        {"reasons", p.reasons},
        {"warnings", p.warnings},
        {"stages_completed", stages},
        {"stage_durations_ms", durations},
        {"cancelled", p.cancelled}
    };
}

json FusionReport::tierJson(SignalScope scope) const {
    json tier = json::object();
    for (const auto& [entity, signals] : result_.field.entities(scope)) {
        json node = json::object();
        for (const auto& [name, value] : signals) {
            node[name] = valueToJson(value);
        }
        tier[entity] = node;
    }
    return tier;
}

json FusionReport::percentilesJson() const {
    json out = json::object();
    for (const auto& [path, table] : result_.field.percentiles()) {
        json node = json::object();
        for (const auto& [name, value] : table) {
            node[name] = value ? json(*value) : json(nullptr);
        }
        out[path] = node;
    }
    return out;
}

// Band of every written composite that has a display value
json FusionReport::bandsJson() const {
    const SignalRegistry& registry = result_.field.registry();
    json bands = json::object();

    for (SignalScope scope : {SignalScope::File, SignalScope::Module, SignalScope::Global}) {
        json scoped = json::object();
        for (const auto& [entity, signals] : result_.field.entities(scope)) {
            json node = json::object();
            for (const auto& [name, value] : signals) {
                if (!registry.find(scope, name + "_display")) {
                    continue;
                }
                auto number = numericValue(value);
                if (!number) {
                    continue;
                }
                const SignalMeta* meta = registry.find(scope, name);
                // The band is read off health_display, not off the composite's
                // own _display, which runs the other way for risk-like signals
                node[name] = {
                    {"band", bandToString(bandFor(*number, meta->polarity))},
                    {"health_display", healthDisplay(*number, meta->polarity)},
                    {"polarity", polarityToString(meta->polarity)}
                };
            }
            if (!node.empty()) {
                scoped[entity] = node;
            }
        }
        bands[scopeToString(scope)] = scoped;
    }
    return bands;
}

json FusionReport::rankingJson(const std::string& signal) const {
    json ranking = json::array();
    for (const auto& [path, value] : topFiles(signal)) {
        ranking.push_back({{"path", path}, {signal, value}});
    }
    return ranking;
}

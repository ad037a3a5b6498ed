#include "signal_types.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace {

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

const std::unordered_map<std::string, FileRole> roleMap = {
    {"UNKNOWN", FileRole::Unknown},
    {"MODEL", FileRole::Model},
    {"SERVICE", FileRole::Service},
    {"ENTRY_POINT", FileRole::EntryPoint},
    {"TEST", FileRole::Test},
    {"CONFIG", FileRole::Config},
    {"UTILITY", FileRole::Utility},
    {"INTERFACE", FileRole::Interface}
};

const std::unordered_map<std::string, ChurnTrajectory> trajectoryMap = {
    {"DORMANT", ChurnTrajectory::Dormant},
    {"STABILIZING", ChurnTrajectory::Stabilizing},
    {"STABLE", ChurnTrajectory::Stable},
    {"CHURNING", ChurnTrajectory::Churning},
    {"SPIKING", ChurnTrajectory::Spiking}
};

} // namespace

std::string roleToString(FileRole role) {
    switch (role) {
        case FileRole::Model: return "MODEL";
        case FileRole::Service: return "SERVICE";
        case FileRole::EntryPoint: return "ENTRY_POINT";
        case FileRole::Test: return "TEST";
        case FileRole::Config: return "CONFIG";
        case FileRole::Utility: return "UTILITY";
        case FileRole::Interface: return "INTERFACE";
        case FileRole::Unknown:
        default:
            return "UNKNOWN";
    }
}

FileRole roleFromString(const std::string& name) {
    auto it = roleMap.find(toUpper(name));
    if (it == roleMap.end()) {
        throw std::invalid_argument("Unknown file role: " + name);
    }
    return it->second;
}

std::string trajectoryToString(ChurnTrajectory trajectory) {
    switch (trajectory) {
        case ChurnTrajectory::Stabilizing: return "STABILIZING";
        case ChurnTrajectory::Stable: return "STABLE";
        case ChurnTrajectory::Churning: return "CHURNING";
        case ChurnTrajectory::Spiking: return "SPIKING";
        case ChurnTrajectory::Dormant:
        default:
            return "DORMANT";
    }
}

ChurnTrajectory trajectoryFromString(const std::string& name) {
    auto it = trajectoryMap.find(toUpper(name));
    if (it == trajectoryMap.end()) {
        throw std::invalid_argument("Unknown churn trajectory: " + name);
    }
    return it->second;
}

std::string tierToString(Tier tier) {
    switch (tier) {
        case Tier::Absolute: return "ABSOLUTE";
        case Tier::Bayesian: return "BAYESIAN";
        case Tier::Full:
        default:
            return "FULL";
    }
}

std::string polarityToString(Polarity polarity) {
    switch (polarity) {
        case Polarity::HighIsBad: return "high_is_bad";
        case Polarity::HighIsGood: return "high_is_good";
        case Polarity::Neutral:
        default:
            return "neutral";
    }
}

std::string scopeToString(SignalScope scope) {
    switch (scope) {
        case SignalScope::File: return "file";
        case SignalScope::Directory: return "directory";
        case SignalScope::Module: return "module";
        case SignalScope::Global:
        default:
            return "global";
    }
}

std::string signalTypeToString(SignalType type) {
    switch (type) {
        case SignalType::Int: return "int";
        case SignalType::Float: return "float";
        case SignalType::Bool: return "bool";
        case SignalType::Text:
        default:
            return "text";
    }
}

std::string stageToString(Stage stage) {
    switch (stage) {
        case Stage::Collect: return "collect";
        case Stage::RawRisk: return "raw_risk";
        case Stage::Normalize: return "normalize";
        case Stage::ModuleTemporal: return "module_temporal";
        case Stage::Composites: return "composites";
        case Stage::HealthLaplacian:
        default:
            return "health_laplacian";
    }
}

bool isOrphanExempt(FileRole role) {
    return role == FileRole::EntryPoint || role == FileRole::Test ||
           role == FileRole::Config || role == FileRole::Interface ||
           role == FileRole::Utility;
}

bool isUnstableTrajectory(ChurnTrajectory trajectory) {
    return trajectory == ChurnTrajectory::Churning || trajectory == ChurnTrajectory::Spiking;
}

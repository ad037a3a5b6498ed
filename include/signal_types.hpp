#pragma once

#include <string>
#include <vector>
#include <unordered_map>

// Semantic role assigned to a file by the external classifier
enum class FileRole {
    Unknown,
    Model,
    Service,
    EntryPoint,
    Test,
    Config,
    Utility,
    Interface
};

// Shape of a file's change history over time
enum class ChurnTrajectory {
    Dormant,      // <= 1 change or perfectly flat history
    Stabilizing,  // decreasing and steady
    Stable,       // steady, no strong trend
    Churning,     // erratic, no clear trend
    Spiking       // increasing and erratic
};

// Normalization mode chosen once per run from the file count
enum class Tier {
    Absolute,  // < 15 files: no percentiles
    Bayesian,  // 15-49 files: percentiles, lower confidence
    Full       // >= 50 files
};

enum class Polarity {
    HighIsBad,
    HighIsGood,
    Neutral
};

enum class SignalScope {
    File,
    Directory,
    Module,
    Global
};

enum class SignalType {
    Int,
    Float,
    Bool,
    Text
};

// The six fusion stages in execution order
enum class Stage {
    Collect = 1,
    RawRisk,
    Normalize,
    ModuleTemporal,
    Composites,
    HealthLaplacian
};

// Edge direction used by neighbor queries
enum class Direction {
    Out,   // files this file imports
    In,    // files importing this file
    Both
};

// String conversions, mirroring the names used in reports and snapshot files
std::string roleToString(FileRole role);
FileRole roleFromString(const std::string& name);

std::string trajectoryToString(ChurnTrajectory trajectory);
ChurnTrajectory trajectoryFromString(const std::string& name);

std::string tierToString(Tier tier);
std::string polarityToString(Polarity polarity);
std::string scopeToString(SignalScope scope);
std::string signalTypeToString(SignalType type);
std::string stageToString(Stage stage);

// Roles that are never considered orphans even without importers
bool isOrphanExempt(FileRole role);

// Trajectories that count as unstable for risk purposes
bool isUnstableTrajectory(ChurnTrajectory trajectory);

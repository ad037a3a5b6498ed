#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <stdexcept>
#include "signal_types.hpp"

// Raised on a write the signal contract forbids: an undeclared signal, a signal
// written at the wrong scope or stage, a value of the wrong type, or a second write.
class SignalFieldError : public std::logic_error {
public:
    explicit SignalFieldError(const std::string& message)
        : std::logic_error(message) {}
};

// Static declaration of one signal
struct SignalMeta {
    std::string name;
    SignalScope scope = SignalScope::File;
    SignalType type = SignalType::Float;
    Polarity polarity = Polarity::Neutral;
    bool percentileable = false;
    std::optional<double> absoluteThreshold;   // stand-in for a percentile in the ABSOLUTE tier
    Stage stage = Stage::Collect;              // the only stage allowed to write it
    std::string description;
};

class SignalRegistry {
public:
    SignalRegistry() = default;

    // The registry of every signal the fusion pipeline produces
    static SignalRegistry createDefault();

    // Throws SignalFieldError if the (scope, name) pair is already declared
    void declare(SignalMeta meta);

    // Declare a 0-1 composite together with its 1-10 "<name>_display" companion
    void declareComposite(SignalMeta meta);

    const SignalMeta* find(SignalScope scope, const std::string& name) const;

    // Signals of one scope in name order
    std::vector<const SignalMeta*> signals(SignalScope scope) const;

    // Per-file signals that get a percentile in the Normalize stage
    std::vector<const SignalMeta*> percentileableFileSignals() const;

    size_t size() const { return signals_.size(); }

private:
    std::map<std::pair<SignalScope, std::string>, SignalMeta> signals_;
};

#pragma once

#include <string>
#include "signal_types.hpp"

enum class HealthBand {
    Healthy,    // [7.78, 10]
    Moderate,   // [5.56, 7.77]
    AtRisk,     // [3.33, 5.55]
    Critical    // [1.0, 3.32]
};

// round(value * 9 + 1, 1) for a value in [0, 1]; out-of-range values are clamped first
double displayScore(double value);

HealthBand bandForDisplay(double display);

// Display score on the health orientation: 1 - value for composites where high
// is bad, so 10 is always best. Differs from the composite's own _display signal
// for risk-like composites.
double healthDisplay(double value, Polarity polarity);

// Band of a 0-1 composite. Composites where high is bad are banded on 1 - value,
// so a risk of 0.9 lands in Critical.
HealthBand bandFor(double value, Polarity polarity);

std::string bandToString(HealthBand band);

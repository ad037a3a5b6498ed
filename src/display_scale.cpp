#include "display_scale.hpp"
#include "statistics_toolkit.hpp"
#include <cmath>

double displayScore(double value) {
    double scaled = clamp01(value) * 9.0 + 1.0;
    return std::round(scaled * 10.0) / 10.0;
}

HealthBand bandForDisplay(double display) {
    if (display >= 7.78) {
        return HealthBand::Healthy;
    }
    if (display >= 5.56) {
        return HealthBand::Moderate;
    }
    if (display >= 3.33) {
        return HealthBand::AtRisk;
    }
    return HealthBand::Critical;
}

double healthDisplay(double value, Polarity polarity) {
    double health = polarity == Polarity::HighIsBad ? 1.0 - clamp01(value) : clamp01(value);
    return displayScore(health);
}

HealthBand bandFor(double value, Polarity polarity) {
    // Band the rounded value so the band always agrees with the health number shown
    return bandForDisplay(healthDisplay(value, polarity));
}

std::string bandToString(HealthBand band) {
    switch (band) {
        case HealthBand::Healthy: return "Healthy";
        case HealthBand::Moderate: return "Moderate";
        case HealthBand::AtRisk: return "At Risk";
        case HealthBand::Critical:
        default:
            return "Critical";
    }
}

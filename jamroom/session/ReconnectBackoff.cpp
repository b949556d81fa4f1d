#include "ReconnectBackoff.hpp"

#include <cmath>

namespace jamroom {

ReconnectBackoff::ReconnectBackoff() : ReconnectBackoff(Settings{}) {}

ReconnectBackoff::ReconnectBackoff(const Settings& settings, juce::int64 seed)
    : settings_(settings), random_(seed) {
    settings_.baseDelayMs = juce::jmax(1, settings_.baseDelayMs);
    settings_.maxDelayMs = juce::jmax(settings_.baseDelayMs, settings_.maxDelayMs);
    settings_.multiplier = juce::jmax(1.0, settings_.multiplier);
    settings_.jitter = juce::jlimit(0.0, 1.0, settings_.jitter);

    if (seed == 0)
        random_.setSeedRandomly();
}

int ReconnectBackoff::nextDelayMs() {
    double delay = settings_.baseDelayMs * std::pow(settings_.multiplier, attempt_);
    delay = juce::jmin(delay, static_cast<double>(settings_.maxDelayMs));

    if (settings_.jitter > 0.0) {
        // Uniform in [-jitter, +jitter]
        double spread = (random_.nextDouble() * 2.0 - 1.0) * settings_.jitter;
        delay *= 1.0 + spread;
    }

    // Stop growing the exponent once the cap is reached
    if (settings_.baseDelayMs * std::pow(settings_.multiplier, attempt_) < settings_.maxDelayMs)
        ++attempt_;

    return juce::jmax(1, static_cast<int>(std::lround(delay)));
}

}  // namespace jamroom

#pragma once

#include <juce_core/juce_core.h>

namespace jamroom {

/**
 * @brief Exponential backoff schedule for transport reconnect attempts
 *
 * delay(n) = min(base * multiplier^n, max), then spread by +/- jitter.
 * A jitter of 0 makes the schedule fully deterministic.
 */
class ReconnectBackoff {
  public:
    struct Settings {
        int baseDelayMs = 250;
        int maxDelayMs = 10000;
        double multiplier = 2.0;
        double jitter = 0.2;  // Fraction of the delay, 0..1
    };

    ReconnectBackoff();
    explicit ReconnectBackoff(const Settings& settings, juce::int64 seed = 0);

    /**
     * @brief Delay before the next attempt; advances the attempt counter
     */
    int nextDelayMs();

    /**
     * @brief Call after a successful connection
     */
    void reset() {
        attempt_ = 0;
    }

    int getAttempt() const {
        return attempt_;
    }

    const Settings& getSettings() const {
        return settings_;
    }

  private:
    Settings settings_;
    juce::Random random_;
    int attempt_ = 0;
};

}  // namespace jamroom

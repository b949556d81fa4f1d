#pragma once

#include <string>

namespace jamroom {

/**
 * Configuration class to manage the tunable settings of hub, session and mixdown
 */
class Config {
  public:
    static Config& getInstance();

    // Hub Configuration
    std::string getHubHost() const {
        return hubHost;
    }
    void setHubHost(const std::string& host) {
        hubHost = host;
    }

    int getHubPort() const {
        return hubPort;
    }
    void setHubPort(int port) {
        hubPort = port;
    }

    size_t getMaxBufferedBytes() const {
        return maxBufferedBytes;
    }
    void setMaxBufferedBytes(size_t bytes) {
        maxBufferedBytes = bytes;
    }

    // Presence / Cursor Configuration
    int getHeartbeatIntervalMs() const {
        return heartbeatIntervalMs;
    }
    void setHeartbeatIntervalMs(int ms) {
        heartbeatIntervalMs = ms;
    }

    int getPresenceTimeoutMs() const {
        return presenceTimeoutMs;
    }
    void setPresenceTimeoutMs(int ms) {
        presenceTimeoutMs = ms;
    }

    int getCursorThrottleMs() const {
        return cursorThrottleMs;
    }
    void setCursorThrottleMs(int ms) {
        cursorThrottleMs = ms;
    }

    // Reconnect Configuration
    int getReconnectBaseDelayMs() const {
        return reconnectBaseDelayMs;
    }
    void setReconnectBaseDelayMs(int ms) {
        reconnectBaseDelayMs = ms;
    }

    int getReconnectMaxDelayMs() const {
        return reconnectMaxDelayMs;
    }
    void setReconnectMaxDelayMs(int ms) {
        reconnectMaxDelayMs = ms;
    }

    double getReconnectJitter() const {
        return reconnectJitter;
    }
    void setReconnectJitter(double jitter) {
        reconnectJitter = jitter;
    }

    // Mixdown Configuration
    double getMixdownSampleRate() const {
        return mixdownSampleRate;
    }
    void setMixdownSampleRate(double rate) {
        mixdownSampleRate = rate;
    }

    int getMixdownBitDepth() const {
        return mixdownBitDepth;
    }
    void setMixdownBitDepth(int bits) {
        mixdownBitDepth = bits;
    }

    double getLimiterCeilingDb() const {
        return limiterCeilingDb;
    }
    void setLimiterCeilingDb(double db) {
        limiterCeilingDb = db;
    }

    std::string getAudioRoot() const {
        return audioRoot;
    }
    void setAudioRoot(const std::string& folder) {
        audioRoot = folder;
    }

    // Save/Load Configuration
    void saveToFile(const std::string& filename);
    void loadFromFile(const std::string& filename);

    // Parse a single key=value pair; unknown keys are ignored
    void parseConfigLine(const std::string& key, const std::string& value);

    // Restore every setting to its default
    void resetToDefaults();

  private:
    Config() = default;

    // Hub settings
    std::string hubHost = "127.0.0.1";
    int hubPort = 8787;
    size_t maxBufferedBytes = 1 << 20;  // Ephemeral events dropped above this

    // Presence / cursor settings
    int heartbeatIntervalMs = 5000;
    int presenceTimeoutMs = 15000;  // Three missed heartbeats
    int cursorThrottleMs = 50;

    // Reconnect settings
    int reconnectBaseDelayMs = 250;
    int reconnectMaxDelayMs = 10000;
    double reconnectJitter = 0.2;

    // Mixdown settings
    double mixdownSampleRate = 44100.0;
    int mixdownBitDepth = 16;
    double limiterCeilingDb = -1.0;
    std::string audioRoot = "";  // Directory audio refs are resolved under (empty = cwd)
};

}  // namespace jamroom

#include "Config.hpp"

#include <fstream>
#include <iostream>

namespace jamroom {

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::resetToDefaults() {
    *this = Config();
}

void Config::saveToFile(const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Failed to open config file for writing: " << filename << std::endl;
        return;
    }

    file << "hubHost=" << hubHost << std::endl;
    file << "hubPort=" << hubPort << std::endl;
    file << "maxBufferedBytes=" << maxBufferedBytes << std::endl;
    file << "heartbeatIntervalMs=" << heartbeatIntervalMs << std::endl;
    file << "presenceTimeoutMs=" << presenceTimeoutMs << std::endl;
    file << "cursorThrottleMs=" << cursorThrottleMs << std::endl;
    file << "reconnectBaseDelayMs=" << reconnectBaseDelayMs << std::endl;
    file << "reconnectMaxDelayMs=" << reconnectMaxDelayMs << std::endl;
    file << "reconnectJitter=" << reconnectJitter << std::endl;
    file << "mixdownSampleRate=" << mixdownSampleRate << std::endl;
    file << "mixdownBitDepth=" << mixdownBitDepth << std::endl;
    file << "limiterCeilingDb=" << limiterCeilingDb << std::endl;
    file << "audioRoot=" << audioRoot << std::endl;

    file.close();
    std::cout << "Config saved to: " << filename << std::endl;
}

void Config::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cout << "Config file not found, using defaults: " << filename << std::endl;
        return;
    }

    std::string line;
    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#')
            continue;

        size_t equalPos = line.find('=');
        if (equalPos == std::string::npos)
            continue;

        std::string key = line.substr(0, equalPos);
        std::string value = line.substr(equalPos + 1);

        parseConfigLine(key, value);
    }

    file.close();
    std::cout << "Config loaded from: " << filename << std::endl;
}

void Config::parseConfigLine(const std::string& key, const std::string& value) {
    try {
        // Handle string values
        if (key == "hubHost") {
            hubHost = value;
            return;
        }
        if (key == "audioRoot") {
            audioRoot = value;
            return;
        }

        // Handle numeric values
        double numValue = 0.0;
        numValue = std::stod(value);

        if (key == "hubPort") {
            hubPort = static_cast<int>(numValue);
        } else if (key == "maxBufferedBytes") {
            maxBufferedBytes = static_cast<size_t>(numValue);
        } else if (key == "heartbeatIntervalMs") {
            heartbeatIntervalMs = static_cast<int>(numValue);
        } else if (key == "presenceTimeoutMs") {
            presenceTimeoutMs = static_cast<int>(numValue);
        } else if (key == "cursorThrottleMs") {
            cursorThrottleMs = static_cast<int>(numValue);
        } else if (key == "reconnectBaseDelayMs") {
            reconnectBaseDelayMs = static_cast<int>(numValue);
        } else if (key == "reconnectMaxDelayMs") {
            reconnectMaxDelayMs = static_cast<int>(numValue);
        } else if (key == "reconnectJitter") {
            reconnectJitter = numValue;
        } else if (key == "mixdownSampleRate") {
            mixdownSampleRate = numValue;
        } else if (key == "mixdownBitDepth") {
            mixdownBitDepth = static_cast<int>(numValue);
        } else if (key == "limiterCeilingDb") {
            limiterCeilingDb = numValue;
        }
        // Skip unknown keys silently
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config value: " << key << "=" << value << " (" << e.what()
                  << ")" << std::endl;
    }
}

}  // namespace jamroom

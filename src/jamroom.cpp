#include "jamroom/jamroom.hpp"

#include <iostream>

#include "jamroom/core/Config.hpp"

bool jamroom_initialize(const std::string& config_file) {
    std::cout << "JamRoom v" << JAMROOM_VERSION << " - collaborative audio workspace"
              << std::endl;

    if (!config_file.empty())
        jamroom::Config::getInstance().loadFromFile(config_file);

    std::cout << "JamRoom initialized successfully!" << std::endl;
    return true;
}

void jamroom_shutdown() {
    std::cout << "JamRoom shutdown complete." << std::endl;
}

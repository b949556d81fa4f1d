#pragma once

/**
 * @file jamroom.hpp
 * @brief Main header for the JamRoom collaboration core
 *
 * JamRoom lets several people edit one audio project at the same time: they
 * share presence, cursors, track settings and a project chat over a channel
 * hub, and freeze the result into a single mixed-down WAV for publishing.
 */

#include <string>

#include "jamroom/core/envelope.hpp"
#include "jamroom/core/errors.hpp"
#include "jamroom/core/hub_server.hpp"
#include "jamroom/core/interfaces/chat_store_interface.hpp"
#include "jamroom/core/interfaces/identity_interface.hpp"
#include "jamroom/core/interfaces/object_storage_interface.hpp"
#include "jamroom/core/interfaces/profile_interface.hpp"
#include "jamroom/core/interfaces/publisher_interface.hpp"
#include "jamroom/core/interfaces/track_store_interface.hpp"
#include "jamroom/core/model.hpp"

/**
 * @brief Current version of JamRoom
 */
constexpr const char* JAMROOM_VERSION = "0.1.0";

/**
 * @brief Initialize the JamRoom system
 * @param config_file Optional key=value config file; defaults are kept when empty
 * @return true if initialization was successful
 */
bool jamroom_initialize(const std::string& config_file = "");

/**
 * @brief Shutdown the JamRoom system
 */
void jamroom_shutdown();

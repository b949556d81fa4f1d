/**
 * @file jamroom_hub_main.cpp
 * @brief Channel hub executable
 *
 * Serves every project's presence, cursor, track and chat topics to
 * WebSocket clients until SIGINT or SIGTERM.
 *
 *   jamroom_hub [--config=<file>] [--port=<port>]
 */

#include <juce_core/juce_core.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

#include "jamroom/core/Config.hpp"
#include "jamroom/jamroom.hpp"

namespace {

std::atomic<bool> g_stopRequested{false};

void onSignal(int) {
    g_stopRequested = true;
}

}  // namespace

int main(int argc, char* argv[]) {
    juce::ArgumentList args(argc, argv);

    if (!jamroom_initialize(args.getValueForOption("--config").toStdString()))
        return 1;

    auto& config = jamroom::Config::getInstance();
    int port = config.getHubPort();
    if (args.containsOption("--port"))
        port = args.getValueForOption("--port").getIntValue();

    if (port <= 0 || port > 65535) {
        std::cerr << "Invalid port: " << port << std::endl;
        return 1;
    }

    jamroom::WebSocketHubServer hub(port, config.getMaxBufferedBytes());
    if (!hub.start())
        return 1;

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    while (!g_stopRequested)
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

    std::cout << "Dropped " << hub.getDroppedEphemeralCount()
              << " ephemeral events for slow clients" << std::endl;
    hub.stop();
    jamroom_shutdown();
    return 0;
}

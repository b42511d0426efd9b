/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SERVER_CONFIG_HPP
#define SERVER_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <string>

namespace MarkerSync {

class SettingsManager;

/**
 * @brief Tunables for one marker server and the loop driving it
 *
 * Read from the "server", "loop" and "logging" categories of the
 * SettingsManager; anything missing keeps its default.
 */
struct ServerConfig {
    std::string topicNamespace{"marker_sync"};
    std::string serverId{};            // empty: use the topic namespace
    size_t updateQueueDepth{100};      // diff channel
    size_t feedbackQueueDepth{1};      // feedback channel
    uint32_t flushIntervalMs{100};
    bool quietLogging{false};

    static ServerConfig fromSettings(const SettingsManager& settings);
};

} // namespace MarkerSync

#endif // SERVER_CONFIG_HPP

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/ServerConfig.hpp"
#include "core/Logger.hpp"
#include "managers/SettingsManager.hpp"

namespace MarkerSync {

namespace {

// Negative or zero values fall back to the default
size_t readPositive(const SettingsManager& settings, const char* category,
                    const char* key, size_t fallback) {
    int value = settings.get<int>(category, key, static_cast<int>(fallback));
    if (value <= 0) {
        SETTINGS_WARNING(std::string("Ignoring non-positive ") + category + "." + key);
        return fallback;
    }
    return static_cast<size_t>(value);
}

} // anonymous namespace

ServerConfig ServerConfig::fromSettings(const SettingsManager& settings) {
    ServerConfig config;

    config.topicNamespace = settings.get<std::string>("server", "topic_namespace", config.topicNamespace);
    if (config.topicNamespace.empty()) {
        SETTINGS_WARNING("Empty server.topic_namespace, using default");
        config.topicNamespace = ServerConfig{}.topicNamespace;
    }
    config.serverId = settings.get<std::string>("server", "server_id", config.serverId);
    config.updateQueueDepth = readPositive(settings, "server", "update_queue_depth", config.updateQueueDepth);
    config.feedbackQueueDepth = readPositive(settings, "server", "feedback_queue_depth", config.feedbackQueueDepth);
    config.flushIntervalMs = static_cast<uint32_t>(
        readPositive(settings, "loop", "flush_interval_ms", config.flushIntervalMs));
    config.quietLogging = settings.get<bool>("logging", "quiet", config.quietLogging);

    return config;
}

} // namespace MarkerSync

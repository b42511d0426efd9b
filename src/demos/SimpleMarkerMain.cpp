/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/Logger.hpp"
#include "core/ServerConfig.hpp"
#include "core/SyncLoop.hpp"
#include "managers/InteractiveMarkerServer.hpp"
#include "managers/SettingsManager.hpp"
#include "transport/LoopbackTransport.hpp"
#include <SDL3/SDL.h>
#include <cmath>
#include <format>
#include <memory>
#include <string>

using namespace MarkerSync;

namespace {

const std::string DEMO_NAME{"simple_marker"};
const std::string MARKER_NAME{"my_marker"};

InteractiveMarker makeSimpleMarker() {
  InteractiveMarker marker;
  marker.header.frameId = "base_link";
  marker.name = MARKER_NAME;
  marker.description = "Simple 1-DoF Control";

  // Grey box
  Marker box;
  box.type = Marker::CUBE;
  box.action = Marker::ADD;
  box.scale = Vector3{0.45, 0.45, 0.45};
  box.color = ColorRGBA{0.0f, 0.5f, 0.5f, 1.0f};

  // Non-interactive control holding the box
  InteractiveMarkerControl boxControl;
  boxControl.alwaysVisible = true;
  boxControl.markers.push_back(box);
  marker.controls.push_back(boxControl);

  // Moves the box along the x-axis
  InteractiveMarkerControl moveControl;
  moveControl.name = "move_x";
  moveControl.interactionMode = InteractiveMarkerControl::MOVE_AXIS;
  marker.controls.push_back(moveControl);

  return marker;
}

} // anonymous namespace

int main([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
  DEMO_INFO(std::format("Initializing {}", DEMO_NAME));

  auto& settingsManager = SettingsManager::Instance();
  if (!settingsManager.loadFromFile("res/settings.json")) {
    DEMO_WARN("Failed to load settings.json - using defaults");
  }

  ServerConfig config = ServerConfig::fromSettings(settingsManager);
  config.topicNamespace = settingsManager.get<std::string>("simple_marker", "topic_namespace", DEMO_NAME);
  const bool simulateObserver = settingsManager.get<bool>("simple_marker", "simulate_observer", true);
  const int runSeconds = settingsManager.get<int>("simple_marker", "run_seconds", 0);

  if (config.quietLogging) {
    MARKERSYNC_ENABLE_QUIET_MODE();
  }

  // Events only: SDL turns SIGINT/SIGTERM into SDL_EVENT_QUIT
  if (!SDL_Init(SDL_INIT_EVENTS)) {
    DEMO_CRITICAL(std::format("SDL_Init failed: {}", SDL_GetError()));
    return -1;
  }

  auto transport = std::make_shared<LoopbackTransport>();
  int exitCode = 0;

  {
    InteractiveMarkerServer server(config.topicNamespace, transport, config);

    // Local observer printing every diff it receives
    uint64_t observerId = transport->subscribeUpdates(
        server.getUpdateTopic(), []([[maybe_unused]] const MarkerUpdate& update) {
          DEMO_DEBUG(std::format("Update {}: {} full, {} poses, {} erases",
                                 update.seqNum, update.markers.size(),
                                 update.poses.size(), update.erases.size()));
        });

    server.insert(makeSimpleMarker(),
                  makeFeedbackHandler([]([[maybe_unused]] const MarkerFeedback& feedback) {
                    DEMO_INFO(std::format("{} is now at {}, {}, {}.",
                                          feedback.markerName,
                                          feedback.pose.position.x,
                                          feedback.pose.position.y,
                                          feedback.pose.position.z));
                  }));
    server.applyChanges();

    if (auto snapshot = transport->callSnapshotService(server.getServiceName())) {
      DEMO_INFO(std::format("Snapshot at seq {} holds {} marker(s)",
                            snapshot->seqNum, snapshot->markers.size()));
    }

    SyncLoop loop(config.flushIntervalMs);
    float elapsed = 0.0f;

    loop.setPollHandler([&loop, &transport]() {
      SDL_Event event;
      while (SDL_PollEvent(&event)) {
        if (event.type == SDL_EVENT_QUIT) {
          DEMO_INFO("Quit requested");
          loop.stop();
        }
      }
      transport->spinOnce();
    });

    loop.setUpdateHandler([&](float deltaTime) {
      elapsed += deltaTime;
      if (runSeconds > 0 && elapsed >= static_cast<float>(runSeconds)) {
        loop.stop();
        return;
      }
      if (!simulateObserver) {
        return;
      }

      // Stand-in for a viewer dragging the box back and forth
      MarkerFeedback feedback;
      feedback.clientId = "simulated_viewer";
      feedback.markerName = MARKER_NAME;
      feedback.controlName = "move_x";
      feedback.eventType = MarkerFeedback::POSE_UPDATE;
      feedback.header.frameId = "base_link";
      feedback.pose.position.x = std::sin(elapsed);
      if (!transport->injectFeedback(server.getFeedbackTopic(), feedback)) {
        DEMO_WARN("Feedback topic has no subscriber");
      }
    });

    loop.setFlushHandler([&server]() { server.applyChanges(); });

    DEMO_INFO("Node started.");
    if (!loop.run()) {
      DEMO_ERROR("Sync loop ended with an error");
      exitCode = 1;
    }

    if (!transport->unsubscribeUpdates(observerId)) {
      DEMO_WARN("Update observer was already gone");
    }
    DEMO_INFO(std::format("{} shutting down at seq {}", DEMO_NAME,
                          server.getSequenceNumber()));
  }

  SDL_Quit();
  return exitCode;
}

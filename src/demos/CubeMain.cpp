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
#include <algorithm>
#include <array>
#include <cmath>
#include <format>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

using namespace MarkerSync;

namespace {

const std::string DEMO_NAME{"cube"};
constexpr int SIDE_LENGTH{10};

using Position = std::array<double, 3>;

/**
 * Positions of every box in the grid, shared between the feedback handler
 * (drag) and the loop (re-staging poses every tick).
 */
class CubeField {
public:
  void add(const Position& position) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_positions.push_back(position);
  }

  std::vector<Position> copy() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_positions;
  }

  // Moves the dragged box to the reported position and pulls its neighbours
  // along with a falloff of max(0, 1/(5d+1) - 0.2)
  void drag(size_t index, const Point& target) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (index >= m_positions.size()) {
      return;
    }

    const double dx = target.x - m_positions[index][0];
    const double dy = target.y - m_positions[index][1];
    const double dz = target.z - m_positions[index][2];

    for (size_t i = 0; i < m_positions.size(); ++i) {
      Position& p = m_positions[i];
      const double d = std::sqrt((target.x - p[0]) * (target.x - p[0]) +
                                 (target.y - p[1]) * (target.y - p[1]) +
                                 (target.z - p[2]) * (target.z - p[2]));
      const double t = std::max(0.0, 1.0 / (d * 5.0 + 1.0) - 0.2);

      p[0] += t * dx;
      p[1] += t * dy;
      p[2] += t * dz;

      if (i == index) {
        p = Position{target.x, target.y, target.z};
      }
    }
  }

private:
  mutable std::mutex m_mutex;
  std::vector<Position> m_positions;
};

void makeBoxControl(InteractiveMarker& marker) {
  InteractiveMarkerControl control;
  control.alwaysVisible = true;
  control.orientationMode = InteractiveMarkerControl::VIEW_FACING;
  control.interactionMode = InteractiveMarkerControl::MOVE_PLANE;
  control.independentMarkerOrientation = true;

  Marker box;
  box.type = Marker::CUBE;
  box.scale = Vector3{marker.scale, marker.scale, marker.scale};
  box.color.r = static_cast<float>(0.65 + 0.7 * marker.pose.position.x);
  box.color.g = static_cast<float>(0.65 + 0.7 * marker.pose.position.y);
  box.color.b = static_cast<float>(0.65 + 0.7 * marker.pose.position.z);
  box.color.a = 1.0f;

  control.markers.push_back(box);
  marker.controls.push_back(control);
}

void makeCube(InteractiveMarkerServer& server, const std::shared_ptr<CubeField>& field) {
  const double step = 1.0 / SIDE_LENGTH;
  size_t count = 0;

  for (int i = 0; i < SIDE_LENGTH; ++i) {
    const double x = -0.5 + step * i;
    for (int j = 0; j < SIDE_LENGTH; ++j) {
      const double y = -0.5 + step * j;
      for (int k = 0; k < SIDE_LENGTH; ++k) {
        const double z = step * k;

        InteractiveMarker marker;
        marker.header.frameId = "base_link";
        marker.scale = static_cast<float>(step);
        marker.pose.position = Point{x, y, z};
        marker.name = std::to_string(count);
        makeBoxControl(marker);

        field->add(Position{x, y, z});

        server.insert(marker, makeFeedbackHandler([field, count](const MarkerFeedback& feedback) {
          if (feedback.eventType == MarkerFeedback::POSE_UPDATE) {
            field->drag(count, feedback.pose.position);
          }
        }));
        ++count;
      }
    }
  }

  DEMO_INFO(std::format("Staged {} boxes", count));
}

} // anonymous namespace

int main([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
  DEMO_INFO(std::format("Initializing {}", DEMO_NAME));

  auto& settingsManager = SettingsManager::Instance();
  if (!settingsManager.loadFromFile("res/settings.json")) {
    DEMO_WARN("Failed to load settings.json - using defaults");
  }

  ServerConfig config = ServerConfig::fromSettings(settingsManager);
  config.topicNamespace = settingsManager.get<std::string>("cube", "topic_namespace", DEMO_NAME);
  const bool simulateObserver = settingsManager.get<bool>("cube", "simulate_observer", true);
  const int runSeconds = settingsManager.get<int>("cube", "run_seconds", 0);

  if (config.quietLogging) {
    MARKERSYNC_ENABLE_QUIET_MODE();
  }

  if (!SDL_Init(SDL_INIT_EVENTS)) {
    DEMO_CRITICAL(std::format("SDL_Init failed: {}", SDL_GetError()));
    return -1;
  }

  auto transport = std::make_shared<LoopbackTransport>();
  auto field = std::make_shared<CubeField>();
  int exitCode = 0;

  {
    InteractiveMarkerServer server(config.topicNamespace, transport, config);

    // Per-tick setPose only reaches committed boxes
    makeCube(server, field);
    if (!server.applyChanges()) {
      DEMO_CRITICAL("Failed to commit the cube");
      SDL_Quit();
      return 1;
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

      if (simulateObserver) {
        // Drag the corner box in a slow circle
        MarkerFeedback feedback;
        feedback.clientId = "simulated_viewer";
        feedback.markerName = "0";
        feedback.eventType = MarkerFeedback::POSE_UPDATE;
        feedback.header.frameId = "base_link";
        feedback.pose.position = Point{-0.5 + 0.2 * std::cos(elapsed),
                                       -0.5 + 0.2 * std::sin(elapsed), 0.0};
        if (!transport->injectFeedback(server.getFeedbackTopic(), feedback)) {
          DEMO_WARN("Feedback topic has no subscriber");
        }
      }

      const std::vector<Position> positions = field->copy();
      for (size_t i = 0; i < positions.size(); ++i) {
        Pose pose;
        pose.position = Point{positions[i][0], positions[i][1], positions[i][2]};
        server.setPose(std::to_string(i), pose);
      }
    });

    loop.setFlushHandler([&server]() { server.applyChanges(); });

    DEMO_INFO("Node started.");
    if (!loop.run()) {
      DEMO_ERROR("Sync loop ended with an error");
      exitCode = 1;
    }

    DEMO_INFO(std::format("{} shutting down at seq {} with {} markers", DEMO_NAME,
                          server.getSequenceNumber(), server.size()));
  }

  SDL_Quit();
  return exitCode;
}

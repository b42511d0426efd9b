/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MARKER_MESSAGES_HPP
#define MARKER_MESSAGES_HPP

#include "markers/MarkerTypes.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace MarkerSync {

/**
 * @brief Event sent by an observer about one marker
 */
struct MarkerFeedback {
  static constexpr uint8_t KEEP_ALIVE = 0;
  static constexpr uint8_t POSE_UPDATE = 1;
  static constexpr uint8_t MENU_SELECT = 2;
  static constexpr uint8_t BUTTON_CLICK = 3;
  static constexpr uint8_t MOUSE_DOWN = 4;
  static constexpr uint8_t MOUSE_UP = 5;

  Header header{};
  std::string clientId{};
  std::string markerName{};
  std::string controlName{};
  uint8_t eventType{KEEP_ALIVE};
  Pose pose{};
  uint32_t menuEntryId{0};
  Point mousePoint{};
  bool mousePointValid{false};

  bool operator==(const MarkerFeedback &) const = default;
};

// Pose-only diff record
struct MarkerPose {
  Header header{};
  Pose pose{};
  std::string name{};

  bool operator==(const MarkerPose &) const = default;
};

/**
 * @brief Diff message emitted once per non-empty flush
 */
struct MarkerUpdate {
  static constexpr uint8_t KEEP_ALIVE = 0;
  static constexpr uint8_t UPDATE = 1;

  std::string serverId{};
  uint64_t seqNum{0};
  uint8_t type{UPDATE};
  std::vector<InteractiveMarker> markers{};
  std::vector<MarkerPose> poses{};
  std::vector<std::string> erases{};

  bool empty() const {
    return markers.empty() && poses.empty() && erases.empty();
  }
  bool operator==(const MarkerUpdate &) const = default;
};

// Snapshot service response: committed markers only
struct MarkerSnapshot {
  uint64_t seqNum{0};
  std::vector<InteractiveMarker> markers{};
};

} // namespace MarkerSync

#endif // MARKER_MESSAGES_HPP

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MARKER_TYPES_HPP
#define MARKER_TYPES_HPP

/**
 * @file MarkerTypes.hpp
 * @brief Value types describing an interactive marker and its geometry
 *
 * These are plain structs copied by value. The server never mutates a
 * definition in place except for the pose/header of a committed marker.
 */

#include <cstdint>
#include <string>
#include <vector>

namespace MarkerSync {

struct Time {
  int32_t sec{0};
  uint32_t nanosec{0};

  bool isZero() const { return sec == 0 && nanosec == 0; }
  bool operator==(const Time &) const = default;
};

struct Header {
  Time stamp{};
  std::string frameId{};

  bool operator==(const Header &) const = default;
};

struct Point {
  double x{0.0};
  double y{0.0};
  double z{0.0};

  bool operator==(const Point &) const = default;
};

struct Vector3 {
  double x{0.0};
  double y{0.0};
  double z{0.0};

  bool operator==(const Vector3 &) const = default;
};

struct Quaternion {
  double x{0.0};
  double y{0.0};
  double z{0.0};
  double w{1.0};

  bool operator==(const Quaternion &) const = default;
};

struct Pose {
  Point position{};
  Quaternion orientation{};

  bool operator==(const Pose &) const = default;
};

struct ColorRGBA {
  float r{0.0f};
  float g{0.0f};
  float b{0.0f};
  float a{0.0f};

  bool operator==(const ColorRGBA &) const = default;
};

/**
 * @brief One visual primitive drawn as part of a control
 */
struct Marker {
  static constexpr int32_t ARROW = 0;
  static constexpr int32_t CUBE = 1;
  static constexpr int32_t SPHERE = 2;
  static constexpr int32_t CYLINDER = 3;
  static constexpr int32_t LINE_STRIP = 4;
  static constexpr int32_t LINE_LIST = 5;
  static constexpr int32_t CUBE_LIST = 6;
  static constexpr int32_t SPHERE_LIST = 7;
  static constexpr int32_t POINTS = 8;
  static constexpr int32_t TEXT_VIEW_FACING = 9;
  static constexpr int32_t MESH_RESOURCE = 10;
  static constexpr int32_t TRIANGLE_LIST = 11;

  static constexpr int32_t ADD = 0;
  static constexpr int32_t MODIFY = 0;
  static constexpr int32_t DELETE_ACTION = 2;

  Header header{};
  std::string ns{};
  int32_t id{0};
  int32_t type{ARROW};
  int32_t action{ADD};
  Pose pose{};
  Vector3 scale{};
  ColorRGBA color{};
  std::vector<Point> points{};
  std::string text{};
  std::string meshResource{};

  bool operator==(const Marker &) const = default;
};

/**
 * @brief Context menu entry attached to an interactive marker
 */
struct MenuEntry {
  static constexpr uint8_t FEEDBACK = 0;
  static constexpr uint8_t ROSRUN = 1;
  static constexpr uint8_t ROSLAUNCH = 2;

  uint32_t id{0};
  uint32_t parentId{0};
  std::string title{};
  std::string command{};
  uint8_t commandType{FEEDBACK};

  bool operator==(const MenuEntry &) const = default;
};

struct InteractiveMarkerControl {
  // Orientation modes
  static constexpr uint8_t INHERIT = 0;
  static constexpr uint8_t FIXED = 1;
  static constexpr uint8_t VIEW_FACING = 2;

  // Interaction modes
  static constexpr uint8_t NONE = 0;
  static constexpr uint8_t MENU = 1;
  static constexpr uint8_t BUTTON = 2;
  static constexpr uint8_t MOVE_AXIS = 3;
  static constexpr uint8_t MOVE_PLANE = 4;
  static constexpr uint8_t ROTATE_AXIS = 5;
  static constexpr uint8_t MOVE_ROTATE = 6;
  static constexpr uint8_t MOVE_3D = 7;
  static constexpr uint8_t ROTATE_3D = 8;
  static constexpr uint8_t MOVE_ROTATE_3D = 9;

  std::string name{};
  Quaternion orientation{};
  uint8_t orientationMode{INHERIT};
  uint8_t interactionMode{NONE};
  bool alwaysVisible{false};
  std::vector<Marker> markers{};
  bool independentMarkerOrientation{false};
  std::string description{};

  bool operator==(const InteractiveMarkerControl &) const = default;
};

/**
 * @brief Full definition of one interactive marker
 *
 * `name` is the registry key and must stay stable for the marker's lifetime.
 */
struct InteractiveMarker {
  Header header{};
  Pose pose{};
  std::string name{};
  std::string description{};
  float scale{1.0f};
  std::vector<MenuEntry> menuEntries{};
  std::vector<InteractiveMarkerControl> controls{};

  bool operator==(const InteractiveMarker &) const = default;
};

} // namespace MarkerSync

#endif // MARKER_TYPES_HPP

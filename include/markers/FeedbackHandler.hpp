/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef FEEDBACK_HANDLER_HPP
#define FEEDBACK_HANDLER_HPP

#include "markers/MarkerMessages.hpp"

#include <boost/container/flat_map.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

namespace MarkerSync {

/**
 * @brief Event-type code that addresses a marker's default handler
 *
 * Handlers registered under this code fire for every event type that has
 * no type-specific handler.
 */
inline constexpr uint8_t DEFAULT_FEEDBACK_CB = 255;

/**
 * @brief Receives feedback routed to one marker
 *
 * Invoked synchronously on the thread that delivers feedback, with no
 * server lock held, so implementations may call back into the server.
 */
class FeedbackHandler {
public:
  virtual ~FeedbackHandler() = default;
  virtual void handleFeedback(const MarkerFeedback &feedback) = 0;
};

using FeedbackHandlerPtr = std::shared_ptr<FeedbackHandler>;

// Event type -> handler, unique keys
using FeedbackHandlerMap = boost::container::flat_map<uint8_t, FeedbackHandlerPtr>;

// Adapts any callable taking `const MarkerFeedback&`
class FunctionFeedbackHandler : public FeedbackHandler {
public:
  using Callback = std::function<void(const MarkerFeedback &)>;

  explicit FunctionFeedbackHandler(Callback callback)
      : m_callback(std::move(callback)) {}

  void handleFeedback(const MarkerFeedback &feedback) override {
    if (m_callback) {
      m_callback(feedback);
    }
  }

private:
  Callback m_callback;
};

template <typename Fn>
FeedbackHandlerPtr makeFeedbackHandler(Fn &&fn) {
  static_assert(std::is_invocable_v<Fn &, const MarkerFeedback &>,
                "feedback handler must accept const MarkerFeedback&");
  return std::make_shared<FunctionFeedbackHandler>(
      FunctionFeedbackHandler::Callback(std::forward<Fn>(fn)));
}

} // namespace MarkerSync

#endif // FEEDBACK_HANDLER_HPP

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOOPBACK_TRANSPORT_HPP
#define LOOPBACK_TRANSPORT_HPP

/**
 * @file LoopbackTransport.hpp
 * @brief In-process MarkerTransport for demos and tests
 *
 * Messages are queued per topic and handed out by spinOnce(), which the host
 * loop calls every tick from a single thread:
 * - Bounded queues drop the oldest entry when full (depth 0 is unbounded)
 * - Updates on a topic reach every observer in publish order
 * - Callbacks always run with the transport lock released
 */

#include "transport/MarkerTransport.hpp"

#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace MarkerSync {

class LoopbackTransport : public MarkerTransport {
public:
  using UpdateObserver = std::function<void(const MarkerUpdate &)>;

  LoopbackTransport() = default;
  ~LoopbackTransport() override = default;

  // MarkerTransport
  bool advertiseUpdates(const std::string &topic, size_t depth) override;
  bool unadvertiseUpdates(const std::string &topic) override;
  bool publishUpdate(const std::string &topic,
                     const MarkerUpdate &update) override;
  bool subscribeFeedback(const std::string &topic, size_t depth,
                         FeedbackSink sink) override;
  bool unsubscribeFeedback(const std::string &topic) override;
  bool advertiseSnapshotService(const std::string &service,
                                SnapshotProvider provider) override;
  bool withdrawSnapshotService(const std::string &service) override;

  /**
   * @brief Registers an observer for diffs published on a topic
   * @return Observer ID (never 0) used to unsubscribe
   *
   * The topic does not need to be advertised yet.
   */
  uint64_t subscribeUpdates(const std::string &topic, UpdateObserver observer);
  bool unsubscribeUpdates(uint64_t observerId);

  /**
   * @brief Queues a feedback event as if an observer had sent it
   * @return false if nobody subscribed to the topic
   */
  bool injectFeedback(const std::string &topic, const MarkerFeedback &feedback);

  /**
   * @brief Calls a snapshot service synchronously
   * @return The response, or std::nullopt if the service is not advertised
   */
  std::optional<MarkerSnapshot>
  callSnapshotService(const std::string &service) const;

  /**
   * @brief Delivers everything queued so far
   * @return Number of messages handed to observers and sinks
   */
  size_t spinOnce();

  size_t getQueuedUpdateCount(const std::string &topic) const;
  size_t getQueuedFeedbackCount(const std::string &topic) const;
  uint64_t getDroppedCount() const {
    return m_droppedCount.load(std::memory_order_relaxed);
  }

private:
  struct UpdateTopic {
    bool advertised{false};
    size_t depth{0};
    std::deque<MarkerUpdate> queue;
    std::vector<std::pair<uint64_t, UpdateObserver>> observers;
  };

  struct FeedbackTopic {
    size_t depth{0};
    std::deque<MarkerFeedback> queue;
    FeedbackSink sink;
  };

  mutable std::mutex m_mutex;
  std::unordered_map<std::string, UpdateTopic> m_updateTopics;
  std::unordered_map<std::string, FeedbackTopic> m_feedbackTopics;
  std::unordered_map<std::string, SnapshotProvider> m_services;
  uint64_t m_nextObserverId{1};
  std::atomic<uint64_t> m_droppedCount{0};

  LoopbackTransport(const LoopbackTransport &) = delete;
  LoopbackTransport &operator=(const LoopbackTransport &) = delete;
};

} // namespace MarkerSync

#endif // LOOPBACK_TRANSPORT_HPP

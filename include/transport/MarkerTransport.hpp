/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MARKER_TRANSPORT_HPP
#define MARKER_TRANSPORT_HPP

#include "markers/MarkerMessages.hpp"

#include <cstddef>
#include <functional>
#include <string>

namespace MarkerSync {

/**
 * @brief Publish/subscribe/service collaborator used by the marker server
 *
 * Every operation reports failure by returning false; none of them throw.
 * Implementations must deliver updates on one topic in publish order.
 */
class MarkerTransport {
public:
  using FeedbackSink = std::function<void(const MarkerFeedback &)>;
  using SnapshotProvider = std::function<MarkerSnapshot()>;

  virtual ~MarkerTransport() = default;

  /**
   * @brief Declares an outbound diff topic
   * @param topic Topic name, e.g. "<ns>/update"
   * @param depth Maximum number of undelivered messages kept
   * @return true if the topic can now be published to
   */
  virtual bool advertiseUpdates(const std::string &topic, size_t depth) = 0;
  virtual bool unadvertiseUpdates(const std::string &topic) = 0;

  /**
   * @brief Publishes one diff message
   * @return false if the topic is not advertised or the send failed
   */
  virtual bool publishUpdate(const std::string &topic,
                             const MarkerUpdate &update) = 0;

  /**
   * @brief Routes inbound feedback on a topic to a sink
   * @param topic Topic name, e.g. "<ns>/feedback"
   * @param depth Maximum number of undelivered events kept
   * @param sink Called once per event, never with a transport lock held
   */
  virtual bool subscribeFeedback(const std::string &topic, size_t depth,
                                 FeedbackSink sink) = 0;
  virtual bool unsubscribeFeedback(const std::string &topic) = 0;

  /**
   * @brief Serves snapshot requests on a service name
   * @param service Service name, e.g. "<ns>/get_interactive_markers"
   * @param provider Produces the response for each request
   */
  virtual bool advertiseSnapshotService(const std::string &service,
                                        SnapshotProvider provider) = 0;
  virtual bool withdrawSnapshotService(const std::string &service) = 0;
};

} // namespace MarkerSync

#endif // MARKER_TRANSPORT_HPP

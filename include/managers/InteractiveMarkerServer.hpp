/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef INTERACTIVE_MARKER_SERVER_HPP
#define INTERACTIVE_MARKER_SERVER_HPP

/**
 * @file InteractiveMarkerServer.hpp
 * @brief Registry of interactive markers synchronized to observers by diffs
 *
 * Callers stage changes (insert, setPose, erase, clear, setCallback) into a
 * pending buffer holding at most one update per marker name. applyChanges()
 * commits the buffer into the registry and publishes one MarkerUpdate with a
 * fresh sequence number. Observer feedback arrives through processFeedback(),
 * which may stage pose updates of its own and then invokes the marker's
 * handler for that event type (or its default handler).
 *
 * Lock order is always: flush -> contexts -> pending. Handlers and the
 * transport are never called with the contexts or pending lock held.
 */

#include "core/ServerConfig.hpp"
#include "markers/FeedbackHandler.hpp"
#include "markers/MarkerMessages.hpp"
#include "markers/MarkerTypes.hpp"
#include "transport/MarkerTransport.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace MarkerSync {

class InteractiveMarkerServer {
public:
  /**
   * @brief Bookkeeping about the last feedback a marker received
   */
  struct FeedbackInfo {
    std::optional<std::chrono::system_clock::time_point> lastFeedback;
    std::string lastClientId;
  };

  /**
   * @brief Creates a server and registers it with the transport
   * @param topicNamespace Prefix for "<ns>/update", "<ns>/feedback" and
   *        "<ns>/get_interactive_markers"
   * @param transport Shared transport; may be null for a local-only server
   * @param config Queue depths and server id
   *
   * Registration failures are logged; the server stays usable locally.
   */
  InteractiveMarkerServer(const std::string &topicNamespace,
                          std::shared_ptr<MarkerTransport> transport,
                          const ServerConfig &config = ServerConfig{});

  /**
   * @brief Withdraws the feedback subscription, the snapshot service and
   * the update topic
   *
   * Blocks until feedback already being routed into this server returns.
   * Transport callbacks that run afterwards are no-ops. Must not be called
   * from inside a feedback handler of this server.
   */
  ~InteractiveMarkerServer();

  /**
   * @brief Stages a full definition under marker.name
   *
   * Replaces whatever was staged for that name, including staged handlers.
   * Committed handlers are replaced by the (empty) staged set on the next
   * flush unless setCallback() is called again.
   */
  void insert(const InteractiveMarker &marker);

  /**
   * @brief insert() followed by setCallback(marker.name, handler, feedbackType)
   */
  void insert(const InteractiveMarker &marker, FeedbackHandlerPtr handler,
              uint8_t feedbackType = DEFAULT_FEEDBACK_CB);

  /**
   * @brief Stages a pose-only update for a known marker
   *
   * Replaces anything staged for the name, a staged full definition
   * included. At flush the pose is applied to the committed definition; a
   * marker that was never committed is dropped.
   * @param header Overrides the header; when absent the staged header (if
   *        any) or the committed header is kept
   * @return false if the name is neither committed nor staged
   */
  bool setPose(const std::string &name, const Pose &pose,
               const std::optional<Header> &header = std::nullopt);

  /**
   * @brief Stages removal of a known marker, dropping anything else staged
   * @return false if the name is neither committed nor staged
   */
  bool erase(const std::string &name);

  /**
   * @brief Drops every staged change and stages removal of every committed
   * marker
   */
  void clear();

  /**
   * @brief Sets or removes a feedback handler on the committed and/or staged
   * entry for a marker
   * @param handler Handler to install; null removes it
   * @param feedbackType Event type, or DEFAULT_FEEDBACK_CB for the default
   * @return false if the name is neither committed nor staged
   */
  bool setCallback(const std::string &name, FeedbackHandlerPtr handler,
                   uint8_t feedbackType = DEFAULT_FEEDBACK_CB);

  /**
   * @brief Commits all staged changes and publishes one diff
   * @return true if a diff was produced, false if nothing was staged
   *
   * Flushes are serialized so diffs reach the transport in sequence order.
   * A publish failure is logged; the commit is not rolled back.
   */
  bool applyChanges();

  /**
   * @brief Routes one observer event to its marker
   *
   * Unknown markers are logged and ignored. POSE_UPDATE events stage a
   * pose-only update exactly as setPose() does. The matching handler runs synchronously on the calling
   * thread after all server locks are released.
   */
  void processFeedback(const MarkerFeedback &feedback);

  /**
   * @brief Effective definition of a marker, staged changes included
   * @return Copy of the definition, or std::nullopt if absent or being erased
   */
  std::optional<InteractiveMarker> get(const std::string &name) const;

  // Committed markers only
  size_t size() const;
  bool empty() const;

  uint64_t getSequenceNumber() const;
  size_t getPendingCount() const;

  /**
   * @brief Current sequence number and every committed definition
   */
  MarkerSnapshot getSnapshot() const;

  std::optional<FeedbackInfo> getFeedbackInfo(const std::string &name) const;

  const std::string &getTopicNamespace() const { return m_topicNamespace; }
  const std::string &getServerId() const { return m_serverId; }
  const std::string &getUpdateTopic() const { return m_updateTopic; }
  const std::string &getFeedbackTopic() const { return m_feedbackTopic; }
  const std::string &getServiceName() const { return m_serviceName; }

private:
  enum class UpdateType : uint8_t { FullUpdate, PoseUpdate, Erase };

  struct MarkerContext {
    std::optional<std::chrono::system_clock::time_point> lastFeedback;
    std::string lastClientId;
    FeedbackHandlerPtr defaultFeedbackCb;
    FeedbackHandlerMap feedbackCbs;
    InteractiveMarker intMarker;
  };

  // For PoseUpdate only intMarker.pose/header are meaningful
  struct UpdateContext {
    UpdateType updateType{UpdateType::FullUpdate};
    InteractiveMarker intMarker;
    FeedbackHandlerPtr defaultFeedbackCb;
    FeedbackHandlerMap feedbackCbs;
  };

  std::string m_topicNamespace;
  std::string m_serverId;
  std::string m_updateTopic;
  std::string m_feedbackTopic;
  std::string m_serviceName;
  std::shared_ptr<MarkerTransport> m_transport;

  // Transport callbacks hold a weak_ptr to this and reach the server only
  // under a shared lock; the destructor nulls `server` under the unique lock
  struct CallbackGuard {
    std::shared_mutex mutex;
    InteractiveMarkerServer *server{nullptr};
  };
  std::shared_ptr<CallbackGuard> m_callbackGuard;

  bool m_updatesAdvertised{false};
  bool m_feedbackSubscribed{false};
  bool m_serviceAdvertised{false};

  std::unordered_map<std::string, MarkerContext> m_markerContexts;
  std::unordered_map<std::string, UpdateContext> m_pendingUpdates;
  std::atomic<uint64_t> m_sequenceNumber{0};

  mutable std::mutex m_flushMutex;
  mutable std::shared_mutex m_contextsMutex;
  mutable std::mutex m_pendingMutex;

  // Caller holds m_pendingMutex
  void stagePoseLocked(const std::string &name, const Pose &pose,
                       const Header &header);

  static void assignCallback(FeedbackHandlerPtr &defaultCb,
                             FeedbackHandlerMap &callbacks,
                             const FeedbackHandlerPtr &handler,
                             uint8_t feedbackType);

  InteractiveMarkerServer(const InteractiveMarkerServer &) = delete;
  InteractiveMarkerServer &operator=(const InteractiveMarkerServer &) = delete;
};

} // namespace MarkerSync

#endif // INTERACTIVE_MARKER_SERVER_HPP

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/InteractiveMarkerServer.hpp"
#include "core/Logger.hpp"

#include <exception>
#include <format>
#include <utility>
#include <vector>

namespace MarkerSync {

InteractiveMarkerServer::InteractiveMarkerServer(
    const std::string &topicNamespace,
    std::shared_ptr<MarkerTransport> transport, const ServerConfig &config)
    : m_topicNamespace(topicNamespace),
      m_serverId(config.serverId.empty() ? topicNamespace : config.serverId),
      m_updateTopic(topicNamespace + "/update"),
      m_feedbackTopic(topicNamespace + "/feedback"),
      m_serviceName(topicNamespace + "/get_interactive_markers"),
      m_transport(std::move(transport)),
      m_callbackGuard(std::make_shared<CallbackGuard>()) {
  m_callbackGuard->server = this;

  if (!m_transport) {
    SERVER_WARN("No transport for '" + m_topicNamespace +
                "', running local-only");
    return;
  }

  m_updatesAdvertised =
      m_transport->advertiseUpdates(m_updateTopic, config.updateQueueDepth);
  if (!m_updatesAdvertised) {
    SERVER_ERROR("Failed to advertise update topic " + m_updateTopic);
  }

  std::weak_ptr<CallbackGuard> guard = m_callbackGuard;

  m_feedbackSubscribed = m_transport->subscribeFeedback(
      m_feedbackTopic, config.feedbackQueueDepth,
      [guard](const MarkerFeedback &feedback) {
        auto live = guard.lock();
        if (!live) {
          return;
        }
        std::shared_lock<std::shared_mutex> guardLock(live->mutex);
        if (live->server != nullptr) {
          live->server->processFeedback(feedback);
        }
      });
  if (!m_feedbackSubscribed) {
    SERVER_ERROR("Failed to subscribe to feedback topic " + m_feedbackTopic);
  }

  m_serviceAdvertised = m_transport->advertiseSnapshotService(
      m_serviceName, [guard]() {
        auto live = guard.lock();
        if (!live) {
          return MarkerSnapshot{};
        }
        std::shared_lock<std::shared_mutex> guardLock(live->mutex);
        return live->server != nullptr ? live->server->getSnapshot()
                                       : MarkerSnapshot{};
      });
  if (!m_serviceAdvertised) {
    SERVER_ERROR("Failed to advertise snapshot service " + m_serviceName);
  }

  SERVER_INFO(std::format("Server '{}' ready on namespace '{}'", m_serverId,
                          m_topicNamespace));
}

InteractiveMarkerServer::~InteractiveMarkerServer() {
  // Waits for deliveries already inside the server; later ones see null
  {
    std::unique_lock<std::shared_mutex> guardLock(m_callbackGuard->mutex);
    m_callbackGuard->server = nullptr;
  }

  if (!m_transport) {
    return;
  }

  if (m_serviceAdvertised && !m_transport->withdrawSnapshotService(m_serviceName)) {
    SERVER_WARN("Failed to withdraw snapshot service " + m_serviceName);
  }
  if (m_feedbackSubscribed && !m_transport->unsubscribeFeedback(m_feedbackTopic)) {
    SERVER_WARN("Failed to unsubscribe from " + m_feedbackTopic);
  }
  if (m_updatesAdvertised && !m_transport->unadvertiseUpdates(m_updateTopic)) {
    SERVER_WARN("Failed to unadvertise " + m_updateTopic);
  }
}

// ---------------------------------------------------------------------------
// Staging
// ---------------------------------------------------------------------------

void InteractiveMarkerServer::insert(const InteractiveMarker &marker) {
  std::lock_guard<std::mutex> pendingLock(m_pendingMutex);

  // Staged handlers for this name go away with the previous entry
  UpdateContext &update = m_pendingUpdates[marker.name];
  update = UpdateContext{};
  update.updateType = UpdateType::FullUpdate;
  update.intMarker = marker;
}

void InteractiveMarkerServer::insert(const InteractiveMarker &marker,
                                     FeedbackHandlerPtr handler,
                                     uint8_t feedbackType) {
  insert(marker);
  setCallback(marker.name, std::move(handler), feedbackType);
}

bool InteractiveMarkerServer::setPose(const std::string &name,
                                      const Pose &pose,
                                      const std::optional<Header> &header) {
  std::shared_lock<std::shared_mutex> contextsLock(m_contextsMutex);
  std::lock_guard<std::mutex> pendingLock(m_pendingMutex);

  auto contextIt = m_markerContexts.find(name);
  auto updateIt = m_pendingUpdates.find(name);

  if (contextIt == m_markerContexts.end() && updateIt == m_pendingUpdates.end()) {
    SERVER_DEBUG("setPose: unknown marker '" + name + "'");
    return false;
  }

  Header effectiveHeader;
  if (header) {
    effectiveHeader = *header;
  } else if (updateIt != m_pendingUpdates.end() &&
             updateIt->second.updateType != UpdateType::Erase) {
    effectiveHeader = updateIt->second.intMarker.header;
  } else if (contextIt != m_markerContexts.end()) {
    effectiveHeader = contextIt->second.intMarker.header;
  }

  stagePoseLocked(name, pose, effectiveHeader);
  return true;
}

bool InteractiveMarkerServer::erase(const std::string &name) {
  std::shared_lock<std::shared_mutex> contextsLock(m_contextsMutex);
  std::lock_guard<std::mutex> pendingLock(m_pendingMutex);

  auto updateIt = m_pendingUpdates.find(name);
  if (updateIt == m_pendingUpdates.end()) {
    if (m_markerContexts.find(name) == m_markerContexts.end()) {
      SERVER_DEBUG("erase: unknown marker '" + name + "'");
      return false;
    }
    updateIt = m_pendingUpdates.try_emplace(name).first;
  }

  updateIt->second = UpdateContext{};
  updateIt->second.updateType = UpdateType::Erase;
  return true;
}

void InteractiveMarkerServer::clear() {
  std::shared_lock<std::shared_mutex> contextsLock(m_contextsMutex);
  std::lock_guard<std::mutex> pendingLock(m_pendingMutex);

  m_pendingUpdates.clear();
  for (const auto &[name, context] : m_markerContexts) {
    m_pendingUpdates[name].updateType = UpdateType::Erase;
  }
}

bool InteractiveMarkerServer::setCallback(const std::string &name,
                                          FeedbackHandlerPtr handler,
                                          uint8_t feedbackType) {
  std::unique_lock<std::shared_mutex> contextsLock(m_contextsMutex);
  std::lock_guard<std::mutex> pendingLock(m_pendingMutex);

  auto contextIt = m_markerContexts.find(name);
  auto updateIt = m_pendingUpdates.find(name);

  if (contextIt == m_markerContexts.end() && updateIt == m_pendingUpdates.end()) {
    SERVER_DEBUG("setCallback: unknown marker '" + name + "'");
    return false;
  }

  if (contextIt != m_markerContexts.end()) {
    assignCallback(contextIt->second.defaultFeedbackCb,
                   contextIt->second.feedbackCbs, handler, feedbackType);
  }
  if (updateIt != m_pendingUpdates.end()) {
    assignCallback(updateIt->second.defaultFeedbackCb,
                   updateIt->second.feedbackCbs, handler, feedbackType);
  }
  return true;
}

void InteractiveMarkerServer::stagePoseLocked(const std::string &name,
                                              const Pose &pose,
                                              const Header &header) {
  // Whatever was staged before, the entry is now a pose-only update applied
  // to the committed definition at flush
  UpdateContext &update = m_pendingUpdates[name];
  update.updateType = UpdateType::PoseUpdate;
  update.intMarker.name = name;
  update.intMarker.pose = pose;
  update.intMarker.header = header;
}

void InteractiveMarkerServer::assignCallback(FeedbackHandlerPtr &defaultCb,
                                             FeedbackHandlerMap &callbacks,
                                             const FeedbackHandlerPtr &handler,
                                             uint8_t feedbackType) {
  if (feedbackType == DEFAULT_FEEDBACK_CB) {
    defaultCb = handler;
    return;
  }

  if (handler) {
    callbacks[feedbackType] = handler;
  } else {
    callbacks.erase(feedbackType);
  }
}

// ---------------------------------------------------------------------------
// Flush
// ---------------------------------------------------------------------------

bool InteractiveMarkerServer::applyChanges() {
  std::lock_guard<std::mutex> flushLock(m_flushMutex);

  MarkerUpdate update;
  size_t droppedPoses = 0;

  {
    std::unique_lock<std::shared_mutex> contextsLock(m_contextsMutex);
    std::lock_guard<std::mutex> pendingLock(m_pendingMutex);

    if (m_pendingUpdates.empty()) {
      return false;
    }

    update.markers.reserve(m_pendingUpdates.size());

    for (auto &[name, pending] : m_pendingUpdates) {
      switch (pending.updateType) {
      case UpdateType::FullUpdate: {
        auto [contextIt, created] = m_markerContexts.try_emplace(name);
        MarkerContext &context = contextIt->second;
        context.intMarker = std::move(pending.intMarker);
        context.defaultFeedbackCb = std::move(pending.defaultFeedbackCb);
        context.feedbackCbs = std::move(pending.feedbackCbs);
        update.markers.push_back(context.intMarker);
        if (created) {
          SERVER_DEBUG("Committed new marker '" + name + "'");
        }
        break;
      }
      case UpdateType::PoseUpdate: {
        auto contextIt = m_markerContexts.find(name);
        if (contextIt == m_markerContexts.end()) {
          SERVER_ERROR("Pending pose update for '" + name +
                       "' has no committed marker, dropping it");
          ++droppedPoses;
          break;
        }
        InteractiveMarker &committed = contextIt->second.intMarker;
        committed.pose = pending.intMarker.pose;
        committed.header = pending.intMarker.header;

        MarkerPose poseRecord;
        poseRecord.header = committed.header;
        poseRecord.pose = committed.pose;
        poseRecord.name = name;
        update.poses.push_back(std::move(poseRecord));
        break;
      }
      case UpdateType::Erase:
        m_markerContexts.erase(name);
        update.erases.push_back(name);
        break;
      }
    }

    m_pendingUpdates.clear();

    if (update.empty()) {
      SERVER_DEBUG(std::format("Flush produced no diff ({} pose updates dropped)",
                               droppedPoses));
      return false;
    }

    update.seqNum = m_sequenceNumber.fetch_add(1, std::memory_order_acq_rel) + 1;
  }

  update.serverId = m_serverId;
  update.type = MarkerUpdate::UPDATE;

  SERVER_DEBUG(std::format("Publishing update {}: {} full, {} poses, {} erases",
                           update.seqNum, update.markers.size(),
                           update.poses.size(), update.erases.size()));

  if (!m_transport) {
    return true;
  }
  if (!m_transport->publishUpdate(m_updateTopic, update)) {
    SERVER_ERROR(std::format("Failed to publish update {} on {}", update.seqNum,
                             m_updateTopic));
  }
  return true;
}

// ---------------------------------------------------------------------------
// Feedback
// ---------------------------------------------------------------------------

void InteractiveMarkerServer::processFeedback(const MarkerFeedback &feedback) {
  FeedbackHandlerPtr handler;

  {
    std::unique_lock<std::shared_mutex> contextsLock(m_contextsMutex);
    std::lock_guard<std::mutex> pendingLock(m_pendingMutex);

    auto contextIt = m_markerContexts.find(feedback.markerName);
    if (contextIt == m_markerContexts.end()) {
      SERVER_DEBUG("Dropping feedback for unknown marker '" +
                   feedback.markerName + "'");
      return;
    }

    MarkerContext &context = contextIt->second;
    context.lastFeedback = std::chrono::system_clock::now();
    context.lastClientId = feedback.clientId;

    if (feedback.eventType == MarkerFeedback::POSE_UPDATE) {
      stagePoseLocked(feedback.markerName, feedback.pose, feedback.header);
    }

    auto cbIt = context.feedbackCbs.find(feedback.eventType);
    if (cbIt != context.feedbackCbs.end()) {
      handler = cbIt->second;
    } else {
      handler = context.defaultFeedbackCb;
    }
  }

  if (!handler) {
    return;
  }

  try {
    handler->handleFeedback(feedback);
  } catch (const std::exception &e) {
    SERVER_ERROR(std::format("Feedback handler for '{}' threw: {}",
                             feedback.markerName, e.what()));
  }
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

std::optional<InteractiveMarker>
InteractiveMarkerServer::get(const std::string &name) const {
  std::shared_lock<std::shared_mutex> contextsLock(m_contextsMutex);
  std::lock_guard<std::mutex> pendingLock(m_pendingMutex);

  auto contextIt = m_markerContexts.find(name);
  auto updateIt = m_pendingUpdates.find(name);

  if (updateIt == m_pendingUpdates.end()) {
    if (contextIt == m_markerContexts.end()) {
      return std::nullopt;
    }
    return contextIt->second.intMarker;
  }

  const UpdateContext &pending = updateIt->second;
  switch (pending.updateType) {
  case UpdateType::FullUpdate:
    return pending.intMarker;
  case UpdateType::PoseUpdate: {
    if (contextIt == m_markerContexts.end()) {
      return std::nullopt;
    }
    InteractiveMarker effective = contextIt->second.intMarker;
    effective.pose = pending.intMarker.pose;
    effective.header = pending.intMarker.header;
    return effective;
  }
  case UpdateType::Erase:
    return std::nullopt;
  }
  return std::nullopt;
}

size_t InteractiveMarkerServer::size() const {
  std::shared_lock<std::shared_mutex> contextsLock(m_contextsMutex);
  return m_markerContexts.size();
}

bool InteractiveMarkerServer::empty() const {
  std::shared_lock<std::shared_mutex> contextsLock(m_contextsMutex);
  return m_markerContexts.empty();
}

uint64_t InteractiveMarkerServer::getSequenceNumber() const {
  return m_sequenceNumber.load(std::memory_order_acquire);
}

size_t InteractiveMarkerServer::getPendingCount() const {
  std::lock_guard<std::mutex> pendingLock(m_pendingMutex);
  return m_pendingUpdates.size();
}

MarkerSnapshot InteractiveMarkerServer::getSnapshot() const {
  std::shared_lock<std::shared_mutex> contextsLock(m_contextsMutex);

  MarkerSnapshot snapshot;
  snapshot.seqNum = m_sequenceNumber.load(std::memory_order_acquire);
  snapshot.markers.reserve(m_markerContexts.size());
  for (const auto &[name, context] : m_markerContexts) {
    snapshot.markers.push_back(context.intMarker);
  }
  return snapshot;
}

std::optional<InteractiveMarkerServer::FeedbackInfo>
InteractiveMarkerServer::getFeedbackInfo(const std::string &name) const {
  std::shared_lock<std::shared_mutex> contextsLock(m_contextsMutex);

  auto contextIt = m_markerContexts.find(name);
  if (contextIt == m_markerContexts.end()) {
    return std::nullopt;
  }
  return FeedbackInfo{contextIt->second.lastFeedback,
                      contextIt->second.lastClientId};
}

} // namespace MarkerSync

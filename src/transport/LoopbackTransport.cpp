/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "transport/LoopbackTransport.hpp"
#include "core/Logger.hpp"

#include <algorithm>

namespace MarkerSync {

namespace {

// Drop-oldest bounded push. A depth of 0 keeps everything.
template <typename T>
bool pushBounded(std::deque<T> &queue, size_t depth, const T &value) {
  bool dropped = false;
  while (depth > 0 && queue.size() >= depth) {
    queue.pop_front();
    dropped = true;
  }
  queue.push_back(value);
  return dropped;
}

} // anonymous namespace

bool LoopbackTransport::advertiseUpdates(const std::string &topic,
                                         size_t depth) {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto &entry = m_updateTopics[topic];
  if (entry.advertised) {
    TRANSPORT_WARN("Update topic already advertised: " + topic);
    return false;
  }
  entry.advertised = true;
  entry.depth = depth;
  TRANSPORT_DEBUG("Advertised update topic '" + topic + "' with depth " +
                  std::to_string(depth));
  return true;
}

bool LoopbackTransport::unadvertiseUpdates(const std::string &topic) {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_updateTopics.find(topic);
  if (it == m_updateTopics.end() || !it->second.advertised) {
    return false;
  }
  it->second.advertised = false;
  it->second.queue.clear();
  // Keep the entry while observers are still attached
  if (it->second.observers.empty()) {
    m_updateTopics.erase(it);
  }
  return true;
}

bool LoopbackTransport::publishUpdate(const std::string &topic,
                                      const MarkerUpdate &update) {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_updateTopics.find(topic);
  if (it == m_updateTopics.end() || !it->second.advertised) {
    TRANSPORT_ERROR("Publish on unadvertised update topic: " + topic);
    return false;
  }

  if (pushBounded(it->second.queue, it->second.depth, update)) {
    m_droppedCount.fetch_add(1, std::memory_order_relaxed);
    TRANSPORT_WARN("Update queue full on '" + topic +
                   "', dropped oldest message");
  }
  return true;
}

bool LoopbackTransport::subscribeFeedback(const std::string &topic,
                                          size_t depth, FeedbackSink sink) {
  if (!sink) {
    TRANSPORT_ERROR("Refusing empty feedback sink for topic: " + topic);
    return false;
  }

  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_feedbackTopics.find(topic) != m_feedbackTopics.end()) {
    TRANSPORT_ERROR("Feedback topic already has a subscriber: " + topic);
    return false;
  }

  FeedbackTopic entry;
  entry.depth = depth;
  entry.sink = std::move(sink);
  m_feedbackTopics.emplace(topic, std::move(entry));
  return true;
}

bool LoopbackTransport::unsubscribeFeedback(const std::string &topic) {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_feedbackTopics.erase(topic) > 0;
}

bool LoopbackTransport::advertiseSnapshotService(const std::string &service,
                                                 SnapshotProvider provider) {
  if (!provider) {
    TRANSPORT_ERROR("Refusing empty snapshot provider for service: " + service);
    return false;
  }

  std::lock_guard<std::mutex> lock(m_mutex);
  auto [it, inserted] = m_services.emplace(service, std::move(provider));
  if (!inserted) {
    TRANSPORT_ERROR("Service already advertised: " + service);
    return false;
  }
  return true;
}

bool LoopbackTransport::withdrawSnapshotService(const std::string &service) {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_services.erase(service) > 0;
}

uint64_t LoopbackTransport::subscribeUpdates(const std::string &topic,
                                             UpdateObserver observer) {
  if (!observer) {
    return 0;
  }

  std::lock_guard<std::mutex> lock(m_mutex);
  uint64_t id = m_nextObserverId++;
  m_updateTopics[topic].observers.emplace_back(id, std::move(observer));
  return id;
}

bool LoopbackTransport::unsubscribeUpdates(uint64_t observerId) {
  std::lock_guard<std::mutex> lock(m_mutex);
  for (auto it = m_updateTopics.begin(); it != m_updateTopics.end(); ++it) {
    auto &observers = it->second.observers;
    auto found = std::find_if(observers.begin(), observers.end(),
                              [observerId](const auto &entry) {
                                return entry.first == observerId;
                              });
    if (found != observers.end()) {
      observers.erase(found);
      if (observers.empty() && !it->second.advertised) {
        m_updateTopics.erase(it);
      }
      return true;
    }
  }
  return false;
}

bool LoopbackTransport::injectFeedback(const std::string &topic,
                                       const MarkerFeedback &feedback) {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_feedbackTopics.find(topic);
  if (it == m_feedbackTopics.end()) {
    TRANSPORT_DEBUG("No subscriber for feedback topic: " + topic);
    return false;
  }

  if (pushBounded(it->second.queue, it->second.depth, feedback)) {
    m_droppedCount.fetch_add(1, std::memory_order_relaxed);
    TRANSPORT_DEBUG("Feedback queue full on '" + topic +
                    "', dropped oldest event");
  }
  return true;
}

std::optional<MarkerSnapshot>
LoopbackTransport::callSnapshotService(const std::string &service) const {
  SnapshotProvider provider;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_services.find(service);
    if (it == m_services.end()) {
      TRANSPORT_WARN("Snapshot service not available: " + service);
      return std::nullopt;
    }
    provider = it->second;
  }
  return provider();
}

size_t LoopbackTransport::spinOnce() {
  struct UpdateBatch {
    std::deque<MarkerUpdate> messages;
    std::vector<UpdateObserver> observers;
  };
  struct FeedbackBatch {
    std::deque<MarkerFeedback> events;
    FeedbackSink sink;
  };

  std::vector<UpdateBatch> updateBatches;
  std::vector<FeedbackBatch> feedbackBatches;

  // Take everything queued so far, then deliver without holding the lock
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto &[topic, entry] : m_updateTopics) {
      if (entry.queue.empty()) {
        continue;
      }
      UpdateBatch batch;
      batch.messages.swap(entry.queue);
      batch.observers.reserve(entry.observers.size());
      for (const auto &[id, observer] : entry.observers) {
        batch.observers.push_back(observer);
      }
      updateBatches.push_back(std::move(batch));
    }
    for (auto &[topic, entry] : m_feedbackTopics) {
      if (entry.queue.empty()) {
        continue;
      }
      FeedbackBatch batch;
      batch.events.swap(entry.queue);
      batch.sink = entry.sink;
      feedbackBatches.push_back(std::move(batch));
    }
  }

  size_t delivered = 0;
  for (const auto &batch : updateBatches) {
    for (const auto &message : batch.messages) {
      for (const auto &observer : batch.observers) {
        observer(message);
      }
      ++delivered;
    }
  }
  for (const auto &batch : feedbackBatches) {
    for (const auto &event : batch.events) {
      batch.sink(event);
      ++delivered;
    }
  }
  return delivered;
}

size_t LoopbackTransport::getQueuedUpdateCount(const std::string &topic) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_updateTopics.find(topic);
  return it == m_updateTopics.end() ? 0 : it->second.queue.size();
}

size_t
LoopbackTransport::getQueuedFeedbackCount(const std::string &topic) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_feedbackTopics.find(topic);
  return it == m_feedbackTopics.end() ? 0 : it->second.queue.size();
}

} // namespace MarkerSync

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE FeedbackRouterTests
#include <boost/test/unit_test.hpp>

#include "core/Logger.hpp"
#include "managers/InteractiveMarkerServer.hpp"
#include "mocks/MockTransport.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace MarkerSync;

namespace {

InteractiveMarker makeMarker(const std::string &name) {
  InteractiveMarker marker;
  marker.header.frameId = "base_link";
  marker.name = name;
  return marker;
}

MarkerFeedback makeFeedback(const std::string &name, uint8_t eventType,
                            const std::string &clientId = "viewer") {
  MarkerFeedback feedback;
  feedback.clientId = clientId;
  feedback.markerName = name;
  feedback.eventType = eventType;
  return feedback;
}

// Counts calls and remembers the last event it saw
class RecordingHandler : public FeedbackHandler {
public:
  void handleFeedback(const MarkerFeedback &feedback) override {
    ++calls;
    lastEvent = feedback.eventType;
  }

  std::atomic<int> calls{0};
  std::atomic<uint8_t> lastEvent{255};
};

class ThrowingHandler : public FeedbackHandler {
public:
  void handleFeedback(const MarkerFeedback &) override {
    throw std::runtime_error("handler failure");
  }
};

} // namespace

struct RouterFixture {
  std::shared_ptr<MockTransport> transport;
  std::unique_ptr<InteractiveMarkerServer> server;

  RouterFixture() : transport(std::make_shared<MockTransport>()) {
    MARKERSYNC_ENABLE_QUIET_MODE();
    server = std::make_unique<InteractiveMarkerServer>("router", transport);
  }

  ~RouterFixture() {
    server.reset();
    MARKERSYNC_DISABLE_QUIET_MODE();
  }

  void commit(const std::string &name) {
    server->insert(makeMarker(name));
    BOOST_REQUIRE(server->applyChanges());
  }
};

BOOST_FIXTURE_TEST_SUITE(FeedbackRoutingTests, RouterFixture)

BOOST_AUTO_TEST_CASE(UnknownMarkerIsIgnored) {
  commit("a");
  auto handler = std::make_shared<RecordingHandler>();
  server->setCallback("a", handler);

  BOOST_CHECK_NO_THROW(
      server->processFeedback(makeFeedback("ghost", MarkerFeedback::POSE_UPDATE)));
  BOOST_CHECK_EQUAL(handler->calls.load(), 0);
  BOOST_CHECK_EQUAL(server->getPendingCount(), 0u);
  BOOST_CHECK_EQUAL(server->size(), 1u);
}

BOOST_AUTO_TEST_CASE(StagedOnlyMarkerIsIgnored) {
  auto handler = std::make_shared<RecordingHandler>();
  server->insert(makeMarker("a"), handler);

  // Not committed yet, so there is nothing to route to
  server->processFeedback(makeFeedback("a", MarkerFeedback::BUTTON_CLICK));
  BOOST_CHECK_EQUAL(handler->calls.load(), 0);
}

BOOST_AUTO_TEST_CASE(DefaultHandlerReceivesEveryType) {
  commit("a");
  auto handler = std::make_shared<RecordingHandler>();
  BOOST_REQUIRE(server->setCallback("a", handler));

  const uint8_t types[] = {
      MarkerFeedback::KEEP_ALIVE,   MarkerFeedback::POSE_UPDATE,
      MarkerFeedback::MENU_SELECT,  MarkerFeedback::BUTTON_CLICK,
      MarkerFeedback::MOUSE_DOWN,   MarkerFeedback::MOUSE_UP,
  };
  for (uint8_t type : types) {
    transport->deliverFeedback(makeFeedback("a", type));
    BOOST_CHECK_EQUAL(handler->lastEvent.load(), type);
  }
  BOOST_CHECK_EQUAL(handler->calls.load(), 6);
}

BOOST_AUTO_TEST_CASE(TypeHandlerTakesPriority) {
  commit("a");
  auto fallback = std::make_shared<RecordingHandler>();
  auto clicks = std::make_shared<RecordingHandler>();
  server->setCallback("a", fallback);
  server->setCallback("a", clicks, MarkerFeedback::BUTTON_CLICK);

  transport->deliverFeedback(makeFeedback("a", MarkerFeedback::BUTTON_CLICK));
  transport->deliverFeedback(makeFeedback("a", MarkerFeedback::BUTTON_CLICK));
  transport->deliverFeedback(makeFeedback("a", MarkerFeedback::MOUSE_DOWN));

  BOOST_CHECK_EQUAL(clicks->calls.load(), 2);
  BOOST_CHECK_EQUAL(fallback->calls.load(), 1);
  BOOST_CHECK_EQUAL(fallback->lastEvent.load(), MarkerFeedback::MOUSE_DOWN);
}

BOOST_AUTO_TEST_CASE(RemovingTypeHandlerFallsBackToDefault) {
  commit("a");
  auto fallback = std::make_shared<RecordingHandler>();
  auto clicks = std::make_shared<RecordingHandler>();
  server->setCallback("a", fallback);
  server->setCallback("a", clicks, MarkerFeedback::BUTTON_CLICK);

  BOOST_CHECK(server->setCallback("a", nullptr, MarkerFeedback::BUTTON_CLICK));
  transport->deliverFeedback(makeFeedback("a", MarkerFeedback::BUTTON_CLICK));
  BOOST_CHECK_EQUAL(clicks->calls.load(), 0);
  BOOST_CHECK_EQUAL(fallback->calls.load(), 1);

  // Removing the default leaves nothing to call
  BOOST_CHECK(server->setCallback("a", nullptr));
  transport->deliverFeedback(makeFeedback("a", MarkerFeedback::BUTTON_CLICK));
  BOOST_CHECK_EQUAL(fallback->calls.load(), 1);
}

BOOST_AUTO_TEST_CASE(NoHandlerStillRecordsFeedback) {
  commit("a");
  const auto before = std::chrono::system_clock::now();
  transport->deliverFeedback(
      makeFeedback("a", MarkerFeedback::MOUSE_DOWN, "viewer_1"));

  auto info = server->getFeedbackInfo("a");
  BOOST_REQUIRE(info.has_value());
  BOOST_REQUIRE(info->lastFeedback.has_value());
  BOOST_CHECK(*info->lastFeedback >= before);
  BOOST_CHECK_EQUAL(info->lastClientId, "viewer_1");

  transport->deliverFeedback(
      makeFeedback("a", MarkerFeedback::KEEP_ALIVE, "viewer_2"));
  BOOST_CHECK_EQUAL(server->getFeedbackInfo("a")->lastClientId, "viewer_2");
}

BOOST_AUTO_TEST_CASE(PoseUpdateStagesReportedPose) {
  commit("a");

  MarkerFeedback feedback = makeFeedback("a", MarkerFeedback::POSE_UPDATE);
  feedback.header.frameId = "odom";
  feedback.header.stamp = Time{12, 0};
  feedback.pose.position = Point{1.0, 2.0, 3.0};
  transport->deliverFeedback(feedback);

  BOOST_CHECK_EQUAL(server->getPendingCount(), 1u);
  auto effective = server->get("a");
  BOOST_REQUIRE(effective.has_value());
  BOOST_CHECK(effective->pose == feedback.pose);
  BOOST_CHECK(effective->header == feedback.header);

  BOOST_REQUIRE(server->applyChanges());
  const MarkerUpdate &update = transport->published.back();
  BOOST_REQUIRE_EQUAL(update.poses.size(), 1u);
  BOOST_CHECK_EQUAL(update.poses[0].name, "a");
  BOOST_CHECK(update.poses[0].pose == feedback.pose);
  BOOST_CHECK(update.poses[0].header == feedback.header);
}

BOOST_AUTO_TEST_CASE(PoseUpdateCoalescesWithStagedPose) {
  commit("a");
  Pose staged;
  staged.position.x = 5.0;
  server->setPose("a", staged);

  MarkerFeedback feedback = makeFeedback("a", MarkerFeedback::POSE_UPDATE);
  feedback.pose.position.x = 6.0;
  transport->deliverFeedback(feedback);

  BOOST_CHECK_EQUAL(server->getPendingCount(), 1u);
  BOOST_REQUIRE(server->applyChanges());
  const MarkerUpdate &update = transport->published.back();
  BOOST_REQUIRE_EQUAL(update.poses.size(), 1u);
  BOOST_CHECK_EQUAL(update.poses[0].pose.position.x, 6.0);
}

BOOST_AUTO_TEST_CASE(PoseUpdateSupersedesStagedRedefinition) {
  commit("a");
  InteractiveMarker redefined = makeMarker("a");
  redefined.description = "redefined";
  server->insert(redefined);

  MarkerFeedback feedback = makeFeedback("a", MarkerFeedback::POSE_UPDATE);
  feedback.pose.position.x = 7.0;
  transport->deliverFeedback(feedback);

  BOOST_REQUIRE(server->applyChanges());
  const MarkerUpdate &update = transport->published.back();
  BOOST_CHECK(update.markers.empty());
  BOOST_REQUIRE_EQUAL(update.poses.size(), 1u);
  BOOST_CHECK_EQUAL(update.poses[0].pose.position.x, 7.0);

  auto stored = server->get("a");
  BOOST_REQUIRE(stored.has_value());
  BOOST_CHECK(stored->description.empty());
  BOOST_CHECK_EQUAL(stored->pose.position.x, 7.0);
}

BOOST_AUTO_TEST_CASE(OtherEventsStageNothing) {
  commit("a");
  MarkerFeedback feedback = makeFeedback("a", MarkerFeedback::MOUSE_UP);
  feedback.pose.position.x = 9.0;
  transport->deliverFeedback(feedback);

  BOOST_CHECK_EQUAL(server->getPendingCount(), 0u);
  BOOST_CHECK_EQUAL(server->get("a")->pose.position.x, 0.0);
}

BOOST_AUTO_TEST_CASE(HandlerMayCallBackIntoServer) {
  commit("a");
  commit("b");

  int calls = 0;
  server->setCallback("a", makeFeedbackHandler([&](const MarkerFeedback &fb) {
    ++calls;
    // Mirror the drag onto "b" and publish immediately
    BOOST_CHECK(server->get("a").has_value());
    BOOST_CHECK(server->setPose("b", fb.pose));
    BOOST_CHECK(server->applyChanges());
    BOOST_CHECK(server->setCallback("a", nullptr, MarkerFeedback::MENU_SELECT));
  }));

  MarkerFeedback feedback = makeFeedback("a", MarkerFeedback::POSE_UPDATE);
  feedback.pose.position.y = 4.0;
  transport->deliverFeedback(feedback);

  BOOST_CHECK_EQUAL(calls, 1);
  BOOST_CHECK_EQUAL(server->getPendingCount(), 0u);
  BOOST_CHECK_EQUAL(server->getSequenceNumber(), 3u);

  // Both the drag and the mirrored pose went out in one diff
  const MarkerUpdate &update = transport->published.back();
  BOOST_CHECK_EQUAL(update.poses.size(), 2u);
  BOOST_CHECK_EQUAL(server->get("b")->pose.position.y, 4.0);
}

BOOST_AUTO_TEST_CASE(HandlerMayEraseItsOwnMarker) {
  commit("a");
  server->setCallback("a", makeFeedbackHandler([&](const MarkerFeedback &fb) {
    server->erase(fb.markerName);
    server->applyChanges();
  }));

  transport->deliverFeedback(makeFeedback("a", MarkerFeedback::BUTTON_CLICK));
  BOOST_CHECK_EQUAL(server->size(), 0u);

  // Later feedback for the removed marker is ignored
  BOOST_CHECK_NO_THROW(
      transport->deliverFeedback(makeFeedback("a", MarkerFeedback::BUTTON_CLICK)));
}

BOOST_AUTO_TEST_CASE(HandlerExceptionIsContained) {
  commit("a");
  server->setCallback("a", std::make_shared<ThrowingHandler>());

  MarkerFeedback feedback = makeFeedback("a", MarkerFeedback::POSE_UPDATE);
  feedback.pose.position.z = 1.5;
  BOOST_CHECK_NO_THROW(server->processFeedback(feedback));

  // The pose staged before the handler ran is kept
  BOOST_CHECK_EQUAL(server->getPendingCount(), 1u);
  BOOST_CHECK(server->applyChanges());
  BOOST_CHECK_EQUAL(server->get("a")->pose.position.z, 1.5);
}

BOOST_AUTO_TEST_CASE(HandlerOwnershipIsShared) {
  commit("a");
  auto handler = std::make_shared<RecordingHandler>();
  server->setCallback("a", handler);
  BOOST_CHECK_EQUAL(handler.use_count(), 2);

  server->erase("a");
  server->applyChanges();
  BOOST_CHECK_EQUAL(handler.use_count(), 1);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(FeedbackConcurrencyTests, RouterFixture)

BOOST_AUTO_TEST_CASE(FeedbackWhileStagingAndFlushing) {
  constexpr int NUM_MARKERS = 8;
  constexpr int EVENTS_PER_THREAD = 200;
  constexpr int NUM_FEEDBACK_THREADS = 3;

  std::vector<std::shared_ptr<RecordingHandler>> handlers;
  for (int i = 0; i < NUM_MARKERS; ++i) {
    const std::string name = "m" + std::to_string(i);
    handlers.push_back(std::make_shared<RecordingHandler>());
    server->insert(makeMarker(name), handlers.back());
  }
  BOOST_REQUIRE(server->applyChanges());

  std::atomic<bool> done{false};
  std::thread flusher([&]() {
    while (!done.load()) {
      server->applyChanges();
      std::this_thread::yield();
    }
  });

  std::thread stager([&]() {
    for (int i = 0; i < EVENTS_PER_THREAD; ++i) {
      Pose pose;
      pose.position.x = i;
      server->setPose("m" + std::to_string(i % NUM_MARKERS), pose);
    }
  });

  std::vector<std::thread> viewers;
  for (int t = 0; t < NUM_FEEDBACK_THREADS; ++t) {
    viewers.emplace_back([&, t]() {
      for (int i = 0; i < EVENTS_PER_THREAD; ++i) {
        MarkerFeedback feedback =
            makeFeedback("m" + std::to_string(i % NUM_MARKERS),
                         MarkerFeedback::POSE_UPDATE,
                         "viewer_" + std::to_string(t));
        feedback.pose.position.y = i;
        transport->deliverFeedback(feedback);
      }
    });
  }

  stager.join();
  for (auto &viewer : viewers) {
    viewer.join();
  }
  done.store(true);
  flusher.join();
  server->applyChanges();

  int totalCalls = 0;
  for (const auto &handler : handlers) {
    totalCalls += handler->calls.load();
  }
  BOOST_CHECK_EQUAL(totalCalls, NUM_FEEDBACK_THREADS * EVENTS_PER_THREAD);
  BOOST_CHECK_EQUAL(server->size(), static_cast<size_t>(NUM_MARKERS));
  BOOST_CHECK_EQUAL(server->getPendingCount(), 0u);

  std::vector<MarkerUpdate> published = transport->publishedCopy();
  for (size_t i = 1; i < published.size(); ++i) {
    BOOST_CHECK_GT(published[i].seqNum, published[i - 1].seqNum);
  }
}

BOOST_AUTO_TEST_SUITE_END()

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE LoopbackTransportTests
#include <boost/test/unit_test.hpp>

#include "transport/LoopbackTransport.hpp"

#include <string>
#include <vector>

using namespace MarkerSync;

namespace {

MarkerUpdate makeUpdate(uint64_t seq) {
  MarkerUpdate update;
  update.serverId = "test";
  update.seqNum = seq;
  update.erases.push_back("m" + std::to_string(seq));
  return update;
}

MarkerFeedback makeFeedback(const std::string &name, uint8_t eventType) {
  MarkerFeedback feedback;
  feedback.markerName = name;
  feedback.clientId = "client";
  feedback.eventType = eventType;
  return feedback;
}

} // namespace

struct LoopbackFixture {
  LoopbackTransport transport;
  const std::string updateTopic{"ns/update"};
  const std::string feedbackTopic{"ns/feedback"};
  const std::string service{"ns/get_interactive_markers"};
};

BOOST_FIXTURE_TEST_SUITE(LoopbackTransportTestSuite, LoopbackFixture)

BOOST_AUTO_TEST_CASE(PublishRequiresAdvertisedTopic) {
  BOOST_CHECK(!transport.publishUpdate(updateTopic, makeUpdate(1)));

  BOOST_REQUIRE(transport.advertiseUpdates(updateTopic, 10));
  BOOST_CHECK(transport.publishUpdate(updateTopic, makeUpdate(1)));
  BOOST_CHECK_EQUAL(transport.getQueuedUpdateCount(updateTopic), 1u);

  // Second advertisement of the same topic is refused
  BOOST_CHECK(!transport.advertiseUpdates(updateTopic, 10));

  BOOST_CHECK(transport.unadvertiseUpdates(updateTopic));
  BOOST_CHECK(!transport.unadvertiseUpdates(updateTopic));
  BOOST_CHECK(!transport.publishUpdate(updateTopic, makeUpdate(2)));
}

BOOST_AUTO_TEST_CASE(UpdatesReachEveryObserverInOrder) {
  BOOST_REQUIRE(transport.advertiseUpdates(updateTopic, 0));

  std::vector<uint64_t> first;
  std::vector<uint64_t> second;
  uint64_t idA = transport.subscribeUpdates(
      updateTopic, [&](const MarkerUpdate &u) { first.push_back(u.seqNum); });
  uint64_t idB = transport.subscribeUpdates(
      updateTopic, [&](const MarkerUpdate &u) { second.push_back(u.seqNum); });
  BOOST_CHECK_NE(idA, 0u);
  BOOST_CHECK_NE(idA, idB);

  for (uint64_t seq = 1; seq <= 5; ++seq) {
    BOOST_CHECK(transport.publishUpdate(updateTopic, makeUpdate(seq)));
  }

  // Nothing is delivered before spinning
  BOOST_CHECK(first.empty());
  BOOST_CHECK_EQUAL(transport.spinOnce(), 5u);

  const std::vector<uint64_t> expected{1, 2, 3, 4, 5};
  BOOST_CHECK_EQUAL_COLLECTIONS(first.begin(), first.end(), expected.begin(),
                                expected.end());
  BOOST_CHECK_EQUAL_COLLECTIONS(second.begin(), second.end(), expected.begin(),
                                expected.end());
  BOOST_CHECK_EQUAL(transport.getQueuedUpdateCount(updateTopic), 0u);

  // Queue is drained, a second spin delivers nothing
  BOOST_CHECK_EQUAL(transport.spinOnce(), 0u);
}

BOOST_AUTO_TEST_CASE(UnsubscribedObserverStopsReceiving) {
  BOOST_REQUIRE(transport.advertiseUpdates(updateTopic, 0));

  int received = 0;
  uint64_t id = transport.subscribeUpdates(
      updateTopic, [&](const MarkerUpdate &) { ++received; });

  transport.publishUpdate(updateTopic, makeUpdate(1));
  transport.spinOnce();
  BOOST_CHECK_EQUAL(received, 1);

  BOOST_CHECK(transport.unsubscribeUpdates(id));
  BOOST_CHECK(!transport.unsubscribeUpdates(id));

  transport.publishUpdate(updateTopic, makeUpdate(2));
  transport.spinOnce();
  BOOST_CHECK_EQUAL(received, 1);

  // Empty observers are refused
  BOOST_CHECK_EQUAL(transport.subscribeUpdates(updateTopic, nullptr), 0u);
}

BOOST_AUTO_TEST_CASE(BoundedUpdateQueueDropsOldest) {
  BOOST_REQUIRE(transport.advertiseUpdates(updateTopic, 3));

  std::vector<uint64_t> received;
  transport.subscribeUpdates(updateTopic, [&](const MarkerUpdate &u) {
    received.push_back(u.seqNum);
  });

  for (uint64_t seq = 1; seq <= 5; ++seq) {
    BOOST_CHECK(transport.publishUpdate(updateTopic, makeUpdate(seq)));
  }
  BOOST_CHECK_EQUAL(transport.getQueuedUpdateCount(updateTopic), 3u);
  BOOST_CHECK_EQUAL(transport.getDroppedCount(), 2u);

  transport.spinOnce();
  const std::vector<uint64_t> expected{3, 4, 5};
  BOOST_CHECK_EQUAL_COLLECTIONS(received.begin(), received.end(),
                                expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(FeedbackRoutesToSingleSink) {
  std::vector<std::string> names;
  BOOST_REQUIRE(transport.subscribeFeedback(
      feedbackTopic, 0,
      [&](const MarkerFeedback &fb) { names.push_back(fb.markerName); }));

  // One sink per feedback topic
  BOOST_CHECK(!transport.subscribeFeedback(feedbackTopic, 0,
                                           [](const MarkerFeedback &) {}));
  // Empty sinks are refused
  BOOST_CHECK(!transport.subscribeFeedback("other/feedback", 0, nullptr));

  BOOST_CHECK(transport.injectFeedback(
      feedbackTopic, makeFeedback("a", MarkerFeedback::BUTTON_CLICK)));
  BOOST_CHECK(transport.injectFeedback(
      feedbackTopic, makeFeedback("b", MarkerFeedback::MOUSE_DOWN)));
  BOOST_CHECK_EQUAL(transport.getQueuedFeedbackCount(feedbackTopic), 2u);

  BOOST_CHECK_EQUAL(transport.spinOnce(), 2u);
  BOOST_REQUIRE_EQUAL(names.size(), 2u);
  BOOST_CHECK_EQUAL(names[0], "a");
  BOOST_CHECK_EQUAL(names[1], "b");

  BOOST_CHECK(transport.unsubscribeFeedback(feedbackTopic));
  BOOST_CHECK(!transport.unsubscribeFeedback(feedbackTopic));
  BOOST_CHECK(!transport.injectFeedback(
      feedbackTopic, makeFeedback("c", MarkerFeedback::MOUSE_UP)));
}

BOOST_AUTO_TEST_CASE(FeedbackDepthOneKeepsLatestEvent) {
  std::vector<std::string> names;
  BOOST_REQUIRE(transport.subscribeFeedback(
      feedbackTopic, 1,
      [&](const MarkerFeedback &fb) { names.push_back(fb.markerName); }));

  transport.injectFeedback(feedbackTopic,
                           makeFeedback("old", MarkerFeedback::POSE_UPDATE));
  transport.injectFeedback(feedbackTopic,
                           makeFeedback("new", MarkerFeedback::POSE_UPDATE));
  BOOST_CHECK_EQUAL(transport.getDroppedCount(), 1u);

  transport.spinOnce();
  BOOST_REQUIRE_EQUAL(names.size(), 1u);
  BOOST_CHECK_EQUAL(names[0], "new");
}

BOOST_AUTO_TEST_CASE(SnapshotServiceCallsProvider) {
  BOOST_CHECK(!transport.callSnapshotService(service).has_value());

  int calls = 0;
  BOOST_REQUIRE(transport.advertiseSnapshotService(service, [&]() {
    ++calls;
    MarkerSnapshot snapshot;
    snapshot.seqNum = 7;
    snapshot.markers.resize(2);
    return snapshot;
  }));
  BOOST_CHECK(!transport.advertiseSnapshotService(
      service, []() { return MarkerSnapshot{}; }));

  auto response = transport.callSnapshotService(service);
  BOOST_REQUIRE(response.has_value());
  BOOST_CHECK_EQUAL(response->seqNum, 7u);
  BOOST_CHECK_EQUAL(response->markers.size(), 2u);
  BOOST_CHECK_EQUAL(calls, 1);

  BOOST_CHECK(transport.withdrawSnapshotService(service));
  BOOST_CHECK(!transport.withdrawSnapshotService(service));
  BOOST_CHECK(!transport.callSnapshotService(service).has_value());
}

BOOST_AUTO_TEST_CASE(CallbacksMayUseTransport) {
  BOOST_REQUIRE(transport.advertiseUpdates(updateTopic, 0));

  // An observer that publishes again must not deadlock; the new message
  // waits for the next spin
  int received = 0;
  transport.subscribeUpdates(updateTopic, [&](const MarkerUpdate &u) {
    ++received;
    if (u.seqNum == 1) {
      transport.publishUpdate(updateTopic, makeUpdate(2));
    }
  });

  transport.publishUpdate(updateTopic, makeUpdate(1));
  BOOST_CHECK_EQUAL(transport.spinOnce(), 1u);
  BOOST_CHECK_EQUAL(received, 1);
  BOOST_CHECK_EQUAL(transport.getQueuedUpdateCount(updateTopic), 1u);
  BOOST_CHECK_EQUAL(transport.spinOnce(), 1u);
  BOOST_CHECK_EQUAL(received, 2);
}

BOOST_AUTO_TEST_SUITE_END()

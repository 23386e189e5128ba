/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "transfer/transfer_events.hpp"

#include <gtest/gtest.h>

#include "testutil/context_wait.hpp"
#include "testutil/mocks/std_function.hpp"

namespace vegam::transfer {
  using testing::_;
  using testing::Field;

  using MockCallback = MockStdFunction<std::function<TransferEvents::Callback>>;

  class TransferEventsTest : public ::testing::Test {
   public:
    std::shared_ptr<boost::asio::io_context> io{
        std::make_shared<boost::asio::io_context>()};
    std::shared_ptr<TransferEvents> events{
        std::make_shared<TransferEvents>(io)};

    static TransferRecord makeRecord(const TransferId &id,
                                     TransferStatus status) {
      TransferRecord record;
      record.id = id;
      record.status = status;
      return record;
    }
  };

  /**
   * @given global and per id subscribers
   * @when updates and progress of two transfers are signalled
   * @then global one sees all, per id one sees only its transfer
   */
  TEST_F(TransferEventsTest, PerIdFiltering) {
    MockCallback progress;
    EXPECT_CALL(progress, Call(Field(&TransferRecord::id, "b"))).Times(1);
    events->subscribeProgress("b", progress.AsStdFunction());
    events->signalProgress(makeRecord("a", TransferStatus::kInProgress));
    events->signalProgress(makeRecord("b", TransferStatus::kInProgress));

    std::vector<TransferId> global, own;
    events->subscribeUpdate([&](auto &r) { global.push_back(r.id); });
    events->subscribeUpdate("a", [&](auto &r) { own.push_back(r.id); });

    events->signalUpdate(makeRecord("a", TransferStatus::kPending));
    events->signalUpdate(makeRecord("b", TransferStatus::kPending));
    EXPECT_TRUE(global.empty());
    runAll(*io);

    EXPECT_EQ(global, (std::vector<TransferId>{"a", "b"}));
    EXPECT_EQ(own, (std::vector<TransferId>{"a"}));
  }

  /**
   * @given per id subscriber
   * @when terminal update is delivered and later events are signalled
   * @then subscriber receives nothing after terminal update
   */
  TEST_F(TransferEventsTest, TerminalReleasesSubscribers) {
    std::vector<TransferStatus> seen;
    size_t progress{};
    events->subscribeUpdate("a", [&](auto &r) { seen.push_back(r.status); });
    events->subscribeProgress("a", [&](auto &) { ++progress; });

    events->signalProgress(makeRecord("a", TransferStatus::kInProgress));
    events->signalUpdate(makeRecord("a", TransferStatus::kCompleted));
    events->signalProgress(makeRecord("a", TransferStatus::kCompleted));
    events->signalUpdate(makeRecord("a", TransferStatus::kCompleted));
    runAll(*io);

    EXPECT_EQ(seen, (std::vector<TransferStatus>{TransferStatus::kCompleted}));
    EXPECT_EQ(progress, 1);
  }

  /**
   * @given per id subscribers of an ended and of an unknown transfer
   * @when they disconnect and another transfer is subscribed
   * @then their channels are released
   */
  TEST_F(TransferEventsTest, LateSubscriptionReleased) {
    events->signalUpdate(makeRecord("a", TransferStatus::kCompleted));
    runAll(*io);
    EXPECT_EQ(events->channelCount(), 0);

    auto ended{events->subscribeUpdate("a", [](auto &) {})};
    auto unknown{events->subscribeProgress("x", [](auto &) {})};
    EXPECT_EQ(events->channelCount(), 2);
    ended.disconnect();
    unknown.disconnect();

    auto live{events->subscribeUpdate("b", [](auto &) {})};
    EXPECT_EQ(events->channelCount(), 1);
    events->signalUpdate(makeRecord("b", TransferStatus::kFailed));
    runAll(*io);
    EXPECT_EQ(events->channelCount(), 0);
  }

  /**
   * @given subscriber with disconnected connection
   * @when update is signalled
   * @then callback is not called
   */
  TEST_F(TransferEventsTest, Disconnect) {
    MockCallback cb;
    EXPECT_CALL(cb, Call(_)).Times(0);
    auto connection{events->subscribeUpdate(cb.AsStdFunction())};
    connection.disconnect();
    events->signalUpdate(makeRecord("a", TransferStatus::kPending));
    runAll(*io);
  }

  /**
   * @given signalled but undelivered events
   * @when events are stopped
   * @then they are dropped
   */
  TEST_F(TransferEventsTest, Stop) {
    MockCallback cb;
    EXPECT_CALL(cb, Call(_)).Times(0);
    events->subscribeProgress(cb.AsStdFunction());
    events->signalProgress(makeRecord("a", TransferStatus::kInProgress));
    events->stop();
    runAll(*io);
  }
}  // namespace vegam::transfer

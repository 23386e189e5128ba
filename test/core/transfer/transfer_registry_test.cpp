/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "transfer/transfer_registry.hpp"

#include <gtest/gtest.h>
#include <thread>

#include "testutil/context_wait.hpp"
#include "testutil/outcome.hpp"
#include "transfer/transfer_error.hpp"

namespace vegam::transfer {
  class TransferRegistryTest : public ::testing::Test {
   public:
    std::shared_ptr<boost::asio::io_context> io{
        std::make_shared<boost::asio::io_context>()};
    std::shared_ptr<TransferEvents> events{
        std::make_shared<TransferEvents>(io)};
    TransferRegistry registry{events};

    TransferId createReceive(uint64_t size = 100) {
      return registry.create(
          TransferDirection::kReceive, "a.txt", size, "locator");
    }

    TransferRecord record(const TransferId &id) {
      return registry.get(id).value();
    }
  };

  /**
   * @given empty registry
   * @when transfer is created
   * @then record is pending with zero progress and fields preserved
   */
  TEST_F(TransferRegistryTest, Create) {
    auto id{registry.create(TransferDirection::kSend, "a.txt", 10, "xyz")};
    EXPECT_EQ(id.size(), 36);
    auto r{record(id)};
    EXPECT_EQ(r.id, id);
    EXPECT_EQ(r.direction, TransferDirection::kSend);
    EXPECT_EQ(r.file_name, "a.txt");
    EXPECT_EQ(r.file_size, 10);
    EXPECT_EQ(r.locator, "xyz");
    EXPECT_EQ(r.status, TransferStatus::kPending);
    EXPECT_EQ(r.bytes_transferred, 0);
    EXPECT_FALSE(r.error);
  }

  /**
   * @given empty registry
   * @when unknown id is used
   * @then kNotFound is returned by every operation
   */
  TEST_F(TransferRegistryTest, NotFound) {
    EXPECT_OUTCOME_ERROR(TransferError::kNotFound, registry.get("missing"));
    EXPECT_OUTCOME_ERROR(TransferError::kNotFound,
                         registry.updateProgress("missing", 1));
    EXPECT_OUTCOME_ERROR(TransferError::kNotFound,
                         registry.complete("missing"));
    EXPECT_OUTCOME_ERROR(TransferError::kNotFound,
                         registry.fail("missing", "error"));
    EXPECT_OUTCOME_ERROR(TransferError::kNotFound, registry.cancel("missing"));
  }

  /**
   * @given pending transfer of 100 bytes
   * @when progress samples arrive, one of them smaller and one too large
   * @then status is in progress, bytes never decrease and stay within size
   */
  TEST_F(TransferRegistryTest, ProgressMonotonicAndClamped) {
    auto id{createReceive()};
    EXPECT_OUTCOME_TRUE_1(registry.updateProgress(id, 40, boost::none, 400.0));
    EXPECT_EQ(record(id).status, TransferStatus::kInProgress);
    EXPECT_EQ(record(id).bytes_transferred, 40);
    EXPECT_EQ(record(id).speed_bytes_per_second, 400.0);

    EXPECT_OUTCOME_TRUE_1(registry.updateProgress(id, 30));
    EXPECT_EQ(record(id).bytes_transferred, 40);

    EXPECT_OUTCOME_TRUE_1(registry.updateProgress(id, 500));
    EXPECT_EQ(record(id).bytes_transferred, 100);
  }

  /**
   * @given legacy transfer with unknown size
   * @when progress carries actual size
   * @then size is corrected
   */
  TEST_F(TransferRegistryTest, SizeCorrection) {
    auto id{createReceive(0)};
    EXPECT_OUTCOME_TRUE_1(registry.updateProgress(id, 10, uint64_t{50}));
    EXPECT_EQ(record(id).file_size, 50);
    EXPECT_OUTCOME_TRUE_1(registry.updateProgress(id, 20, uint64_t{0}));
    EXPECT_EQ(record(id).file_size, 50);
  }

  /**
   * @given transfer in progress
   * @when it is completed
   * @then bytes equal size, repeated completion is a no-op and other terminal
   * transitions are rejected
   */
  TEST_F(TransferRegistryTest, CompleteIsTerminal) {
    auto id{createReceive()};
    EXPECT_OUTCOME_TRUE_1(registry.updateProgress(id, 60));
    EXPECT_OUTCOME_TRUE_1(registry.complete(id));
    EXPECT_EQ(record(id).status, TransferStatus::kCompleted);
    EXPECT_EQ(record(id).bytes_transferred, 100);

    EXPECT_OUTCOME_TRUE_1(registry.complete(id));
    EXPECT_OUTCOME_ERROR(TransferError::kInvalidTransition,
                         registry.fail(id, "late"));
    EXPECT_OUTCOME_ERROR(TransferError::kInvalidTransition,
                         registry.cancel(id));
    EXPECT_OUTCOME_ERROR(TransferError::kInvalidTransition,
                         registry.updateProgress(id, 100));
    EXPECT_EQ(record(id).status, TransferStatus::kCompleted);
    EXPECT_FALSE(record(id).error);
  }

  /**
   * @given pending transfer
   * @when it fails
   * @then error message is stored and speed is reset
   */
  TEST_F(TransferRegistryTest, Fail) {
    auto id{createReceive()};
    EXPECT_OUTCOME_TRUE_1(registry.updateProgress(id, 10, boost::none, 5.0));
    EXPECT_OUTCOME_TRUE_1(registry.fail(id, "connection reset"));
    auto r{record(id)};
    EXPECT_EQ(r.status, TransferStatus::kFailed);
    ASSERT_TRUE(r.error);
    EXPECT_EQ(*r.error, "connection reset");
    EXPECT_EQ(r.speed_bytes_per_second, 0);
    EXPECT_EQ(r.bytes_transferred, 10);
  }

  /**
   * @given pending transfer
   * @when it is cancelled twice
   * @then it stays cancelled without error
   */
  TEST_F(TransferRegistryTest, Cancel) {
    auto id{createReceive()};
    EXPECT_OUTCOME_TRUE_1(registry.cancel(id));
    EXPECT_OUTCOME_TRUE_1(registry.cancel(id));
    EXPECT_EQ(record(id).status, TransferStatus::kCancelled);
    EXPECT_OUTCOME_ERROR(TransferError::kInvalidTransition,
                         registry.complete(id));
  }

  /**
   * @given several transfers
   * @when listed
   * @then they are ordered by creation
   */
  TEST_F(TransferRegistryTest, ListOrder) {
    std::vector<TransferId> ids;
    for (auto i{0}; i < 20; ++i) {
      ids.push_back(createReceive());
    }
    auto list{registry.list()};
    ASSERT_EQ(list.size(), ids.size());
    for (size_t i{0}; i < ids.size(); ++i) {
      EXPECT_EQ(list[i].id, ids[i]);
      EXPECT_EQ(list[i].created_at, i);
    }
  }

  /**
   * @given subscriber to updates and progress
   * @when transfer goes through its lifecycle
   * @then updates are delivered in order with terminal one last
   */
  TEST_F(TransferRegistryTest, EventsOrder) {
    std::vector<TransferStatus> updates;
    std::vector<uint64_t> progress;
    events->subscribeUpdate(
        [&](auto &r) { updates.push_back(r.status); });
    events->subscribeProgress(
        [&](auto &r) { progress.push_back(r.bytes_transferred); });

    auto id{createReceive()};
    EXPECT_OUTCOME_TRUE_1(registry.updateProgress(id, 10));
    EXPECT_OUTCOME_TRUE_1(registry.updateProgress(id, 50));
    EXPECT_OUTCOME_TRUE_1(registry.complete(id));
    EXPECT_OUTCOME_TRUE_1(registry.complete(id));
    runAll(*io);

    EXPECT_EQ(updates,
              (std::vector<TransferStatus>{TransferStatus::kPending,
                                           TransferStatus::kInProgress,
                                           TransferStatus::kCompleted}));
    EXPECT_EQ(progress, (std::vector<uint64_t>{10, 50}));
  }

  /**
   * @given many transfers updated from several threads
   * @when all threads finish
   * @then every record holds its largest sample and completes once
   */
  TEST_F(TransferRegistryTest, Concurrent) {
    constexpr auto kThreads{4};
    constexpr auto kSamples{1000};
    std::vector<TransferId> ids;
    for (auto i{0}; i < kThreads; ++i) {
      ids.push_back(createReceive(kSamples));
    }
    std::vector<std::thread> threads;
    for (auto t{0}; t < kThreads; ++t) {
      threads.emplace_back([&, t] {
        for (auto i{1}; i <= kSamples; ++i) {
          for (auto &id : ids) {
            auto bytes{static_cast<uint64_t>((i + t) % kSamples)};
            EXPECT_OUTCOME_TRUE_1(registry.updateProgress(id, bytes));
          }
          registry.list();
        }
      });
    }
    for (auto &thread : threads) {
      thread.join();
    }
    for (auto &id : ids) {
      EXPECT_EQ(record(id).bytes_transferred, kSamples - 1);
    }
    threads.clear();
    for (auto t{0}; t < kThreads; ++t) {
      threads.emplace_back([&] {
        for (auto &id : ids) {
          EXPECT_OUTCOME_TRUE_1(registry.complete(id));
        }
      });
    }
    for (auto &thread : threads) {
      thread.join();
    }
    for (auto &id : ids) {
      auto r{record(id)};
      EXPECT_EQ(r.status, TransferStatus::kCompleted);
      EXPECT_EQ(r.bytes_transferred, kSamples);
    }
  }
}  // namespace vegam::transfer

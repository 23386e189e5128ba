/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "transfer/orchestrator.hpp"

#include <gtest/gtest.h>
#include <boost/asio/post.hpp>
#include <future>
#include <thread>

#include "clock/impl/steady_clock_impl.hpp"
#include "common/io_thread.hpp"
#include "testutil/outcome.hpp"
#include "testutil/storage/base_fs_test.hpp"
#include "transport/impl/tcp_peer_transport.hpp"

namespace vegam::transfer {
  namespace net = boost::asio;
  using net::ip::tcp;
  using transport::TcpPeerTransport;
  using transport::TcpTransportConfig;

  /// Peer which accepts connections and never answers them
  class SilentPeer {
   public:
    explicit SilentPeer(size_t connections)
        : acceptor_{io_,
                    tcp::endpoint{net::ip::make_address("127.0.0.1"), 0}},
          port_{acceptor_.local_endpoint().port()},
          thread_{[this, connections] {
            std::vector<tcp::socket> sockets;
            for (size_t i{0}; i < connections; ++i) {
              tcp::socket socket{io_};
              boost::system::error_code ec;
              acceptor_.accept(socket, ec);
              sockets.push_back(std::move(socket));
            }
            release_.get_future().wait();
          }} {}

    ~SilentPeer() {
      release_.set_value();
      thread_.join();
    }

    /// Legacy ticket pointing to this peer
    std::string ticket() const {
      return transport::makeLocator(transport::PeerContent{
          {"127.0.0.1", port_}, std::string(64, 'a'), std::string(16, 'b')});
    }

   private:
    net::io_context io_;
    tcp::acceptor acceptor_;
    uint16_t port_;
    std::promise<void> release_;
    std::thread thread_;
  };

  /// @return true if work posted to io runs within timeout
  bool runsWithin(net::io_context &io, std::chrono::milliseconds timeout) {
    auto ran{std::make_shared<std::promise<void>>()};
    auto future{ran->get_future()};
    net::post(io, [ran] { ran->set_value(); });
    return future.wait_for(timeout) == std::future_status::ready;
  }

  class OrchestratorTcpTest : public test::BaseFS_Test {
   public:
    OrchestratorTcpTest() : BaseFS_Test("vegam_orchestrator_tcp_test") {}

    void start(TcpTransportConfig config = {}) {
      config.listen_host = "127.0.0.1";
      auto store{std::make_shared<transport::BlobStore>()};
      transport = TcpPeerTransport::create(thread.io, store, config).value();
      transport->start();
      orchestrator = std::make_shared<TransferOrchestrator>(
          fetch_thread.io,
          registry,
          multiplexer,
          transport,
          platform::makeFileAccess(platform::FileAccessKind::kLocal),
          OrchestratorConfig{});
    }

    void TearDown() override {
      if (orchestrator) {
        for (auto &record : orchestrator->list()) {
          if (!isTerminal(record.status)) {
            EXPECT_OUTCOME_TRUE_1(orchestrator->cancel(record.id));
          }
        }
      }
      if (transport) {
        transport->stop();
      }
      BaseFS_Test::TearDown();
    }

    /// Polls record until it reaches status or time is out
    TransferRecord waitFor(const TransferId &id, TransferStatus status) {
      const auto deadline{std::chrono::steady_clock::now()
                          + std::chrono::seconds{10}};
      auto record{orchestrator->getStatus(id).value()};
      while (record.status != status
             && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
        record = orchestrator->getStatus(id).value();
      }
      return record;
    }

    std::string path(const std::string &name) const {
      return (base_path / name).string();
    }

    IoThread thread{2};
    IoThread fetch_thread{2};
    std::shared_ptr<TransferEvents> events{
        std::make_shared<TransferEvents>(thread.io)};
    std::shared_ptr<TransferRegistry> registry{
        std::make_shared<TransferRegistry>(events)};
    std::shared_ptr<ProgressMultiplexer> multiplexer{
        std::make_shared<ProgressMultiplexer>(
            registry,
            std::make_shared<clock::SteadyClockImpl>(),
            kDefaultThrottleInterval)};
    std::shared_ptr<TcpPeerTransport> transport;
    std::shared_ptr<TransferOrchestrator> orchestrator;
  };

  /**
   * @given two files with identical content, both sent
   * @when first ticket is received and first send is cancelled
   * @then only first send completes, second ticket is still receivable
   */
  TEST_F(OrchestratorTcpTest, IdenticalSendsAreIndependent) {
    start();
    const Bytes content(100000, 'x');
    createFile("a.txt", content);
    createFile("b.txt", content);
    EXPECT_OUTCOME_TRUE(a, orchestrator->send(path("a.txt")));
    EXPECT_OUTCOME_TRUE(b, orchestrator->send(path("b.txt")));
    EXPECT_NE(a.ticket, b.ticket);

    EXPECT_OUTCOME_TRUE(
        received_a, orchestrator->receive(a.ticket, path("a.out")));
    EXPECT_EQ(waitFor(received_a, TransferStatus::kCompleted).status,
              TransferStatus::kCompleted);
    EXPECT_EQ(waitFor(a.id, TransferStatus::kCompleted).status,
              TransferStatus::kCompleted);
    EXPECT_EQ(orchestrator->getStatus(b.id).value().status,
              TransferStatus::kPending);

    EXPECT_OUTCOME_TRUE_1(orchestrator->withdraw(a.id));
    EXPECT_OUTCOME_TRUE(
        received_b, orchestrator->receive(b.ticket, path("b.out")));
    EXPECT_EQ(waitFor(received_b, TransferStatus::kCompleted).status,
              TransferStatus::kCompleted);
    EXPECT_EQ(readFile("b.out"), content);
    EXPECT_EQ(waitFor(b.id, TransferStatus::kCompleted).status,
              TransferStatus::kCompleted);

    EXPECT_OUTCOME_TRUE_1(orchestrator->withdraw(b.id));
    EXPECT_EQ(transport->store()->size(), 0);
  }

  /**
   * @given two downloads stuck on a peer which never answers
   * @when both are cancelled
   * @then fetch threads are released and engine keeps handling work
   */
  TEST_F(OrchestratorTcpTest, CancelReleasesStalledDownloads) {
    start();
    SilentPeer peer{2};
    EXPECT_OUTCOME_TRUE(first,
                        orchestrator->receive(peer.ticket(), path("1.bin")));
    EXPECT_OUTCOME_TRUE(second,
                        orchestrator->receive(peer.ticket(), path("2.bin")));
    EXPECT_FALSE(
        runsWithin(*fetch_thread.io, std::chrono::milliseconds{300}));

    EXPECT_OUTCOME_TRUE_1(orchestrator->cancel(first));
    EXPECT_OUTCOME_TRUE_1(orchestrator->cancel(second));
    EXPECT_TRUE(runsWithin(*fetch_thread.io, std::chrono::seconds{3}));
    EXPECT_TRUE(runsWithin(*thread.io, std::chrono::seconds{3}));
    EXPECT_EQ(orchestrator->getStatus(first).value().status,
              TransferStatus::kCancelled);
    EXPECT_EQ(orchestrator->getStatus(second).value().status,
              TransferStatus::kCancelled);
  }

  /**
   * @given download stuck on a peer which never answers, short idle deadline
   * @when deadline passes
   * @then transfer is recorded as failed
   */
  TEST_F(OrchestratorTcpTest, StalledDownloadFails) {
    TcpTransportConfig config;
    config.idle_timeout = std::chrono::milliseconds{200};
    start(config);
    SilentPeer peer{1};
    EXPECT_OUTCOME_TRUE(id,
                        orchestrator->receive(peer.ticket(), path("1.bin")));
    auto record{waitFor(id, TransferStatus::kFailed)};
    EXPECT_EQ(record.status, TransferStatus::kFailed);
    EXPECT_TRUE(record.error);
  }
}  // namespace vegam::transfer

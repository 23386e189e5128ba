/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "config/engine_config.hpp"

#include <gtest/gtest.h>
#include <boost/program_options/errors.hpp>
#include <sstream>

namespace vegam::config {
  namespace po = boost::program_options;

  EngineConfig read(const std::string &text) {
    std::istringstream input{text};
    return readConfig(input);
  }

  /**
   * @given empty config
   * @when it is read
   * @then defaults are used
   */
  TEST(EngineConfigTest, Defaults) {
    auto config{read("")};
    EXPECT_EQ(config.throttleInterval(), std::chrono::milliseconds{100});
    EXPECT_EQ(config.placeholder_name, ticket::kDefaultPlaceholder);
    EXPECT_EQ(config.listen_port, 0);
    EXPECT_EQ(config.file_access, platform::FileAccessKind::kLocal);
    EXPECT_FALSE(config.seal_tickets);
    EXPECT_EQ(config.fetch_threads, 2);
    EXPECT_EQ(config.connectTimeout(), std::chrono::seconds{10});
    EXPECT_EQ(config.idleTimeout(), std::chrono::seconds{30});
  }

  /**
   * @given config with every key
   * @when it is read
   * @then fields hold configured values
   */
  TEST(EngineConfigTest, AllKeys) {
    auto config{read("throttle-ms = 250\n"
                     "placeholder-name = incoming.bin\n"
                     "listen-host = 127.0.0.1\n"
                     "advertise-host = 192.168.1.5\n"
                     "listen-port = 4100\n"
                     "download-dir = /tmp/downloads\n"
                     "file-access = uri\n"
                     "io-threads = 4\n"
                     "fetch-threads = 3\n"
                     "connect-timeout-ms = 500\n"
                     "idle-timeout-ms = 1500\n"
                     "seal-tickets = true\n"
                     "node-name = Living Room\n")};
    EXPECT_EQ(config.throttle_ms, 250);
    EXPECT_EQ(config.placeholder_name, "incoming.bin");
    EXPECT_EQ(config.listen_host, "127.0.0.1");
    EXPECT_EQ(config.advertise_host, "192.168.1.5");
    EXPECT_EQ(config.listen_port, 4100);
    EXPECT_EQ(config.download_dir, "/tmp/downloads");
    EXPECT_EQ(config.file_access, platform::FileAccessKind::kUri);
    EXPECT_EQ(config.io_threads, 4);
    EXPECT_EQ(config.fetch_threads, 3);
    EXPECT_EQ(config.connectTimeout(), std::chrono::milliseconds{500});
    EXPECT_EQ(config.idleTimeout(), std::chrono::milliseconds{1500});
    EXPECT_TRUE(config.seal_tickets);
    EXPECT_EQ(config.node_name, "Living Room");
  }

  /**
   * @given zero throttle interval
   * @when it is read
   * @then throttling is disabled
   */
  TEST(EngineConfigTest, ZeroThrottle) {
    EXPECT_EQ(read("throttle-ms = 0").throttleInterval().count(), 0);
  }

  /**
   * @given invalid configs
   * @when they are read
   * @then program options error is thrown
   */
  TEST(EngineConfigTest, Invalid) {
    EXPECT_THROW(read("throttle-ms = -5"), po::error);
    EXPECT_THROW(read("throttle-ms = fast"), po::error);
    EXPECT_THROW(read("idle-timeout-ms = 0"), po::error);
    EXPECT_THROW(read("connect-timeout-ms = -1"), po::error);
    EXPECT_THROW(read("file-access = ftp"), po::error);
    EXPECT_THROW(read("unknown-key = 1"), po::error);
  }

  /**
   * @when default node name is requested
   * @then it is not empty
   */
  TEST(EngineConfigTest, NodeName) {
    EXPECT_FALSE(defaultNodeName().empty());
  }
}  // namespace vegam::config

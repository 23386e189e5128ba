/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <thread>
#include <vector>

namespace vegam {
  /// Runs shared io_context on a fixed set of threads until destruction
  struct IoThread {
    inline explicit IoThread(size_t threads = 1)
        : io{std::make_shared<boost::asio::io_context>()},
          work{io->get_executor()} {
      if (threads == 0) {
        threads = 1;
      }
      for (size_t i = 0; i < threads; ++i) {
        this->threads.emplace_back([this] { io->run(); });
      }
    }
    inline ~IoThread() {
      io->stop();
      for (auto &thread : threads) {
        if (thread.joinable()) {
          thread.join();
        }
      }
    }
    IoThread(const IoThread &) = delete;
    IoThread &operator=(const IoThread &) = delete;

    std::shared_ptr<boost::asio::io_context> io;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type>
        work;
    std::vector<std::thread> threads;
  };
}  // namespace vegam

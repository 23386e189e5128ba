/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "transport/peer_transport.hpp"

namespace vegam::transport {
  class PeerTransportMock : public PeerTransport {
   public:
    MOCK_CONST_METHOD0(nodeId, std::string());
    MOCK_METHOD1(import, outcome::result<ContentHandle>(BytesIn));
    MOCK_METHOD2(publish,
                 outcome::result<Publication>(const ContentHandle &,
                                              ServeHandler));
    MOCK_METHOD1(unpublish, void(const std::string &));
    MOCK_CONST_METHOD1(resolve,
                       outcome::result<PeerContent>(const std::string &));
    MOCK_METHOD4(fetch,
                 outcome::result<uint64_t>(const PeerContent &,
                                           platform::FileWriter &,
                                           const ProgressCallback &,
                                           const CancelToken &));
  };
}  // namespace vegam::transport

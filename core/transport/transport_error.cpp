/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "transport/transport_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(vegam::transport, TransportError, e) {
  using vegam::transport::TransportError;
  switch (e) {
    case TransportError::kImportError:
      return "Transport: cannot import or publish content";
    case TransportError::kResolveError:
      return "Transport: cannot resolve locator";
    case TransportError::kFetchError:
      return "Transport: fetch failed";
    case TransportError::kPeerUnreachable:
      return "Transport: peer is unreachable";
    case TransportError::kContentNotFound:
      return "Transport: peer does not serve the content";
    case TransportError::kIntegrityMismatch:
      return "Transport: fetched content digest mismatch";
    case TransportError::kCancelled:
      return "Transport: cancelled";
  }
  return "Transport: unknown error";
}

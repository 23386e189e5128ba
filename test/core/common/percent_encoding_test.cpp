/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/percent_encoding.hpp"

#include <gtest/gtest.h>

namespace vegam::common {
  /**
   * @given percent encoded strings
   * @when decoded
   * @then escapes are replaced by bytes
   */
  TEST(PercentEncodingTest, Decode) {
    EXPECT_EQ(percentDecode("My%20File.txt").value(), "My File.txt");
    EXPECT_EQ(percentDecode("%e2%82%AC").value(), "\xe2\x82\xac");
    EXPECT_EQ(percentDecode("plain").value(), "plain");
    EXPECT_EQ(percentDecode("").value(), "");
  }

  /**
   * @given broken escapes
   * @when decoded
   * @then none is returned
   */
  TEST(PercentEncodingTest, Malformed) {
    EXPECT_FALSE(percentDecode("%"));
    EXPECT_FALSE(percentDecode("abc%2"));
    EXPECT_FALSE(percentDecode("%zz"));
  }
}  // namespace vegam::common

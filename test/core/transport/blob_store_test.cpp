/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "transport/blob_store.hpp"

#include <gtest/gtest.h>

namespace vegam::transport {
  using common::span::cbytes;

  /**
   * @given empty store
   * @when same content is put twice
   * @then both puts return its sha256 and content is stored once
   */
  TEST(BlobStoreTest, PutIsIdempotent) {
    BlobStore store;
    auto id{store.put(cbytes("abc"))};
    EXPECT_EQ(
        id, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    auto blob{store.get(id)};
    ASSERT_TRUE(blob);
    EXPECT_EQ(store.put(cbytes("abc")), id);
    EXPECT_EQ(store.get(id), blob);
    EXPECT_EQ(*blob, (Bytes{'a', 'b', 'c'}));
  }

  /**
   * @given content put twice
   * @when it is released
   * @then it stays until the last reference is released, while previously
   * returned blob stays valid
   */
  TEST(BlobStoreTest, ReleaseLastReference) {
    BlobStore store;
    auto id{store.put(cbytes("abc"))};
    store.put(cbytes("abc"));
    auto blob{store.get(id)};
    EXPECT_EQ(store.size(), 1);

    store.release(id);
    EXPECT_TRUE(store.contains(id));
    store.release(id);
    EXPECT_FALSE(store.contains(id));
    EXPECT_EQ(store.get(id), nullptr);
    EXPECT_EQ(store.size(), 0);
    EXPECT_EQ(blob->size(), 3);

    store.release(id);
    EXPECT_EQ(store.size(), 0);
  }
}  // namespace vegam::transport

/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ticket/sealed_ticket.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"
#include "ticket/ticket_error.hpp"

namespace vegam::ticket {
  const std::string kNodeId{"0123abcd"};
  const std::string kTicket{"a.txt|10|blob:127.0.0.1:4000:abc"};

  /**
   * @given plain ticket
   * @when sealed and unsealed
   * @then plain ticket is restored and envelope is url safe
   */
  TEST(SealedTicketTest, SealUnseal) {
    EXPECT_OUTCOME_TRUE(sealed, sealTicket(kTicket, kNodeId));
    EXPECT_TRUE(isSealedTicket(sealed));
    EXPECT_EQ(sealed.rfind("vegam://0123abcd:", 0), 0);
    EXPECT_EQ(sealed.find_first_of("=+/|", kSealedPrefix.size()),
              std::string::npos);
    EXPECT_OUTCOME_EQ(unsealTicket(sealed), kTicket);
  }

  /**
   * @given same ticket sealed twice
   * @then envelopes differ because of random nonce
   */
  TEST(SealedTicketTest, NonceIsRandom) {
    EXPECT_OUTCOME_TRUE(first, sealTicket(kTicket, kNodeId));
    EXPECT_OUTCOME_TRUE(second, sealTicket(kTicket, kNodeId));
    EXPECT_NE(first, second);
  }

  /**
   * @given envelope with changed node id
   * @when unsealed
   * @then kSealedTicketUndecryptable is returned
   */
  TEST(SealedTicketTest, WrongNodeId) {
    EXPECT_OUTCOME_TRUE(sealed, sealTicket(kTicket, kNodeId));
    auto forged{sealed};
    forged.replace(kSealedPrefix.size(), kNodeId.size(), "0123abce");
    EXPECT_OUTCOME_ERROR(TicketError::kSealedTicketUndecryptable,
                         unsealTicket(forged));
  }

  /**
   * @given envelope with flipped payload character
   * @when unsealed
   * @then authentication fails
   */
  TEST(SealedTicketTest, TamperedPayload) {
    EXPECT_OUTCOME_TRUE(sealed, sealTicket(kTicket, kNodeId));
    auto tampered{sealed};
    auto &c{tampered[tampered.size() / 2 + 10]};
    c = c == 'A' ? 'B' : 'A';
    EXPECT_OUTCOME_ERROR(TicketError::kSealedTicketUndecryptable,
                         unsealTicket(tampered));
  }

  /**
   * @given malformed envelopes
   * @when unsealed
   * @then kSealedTicketMalformed is returned
   */
  TEST(SealedTicketTest, Malformed) {
    for (std::string input : {"vegam://",
                              "vegam://node",
                              "vegam://:AAAA",
                              "vegam://node:AAAA",
                              "vegam://node:***",
                              "a.txt|10|xyz"}) {
      EXPECT_OUTCOME_ERROR(TicketError::kSealedTicketMalformed,
                           unsealTicket(input));
    }
  }

  /**
   * @given plain and sealed tickets
   * @when unsealIfSealed is called
   * @then plain is passed through and sealed is opened
   */
  TEST(SealedTicketTest, UnsealIfSealed) {
    EXPECT_OUTCOME_EQ(unsealIfSealed(kTicket), kTicket);
    EXPECT_OUTCOME_TRUE(sealed, sealTicket(kTicket, kNodeId));
    EXPECT_OUTCOME_EQ(unsealIfSealed(sealed), kTicket);
  }
}  // namespace vegam::ticket

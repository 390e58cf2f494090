/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ledger/call_blocking.hpp"

#include <gtest/gtest.h>
#include <thread>

#include "testutil/mocks/ledger/ledger_mock.hpp"
#include "testutil/outcome.hpp"

namespace paychan::ledger {
  using std::chrono::milliseconds;
  using testing::_;

  struct CallBlockingTest : ::testing::Test {
    LedgerMock ledger;
    const LedgerCall call{TopUpChannel{ChannelId{}, 1}};
  };

  /**
   * @given ledger answering synchronously
   * @when callBlocking
   * @then receipt is returned
   */
  TEST_F(CallBlockingTest, Receipt) {
    LedgerReceipt expected;
    expected.tx_hash[0] = 1;
    EXPECT_CALL(ledger, submit(_, _))
        .WillOnce(testing::Invoke(
            [&](auto &&, auto cb) { cb(expected); }));
    EXPECT_OUTCOME_TRUE(receipt, callBlocking(ledger, call, milliseconds{100}));
    EXPECT_EQ(receipt.tx_hash, expected.tx_hash);
  }

  /**
   * @given ledger answering with error
   * @when callBlocking
   * @then same error
   */
  TEST_F(CallBlockingTest, Error) {
    EXPECT_CALL(ledger, submit(_, _))
        .WillOnce(testing::Invoke(
            [](auto &&, auto cb) { cb(LedgerError::kRejected); }));
    EXPECT_OUTCOME_ERROR(LedgerError::kRejected,
                         callBlocking(ledger, call, milliseconds{100}));
  }

  /**
   * @given ledger that never answers
   * @when callBlocking
   * @then kTimeout
   */
  TEST_F(CallBlockingTest, Timeout) {
    EXPECT_CALL(ledger, submit(_, _)).WillOnce(testing::Return());
    EXPECT_OUTCOME_ERROR(LedgerError::kTimeout,
                         callBlocking(ledger, call, milliseconds{20}));
  }

  /**
   * @given ledger answering from another thread after timeout
   * @when callBlocking
   * @then kTimeout and late answer is dropped
   */
  TEST_F(CallBlockingTest, LateAnswer) {
    std::thread late;
    EXPECT_CALL(ledger, submit(_, _))
        .WillOnce(testing::Invoke([&](auto &&, auto cb) {
          late = std::thread{[cb] {
            std::this_thread::sleep_for(milliseconds{50});
            cb(LedgerReceipt{});
          }};
        }));
    EXPECT_OUTCOME_ERROR(LedgerError::kTimeout,
                         callBlocking(ledger, call, milliseconds{10}));
    late.join();
  }

  /**
   * @given ledger reporting balance
   * @when getChannelBalanceBlocking
   * @then balance is returned
   */
  TEST_F(CallBlockingTest, Balance) {
    EXPECT_CALL(ledger, getChannelBalance(_, _))
        .WillOnce(testing::Invoke([](auto &&, auto cb) {
          cb(ChannelBalance{100, 10});
        }));
    EXPECT_OUTCOME_TRUE(
        balance,
        getChannelBalanceBlocking(ledger, ChannelId{}, milliseconds{100}));
    EXPECT_EQ(balance.available, 100);
    EXPECT_EQ(balance.spent, 10);
  }
}  // namespace paychan::ledger

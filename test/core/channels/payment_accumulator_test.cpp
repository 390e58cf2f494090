/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "channels/payment_accumulator.hpp"

#include <limits>
#include <set>
#include <thread>

#include "testutil/channels/channel_fixture.hpp"
#include "testutil/mocks/crypto/signer/signer_mock.hpp"

namespace paychan::channels {
  using crypto::signer::SignerError;
  using crypto::signer::SignerMock;
  using testing::_;

  struct PaymentAccumulatorTest : ChannelFixture {};

  /**
   * @given channel with deposit 100
   * @when paying 10, 20, 5
   * @then cumulative state 35 at nonce 3 is signed by sender
   */
  TEST_F(PaymentAccumulatorTest, CumulativePayments) {
    const auto channel{open(100)};
    EXPECT_OUTCOME_TRUE(first, accumulator->pay(channel.id, 10));
    EXPECT_EQ(first.amount, 10);
    EXPECT_EQ(first.nonce, 1);
    EXPECT_OUTCOME_TRUE_1(accumulator->pay(channel.id, 20));
    EXPECT_OUTCOME_TRUE(last, accumulator->pay(channel.id, 5));
    EXPECT_EQ(last.channel_id, channel.id);
    EXPECT_EQ(last.amount, 35);
    EXPECT_EQ(last.nonce, 3);
    EXPECT_TRUE(accumulator->verifyPayment(last, sender));

    EXPECT_OUTCOME_TRUE(stored, store->getRecord(channel.id));
    EXPECT_EQ(stored.channel.spent, 35);
    EXPECT_EQ(stored.channel.balance, 65);
    EXPECT_EQ(stored.channel.nonce, 3);
    ASSERT_TRUE(stored.channel.last_signature);
    EXPECT_EQ(*stored.channel.last_signature, last.signature);
    ASSERT_EQ(stored.history.size(), 3);
    EXPECT_EQ(stored.history[1].amount, 20);
  }

  /**
   * @given signed payment
   * @when amount, nonce or expected sender changes
   * @then verification fails
   */
  TEST_F(PaymentAccumulatorTest, VerifyTampered) {
    const auto channel{open(100)};
    EXPECT_OUTCOME_TRUE(payment, accumulator->pay(channel.id, 10));
    auto tampered{payment};
    tampered.amount = 11;
    EXPECT_FALSE(accumulator->verifyPayment(tampered, sender));
    tampered = payment;
    tampered.nonce = 2;
    EXPECT_FALSE(accumulator->verifyPayment(tampered, sender));
    EXPECT_FALSE(accumulator->verifyPayment(payment, recipient));
    tampered = payment;
    tampered.signature[64] = 0;
    EXPECT_FALSE(verifyPayment(*signer, tampered, sender));
  }

  /**
   * @given channel with balance 5
   * @when paying 6, 0 or negative amount
   * @then rejected and channel unchanged
   */
  TEST_F(PaymentAccumulatorTest, InvalidPayments) {
    const auto channel{open(100)};
    EXPECT_OUTCOME_TRUE_1(accumulator->pay(channel.id, 95));
    EXPECT_OUTCOME_ERROR(ChannelError::kInsufficientChannelBalance,
                         accumulator->pay(channel.id, 6));
    EXPECT_OUTCOME_ERROR(ChannelError::kInvalidAmount,
                         accumulator->pay(channel.id, 0));
    EXPECT_OUTCOME_ERROR(ChannelError::kInvalidAmount,
                         accumulator->pay(channel.id, -1));
    EXPECT_OUTCOME_TRUE(stored, store->get(channel.id));
    EXPECT_EQ(stored.spent, 95);
    EXPECT_EQ(stored.nonce, 1);
    EXPECT_OUTCOME_TRUE(exact, accumulator->pay(channel.id, 5));
    EXPECT_EQ(exact.amount, 100);
  }

  /**
   * @given unknown, expired and closing channels
   * @when paying
   * @then payment is refused
   */
  TEST_F(PaymentAccumulatorTest, NotPayable) {
    EXPECT_OUTCOME_ERROR(ChannelError::kChannelNotFound,
                         accumulator->pay(ChannelId{}, 1));

    const auto channel{open(100)};
    advance(std::chrono::hours{24});
    EXPECT_OUTCOME_TRUE_1(accumulator->pay(channel.id, 1));
    advance(std::chrono::milliseconds{1});
    EXPECT_OUTCOME_ERROR(ChannelError::kChannelExpired,
                         accumulator->pay(channel.id, 1));

    const auto other{open(100)};
    EXPECT_OUTCOME_TRUE_1(store->update(
        other.id, [](ChannelRecord &record) -> outcome::result<void> {
          record.channel.state = ChannelState::kClosing;
          return outcome::success();
        }));
    EXPECT_OUTCOME_ERROR(ChannelError::kInvalidState,
                         accumulator->pay(other.id, 1));
  }

  /**
   * @given channel at maximum nonce
   * @when paying
   * @then kNonceOverflow
   */
  TEST_F(PaymentAccumulatorTest, NonceOverflow) {
    const auto channel{open(100)};
    EXPECT_OUTCOME_TRUE_1(store->update(
        channel.id, [](ChannelRecord &record) -> outcome::result<void> {
          record.channel.nonce = std::numeric_limits<Nonce>::max() - 1;
          return outcome::success();
        }));
    EXPECT_OUTCOME_ERROR(ChannelError::kNonceOverflow,
                         accumulator->batchPay(channel.id, {{1, ""}, {1, ""}}));
    EXPECT_OUTCOME_TRUE_1(accumulator->pay(channel.id, 1));
    EXPECT_OUTCOME_ERROR(ChannelError::kNonceOverflow,
                         accumulator->pay(channel.id, 1));
  }

  /**
   * @given signer that fails
   * @when paying
   * @then error and channel unchanged
   */
  TEST_F(PaymentAccumulatorTest, SignerFailure) {
    const auto channel{open(100)};
    auto failing{std::make_shared<SignerMock>()};
    EXPECT_CALL(*failing, sign(_, _))
        .WillRepeatedly(testing::Invoke(
            [](auto &&, auto &&) -> outcome::result<Signature> {
              return SignerError::kInvalidSignature;
            }));
    PaymentAccumulator broken{
        store, failing, sender_key, sender, clock, nullptr, boost::none};
    EXPECT_OUTCOME_ERROR(SignerError::kInvalidSignature,
                         broken.pay(channel.id, 10));
    EXPECT_OUTCOME_ERROR(SignerError::kInvalidSignature,
                         broken.batchPay(channel.id, {{10, "a"}}));
    EXPECT_OUTCOME_TRUE(stored, store->getRecord(channel.id));
    EXPECT_EQ(stored.channel.spent, 0);
    EXPECT_EQ(stored.channel.nonce, 0);
    EXPECT_TRUE(stored.history.empty());
  }

  /**
   * @given channel with deposit 100
   * @when batch of 10, 20, 30
   * @then one signature over (60, 3), entries get nonces 1..3
   */
  TEST_F(PaymentAccumulatorTest, Batch) {
    const auto channel{open(100)};
    EXPECT_OUTCOME_TRUE(
        receipt,
        accumulator->batchPay(channel.id,
                              {{10, "first"}, {20, "second"}, {30, "third"}}));
    EXPECT_EQ(receipt.count, 3);
    EXPECT_EQ(receipt.total_amount, 60);
    ASSERT_EQ(receipt.payments.size(), 3);
    for (size_t i{0}; i < 3; ++i) {
      EXPECT_EQ(receipt.payments[i].nonce, i + 1);
    }
    EXPECT_EQ(receipt.payments[1].memo, "second");
    EXPECT_EQ(receipt.payment.amount, 60);
    EXPECT_EQ(receipt.payment.nonce, 3);
    EXPECT_EQ(receipt.payment.signature, receipt.signature);
    EXPECT_TRUE(accumulator->verifyPayment(receipt.payment, sender));

    EXPECT_OUTCOME_TRUE(stored, store->getRecord(channel.id));
    EXPECT_EQ(stored.channel.nonce, 3);
    EXPECT_EQ(stored.channel.balance, 40);
    EXPECT_EQ(stored.history.size(), 3);

    EXPECT_OUTCOME_TRUE(next, accumulator->pay(channel.id, 1));
    EXPECT_EQ(next.nonce, 4);
  }

  /**
   * @given batch exceeding balance, with invalid item, or empty
   * @when batchPay
   * @then nothing is applied
   */
  TEST_F(PaymentAccumulatorTest, BatchAllOrNothing) {
    const auto channel{open(100)};
    EXPECT_OUTCOME_TRUE_1(accumulator->pay(channel.id, 50));
    EXPECT_OUTCOME_ERROR(
        ChannelError::kInsufficientChannelBalance,
        accumulator->batchPay(channel.id, {{30, ""}, {30, ""}}));
    EXPECT_OUTCOME_ERROR(
        ChannelError::kInvalidAmount,
        accumulator->batchPay(channel.id, {{10, ""}, {0, ""}}));
    EXPECT_OUTCOME_ERROR(ChannelError::kEmptyBatch,
                         accumulator->batchPay(channel.id, {}));
    EXPECT_OUTCOME_TRUE(stored, store->getRecord(channel.id));
    EXPECT_EQ(stored.channel.spent, 50);
    EXPECT_EQ(stored.channel.nonce, 1);
    EXPECT_EQ(stored.history.size(), 1);
  }

  /**
   * @given channel with deposit 100
   * @when 8 threads pay 1 ten times each
   * @then every payment gets distinct nonce and total is 80
   */
  TEST_F(PaymentAccumulatorTest, ConcurrentPayments) {
    const auto channel{open(100)};
    std::mutex mutex;
    std::set<Nonce> nonces;
    std::vector<std::thread> threads;
    for (auto i{0}; i < 8; ++i) {
      threads.emplace_back([&] {
        for (auto j{0}; j < 10; ++j) {
          auto payment{accumulator->pay(channel.id, 1)};
          EXPECT_TRUE(payment);
          if (payment) {
            std::lock_guard lock{mutex};
            nonces.insert(payment.value().nonce);
          }
        }
      });
    }
    for (auto &thread : threads) {
      thread.join();
    }
    EXPECT_EQ(nonces.size(), 80);
    EXPECT_EQ(*nonces.rbegin(), 80);
    EXPECT_OUTCOME_TRUE(stored, store->getRecord(channel.id));
    EXPECT_EQ(stored.channel.spent, 80);
    EXPECT_EQ(stored.channel.nonce, 80);
    EXPECT_EQ(stored.history.size(), 80);
  }
}  // namespace paychan::channels

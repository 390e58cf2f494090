/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "channels/lifecycle_manager.hpp"

#include <future>

#include "crypto/payment/payment_hash.hpp"
#include "testutil/channels/channel_fixture.hpp"
#include "testutil/mocks/ledger/ledger_mock.hpp"

namespace paychan::channels {
  using crypto::payment::paymentHash;
  using ledger::LedgerError;
  using ledger::LedgerMock;
  using ledger::LedgerReceipt;
  using std::chrono::milliseconds;
  using testing::_;

  struct LifecycleManagerTest : ChannelFixture {
    std::shared_ptr<LedgerMock> ledger_mock{std::make_shared<LedgerMock>()};
    /// Same store as `lifecycle`, ledger under test control
    std::shared_ptr<LifecycleManager> mocked{std::make_shared<LifecycleManager>(
        store,
        ledger_mock,
        signer,
        clock,
        sender,
        LifecycleConfig{seconds{86400}, milliseconds{20}, seconds{60}})};

    void ledgerAnswers(outcome::result<LedgerReceipt> answer) {
      EXPECT_CALL(*ledger_mock, submit(_, _))
          .WillOnce(testing::Invoke(
              [answer](auto &&, auto cb) { cb(answer); }));
    }

    void ledgerIsSilent() {
      EXPECT_CALL(*ledger_mock, submit(_, _)).WillOnce(testing::Return());
    }

    SignedPayment signState(const ChannelId &id,
                            const TokenAmount &amount,
                            Nonce nonce) {
      return {id,
              amount,
              nonce,
              signer->sign(paymentHash(id, amount, nonce).value(), sender_key)
                  .value(),
              nowMillis()};
    }
  };

  /**
   * @given funded sender
   * @when channel is created
   * @then open channel with full balance, deposit is locked on ledger
   */
  TEST_F(LifecycleManagerTest, Create) {
    const auto channel{open(100)};
    EXPECT_EQ(channel.state, ChannelState::kOpen);
    EXPECT_EQ(channel.sender, sender);
    EXPECT_EQ(channel.recipient, recipient);
    EXPECT_EQ(channel.deposit, 100);
    EXPECT_EQ(channel.balance, 100);
    EXPECT_EQ(channel.nonce, 0);
    EXPECT_EQ(channel.created_at, nowMillis());
    EXPECT_EQ(channel.expires_at, nowMillis() + seconds{86400});
    EXPECT_EQ(ledger->balanceOf(sender), 900);
    EXPECT_TRUE(store->has(channel.id));

    EXPECT_OUTCOME_TRUE(
        short_lived,
        lifecycle->createChannel({recipient, 10, seconds{60}, boost::none}));
    EXPECT_EQ(short_lived.expires_at, nowMillis() + seconds{60});
    EXPECT_NE(short_lived.id, channel.id);
  }

  /**
   * @given invalid deposit or not enough funds
   * @when channel is created
   * @then error and nothing is stored
   */
  TEST_F(LifecycleManagerTest, CreateFails) {
    EXPECT_OUTCOME_ERROR(
        ChannelError::kInvalidAmount,
        lifecycle->createChannel({recipient, 0, boost::none, boost::none}));
    EXPECT_OUTCOME_ERROR(
        ChannelError::kInvalidAmount,
        lifecycle->createChannel(
            {recipient, 10, boost::none, AutoTopupConfig{5, 0, boost::none}}));
    EXPECT_OUTCOME_ERROR(
        ChannelError::kLedgerCallFailed,
        lifecycle->createChannel({recipient, 1001, boost::none, boost::none}));
    EXPECT_EQ(store->size(), 0);
  }

  /**
   * @given ledger assigning its own channel id
   * @when channel is created
   * @then id from receipt is used
   */
  TEST_F(LifecycleManagerTest, CreateLedgerId) {
    LedgerReceipt receipt;
    receipt.channel_id = ChannelId{};
    receipt.channel_id->fill(0x42);
    ledgerAnswers(receipt);
    EXPECT_OUTCOME_TRUE(
        channel,
        mocked->createChannel({recipient, 10, boost::none, boost::none}));
    EXPECT_EQ(channel.id, *receipt.channel_id);
  }

  /**
   * @given channel with deposit 100 and payment of 10
   * @when closed
   * @then recipient gets 10, sender is refunded 90
   */
  TEST_F(LifecycleManagerTest, Close) {
    const auto channel{open(100)};
    EXPECT_OUTCOME_TRUE_1(accumulator->pay(channel.id, 10));
    EXPECT_OUTCOME_TRUE(settlement, lifecycle->closeChannel(channel.id));
    EXPECT_EQ(settlement.channel_id, channel.id);
    EXPECT_EQ(settlement.final_amount, 10);
    EXPECT_EQ(settlement.refund_amount, 90);
    EXPECT_EQ(settlement.settled_at, nowMillis());
    EXPECT_EQ(ledger->balanceOf(recipient), 10);
    EXPECT_EQ(ledger->balanceOf(sender), 990);

    EXPECT_OUTCOME_TRUE(closed, store->getRecord(channel.id));
    EXPECT_EQ(closed.channel.state, ChannelState::kClosed);
    EXPECT_EQ(closed.onchain_nonce, 1);
    EXPECT_FALSE(closed.channel.settlement_unresolved);

    EXPECT_OUTCOME_ERROR(ChannelError::kAlreadyClosed,
                         lifecycle->closeChannel(channel.id));
    EXPECT_OUTCOME_ERROR(ChannelError::kInvalidState,
                         accumulator->pay(channel.id, 1));
  }

  /**
   * @given channel with deposit 100 and ten payments of 1
   * @when closed
   * @then settlement carries the last cumulative amount of 10
   */
  TEST_F(LifecycleManagerTest, CloseAfterPayments) {
    const auto channel{open(100)};
    for (auto i{0}; i < 10; ++i) {
      EXPECT_OUTCOME_TRUE_1(accumulator->pay(channel.id, 1));
    }
    EXPECT_OUTCOME_TRUE(paid, store->get(channel.id));
    EXPECT_EQ(paid.spent, 10);
    EXPECT_EQ(paid.nonce, 10);
    EXPECT_EQ(paid.balance, 90);

    EXPECT_OUTCOME_TRUE(settlement, lifecycle->closeChannel(channel.id));
    EXPECT_EQ(settlement.final_amount, 10);
    EXPECT_EQ(settlement.refund_amount, 90);
    EXPECT_EQ(ledger->balanceOf(recipient), 10);
    EXPECT_EQ(ledger->balanceOf(sender), 990);
    EXPECT_OUTCOME_TRUE(closed, store->get(channel.id));
    EXPECT_EQ(closed.state, ChannelState::kClosed);
  }

  /**
   * @given channel without payments
   * @when closed
   * @then whole deposit is refunded
   */
  TEST_F(LifecycleManagerTest, CloseUnused) {
    const auto channel{open(100)};
    EXPECT_OUTCOME_TRUE(settlement, lifecycle->closeChannel(channel.id));
    EXPECT_EQ(settlement.final_amount, 0);
    EXPECT_EQ(settlement.refund_amount, 100);
    EXPECT_EQ(ledger->balanceOf(sender), 1000);
  }

  /**
   * @given ledger rejecting settlement
   * @when closed
   * @then kSettlementUnresolved, channel is closed with unresolved marker
   */
  TEST_F(LifecycleManagerTest, CloseRejected) {
    const auto channel{open(100)};
    EXPECT_OUTCOME_TRUE_1(accumulator->pay(channel.id, 10));
    ledgerAnswers(LedgerError::kRejected);
    EXPECT_OUTCOME_ERROR(ChannelError::kSettlementUnresolved,
                         mocked->closeChannel(channel.id));
    EXPECT_OUTCOME_TRUE(record, store->getRecord(channel.id));
    EXPECT_EQ(record.channel.state, ChannelState::kClosed);
    EXPECT_TRUE(record.channel.settlement_unresolved);
    ASSERT_TRUE(record.pending_call);
    const auto *close{boost::get<ledger::CloseChannel>(&*record.pending_call)};
    ASSERT_NE(close, nullptr);
    EXPECT_EQ(close->amount, 10);
    EXPECT_EQ(close->nonce, 1);

    ledgerAnswers(LedgerReceipt{});
    EXPECT_OUTCOME_TRUE(reconciled, mocked->reconcileSettlement(channel.id));
    EXPECT_EQ(reconciled.state, ChannelState::kClosed);
    EXPECT_FALSE(reconciled.settlement_unresolved);
  }

  /**
   * @given ledger that does not answer in time
   * @when closed, then reconciled against working ledger
   * @then channel stays closing until reconciled, then closed and paid out
   */
  TEST_F(LifecycleManagerTest, CloseTimeout) {
    const auto channel{open(100)};
    EXPECT_OUTCOME_TRUE_1(accumulator->pay(channel.id, 10));
    ledgerIsSilent();
    EXPECT_OUTCOME_ERROR(ChannelError::kSettlementUnresolved,
                         mocked->closeChannel(channel.id));
    EXPECT_OUTCOME_TRUE(closing, store->get(channel.id));
    EXPECT_EQ(closing.state, ChannelState::kClosing);
    EXPECT_TRUE(closing.settlement_unresolved);
    EXPECT_OUTCOME_ERROR(ChannelError::kInvalidState,
                         lifecycle->closeChannel(channel.id));

    EXPECT_OUTCOME_TRUE(reconciled,
                        lifecycle->reconcileSettlement(channel.id));
    EXPECT_EQ(reconciled.state, ChannelState::kClosed);
    EXPECT_FALSE(reconciled.settlement_unresolved);
    EXPECT_EQ(ledger->balanceOf(recipient), 10);
    EXPECT_OUTCOME_ERROR(ChannelError::kNoUnresolvedSettlement,
                         lifecycle->reconcileSettlement(channel.id));
  }

  /**
   * @given unresolved settlement and ledger still silent
   * @when reconciled
   * @then still unresolved
   */
  TEST_F(LifecycleManagerTest, ReconcileTimeout) {
    const auto channel{open(100)};
    EXPECT_OUTCOME_ERROR(ChannelError::kNoUnresolvedSettlement,
                         lifecycle->reconcileSettlement(channel.id));
    EXPECT_CALL(*ledger_mock, submit(_, _))
        .Times(2)
        .WillRepeatedly(testing::Return());
    EXPECT_OUTCOME_ERROR(ChannelError::kSettlementUnresolved,
                         mocked->closeChannel(channel.id));
    EXPECT_OUTCOME_ERROR(ChannelError::kSettlementUnresolved,
                         mocked->reconcileSettlement(channel.id));
    EXPECT_OUTCOME_TRUE(record, store->get(channel.id));
    EXPECT_TRUE(record.settlement_unresolved);
  }

  /**
   * @given payment signed at nonce 2
   * @when disputed
   * @then channel is disputed until deadline, ledger pays out disputed state
   */
  TEST_F(LifecycleManagerTest, Dispute) {
    const auto channel{open(100)};
    EXPECT_OUTCOME_TRUE_1(accumulator->pay(channel.id, 10));
    EXPECT_OUTCOME_TRUE(latest, accumulator->pay(channel.id, 20));
    EXPECT_OUTCOME_TRUE(result, lifecycle->disputeChannel(channel.id, latest));
    EXPECT_EQ(result.channel_id, channel.id);
    EXPECT_EQ(result.disputed_amount, 30);
    EXPECT_EQ(result.challenge_ends_at, nowMillis() + seconds{3600});

    EXPECT_OUTCOME_TRUE(record, store->getRecord(channel.id));
    EXPECT_EQ(record.channel.state, ChannelState::kDisputed);
    EXPECT_EQ(record.onchain_nonce, 2);
    ASSERT_TRUE(record.challenge_deadline);
    EXPECT_EQ(*record.challenge_deadline, result.challenge_ends_at);

    EXPECT_OUTCOME_ERROR(ChannelError::kInvalidState,
                         lifecycle->disputeChannel(channel.id, latest));
    EXPECT_OUTCOME_ERROR(ChannelError::kInvalidState,
                         lifecycle->closeChannel(channel.id));

    EXPECT_OUTCOME_TRUE_1(ledger->resolveDispute(
        channel.id, result.challenge_ends_at + milliseconds{1}));
    EXPECT_EQ(ledger->balanceOf(recipient), 30);
    EXPECT_EQ(ledger->balanceOf(sender), 970);
  }

  /**
   * @given invalid payments
   * @when disputed
   * @then rejected before ledger is called
   */
  TEST_F(LifecycleManagerTest, DisputeInvalid) {
    const auto channel{open(100)};
    EXPECT_OUTCOME_TRUE(payment, accumulator->pay(channel.id, 10));

    auto other_channel{payment};
    other_channel.channel_id[0] ^= 1;
    EXPECT_OUTCOME_ERROR(ChannelError::kPaymentChannelMismatch,
                         lifecycle->disputeChannel(channel.id, other_channel));

    auto forged{payment};
    forged.amount = 50;
    EXPECT_OUTCOME_ERROR(ChannelError::kSignatureVerificationFailed,
                         lifecycle->disputeChannel(channel.id, forged));

    EXPECT_OUTCOME_ERROR(
        ChannelError::kStaleNonce,
        lifecycle->disputeChannel(channel.id, signState(channel.id, 10, 0)));
    EXPECT_OUTCOME_ERROR(
        ChannelError::kInsufficientChannelBalance,
        lifecycle->disputeChannel(channel.id, signState(channel.id, 101, 5)));

    EXPECT_OUTCOME_TRUE(stored, store->get(channel.id));
    EXPECT_EQ(stored.state, ChannelState::kOpen);

    EXPECT_OUTCOME_TRUE_1(lifecycle->closeChannel(channel.id));
    EXPECT_OUTCOME_ERROR(ChannelError::kAlreadyClosed,
                         lifecycle->disputeChannel(channel.id, payment));
  }

  /**
   * @given ledger rejecting dispute
   * @when disputed
   * @then kLedgerCallFailed and prior state restored
   */
  TEST_F(LifecycleManagerTest, DisputeRejected) {
    const auto channel{open(100)};
    EXPECT_OUTCOME_TRUE(payment, accumulator->pay(channel.id, 10));
    ledgerAnswers(LedgerError::kBadSignature);
    EXPECT_OUTCOME_ERROR(ChannelError::kLedgerCallFailed,
                         mocked->disputeChannel(channel.id, payment));
    EXPECT_OUTCOME_TRUE(stored, store->get(channel.id));
    EXPECT_EQ(stored.state, ChannelState::kOpen);
    EXPECT_FALSE(stored.settlement_unresolved);
  }

  /**
   * @given ledger not answering dispute, ledger accepting it later
   * @when disputed, then reconciled
   * @then disputed with deadline from reconciliation receipt
   */
  TEST_F(LifecycleManagerTest, DisputeTimeout) {
    const auto channel{open(100)};
    EXPECT_OUTCOME_TRUE(payment, accumulator->pay(channel.id, 10));
    ledgerIsSilent();
    EXPECT_OUTCOME_ERROR(ChannelError::kSettlementUnresolved,
                         mocked->disputeChannel(channel.id, payment));
    EXPECT_OUTCOME_TRUE(pending, store->get(channel.id));
    EXPECT_EQ(pending.state, ChannelState::kDisputed);
    EXPECT_TRUE(pending.settlement_unresolved);

    LedgerReceipt receipt;
    receipt.challenge_deadline = nowMillis() + seconds{10};
    ledgerAnswers(receipt);
    EXPECT_OUTCOME_TRUE(reconciled, mocked->reconcileSettlement(channel.id));
    EXPECT_EQ(reconciled.state, ChannelState::kDisputed);
    EXPECT_FALSE(reconciled.settlement_unresolved);
    EXPECT_OUTCOME_TRUE(record, store->getRecord(channel.id));
    ASSERT_TRUE(record.challenge_deadline);
    EXPECT_EQ(*record.challenge_deadline, nowMillis() + seconds{10});
    EXPECT_EQ(record.onchain_nonce, 1);
  }

  /**
   * @given close awaiting ledger answer
   * @when recipient dispute is accepted meanwhile and ledger rejects close
   * @then channel stays disputed, close is not marked for reconciliation
   */
  TEST_F(LifecycleManagerTest, DisputeDuringClose) {
    const auto channel{open(100)};
    EXPECT_OUTCOME_TRUE(payment, accumulator->pay(channel.id, 10));
    LifecycleManager patient{
        store,
        ledger_mock,
        signer,
        clock,
        sender,
        LifecycleConfig{seconds{86400}, milliseconds{5000}, seconds{60}}};

    std::promise<CbT<LedgerReceipt>> close_submitted;
    EXPECT_CALL(*ledger_mock, submit(_, _))
        .WillOnce(testing::Invoke([&](auto &&, auto cb) {
          close_submitted.set_value(std::move(cb));
        }))
        .WillOnce(testing::Invoke(
            [](auto &&, auto cb) { cb(LedgerReceipt{}); }));

    auto closing{std::async(std::launch::async,
                            [&] { return patient.closeChannel(channel.id); })};
    auto answer_close{close_submitted.get_future().get()};
    EXPECT_OUTCOME_TRUE(closing_state, store->get(channel.id));
    EXPECT_EQ(closing_state.state, ChannelState::kClosing);

    EXPECT_OUTCOME_TRUE_1(patient.disputeChannel(channel.id, payment));
    answer_close(LedgerError::kRejected);
    EXPECT_OUTCOME_ERROR(ChannelError::kInvalidState, closing.get());

    EXPECT_OUTCOME_TRUE(record, store->getRecord(channel.id));
    EXPECT_EQ(record.channel.state, ChannelState::kDisputed);
    EXPECT_FALSE(record.channel.settlement_unresolved);
    EXPECT_FALSE(record.pending_call);
    EXPECT_EQ(record.onchain_nonce, 1);
    EXPECT_OUTCOME_ERROR(ChannelError::kNoUnresolvedSettlement,
                         patient.reconcileSettlement(channel.id));
  }

  /**
   * @given open channel
   * @when extended
   * @then expiry moves forward, closed channel can not be extended
   */
  TEST_F(LifecycleManagerTest, Extend) {
    const auto channel{open(100)};
    EXPECT_OUTCOME_TRUE_1(lifecycle->extendChannel(channel.id, seconds{3600}));
    EXPECT_OUTCOME_TRUE(extended, store->get(channel.id));
    EXPECT_EQ(extended.expires_at, channel.expires_at + seconds{3600});
    EXPECT_OUTCOME_ERROR(ChannelError::kInvalidAmount,
                         lifecycle->extendChannel(channel.id, seconds{0}));

    advance(std::chrono::hours{24} + std::chrono::minutes{30});
    EXPECT_OUTCOME_TRUE_1(accumulator->pay(channel.id, 1));

    EXPECT_OUTCOME_TRUE_1(lifecycle->closeChannel(channel.id));
    EXPECT_OUTCOME_ERROR(ChannelError::kInvalidState,
                         lifecycle->extendChannel(channel.id, seconds{60}));
  }

  /**
   * @given open channel
   * @when topped up manually
   * @then deposit and balance grow, auto top-up counter does not
   */
  TEST_F(LifecycleManagerTest, TopUp) {
    const auto channel{open(100)};
    EXPECT_OUTCOME_TRUE_1(accumulator->pay(channel.id, 30));
    EXPECT_OUTCOME_TRUE_1(lifecycle->topUpChannel(channel.id, 50));
    EXPECT_OUTCOME_TRUE(record, store->getRecord(channel.id));
    EXPECT_EQ(record.channel.deposit, 150);
    EXPECT_EQ(record.channel.balance, 120);
    EXPECT_EQ(record.topup_count, 1);
    EXPECT_EQ(record.auto_topups, 0);
    EXPECT_EQ(ledger->balanceOf(sender), 850);

    EXPECT_OUTCOME_ERROR(ChannelError::kInvalidAmount,
                         lifecycle->topUpChannel(channel.id, 0));
    EXPECT_OUTCOME_ERROR(ChannelError::kLedgerCallFailed,
                         lifecycle->topUpChannel(channel.id, 10000));
    EXPECT_OUTCOME_TRUE(unchanged, store->get(channel.id));
    EXPECT_EQ(unchanged.deposit, 150);
  }

  /**
   * @given channel known to store
   * @when tracked again
   * @then kDuplicateChannel
   */
  TEST_F(LifecycleManagerTest, Track) {
    const auto channel{open(100)};
    EXPECT_OUTCOME_ERROR(ChannelError::kDuplicateChannel,
                         lifecycle->trackChannel(channel));
    auto copy{channel};
    copy.id[0] ^= 1;
    EXPECT_OUTCOME_TRUE_1(lifecycle->trackChannel(copy));
    EXPECT_EQ(store->size(), 2);
  }
}  // namespace paychan::channels

#include "lft/transfer/session.hpp"
#include "lft/transfer/verification.hpp"

#include <gtest/gtest.h>

using lft::Error;
using lft::ErrorCode;
using lft::transfer::Role;
using lft::transfer::TransferPhase;
using lft::transfer::TransferSession;
using lft::transfer::VerificationAccumulator;

TEST(TransferSessionTest, StartMovesReceiverToAwaitingHeader) {
    TransferSession session{Role::Receiver};
    EXPECT_EQ(session.phase(), TransferPhase::Idle);

    ASSERT_TRUE(session.start("10.0.0.2:5001").is_ok());
    EXPECT_EQ(session.phase(), TransferPhase::AwaitingHeader);
    EXPECT_EQ(session.peer(), "10.0.0.2:5001");

    auto again = session.start("other");
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error().code, ErrorCode::ProtocolViolation);
}

TEST(TransferSessionTest, StartMovesSenderToSendingHeader) {
    TransferSession session{Role::Sender};
    ASSERT_TRUE(session.start("peer").is_ok());
    EXPECT_EQ(session.phase(), TransferPhase::SendingHeader);
}

TEST(TransferSessionTest, ReceiverFolderPath) {
    TransferSession session{Role::Receiver};
    ASSERT_TRUE(session.start("peer").is_ok());

    EXPECT_TRUE(session.transition_to(TransferPhase::ReceivingEntries).is_ok());
    EXPECT_TRUE(session.transition_to(TransferPhase::ReceivingData).is_ok());
    EXPECT_TRUE(session.transition_to(TransferPhase::ReceivingEntries).is_ok());
    EXPECT_TRUE(session.transition_to(TransferPhase::AwaitingHandshake).is_ok());
    EXPECT_TRUE(session.transition_to(TransferPhase::Verifying).is_ok());
    EXPECT_TRUE(session.transition_to(TransferPhase::Complete).is_ok());
    EXPECT_TRUE(session.finished());

    auto illegal = session.transition_to(TransferPhase::ReceivingEntries);
    EXPECT_TRUE(illegal.is_error());
}

TEST(TransferSessionTest, ReceiverCannotSkipVerification) {
    TransferSession session{Role::Receiver};
    ASSERT_TRUE(session.start("peer").is_ok());
    ASSERT_TRUE(session.transition_to(TransferPhase::ReceivingEntries).is_ok());

    EXPECT_TRUE(session.transition_to(TransferPhase::Complete).is_error());
    EXPECT_TRUE(session.transition_to(TransferPhase::Verifying).is_error());
    EXPECT_EQ(session.phase(), TransferPhase::ReceivingEntries);
}

TEST(TransferSessionTest, SenderPhasesAreSeparateFromReceiverPhases) {
    TransferSession session{Role::Sender};
    ASSERT_TRUE(session.start("peer").is_ok());

    EXPECT_TRUE(session.transition_to(TransferPhase::ReceivingEntries).is_error());
    EXPECT_TRUE(session.transition_to(TransferPhase::SendingEntries).is_ok());
    EXPECT_TRUE(session.transition_to(TransferPhase::AwaitingAcknowledgment).is_ok());
    EXPECT_TRUE(session.transition_to(TransferPhase::Complete).is_ok());
}

TEST(TransferSessionTest, AbortFromAnyNonTerminalPhaseKeepsFirstError) {
    TransferSession session{Role::Receiver};
    ASSERT_TRUE(session.start("peer").is_ok());
    ASSERT_TRUE(session.transition_to(TransferPhase::ReceivingData).is_ok());

    session.abort(Error(ErrorCode::SizeMismatch, "short file"));
    EXPECT_EQ(session.phase(), TransferPhase::Aborted);
    ASSERT_TRUE(session.error().has_value());
    EXPECT_EQ(session.error()->code, ErrorCode::SizeMismatch);

    session.abort(Error(ErrorCode::IOFailure, "later"));
    EXPECT_EQ(session.error()->code, ErrorCode::SizeMismatch);
    EXPECT_TRUE(session.transition_to(TransferPhase::Complete).is_error());
}

TEST(TransferSessionTest, CompleteSessionIgnoresAbort) {
    TransferSession session{Role::Sender};
    ASSERT_TRUE(session.start("peer").is_ok());
    ASSERT_TRUE(session.transition_to(TransferPhase::SendingData).is_ok());
    ASSERT_TRUE(session.transition_to(TransferPhase::Complete).is_ok());

    session.abort(Error(ErrorCode::Cancelled, "too late"));
    EXPECT_EQ(session.phase(), TransferPhase::Complete);
    EXPECT_FALSE(session.error().has_value());
}

TEST(VerificationAccumulatorTest, CountsAndVerifies) {
    VerificationAccumulator counters;
    counters.record_item();
    counters.record_item();
    counters.record_bytes(5);
    counters.record_bytes(1000000);

    auto match = counters.verify(2, 1000005);
    EXPECT_TRUE(match.matched);
    EXPECT_EQ(match.items_received, 2u);
    EXPECT_EQ(match.bytes_received, 1000005u);

    auto mismatch = counters.verify(3, 1000005);
    EXPECT_FALSE(mismatch.matched);
    EXPECT_EQ(mismatch.items_expected, 3u);
    EXPECT_EQ(mismatch.describe(),
              "expected 3 items / 1000005 bytes, received 2 items / 1000005 bytes");
}

TEST(VerificationAccumulatorTest, EmptyTransferMatchesZeroTotals) {
    VerificationAccumulator counters;
    EXPECT_TRUE(counters.verify(0, 0).matched);
    EXPECT_FALSE(counters.verify(1, 0).matched);
}

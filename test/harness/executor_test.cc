#include <gtest/gtest.h>
#include "../../src/common/errors.h"
#include "../../src/harness/executor.h"
#include "../sim/simulated_lu.h"

using namespace MpathPr;

namespace {
constexpr int kLocal = 0;
constexpr int kPeer = 1;
} // namespace

class CommandExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        lu_.SetNexusCount(kLocal, 2);
    }

    PrState Run(const PrState& state, const Operation& op, bool peer_reserves_first = false) {
        return executor_.Execute(state, PlannedOperation{op, peer_reserves_first});
    }

    SimulatedLu lu_;
    FakePrTool local_{lu_, kLocal, "/dev/mapper/mpatha"};
    FakePrTool peer_{lu_, kPeer, "/dev/sdb"};
    CommandExecutor executor_{local_, peer_};
    PrState clean_ = InitialState(0x1, 0x2);
};

TEST_F(CommandExecutorTest, RegisterThenReserve) {
    PrState registered = Run(clean_, Register{KeyChange::kNewKey});
    EXPECT_EQ(lu_.KeyOf(kLocal), Key{0x2});
    EXPECT_EQ(registered.local_key, 0x2u);

    PrState reserved = Run(registered, Reserve{});
    EXPECT_EQ(lu_.holder(), kLocal);
    EXPECT_EQ(lu_.ReservationKey(), Key{0x2});
    EXPECT_EQ(reserved.holder, Holder::kLocal);
}

TEST_F(CommandExecutorTest, ReRegisterSendsCurrentKey) {
    PrState state = Run(clean_, Register{KeyChange::kNewKey});
    // The LU rejects a REGISTER with the wrong reservation key
    state = Run(state, Register{KeyChange::kNewKey});
    EXPECT_EQ(lu_.KeyOf(kLocal), Key{0x3});
    state = Run(state, Register{KeyChange::kUnregister});
    EXPECT_FALSE(lu_.KeyOf(kLocal).has_value());
    EXPECT_EQ(state.local_key, kNoKey);
}

TEST_F(CommandExecutorTest, PeerPreemptTakesReservation) {
    PrState state = Run(Run(clean_, Register{KeyChange::kNewKey}), Reserve{});
    state = Run(state, Preempt{Initiator::kPeer});
    EXPECT_EQ(lu_.holder(), kPeer);
    EXPECT_EQ(lu_.ReservationKey(), Key{0x1});
    EXPECT_FALSE(lu_.KeyOf(kLocal).has_value());
    EXPECT_EQ(state.holder, Holder::kPeer);
    EXPECT_EQ(state.pending_preemption, Key{0x2});
}

TEST_F(CommandExecutorTest, LocalPreemptAfterPeerGrab) {
    PrState state = Run(clean_, Register{KeyChange::kNewKey});
    state = Run(state, Preempt{Initiator::kLocal}, true);
    EXPECT_EQ(lu_.holder(), kLocal);
    EXPECT_FALSE(lu_.KeyOf(kPeer).has_value());
    EXPECT_EQ(state.holder, Holder::kLocal);
    EXPECT_EQ(state.pending_preemption, Key{0x1});
}

TEST_F(CommandExecutorTest, LocalPreemptWithoutGrab) {
    PrState state = Run(clean_, Register{KeyChange::kNewKey});
    state = Run(state, Preempt{Initiator::kLocal}, false);
    EXPECT_FALSE(lu_.holder().has_value());
    EXPECT_EQ(state.holder, Holder::kNone);
}

TEST_F(CommandExecutorTest, FailedCommandLeavesStateUntouched) {
    PrState registered = Run(clean_, Register{KeyChange::kNewKey});
    local_.FailNextCommand();
    EXPECT_THROW(Run(registered, Reserve{}), ToolInvocationFailure);
    EXPECT_FALSE(lu_.holder().has_value());
}

TEST_F(CommandExecutorTest, ClearAllRemovesBothInitiators) {
    PrState state = Run(Run(clean_, Register{KeyChange::kNewKey}), Reserve{});
    state = Run(state, Preempt{Initiator::kPeer});
    ASSERT_TRUE(lu_.KeyOf(kPeer).has_value());

    EXPECT_TRUE(executor_.ClearAllRegistrations());
    EXPECT_FALSE(lu_.KeyOf(kLocal).has_value());
    EXPECT_FALSE(lu_.KeyOf(kPeer).has_value());
    EXPECT_FALSE(lu_.holder().has_value());
}

TEST_F(CommandExecutorTest, ClearAllIsBestEffort) {
    Run(clean_, Register{KeyChange::kNewKey});
    peer_.FailNextCommand();
    local_.FailNextCommand();
    EXPECT_FALSE(executor_.ClearAllRegistrations());
    // Nothing thrown, and the next attempt succeeds
    EXPECT_TRUE(executor_.ClearAllRegistrations());
    EXPECT_FALSE(lu_.KeyOf(kLocal).has_value());
}

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "../../src/common/errors.h"
#include "../../src/tools/pr_tool.h"
#include "mock_command_runner.h"

using namespace MpathPr;
using ::testing::ElementsAre;
using ::testing::Return;
using ::testing::_;

class PersistToolTest : public ::testing::Test {
protected:
    void SetUp() override {
        runner_ = std::make_shared<::testing::StrictMock<MockCommandRunner>>();
        tool_ = std::make_unique<PersistTool>(runner_, "mpathpersist", "/dev/mapper/mpatha", RetryPolicy{});
        tool_->SetSleeper([this](std::chrono::milliseconds d) { sleeps_.push_back(d); });
    }

    std::shared_ptr<::testing::StrictMock<MockCommandRunner>> runner_;
    std::unique_ptr<PersistTool> tool_;
    std::vector<std::chrono::milliseconds> sleeps_;
};

TEST_F(PersistToolTest, RegisterOmitsReservationKeyWhenUnregistered) {
    EXPECT_CALL(*runner_, Run(ElementsAre("mpathpersist", "--out", "--register",
                                          "--param-sark=0x2", "/dev/mapper/mpatha")))
        .WillOnce(Return(Exited(0)));
    tool_->Register(std::nullopt, 0x2);
}

TEST_F(PersistToolTest, RegisterWithExistingKey) {
    EXPECT_CALL(*runner_, Run(ElementsAre("mpathpersist", "--out", "--register", "--param-rk=0x2",
                                          "--param-sark=0x3", "/dev/mapper/mpatha")))
        .WillOnce(Return(Exited(0)));
    tool_->Register(Key{0x2}, 0x3);
}

TEST_F(PersistToolTest, OutCommandArguments) {
    ::testing::InSequence seq;
    EXPECT_CALL(*runner_, Run(ElementsAre("mpathpersist", "--out", "--register-ignore",
                                          "--param-sark=0x0", "/dev/mapper/mpatha")))
        .WillOnce(Return(Exited(0)));
    EXPECT_CALL(*runner_, Run(ElementsAre("mpathpersist", "--out", "--reserve", "--param-rk=0x2",
                                          "--prout-type=5", "/dev/mapper/mpatha")))
        .WillOnce(Return(Exited(0)));
    EXPECT_CALL(*runner_, Run(ElementsAre("mpathpersist", "--out", "--release", "--param-rk=0x2",
                                          "--prout-type=5", "/dev/mapper/mpatha")))
        .WillOnce(Return(Exited(0)));
    EXPECT_CALL(*runner_, Run(ElementsAre("mpathpersist", "--out", "--clear", "--param-rk=0x2",
                                          "/dev/mapper/mpatha")))
        .WillOnce(Return(Exited(0)));
    EXPECT_CALL(*runner_, Run(ElementsAre("mpathpersist", "--out", "--preempt", "--param-rk=0x2",
                                          "--param-sark=0x1", "--prout-type=5", "/dev/mapper/mpatha")))
        .WillOnce(Return(Exited(0)));

    tool_->RegisterIgnore(kNoKey);
    tool_->Reserve(0x2, 5);
    tool_->Release(0x2, 5);
    tool_->Clear(0x2);
    tool_->Preempt(0x2, 0x1, 5);
}

TEST_F(PersistToolTest, UnitAttentionIsRetried) {
    EXPECT_CALL(*runner_, Run(_))
        .WillOnce(Return(Exited(6)))
        .WillOnce(Return(Exited(6)))
        .WillOnce(Return(Exited(0)));
    tool_->Reserve(0x2, 5);
    ASSERT_EQ(sleeps_.size(), 2u);
    EXPECT_EQ(sleeps_[0], std::chrono::milliseconds(100));
}

TEST_F(PersistToolTest, UnitAttentionGivesUpAfterThreeAttempts) {
    EXPECT_CALL(*runner_, Run(_)).Times(3).WillRepeatedly(Return(Exited(6)));
    EXPECT_THROW(tool_->Reserve(0x2, 5), RetryableTransient);
    // Back off only between attempts
    EXPECT_EQ(sleeps_.size(), 2u);
}

TEST_F(PersistToolTest, OtherFailuresAreNotRetried) {
    EXPECT_CALL(*runner_, Run(_)).WillOnce(Return(Exited(24, "reservation conflict")));
    EXPECT_THROW(tool_->Reserve(0x2, 5), ToolInvocationFailure);
    EXPECT_TRUE(sleeps_.empty());
}

TEST_F(PersistToolTest, ReadKeysParsesOutput) {
    EXPECT_CALL(*runner_, Run(ElementsAre("mpathpersist", "-ik", "/dev/mapper/mpatha")))
        .WillOnce(Return(Exited(0, "  PR generation=0x4, 2 registered reservation keys follow:\n"
                                   "    0x2\n    0x2\n")));
    KeyReport report = tool_->ReadKeys();
    EXPECT_TRUE(report.Contains(0x2));
    EXPECT_EQ(report.registrations, 2u);
}

TEST_F(PersistToolTest, ReadReservationRetriesUnitAttention) {
    EXPECT_CALL(*runner_, Run(ElementsAre("mpathpersist", "-ir", "/dev/mapper/mpatha")))
        .WillOnce(Return(Exited(6)))
        .WillOnce(Return(Exited(0, "  PR generation=0x4, there is NO reservation held\n")));
    EXPECT_FALSE(tool_->ReadReservation().Held());
}

TEST_F(PersistToolTest, ReadFailureThrows) {
    EXPECT_CALL(*runner_, Run(_)).WillOnce(Return(Exited(1)));
    EXPECT_THROW(tool_->ReadKeys(), ToolInvocationFailure);
}

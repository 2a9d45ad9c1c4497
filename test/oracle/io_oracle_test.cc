#include <gtest/gtest.h>
#include "../../src/common/errors.h"
#include "../../src/oracle/io_oracle.h"
#include "../sim/fake_process.h"

using namespace MpathPr;

class IoOracleControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        OracleOptions options;
        options.program = "mpath_pr_io_oracle";
        options.extra_args = {"--interval_ms=100"};
        controller_ = std::make_unique<IoOracleController>("/dev/mapper/mpatha", options,
                                                           launcher_.launcher());
        controller_->SetSleeper([](std::chrono::milliseconds) {});
    }

    FakeLauncher launcher_;
    std::unique_ptr<IoOracleController> controller_;
};

TEST_F(IoOracleControllerTest, StartPassesDeviceAndExpectation) {
    controller_->Start(IoExpectation::kPass);
    ASSERT_EQ(launcher_.launched.size(), 1u);
    EXPECT_EQ(launcher_.last()->argv,
              (std::vector<std::string>{"mpath_pr_io_oracle", "--interval_ms=100",
                                        "/dev/mapper/mpatha", "pass"}));
    EXPECT_TRUE(controller_->running());
    EXPECT_EQ(controller_->expectation(), IoExpectation::kPass);
}

TEST_F(IoOracleControllerTest, StartFailsIfProcessDiesDuringGrace) {
    launcher_.fail_next_start = true;
    EXPECT_THROW(controller_->Start(IoExpectation::kFail), BackgroundProcessFault);
    EXPECT_FALSE(controller_->running());
}

TEST_F(IoOracleControllerTest, DoubleStartIsRejected) {
    controller_->Start(IoExpectation::kPass);
    EXPECT_THROW(controller_->Start(IoExpectation::kPass), BackgroundProcessFault);
}

TEST_F(IoOracleControllerTest, RestartOnlyWhenExpectationChanges) {
    controller_->Start(IoExpectation::kPass);
    EXPECT_FALSE(controller_->StopIfChanging(IoExpectation::kPass));
    EXPECT_EQ(launcher_.last()->stops, 0);

    EXPECT_TRUE(controller_->StopIfChanging(IoExpectation::kFail));
    EXPECT_EQ(launcher_.last()->stops, 1);
    EXPECT_FALSE(controller_->running());

    controller_->Start(IoExpectation::kFail);
    EXPECT_EQ(launcher_.launched.size(), 2u);
    EXPECT_EQ(launcher_.last()->argv.back(), "fail");
}

TEST_F(IoOracleControllerTest, UncleanStopIsAViolation) {
    controller_->Start(IoExpectation::kFail);
    // The oracle saw a write succeed and is exiting with status 1
    launcher_.last()->on_exit = ExitStatus{true, 1, 0};
    EXPECT_THROW(controller_->StopIfChanging(IoExpectation::kPass), BackgroundProcessFault);
    EXPECT_FALSE(controller_->running());
}

TEST_F(IoOracleControllerTest, CheckAliveReportsDeath) {
    controller_->Start(IoExpectation::kPass);
    EXPECT_NO_THROW(controller_->CheckAlive());

    launcher_.last()->Die(1);
    try {
        controller_->CheckAlive();
        FAIL() << "expected BackgroundProcessFault";
    } catch (const BackgroundProcessFault& e) {
        EXPECT_NE(std::string(e.what()).find("exit code 1"), std::string::npos);
    }
    EXPECT_FALSE(controller_->running());
    EXPECT_THROW(controller_->CheckAlive(), BackgroundProcessFault);
}

TEST_F(IoOracleControllerTest, StopQuietlyNeverThrows) {
    EXPECT_TRUE(controller_->StopQuietly());

    controller_->Start(IoExpectation::kPass);
    launcher_.last()->ignores_term = true;
    EXPECT_FALSE(controller_->StopQuietly());
    EXPECT_FALSE(controller_->running());
}

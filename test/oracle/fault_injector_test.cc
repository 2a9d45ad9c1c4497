#include <gtest/gtest.h>
#include <signal.h>
#include "../../src/common/errors.h"
#include "../../src/oracle/fault_injector.h"
#include "../sim/fake_process.h"

using namespace MpathPr;

class FaultInjectorTest : public ::testing::Test {
protected:
    FakeLauncher launcher_;
    FaultInjector injector_{"./multipath-test.sh", "mpatha", std::chrono::milliseconds(1000),
                            launcher_.launcher()};
};

TEST_F(FaultInjectorTest, StartsWithMapName) {
    injector_.Start();
    ASSERT_EQ(launcher_.launched.size(), 1u);
    EXPECT_EQ(launcher_.last()->argv, (std::vector<std::string>{"./multipath-test.sh", "mpatha"}));
    EXPECT_NO_THROW(injector_.CheckAlive());
}

TEST_F(FaultInjectorTest, DeathIsDetected) {
    injector_.Start();
    launcher_.last()->Die(2);
    EXPECT_THROW(injector_.CheckAlive(), BackgroundProcessFault);
}

TEST_F(FaultInjectorTest, TerminationBySigtermIsClean) {
    injector_.Start();
    launcher_.last()->on_exit = ExitStatus{false, 0, SIGTERM};
    EXPECT_TRUE(injector_.StopQuietly());
    EXPECT_FALSE(injector_.running());
}

TEST_F(FaultInjectorTest, FailedRestoreIsReported) {
    injector_.Start();
    launcher_.last()->on_exit = ExitStatus{true, 1, 0};
    EXPECT_THROW(injector_.Stop(), BackgroundProcessFault);
    // Already gone; a second stop is a no-op
    EXPECT_TRUE(injector_.StopQuietly());
}

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "../../src/common/errors.h"
#include "../../src/tools/multipath_daemon.h"
#include "mock_command_runner.h"

using namespace MpathPr;
using ::testing::ElementsAre;
using ::testing::Return;
using ::testing::_;

class MultipathDaemonTest : public ::testing::Test {
protected:
    void SetUp() override {
        runner_ = std::make_shared<MockCommandRunner>();
        daemon_ = std::make_unique<MultipathDaemon>(runner_, "multipathd", "multipath");
    }

    std::shared_ptr<MockCommandRunner> runner_;
    std::unique_ptr<MultipathDaemon> daemon_;
};

TEST_F(MultipathDaemonTest, GetPrKey) {
    EXPECT_CALL(*runner_, Run(ElementsAre("multipathd", "getprkey", "map", "mpatha")))
        .WillOnce(Return(Exited(0, "0x2\n")))
        .WillOnce(Return(Exited(0, "none\n")))
        .WillOnce(Return(Exited(0, "fail\n")));
    EXPECT_EQ(daemon_->GetPrKey("mpatha"), Key{0x2});
    EXPECT_FALSE(daemon_->GetPrKey("mpatha").has_value());
    EXPECT_THROW(daemon_->GetPrKey("mpatha"), ToolInvocationFailure);
}

TEST_F(MultipathDaemonTest, StatusAndHold) {
    EXPECT_CALL(*runner_, Run(ElementsAre("multipathd", "getprstatus", "map", "mpatha")))
        .WillOnce(Return(Exited(0, "set\n")))
        .WillOnce(Return(Exited(0, "unset\n")));
    EXPECT_CALL(*runner_, Run(ElementsAre("multipathd", "getprhold", "map", "mpatha")))
        .WillOnce(Return(Exited(0, "unset\n")))
        .WillOnce(Return(Exited(0, "timeout\n")));
    EXPECT_TRUE(daemon_->GetPrStatus("mpatha"));
    EXPECT_FALSE(daemon_->GetPrStatus("mpatha"));
    EXPECT_FALSE(daemon_->GetPrHold("mpatha"));
    EXPECT_THROW(daemon_->GetPrHold("mpatha"), ToolInvocationFailure);
}

TEST_F(MultipathDaemonTest, DaemonFailureThrows) {
    EXPECT_CALL(*runner_, Run(_)).WillOnce(Return(Exited(1, "error receiving packet\n")));
    EXPECT_THROW(daemon_->GetPrStatus("mpatha"), ToolInvocationFailure);
}

TEST_F(MultipathDaemonTest, MapWwidMatchesWholeName) {
    EXPECT_CALL(*runner_, Run(ElementsAre("multipathd", "show", "maps", "raw", "format", "%n %w")))
        .WillRepeatedly(Return(Exited(0, "mpathaa 36001405aaaa\nmpatha 36001405bbbb\n")));
    EXPECT_EQ(daemon_->MapWwid("mpatha"), "36001405bbbb");
    EXPECT_EQ(daemon_->MapWwid("mpathaa"), "36001405aaaa");
    EXPECT_THROW(daemon_->MapWwid("mpathb"), ToolInvocationFailure);
}

TEST_F(MultipathDaemonTest, MapPaths) {
    EXPECT_CALL(*runner_, Run(ElementsAre("multipathd", "show", "paths", "raw", "format", "%m %d")))
        .WillOnce(Return(Exited(0, "mpatha sdb\nmpathb sdc\nmpatha sdd\n")));
    EXPECT_THAT(daemon_->MapPaths("mpatha"), ElementsAre("sdb", "sdd"));
}

TEST_F(MultipathDaemonTest, DumpTopologyUsesMultipath) {
    EXPECT_CALL(*runner_, Run(ElementsAre("multipath", "-l", "mpatha")))
        .WillOnce(Return(Exited(0, "mpatha (36001405bbbb) dm-0 LIO-ORG,disk0\n")));
    EXPECT_EQ(daemon_->DumpTopology("mpatha"), "mpatha (36001405bbbb) dm-0 LIO-ORG,disk0\n");
}

TEST(RawDeviceWwidTest, QueriesUdevSerial) {
    MockCommandRunner runner;
    EXPECT_CALL(runner, Run(ElementsAre("udevadm", "info", "-n", "/dev/sdb", "--query=property",
                                        "--property=ID_SERIAL", "--value")))
        .WillOnce(Return(Exited(0, "36001405bbbb\n")))
        .WillOnce(Return(Exited(0, "\n")));
    EXPECT_EQ(RawDeviceWwid(runner, "udevadm", "/dev/sdb"), "36001405bbbb");
    EXPECT_THROW(RawDeviceWwid(runner, "udevadm", "/dev/sdb"), ToolInvocationFailure);
}

#include "../standby_guard.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "mock_disk_power_interface.hpp"

#include <gtest/gtest.h>

using namespace smfc;
using namespace smfc::control;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

namespace
{
const std::vector<std::string> disks{"/dev/disk/by-id/d0", "/dev/disk/by-id/d1",
                                     "/dev/disk/by-id/d2",
                                     "/dev/disk/by-id/d3"};

// Make the mock report the given STANDBY states
void setStates(MockDiskPowerInterface& power, const std::vector<bool>& states)
{
    for (size_t i = 0; i < disks.size(); i++)
    {
        ON_CALL(power, isStandby(disks[i])).WillByDefault(Return(states[i]));
    }
}
} // namespace

TEST(StandbyGuardTest, TestSync)
{
    auto power = std::make_shared<NiceMock<MockDiskPowerInterface>>();
    auto start = Clock::now();

    setStates(*power, {false, false, false, false});
    StandbyGuard guard{disks, 1, power, start};
    EXPECT_FALSE(guard.isArrayStandby());
    EXPECT_EQ(guard.getStateString(), "AAAA");
    EXPECT_EQ(guard.getStates(), std::vector<bool>(disks.size(), false));

    // Nothing changes while every disk is active
    EXPECT_CALL(*power, setStandby(_)).Times(0);
    guard.run(start + 1h);
    EXPECT_FALSE(guard.isArrayStandby());
    ::testing::Mock::VerifyAndClearExpectations(power.get());

    // One disk went to standby, the other three follow
    setStates(*power, {false, true, false, false});
    EXPECT_CALL(*power, setStandby(disks[0])).Times(1);
    EXPECT_CALL(*power, setStandby(disks[1])).Times(0);
    EXPECT_CALL(*power, setStandby(disks[2])).Times(1);
    EXPECT_CALL(*power, setStandby(disks[3])).Times(1);
    guard.run(start + 2h);
    EXPECT_TRUE(guard.isArrayStandby());
    EXPECT_EQ(guard.getStateString(), "SSSS");
    EXPECT_EQ(guard.getChangeTime(), start + 2h);
    ::testing::Mock::VerifyAndClearExpectations(power.get());

    // Staying in standby
    setStates(*power, {true, true, true, true});
    EXPECT_CALL(*power, setStandby(_)).Times(0);
    guard.run(start + 3h);
    EXPECT_TRUE(guard.isArrayStandby());

    // One disk woke up, nothing is written
    setStates(*power, {true, true, false, true});
    guard.run(start + 4h);
    EXPECT_FALSE(guard.isArrayStandby());
    EXPECT_EQ(guard.getStateString(), "SSAS");
    EXPECT_EQ(guard.getStates(), (std::vector<bool>{true, true, false, true}));
    EXPECT_EQ(guard.getChangeTime(), start + 4h);
}

TEST(StandbyGuardTest, TestLimit)
{
    auto power = std::make_shared<NiceMock<MockDiskPowerInterface>>();
    auto start = Clock::now();

    setStates(*power, {false, false, false, false});
    StandbyGuard guard{disks, 2, power, start};
    EXPECT_EQ(guard.getHdLimit(), 2);

    // One disk in standby is not enough
    setStates(*power, {false, false, true, false});
    EXPECT_CALL(*power, setStandby(_)).Times(0);
    guard.run(start + 1h);
    EXPECT_FALSE(guard.isArrayStandby());
    ::testing::Mock::VerifyAndClearExpectations(power.get());

    setStates(*power, {true, false, true, false});
    EXPECT_CALL(*power, setStandby(_)).Times(2);
    guard.run(start + 2h);
    EXPECT_TRUE(guard.isArrayStandby());
}

TEST(StandbyGuardTest, TestInitialStandby)
{
    auto power = std::make_shared<NiceMock<MockDiskPowerInterface>>();

    setStates(*power, {true, true, true, true});
    StandbyGuard standby{disks, 1, power, Clock::now()};
    EXPECT_TRUE(standby.isArrayStandby());

    // Only a fully sleeping array starts in standby
    setStates(*power, {true, true, false, true});
    StandbyGuard active{disks, 1, power, Clock::now()};
    EXPECT_FALSE(active.isArrayStandby());
}

TEST(StandbyGuardTest, TestQueryFailure)
{
    auto power = std::make_shared<NiceMock<MockDiskPowerInterface>>();
    auto start = Clock::now();

    setStates(*power, {false, true, false, false});
    StandbyGuard guard{disks, 2, power, start};
    EXPECT_EQ(guard.getStateString(), "ASAA");

    // The states of a failed query are not kept
    ON_CALL(*power, isStandby(disks[0])).WillByDefault(Return(true));
    ON_CALL(*power, isStandby(disks[2]))
        .WillByDefault(Throw(IOError("smartctl failed")));
    EXPECT_THROW(guard.run(start + 1h), IOError);
    EXPECT_EQ(guard.getStateString(), "ASAA");
    EXPECT_FALSE(guard.isArrayStandby());
}

namespace
{
// Number of logged messages containing the text
size_t countLogs(const std::string& text)
{
    size_t count = 0;
    for (const auto& entry : getLogger().getLogs())
    {
        if (entry[1].get<std::string>().find(text) != std::string::npos)
        {
            count++;
        }
    }
    return count;
}
} // namespace

TEST(StandbyGuardTest, TestFailedStandbyNotLogged)
{
    auto& logger = getLogger();
    auto level = logger.getLevel();
    logger.setLevel(Logger::info);
    logger.clear();

    auto power = std::make_shared<NiceMock<MockDiskPowerInterface>>();
    auto start = Clock::now();

    setStates(*power, {false, false, false, false});
    StandbyGuard guard{disks, 1, power, start};

    // The array cannot be put into standby
    setStates(*power, {true, false, false, false});
    EXPECT_CALL(*power, setStandby(disks[1]))
        .WillOnce(Throw(IOError("smartctl failed")));
    EXPECT_THROW(guard.run(start + 1h), IOError);
    EXPECT_FALSE(guard.isArrayStandby());
    EXPECT_EQ(countLogs("ACTIVE to STANDBY"), 0);
    ::testing::Mock::VerifyAndClearExpectations(power.get());

    // Once it worked the change is logged with the states that caused it
    EXPECT_CALL(*power, setStandby(_)).Times(3);
    guard.run(start + 2h);
    EXPECT_TRUE(guard.isArrayStandby());
    EXPECT_EQ(countLogs("Change ACTIVE to STANDBY after 2.0 hour(s) [SAAA]"),
              1);

    logger.clear();
    logger.setLevel(level);
}

TEST(StandbyGuardTest, TestInvalid)
{
    auto power = std::make_shared<NiceMock<MockDiskPowerInterface>>();
    setStates(*power, {false, false, false, false});

    EXPECT_THROW((StandbyGuard{{}, 1, power, Clock::now()}),
                 ConfigurationError);
    EXPECT_THROW((StandbyGuard{disks, 0, power, Clock::now()}),
                 ConfigurationError);
    EXPECT_THROW((StandbyGuard{disks, 5, power, Clock::now()}),
                 ConfigurationError);
}

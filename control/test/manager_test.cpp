#include "../manager.hpp"
#include "errors.hpp"
#include "mock_fan_interface.hpp"
#include "mock_sensor_interface.hpp"
#include "static_resolver.hpp"

#include <sdeventplus/event.hpp>

#include <gtest/gtest.h>

using namespace smfc;
using namespace smfc::control;
using namespace smfc::control::test;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

class ManagerTest : public ::testing::Test
{
  protected:
    ManagerTest() : event(sdeventplus::Event::get_default())
    {
        ON_CALL(*sensors, read(_)).WillByDefault(Return(45000));
        ON_CALL(*fans, getFanMode())
            .WillByDefault(Return(static_cast<int>(FanMode::full)));
    }

    std::unique_ptr<Zone> makeZone(const std::string& name, IpmiZone zone,
                                   Seconds polling)
    {
        ZoneConfig config;
        config.name = name;
        config.ipmiZone = zone;
        config.count = 1;
        config.tempCalc = Aggregation::avg;
        config.steps = 6;
        config.sensitivity = 3.0;
        config.polling = polling;
        config.minTemp = 30.0;
        config.maxTemp = 60.0;
        config.minLevel = 35;
        config.maxLevel = 100;

        return std::make_unique<Zone>(config, StaticResolver{{name}}, sensors,
                                      fans);
    }

    std::vector<std::unique_ptr<Zone>> makeZones(Seconds cpuPolling,
                                                 Seconds hdPolling)
    {
        std::vector<std::unique_ptr<Zone>> zones;
        zones.push_back(makeZone("CPU zone", IpmiZone::cpu, cpuPolling));
        zones.push_back(makeZone("HD zone", IpmiZone::hd, hdPolling));
        return zones;
    }

    sdeventplus::Event event;
    std::shared_ptr<NiceMock<MockSensorInterface>> sensors =
        std::make_shared<NiceMock<MockSensorInterface>>();
    std::shared_ptr<NiceMock<MockFanInterface>> fans =
        std::make_shared<NiceMock<MockFanInterface>>();
};

TEST_F(ManagerTest, TestInterval)
{
    EXPECT_EQ(Manager::getInterval(makeZones(Seconds{2}, Seconds{10})), 1s);
    EXPECT_EQ(Manager::getInterval(makeZones(Seconds{30}, Seconds{5})),
              2500ms);

    std::vector<std::unique_ptr<Zone>> zones;
    zones.push_back(makeZone("HD zone", IpmiZone::hd, Seconds{10}));
    EXPECT_EQ(Manager::getInterval(zones), 5s);

    // Never below the shortest timer period
    EXPECT_EQ(Manager::getInterval(makeZones(Seconds{0}, Seconds{10})),
              Manager::minInterval);

    zones.clear();
    EXPECT_THROW(Manager::getInterval(zones), ConfigurationError);
    EXPECT_THROW((Manager{event, fans, {}}), ConfigurationError);
}

TEST_F(ManagerTest, TestFanModeInit)
{
    Manager manager{event, fans, makeZones(Seconds{2}, Seconds{10})};

    EXPECT_CALL(*fans, getFanMode())
        .WillOnce(Return(static_cast<int>(FanMode::optimal)));
    EXPECT_CALL(*fans, setFanMode(FanMode::full)).Times(1);
    manager.initFanMode();
    ::testing::Mock::VerifyAndClearExpectations(fans.get());

    // Already in full mode
    EXPECT_CALL(*fans, getFanMode())
        .WillOnce(Return(static_cast<int>(FanMode::full)));
    EXPECT_CALL(*fans, setFanMode(_)).Times(0);
    manager.initFanMode();
}

TEST_F(ManagerTest, TestTickOrder)
{
    Manager manager{event, fans, makeZones(Seconds{2}, Seconds{10})};
    ASSERT_EQ(manager.getZones().size(), 2);
    EXPECT_EQ(manager.getZones()[0]->getName(), "CPU zone");

    {
        ::testing::InSequence seq;
        EXPECT_CALL(*fans, setFanLevel(IpmiZone::cpu, 67)).Times(1);
        EXPECT_CALL(*fans, setFanLevel(IpmiZone::hd, 67)).Times(1);
    }
    manager.tick();
}

TEST_F(ManagerTest, TestZoneFailure)
{
    Manager manager{event, fans, makeZones(Seconds{2}, Seconds{10})};

    // The CPU zone fails, the disk zone still runs
    ON_CALL(*sensors, read("CPU zone"))
        .WillByDefault(Throw(IOError("Cannot read file (CPU zone).")));
    EXPECT_CALL(*fans, setFanLevel(IpmiZone::cpu, _)).Times(0);
    EXPECT_CALL(*fans, setFanLevel(IpmiZone::hd, 67)).Times(1);
    EXPECT_NO_THROW(manager.tick());

    // The disk zone state moved on
    const auto& hdZone = *manager.getZones()[1];
    EXPECT_EQ(hdZone.getState().lastLevel, 67);
}

TEST_F(ManagerTest, TestStart)
{
    Manager manager{event, fans, makeZones(Seconds{0}, Seconds{10})};
    EXPECT_EQ(manager.getInterval(), Manager::minInterval);
    EXPECT_FALSE(manager.isRunning());

    EXPECT_CALL(*fans, getFanMode())
        .WillOnce(Return(static_cast<int>(FanMode::standard)));
    EXPECT_CALL(*fans, setFanMode(FanMode::full)).Times(1);
    EXPECT_CALL(*fans, setFanLevel(IpmiZone::cpu, 67)).Times(1);
    EXPECT_CALL(*fans, setFanLevel(IpmiZone::hd, 67)).Times(1);
    manager.start();
    EXPECT_TRUE(manager.isRunning());
    ::testing::Mock::VerifyAndClearExpectations(fans.get());

    // The timer keeps polling the CPU zone
    EXPECT_CALL(*sensors, read("CPU zone"))
        .Times(::testing::AtLeast(1))
        .WillRepeatedly(Return(60000));
    EXPECT_CALL(*fans, setFanLevel(IpmiZone::cpu, 100)).Times(1);
    for (int i = 0; i < 10 && manager.getZones()[0]->getState().lastLevel != 100;
         i++)
    {
        event.run(std::chrono::milliseconds(200));
    }
    EXPECT_EQ(manager.getZones()[0]->getState().lastLevel, 100);
}

TEST_F(ManagerTest, TestDebugData)
{
    Manager manager{event, fans, makeZones(Seconds{2}, Seconds{10})};
    manager.tick();

    auto data = manager.getDebugData();
    EXPECT_DOUBLE_EQ(data["interval"].get<double>(), 1.0);
    EXPECT_TRUE(data["logs"].is_array());
    ASSERT_TRUE(data["zones"].contains("CPU zone"));
    ASSERT_TRUE(data["zones"].contains("HD zone"));
    EXPECT_EQ(data["zones"]["CPU zone"]["last_level"], 67);
    EXPECT_EQ(data["zones"]["HD zone"]["ipmi_zone"], 1);
}

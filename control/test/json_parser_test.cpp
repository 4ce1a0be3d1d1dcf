#include "../json_parser.hpp"
#include "errors.hpp"
#include "fake_tool.hpp"
#include "mock_disk_power_interface.hpp"
#include "mock_fan_interface.hpp"
#include "mock_sensor_interface.hpp"

#include <gtest/gtest.h>

using namespace smfc;
using namespace smfc::control;
using namespace smfc::control::test;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

class JsonParserTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        ON_CALL(*sensors, read(_)).WillByDefault(Return(40000));
        ON_CALL(*power, isStandby(_)).WillByDefault(Return(false));
    }

    std::shared_ptr<NiceMock<MockSensorInterface>> sensors =
        std::make_shared<NiceMock<MockSensorInterface>>();
    std::shared_ptr<NiceMock<MockFanInterface>> fans =
        std::make_shared<NiceMock<MockFanInterface>>();
    std::shared_ptr<NiceMock<MockDiskPowerInterface>> power =
        std::make_shared<NiceMock<MockDiskPowerInterface>>();
};

TEST_F(JsonParserTest, TestAggregation)
{
    EXPECT_EQ(getAggregation("min"), Aggregation::min);
    EXPECT_EQ(getAggregation("avg"), Aggregation::avg);
    EXPECT_EQ(getAggregation("max"), Aggregation::max);
    EXPECT_THROW(getAggregation("single"), ConfigurationError);
    EXPECT_THROW(getAggregation("AVG"), ConfigurationError);
}

TEST_F(JsonParserTest, TestZoneDefaults)
{
    auto cpu = getCpuZoneConfig(json::object());
    EXPECT_EQ(cpu.name, "CPU zone");
    EXPECT_EQ(cpu.ipmiZone, IpmiZone::cpu);
    EXPECT_EQ(cpu.count, 1);
    EXPECT_EQ(cpu.tempCalc, Aggregation::avg);
    EXPECT_EQ(cpu.steps, 6);
    EXPECT_DOUBLE_EQ(cpu.sensitivity, 3.0);
    EXPECT_DOUBLE_EQ(cpu.polling.count(), 2.0);
    EXPECT_DOUBLE_EQ(cpu.minTemp, 30.0);
    EXPECT_DOUBLE_EQ(cpu.maxTemp, 60.0);
    EXPECT_EQ(cpu.minLevel, 35);
    EXPECT_EQ(cpu.maxLevel, 100);

    auto hd = getHdZoneConfig(json::object());
    EXPECT_EQ(hd.name, "HD zone");
    EXPECT_EQ(hd.ipmiZone, IpmiZone::hd);
    EXPECT_EQ(hd.steps, 4);
    EXPECT_DOUBLE_EQ(hd.sensitivity, 2.0);
    EXPECT_DOUBLE_EQ(hd.polling.count(), 10.0);
    EXPECT_DOUBLE_EQ(hd.minTemp, 32.0);
    EXPECT_DOUBLE_EQ(hd.maxTemp, 46.0);
}

TEST_F(JsonParserTest, TestZoneValues)
{
    const auto obj = R"(
    {
        "count": 2,
        "temp_calc": "max",
        "steps": 5,
        "sensitivity": 1.5,
        "polling": 0.5,
        "min_temp": 25,
        "max_temp": 55.5,
        "min_level": 20,
        "max_level": 90
    })"_json;

    auto config = getCpuZoneConfig(obj);
    EXPECT_EQ(config.count, 2);
    EXPECT_EQ(config.tempCalc, Aggregation::max);
    EXPECT_EQ(config.steps, 5);
    EXPECT_DOUBLE_EQ(config.sensitivity, 1.5);
    EXPECT_DOUBLE_EQ(config.polling.count(), 0.5);
    EXPECT_DOUBLE_EQ(config.minTemp, 25.0);
    EXPECT_DOUBLE_EQ(config.maxTemp, 55.5);
    EXPECT_EQ(config.minLevel, 20);
    EXPECT_EQ(config.maxLevel, 90);
}

TEST_F(JsonParserTest, TestInvalidValues)
{
    EXPECT_THROW(getCpuZoneConfig(R"({"steps": "six"})"_json),
                 ConfigurationError);
    EXPECT_THROW(getCpuZoneConfig(R"({"count": -1})"_json),
                 ConfigurationError);
    EXPECT_THROW(getCpuZoneConfig(R"({"temp_calc": "median"})"_json),
                 ConfigurationError);
    EXPECT_THROW(getCpuZoneConfig(R"({"min_temp": [30]})"_json),
                 ConfigurationError);

    EXPECT_THROW(getZones(R"({"cpu_zone": true})"_json, sensors, fans, power,
                          Clock::now()),
                 ConfigurationError);
    EXPECT_THROW(getZones(R"([1, 2])"_json, sensors, fans, power,
                          Clock::now()),
                 ConfigurationError);
}

TEST_F(JsonParserTest, TestNonIntegerValues)
{
    // Fractional numbers are not truncated
    EXPECT_THROW(getCpuZoneConfig(R"({"min_level": 35.7})"_json),
                 ConfigurationError);
    EXPECT_THROW(getCpuZoneConfig(R"({"steps": 6.9})"_json),
                 ConfigurationError);
    EXPECT_THROW(getCpuZoneConfig(R"({"max_level": 100.9})"_json),
                 ConfigurationError);
    EXPECT_THROW(getCpuZoneConfig(R"({"count": 2.0})"_json),
                 ConfigurationError);

    // Out of range of the target type
    EXPECT_THROW(getCpuZoneConfig(R"({"count": 1e20})"_json),
                 ConfigurationError);
    EXPECT_THROW(getCpuZoneConfig(R"({"min_level": 4294967296})"_json),
                 ConfigurationError);
    EXPECT_THROW(getCpuZoneConfig(R"({"max_level": -4294967296})"_json),
                 ConfigurationError);
    EXPECT_THROW(getCpuZoneConfig(R"({"steps": 18446744073709551615})"_json),
                 ConfigurationError);

    try
    {
        getCpuZoneConfig(R"({"min_level": 35.7})"_json);
        FAIL() << "min_level 35.7 was accepted";
    }
    catch (const ConfigurationError& e)
    {
        EXPECT_NE(std::string{e.what()}.find("'min_level'"),
                  std::string::npos);
    }

    // Integers are still accepted, and floats where a float is expected
    auto config = getCpuZoneConfig(
        R"({"min_level": 20, "max_level": 90, "min_temp": 25})"_json);
    EXPECT_EQ(config.minLevel, 20);
    EXPECT_EQ(config.maxLevel, 90);
    EXPECT_DOUBLE_EQ(config.minTemp, 25.0);

    json conf;
    conf["ipmi"] = {{"command", "/bin/true"}, {"fan_mode_delay", 0.5}};
    EXPECT_THROW(getIpmiTool(conf), ConfigurationError);
}

TEST_F(JsonParserTest, TestDiskNames)
{
    const auto obj = R"({"hd_names": ["/dev/disk/by-id/a", "/dev/disk/by-id/b"]})"_json;

    EXPECT_EQ(getDiskNames(obj, 2),
              (std::vector<std::string>{"/dev/disk/by-id/a",
                                        "/dev/disk/by-id/b"}));
    EXPECT_THROW(getDiskNames(obj, 3), ConfigurationError);
    EXPECT_THROW(getDiskNames(json::object(), 1), ConfigurationError);
    EXPECT_THROW(getDiskNames(R"({"hd_names": []})"_json, 1),
                 ConfigurationError);
}

TEST_F(JsonParserTest, TestResolver)
{
    auto paths = getResolver(R"({"hwmon_path": ["/a"]})"_json, IpmiZone::hd,
                             {"/dev/disk/by-id/a"});
    EXPECT_NE(dynamic_cast<PathResolver*>(paths.get()), nullptr);

    auto coretemp = getResolver(json::object(), IpmiZone::cpu);
    EXPECT_NE(dynamic_cast<CoretempResolver*>(coretemp.get()), nullptr);

    auto disks =
        getResolver(json::object(), IpmiZone::hd, {"/dev/disk/by-id/a"});
    EXPECT_NE(dynamic_cast<DiskResolver*>(disks.get()), nullptr);
}

TEST_F(JsonParserTest, TestNoZones)
{
    auto zones = getZones(json::object(), sensors, fans, power, Clock::now());
    EXPECT_TRUE(zones.empty());

    zones = getZones(R"({"cpu_zone": {"enabled": false}})"_json, sensors,
                     fans, power, Clock::now());
    EXPECT_TRUE(zones.empty());
}

TEST_F(JsonParserTest, TestZones)
{
    const auto conf = R"(
    {
        // Comments are allowed in the files
        "hd_zone": {
            "enabled": true,
            "count": 2,
            "hd_names": ["/dev/disk/by-id/a", "/dev/disk/by-id/b"],
            "hwmon_path": ["/hd/a", "/hd/b"]
        },
        "cpu_zone": {
            "enabled": true,
            "hwmon_path": ["/cpu"]
        }
    })";

    // PathResolver checks the files, mock them with temp files
    auto dir = fs::temp_directory_path() / "smfc_json_parser_test";
    fs::remove_all(dir);
    auto text = std::string{conf};
    for (const auto& name : {"/hd/a", "/hd/b", "/cpu"})
    {
        auto path = dir / fs::path{name}.relative_path();
        fs::create_directories(path.parent_path());
        std::ofstream{path} << "40000\n";
        auto pos = text.find(std::string{"\""} + name + "\"");
        text.replace(pos + 1, std::string{name}.size(), path.string());
    }

    auto zones = getZones(json::parse(text, nullptr, true, true), sensors,
                          fans, power, Clock::now());
    ASSERT_EQ(zones.size(), 2);

    EXPECT_EQ(zones[0]->getName(), "CPU zone");
    EXPECT_EQ(zones[0]->getHook(), nullptr);
    EXPECT_EQ(zones[1]->getName(), "HD zone");
    EXPECT_EQ(zones[1]->getConfig().count, 2);
    EXPECT_EQ(zones[1]->getHook(), nullptr);

    fs::remove_all(dir);
}

TEST_F(JsonParserTest, TestStandbyGuard)
{
    const std::vector<std::string> disks{"/dev/disk/by-id/a",
                                         "/dev/disk/by-id/b"};

    auto disabled = getStandbyGuard(json::object(), disks, power, Clock::now());
    EXPECT_EQ(disabled.get(), nullptr);

    const auto obj = R"({"standby_guard": {"enabled": true, "hd_limit": 2}})"_json;
    auto guard = getStandbyGuard(obj, disks, power, Clock::now());
    ASSERT_NE(guard.get(), nullptr);
    EXPECT_EQ(guard->getHdLimit(), 2);

    // Default limit
    guard = getStandbyGuard(R"({"standby_guard": {"enabled": true}})"_json,
                            disks, power, Clock::now());
    ASSERT_NE(guard.get(), nullptr);
    EXPECT_EQ(guard->getHdLimit(), 1);

    // A single disk never gets a guard, whatever the configuration says
    EXPECT_EQ(
        getStandbyGuard(obj, {"/dev/disk/by-id/a"}, power, Clock::now()).get(),
        nullptr);

    EXPECT_THROW(getStandbyGuard(obj, disks, nullptr, Clock::now()),
                 ConfigurationError);
    EXPECT_THROW(getStandbyGuard(
                     R"({"standby_guard": {"enabled": true, "hd_limit": 3}})"_json,
                     disks, power, Clock::now()),
                 ConfigurationError);
}

TEST_F(JsonParserTest, TestUsesStandbyGuard)
{
    EXPECT_FALSE(usesStandbyGuard(json::object()));
    EXPECT_FALSE(usesStandbyGuard(R"(
        {"hd_zone": {"enabled": false, "count": 2,
                     "standby_guard": {"enabled": true}}})"_json));
    EXPECT_FALSE(usesStandbyGuard(R"(
        {"hd_zone": {"enabled": true, "count": 1,
                     "standby_guard": {"enabled": true}}})"_json));
    EXPECT_FALSE(usesStandbyGuard(R"(
        {"hd_zone": {"enabled": true, "count": 2}})"_json));
    EXPECT_TRUE(usesStandbyGuard(R"(
        {"hd_zone": {"enabled": true, "count": 2,
                     "standby_guard": {"enabled": true}}})"_json));
}

TEST_F(JsonParserTest, TestTools)
{
    auto dir = fs::temp_directory_path() / "smfc_json_parser_tools";
    fs::remove_all(dir);
    writeScript(dir / "ipmitool", "exit 0");
    writeScript(dir / "smartctl", "exit 0");

    json conf;
    conf["ipmi"] = {{"command", (dir / "ipmitool").string()},
                    {"fan_mode_delay", 0},
                    {"fan_level_delay", 0}};
    conf["smartctl"] = {{"command", (dir / "smartctl").string()}};

    EXPECT_NE(getIpmiTool(conf).get(), nullptr);
    EXPECT_NE(getSmartctl(conf).get(), nullptr);

    conf["ipmi"]["fan_mode_delay"] = -1;
    EXPECT_THROW(getIpmiTool(conf), ConfigurationError);
    conf["ipmi"]["fan_mode_delay"] = "ten";
    EXPECT_THROW(getIpmiTool(conf), ConfigurationError);

    conf["smartctl"]["command"] = (dir / "missing").string();
    EXPECT_THROW(getSmartctl(conf), ConfigurationError);

    fs::remove_all(dir);
}

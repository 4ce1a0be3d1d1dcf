#pragma once

#include "../fan_interface.hpp"

#include <gmock/gmock.h>

namespace smfc::control
{

class MockFanInterface : public FanInterface
{
  public:
    MOCK_METHOD(int, getFanMode, (), (override));
    MOCK_METHOD(void, setFanMode, (FanMode), (override));
    MOCK_METHOD(void, setFanLevel, (IpmiZone, int), (override));
};

} // namespace smfc::control

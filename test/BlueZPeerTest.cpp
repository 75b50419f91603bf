// test/BlueZPeerTest.cpp
#include <gtest/gtest.h>
#include <map>
#include <string>

#include "BlueZConstants.h"
#include "BlueZPeer.h"

using namespace hapble;

// 장치 경로 생성 테스트
TEST(BlueZPeerTest, DevicePathFromAddress) {
    EXPECT_EQ(BlueZPeer::devicePathFromAddress("/org/bluez/hci0", "aa:bb:cc:dd:ee:ff"),
              "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_FF");
    EXPECT_EQ(BlueZPeer::devicePathFromAddress(BlueZConstants::DEFAULT_ADAPTER_PATH, "12:34:56:78:9A:BC"),
              "/org/bluez/hci0/dev_12_34_56_78_9A_BC");
    EXPECT_EQ(BlueZPeer::devicePathFromAddress("/org/bluez/hci1", "12:34:56:78:9A:BC"),
              "/org/bluez/hci1/dev_12_34_56_78_9A_BC");
}

// Connected=false 신호만 연결 해제로 처리
TEST(BlueZPeerTest, DetectsDisconnect) {
    std::map<std::string, sdbus::Variant> changed;
    changed[BlueZConstants::PROPERTY_CONNECTED] = sdbus::Variant(false);

    EXPECT_TRUE(BlueZPeer::isDisconnectChange(BlueZConstants::DEVICE_INTERFACE, changed));
}

TEST(BlueZPeerTest, IgnoresConnectAndOtherProperties) {
    std::map<std::string, sdbus::Variant> connected;
    connected[BlueZConstants::PROPERTY_CONNECTED] = sdbus::Variant(true);
    EXPECT_FALSE(BlueZPeer::isDisconnectChange(BlueZConstants::DEVICE_INTERFACE, connected));

    std::map<std::string, sdbus::Variant> rssi;
    rssi["RSSI"] = sdbus::Variant(static_cast<int16_t>(-60));
    EXPECT_FALSE(BlueZPeer::isDisconnectChange(BlueZConstants::DEVICE_INTERFACE, rssi));

    std::map<std::string, sdbus::Variant> wrongType;
    wrongType[BlueZConstants::PROPERTY_CONNECTED] = sdbus::Variant(std::string("no"));
    EXPECT_FALSE(BlueZPeer::isDisconnectChange(BlueZConstants::DEVICE_INTERFACE, wrongType));
}

TEST(BlueZPeerTest, IgnoresOtherInterfaces) {
    std::map<std::string, sdbus::Variant> changed;
    changed[BlueZConstants::PROPERTY_CONNECTED] = sdbus::Variant(false);

    EXPECT_FALSE(BlueZPeer::isDisconnectChange("org.bluez.Adapter1", changed));
}

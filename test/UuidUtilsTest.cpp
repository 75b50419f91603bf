#include <gtest/gtest.h>
#include "UuidUtils.h"

using namespace hapble;

// ✅ Compact 변환 테스트
TEST(UuidUtilsTest, ToCompact) {
    EXPECT_EQ(UuidUtils::toCompact("2A37"), "2a37");
    EXPECT_EQ(UuidUtils::toCompact("0000180D-0000-1000-8000-00805F9B34FB"), "0000180d00001000800000805f9b34fb");
    EXPECT_EQ(UuidUtils::toCompact("0000180d00001000800000805f9b34fb"), "0000180d00001000800000805f9b34fb");
    EXPECT_EQ(UuidUtils::toCompact(""), "");
}

// ✅ Canonical 변환 테스트
TEST(UuidUtilsTest, ToCanonical) {
    EXPECT_EQ(UuidUtils::toCanonical("0000180d00001000800000805f9b34fb"), "0000180D-0000-1000-8000-00805F9B34FB");
    EXPECT_EQ(UuidUtils::toCanonical("000000250000100080000026bb765291"), "00000025-0000-1000-8000-0026BB765291");
}

// ✅ 32자가 아니면 대문자만 적용
TEST(UuidUtilsTest, ToCanonicalPassesThroughOtherLengths) {
    EXPECT_EQ(UuidUtils::toCanonical("abc"), "ABC");
    EXPECT_EQ(UuidUtils::toCanonical("2a37"), "2A37");
    EXPECT_EQ(UuidUtils::toCanonical("0000180d-0000-1000-8000-00805f9b34fb"), "0000180D-0000-1000-8000-00805F9B34FB");
    EXPECT_EQ(UuidUtils::toCanonical(""), "");
}

// ✅ 양방향 변환 테스트
TEST(UuidUtilsTest, CanonicalCompactRoundTrip) {
    const std::string canonical = "E863F10A-079E-48FF-8F27-9C2605A29F52";

    EXPECT_EQ(UuidUtils::toCanonical(UuidUtils::toCompact(canonical)), canonical);
    EXPECT_EQ(UuidUtils::toCanonical(UuidUtils::toCompact("e863f10a-079e-48ff-8f27-9c2605a29f52")), canonical);
}

// ✅ HAP short UUID 확장 테스트
TEST(UuidUtilsTest, FromShortUuid) {
    EXPECT_EQ(UuidUtils::fromShortUuid(0x25), "00000025-0000-1000-8000-0026BB765291");
    EXPECT_EQ(UuidUtils::fromShortUuid(0x3E), "0000003E-0000-1000-8000-0026BB765291");
    EXPECT_TRUE(UuidUtils::isCanonical(UuidUtils::fromShortUuid(0xA2)));
}

// ✅ Canonical 형식 검사
TEST(UuidUtilsTest, IsCanonical) {
    EXPECT_TRUE(UuidUtils::isCanonical("0000180D-0000-1000-8000-00805F9B34FB"));
    EXPECT_TRUE(UuidUtils::isCanonical("0000180d-0000-1000-8000-00805f9b34fb"));
    EXPECT_FALSE(UuidUtils::isCanonical("0000180d00001000800000805f9b34fb"));
    EXPECT_FALSE(UuidUtils::isCanonical("0000180D-0000-1000-8000-00805F9B34FZ"));
    EXPECT_FALSE(UuidUtils::isCanonical("0000180D+0000-1000-8000-00805F9B34FB"));
    EXPECT_FALSE(UuidUtils::isCanonical("2A37"));
}

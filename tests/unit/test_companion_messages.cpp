#include "FakeCompanionDevice.h"
#include "protocol/CompanionMessages.h"
#include <gtest/gtest.h>
using nf::test::FakeCompanionDevice;
TEST(CompanionMessagesTest, RadioParamsPayloadLayout) {
    const QByteArray payload = nf::companion::radioParamsPayload(nf::RadioSetting{915.125, nf::RadioParams{250.0, 10, 5}});
    EXPECT_EQ(payload, QByteArray("\xb5\xf6\x0d\x00\x90\xd0\x03\x00\x0a\x05", 10));
}
TEST(CompanionMessagesTest, AppStartPayloadCarriesName) {
    const QByteArray payload = nf::companion::appStartPayload(QStringLiteral("Scanner"));
    ASSERT_EQ(payload.size(), 1 + 6 + 7);
    EXPECT_EQ(static_cast<uint8_t>(payload[0]), nf::companion::kAppProtocolVersion);
    EXPECT_EQ(payload.mid(1, 6), QByteArray(6, '\0'));
    EXPECT_EQ(payload.mid(7), QByteArray("Scanner"));
}
TEST(CompanionMessagesTest, ParsesNegativeNoiseFloor) {
    nf::RadioStats stats;
    ASSERT_TRUE(nf::companion::parseRadioStats(FakeCompanionDevice::statsBody(-110).mid(1), stats));
    EXPECT_EQ(stats.noiseFloor, -110);
    EXPECT_EQ(stats.lastRssi, -95);
    EXPECT_EQ(stats.lastSnrX4, 24);
    EXPECT_EQ(stats.rxAirSecs, 340u);
}
TEST(CompanionMessagesTest, RejectsNonRadioStats) {
    nf::RadioStats stats;
    EXPECT_FALSE(nf::companion::parseRadioStats(QByteArray("\x00\x10\x0e\x00\x00", 5), stats));
    EXPECT_FALSE(nf::companion::parseRadioStats(QByteArray("\x01\x92", 2), stats));
}
TEST(CompanionMessagesTest, ParsesDeviceInfo) {
    nf::DeviceInfo info;
    ASSERT_TRUE(nf::companion::parseDeviceInfo(FakeCompanionDevice::deviceInfoBody().mid(1), info));
    EXPECT_EQ(info.firmwareVersion, 10);
    EXPECT_EQ(info.maxContacts, 100);
    EXPECT_EQ(info.maxChannels, 8);
    EXPECT_EQ(info.buildDate, QStringLiteral("19 Oct 2026"));
    EXPECT_EQ(info.model, QStringLiteral("Heltec V3"));
    EXPECT_EQ(info.version, QStringLiteral("v1.13.0"));
}
TEST(CompanionMessagesTest, ShortDeviceInfoKeepsVersionCode) {
    nf::DeviceInfo info;
    ASSERT_TRUE(nf::companion::parseDeviceInfo(QByteArray("\x03", 1), info));
    EXPECT_EQ(info.firmwareVersion, 3);
    EXPECT_TRUE(info.model.isEmpty());
    EXPECT_FALSE(nf::companion::parseDeviceInfo(QByteArray(), info));
}
TEST(CompanionMessagesTest, ParsesSelfInfoRadioSetting) {
    nf::SelfInfo self;
    ASSERT_TRUE(nf::companion::parseSelfInfo(FakeCompanionDevice::selfInfoBody().mid(1), self));
    EXPECT_EQ(self.name, QStringLiteral("TestNode"));
    EXPECT_EQ(self.txPowerDbm, 22);
    EXPECT_DOUBLE_EQ(self.radio.frequencyMhz, 910.525);
    EXPECT_DOUBLE_EQ(self.radio.params.bandwidthKhz, 62.5);
    EXPECT_EQ(self.radio.params.spreadingFactor, 7);
    EXPECT_EQ(self.radio.params.codingRate, 5);
}
TEST(CompanionMessagesTest, ErrorCodeOfEmptyPayloadIsUnknown) {
    EXPECT_EQ(nf::companion::parseErrorCode(QByteArray("\x01", 1)), 1);
    EXPECT_EQ(nf::companion::parseErrorCode(QByteArray()), -1);
}

#pragma once
#include "common/types.h"
#include <QtCore/QByteArrayView>
namespace nf {
struct DeviceInfo {
    int firmwareVersion = 0;
    int maxContacts = 0;
    int maxChannels = 0;
    QString buildDate;
    QString model;
    QString version;
};
struct SelfInfo {
    QString name;
    int txPowerDbm = 0;
    int maxTxPowerDbm = 0;
    RadioSetting radio;
};
struct RadioStats {
    int16_t noiseFloor = 0;
    int8_t lastRssi = 0;
    int8_t lastSnrX4 = 0;
    uint32_t txAirSecs = 0;
    uint32_t rxAirSecs = 0;
};
// Payload builders return the bytes that follow the command code.
namespace companion {
QByteArray deviceQueryPayload();
QByteArray appStartPayload(const QString& appName);
QByteArray radioParamsPayload(const RadioSetting& setting);
bool parseRadioParams(QByteArrayView payload, RadioSetting& out);
bool parseDeviceInfo(QByteArrayView payload, DeviceInfo& out);
bool parseSelfInfo(QByteArrayView payload, SelfInfo& out);
bool parseRadioStats(QByteArrayView payload, RadioStats& out);
int parseErrorCode(QByteArrayView payload);
}
}

#include "protocol/CompanionMessages.h"
#include "protocol/CompanionCodes.h"
#include <QtCore/QtMath>
namespace {
inline uint8_t u8(QByteArrayView b, qsizetype i) { return static_cast<uint8_t>(b[i]); }
inline uint16_t readU16Le(QByteArrayView b, qsizetype i) { return static_cast<uint16_t>(u8(b, i) | (u8(b, i + 1) << 8)); }
inline uint32_t readU32Le(QByteArrayView b, qsizetype i) {
    uint32_t v = 0;
    for (int k = 0; k < 4; ++k) v |= static_cast<uint32_t>(u8(b, i + k)) << (8 * k);
    return v;
}
inline void appendU32Le(QByteArray& out, uint32_t v) { for (int k = 0; k < 4; ++k) out.append(static_cast<char>((v >> (8 * k)) & 0xFF)); }
QString fixedString(QByteArrayView b, qsizetype offset, qsizetype width) {
    if (offset >= b.size()) return {};
    const qsizetype limit = qMin(width, b.size() - offset);
    const char* p = b.data() + offset;
    qsizetype n = 0;
    while (n < limit && p[n] != '\0') ++n;
    return QString::fromUtf8(p, n).trimmed();
}
constexpr qsizetype kRadioParamsSize = 10;
constexpr qsizetype kPubKeySize = 32;
constexpr qsizetype kSelfInfoRadioOffset = 3 + kPubKeySize + 4 + 4 + 4;
constexpr qsizetype kSelfInfoNameOffset = kSelfInfoRadioOffset + kRadioParamsSize;
}
namespace nf {
namespace companion {
QByteArray deviceQueryPayload() { return QByteArray(1, static_cast<char>(kAppProtocolVersion)); }
QByteArray appStartPayload(const QString& appName) {
    QByteArray out(1, static_cast<char>(kAppProtocolVersion));
    out.append(6, '\0');
    out.append(appName.toUtf8());
    return out;
}
QByteArray radioParamsPayload(const RadioSetting& setting) {
    QByteArray out;
    out.reserve(kRadioParamsSize);
    appendU32Le(out, static_cast<uint32_t>(qRound64(setting.frequencyMhz * 1000.0)));
    appendU32Le(out, static_cast<uint32_t>(qRound64(setting.params.bandwidthKhz * 1000.0)));
    out.append(static_cast<char>(static_cast<int8_t>(setting.params.spreadingFactor)));
    out.append(static_cast<char>(static_cast<int8_t>(setting.params.codingRate)));
    return out;
}
bool parseRadioParams(QByteArrayView payload, RadioSetting& out) {
    if (payload.size() < kRadioParamsSize) return false;
    out.frequencyMhz = readU32Le(payload, 0) / 1000.0;
    out.params.bandwidthKhz = readU32Le(payload, 4) / 1000.0;
    out.params.spreadingFactor = static_cast<int8_t>(u8(payload, 8));
    out.params.codingRate = static_cast<int8_t>(u8(payload, 9));
    return true;
}
bool parseDeviceInfo(QByteArrayView payload, DeviceInfo& out) {
    if (payload.isEmpty()) return false;
    out = DeviceInfo{};
    out.firmwareVersion = u8(payload, 0);
    if (payload.size() >= 3) {
        out.maxContacts = u8(payload, 1) * 2;
        out.maxChannels = u8(payload, 2);
    }
    out.buildDate = fixedString(payload, 7, 12);
    out.model = fixedString(payload, 19, 40);
    out.version = fixedString(payload, 59, 20);
    return true;
}
bool parseSelfInfo(QByteArrayView payload, SelfInfo& out) {
    if (payload.size() < kSelfInfoNameOffset) return false;
    out = SelfInfo{};
    out.txPowerDbm = static_cast<int8_t>(u8(payload, 1));
    out.maxTxPowerDbm = static_cast<int8_t>(u8(payload, 2));
    if (!parseRadioParams(payload.sliced(kSelfInfoRadioOffset, kRadioParamsSize), out.radio)) return false;
    out.name = fixedString(payload, kSelfInfoNameOffset, payload.size() - kSelfInfoNameOffset);
    return true;
}
bool parseRadioStats(QByteArrayView payload, RadioStats& out) {
    if (payload.size() < 3 || u8(payload, 0) != static_cast<uint8_t>(StatsType::Radio)) return false;
    out = RadioStats{};
    out.noiseFloor = static_cast<int16_t>(readU16Le(payload, 1));
    if (payload.size() >= 5) {
        out.lastRssi = static_cast<int8_t>(u8(payload, 3));
        out.lastSnrX4 = static_cast<int8_t>(u8(payload, 4));
    }
    if (payload.size() >= 13) {
        out.txAirSecs = readU32Le(payload, 5);
        out.rxAirSecs = readU32Le(payload, 9);
    }
    return true;
}
int parseErrorCode(QByteArrayView payload) { return payload.isEmpty() ? -1 : u8(payload, 0); }
}
}

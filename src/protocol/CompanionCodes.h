#pragma once
#include <cstdint>
namespace nf {
enum class CommandCode : uint8_t { AppStart = 0x01, SetRadioParams = 0x0B, DeviceQuery = 0x16, GetStats = 0x38 };
enum class ResponseCode : uint8_t { Ok = 0x00, Error = 0x01, SelfInfo = 0x05, DeviceInfo = 0x0D, Stats = 0x18 };
enum class StatsType : uint8_t { Core = 0, Radio = 1, Packets = 2 };
namespace companion {
constexpr uint8_t kHostMarker = '<';
constexpr uint8_t kDeviceMarker = '>';
constexpr uint8_t kAppProtocolVersion = 7;
constexpr int kMaxFrameSize = 255;
constexpr uint8_t kLastCommandCode = 0x3D;
constexpr uint8_t kLastResponseCode = 0x1A;
constexpr uint8_t kFirstPushCode = 0x80;
constexpr uint8_t kErrUnsupported = 0x01;
constexpr uint8_t kErrNotFound = 0x02;
constexpr uint8_t kErrTableFull = 0x03;
constexpr uint8_t kErrBadState = 0x04;
constexpr uint8_t kErrIllegalArg = 0x06;
}
inline ResponseCode expectedResponse(CommandCode cmd) {
    switch (cmd) {
    case CommandCode::AppStart: return ResponseCode::SelfInfo;
    case CommandCode::SetRadioParams: return ResponseCode::Ok;
    case CommandCode::DeviceQuery: return ResponseCode::DeviceInfo;
    case CommandCode::GetStats: return ResponseCode::Stats;
    }
    return ResponseCode::Ok;
}
inline bool isKnownCommandCode(uint8_t code) { return code >= 0x01 && code <= companion::kLastCommandCode; }
inline bool isKnownResponseCode(uint8_t code) { return code <= companion::kLastResponseCode || code >= companion::kFirstPushCode; }
inline bool isPushCode(uint8_t code) { return code >= companion::kFirstPushCode; }
const char* commandName(CommandCode cmd);
const char* deviceErrorName(int code);
}

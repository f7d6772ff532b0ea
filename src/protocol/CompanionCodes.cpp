#include "protocol/CompanionCodes.h"
namespace nf {
const char* commandName(CommandCode cmd) {
    switch (cmd) {
    case CommandCode::AppStart: return "APP_START";
    case CommandCode::SetRadioParams: return "SET_RADIO_PARAMS";
    case CommandCode::DeviceQuery: return "DEVICE_QUERY";
    case CommandCode::GetStats: return "GET_STATS";
    }
    return "UNKNOWN";
}
const char* deviceErrorName(int code) {
    switch (code) {
    case companion::kErrUnsupported: return "unsupported";
    case companion::kErrNotFound: return "not found";
    case companion::kErrTableFull: return "table full";
    case companion::kErrBadState: return "bad state";
    case companion::kErrIllegalArg: return "illegal argument";
    default: return "unspecified";
    }
}
}

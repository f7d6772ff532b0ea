#include "common/types.h"
namespace nf {
const char* errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None: return "none";
    case ErrorKind::Connection: return "connection error";
    case ErrorKind::Frame: return "frame error";
    case ErrorKind::Protocol: return "protocol error";
    case ErrorKind::Timeout: return "timeout";
    case ErrorKind::Handshake: return "handshake error";
    case ErrorKind::Closed: return "client closed";
    case ErrorKind::Output: return "output error";
    }
    return "unknown error";
}
QString toHex(const QByteArray& bytes) { return QString::fromLatin1(bytes.toHex(' ')); }
}

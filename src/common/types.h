#pragma once
#include <QtCore/QByteArray>
#include <QtCore/QMetaType>
#include <QtCore/QString>
#include <QtCore/QVector>
#include <cstdint>
#include <limits>
namespace nf {
enum class ConnectionState { Disconnected, Connecting, Connected, Error };
enum class TransportKind { Serial, Tcp };
enum class ErrorKind { None, Connection, Frame, Protocol, Timeout, Handshake, Closed, Output };
struct TransportConfig {
    TransportKind kind = TransportKind::Serial;
    QString portName;
    int baudRate = 115200;
    int dataBits = 8;
    int stopBits = 1;
    int parity = 0;
    QString host;
    quint16 port = 0;
    int connectTimeoutMs = 5000;
    int writeTimeoutMs = 2000;
};
struct Frame { uint8_t code = 0; QByteArray payload; };
struct Error {
    ErrorKind kind = ErrorKind::None;
    int deviceCode = -1;
    QString message;
    bool ok() const { return kind == ErrorKind::None; }
    bool isFatal() const { return kind == ErrorKind::Connection || kind == ErrorKind::Closed || kind == ErrorKind::Handshake; }
    static Error none() { return {}; }
    static Error make(ErrorKind kind, const QString& message, int deviceCode = -1) { return Error{kind, deviceCode, message}; }
};
struct RadioParams { double bandwidthKhz = 250.0; int spreadingFactor = 10; int codingRate = 5; };
struct RadioSetting { double frequencyMhz = 0.0; RadioParams params; };
struct FrequencyRecord {
    double frequencyMhz = 0.0;
    int samples = 0;
    double average = std::numeric_limits<double>::quiet_NaN();
    double minimum = std::numeric_limits<double>::quiet_NaN();
    double maximum = std::numeric_limits<double>::quiet_NaN();
    double stdev = std::numeric_limits<double>::quiet_NaN();
};
const char* errorKindName(ErrorKind kind);
QString toHex(const QByteArray& bytes);
}
Q_DECLARE_METATYPE(nf::FrequencyRecord)

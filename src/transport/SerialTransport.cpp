#include "transport/SerialTransport.h"
#include "common/logging.h"
#include <limits>
namespace nf {
SerialTransport::SerialTransport(QObject* parent) : ITransport(parent) {}
bool SerialTransport::open(const TransportConfig& config) {
    if (serial_.isOpen()) serial_.close();
    write_timeout_ms_ = config.writeTimeoutMs;
    serial_.setPortName(config.portName);
    serial_.setBaudRate(config.baudRate);
    serial_.setDataBits(static_cast<QSerialPort::DataBits>(config.dataBits));
    serial_.setStopBits(config.stopBits == 2 ? QSerialPort::TwoStop : QSerialPort::OneStop);
    serial_.setParity(static_cast<QSerialPort::Parity>(config.parity));
    serial_.setFlowControl(QSerialPort::NoFlowControl);
    emit stateChanged(ConnectionState::Connecting);
    if (!serial_.open(QIODevice::ReadWrite)) {
        qCWarning(lcTransport) << "cannot open" << config.portName << ":" << serial_.errorString();
        emit errorOccurred(serial_.errorString());
        emit stateChanged(ConnectionState::Error);
        return false;
    }
    serial_.clear(QSerialPort::AllDirections);
    qCInfo(lcTransport) << "serial port" << config.portName << "open at" << config.baudRate << "baud";
    emit stateChanged(ConnectionState::Connected);
    return true;
}
void SerialTransport::close() {
    if (!serial_.isOpen()) return;
    serial_.close();
    emit stateChanged(ConnectionState::Disconnected);
}
bool SerialTransport::isOpen() const { return serial_.isOpen(); }
qint64 SerialTransport::write(const QByteArray& data) {
    if (!serial_.isOpen()) return -1;
    const qint64 n = serial_.write(data);
    if (n != data.size()) { fail(serial_.errorString()); return -1; }
    while (serial_.bytesToWrite() > 0) {
        if (!serial_.waitForBytesWritten(write_timeout_ms_)) { fail(QStringLiteral("write timed out: %1").arg(serial_.errorString())); return -1; }
    }
    return n;
}
QByteArray SerialTransport::readTimeout(qint64 maxBytes, const QDeadlineTimer& deadline) {
    if (!serial_.isOpen() || maxBytes <= 0) return {};
    if (serial_.bytesAvailable() == 0) {
        // An expired deadline still polls once without blocking.
        const int wait = static_cast<int>(qBound<qint64>(0, deadline.remainingTime(), std::numeric_limits<int>::max()));
        if (!serial_.waitForReadyRead(wait)) {
            if (serial_.error() != QSerialPort::NoError && serial_.error() != QSerialPort::TimeoutError) fail(serial_.errorString());
            return {};
        }
    }
    return serial_.read(maxBytes);
}
void SerialTransport::fail(const QString& message) {
    qCWarning(lcTransport) << "serial port failure:" << message;
    emit errorOccurred(message);
    serial_.close();
    emit stateChanged(ConnectionState::Error);
}
}

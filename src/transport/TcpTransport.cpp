#include "transport/TcpTransport.h"
#include "common/logging.h"
#include <limits>
namespace nf {
TcpTransport::TcpTransport(QObject* parent) : ITransport(parent) {}
bool TcpTransport::open(const TransportConfig& config) {
    if (socket_.state() != QAbstractSocket::UnconnectedState) socket_.abort();
    write_timeout_ms_ = config.writeTimeoutMs;
    emit stateChanged(ConnectionState::Connecting);
    socket_.connectToHost(config.host, config.port);
    if (!socket_.waitForConnected(config.connectTimeoutMs)) {
        qCWarning(lcTransport) << "cannot connect to" << config.host << config.port << ":" << socket_.errorString();
        emit errorOccurred(socket_.errorString());
        socket_.abort();
        emit stateChanged(ConnectionState::Error);
        return false;
    }
    socket_.setSocketOption(QAbstractSocket::LowDelayOption, 1);
    qCInfo(lcTransport) << "connected to" << config.host << config.port;
    emit stateChanged(ConnectionState::Connected);
    return true;
}
void TcpTransport::close() {
    if (socket_.state() == QAbstractSocket::UnconnectedState) return;
    socket_.disconnectFromHost();
    if (socket_.state() != QAbstractSocket::UnconnectedState) socket_.abort();
    emit stateChanged(ConnectionState::Disconnected);
}
bool TcpTransport::isOpen() const { return socket_.state() == QAbstractSocket::ConnectedState; }
qint64 TcpTransport::write(const QByteArray& data) {
    if (!isOpen()) return -1;
    const qint64 n = socket_.write(data);
    if (n != data.size()) { fail(socket_.errorString()); return -1; }
    while (socket_.bytesToWrite() > 0) {
        if (!socket_.waitForBytesWritten(write_timeout_ms_)) { fail(QStringLiteral("write timed out: %1").arg(socket_.errorString())); return -1; }
    }
    return n;
}
QByteArray TcpTransport::readTimeout(qint64 maxBytes, const QDeadlineTimer& deadline) {
    if (maxBytes <= 0) return {};
    if (socket_.bytesAvailable() == 0) {
        if (!isOpen()) return {};
        const int wait = static_cast<int>(qBound<qint64>(0, deadline.remainingTime(), std::numeric_limits<int>::max()));
        if (!socket_.waitForReadyRead(wait)) {
            if (socket_.error() != QAbstractSocket::SocketTimeoutError) fail(socket_.errorString());
            return {};
        }
    }
    return socket_.read(maxBytes);
}
void TcpTransport::fail(const QString& message) {
    qCWarning(lcTransport) << "socket failure:" << message;
    emit errorOccurred(message);
    socket_.abort();
    emit stateChanged(ConnectionState::Error);
}
}

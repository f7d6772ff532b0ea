#pragma once
#include "transport/ITransport.h"
#include <QtNetwork/QTcpSocket>
namespace nf {
class TcpTransport final : public ITransport {
    Q_OBJECT
public:
    explicit TcpTransport(QObject* parent = nullptr);
    bool open(const TransportConfig& config) override;
    void close() override;
    bool isOpen() const override;
    qint64 write(const QByteArray& data) override;
    QByteArray readTimeout(qint64 maxBytes, const QDeadlineTimer& deadline) override;
    QString errorString() const override { return socket_.errorString(); }
private:
    void fail(const QString& message);
    QTcpSocket socket_;
    int write_timeout_ms_ = 2000;
};
}

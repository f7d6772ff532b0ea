#pragma once
#include "transport/ITransport.h"
#include <QtSerialPort/QSerialPort>
namespace nf {
class SerialTransport final : public ITransport {
    Q_OBJECT
public:
    explicit SerialTransport(QObject* parent = nullptr);
    bool open(const TransportConfig& config) override;
    void close() override;
    bool isOpen() const override;
    qint64 write(const QByteArray& data) override;
    QByteArray readTimeout(qint64 maxBytes, const QDeadlineTimer& deadline) override;
    QString errorString() const override { return serial_.errorString(); }
private:
    void fail(const QString& message);
    QSerialPort serial_;
    int write_timeout_ms_ = 2000;
};
}

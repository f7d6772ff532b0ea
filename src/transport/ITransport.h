#pragma once
#include "common/types.h"
#include <QtCore/QDeadlineTimer>
#include <QtCore/QObject>
namespace nf {
class ITransport : public QObject {
    Q_OBJECT
public:
    using QObject::QObject;
    ~ITransport() override = default;
    virtual bool open(const TransportConfig& config) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;
    // Returns once the bytes are flushed, -1 on failure.
    virtual qint64 write(const QByteArray& data) = 0;
    // Returns 0..maxBytes bytes, empty on timeout. Never blocks past the deadline.
    virtual QByteArray readTimeout(qint64 maxBytes, const QDeadlineTimer& deadline) = 0;
    virtual QString errorString() const = 0;
signals:
    void errorOccurred(const QString& message);
    void stateChanged(nf::ConnectionState state);
};
}

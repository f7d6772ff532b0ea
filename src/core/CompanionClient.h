#pragma once
#include "protocol/CompanionCodes.h"
#include "protocol/CompanionFramer.h"
#include "protocol/CompanionMessages.h"
#include "transport/ITransport.h"
#include <QtCore/QByteArrayView>
#include <QtCore/QObject>
#include <memory>
namespace nf {
struct ClientConfig {
    TransportConfig transport;
    int timeoutMs = 10000;
    int retries = 2;
    QString appName = QStringLiteral("NoiseFloorScanner");
    bool probeStatsShapes = true;
};
class CompanionClient : public QObject {
    Q_OBJECT
public:
    CompanionClient(std::unique_ptr<ITransport> transport, ClientConfig config, QObject* parent = nullptr);
    ~CompanionClient() override;
    Error open();
    Error handshake();
    Error request(CommandCode cmd, QByteArrayView payload, Frame& response);
    Error setRadioParams(const RadioSetting& setting);
    Error getNoiseFloor(int16_t& sample);
    void close();
    bool isOpen() const;
    bool isHandshaken() const { return handshaken_; }
    const DeviceInfo& deviceInfo() const { return device_info_; }
    const SelfInfo& selfInfo() const { return self_info_; }
    const ClientConfig& config() const { return config_; }
    QByteArray statsRequestShape() const { return stats_shape_; }
    int frameErrorCount() const { return framer_.frameErrorCount(); }
signals:
    void pushReceived(const nf::Frame& frame);
    void errorOccurred(const QString& error);
    void stateChanged(nf::ConnectionState state);
private:
    enum class WaitResult { Matched, DeviceError, TimedOut, Closed, Lost };
    WaitResult awaitResponse(CommandCode cmd, Frame& response);
    Error fail(Error error);
    void discardStale();
    Error requestStats(QByteArrayView shape, int16_t& sample);
    std::unique_ptr<ITransport> transport_;
    ClientConfig config_;
    CompanionFramer framer_;
    DeviceInfo device_info_;
    SelfInfo self_info_;
    QByteArray stats_shape_;
    bool handshaken_ = false;
    bool closed_ = false;
};
}

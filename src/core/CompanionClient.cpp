#include "core/CompanionClient.h"
#include "common/logging.h"
#include <QtCore/QDeadlineTimer>
namespace {
constexpr qint64 kReadChunk = 512;
constexpr int kMinTimeoutMs = 1;
const QVector<QByteArray>& statsShapes() {
    static const QVector<QByteArray> shapes = {
        QByteArray("\x01", 1), QByteArray("\x07\x01", 2), QByteArray("\x07\x01\x00", 3),
        QByteArray("\x07\x01\x00\x00", 4), QByteArray("\x01\x00", 2), QByteArray("\x01\x00\x00", 3),
    };
    return shapes;
}
QString describe(uint8_t code, const QByteArray& payload) {
    QByteArray raw(1, static_cast<char>(code));
    raw.append(payload);
    return nf::toHex(raw);
}
}
namespace nf {
CompanionClient::CompanionClient(std::unique_ptr<ITransport> transport, ClientConfig config, QObject* parent)
    : QObject(parent), transport_(std::move(transport)), config_(std::move(config)) {
    if (config_.timeoutMs <= 0) {
        qCWarning(lcProtocol) << "response timeout" << config_.timeoutMs << "ms is not positive, using" << kMinTimeoutMs << "ms";
        config_.timeoutMs = kMinTimeoutMs;
    }
    if (transport_) {
        connect(transport_.get(), &ITransport::errorOccurred, this, &CompanionClient::errorOccurred);
        connect(transport_.get(), &ITransport::stateChanged, this, &CompanionClient::stateChanged);
    }
}
CompanionClient::~CompanionClient() { close(); }
Error CompanionClient::open() {
    if (!transport_) return fail(Error::make(ErrorKind::Connection, QStringLiteral("transport is not set")));
    closed_ = false;
    handshaken_ = false;
    stats_shape_.clear();
    framer_.reset();
    if (!transport_->open(config_.transport)) return fail(Error::make(ErrorKind::Connection, QStringLiteral("cannot open transport: %1").arg(transport_->errorString())));
    return Error::none();
}
Error CompanionClient::handshake() {
    handshaken_ = false;
    auto stepFailed = [this](const char* step, const Error& e) {
        if (e.kind == ErrorKind::Connection || e.kind == ErrorKind::Closed) return e;
        return fail(Error::make(ErrorKind::Handshake, QStringLiteral("%1 failed: %2").arg(QLatin1String(step), e.message), e.deviceCode));
    };
    Frame response;
    Error e = request(CommandCode::DeviceQuery, companion::deviceQueryPayload(), response);
    if (!e.ok()) return stepFailed("DEVICE_QUERY", e);
    if (!companion::parseDeviceInfo(response.payload, device_info_)) return fail(Error::make(ErrorKind::Handshake, QStringLiteral("DEVICE_INFO reply is empty")));
    qCInfo(lcProtocol).noquote() << "device" << device_info_.model << device_info_.version << "firmware code" << device_info_.firmwareVersion;

    e = request(CommandCode::AppStart, companion::appStartPayload(config_.appName), response);
    if (!e.ok()) return stepFailed("APP_START", e);
    if (!companion::parseSelfInfo(response.payload, self_info_)) {
        qCWarning(lcProtocol) << "SELF_INFO reply too short, current radio setting unknown";
        self_info_ = SelfInfo{};
    } else {
        qCInfo(lcProtocol).noquote() << "node" << self_info_.name << "on" << self_info_.radio.frequencyMhz << "MHz";
    }
    handshaken_ = true;
    return Error::none();
}
Error CompanionClient::request(CommandCode cmd, QByteArrayView payload, Frame& response) {
    if (closed_) return fail(Error::make(ErrorKind::Closed, QStringLiteral("%1 issued after close").arg(QLatin1String(commandName(cmd)))));
    if (!transport_ || !transport_->isOpen()) return fail(Error::make(ErrorKind::Connection, QStringLiteral("transport is not open")));
    discardStale();
    if (closed_) return fail(Error::make(ErrorKind::Closed, QStringLiteral("client closed before %1").arg(QLatin1String(commandName(cmd)))));
    const QByteArray packet = framer_.buildFrame(static_cast<uint8_t>(cmd), payload);
    const int attempts = qMax(0, config_.retries) + 1;
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (attempt > 1) qCWarning(lcProtocol) << commandName(cmd) << "timed out, resending" << attempt - 1 << "of" << config_.retries;
        qCDebug(lcFrames).noquote() << "[TX]" << toHex(packet);
        if (transport_->write(packet) != packet.size()) {
            if (closed_) return fail(Error::make(ErrorKind::Closed, QStringLiteral("client closed during %1").arg(QLatin1String(commandName(cmd)))));
            return fail(Error::make(ErrorKind::Connection, QStringLiteral("write of %1 failed: %2").arg(QLatin1String(commandName(cmd)), transport_->errorString())));
        }
        switch (awaitResponse(cmd, response)) {
        case WaitResult::Matched: return Error::none();
        case WaitResult::DeviceError: {
            const int code = companion::parseErrorCode(response.payload);
            return fail(Error::make(ErrorKind::Protocol, QStringLiteral("%1 rejected with error %2 (%3)").arg(QLatin1String(commandName(cmd))).arg(code).arg(QLatin1String(deviceErrorName(code))), code));
        }
        case WaitResult::Closed: return fail(Error::make(ErrorKind::Closed, QStringLiteral("client closed during %1").arg(QLatin1String(commandName(cmd)))));
        case WaitResult::Lost: return fail(Error::make(ErrorKind::Connection, QStringLiteral("connection lost waiting for %1 reply: %2").arg(QLatin1String(commandName(cmd)), transport_->errorString())));
        case WaitResult::TimedOut: break;
        }
    }
    return fail(Error::make(ErrorKind::Timeout, QStringLiteral("no reply to %1 after %2 attempt(s)").arg(QLatin1String(commandName(cmd))).arg(attempts)));
}
CompanionClient::WaitResult CompanionClient::awaitResponse(CommandCode cmd, Frame& response) {
    const QDeadlineTimer deadline(config_.timeoutMs);
    const uint8_t expected = static_cast<uint8_t>(expectedResponse(cmd));
    while (true) {
        Frame frame;
        while (framer_.tryPopFrame(frame)) {
            qCDebug(lcFrames).noquote() << "[RX]" << describe(frame.code, frame.payload);
            if (frame.code == expected) { response = frame; return WaitResult::Matched; }
            if (frame.code == static_cast<uint8_t>(ResponseCode::Error)) { response = frame; return WaitResult::DeviceError; }
            if (isPushCode(frame.code)) {
                emit pushReceived(frame);
                if (closed_) return WaitResult::Closed;
                continue;
            }
            qCDebug(lcProtocol) << "ignoring stray frame with code" << frame.code << "while waiting for" << commandName(cmd);
        }
        if (closed_) return WaitResult::Closed;
        if (deadline.hasExpired()) return WaitResult::TimedOut;
        const QByteArray bytes = transport_->readTimeout(kReadChunk, deadline);
        if (closed_) return WaitResult::Closed;
        if (bytes.isEmpty()) {
            if (!transport_->isOpen()) return WaitResult::Lost;
            continue;
        }
        const int errors = framer_.feed(bytes);
        if (errors > 0) qCWarning(lcProtocol).noquote() << "dropped" << errors << "malformed frame(s):" << framer_.lastFrameError();
    }
}
// Late or duplicate replies to an earlier request must not answer this one.
void CompanionClient::discardStale() {
    const QDeadlineTimer now(0);
    while (transport_->isOpen()) {
        const QByteArray bytes = transport_->readTimeout(kReadChunk, now);
        if (bytes.isEmpty()) break;
        framer_.feed(bytes);
    }
    Frame frame;
    while (framer_.tryPopFrame(frame)) {
        if (isPushCode(frame.code)) { emit pushReceived(frame); continue; }
        qCDebug(lcProtocol).noquote() << "dropping stale frame" << describe(frame.code, frame.payload);
    }
}
Error CompanionClient::setRadioParams(const RadioSetting& setting) {
    if (!handshaken_) return fail(Error::make(ErrorKind::Handshake, QStringLiteral("SET_RADIO_PARAMS before handshake")));
    Frame response;
    return request(CommandCode::SetRadioParams, companion::radioParamsPayload(setting), response);
}
Error CompanionClient::getNoiseFloor(int16_t& sample) {
    if (!handshaken_) return fail(Error::make(ErrorKind::Handshake, QStringLiteral("GET_STATS before handshake")));
    if (!stats_shape_.isEmpty()) {
        const Error e = requestStats(stats_shape_, sample);
        if (!e.ok()) {
            qCWarning(lcProtocol).noquote() << "GET_STATS request" << toHex(stats_shape_) << "stopped working, will probe again";
            stats_shape_.clear();
        }
        return e;
    }
    const QVector<QByteArray> shapes = config_.probeStatsShapes ? statsShapes() : QVector<QByteArray>{statsShapes().first()};
    Error last;
    for (const QByteArray& shape : shapes) {
        last = requestStats(shape, sample);
        if (last.ok()) {
            stats_shape_ = shape;
            qCInfo(lcProtocol).noquote() << "GET_STATS working request:" << describe(static_cast<uint8_t>(CommandCode::GetStats), shape);
            return last;
        }
        if (last.kind != ErrorKind::Protocol) return last;
        qCDebug(lcProtocol).noquote() << "GET_STATS request" << describe(static_cast<uint8_t>(CommandCode::GetStats), shape) << "rejected:" << last.message;
    }
    if (shapes.size() == 1) return last;
    return fail(Error::make(ErrorKind::Protocol, QStringLiteral("GET_STATS failed for all request shapes (last: %1)").arg(last.message), last.deviceCode));
}
Error CompanionClient::requestStats(QByteArrayView shape, int16_t& sample) {
    Frame response;
    const Error e = request(CommandCode::GetStats, shape, response);
    if (!e.ok()) return e;
    RadioStats stats;
    if (!companion::parseRadioStats(response.payload, stats)) return fail(Error::make(ErrorKind::Protocol, QStringLiteral("STATS reply does not carry radio stats")));
    sample = stats.noiseFloor;
    return Error::none();
}
void CompanionClient::close() {
    if (closed_) return;
    closed_ = true;
    handshaken_ = false;
    if (transport_) transport_->close();
}
bool CompanionClient::isOpen() const { return !closed_ && transport_ && transport_->isOpen(); }
Error CompanionClient::fail(Error error) {
    qCDebug(lcProtocol).noquote() << errorKindName(error.kind) << "-" << error.message;
    emit errorOccurred(error.message);
    return error;
}
}

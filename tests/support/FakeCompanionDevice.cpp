#include "FakeCompanionDevice.h"
#include "protocol/CompanionMessages.h"
#include <QtCore/QThread>
namespace {
void appendU32Le(QByteArray& out, uint32_t v) { for (int k = 0; k < 4; ++k) out.append(static_cast<char>((v >> (8 * k)) & 0xFF)); }
void appendFixed(QByteArray& out, const QByteArray& text, int width) {
    QByteArray field = text.left(width);
    field.append(width - field.size(), '\0');
    out.append(field);
}
}
namespace nf::test {
FakeCompanionDevice::FakeCompanionDevice(QObject* parent) : ITransport(parent) {}
bool FakeCompanionDevice::open(const TransportConfig&) {
    ++open_count_;
    emit stateChanged(ConnectionState::Connecting);
    if (fail_open_) {
        error_ = QStringLiteral("Connection refused");
        emit errorOccurred(error_);
        emit stateChanged(ConnectionState::Error);
        return false;
    }
    open_ = true;
    emit stateChanged(ConnectionState::Connected);
    return true;
}
void FakeCompanionDevice::close() {
    if (!open_) return;
    open_ = false;
    ++close_count_;
    emit stateChanged(ConnectionState::Disconnected);
}
qint64 FakeCompanionDevice::write(const QByteArray& data) {
    if (!open_) return -1;
    ++write_count_;
    device_framer_.feed(data);
    Frame request;
    while (device_framer_.tryPopFrame(request)) {
        requests_.push_back(request);
        if (drop_on_ != 0 && request.code == drop_on_ && --drop_occurrence_ == 0) {
            open_ = false;
            error_ = QStringLiteral("device unplugged");
            emit errorOccurred(error_);
            emit stateChanged(ConnectionState::Error);
            return data.size();
        }
        if (silent_ || silent_for_.contains(request.code)) continue;
        QVector<QByteArray> bodies;
        if (handler_) bodies = handler_(request);
        if (bodies.isEmpty()) bodies = defaultReply(request);
        for (const QByteArray& body : bodies) queueReply(body);
    }
    return data.size();
}
QByteArray FakeCompanionDevice::readTimeout(qint64 maxBytes, const QDeadlineTimer& deadline) {
    if (pending_.isEmpty()) {
        const qint64 remaining = deadline.remainingTime();
        if (open_ && remaining > 0) QThread::msleep(static_cast<unsigned long>(remaining));
        return {};
    }
    qint64 n = qMin<qint64>(maxBytes, pending_.size());
    if (chunk_size_ > 0) n = qMin<qint64>(n, chunk_size_);
    const QByteArray out = pending_.left(n);
    pending_.remove(0, n);
    return out;
}
int FakeCompanionDevice::countOf(CommandCode cmd) const {
    int n = 0;
    for (const Frame& f : requests_) if (f.code == static_cast<uint8_t>(cmd)) ++n;
    return n;
}
QVector<RadioSetting> FakeCompanionDevice::radioSettings() const {
    QVector<RadioSetting> out;
    for (const Frame& f : requests_) {
        RadioSetting s;
        if (f.code == static_cast<uint8_t>(CommandCode::SetRadioParams) && companion::parseRadioParams(f.payload, s)) out.push_back(s);
    }
    return out;
}
QVector<QByteArray> FakeCompanionDevice::defaultReply(const Frame& request) {
    switch (static_cast<CommandCode>(request.code)) {
    case CommandCode::DeviceQuery: return {deviceInfoBody()};
    case CommandCode::AppStart: return {selfInfoBody()};
    case CommandCode::SetRadioParams: {
        RadioSetting s;
        if (!companion::parseRadioParams(request.payload, s)) return {errorBody(companion::kErrIllegalArg)};
        const qint64 khz = qRound64(s.frequencyMhz * 1000.0);
        if (radio_errors_.contains(khz)) return {errorBody(radio_errors_.value(khz))};
        current_khz_ = khz;
        sample_index_ = 0;
        return {okBody()};
    }
    case CommandCode::GetStats: {
        if (!accepted_shape_.isEmpty()) {
            if (request.payload != accepted_shape_) return {errorBody(companion::kErrUnsupported)};
        } else if (request.payload.isEmpty() || request.payload[0] != static_cast<char>(StatsType::Radio)) {
            return {errorBody(companion::kErrUnsupported)};
        }
        if (stats_errors_.contains(current_khz_)) return {errorBody(stats_errors_.value(current_khz_))};
        if (noise_script_.isEmpty()) return {statsBody(-100)};
        const int16_t v = noise_script_[sample_index_ % noise_script_.size()];
        ++sample_index_;
        return {statsBody(v)};
    }
    }
    return {errorBody(companion::kErrUnsupported)};
}
RadioSetting FakeCompanionDevice::originalRadio() { return RadioSetting{910.525, RadioParams{62.5, 7, 5}}; }
QByteArray FakeCompanionDevice::deviceInfoBody() {
    QByteArray b;
    b.append(static_cast<char>(ResponseCode::DeviceInfo));
    b.append(static_cast<char>(10));
    b.append(static_cast<char>(50));
    b.append(static_cast<char>(8));
    appendU32Le(b, 123456);
    appendFixed(b, "19 Oct 2026", 12);
    appendFixed(b, "Heltec V3", 40);
    appendFixed(b, "v1.13.0", 20);
    b.append(2, '\0');
    return b;
}
QByteArray FakeCompanionDevice::selfInfoBody() {
    const RadioSetting r = originalRadio();
    QByteArray b;
    b.append(static_cast<char>(ResponseCode::SelfInfo));
    b.append(static_cast<char>(1));
    b.append(static_cast<char>(22));
    b.append(static_cast<char>(22));
    b.append(32, '\x5A');
    appendU32Le(b, 0);
    appendU32Le(b, 0);
    b.append(4, '\0');
    b.append(companion::radioParamsPayload(r));
    b.append("TestNode");
    return b;
}
QByteArray FakeCompanionDevice::statsBody(int16_t noiseFloor) {
    QByteArray b;
    b.append(static_cast<char>(ResponseCode::Stats));
    b.append(static_cast<char>(StatsType::Radio));
    const uint16_t raw = static_cast<uint16_t>(noiseFloor);
    b.append(static_cast<char>(raw & 0xFF));
    b.append(static_cast<char>((raw >> 8) & 0xFF));
    b.append(static_cast<char>(-95));
    b.append(static_cast<char>(24));
    appendU32Le(b, 12);
    appendU32Le(b, 340);
    return b;
}
QByteArray FakeCompanionDevice::okBody() { return QByteArray(1, static_cast<char>(ResponseCode::Ok)); }
QByteArray FakeCompanionDevice::errorBody(uint8_t code) {
    QByteArray b(1, static_cast<char>(ResponseCode::Error));
    b.append(static_cast<char>(code));
    return b;
}
}

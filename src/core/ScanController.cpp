#include "core/ScanController.h"
#include "common/logging.h"
namespace {
QString mhz(double f) { return QString::number(f, 'g', 10); }
// Puts the device back on the radio setting it had before the scan and closes the
// link, on every path out of run() once the handshake has succeeded.
class DeviceSession {
public:
    DeviceSession(nf::CompanionClient* client, bool restore)
        : client_(client), original_(client->selfInfo().radio), restore_(restore && original_.frequencyMhz > 0.0) {}
    ~DeviceSession() { release(); }
    DeviceSession(const DeviceSession&) = delete;
    DeviceSession& operator=(const DeviceSession&) = delete;
    void release() {
        if (!client_) return;
        if (restore_ && client_->isOpen()) {
            qCInfo(lcScan) << "restoring radio to" << original_.frequencyMhz << "MHz";
            const nf::Error e = client_->setRadioParams(original_);
            if (!e.ok()) qCWarning(lcScan).noquote() << "could not restore radio setting:" << e.message;
        }
        client_->close();
        client_ = nullptr;
    }
private:
    nf::CompanionClient* client_;
    nf::RadioSetting original_;
    bool restore_;
};
}
namespace nf {
const char* scanStateName(ScanState state) {
    switch (state) {
    case ScanState::Idle: return "idle";
    case ScanState::Handshaking: return "handshake";
    case ScanState::SettingParams: return "set radio params";
    case ScanState::Dwelling: return "dwell";
    case ScanState::Emitting: return "emit record";
    case ScanState::Finished: return "finished";
    case ScanState::Failed: return "failed";
    }
    return "unknown";
}
ScanController::ScanController(CompanionClient* client, IClock* clock, ScanConfig config, QObject* parent)
    : QObject(parent), client_(client), clock_(clock), config_(std::move(config)) {}
ScanResult ScanController::run() {
    ScanResult result;
    index_ = -1;
    setState(ScanState::Handshaking);
    Error e = client_->open();
    if (!e.ok()) return failWith(result, e, state_);
    e = client_->handshake();
    if (!e.ok()) {
        client_->close();
        return failWith(result, e, state_);
    }
    if (sink_ && !sink_->begin()) {
        client_->close();
        return failWith(result, Error::make(ErrorKind::Output, QStringLiteral("cannot create output: %1").arg(sink_->errorString())), state_);
    }
    DeviceSession session(client_, config_.restoreRadio);

    const ScanPlan& plan = config_.plan;
    int consecutive_failures = 0;
    for (int i = 0; i < plan.size(); ++i) {
        if (stop_requested_.load()) {
            qCInfo(lcScan) << "stop requested, ending after" << i << "of" << plan.size() << "frequencies";
            result.stopped = true;
            break;
        }
        index_ = i;
        const double freq = plan.at(i);
        emit progress(i + 1, plan.size(), freq);
        FrequencyRecord record;
        bool failed = false;
        e = scanFrequency(freq, record, failed);
        if (e.isFatal()) return failWith(result, e, state_);

        setState(ScanState::Emitting);
        emitRecord(record);
        result.records.push_back(record);

        consecutive_failures = failed ? consecutive_failures + 1 : 0;
        if (consecutive_failures >= config_.maxConsecutiveFailures) {
            return failWith(result, Error::make(e.kind, QStringLiteral("%1 consecutive frequencies failed, device looks offline (last: %2)").arg(consecutive_failures).arg(e.message), e.deviceCode), failure_step_);
        }
    }
    session.release();
    setState(ScanState::Finished);
    result.state = ScanState::Finished;
    if (renderer_ && !renderer_->render(result.records)) warn(QStringLiteral("chart not rendered: %1").arg(renderer_->errorString()));
    return result;
}
Error ScanController::scanFrequency(double frequencyMhz, FrequencyRecord& record, bool& failed) {
    aggregator_.reset();
    failed = false;
    setState(ScanState::SettingParams);
    Error e = client_->setRadioParams(RadioSetting{frequencyMhz, config_.radio});
    if (!e.ok()) {
        if (e.isFatal()) return e;
        warn(QStringLiteral("%1 MHz skipped: %2").arg(mhz(frequencyMhz), e.message));
        failed = true;
        failure_step_ = ScanState::SettingParams;
    } else {
        clock_->sleepMs(config_.settleMs);
        setState(ScanState::Dwelling);
        bool aborted = false;
        e = dwell(frequencyMhz, aborted);
        if (e.isFatal()) return e;
        failed = aborted && aggregator_.count() == 0;
        if (failed) failure_step_ = ScanState::Dwelling;
    }
    const SampleSummary s = aggregator_.finalize();
    record.frequencyMhz = frequencyMhz;
    record.samples = s.count;
    record.average = s.average;
    record.minimum = s.minimum;
    record.maximum = s.maximum;
    record.stdev = s.stdev;
    return e;
}
Error ScanController::dwell(double frequencyMhz, bool& aborted) {
    aborted = false;
    const qint64 end = clock_->nowMs() + config_.dwellMs;
    while (clock_->nowMs() < end) {
        int16_t sample = 0;
        const Error e = client_->getNoiseFloor(sample);
        if (!e.ok()) {
            if (e.isFatal()) return e;
            aborted = true;
            warn(QStringLiteral("%1 MHz: dwell aborted after %2 sample(s): %3").arg(mhz(frequencyMhz)).arg(aggregator_.count()).arg(e.message));
            return e;
        }
        aggregator_.observe(sample);
        emit sampleTaken(frequencyMhz, sample);
        clock_->sleepMs(config_.sampleIntervalMs);
    }
    return Error::none();
}
void ScanController::emitRecord(const FrequencyRecord& record) {
    if (sink_ && !sink_->append(record)) warn(QStringLiteral("record for %1 MHz not written: %2").arg(mhz(record.frequencyMhz), sink_->errorString()));
    emit recordReady(record);
}
void ScanController::setState(ScanState state) {
    if (state_ == state) return;
    state_ = state;
    qCDebug(lcScan) << "state" << scanStateName(state);
    emit stateChanged(state);
}
void ScanController::warn(const QString& message) {
    qCWarning(lcScan).noquote() << message;
    emit warning(message);
}
ScanResult ScanController::failWith(ScanResult result, const Error& error, ScanState step) {
    qCCritical(lcScan).noquote() << "scan failed during" << scanStateName(step) << "-" << error.message;
    result.failedIn = step;
    result.error = error;
    result.state = ScanState::Failed;
    setState(ScanState::Failed);
    return result;
}
}

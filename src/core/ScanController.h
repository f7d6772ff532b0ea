#pragma once
#include "common/Clock.h"
#include "core/CompanionClient.h"
#include "core/RecordSink.h"
#include "core/ScanPlan.h"
#include "core/StatsAggregator.h"
#include <QtCore/QObject>
#include <atomic>
namespace nf {
enum class ScanState { Idle, Handshaking, SettingParams, Dwelling, Emitting, Finished, Failed };
const char* scanStateName(ScanState state);
struct ScanConfig {
    ScanPlan plan;
    RadioParams radio;
    qint64 dwellMs = 15 * 60 * 1000;
    qint64 sampleIntervalMs = 5000;
    qint64 settleMs = 2000;
    int maxConsecutiveFailures = 3;
    bool restoreRadio = true;
};
struct ScanResult {
    ScanState state = ScanState::Idle;
    Error error;
    QVector<FrequencyRecord> records;
    ScanState failedIn = ScanState::Idle;
    bool stopped = false;
    bool ok() const { return state == ScanState::Finished; }
};
class ScanController : public QObject {
    Q_OBJECT
public:
    ScanController(CompanionClient* client, IClock* clock, ScanConfig config, QObject* parent = nullptr);
    void setRecordSink(IRecordSink* sink) { sink_ = sink; }
    void setChartRenderer(IChartRenderer* renderer) { renderer_ = renderer; }
    ScanResult run();
    // Safe from a signal handler; honoured between frequencies.
    void requestStop() { stop_requested_.store(true); }
    ScanState state() const { return state_; }
    int currentIndex() const { return index_; }
signals:
    void stateChanged(nf::ScanState state);
    void progress(int index, int total, double frequencyMhz);
    void sampleTaken(double frequencyMhz, int sample);
    void recordReady(const nf::FrequencyRecord& record);
    void warning(const QString& message);
private:
    Error scanFrequency(double frequencyMhz, FrequencyRecord& record, bool& failed);
    Error dwell(double frequencyMhz, bool& aborted);
    void emitRecord(const FrequencyRecord& record);
    void setState(ScanState state);
    void warn(const QString& message);
    ScanResult failWith(ScanResult result, const Error& error, ScanState step);
    CompanionClient* client_ = nullptr;
    IClock* clock_ = nullptr;
    ScanConfig config_;
    IRecordSink* sink_ = nullptr;
    IChartRenderer* renderer_ = nullptr;
    StatsAggregator aggregator_;
    ScanState state_ = ScanState::Idle;
    int index_ = -1;
    ScanState failure_step_ = ScanState::Idle;
    std::atomic<bool> stop_requested_{false};
};
}

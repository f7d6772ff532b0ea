#include "core/CsvRecordSink.h"
#include "common/logging.h"
#include <cmath>
namespace {
QByteArray cell(double v) { return std::isnan(v) ? QByteArray() : QByteArray::number(v, 'g', 10); }
}
namespace nf {
bool CsvRecordSink::begin() {
    if (file_.isOpen()) return true;
    if (path_.isEmpty()) { error_ = QStringLiteral("no CSV path configured"); return false; }
    return open(path_);
}
bool CsvRecordSink::open(const QString& path) {
    if (file_.isOpen()) file_.close();
    path_ = path;
    file_.setFileName(path);
    if (!file_.open(QIODevice::WriteOnly | QIODevice::Truncate)) { error_ = file_.errorString(); return false; }
    error_.clear();
    return writeLine(header());
}
void CsvRecordSink::close() { if (file_.isOpen()) file_.close(); }
bool CsvRecordSink::append(const FrequencyRecord& record) {
    if (!file_.isOpen()) { error_ = QStringLiteral("CSV file is not open"); return false; }
    return writeLine(formatRow(record));
}
QByteArray CsvRecordSink::header() { return "freq_mhz,samples,noise_floor_avg,noise_floor_min,noise_floor_max,noise_floor_stdev\n"; }
QByteArray CsvRecordSink::formatRow(const FrequencyRecord& r) {
    QByteArray line = QByteArray::number(r.frequencyMhz, 'g', 10);
    line += ',' + QByteArray::number(r.samples);
    line += ',' + cell(r.average) + ',' + cell(r.minimum) + ',' + cell(r.maximum) + ',' + cell(r.stdev) + '\n';
    return line;
}
// One write per line, flushed, so a crash never leaves a partial row behind a complete one.
bool CsvRecordSink::writeLine(const QByteArray& line) {
    if (file_.write(line) != line.size() || !file_.flush()) {
        error_ = file_.errorString();
        qCWarning(lcOutput) << "CSV write to" << file_.fileName() << "failed:" << error_;
        return false;
    }
    return true;
}
}

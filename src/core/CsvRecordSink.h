#pragma once
#include "core/RecordSink.h"
#include <QtCore/QFile>
namespace nf {
class CsvRecordSink final : public IRecordSink {
public:
    CsvRecordSink() = default;
    explicit CsvRecordSink(const QString& path) : path_(path) {}
    // Creates the file at the configured path unless it is already open.
    bool begin() override;
    bool open(const QString& path);
    void close();
    bool isOpen() const { return file_.isOpen(); }
    bool append(const FrequencyRecord& record) override;
    QString errorString() const override { return error_; }
    QString path() const { return path_; }
    static QByteArray header();
    static QByteArray formatRow(const FrequencyRecord& record);
private:
    bool writeLine(const QByteArray& line);
    QString path_;
    QFile file_;
    QString error_;
};
}

#pragma once
#include "core/RecordSink.h"
#include <QtCore/QSize>
#include <QtCore/QStringList>
namespace nf {
class PngChartRenderer final : public IChartRenderer {
public:
    PngChartRenderer(QString path, QStringList title, QSize size = QSize(1280, 960));
    bool render(const QVector<FrequencyRecord>& records) override;
    QString errorString() const override { return error_; }
    QString path() const { return path_; }
    bool rendered() const { return rendered_; }
private:
    QString path_;
    QStringList title_;
    QSize size_;
    QString error_;
    bool rendered_ = false;
};
}

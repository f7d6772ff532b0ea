#pragma once
#include "common/types.h"
namespace nf {
class IRecordSink {
public:
    virtual ~IRecordSink() = default;
    // Called once the device link is up, before the first record.
    virtual bool begin() { return true; }
    // Must be durable when it returns true; the scan does not retry.
    virtual bool append(const FrequencyRecord& record) = 0;
    virtual QString errorString() const = 0;
};
class IChartRenderer {
public:
    virtual ~IChartRenderer() = default;
    virtual bool render(const QVector<FrequencyRecord>& records) = 0;
    virtual QString errorString() const = 0;
};
}

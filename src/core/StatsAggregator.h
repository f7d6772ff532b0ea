#pragma once
#include <cstdint>
namespace nf {
struct SampleSummary {
    int count = 0;
    double average = 0.0;
    double minimum = 0.0;
    double maximum = 0.0;
    double stdev = 0.0;
};
// Running statistics over one frequency's dwell (Welford, population variance).
// With no samples every derived field is NaN.
class StatsAggregator {
public:
    void reset();
    void observe(int16_t sample);
    SampleSummary finalize() const;
    int count() const { return count_; }
private:
    int count_ = 0;
    double mean_ = 0.0;
    double m2_ = 0.0;
    int16_t min_ = 0;
    int16_t max_ = 0;
};
}

#include "core/StatsAggregator.h"
#include <cmath>
#include <limits>
namespace nf {
void StatsAggregator::reset() { count_ = 0; mean_ = 0.0; m2_ = 0.0; min_ = 0; max_ = 0; }
void StatsAggregator::observe(int16_t sample) {
    if (count_ == 0) { min_ = sample; max_ = sample; }
    else { if (sample < min_) min_ = sample; if (sample > max_) max_ = sample; }
    ++count_;
    const double delta = sample - mean_;
    mean_ += delta / count_;
    m2_ += delta * (sample - mean_);
}
SampleSummary StatsAggregator::finalize() const {
    SampleSummary s;
    s.count = count_;
    if (count_ == 0) {
        const double nan = std::numeric_limits<double>::quiet_NaN();
        s.average = s.minimum = s.maximum = s.stdev = nan;
        return s;
    }
    s.average = mean_;
    s.minimum = min_;
    s.maximum = max_;
    s.stdev = count_ > 1 ? std::sqrt(m2_ / count_) : 0.0;
    return s;
}
}

#include "core/ScanPlan.h"
#include <cmath>
#include <limits>
namespace {
constexpr double kEpsilon = 1e-9;
constexpr double kScale = 1e6;
}
namespace nf {
ScanPlan::ScanPlan(double startMhz, double endMhz, double stepMhz) : start_(startMhz), end_(endMhz), step_(stepMhz) {
    if (!(stepMhz > 0.0) || !(startMhz <= endMhz)) return;
    const double steps = std::floor((endMhz - startMhz) / stepMhz + kEpsilon);
    if (steps >= std::numeric_limits<int>::max()) return;
    count_ = static_cast<int>(steps) + 1;
}
double ScanPlan::at(int index) const {
    if (index < 0 || index >= count_) return std::numeric_limits<double>::quiet_NaN();
    return std::round((start_ + index * step_) * kScale) / kScale;
}
}

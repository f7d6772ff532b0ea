#pragma once
#include <QtCore/QtGlobal>
namespace nf {
// Frequencies start + i*step up to end inclusive, computed on demand.
// step <= 0 or start > end gives an empty plan.
class ScanPlan {
public:
    ScanPlan() = default;
    ScanPlan(double startMhz, double endMhz, double stepMhz);
    int size() const { return count_; }
    bool isEmpty() const { return count_ == 0; }
    double at(int index) const;
    double startMhz() const { return start_; }
    double endMhz() const { return end_; }
    double stepMhz() const { return step_; }
private:
    double start_ = 0.0;
    double end_ = 0.0;
    double step_ = 0.0;
    int count_ = 0;
};
}

#include "common/Clock.h"
#include <QtCore/QThread>
namespace nf {
SteadyClock::SteadyClock() { timer_.start(); }
qint64 SteadyClock::nowMs() const { return timer_.elapsed(); }
void SteadyClock::sleepMs(qint64 ms) { if (ms > 0) QThread::msleep(static_cast<unsigned long>(ms)); }
}

#pragma once
#include <QtCore/QElapsedTimer>
#include <QtCore/QtGlobal>
namespace nf {
class IClock {
public:
    virtual ~IClock() = default;
    virtual qint64 nowMs() const = 0;
    virtual void sleepMs(qint64 ms) = 0;
};
class SteadyClock final : public IClock {
public:
    SteadyClock();
    qint64 nowMs() const override;
    void sleepMs(qint64 ms) override;
private:
    QElapsedTimer timer_;
};
}

#include "moodcam/qt_tick_timer.hpp"

#include <QObject>
#include <utility>

namespace moodcam {

QtTickTimer::QtTickTimer() {
    timer_.setTimerType(Qt::PreciseTimer);
    QObject::connect(&timer_, &QTimer::timeout, [this]() {
        if (cb_) cb_();
    });
}

void QtTickTimer::set_callback(std::function<void()> cb) {
    cb_ = std::move(cb);
}

void QtTickTimer::start(int period_ms) {
    timer_.start(period_ms);
}

void QtTickTimer::stop() {
    timer_.stop();
}

bool QtTickTimer::active() const {
    return timer_.isActive();
}

}  // namespace moodcam

#pragma once

#include <functional>

#include <QTimer>

#include "tick_timer.hpp"

namespace moodcam {

class QtTickTimer : public TickTimer {
public:
    QtTickTimer();

    void set_callback(std::function<void()> cb) override;
    void start(int period_ms) override;
    void stop() override;
    bool active() const override;

private:
    QTimer timer_{};
    std::function<void()> cb_;
};

}  // namespace moodcam

#pragma once

#include <functional>

namespace moodcam {

// Repeating timer driven by the host event loop. The callback runs on the
// loop thread and the next tick is not delivered before it returns.
class TickTimer {
public:
    virtual ~TickTimer() = default;

    virtual void set_callback(std::function<void()> cb) = 0;
    virtual void start(int period_ms) = 0;
    virtual void stop() = 0;
    virtual bool active() const = 0;
};

}  // namespace moodcam

#pragma once

#include <atomic>

namespace reeldrop {

// Two-stage shutdown flag shared by the main loop and running workflows.
// stop: finish the current step, start no new one. abort: cut in-flight transfers.
class StopSource {
public:
    void requestStop() { stop_.store(true); }

    void abort() {
        stop_.store(true);
        abort_.store(true);
    }

    bool stopRequested() const { return stop_.load(); }
    bool abortRequested() const { return abort_.load(); }

private:
    std::atomic<bool> stop_{false};
    std::atomic<bool> abort_{false};
};

} // namespace reeldrop

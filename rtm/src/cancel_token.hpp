#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

// Copyable handle on a shared cancellation flag. Copies observe the same flag.
class CancelToken {
public:
    CancelToken();

    void cancel();
    bool is_cancelled() const;
    // Throws RtmException(Cancelled) once cancel() has been called.
    void throw_if_cancelled() const;
    // Sleeps up to `duration`; returns true early if the token is cancelled.
    bool wait_for(std::chrono::milliseconds duration) const;

private:
    struct State {
        mutable std::mutex mtx;
        std::condition_variable cv;
        bool cancelled = false;
    };
    std::shared_ptr<State> state_;
};

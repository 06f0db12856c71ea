#include "cancel_token.hpp"
#include "exception.hpp"
#include "localization.hpp"

CancelToken::CancelToken() : state_(std::make_shared<State>()) {}

void CancelToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(state_->mtx);
        state_->cancelled = true;
    }
    state_->cv.notify_all();
}

bool CancelToken::is_cancelled() const {
    std::lock_guard<std::mutex> lock(state_->mtx);
    return state_->cancelled;
}

void CancelToken::throw_if_cancelled() const {
    if (is_cancelled()) {
        throw RtmException(ErrorKind::Cancelled, get_string("error.cancelled"));
    }
}

bool CancelToken::wait_for(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(state_->mtx);
    return state_->cv.wait_for(lock, duration, [this] { return state_->cancelled; });
}

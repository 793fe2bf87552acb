#include "cancel.hpp"
#include "errors.hpp"
#include <string>

namespace tooledchat {

static int64_t steady_now_ns() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

CancellationToken::CancellationToken()
    : state_(std::make_shared<State>()) {}

void CancellationToken::cancel() {
    state_->flag.store(true, std::memory_order_relaxed);
}

void CancellationToken::cancel_after(std::chrono::milliseconds timeout) {
    int64_t deadline = steady_now_ns() +
        std::chrono::duration_cast<std::chrono::nanoseconds>(timeout).count();
    // Never 0: that value means "no deadline"
    state_->deadline_ns.store(deadline == 0 ? 1 : deadline, std::memory_order_relaxed);
}

bool CancellationToken::cancelled() const {
    if (state_->flag.load(std::memory_order_relaxed)) return true;
    int64_t deadline = state_->deadline_ns.load(std::memory_order_relaxed);
    if (deadline != 0 && steady_now_ns() >= deadline) {
        state_->flag.store(true, std::memory_order_relaxed);
        return true;
    }
    return false;
}

void CancellationToken::throw_if_cancelled(const char* stage) const {
    if (cancelled()) {
        throw Error(ErrorKind::Cancelled, std::string("Cancelled while ") + stage);
    }
}

} // namespace tooledchat

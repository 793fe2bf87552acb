#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

namespace tooledchat {

// Caller-driven abort for a single turn. Copies share state, so the caller
// keeps one copy and hands another to the turn. A default-constructed token
// is live (never cancelled until cancel() is called).
class CancellationToken {
public:
    CancellationToken();

    void cancel();

    // Cancel automatically once the timeout elapses (caller-driven deadline).
    void cancel_after(std::chrono::milliseconds timeout);

    bool cancelled() const;

    // Throws Error{Cancelled} when cancelled
    void throw_if_cancelled(const char* stage) const;

private:
    struct State {
        std::atomic<bool> flag{false};
        std::atomic<int64_t> deadline_ns{0}; // steady_clock; 0 = none
    };
    std::shared_ptr<State> state_;
};

} // namespace tooledchat

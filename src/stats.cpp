#include "stats.hpp"
#include "event.hpp"

namespace tooledchat {

double StatsSnapshot::error_rate() const {
    return turns == 0 ? 0.0 : static_cast<double>(failed_turns) / static_cast<double>(turns);
}

double StatsSnapshot::average_turn_ms() const {
    return turns == 0 ? 0.0 : static_cast<double>(total_turn_ms) / static_cast<double>(turns);
}

double StatsSnapshot::average_model_latency_ms() const {
    return model_requests == 0
        ? 0.0
        : static_cast<double>(total_model_ms) / static_cast<double>(model_requests);
}

TurnStats::TurnStats(EventBus& bus) : bus_(bus) {
    subscriptions_.push_back(subscribe<ModelResponseEvent>(bus_,
        [this](const ModelResponseEvent& ev) {
            std::lock_guard<std::mutex> lock(mutex_);
            stats_.model_requests++;
            stats_.total_model_ms += ev.latency_ms;
        }));

    subscriptions_.push_back(subscribe<ToolCallResultEvent>(bus_,
        [this](const ToolCallResultEvent& ev) {
            std::lock_guard<std::mutex> lock(mutex_);
            stats_.tool_calls++;
            if (!ev.success) stats_.tool_failures++;
        }));

    subscriptions_.push_back(subscribe<TurnCompletedEvent>(bus_,
        [this](const TurnCompletedEvent& ev) {
            std::lock_guard<std::mutex> lock(mutex_);
            stats_.turns++;
            stats_.total_turn_ms += ev.duration_ms;
            if (!ev.success) {
                stats_.failed_turns++;
                stats_.failures_by_kind[error_kind_name(ev.error_kind)]++;
            }
        }));
}

TurnStats::~TurnStats() {
    for (uint64_t id : subscriptions_) {
        bus_.unsubscribe(id);
    }
}

StatsSnapshot TurnStats::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

nlohmann::json TurnStats::to_json() const {
    StatsSnapshot s = snapshot();
    return {
        {"turns", s.turns},
        {"failed_turns", s.failed_turns},
        {"error_rate", s.error_rate()},
        {"average_turn_ms", s.average_turn_ms()},
        {"model_requests", s.model_requests},
        {"average_model_latency_ms", s.average_model_latency_ms()},
        {"tool_calls", s.tool_calls},
        {"tool_failures", s.tool_failures},
        {"failures_by_kind", s.failures_by_kind}
    };
}

void TurnStats::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_ = StatsSnapshot{};
}

} // namespace tooledchat

#pragma once
#include "event_bus.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace tooledchat {

struct StatsSnapshot {
    uint64_t turns = 0;
    uint64_t failed_turns = 0;
    uint64_t model_requests = 0;
    uint64_t tool_calls = 0;
    uint64_t tool_failures = 0;
    uint64_t total_turn_ms = 0;
    uint64_t total_model_ms = 0;
    std::map<std::string, uint64_t> failures_by_kind; // error_kind_name -> count

    double error_rate() const;
    double average_turn_ms() const;
    double average_model_latency_ms() const;
};

// Request statistics collected from loop events.
// Subscribes on construction and unsubscribes on destruction; the bus
// must outlive this object. Thread-safe.
class TurnStats {
public:
    explicit TurnStats(EventBus& bus);
    ~TurnStats();
    TurnStats(const TurnStats&) = delete;
    TurnStats& operator=(const TurnStats&) = delete;

    StatsSnapshot snapshot() const;
    nlohmann::json to_json() const;
    void reset();

private:
    EventBus& bus_;
    std::vector<uint64_t> subscriptions_;
    mutable std::mutex mutex_;
    StatsSnapshot stats_;
};

} // namespace tooledchat

#include "session.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "formatter.hpp"
#include "providers/ollama.hpp"
#include "stats.hpp"
#include "util.hpp"
#include <iostream>

namespace tooledchat {

SessionManager::SessionManager(const Config& config, HttpClient& http,
                               const ToolRegistry& registry, PromptTemplates templates)
    : config_(config), http_(http), registry_(registry), templates_(std::move(templates))
{}

std::unique_ptr<Provider> SessionManager::make_provider() const {
    if (provider_factory_) return provider_factory_();
    return std::make_unique<OllamaProvider>(
        http_, config_.ollama.base_url(),
        static_cast<long>(config_.ollama.request_timeout),
        static_cast<long>(config_.ollama.health_check_timeout));
}

std::shared_ptr<Session> SessionManager::get_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = sessions_.find(session_id);
    if (it != sessions_.end()) {
        it->second->last_active = epoch_seconds();
        return it->second;
    }

    // Create new session
    auto session = std::make_shared<Session>();
    session->id = session_id;
    session->loop = std::make_unique<ConversationLoop>(
        make_provider(), registry_, templates_, config_.agent,
        config_.ollama.model, config_.ollama.temperature);
    session->last_active = epoch_seconds();

    // Propagate event bus to new session
    if (event_bus_) {
        session->loop->set_event_bus(event_bus_);
        session->loop->set_session_id(session_id);

        SessionCreatedEvent ev;
        ev.session_id = session_id;
        event_bus_->publish(ev);
    }

    sessions_.emplace(session_id, session);
    return session;
}

TurnOutcome SessionManager::run_turn(const std::string& session_id, const std::string& text,
                                     TurnOptions options) {
    auto session = get_session(session_id);

    if (!options.system_prompt_override && !config_.prompts.system_prompt.empty()) {
        options.system_prompt_override = config_.prompts.system_prompt;
    }

    std::lock_guard<std::mutex> turn_lock(session->turn_mutex);
    TurnOutcome outcome = session->loop->run_turn(text, options);

    const auto& limits = config_.session;
    if (session->loop->history_size() > limits.max_history_messages) {
        size_t dropped = session->loop->prune_history(limits.history_prune_threshold);
        std::cerr << "[session] Pruned " << dropped << " messages from " << session_id << '\n';
    }
    session->last_active = epoch_seconds();
    return outcome;
}

std::string SessionManager::process(const std::string& session_id, const std::string& text,
                                    TurnOptions options) {
    return format_response(run_turn(session_id, text, std::move(options)), templates_);
}

bool SessionManager::remove_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.erase(session_id) > 0;
}

size_t SessionManager::evict_idle() {
    return evict_idle(config_.session.idle_timeout);
}

size_t SessionManager::evict_idle(uint64_t max_idle_seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t now = epoch_seconds();
    size_t evicted = 0;

    for (auto it = sessions_.begin(); it != sessions_.end(); ) {
        auto& session = it->second;
        uint64_t last = session->last_active.load();
        bool idle = now > last && (now - last) > max_idle_seconds;
        // A session mid-turn is never idle
        std::unique_lock<std::mutex> busy(session->turn_mutex, std::try_to_lock);
        if (idle && busy.owns_lock()) {
            busy.unlock();
            if (event_bus_) {
                SessionEvictedEvent ev;
                ev.session_id = it->first;
                event_bus_->publish(ev);
            }
            std::cerr << "[session] Evicted idle session " << it->first << '\n';
            it = sessions_.erase(it);
            evicted++;
        } else {
            ++it;
        }
    }
    return evicted;
}

std::vector<std::string> SessionManager::list_sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto& [id, _] : sessions_) {
        ids.push_back(id);
    }
    return ids;
}

size_t SessionManager::session_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

nlohmann::json SessionManager::diagnostics_json(const TurnStats* stats) const {
    nlohmann::json j;
    j["host"] = config_.ollama.host;
    j["port"] = config_.ollama.port;
    j["model"] = config_.ollama.model;
    j["tools"] = registry_.size();

    nlohmann::json sessions = nlohmann::json::object();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        j["session_count"] = sessions_.size();
        for (const auto& [id, session] : sessions_) {
            // Skip sizes of sessions mid-turn rather than racing the loop
            std::unique_lock<std::mutex> busy(session->turn_mutex, std::try_to_lock);
            nlohmann::json entry;
            entry["last_active"] = session->last_active.load();
            if (busy.owns_lock()) {
                entry["history_size"] = session->loop->history_size();
                entry["model"] = session->loop->model();
            } else {
                entry["busy"] = true;
            }
            sessions[id] = std::move(entry);
        }
    }
    j["sessions"] = std::move(sessions);

    if (stats) {
        j["stats"] = stats->to_json();
    }
    return j;
}

} // namespace tooledchat

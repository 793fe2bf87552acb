#pragma once
#include "tool.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tooledchat {

// Immutable view of the registered tools, in registration order.
// A conversation turn holds one snapshot for its whole lifetime.
class ToolSnapshot {
public:
    ToolSnapshot() = default;
    explicit ToolSnapshot(std::vector<std::shared_ptr<Tool>> tools);

    const std::vector<std::shared_ptr<Tool>>& tools() const { return tools_; }
    size_t size() const { return tools_.size(); }
    bool empty() const { return tools_.empty(); }

    // nullptr if absent
    Tool* find(const std::string& name) const;

    std::vector<std::string> names() const;

private:
    std::vector<std::shared_ptr<Tool>> tools_;
};

// Shared, read-mostly tool set. Every mutation builds a new snapshot and
// publishes it under the lock, so readers see either the old or the new
// set, never a partial one.
// All methods are thread-safe.
class ToolRegistry {
public:
    ToolRegistry();

    // Throws std::invalid_argument on an invalid or duplicate name.
    void register_tool(std::shared_ptr<Tool> tool);

    // All-or-nothing: if any tool is rejected, nothing is published.
    void register_tools(std::vector<std::shared_ptr<Tool>> tools);

    // Returns true if found and removed.
    bool unregister_tool(const std::string& name);

    std::shared_ptr<const ToolSnapshot> snapshot() const;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const ToolSnapshot> current_;
};

} // namespace tooledchat

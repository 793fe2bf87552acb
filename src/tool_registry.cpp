#include "tool_registry.hpp"
#include <stdexcept>

namespace tooledchat {

ToolSnapshot::ToolSnapshot(std::vector<std::shared_ptr<Tool>> tools)
    : tools_(std::move(tools)) {}

Tool* ToolSnapshot::find(const std::string& name) const {
    for (const auto& tool : tools_) {
        if (tool->tool_name() == name) return tool.get();
    }
    return nullptr;
}

std::vector<std::string> ToolSnapshot::names() const {
    std::vector<std::string> out;
    out.reserve(tools_.size());
    for (const auto& tool : tools_) {
        out.push_back(tool->tool_name());
    }
    return out;
}

ToolRegistry::ToolRegistry()
    : current_(std::make_shared<const ToolSnapshot>()) {}

void ToolRegistry::register_tool(std::shared_ptr<Tool> tool) {
    std::vector<std::shared_ptr<Tool>> tools;
    tools.push_back(std::move(tool));
    register_tools(std::move(tools));
}

void ToolRegistry::register_tools(std::vector<std::shared_ptr<Tool>> tools) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::shared_ptr<Tool>> next = current_->tools();
    next.reserve(next.size() + tools.size());
    for (auto& tool : tools) {
        if (!tool) {
            throw std::invalid_argument("Cannot register a null tool");
        }
        std::string name = tool->tool_name();
        if (!is_valid_tool_name(name)) {
            throw std::invalid_argument("Invalid tool name: " + name);
        }
        for (const auto& existing : next) {
            if (existing->tool_name() == name) {
                throw std::invalid_argument("Tool already registered: " + name);
            }
        }
        next.push_back(std::move(tool));
    }

    current_ = std::make_shared<const ToolSnapshot>(std::move(next));
}

bool ToolRegistry::unregister_tool(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::shared_ptr<Tool>> next;
    bool found = false;
    for (const auto& tool : current_->tools()) {
        if (tool->tool_name() == name) {
            found = true;
            continue;
        }
        next.push_back(tool);
    }
    if (!found) return false;

    current_ = std::make_shared<const ToolSnapshot>(std::move(next));
    return true;
}

std::shared_ptr<const ToolSnapshot> ToolRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

size_t ToolRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_->size();
}

} // namespace tooledchat

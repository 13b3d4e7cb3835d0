#pragma once
#include "tool.hpp"
#include "config.hpp"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <unordered_map>
#include <mutex>

namespace toolgate {

using ToolFactory = std::function<std::unique_ptr<Tool>(const Config& config)>;

// Central registry for self-registering frontend tools.
// All methods are thread-safe.
class PluginRegistry {
public:
    static PluginRegistry& instance();

    void register_tool(const std::string& name, ToolFactory factory);

    std::unique_ptr<Tool> create_tool(const std::string& name, const Config& config) const;
    std::vector<std::unique_ptr<Tool>> create_all_tools(const Config& config) const;

    std::vector<std::string> tool_names() const;
    bool has_tool(const std::string& name) const;

    // Testing support
    void clear();

private:
    PluginRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ToolFactory> tools_;
};

// Used at file scope in each tool .cpp
struct ToolRegistrar {
    ToolRegistrar(const std::string& name, ToolFactory factory) {
        PluginRegistry::instance().register_tool(name, std::move(factory));
    }
};

} // namespace toolgate

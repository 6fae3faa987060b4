#include "tool_registry.h"
#include "logger.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace lumiere {

bool ToolRegistry::register_tool(std::shared_ptr<Tool> tool) {
    if (!tool) {
        Logger::error("Attempted to register null tool");
        return false;
    }

    std::string name = tool->name();
    if (tools_.find(name) != tools_.end()) {
        Logger::warn("Tool '" + name + "' is already registered. Skipping.");
        return false;
    }

    tools_[name] = tool;
    Logger::debug("Registered tool: " + name);
    return true;
}

std::shared_ptr<Tool> ToolRegistry::get_tool(const std::string& name) const {
    auto it = tools_.find(name);
    if (it != tools_.end()) {
        return it->second;
    }
    return nullptr;
}

std::string ToolRegistry::get_function_declarations_json() const {
    json declarations = json::array();

    for (const auto& [name, tool] : tools_) {
        json function_def;
        function_def["name"] = tool->name();
        function_def["description"] = tool->description();

        try {
            function_def["parameters"] = json::parse(tool->parameter_schema());
        } catch (const json::exception& e) {
            Logger::error("Failed to parse parameter schema for tool '" + name + "': " + e.what());
            function_def["parameters"] = json::object({{"type", "OBJECT"}});
        }

        declarations.push_back(function_def);
    }

    return declarations.dump();
}

} // namespace lumiere

#pragma once

#include "tool.h"
#include <string>
#include <vector>
#include <memory>
#include <map>

namespace lumiere {

/**
 * @brief Registry of the capabilities offered to the remote agent
 *
 * Produces the capability manifest (function declarations) sent in the
 * session setup message.
 */
class ToolRegistry {
public:
    /**
     * @brief Register a tool with the registry
     * @param tool Shared pointer to tool instance
     * @return true if registration successful, false if tool with same name already exists
     */
    bool register_tool(std::shared_ptr<Tool> tool);

    /**
     * @brief Get a tool by name
     * @return Shared pointer to tool, or nullptr if not found
     */
    std::shared_ptr<Tool> get_tool(const std::string& name) const;

    /**
     * @brief Function declarations for the session setup
     * @return JSON array of {name, description, parameters}
     */
    std::string get_function_declarations_json() const;

    size_t size() const { return tools_.size(); }

private:
    std::map<std::string, std::shared_ptr<Tool>> tools_;
};

} // namespace lumiere

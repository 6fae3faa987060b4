#pragma once

#include <string>

namespace lumiere {

/**
 * @brief Abstract base class for client-side capabilities the agent may invoke
 *
 * Each tool provides:
 * - A unique name (matched against inbound function calls)
 * - A description the remote agent reads to decide when to call it
 * - A JSON schema for its arguments
 *
 * Tools never touch the transport; the session sends acknowledgments.
 */
class Tool {
public:
    virtual ~Tool() = default;

    /**
     * @brief Get the tool's unique name
     * @return Tool name (e.g., "displayProducts")
     */
    virtual std::string name() const = 0;

    /**
     * @brief Get the tool's description for the remote agent
     */
    virtual std::string description() const = 0;

    /**
     * @brief Get the JSON schema for tool parameters
     * @return JSON schema string in the service's OpenAPI subset
     */
    virtual std::string parameter_schema() const = 0;
};

} // namespace lumiere

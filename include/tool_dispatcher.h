#pragma once

#include "core/types.h"
#include "tool_registry.h"
#include "tools/display_products_tool.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lumiere {

/**
 * @brief Outcome of matching one inbound function call
 */
struct DispatchResult {
    bool recognized = false;
    std::optional<std::vector<Product>> products;
};

/**
 * @brief Matches inbound function calls against the registered capabilities
 *
 * Pure matcher/validator: no transport access and no host callbacks. The
 * session invokes the host with the products and then sends acknowledge().
 */
class ToolDispatcher {
public:
    ToolDispatcher();

    /**
     * @brief Match and validate a call
     *
     * Unknown names and invalid payloads both come back unrecognized; a
     * validation failure is logged and must not be acknowledged.
     */
    DispatchResult dispatch(const ToolCall& call) const;

    /// Acknowledgment for a recognized call, paired by id
    static ToolResponse acknowledge(const ToolCall& call);

    /// Capability manifest for the session setup
    std::string manifest_json() const;

private:
    ToolRegistry registry_;
};

} // namespace lumiere

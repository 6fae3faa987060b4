#include "tool_dispatcher.h"
#include "core/constants.h"
#include "logger.h"

namespace lumiere {

ToolDispatcher::ToolDispatcher() {
    registry_.register_tool(std::make_shared<DisplayProductsTool>());
}

DispatchResult ToolDispatcher::dispatch(const ToolCall& call) const {
    DispatchResult result;

    auto tool = std::dynamic_pointer_cast<DisplayProductsTool>(registry_.get_tool(call.name));
    if (!tool) {
        LOG_TOOL("ignoring unknown function call '" + call.name + "' (id " + call.id + ")");
        return result;
    }

    auto products = tool->parse_products(call);
    if (products.is_error()) {
        LOG_TOOL("dropping " + call.name + " call " + call.id + ": " + products.error().to_string());
        return result;
    }

    result.recognized = true;
    result.products = std::move(products.value());
    LOG_TOOL(call.name + " call " + call.id + " with " +
             std::to_string(result.products->size()) + " product(s)");
    return result;
}

ToolResponse ToolDispatcher::acknowledge(const ToolCall& call) {
    ToolResponse response;
    response.id = call.id;
    response.name = call.name;
    response.result = constants::protocol::TOOL_ACK_RESULT;
    return response;
}

std::string ToolDispatcher::manifest_json() const {
    return registry_.get_function_declarations_json();
}

} // namespace lumiere

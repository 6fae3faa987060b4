#pragma once

#include "tool.h"
#include "core/types.h"
#include "errors.h"
#include <string>
#include <vector>

namespace lumiere {

/**
 * @brief Shows recommended products to the user as cards
 *
 * Arguments: {"products": [{brand, name, price, description, category?}]}.
 */
class DisplayProductsTool : public Tool {
public:
    std::string name() const override;

    std::string description() const override {
        return "Display a list of recommended fashion products/outfits to the user in a grid.";
    }

    std::string parameter_schema() const override;

    /**
     * @brief Validate call arguments and extract the product list
     * @param call Inbound call (args_json holds the argument object)
     * @return Products, or ToolValidationError when the list is missing, empty,
     *         or any item lacks a required string field
     */
    Result<std::vector<Product>> parse_products(const ToolCall& call) const;
};

} // namespace lumiere

#include "tools/display_products_tool.h"
#include "core/constants.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace lumiere {

namespace {

const char* const REQUIRED_FIELDS[] = {"brand", "name", "price", "description"};

json string_property(const std::string& description) {
    return json::object({{"type", "STRING"}, {"description", description}});
}

} // namespace

std::string DisplayProductsTool::name() const {
    return constants::tools::DISPLAY_PRODUCTS;
}

std::string DisplayProductsTool::parameter_schema() const {
    json item;
    item["type"] = "OBJECT";
    item["properties"]["brand"] = string_property("Brand name");
    item["properties"]["name"] = string_property("Name of the item");
    item["properties"]["price"] = string_property("Price with currency symbol");
    item["properties"]["description"] = string_property("Short visual description for try-on generation");
    item["properties"]["category"] = string_property("Category e.g. Dress, Jacket");
    item["required"] = json::array({"brand", "name", "price", "description"});

    json schema;
    schema["type"] = "OBJECT";
    schema["properties"]["products"] = json::object({{"type", "ARRAY"}, {"items", item}});
    schema["required"] = json::array({"products"});
    return schema.dump();
}

Result<std::vector<Product>> DisplayProductsTool::parse_products(const ToolCall& call) const {
    json args;
    try {
        args = json::parse(call.args_json.empty() ? "{}" : call.args_json);
    } catch (const json::exception& e) {
        return make_tool_error(std::string("arguments are not valid JSON: ") + e.what());
    }

    if (!args.is_object() || !args.contains("products") || !args["products"].is_array()) {
        return make_tool_error("'products' must be an array");
    }
    const auto& items = args["products"];
    if (items.empty()) {
        return make_tool_error("'products' is empty");
    }

    std::vector<Product> products;
    products.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
        const auto& item = items[i];
        if (!item.is_object()) {
            return make_tool_error("product " + std::to_string(i) + " is not an object");
        }
        for (const char* field : REQUIRED_FIELDS) {
            if (!item.contains(field) || !item[field].is_string()) {
                return make_tool_error("product " + std::to_string(i) + " missing string field '" + field + "'");
            }
        }

        Product product;
        product.brand = item["brand"].get<std::string>();
        product.name = item["name"].get<std::string>();
        product.price = item["price"].get<std::string>();
        product.description = item["description"].get<std::string>();

        if (item.contains("category") && !item["category"].is_null()) {
            if (!item["category"].is_string()) {
                return make_tool_error("product " + std::to_string(i) + " has non-string 'category'");
            }
            product.category = item["category"].get<std::string>();
        }
        if (item.contains("currency") && item["currency"].is_string()) {
            product.currency = item["currency"].get<std::string>();
        }
        if (item.contains("id") && item["id"].is_string() && !item["id"].get<std::string>().empty()) {
            product.id = item["id"].get<std::string>();
        } else {
            product.id = call.id + "-" + std::to_string(i);
        }

        products.push_back(std::move(product));
    }

    return products;
}

} // namespace lumiere

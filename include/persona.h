#pragma once

#include "core/config.h"
#include "core/types.h"
#include <string>

namespace lumiere {

/**
 * @brief Render the stylist system instruction
 *
 * Substitutes {name}, {city} and {country} in the persona template.
 * Unknown placeholders are left as-is.
 */
std::string render_system_instruction(const config::PersonaConfig& persona);

/**
 * @brief Build the per-session input from the client configuration
 * @param tools_json Capability manifest (see ToolDispatcher::manifest_json)
 */
SessionConfig make_session_config(const config::AppConfig& config, const std::string& tools_json);

} // namespace lumiere

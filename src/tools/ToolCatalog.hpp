#pragma once

#include "mcp/ToolRegistry.hpp"

namespace presence_mcp {

/**
 * @brief Build the registry of the five brand-presence tools
 * @throws RegistryError if the static catalogue is inconsistent
 */
ToolRegistry build_tool_registry();

} // namespace presence_mcp

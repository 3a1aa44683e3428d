#pragma once

namespace presence_mcp {

constexpr const char* kServerName = "ai-presence-mcp";
constexpr const char* kServerVersion = "1.0.0";
constexpr const char* kServerDescription = "AI brand presence auditing tools";

// Protocol revision answered when the client asks for one we do not know
constexpr const char* kDefaultProtocolVersion = "2024-11-05";

} // namespace presence_mcp

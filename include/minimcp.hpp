#pragma once

/// @file minimcp.hpp
/// @brief Main header for minimcp - includes the server runtime
///
/// Usage:
/// @code
/// #include <minimcp.hpp>
///
/// int main() {
///     minimcp::server::Server server({"demo", "0.1.0"});
///     server.register_tool("ping", "Reply with pong", minimcp::Json{{"type", "object"}},
///                          [](const minimcp::Json&) {
///                              return minimcp::ContentList{minimcp::text_content("pong")};
///                          });
///     server.run();
/// }
/// @endcode

// Core types and exceptions
#include "minimcp/content.hpp"
#include "minimcp/exceptions.hpp"
#include "minimcp/log.hpp"
#include "minimcp/settings.hpp"
#include "minimcp/types.hpp"

// Wire format
#include "minimcp/protocol/jsonrpc.hpp"

// Tools and resources
#include "minimcp/resources/manager.hpp"
#include "minimcp/resources/template.hpp"
#include "minimcp/tools/manager.hpp"

// Server
#include "minimcp/mcp/dispatcher.hpp"
#include "minimcp/server/registry.hpp"
#include "minimcp/server/server.hpp"
#include "minimcp/server/stdio_server.hpp"

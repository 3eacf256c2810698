#pragma once

/// Umbrella header for the mcpkit MCP server library.

#include "version.hpp"
#include "error.hpp"
#include "log.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "method.hpp"
#include "notification.hpp"
#include "progress.hpp"
#include "cancellation.hpp"
#include "subscription.hpp"
#include "capability.hpp"
#include "server.hpp"

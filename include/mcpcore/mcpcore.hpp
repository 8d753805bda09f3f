#pragma once

/// Umbrella header for the mcpcore protocol server library.

#include "version.hpp"
#include "error.hpp"
#include "logging.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "schema.hpp"
#include "cancellation.hpp"
#include "registry.hpp"
#include "dispatcher.hpp"
#include "framing.hpp"
#include "config.hpp"
#include "startup.hpp"
#include "server.hpp"
#include "transport/transport.hpp"
#include "transport/stdio_transport.hpp"

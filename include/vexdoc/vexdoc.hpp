#pragma once

/// Umbrella header for the vexdoc tool server library.

#include "version.hpp"
#include "error.hpp"
#include "log.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "schema.hpp"
#include "context.hpp"
#include "tool.hpp"
#include "registry.hpp"
#include "session.hpp"
#include "router.hpp"
#include "server.hpp"
#include "transport/transport.hpp"
#include "transport/stdio_transport.hpp"
#include "transport/http_transport.hpp"
#include "config.hpp"
#include "vex/document.hpp"
#include "vex/validation.hpp"
#include "vex/client.hpp"
#include "tools/vex_tools.hpp"

#pragma once

/// @file multimcp.hpp
/// @brief Main header for multimcp - includes the orchestrator and its parts
///
/// Usage:
/// @code
/// #include <multimcp.hpp>
///
/// int main() {
///     multimcp::ServerManager manager(multimcp::ConfigStore::load_default(),
///                                     multimcp::Settings::from_env());
///     auto result = manager.query("echo", "process_message", {}, "hello");
///     manager.close(true);
/// }
/// @endcode

// Core types and exceptions
#include "multimcp/exceptions.hpp"
#include "multimcp/settings.hpp"
#include "multimcp/types.hpp"

// Configuration and transport choice
#include "multimcp/classifier.hpp"
#include "multimcp/config.hpp"
#include "multimcp/transport_selector.hpp"

// Processes
#include "multimcp/process_launcher.hpp"
#include "multimcp/registry.hpp"

// Protocol client
#include "multimcp/client/client.hpp"
#include "multimcp/client/transports.hpp"
#include "multimcp/client/types.hpp"

// Orchestration
#include "multimcp/argument_adapter.hpp"
#include "multimcp/logging.hpp"
#include "multimcp/server_manager.hpp"

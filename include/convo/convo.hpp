#pragma once

// Core types
#include "core/config.hpp"
#include "core/context.hpp"
#include "core/conversation.hpp"
#include "core/error.hpp"
#include "core/message.hpp"
#include "core/types.hpp"
#include "core/uuid.hpp"

// Providers
#include "llm/adapter.hpp"
#include "llm/stream_assembler.hpp"
#include "llm/transport.hpp"

// Tool system
#include "tool/builtin/builtins.hpp"
#include "tool/tool.hpp"

// Sessions and the turn loop
#include "agent/engine.hpp"
#include "session/export.hpp"
#include "session/response_cache.hpp"
#include "session/session_store.hpp"

namespace convo {

// Get version string
std::string version();

}  // namespace convo

/**
 * @file chatrelay.hpp
 * @brief Main header for chatrelay
 *
 * Chat-completion relay backed by a rotating pool of upstream accounts.
 * Provides the account pool, token lifecycle, two-phase upstream
 * orchestration, stream translation and the HTTP surface.
 */

#ifndef CHATRELAY_HPP
#define CHATRELAY_HPP

#include "chatrelay/types.hpp"
#include "chatrelay/errors.hpp"
#include "chatrelay/logger.hpp"
#include "chatrelay/config.hpp"
#include "chatrelay/http_client.hpp"
#include "chatrelay/credential_store.hpp"
#include "chatrelay/account_pool.hpp"
#include "chatrelay/token_manager.hpp"
#include "chatrelay/sse.hpp"
#include "chatrelay/stream_translator.hpp"
#include "chatrelay/session.hpp"
#include "chatrelay/orchestrator.hpp"
#include "chatrelay/relay.hpp"
#include "chatrelay/server.hpp"

namespace chatrelay {

/// Relay version
constexpr const char* VERSION = "0.1.0";

} // namespace chatrelay

#endif // CHATRELAY_HPP

/**
 * @file session.cpp
 * @brief Per-request conversation state implementation for chatrelay
 */

#include "chatrelay/session.hpp"
#include "chatrelay/errors.hpp"
#include "chatrelay/logger.hpp"

namespace chatrelay {

// =============================================================================
// Lease
// =============================================================================

Lease::Lease(AccountPool& pool, Account& account)
    : pool_(pool), account_(account) {}

Lease::~Lease() {
    release();
}

bool Lease::release(const std::optional<std::string>& error) {
    if (released_.exchange(true)) {
        return false;
    }

    if (error.has_value()) {
        CHATRELAY_LOG_WARN("[{}] Request failed: {}", account_.identity, truncate(*error));
    }
    pool_.release(account_, error);
    return true;
}

// =============================================================================
// ConversationSession
// =============================================================================

ConversationSession::ConversationSession(
    std::unique_ptr<Lease> lease,
    const std::string& model,
    const std::string& upstream_model,
    const std::string& conversation_id,
    std::unique_ptr<ByteStream> upstream
) : lease_(std::move(lease)),
    model_(model),
    upstream_model_(upstream_model),
    conversation_id_(conversation_id),
    upstream_(std::move(upstream)),
    translator_(generate_response_id(), model) {}

StreamEnd ConversationSession::stream_to(const ChunkWriter& write) {
    return translator_.stream(*upstream_, write, *lease_);
}

json ConversationSession::collect() {
    std::string content;
    try {
        content = translator_.collect(*upstream_);
    } catch (const ConnectionError& e) {
        lease_->release(std::string(e.what()));
        throw;
    }

    lease_->release();
    CHATRELAY_LOG_INFO("[{}] Response {} collected ({} chars)",
                       lease_->account().identity, response_id(), content.size());
    return translator_.completion(content);
}

} // namespace chatrelay

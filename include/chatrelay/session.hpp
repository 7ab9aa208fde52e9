/**
 * @file session.hpp
 * @brief Per-request conversation state for chatrelay
 */

#ifndef CHATRELAY_SESSION_HPP
#define CHATRELAY_SESSION_HPP

#include "types.hpp"
#include "account_pool.hpp"
#include "http_client.hpp"
#include "stream_translator.hpp"
#include <atomic>
#include <memory>

namespace chatrelay {

/**
 * Exclusive use of one pool account
 *
 * The account goes back to the pool exactly once: the first release()
 * wins, later calls are ignored, and a lease destroyed while still held
 * is released as a clean use.
 */
class Lease {
public:
    Lease(AccountPool& pool, Account& account);
    ~Lease();

    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    /**
     * Return the account to the pool
     * @param error Diagnostic for a failed use; std::nullopt for a clean use
     * @return true if this call released the account
     */
    bool release(const std::optional<std::string>& error = std::nullopt);

    bool released() const { return released_.load(); }
    Account& account() const { return account_; }

private:
    AccountPool& pool_;
    Account& account_;
    std::atomic<bool> released_{false};
};

/**
 * One upstream conversation whose phase-2 stream is open
 */
class ConversationSession {
public:
    /**
     * Create a session
     * @param lease Lease of the serving account
     * @param model Model identifier the client sent
     * @param upstream_model Normalized model identifier sent upstream
     * @param conversation_id Upstream conversation id from phase 1
     * @param upstream Open phase-2 stream
     */
    ConversationSession(
        std::unique_ptr<Lease> lease,
        const std::string& model,
        const std::string& upstream_model,
        const std::string& conversation_id,
        std::unique_ptr<ByteStream> upstream
    );

    ConversationSession(const ConversationSession&) = delete;
    ConversationSession& operator=(const ConversationSession&) = delete;

    // Getters
    const std::string& model() const { return model_; }
    const std::string& upstream_model() const { return upstream_model_; }
    const std::string& conversation_id() const { return conversation_id_; }
    const std::string& response_id() const { return translator_.response_id(); }
    Lease& lease() { return *lease_; }

    /**
     * Forward the response as completion chunks
     * @param write Downstream writer
     * @return How the stream ended
     */
    StreamEnd stream_to(const ChunkWriter& write);

    /**
     * Wait for the whole response
     * @return Completion object
     * @throws ConnectionError if the upstream transfer fails
     */
    json collect();

private:
    std::unique_ptr<Lease> lease_;
    std::string model_;
    std::string upstream_model_;
    std::string conversation_id_;
    std::unique_ptr<ByteStream> upstream_;
    StreamTranslator translator_;
};

} // namespace chatrelay

#endif // CHATRELAY_SESSION_HPP

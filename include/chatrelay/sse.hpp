/**
 * @file sse.hpp
 * @brief Upstream event-stream decoding for chatrelay
 */

#ifndef CHATRELAY_SSE_HPP
#define CHATRELAY_SSE_HPP

#include "types.hpp"
#include <string>
#include <vector>

namespace chatrelay {

/**
 * One classified upstream `data:` payload
 */
struct UpstreamEvent {
    enum class Kind {
        Delta,          ///< text delta of the assistant message
        InvalidModel,   ///< upstream rejected the model
        Error,          ///< payload with a truthy `error` field
        Done,           ///< `[DONE]` terminal marker
        Unrecognized    ///< valid JSON of any other shape
    };

    Kind kind = Kind::Unrecognized;
    std::string text;
};

/**
 * Classify one parsed `data:` payload
 * @param payload Parsed JSON payload
 * @return Classified event; `text` holds the delta or error text
 */
UpstreamEvent classify_payload(const json& payload);

/**
 * Incremental decoder for blank-line delimited event blocks
 *
 * Bytes may arrive in arbitrarily sized pieces; a block is decoded only
 * once its terminating blank line has been seen. Malformed JSON payloads
 * are skipped.
 */
class SseDecoder {
public:
    /**
     * Append bytes and decode every completed block
     * @param bytes Next piece of the stream
     * @return Events of the completed blocks, in order
     */
    std::vector<UpstreamEvent> feed(const std::string& bytes);

    /**
     * Decode whatever remains buffered as a final block
     */
    std::vector<UpstreamEvent> finish();

    /// Bytes held back waiting for a block terminator.
    const std::string& pending() const { return buffer_; }

private:
    static void decode_block(const std::string& block, std::vector<UpstreamEvent>& events);

    std::string buffer_;
};

} // namespace chatrelay

#endif // CHATRELAY_SSE_HPP

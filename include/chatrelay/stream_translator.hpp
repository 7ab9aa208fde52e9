/**
 * @file stream_translator.hpp
 * @brief Upstream event stream to chat-completion protocol translation
 */

#ifndef CHATRELAY_STREAM_TRANSLATOR_HPP
#define CHATRELAY_STREAM_TRANSLATOR_HPP

#include "types.hpp"
#include "http_client.hpp"

namespace chatrelay {

class Lease;

/**
 * How a streamed response ended
 */
enum class StreamEnd {
    Completed,          ///< upstream sent its terminal marker
    UpstreamClosed,     ///< upstream closed without a terminal marker
    UpstreamDropped,    ///< upstream transfer failed mid-stream
    ClientDisconnected  ///< downstream write failed
};

std::string stream_end_to_string(StreamEnd end);

/**
 * Translator for one response
 */
class StreamTranslator {
public:
    static constexpr const char* DONE_MARKER = "data: [DONE]\n\n";

    /**
     * Create a translator
     * @param response_id Served response id (`chatcmpl-...`)
     * @param model Model identifier echoed to the client
     */
    StreamTranslator(std::string response_id, std::string model);

    /**
     * Forward upstream text deltas as completion chunks
     *
     * Writes a role chunk, one content chunk per text delta, then a finish
     * chunk and the terminal marker. The finish chunk and marker are also
     * written when the upstream ends without its own marker. The lease is
     * released without an error however the stream ends.
     *
     * @param upstream Phase-2 stream
     * @param write Downstream writer
     * @param lease Lease of the account serving the stream
     * @return How the stream ended
     */
    StreamEnd stream(ByteStream& upstream, const ChunkWriter& write, Lease& lease);

    /**
     * Concatenate every upstream text delta in arrival order
     * @param upstream Phase-2 stream
     * @return Full assistant message
     * @throws ConnectionError if the upstream transfer fails
     */
    std::string collect(ByteStream& upstream);

    std::string role_chunk() const;
    std::string content_chunk(const std::string& text) const;
    std::string finish_chunk() const;

    /**
     * Build the buffered completion object
     * @param content Assistant message
     */
    json completion(const std::string& content) const;

    const std::string& response_id() const { return response_id_; }
    const std::string& model() const { return model_; }

private:
    StreamEnd pump(ByteStream& upstream, const ChunkWriter& write);
    std::string frame(const json& delta, const json& finish_reason) const;

    std::string response_id_;
    std::string model_;
};

} // namespace chatrelay

#endif // CHATRELAY_STREAM_TRANSLATOR_HPP

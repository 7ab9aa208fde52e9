/**
 * @file stream_translator.cpp
 * @brief Stream translation implementation for chatrelay
 */

#include "chatrelay/stream_translator.hpp"
#include "chatrelay/errors.hpp"
#include "chatrelay/logger.hpp"
#include "chatrelay/session.hpp"
#include "chatrelay/sse.hpp"

namespace chatrelay {

std::string stream_end_to_string(StreamEnd end) {
    switch (end) {
        case StreamEnd::Completed: return "completed";
        case StreamEnd::UpstreamClosed: return "upstream_closed";
        case StreamEnd::UpstreamDropped: return "upstream_dropped";
        case StreamEnd::ClientDisconnected: return "client_disconnected";
    }
    return "unknown";
}

StreamTranslator::StreamTranslator(std::string response_id, std::string model)
    : response_id_(std::move(response_id)),
      model_(std::move(model)) {}

std::string StreamTranslator::frame(const json& delta, const json& finish_reason) const {
    json chunk = {
        {"id", response_id_},
        {"object", "chat.completion.chunk"},
        {"created", current_time_seconds()},
        {"model", model_},
        {"choices", json::array({
            {
                {"index", 0},
                {"delta", delta},
                {"finish_reason", finish_reason}
            }
        })}
    };
    return "data: " + chunk.dump(-1, ' ', false, json::error_handler_t::replace) + "\n\n";
}

std::string StreamTranslator::role_chunk() const {
    return frame({{"role", "assistant"}}, nullptr);
}

std::string StreamTranslator::content_chunk(const std::string& text) const {
    return frame({{"content", text}}, nullptr);
}

std::string StreamTranslator::finish_chunk() const {
    return frame(json::object(), "stop");
}

json StreamTranslator::completion(const std::string& content) const {
    return {
        {"id", response_id_},
        {"object", "chat.completion"},
        {"created", current_time_seconds()},
        {"model", model_},
        {"choices", json::array({
            {
                {"index", 0},
                {"message", {{"role", "assistant"}, {"content", content}}},
                {"finish_reason", "stop"}
            }
        })},
        {"usage", {
            {"prompt_tokens", 0},
            {"completion_tokens", 0},
            {"total_tokens", 0}
        }}
    };
}

StreamEnd StreamTranslator::stream(ByteStream& upstream, const ChunkWriter& write, Lease& lease) {
    StreamEnd end = pump(upstream, write);
    lease.release();

    CHATRELAY_LOG_INFO("[{}] Stream {} ended: {}",
                       lease.account().identity, response_id_, stream_end_to_string(end));
    return end;
}

StreamEnd StreamTranslator::pump(ByteStream& upstream, const ChunkWriter& write) {
    if (!write(role_chunk())) {
        return StreamEnd::ClientDisconnected;
    }

    SseDecoder decoder;
    std::string bytes;
    bool dropped = false;

    while (true) {
        try {
            if (!upstream.next(bytes)) {
                break;
            }
        } catch (const ConnectionError& e) {
            CHATRELAY_LOG_WARN("Upstream stream {} dropped: {}", response_id_, e.what());
            dropped = true;
            break;
        }

        for (const auto& event : decoder.feed(bytes)) {
            if (event.kind == UpstreamEvent::Kind::Done) {
                if (!write(finish_chunk()) || !write(DONE_MARKER)) {
                    return StreamEnd::ClientDisconnected;
                }
                return StreamEnd::Completed;
            }

            if (event.kind == UpstreamEvent::Kind::Delta && !event.text.empty()) {
                if (!write(content_chunk(event.text))) {
                    return StreamEnd::ClientDisconnected;
                }
            }
        }
    }

    for (const auto& event : decoder.finish()) {
        if (event.kind == UpstreamEvent::Kind::Delta && !event.text.empty() &&
            !write(content_chunk(event.text))) {
            return StreamEnd::ClientDisconnected;
        }
    }

    // The client must still see a completion signal
    if (!write(finish_chunk()) || !write(DONE_MARKER)) {
        return StreamEnd::ClientDisconnected;
    }
    return dropped ? StreamEnd::UpstreamDropped : StreamEnd::UpstreamClosed;
}

std::string StreamTranslator::collect(ByteStream& upstream) {
    SseDecoder decoder;
    std::string content;
    std::string bytes;

    // Returns true once the terminal marker was seen
    auto append = [&content](const std::vector<UpstreamEvent>& events) {
        for (const auto& event : events) {
            if (event.kind == UpstreamEvent::Kind::Done) {
                return true;
            }
            if (event.kind == UpstreamEvent::Kind::Delta) {
                content += event.text;
            }
        }
        return false;
    };

    while (upstream.next(bytes)) {
        if (append(decoder.feed(bytes))) {
            return content;
        }
    }
    append(decoder.finish());

    return content;
}

} // namespace chatrelay

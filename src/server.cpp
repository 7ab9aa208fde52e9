/**
 * @file server.cpp
 * @brief Chat-completion HTTP surface implementation for chatrelay
 */

#include "chatrelay/server.hpp"
#include "chatrelay/errors.hpp"
#include "chatrelay/logger.hpp"

namespace chatrelay {

static void write_json(httplib::Response& res, int status, const json& body) {
    res.status = status;
    res.set_content(body.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
}

static void write_error(httplib::Response& res, const ChatRelayError& e) {
    write_json(res, e.http_status(), e.to_json());
}

json models_to_json(const std::vector<std::string>& models) {
    json data = json::array();
    int64_t created = current_time_seconds();
    for (const auto& id : models) {
        data.push_back({
            {"id", id},
            {"object", "model"},
            {"created", created},
            {"owned_by", SERVED_NAMESPACE}
        });
    }
    return {{"object", "list"}, {"data", data}};
}

Server::Server(Relay& relay, const ServerOptions& options)
    : relay_(relay), options_(options) {
    std::size_t workers = options_.worker_threads;
    server_.new_task_queue = [workers] {
        return new httplib::ThreadPool(workers);
    };

    server_.set_pre_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        return authorize(req, res)
            ? httplib::Server::HandlerResponse::Unhandled
            : httplib::Server::HandlerResponse::Handled;
    });

    register_routes();
}

void Server::register_routes() {
    server_.Post("/v1/chat/completions", [this](const httplib::Request& req, httplib::Response& res) {
        handle_chat_completions(req, res);
    });
    server_.Get("/v1/models", [this](const httplib::Request& req, httplib::Response& res) {
        handle_models(req, res);
    });
    server_.Get("/status", [this](const httplib::Request& req, httplib::Response& res) {
        handle_status(req, res);
    });
}

void Server::listen() {
    CHATRELAY_LOG_INFO("Listening on {}:{}", options_.host, options_.port);
    if (!server_.listen(options_.host, options_.port)) {
        throw ConfigurationError(
            "Failed to listen on " + options_.host + ":" + std::to_string(options_.port), "port");
    }
}

void Server::stop() {
    server_.stop();
}

bool Server::authorize(const httplib::Request& req, httplib::Response& res) const {
    if (options_.api_key.empty() || req.path == "/status") {
        return true;
    }

    if (req.get_header_value("Authorization") == "Bearer " + options_.api_key) {
        return true;
    }

    write_error(res, AuthenticationError("Invalid API key"));
    return false;
}

void Server::handle_chat_completions(const httplib::Request& req, httplib::Response& res) {
    json body = json::parse(req.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        write_error(res, ValidationError("Invalid JSON body"));
        return;
    }

    CompletionRequest request = CompletionRequest::from_json(body);

    try {
        if (!request.stream) {
            write_json(res, 200, relay_.complete(request));
            return;
        }

        std::shared_ptr<ConversationSession> session = relay_.open(request);

        res.status = 200;
        res.set_header("Cache-Control", "no-cache");
        res.set_chunked_content_provider(
            "text/event-stream",
            [session](size_t, httplib::DataSink& sink) {
                ChunkWriter write = [&sink](const std::string& chunk) {
                    if (sink.is_writable && !sink.is_writable()) return false;
                    return sink.write(chunk.data(), chunk.size());
                };

                if (session->stream_to(write) == StreamEnd::ClientDisconnected) {
                    return false;
                }
                sink.done();
                return true;
            });
    } catch (const ChatRelayError& e) {
        CHATRELAY_LOG_WARN("Chat completion failed: {}", e.what());
        write_error(res, e);
    } catch (const std::exception& e) {
        CHATRELAY_LOG_ERROR("Chat completion failed: {}", e.what());
        write_error(res, ChatRelayError(e.what(), "INTERNAL_ERROR", 502));
    }
}

void Server::handle_models(const httplib::Request&, httplib::Response& res) {
    try {
        write_json(res, 200, models_to_json(relay_.list_models()));
    } catch (const ChatRelayError& e) {
        CHATRELAY_LOG_WARN("Model listing failed: {}", e.what());
        write_error(res, e);
    } catch (const std::exception& e) {
        CHATRELAY_LOG_ERROR("Model listing failed: {}", e.what());
        write_error(res, ChatRelayError(e.what(), "INTERNAL_ERROR", 502));
    }
}

void Server::handle_status(const httplib::Request&, httplib::Response& res) {
    write_json(res, 200, relay_.status().to_json());
}

} // namespace chatrelay

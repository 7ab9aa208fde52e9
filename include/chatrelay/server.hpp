/**
 * @file server.hpp
 * @brief Chat-completion HTTP surface for chatrelay
 */

#ifndef CHATRELAY_SERVER_HPP
#define CHATRELAY_SERVER_HPP

#include "types.hpp"
#include "config.hpp"
#include "relay.hpp"

#include <httplib.h>

namespace chatrelay {

/**
 * Render the model listing response
 * @param models Namespaced model ids
 * @return {"object": "list", "data": [...]}
 */
json models_to_json(const std::vector<std::string>& models);

/**
 * HTTP server exposing `/v1/chat/completions`, `/v1/models` and `/status`
 */
class Server {
public:
    /**
     * Create a server and register its routes
     * @param relay Started relay
     * @param options Server options
     */
    Server(Relay& relay, const ServerOptions& options);

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /**
     * Serve until stop() is called
     * @throws ConfigurationError if the address cannot be bound
     */
    void listen();

    void stop();

    /**
     * Check the bearer gate
     * @return false if the request was rejected and @p res holds the 401
     */
    bool authorize(const httplib::Request& req, httplib::Response& res) const;

    void handle_chat_completions(const httplib::Request& req, httplib::Response& res);
    void handle_models(const httplib::Request& req, httplib::Response& res);
    void handle_status(const httplib::Request& req, httplib::Response& res);

    httplib::Server& http() { return server_; }

private:
    void register_routes();

    Relay& relay_;
    ServerOptions options_;
    httplib::Server server_;
};

} // namespace chatrelay

#endif // CHATRELAY_SERVER_HPP

#include "chatrelay/errors.hpp"
#include "chatrelay/server.hpp"
#include "fake_http_client.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace chatrelay;
using chatrelay::test::FakeByteStream;
using chatrelay::test::FakeHttpClient;
using chatrelay::test::TempAccountsFile;

class ServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        file_ = std::make_unique<TempAccountsFile>(test::accounts_document(2));
        http_ = std::make_shared<FakeHttpClient>();

        http_->on_post = [this](const HttpRequest& request) {
            if (test::ends_with(request.url, UPSTREAM_REFRESH_PATH)) {
                return test::refresh_response("access-token");
            }
            return chat_response_;
        };
        http_->on_stream = [](const HttpRequest&) -> std::unique_ptr<ByteStream> {
            return std::make_unique<FakeByteStream>(200, std::vector<std::string>{
                test::delta_event("Hel"), test::delta_event("lo"), "data: [DONE]\n\n"
            });
        };
        http_->on_get = [](const HttpRequest&) {
            return test::make_response(200, "{\"anthropic\":[\"claude-opus-4-6\"],\"openai\":[\"gpt-4o\"]}");
        };

        RelayOptions options;
        options.accounts_path = file_->path();
        options.tokens.base_url = "http://upstream.test";
        options.upstream.base_url = "http://upstream.test";
        options.upstream.sleep = [](std::chrono::milliseconds) {};
        relay_ = std::make_unique<Relay>(options, http_);
        relay_->start();
    }

    void make_server(const std::string& api_key = "") {
        ServerOptions options;
        options.api_key = api_key;
        options.worker_threads = 2;
        server_ = std::make_unique<Server>(*relay_, options);
    }

    static httplib::Request chat_request(const std::string& body) {
        httplib::Request req;
        req.method = "POST";
        req.path = "/v1/chat/completions";
        req.body = body;
        return req;
    }

    std::unique_ptr<TempAccountsFile> file_;
    std::shared_ptr<FakeHttpClient> http_;
    std::unique_ptr<Relay> relay_;
    std::unique_ptr<Server> server_;
    HttpResponse chat_response_ = test::make_response(200, "{\"conversationId\":\"conv-server\"}");
};

TEST_F(ServerTest, OpenGateWithoutKey) {
    make_server();
    httplib::Request req = chat_request("{}");
    httplib::Response res;

    EXPECT_TRUE(server_->authorize(req, res));
}

TEST_F(ServerTest, RejectsWrongBearerToken) {
    make_server("secret");
    httplib::Request req = chat_request("{}");
    req.set_header("Authorization", "Bearer wrong");
    httplib::Response res;

    EXPECT_FALSE(server_->authorize(req, res));
    EXPECT_EQ(res.status, 401);

    json body = json::parse(res.body);
    EXPECT_EQ(body["error"]["message"], "Invalid API key");
    EXPECT_EQ(body["error"]["type"], "invalid_request_error");
}

TEST_F(ServerTest, RejectsMissingBearerToken) {
    make_server("secret");
    httplib::Request req;
    req.path = "/v1/models";
    httplib::Response res;

    EXPECT_FALSE(server_->authorize(req, res));
    EXPECT_EQ(res.status, 401);
}

TEST_F(ServerTest, AcceptsMatchingBearerToken) {
    make_server("secret");
    httplib::Request req = chat_request("{}");
    req.set_header("Authorization", "Bearer secret");
    httplib::Response res;

    EXPECT_TRUE(server_->authorize(req, res));
}

TEST_F(ServerTest, StatusBypassesGate) {
    make_server("secret");
    httplib::Request req;
    req.path = "/status";
    httplib::Response res;

    EXPECT_TRUE(server_->authorize(req, res));
}

TEST_F(ServerTest, InvalidJsonBody) {
    make_server();
    httplib::Response res;

    server_->handle_chat_completions(chat_request("{not json"), res);

    EXPECT_EQ(res.status, 400);
    EXPECT_EQ(json::parse(res.body)["error"]["message"], "Invalid JSON body");
    EXPECT_EQ(http_->post_calls.load(), 0);
}

TEST_F(ServerTest, EmptyTranscriptRejected) {
    make_server();
    httplib::Response res;

    server_->handle_chat_completions(chat_request("{\"messages\": []}"), res);

    EXPECT_EQ(res.status, 400);
    EXPECT_EQ(json::parse(res.body)["error"]["message"], "No messages");
}

TEST_F(ServerTest, BufferedCompletion) {
    make_server();
    httplib::Response res;

    server_->handle_chat_completions(chat_request(
        "{\"model\": \"claude-opus-4-6\", \"messages\": [{\"role\": \"user\", \"content\": \"Hi\"}]}"), res);

    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(res.get_header_value("Content-Type"), "application/json");

    json body = json::parse(res.body);
    EXPECT_EQ(body["object"], "chat.completion");
    EXPECT_EQ(body["model"], "claude-opus-4-6");
    EXPECT_EQ(body["choices"][0]["message"]["content"], "Hello");

    for (const auto& account : relay_->status().accounts) {
        EXPECT_FALSE(account.leased);
    }
}

TEST_F(ServerTest, StreamingCompletion) {
    make_server();
    httplib::Response res;

    server_->handle_chat_completions(chat_request(
        "{\"stream\": true, \"messages\": [{\"role\": \"user\", \"content\": \"Hi\"}]}"), res);

    ASSERT_EQ(res.status, 200);
    EXPECT_EQ(res.get_header_value("Content-Type"), "text/event-stream");
    EXPECT_EQ(res.get_header_value("Cache-Control"), "no-cache");
    ASSERT_TRUE(static_cast<bool>(res.content_provider_));

    std::string received;
    bool done = false;
    httplib::DataSink sink;
    sink.write = [&](const char* data, size_t length) {
        received.append(data, length);
        return true;
    };
    sink.is_writable = [] { return true; };
    sink.done = [&] { done = true; };

    EXPECT_TRUE(res.content_provider_(0, 0, sink));
    EXPECT_TRUE(done);

    EXPECT_NE(received.find("\"role\":\"assistant\""), std::string::npos);
    EXPECT_NE(received.find("\"content\":\"Hel\""), std::string::npos);
    EXPECT_NE(received.find("\"content\":\"lo\""), std::string::npos);
    EXPECT_NE(received.find("\"finish_reason\":\"stop\""), std::string::npos);
    EXPECT_EQ(received.substr(received.size() - 14), "data: [DONE]\n\n");

    for (const auto& account : relay_->status().accounts) {
        EXPECT_FALSE(account.leased);
    }
}

TEST_F(ServerTest, StreamingClientGoneAbortsProvider) {
    make_server();
    httplib::Response res;

    server_->handle_chat_completions(chat_request(
        "{\"stream\": true, \"messages\": [{\"role\": \"user\", \"content\": \"Hi\"}]}"), res);
    ASSERT_TRUE(static_cast<bool>(res.content_provider_));

    httplib::DataSink sink;
    sink.write = [](const char*, size_t) { return true; };
    sink.is_writable = [] { return false; };
    sink.done = [] {};

    EXPECT_FALSE(res.content_provider_(0, 0, sink));

    for (const auto& account : relay_->status().accounts) {
        EXPECT_FALSE(account.leased);
        EXPECT_EQ(account.errors, 0);
    }
}

TEST_F(ServerTest, RateLimitMapsTo429) {
    make_server();
    chat_response_ = test::make_response(429, "busy");
    httplib::Response res;

    server_->handle_chat_completions(chat_request(
        "{\"messages\": [{\"role\": \"user\", \"content\": \"Hi\"}]}"), res);

    EXPECT_EQ(res.status, 429);
    json body = json::parse(res.body);
    EXPECT_EQ(body["error"]["type"], "rate_limit");
    EXPECT_EQ(body["error"]["message"], "Server busy, please retry later");
}

TEST_F(ServerTest, InvalidModelMapsTo400) {
    make_server();
    chat_response_ = test::make_response(200,
        "data: {\"text\":\"Invalid model spec\",\"error\":true}\n\n", "text/event-stream");
    httplib::Response res;

    server_->handle_chat_completions(chat_request(
        "{\"model\": \"gpt-4o\", \"messages\": [{\"role\": \"user\", \"content\": \"Hi\"}]}"), res);

    EXPECT_EQ(res.status, 400);
    EXPECT_EQ(json::parse(res.body)["error"]["code"], "INVALID_MODEL");
}

TEST_F(ServerTest, UpstreamFailureMapsTo502) {
    make_server();
    chat_response_ = test::make_response(500, "internal");
    httplib::Response res;

    server_->handle_chat_completions(chat_request(
        "{\"messages\": [{\"role\": \"user\", \"content\": \"Hi\"}]}"), res);

    EXPECT_EQ(res.status, 502);
}

TEST_F(ServerTest, UnclassifiedFailureGetsStructuredBody) {
    make_server();
    http_->on_post = [](const HttpRequest&) -> HttpResponse {
        throw std::runtime_error("transport exploded");
    };
    httplib::Response res;

    server_->handle_chat_completions(chat_request(
        "{\"messages\": [{\"role\": \"user\", \"content\": \"Hi\"}]}"), res);

    EXPECT_EQ(res.status, 502);
    json body = json::parse(res.body);
    EXPECT_EQ(body["error"]["message"], "transport exploded");
    EXPECT_EQ(body["error"]["type"], "api_error");
    EXPECT_EQ(body["error"]["code"], "INTERNAL_ERROR");

    for (const auto& account : relay_->status().accounts) {
        EXPECT_FALSE(account.leased);
    }
}

TEST_F(ServerTest, UnclassifiedModelListingFailureGetsStructuredBody) {
    make_server();
    http_->on_get = [](const HttpRequest&) -> HttpResponse {
        throw std::runtime_error("listing exploded");
    };
    httplib::Response res;

    server_->handle_models(httplib::Request(), res);

    EXPECT_EQ(res.status, 502);
    EXPECT_EQ(json::parse(res.body)["error"]["message"], "listing exploded");
    EXPECT_EQ(relay_->status().accounts[0].errors, 1);
}

TEST_F(ServerTest, ModelListing) {
    make_server();
    httplib::Request req;
    httplib::Response res;

    server_->handle_models(req, res);

    EXPECT_EQ(res.status, 200);
    json body = json::parse(res.body);
    EXPECT_EQ(body["object"], "list");
    ASSERT_EQ(body["data"].size(), 1u);
    EXPECT_EQ(body["data"][0]["id"], "anthropic/claude-opus-4-6");
    EXPECT_EQ(body["data"][0]["object"], "model");
    EXPECT_EQ(body["data"][0]["owned_by"], "anthropic");
}

TEST_F(ServerTest, StatusReportsPool) {
    make_server();
    httplib::Request req;
    httplib::Response res;

    server_->handle_status(req, res);

    EXPECT_EQ(res.status, 200);
    json body = json::parse(res.body);
    EXPECT_EQ(body["total"], 2);
    EXPECT_EQ(body["available"], 2);
    EXPECT_EQ(body["accounts"][1]["identity"], "user1@example.com");
}

TEST(ModelsToJsonTest, EmptyList) {
    json body = models_to_json({});

    EXPECT_EQ(body["object"], "list");
    EXPECT_TRUE(body["data"].is_array());
    EXPECT_TRUE(body["data"].empty());
}

TEST(RelayStartTest, NoUsableAccountsIsFatal) {
    TempAccountsFile file(json::array({{{"email", "nobody@example.com"}}}));
    RelayOptions options;
    options.accounts_path = file.path();
    Relay relay(options, std::make_shared<FakeHttpClient>());

    EXPECT_THROW(relay.start(), ConfigurationError);
    EXPECT_FALSE(relay.started());
}

TEST(RelayStartTest, MissingCredentialsFileIsFatal) {
    RelayOptions options;
    options.accounts_path = "/nonexistent/chatrelay/accounts.json";
    Relay relay(options, std::make_shared<FakeHttpClient>());

    EXPECT_THROW(relay.start(), CredentialsNotFoundError);
}

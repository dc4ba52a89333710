#include <gtest/gtest.h>
#include <streamview/core/uv_scheduler.hpp>
#include <streamview/net/http_client.hpp>

#include <optional>

#include <arpa/inet.h>

namespace streamview::net::test {

using namespace std::chrono_literals;

namespace {

// Single-shot HTTP responder on 127.0.0.1. Every connection gets the canned
// response once its request head arrives (or on the first read when
// respond_on_first_read is set), then the connection is closed.
class LoopbackServer {
public:
    LoopbackServer(uv_loop_t* loop, std::string response)
        : loop_(loop), response_(std::move(response)) {
        uv_tcp_init(loop_, &server_);
        server_.data = this;

        sockaddr_in address{};
        uv_ip4_addr("127.0.0.1", 0, &address);
        uv_tcp_bind(&server_, reinterpret_cast<const sockaddr*>(&address), 0);
        uv_listen(reinterpret_cast<uv_stream_t*>(&server_), 8, &LoopbackServer::onConnection);

        sockaddr_storage bound{};
        int length = sizeof(bound);
        uv_tcp_getsockname(&server_, reinterpret_cast<sockaddr*>(&bound), &length);
        port_ = ntohs(reinterpret_cast<sockaddr_in*>(&bound)->sin_port);
    }

    void close() {
        uv_close(reinterpret_cast<uv_handle_t*>(&server_), nullptr);
    }

    std::string url(const std::string& path, const std::string& scheme = "http") const {
        return scheme + "://127.0.0.1:" + std::to_string(port_) + path;
    }

    int connections = 0;
    std::string last_request;
    bool respond_on_first_read = false;

private:
    struct Connection {
        uv_tcp_t handle;
        uv_write_t write;
        LoopbackServer* server;
        std::string received;
        bool answered = false;
    };

    static void onConnection(uv_stream_t* stream, int status) {
        auto* self = static_cast<LoopbackServer*>(stream->data);
        if (status < 0) return;

        auto* connection = new Connection{};
        connection->server = self;
        uv_tcp_init(self->loop_, &connection->handle);
        connection->handle.data = connection;
        if (uv_accept(stream, reinterpret_cast<uv_stream_t*>(&connection->handle)) != 0) {
            closeConnection(connection);
            return;
        }
        ++self->connections;
        uv_read_start(reinterpret_cast<uv_stream_t*>(&connection->handle), &LoopbackServer::onAlloc,
            &LoopbackServer::onRead);
    }

    static void onAlloc(uv_handle_t*, size_t suggested, uv_buf_t* buf) {
        buf->base = new char[suggested];
        buf->len = suggested;
    }

    static void onRead(uv_stream_t* stream, ssize_t nread, const uv_buf_t* buf) {
        auto* connection = static_cast<Connection*>(stream->data);
        if (nread > 0) {
            connection->received.append(buf->base, static_cast<size_t>(nread));
        }
        delete[] buf->base;

        if (nread < 0) {
            closeConnection(connection);
            return;
        }
        if (connection->answered) return;

        LoopbackServer* self = connection->server;
        bool complete = connection->received.find("\r\n\r\n") != std::string::npos;
        if (!complete && !self->respond_on_first_read) return;

        connection->answered = true;
        self->last_request = connection->received;
        uv_buf_t out = uv_buf_init(const_cast<char*>(self->response_.data()),
            static_cast<unsigned int>(self->response_.size()));
        uv_write(&connection->write, stream, &out, 1, [](uv_write_t* request, int) {
            closeConnection(static_cast<Connection*>(request->handle->data));
        });
    }

    static void closeConnection(Connection* connection) {
        auto* handle = reinterpret_cast<uv_handle_t*>(&connection->handle);
        if (uv_is_closing(handle)) return;
        uv_close(handle, [](uv_handle_t* closed) {
            delete static_cast<Connection*>(closed->data);
        });
    }

    uv_loop_t* loop_;
    uv_tcp_t server_;
    std::string response_;
    uint16_t port_ = 0;
};

} // namespace

class HttpClientTest : public ::testing::Test {
protected:
    void TearDown() override {
        client.reset();
        if (server) {
            server->close();
        }
        scheduler.run();
        server.reset();
    }

    void serve(std::string response) {
        server = std::make_unique<LoopbackServer>(scheduler.loop(), std::move(response));
        client = HttpClient::create(scheduler.loop());
    }

    // Issues one GET and runs the loop until it completes or 5 seconds pass
    std::optional<core::Result<HttpResponse>> fetch(const std::string& url) {
        std::optional<core::Result<HttpResponse>> received;
        client->get(url, [&](core::Result<HttpResponse> result) {
            received.emplace(std::move(result));
            scheduler.stop();
        });

        auto guard = scheduler.schedule(5000ms, [this]() { scheduler.stop(); });
        scheduler.run();
        scheduler.cancel(guard);
        return received;
    }

    core::UvScheduler scheduler;
    std::unique_ptr<LoopbackServer> server;
    std::shared_ptr<HttpClient> client;
};

TEST_F(HttpClientTest, FetchesBodyAndHeaders) {
    serve("HTTP/1.1 200 OK\r\n"
          "Content-Type: application/vnd.apple.mpegurl\r\n"
          "Content-Length: 7\r\n"
          "Connection: close\r\n\r\n"
          "#EXTM3U");

    auto result = fetch(server->url("/hls/demo/playlist.m3u8"));

    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result->is_ok()) << result->error().what();
    EXPECT_EQ(result->value().status, 200);
    EXPECT_EQ(result->value().body, "#EXTM3U");
    EXPECT_EQ(result->value().header("CONTENT-TYPE"), "application/vnd.apple.mpegurl");
    EXPECT_EQ(server->last_request.rfind("GET /hls/demo/playlist.m3u8 HTTP/1.1\r\n", 0), 0u);
    EXPECT_EQ(client->pendingRequests(), 0u);
}

TEST_F(HttpClientTest, ChunkedBody) {
    serve("HTTP/1.1 200 OK\r\n"
          "Transfer-Encoding: chunked\r\n"
          "Connection: close\r\n\r\n"
          "4\r\nWiki\r\n5\r\npedia\r\n0\r\n\r\n");

    auto result = fetch(server->url("/seg0.ts"));

    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result->is_ok()) << result->error().what();
    EXPECT_EQ(result->value().body, "Wikipedia");
}

TEST_F(HttpClientTest, NonOkStatusIsError) {
    serve("HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\nConnection: close\r\n\r\n");

    auto result = fetch(server->url("/hls/missing/playlist.m3u8"));

    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result->is_error());
    EXPECT_EQ(result->error().code(), core::ErrorCode::NetworkError);
    EXPECT_NE(std::string(result->error().what()).find("HTTP 404"), std::string::npos);
}

TEST_F(HttpClientTest, HttpsUrlIsAttempted) {
    // A plain-text server cannot complete a TLS handshake, but the request
    // must reach it rather than being refused up front
    serve("HTTP/1.1 200 OK\r\nContent-Length: 2\r\nConnection: close\r\n\r\nok");
    server->respond_on_first_read = true;

    auto result = fetch(server->url("/hls/demo/playlist.m3u8", "https"));

    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result->is_error());
    EXPECT_NE(result->error().code(), core::ErrorCode::NotSupported);
    EXPECT_EQ(server->connections, 1);
}

TEST_F(HttpClientTest, UnsupportedSchemeIsReportedAsynchronously) {
    serve("HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n");

    std::optional<core::Result<HttpResponse>> received;
    client->get("ftp://127.0.0.1/file", [&](core::Result<HttpResponse> result) {
        received.emplace(std::move(result));
        scheduler.stop();
    });
    EXPECT_FALSE(received.has_value());

    auto guard = scheduler.schedule(5000ms, [this]() { scheduler.stop(); });
    scheduler.run();
    scheduler.cancel(guard);

    ASSERT_TRUE(received.has_value());
    ASSERT_TRUE(received->is_error());
    EXPECT_EQ(received->error().code(), core::ErrorCode::NotSupported);
    EXPECT_EQ(server->connections, 0);
}

TEST_F(HttpClientTest, CancelAllDropsCallbacks) {
    serve("HTTP/1.1 200 OK\r\nContent-Length: 2\r\nConnection: close\r\n\r\nok");

    bool called = false;
    client->get(server->url("/a"), [&](core::Result<HttpResponse>) { called = true; });
    client->get(server->url("/b"), [&](core::Result<HttpResponse>) { called = true; });
    EXPECT_EQ(client->pendingRequests(), 2u);

    client->cancelAll();
    EXPECT_EQ(client->pendingRequests(), 0u);

    scheduler.schedule(100ms, [this]() { scheduler.stop(); });
    scheduler.run();
    EXPECT_FALSE(called);
}

} // namespace streamview::net::test

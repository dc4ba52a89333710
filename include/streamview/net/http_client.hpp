#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>

#include <curl/curl.h>
#include <uv.h>

#include <streamview/core/error.hpp>

namespace streamview::net {

struct HttpResponse {
    int status = 0;
    std::map<std::string, std::string> headers; // names lowercased
    std::string body;

    std::string header(const std::string& name) const;
};

// Asynchronous HTTP GET. Callbacks run on the scheduler thread.
class HttpFetcher {
public:
    using Callback = std::function<void(core::Result<HttpResponse>)>;

    virtual ~HttpFetcher() = default;

    virtual void get(const std::string& url, Callback callback) = 0;

    // Drops every outstanding request without invoking its callback
    virtual void cancelAll() = 0;
};

// HttpFetcher on libcurl's multi interface, driven by the libuv loop: curl
// sockets are watched with uv_poll_t and curl's timeout with a uv_timer_t.
// Handles http:// and https://; any status other than 200 is an error.
class HttpClient : public HttpFetcher,
                   public std::enable_shared_from_this<HttpClient> {
public:
    static constexpr long kConnectTimeoutMs = 5000;
    static constexpr long kRequestTimeoutMs = 20000;

    static std::shared_ptr<HttpClient> create(uv_loop_t* loop);
    ~HttpClient() override;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    void get(const std::string& url, Callback callback) override;
    void cancelAll() override;

    size_t pendingRequests() const { return requests_.size(); }

private:
    struct Request;
    struct SocketWatch;

    explicit HttpClient(uv_loop_t* loop);

    static int onSocket(CURL* easy, curl_socket_t socket, int action, void* userp, void* socketp);
    static int onTimerRequest(CURLM* multi, long timeout_ms, void* userp);
    static void onPoll(uv_poll_t* handle, int status, int events);
    static void onTimeout(uv_timer_t* handle);
    static size_t onBody(char* data, size_t size, size_t count, void* userp);
    static size_t onHeader(char* data, size_t size, size_t count, void* userp);

    void drive(curl_socket_t socket, int flags);
    void collectFinished();
    void release(Request& request);
    static core::Result<HttpResponse> resultOf(Request& request, CURLcode code);

    uv_loop_t* loop_;
    CURLM* multi_ = nullptr;
    uv_timer_t* timer_ = nullptr;

    std::set<SocketWatch*> watches_;

    uint64_t next_id_ = 1;
    uint64_t cancel_epoch_ = 0;
    std::map<uint64_t, std::unique_ptr<Request>> requests_;
};

} // namespace streamview::net

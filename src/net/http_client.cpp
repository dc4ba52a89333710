#include <streamview/net/http_client.hpp>
#include <streamview/core/logger.hpp>

#include <algorithm>
#include <cctype>
#include <vector>

namespace streamview::net {

namespace {
    std::string toLower(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return text;
    }

    std::string trim(const std::string& text) {
        auto begin = text.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos) return "";
        auto end = text.find_last_not_of(" \t\r\n");
        return text.substr(begin, end - begin + 1);
    }

    core::ErrorCode codeFor(CURLcode code) {
        switch (code) {
            case CURLE_OPERATION_TIMEDOUT: return core::ErrorCode::ConnectionTimeout;
            case CURLE_COULDNT_CONNECT: return core::ErrorCode::ConnectionFailed;
            case CURLE_COULDNT_RESOLVE_HOST: return core::ErrorCode::InvalidAddress;
            case CURLE_URL_MALFORMAT: return core::ErrorCode::InvalidAddress;
            case CURLE_UNSUPPORTED_PROTOCOL: return core::ErrorCode::NotSupported;
            default: return core::ErrorCode::NetworkError;
        }
    }
}

struct HttpClient::Request {
    uint64_t id = 0;
    CURL* easy = nullptr;
    std::string url;
    Callback callback;
    HttpResponse response;
    char error[CURL_ERROR_SIZE] = {};
};

struct HttpClient::SocketWatch {
    uv_poll_t poll;
    curl_socket_t socket;
    HttpClient* owner;
};

std::string HttpResponse::header(const std::string& name) const {
    auto it = headers.find(toLower(name));
    return it != headers.end() ? it->second : std::string();
}

std::shared_ptr<HttpClient> HttpClient::create(uv_loop_t* loop) {
    return std::shared_ptr<HttpClient>(new HttpClient(loop));
}

HttpClient::HttpClient(uv_loop_t* loop) : loop_(loop) {
    curl_global_init(CURL_GLOBAL_DEFAULT);

    multi_ = curl_multi_init();
    if (!multi_) {
        curl_global_cleanup();
        core::throw_error(core::ErrorCode::Unknown, "Failed to initialize curl multi handle");
    }
    curl_multi_setopt(multi_, CURLMOPT_SOCKETFUNCTION, &HttpClient::onSocket);
    curl_multi_setopt(multi_, CURLMOPT_SOCKETDATA, this);
    curl_multi_setopt(multi_, CURLMOPT_TIMERFUNCTION, &HttpClient::onTimerRequest);
    curl_multi_setopt(multi_, CURLMOPT_TIMERDATA, this);

    timer_ = new uv_timer_t;
    uv_timer_init(loop_, timer_);
    timer_->data = this;
}

HttpClient::~HttpClient() {
    cancelAll();

    // Unassign before cleanup so curl does not report the watches back to us
    for (auto* watch : watches_) {
        uv_poll_stop(&watch->poll);
        curl_multi_assign(multi_, watch->socket, nullptr);
        uv_close(reinterpret_cast<uv_handle_t*>(&watch->poll), [](uv_handle_t* handle) {
            delete static_cast<SocketWatch*>(handle->data);
        });
    }
    watches_.clear();

    curl_multi_cleanup(multi_);

    uv_timer_stop(timer_);
    uv_close(reinterpret_cast<uv_handle_t*>(timer_), [](uv_handle_t* handle) {
        delete reinterpret_cast<uv_timer_t*>(handle);
    });

    curl_global_cleanup();
}

void HttpClient::get(const std::string& url, Callback callback) {
    auto request = std::make_unique<Request>();
    request->id = next_id_++;
    request->url = url;
    request->callback = std::move(callback);

    CURL* easy = curl_easy_init();
    if (!easy) {
        core::throw_error(core::ErrorCode::Unknown, "Failed to initialize curl request for " + url);
    }
    request->easy = easy;

    curl_easy_setopt(easy, CURLOPT_URL, url.c_str());
    curl_easy_setopt(easy, CURLOPT_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(easy, CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(easy, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(easy, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(easy, CURLOPT_CONNECTTIMEOUT_MS, kConnectTimeoutMs);
    curl_easy_setopt(easy, CURLOPT_TIMEOUT_MS, kRequestTimeoutMs);
    curl_easy_setopt(easy, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(easy, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(easy, CURLOPT_USERAGENT, "streamview/0.1");
    curl_easy_setopt(easy, CURLOPT_WRITEFUNCTION, &HttpClient::onBody);
    curl_easy_setopt(easy, CURLOPT_WRITEDATA, request.get());
    curl_easy_setopt(easy, CURLOPT_HEADERFUNCTION, &HttpClient::onHeader);
    curl_easy_setopt(easy, CURLOPT_HEADERDATA, request.get());
    curl_easy_setopt(easy, CURLOPT_ERRORBUFFER, request->error);
    curl_easy_setopt(easy, CURLOPT_PRIVATE, reinterpret_cast<void*>(static_cast<uintptr_t>(request->id)));

    CURLMcode added = curl_multi_add_handle(multi_, easy);
    if (added != CURLM_OK) {
        curl_easy_cleanup(easy);
        core::throw_error(core::ErrorCode::Unknown,
            std::string("Failed to queue request for ") + url + ": " + curl_multi_strerror(added));
    }

    core::Logger::debug("HTTP GET {}", url);
    requests_.emplace(request->id, std::move(request));
}

void HttpClient::cancelAll() {
    ++cancel_epoch_;
    for (auto& [id, request] : requests_) {
        release(*request);
    }
    requests_.clear();
}

void HttpClient::release(Request& request) {
    if (request.easy) {
        curl_multi_remove_handle(multi_, request.easy);
        curl_easy_cleanup(request.easy);
        request.easy = nullptr;
    }
}

int HttpClient::onSocket(CURL*, curl_socket_t socket, int action, void* userp, void* socketp) {
    auto* client = static_cast<HttpClient*>(userp);
    auto* watch = static_cast<SocketWatch*>(socketp);

    if (action == CURL_POLL_REMOVE) {
        if (watch) {
            client->watches_.erase(watch);
            uv_poll_stop(&watch->poll);
            curl_multi_assign(client->multi_, socket, nullptr);
            uv_close(reinterpret_cast<uv_handle_t*>(&watch->poll), [](uv_handle_t* handle) {
                delete static_cast<SocketWatch*>(handle->data);
            });
        }
        return 0;
    }

    if (!watch) {
        watch = new SocketWatch{};
        watch->socket = socket;
        watch->owner = client;
        int result = uv_poll_init_socket(client->loop_, &watch->poll, socket);
        if (result != 0) {
            core::Logger::error("Cannot watch HTTP socket: {}", uv_strerror(result));
            delete watch;
            return -1;
        }
        watch->poll.data = watch;
        client->watches_.insert(watch);
        curl_multi_assign(client->multi_, socket, watch);
    }

    int events = 0;
    if (action & CURL_POLL_IN) events |= UV_READABLE;
    if (action & CURL_POLL_OUT) events |= UV_WRITABLE;
    uv_poll_start(&watch->poll, events, &HttpClient::onPoll);
    return 0;
}

int HttpClient::onTimerRequest(CURLM*, long timeout_ms, void* userp) {
    auto* client = static_cast<HttpClient*>(userp);
    if (timeout_ms < 0) {
        uv_timer_stop(client->timer_);
    } else {
        uv_timer_start(client->timer_, &HttpClient::onTimeout, static_cast<uint64_t>(timeout_ms), 0);
    }
    return 0;
}

void HttpClient::onPoll(uv_poll_t* handle, int status, int events) {
    auto* watch = static_cast<SocketWatch*>(handle->data);
    int flags = 0;
    if (status < 0) {
        flags = CURL_CSELECT_ERR;
    } else {
        if (events & UV_READABLE) flags |= CURL_CSELECT_IN;
        if (events & UV_WRITABLE) flags |= CURL_CSELECT_OUT;
    }
    watch->owner->drive(watch->socket, flags);
}

void HttpClient::onTimeout(uv_timer_t* handle) {
    static_cast<HttpClient*>(handle->data)->drive(CURL_SOCKET_TIMEOUT, 0);
}

size_t HttpClient::onBody(char* data, size_t size, size_t count, void* userp) {
    auto* request = static_cast<Request*>(userp);
    request->response.body.append(data, size * count);
    return size * count;
}

size_t HttpClient::onHeader(char* data, size_t size, size_t count, void* userp) {
    auto* request = static_cast<Request*>(userp);
    std::string line(data, size * count);

    // Every response in a redirect chain starts with its own status line
    if (line.rfind("HTTP/", 0) == 0) {
        request->response.headers.clear();
        return size * count;
    }
    auto colon = line.find(':');
    if (colon != std::string::npos) {
        request->response.headers[toLower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }
    return size * count;
}

void HttpClient::drive(curl_socket_t socket, int flags) {
    // A callback may release the last reference to this client
    auto self = shared_from_this();

    int running = 0;
    CURLMcode result = curl_multi_socket_action(multi_, socket, flags, &running);
    if (result != CURLM_OK) {
        core::Logger::error("curl multi failure: {}", curl_multi_strerror(result));
    }
    collectFinished();
}

core::Result<HttpResponse> HttpClient::resultOf(Request& request, CURLcode code) {
    if (code != CURLE_OK) {
        std::string reason = request.error[0] != '\0' ? request.error : curl_easy_strerror(code);
        return {codeFor(code), "GET " + request.url + " failed: " + reason};
    }

    long status = 0;
    curl_easy_getinfo(request.easy, CURLINFO_RESPONSE_CODE, &status);
    if (status != 200) {
        return {core::ErrorCode::NetworkError, "HTTP " + std::to_string(status) + " for " + request.url};
    }

    request.response.status = static_cast<int>(status);
    return std::move(request.response);
}

void HttpClient::collectFinished() {
    struct Completion {
        Callback callback;
        core::Result<HttpResponse> result;
    };
    std::vector<Completion> completed;

    CURLMsg* message = nullptr;
    int remaining = 0;
    while ((message = curl_multi_info_read(multi_, &remaining)) != nullptr) {
        if (message->msg != CURLMSG_DONE) {
            continue;
        }

        char* tag = nullptr;
        curl_easy_getinfo(message->easy_handle, CURLINFO_PRIVATE, &tag);
        auto it = requests_.find(static_cast<uint64_t>(reinterpret_cast<uintptr_t>(tag)));
        if (it == requests_.end()) {
            continue;
        }

        std::unique_ptr<Request> request = std::move(it->second);
        requests_.erase(it);

        auto result = resultOf(*request, message->data.result);
        release(*request);
        if (result.is_error()) {
            core::Logger::debug("{}", result.error().what());
        }
        completed.push_back(Completion{std::move(request->callback), std::move(result)});
    }

    uint64_t epoch = cancel_epoch_;
    for (auto& completion : completed) {
        if (cancel_epoch_ != epoch) {
            break;
        }
        if (completion.callback) {
            completion.callback(std::move(completion.result));
        }
    }
}

} // namespace streamview::net

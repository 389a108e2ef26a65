#include "ncf_http_server.hpp"
#include "ncf_logger.hpp"
#include "ncf_thread_pool.hpp"

#include <libwebsockets.h>

#include <atomic>
#include <cstdlib>
#include <cstring>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

namespace ncf {

// ---------------------------------------------------------------------------
// HttpServer::Impl: private implementation (pimpl)
// ---------------------------------------------------------------------------
struct HttpServer::Impl {
    enum class Phase { Receiving, Dispatched, Ready, HeadersSent };

    // One request/response on a connection; service thread only
    struct Exchange {
        uint64_t    id = 0;
        std::string method;
        std::string path;
        std::string body;
        bool        too_large = false;
        Phase       phase = Phase::Receiving;
        int         status = 200;
        std::string payload;
        std::string allow;
    };

    // Worker -> service thread hand-off
    struct Completed {
        int         status = 200;
        std::string payload;
        std::string allow;
    };

    const ApiRouter& router;
    HttpServerConfig config;

    struct lws_context* context = nullptr;
    uint16_t bound_port = 0;
    std::thread service_thread;
    std::atomic<bool> running{false};
    std::unique_ptr<ThreadPool> pool;

    std::map<struct lws*, Exchange> exchanges;
    std::map<uint64_t, struct lws*> by_id;
    uint64_t next_id = 0;

    std::mutex completed_mutex;
    std::map<uint64_t, Completed> completed;

    explicit Impl(const ApiRouter& r) : router(r) {}

    // lws protocols
    static const struct lws_protocols protocols[];

    // lws callback
    static int http_callback(struct lws* wsi, enum lws_callback_reasons reason,
                             void* user, void* in, size_t len);

    void service_loop();
    void begin(struct lws* wsi, const char* uri, size_t len);
    void dispatch(struct lws* wsi);
    void collect_completed();
    int  write_response(struct lws* wsi);
    void forget(struct lws* wsi);

    static std::string method_of(struct lws* wsi);
    static size_t content_length(struct lws* wsi);
};

// ---------------------------------------------------------------------------
// Protocol table
// ---------------------------------------------------------------------------
const struct lws_protocols HttpServer::Impl::protocols[] = {
    { "http", HttpServer::Impl::http_callback, 0, 0 },
    { NULL, NULL, 0, 0 }
};

// ---------------------------------------------------------------------------
// Request plumbing
// ---------------------------------------------------------------------------
std::string HttpServer::Impl::method_of(struct lws* wsi) {
    if (lws_hdr_total_length(wsi, WSI_TOKEN_GET_URI))     return "GET";
    if (lws_hdr_total_length(wsi, WSI_TOKEN_POST_URI))    return "POST";
    if (lws_hdr_total_length(wsi, WSI_TOKEN_DELETE_URI))  return "DELETE";
    if (lws_hdr_total_length(wsi, WSI_TOKEN_OPTIONS_URI)) return "OPTIONS";
    if (lws_hdr_total_length(wsi, WSI_TOKEN_PUT_URI))     return "PUT";
    if (lws_hdr_total_length(wsi, WSI_TOKEN_PATCH_URI))   return "PATCH";
    return "";
}

size_t HttpServer::Impl::content_length(struct lws* wsi) {
    char buf[32] = {};
    if (lws_hdr_copy(wsi, buf, sizeof(buf), WSI_TOKEN_HTTP_CONTENT_LENGTH) <= 0) return 0;
    return static_cast<size_t>(std::strtoull(buf, nullptr, 10));
}

void HttpServer::Impl::begin(struct lws* wsi, const char* uri, size_t len) {
    // A kept-alive connection reuses the wsi for its next request
    forget(wsi);

    Exchange ex;
    ex.id     = ++next_id;
    ex.method = method_of(wsi);
    ex.path   = uri ? std::string(uri, len) : std::string("/");

    size_t expected = ex.method == "POST" ? content_length(wsi) : 0;
    if (expected > config.max_body_bytes) ex.too_large = true;

    by_id[ex.id] = wsi;
    exchanges[wsi] = std::move(ex);

    // Bodies arrive through LWS_CALLBACK_HTTP_BODY*
    if (expected == 0) dispatch(wsi);
}

void HttpServer::Impl::dispatch(struct lws* wsi) {
    auto it = exchanges.find(wsi);
    if (it == exchanges.end()) return;
    Exchange& ex = it->second;

    auto finish_now = [&](int status, const std::string& detail) {
        ex.status  = status;
        ex.payload = "{\"detail\":\"" + detail + "\"}";
        ex.phase   = Phase::Ready;
        lws_callback_on_writable(wsi);
    };

    if (ex.too_large) {
        finish_now(413, "Request body too large");
        return;
    }

    ex.phase = Phase::Dispatched;
    const uint64_t id = ex.id;
    const std::string method = ex.method;
    const std::string path = ex.path;
    const std::string body = std::move(ex.body);

    bool queued = pool->post([this, id, method, path, body] {
        ApiResponse r = router.handle(method, path, body);

        Completed c;
        c.status  = r.status;
        c.payload = r.body.is_null()
                  ? std::string()
                  : r.body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        if (method == "OPTIONS") c.allow = router.allowed_methods(path);

        NCF_LOG_DEBUG(method << " " << path << " -> " << r.status);
        {
            std::lock_guard<std::mutex> lock(completed_mutex);
            completed[id] = std::move(c);
        }
        lws_cancel_service(context);
    });

    if (!queued) finish_now(503, "Server shutting down");
}

void HttpServer::Impl::collect_completed() {
    std::map<uint64_t, Completed> batch;
    {
        std::lock_guard<std::mutex> lock(completed_mutex);
        batch.swap(completed);
    }

    for (auto& [id, c] : batch) {
        auto conn = by_id.find(id);
        if (conn == by_id.end()) continue;  // client went away

        Exchange& ex = exchanges[conn->second];
        ex.status  = c.status;
        ex.payload = std::move(c.payload);
        ex.allow   = std::move(c.allow);
        ex.phase   = Phase::Ready;
        lws_callback_on_writable(conn->second);
    }
}

int HttpServer::Impl::write_response(struct lws* wsi) {
    auto it = exchanges.find(wsi);
    if (it == exchanges.end()) return 0;
    Exchange& ex = it->second;

    if (ex.phase == Phase::Ready) {
        unsigned char buf[LWS_PRE + 1024];
        unsigned char* start = &buf[LWS_PRE];
        unsigned char* p = start;
        unsigned char* end = &buf[sizeof(buf) - 1];

        if (lws_add_http_common_headers(wsi, static_cast<unsigned int>(ex.status),
                                        "application/json", ex.payload.size(), &p, end))
            return 1;
        if (lws_add_http_header_by_name(wsi,
                reinterpret_cast<const unsigned char*>("access-control-allow-origin:"),
                reinterpret_cast<const unsigned char*>("*"), 1, &p, end))
            return 1;
        if (ex.method == "OPTIONS") {
            static const char kAllowHeaders[] = "content-type";
            if (lws_add_http_header_by_name(wsi,
                    reinterpret_cast<const unsigned char*>("access-control-allow-methods:"),
                    reinterpret_cast<const unsigned char*>(ex.allow.c_str()),
                    static_cast<int>(ex.allow.size()), &p, end))
                return 1;
            if (lws_add_http_header_by_name(wsi,
                    reinterpret_cast<const unsigned char*>("access-control-allow-headers:"),
                    reinterpret_cast<const unsigned char*>(kAllowHeaders),
                    static_cast<int>(sizeof(kAllowHeaders) - 1), &p, end))
                return 1;
        }
        if (lws_finalize_write_http_header(wsi, start, &p, end))
            return 1;

        if (ex.payload.empty()) {
            forget(wsi);
            return lws_http_transaction_completed(wsi) ? -1 : 0;
        }
        ex.phase = Phase::HeadersSent;
        lws_callback_on_writable(wsi);
        return 0;
    }

    if (ex.phase == Phase::HeadersSent) {
        // LWS_PRE padding required by libwebsockets before payload
        std::vector<unsigned char> out(LWS_PRE + ex.payload.size());
        std::memcpy(out.data() + LWS_PRE, ex.payload.data(), ex.payload.size());
        int written = lws_write(wsi, out.data() + LWS_PRE, ex.payload.size(),
                                LWS_WRITE_HTTP_FINAL);
        if (written < static_cast<int>(ex.payload.size())) return 1;

        forget(wsi);
        return lws_http_transaction_completed(wsi) ? -1 : 0;
    }
    return 0;
}

void HttpServer::Impl::forget(struct lws* wsi) {
    auto it = exchanges.find(wsi);
    if (it == exchanges.end()) return;
    by_id.erase(it->second.id);
    exchanges.erase(it);
}

// ---------------------------------------------------------------------------
// lws callback
// ---------------------------------------------------------------------------
int HttpServer::Impl::http_callback(struct lws* wsi,
    enum lws_callback_reasons reason, void* user, void* in, size_t len)
{
    // Retrieve Impl* stored as user-data of the lws_context
    struct lws_context* ctx = lws_get_context(wsi);
    Impl* self = ctx ? static_cast<Impl*>(lws_context_user(ctx)) : nullptr;
    if (!self) return lws_callback_http_dummy(wsi, reason, user, in, len);

    switch (reason) {
    case LWS_CALLBACK_HTTP:
        self->begin(wsi, static_cast<const char*>(in), len);
        return 0;

    case LWS_CALLBACK_HTTP_BODY: {
        auto it = self->exchanges.find(wsi);
        if (it != self->exchanges.end() && !it->second.too_large && in && len > 0) {
            if (it->second.body.size() + len > self->config.max_body_bytes) {
                it->second.too_large = true;
                it->second.body.clear();
            } else {
                it->second.body.append(static_cast<const char*>(in), len);
            }
        }
        return 0;
    }

    case LWS_CALLBACK_HTTP_BODY_COMPLETION:
        self->dispatch(wsi);
        return 0;

    case LWS_CALLBACK_EVENT_WAIT_CANCELLED:
        self->collect_completed();
        return 0;

    case LWS_CALLBACK_HTTP_WRITEABLE:
        return self->write_response(wsi);

    case LWS_CALLBACK_CLOSED_HTTP:
        self->forget(wsi);
        break;

    default:
        break;
    }
    return lws_callback_http_dummy(wsi, reason, user, in, len);
}

// ---------------------------------------------------------------------------
// Service loop (runs in its own thread)
// ---------------------------------------------------------------------------
void HttpServer::Impl::service_loop()
{
    while (running.load()) {
        if (lws_service(context, 0) < 0) {
            NCF_LOG_ERROR("HTTP service loop failed, stopping");
            running = false;
        }
    }
}

// ---------------------------------------------------------------------------
// HttpServer public API
// ---------------------------------------------------------------------------
HttpServer::HttpServer(const ApiRouter& router) : impl_(std::make_unique<Impl>(router)) {}
HttpServer::~HttpServer() { stop(); }

bool HttpServer::initialize(const HttpServerConfig& config)
{
    impl_->config = config;

    lws_set_log_level(LLL_ERR | LLL_WARN, nullptr);

    struct lws_context_creation_info info;
    std::memset(&info, 0, sizeof(info));
    info.port = config.port;
    info.iface = impl_->config.host.empty() ? nullptr : impl_->config.host.c_str();
    info.protocols = Impl::protocols;
    info.user = impl_.get();             // store Impl* for the callback
    info.timeout_secs = static_cast<unsigned int>(config.idle_timeout_sec);

    impl_->context = lws_create_context(&info);
    if (!impl_->context) {
        NCF_LOG_ERROR("Cannot listen on " << config.host << ":" << config.port);
        return false;
    }

    struct lws_vhost* vhost = lws_get_vhost_by_name(impl_->context, "default");
    int listening = vhost ? lws_get_vhost_listen_port(vhost) : -1;
    impl_->bound_port = listening > 0 ? static_cast<uint16_t>(listening) : config.port;
    return true;
}

bool HttpServer::start()
{
    if (!impl_->context) return false;
    if (impl_->running.exchange(true)) return true;

    impl_->pool = std::make_unique<ThreadPool>(impl_->config.worker_threads, "http");
    impl_->service_thread = std::thread(&Impl::service_loop, impl_.get());

    NCF_LOG_INFO("HTTP API listening on " << impl_->config.host << ":" << impl_->bound_port);
    return true;
}

void HttpServer::stop()
{
    impl_->running = false;
    if (impl_->context) lws_cancel_service(impl_->context);

    if (impl_->service_thread.joinable())
        impl_->service_thread.join();

    // Workers call lws_cancel_service(), so drain them before the context goes
    if (impl_->pool) {
        impl_->pool->shutdown();
        impl_->pool.reset();
    }

    if (impl_->context) {
        lws_context_destroy(impl_->context);
        impl_->context = nullptr;
        impl_->bound_port = 0;
    }
    impl_->exchanges.clear();
    impl_->by_id.clear();
}

bool HttpServer::is_running() const { return impl_->running.load(); }

uint16_t HttpServer::port() const { return impl_->bound_port; }

} // namespace ncf

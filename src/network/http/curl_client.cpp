#include "curl_client.hpp"
#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <string_view>
#include "../../utils/text/string_utils.hpp"

namespace Umbra {
namespace Network {
namespace Http {

namespace net = boost::asio;

namespace {

Response error_response(const std::string& url, ErrorType type, const std::string& message) {
    Response r;
    r.effective_url = url;
    r.success       = false;
    r.error         = message;
    r.error_type    = type;
    return r;
}

}  // namespace

CurlClient::CurlClient(net::thread_pool& pool) : pool_(pool) {
}

void CurlClient::set_proxy(const std::string& proxy) {
    proxy_ = proxy;
}

void CurlClient::set_connect_timeout(std::chrono::milliseconds timeout) {
    connect_timeout_ = timeout;
}

ErrorType CurlClient::classify(CURLcode code) {
    switch (code) {
        case CURLE_OK: return ErrorType::None;
        case CURLE_OPERATION_TIMEDOUT: return ErrorType::Timeout;
        case CURLE_COULDNT_CONNECT: return ErrorType::ConnectionRefused;
        case CURLE_COULDNT_RESOLVE_PROXY: return ErrorType::Proxy;
        case CURLE_ABORTED_BY_CALLBACK: return ErrorType::Cancelled;
        case CURLE_FILESIZE_EXCEEDED: return ErrorType::TooLarge;
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_WEIRD_SERVER_REPLY:
        case CURLE_PARTIAL_FILE:
        case CURLE_SSL_CONNECT_ERROR: return ErrorType::Protocol;
        default: return ErrorType::Network;
    }
}

size_t CurlClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* ctx = static_cast<CurlClient::RequestContext*>(userp);
    if (!ctx || !ctx->body)
        return 0;

    size_t total = size * nmemb;
    if (ctx->max_body > 0 && ctx->body->size() + total > ctx->max_body) {
        ctx->too_large = true;
        return 0;
    }
    ctx->body->append(static_cast<const char*>(contents), total);
    return total;
}

size_t CurlClient::header_callback(char* buffer, size_t size, size_t nitems, void* userp) {
    auto* ctx   = static_cast<CurlClient::RequestContext*>(userp);
    size_t total = size * nitems;
    if (!ctx || !ctx->headers)
        return total;

    std::string line = Utils::Text::trim(std::string(buffer, total));
    // A new status line starts a new header block (proxy CONNECT, 1xx).
    if (Utils::Text::starts_with(line, "HTTP/")) {
        ctx->headers->clear();
        return total;
    }
    auto colon = line.find(':');
    if (colon == std::string::npos)
        return total;

    std::string name  = Utils::Text::trim(line.substr(0, colon));
    std::string value = Utils::Text::trim(line.substr(colon + 1));
    if (Utils::Text::to_lower(name) == "content-type" && ctx->content_type)
        *ctx->content_type = value;
    ctx->headers->emplace_back(std::move(name), std::move(value));
    return total;
}

int CurlClient::progress_callback(void* userp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<CurlClient::RequestContext*>(userp);
    return (ctx && ctx->abort && ctx->abort->load()) ? 1 : 0;
}

CurlClient::HeaderSlist CurlClient::setup_curl_options(CURL*           curl,
                                                       const Request&  req,
                                                       RequestContext& ctx) const {
    curl_easy_setopt(curl, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(req.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connect_timeout_.count()));
    curl_easy_setopt(curl, CURLOPT_SSL_CIPHER_LIST, Identity::cipher_list(req.tls_profile));
    curl_easy_setopt(curl, CURLOPT_SSL_EC_CURVES, Identity::groups_list(req.tls_profile));
    if (req.max_body_size > 0)
        curl_easy_setopt(curl, CURLOPT_MAXFILESIZE_LARGE, static_cast<curl_off_t>(req.max_body_size));

    if (!proxy_.empty())
        curl_easy_setopt(curl, CURLOPT_PROXY, proxy_.c_str());

    curl_slist* raw = nullptr;
    for (const auto& [name, value] : req.headers) {
        curl_slist* next = curl_slist_append(raw, (name + ": " + value).c_str());
        if (!next)
            break;
        raw = next;
    }
    HeaderSlist header_list(raw);
    if (raw)
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, raw);
    return header_list;
}

Response CurlClient::perform(const Request& request, const std::atomic<bool>& abort) const {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl)
        return error_response(request.url, ErrorType::Network, "Failed to initialize CURL handle");

    Response       response;
    RequestContext ctx{.body         = &response.body,
                       .headers      = &response.headers,
                       .content_type = &response.content_type,
                       .max_body     = request.max_body_size,
                       .too_large    = false,
                       .abort        = &abort};

    auto     headers = setup_curl_options(curl.get(), request, ctx);
    CURLcode code    = curl_easy_perform(curl.get());

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    char* effective = nullptr;
    curl_easy_getinfo(curl.get(), CURLINFO_EFFECTIVE_URL, &effective);
    response.effective_url = effective ? std::string(effective) : request.url;

    if (code != CURLE_OK) {
        ErrorType type = ctx.too_large ? ErrorType::TooLarge : classify(code);
        return error_response(response.effective_url, type, curl_easy_strerror(code));
    }

    response.status_code = status;
    response.success     = status >= 200 && status < 300;
    if (!response.success)
        response.error = "HTTP " + std::to_string(status);
    return response;
}

net::awaitable<Response> CurlClient::get(const Request& request, Core::CancellationSignal& cancel) {
    auto abort        = std::make_shared<std::atomic<bool>>(cancel.cancelled());
    auto registration = cancel.on_cancel([abort] { abort->store(true); });

    co_return co_await net::co_spawn(
        pool_,
        [this, request, abort]() -> net::awaitable<Response> {
            co_return perform(request, *abort);
        },
        net::use_awaitable);
}

}  // namespace Http
}  // namespace Network
}  // namespace Umbra

#pragma once
#include <curl/curl.h>
#include <atomic>
#include <utility>
#include <boost/asio/thread_pool.hpp>
#include <memory>
#include <string>
#include "http_client.hpp"

namespace Umbra {
namespace Network {
namespace Http {

class CurlClient : public HttpClient {
public:
    explicit CurlClient(boost::asio::thread_pool& pool);
    ~CurlClient() override                 = default;
    CurlClient(const CurlClient&)            = delete;
    CurlClient& operator=(const CurlClient&) = delete;

    void set_proxy(const std::string& proxy) override;
    void set_connect_timeout(std::chrono::milliseconds timeout) override;
    boost::asio::awaitable<Response> get(const Request&            request,
                                         Core::CancellationSignal& cancel) override;

    // Runs the transfer on the calling thread.
    Response perform(const Request& request, const std::atomic<bool>& abort) const;

    static ErrorType classify(CURLcode code);

private:
    struct RequestContext {
        std::string*             body         = nullptr;
        HeaderList*              headers      = nullptr;
        std::string*             content_type = nullptr;
        std::size_t              max_body     = 0;
        bool                     too_large    = false;
        const std::atomic<bool>* abort        = nullptr;
    };

    struct CurlDeleter {
        void operator()(CURL* curl) const noexcept {
            if (curl)
                curl_easy_cleanup(curl);
        }
    };

    struct CurlSlistDeleter {
        void operator()(curl_slist* list) const noexcept {
            curl_slist_free_all(list);
        }
    };

    using HeaderSlist = std::unique_ptr<curl_slist, CurlSlistDeleter>;

    boost::asio::thread_pool& pool_;
    std::string               proxy_;
    std::chrono::milliseconds connect_timeout_{30000};

    HeaderSlist setup_curl_options(CURL* curl, const Request& req, RequestContext& ctx) const;

    // Callbacks must be static. userp is guaranteed to be RequestContext*.
    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userp);
    static int    progress_callback(void* userp, curl_off_t, curl_off_t, curl_off_t, curl_off_t);
};

}  // namespace Http
}  // namespace Network
}  // namespace Umbra

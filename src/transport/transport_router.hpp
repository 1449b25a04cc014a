#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <cstddef>
#include <string>
#include <umbra/statuses.hpp>
#include "../circuit/circuit_manager.hpp"
#include "../core/cancellation/cancellation.hpp"
#include "../identity/fingerprint_generator.hpp"
#include "../network/http/http_client.hpp"
#include "../target/target.hpp"

namespace Umbra {
namespace Transport {

struct TransportError {
    TransportErrorKind kind   = TransportErrorKind::None;
    long               status = 0;
    std::string        detail;

    std::string describe() const;
};

struct RawDocument {
    std::string                url;
    long                       status_code = 0;
    std::string                content_type;
    std::string                body;
    Network::Http::HeaderList  headers;
};

struct FetchResult {
    bool                      ok = false;
    RawDocument               document;
    TransportError            error;
    TransportKind             transport = TransportKind::Primary;
    std::chrono::milliseconds elapsed{0};
    bool                      oversized = false;
    bool                      cancelled = false;
};

struct TransportSettings {
    std::size_t min_content_length = 50;
    std::size_t max_body_size      = 5000000;
};

class TransportRouter {
public:
    TransportRouter(Network::Http::HttpClient& primary,
                    Network::Http::HttpClient* fallback,
                    Circuit::CircuitManager&   circuits,
                    TransportSettings          settings);

    boost::asio::awaitable<FetchResult> fetch(const Target::Target&            target,
                                              const Identity::IdentityProfile& identity,
                                              TransportKind                    transport,
                                              std::chrono::seconds             timeout,
                                              Core::CancellationSignal&        cancel);

    bool fallback_available() const {
        return fallback_ != nullptr;
    }

    // Folds a client response into the closed error set. `None` means success.
    static TransportError classify(const Network::Http::Response& response,
                                   std::size_t                    min_content_length);

private:
    Network::Http::HttpClient& primary_;
    Network::Http::HttpClient* fallback_;
    Circuit::CircuitManager&   circuits_;
    TransportSettings          settings_;
};

}  // namespace Transport
}  // namespace Umbra

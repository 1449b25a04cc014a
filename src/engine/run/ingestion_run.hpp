#pragma once
#include <utility>
#include <boost/asio.hpp>
#include <deque>
#include <memory>
#include <string>
#include <vector>
#include "../../anomaly/anomaly_sink.hpp"
#include "../../circuit/circuit_manager.hpp"
#include "../../core/cancellation/cancellation.hpp"
#include "../../core/config/config.hpp"
#include "../../identity/fingerprint_generator.hpp"
#include "../../network/http/http_client.hpp"
#include "../../network/tor/control_client.hpp"
#include "../../pipeline/content_processor.hpp"
#include "../../retry/retry_policy.hpp"
#include "../../storage/document_store.hpp"
#include "../../transport/transport_router.hpp"
#include "../ingestion/ingestion_coordinator.hpp"
#include "../orchestrator/fetch_orchestrator.hpp"
#include "run_summary.hpp"

namespace Umbra {
namespace Engine {

// Externally supplied collaborators. Any left null is built from the config.
struct Collaborators {
    Network::Http::HttpClient*        primary   = nullptr;
    Network::Http::HttpClient*        fallback  = nullptr;
    Network::Tor::CircuitControl*     control   = nullptr;
    Pipeline::ContentProcessor*       processor = nullptr;
    Storage::DocumentStore*           store     = nullptr;
    Anomaly::AnomalySink*             anomalies = nullptr;
    Circuit::CircuitManager::ClockFn  clock;
    Circuit::CircuitManager::RandomFn random;
};

struct RunReport {
    RunSummary                 summary;
    bool                       fatal = false;
    std::string                fatal_error;
    std::vector<TargetOutcome> outcomes;
};

/**
 * @brief One ingestion run over a fixed target list.
 *
 * Runs on a single-threaded io_context, which serializes every circuit and
 * dedup decision. Up to max_concurrent_targets workers pull from a shared
 * queue; SIGINT/SIGTERM or the run deadline cancel the run cooperatively
 * and the partial summary is still returned. Single use: execute() may be
 * called once.
 */
class IngestionRun {
public:
    explicit IngestionRun(const Core::Config& config, Collaborators collaborators = {});
    ~IngestionRun();

    IngestionRun(const IngestionRun&)            = delete;
    IngestionRun& operator=(const IngestionRun&) = delete;

    RunReport execute(const std::vector<std::string>& raw_targets);

    // Thread-safe.
    void cancel();

    Circuit::CircuitManager& circuits() {
        return *circuits_;
    }

private:
    Core::Config config_;

    boost::asio::io_context  ioc_;
    boost::asio::thread_pool content_pool_;
    boost::asio::thread_pool transport_pool_;
    boost::asio::signal_set  signals_{ioc_};
    boost::asio::steady_timer deadline_{ioc_};
    Core::CancellationSignal  cancel_;

    std::unique_ptr<Network::Http::HttpClient>    owned_primary_;
    std::unique_ptr<Network::Http::HttpClient>    owned_fallback_;
    std::unique_ptr<Network::Tor::CircuitControl> owned_control_;
    std::unique_ptr<Pipeline::ContentProcessor>   owned_processor_;
    std::unique_ptr<Storage::DocumentStore>       owned_store_;
    std::unique_ptr<Anomaly::AnomalySink>         owned_anomalies_;

    Network::Http::HttpClient*    primary_   = nullptr;
    Network::Http::HttpClient*    fallback_  = nullptr;
    Network::Tor::CircuitControl* control_   = nullptr;
    Pipeline::ContentProcessor*   processor_ = nullptr;
    Storage::DocumentStore*       store_     = nullptr;
    Anomaly::AnomalySink*         anomalies_ = nullptr;

    std::unique_ptr<Identity::FingerprintGenerator> fingerprints_;
    std::unique_ptr<Circuit::CircuitManager>        circuits_;
    std::unique_ptr<Transport::TransportRouter>     router_;
    std::unique_ptr<Retry::RetryPolicy>             policy_;
    std::unique_ptr<IngestionCoordinator>           ingestion_;
    std::unique_ptr<FetchOrchestrator>              orchestrator_;

    std::deque<Target::Target> queue_;
    int                        active_workers_ = 0;
    bool                       executed_       = false;
    RunReport*                 report_         = nullptr;

    void init_collaborators(Collaborators& collaborators);
    void init_components(const Collaborators& collaborators);
    void init_signals();
    void init_deadline();
    void finish();

    void                         enqueue(const std::vector<std::string>& raw_targets);
    boost::asio::awaitable<void> start();
    boost::asio::awaitable<void> worker_loop();
    void                         record(TargetOutcome outcome);
};

}  // namespace Engine
}  // namespace Umbra

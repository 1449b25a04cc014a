#include "ingestion_run.hpp"
#include <algorithm>
#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <cmath>
#include <csignal>
#include <stdexcept>
#include <unordered_set>
#include "../../core/errors/errors.hpp"
#include "../../core/logger/logger.hpp"
#include "../../network/http/beast_client.hpp"
#include "../../network/http/curl_client.hpp"
#include "../../pipeline/html_content_processor.hpp"
#include "../../storage/disk_document_store.hpp"

namespace Umbra {
namespace Engine {

namespace net = boost::asio;
using namespace Umbra::Core;

IngestionRun::IngestionRun(const Config& config, Collaborators collaborators)
    : config_(config),
      content_pool_(static_cast<std::size_t>(config.content_threads)),
      transport_pool_(static_cast<std::size_t>(config.max_concurrent_targets)) {
    init_collaborators(collaborators);
    init_components(collaborators);
}

IngestionRun::~IngestionRun() {
    cancel_.cancel();
    transport_pool_.join();
    content_pool_.join();
}

void IngestionRun::init_collaborators(Collaborators& collaborators) {
    if (collaborators.primary) {
        primary_ = collaborators.primary;
    }
    else {
        auto client = std::make_unique<Network::Http::BeastClient>(ioc_);
        client->set_proxy(config_.tor_socks_proxy);
        client->set_connect_timeout(std::chrono::milliseconds(config_.connect_timeout_ms));
        primary_       = client.get();
        owned_primary_ = std::move(client);
    }

    if (config_.fallback_transport_enabled) {
        if (collaborators.fallback) {
            fallback_ = collaborators.fallback;
        }
        else {
            auto client = std::make_unique<Network::Http::CurlClient>(transport_pool_);
            client->set_proxy(config_.i2p_http_proxy);
            client->set_connect_timeout(std::chrono::milliseconds(config_.connect_timeout_ms));
            fallback_       = client.get();
            owned_fallback_ = std::move(client);
        }
    }

    if (collaborators.control) {
        control_ = collaborators.control;
    }
    else {
        owned_control_ = std::make_unique<Network::Tor::TorControlClient>(
            config_.tor_control_host,
            config_.tor_control_port,
            config_.tor_control_password,
            std::chrono::milliseconds(config_.control_timeout_ms));
        control_ = owned_control_.get();
    }

    if (collaborators.processor) {
        processor_ = collaborators.processor;
    }
    else {
        owned_processor_ = std::make_unique<Pipeline::HtmlContentProcessor>(
            Pipeline::TextChunker(config_.chunk_size, config_.chunk_overlap));
        processor_ = owned_processor_.get();
    }

    if (collaborators.store) {
        store_ = collaborators.store;
    }
    else {
        owned_store_ = std::make_unique<Storage::DiskDocumentStore>(config_.output_dir);
        store_       = owned_store_.get();
    }

    if (collaborators.anomalies) {
        anomalies_ = collaborators.anomalies;
    }
    else if (!config_.anomaly_log.empty()) {
        owned_anomalies_ = std::make_unique<Anomaly::JsonlAnomalySink>(config_.anomaly_log);
        anomalies_       = owned_anomalies_.get();
    }
    else {
        owned_anomalies_ = std::make_unique<Anomaly::LogAnomalySink>();
        anomalies_       = owned_anomalies_.get();
    }
}

void IngestionRun::init_components(const Collaborators& collaborators) {
    fingerprints_ = std::make_unique<Identity::FingerprintGenerator>(
        std::chrono::milliseconds(config_.max_timing_jitter_ms));

    Circuit::CircuitConfig circuit_config{
        .max_requests_per_circuit     = config_.max_requests_per_circuit,
        .min_circuit_lifespan_seconds = config_.min_circuit_lifespan_seconds,
        .random_rotation_probability  = config_.random_rotation_probability,
        .random_rotation_enabled      = config_.random_rotation_enabled,
        .hops                         = config_.circuit_hops};
    circuits_ = std::make_unique<Circuit::CircuitManager>(
        circuit_config, *control_, collaborators.clock, collaborators.random);

    router_ = std::make_unique<Transport::TransportRouter>(
        *primary_,
        fallback_,
        *circuits_,
        Transport::TransportSettings{
            .min_content_length = static_cast<std::size_t>(config_.min_content_length),
            .max_body_size      = static_cast<std::size_t>(config_.max_body_size_bytes)});

    policy_ = std::make_unique<Retry::RetryPolicy>(
        Retry::RetryConfig{.max_retries                = config_.max_retries,
                           .backoff_factor             = config_.backoff_factor,
                           .backoff_base_seconds       = config_.backoff_base_seconds,
                           .escalation_retry_threshold = config_.escalation_retry_threshold,
                           .fallback_enabled           = fallback_ != nullptr},
        *circuits_);

    ingestion_ =
        std::make_unique<IngestionCoordinator>(*processor_, *store_, *anomalies_, &content_pool_);

    orchestrator_ = std::make_unique<FetchOrchestrator>(
        *fingerprints_,
        *router_,
        *policy_,
        *circuits_,
        *ingestion_,
        *anomalies_,
        OrchestratorSettings{
            .request_timeout  = std::chrono::seconds(config_.request_timeout_seconds),
            .fallback_timeout = std::chrono::seconds(config_.fallback_timeout_seconds),
            .slow_attempt     = std::chrono::seconds(config_.slow_attempt_seconds)});
}

void IngestionRun::init_signals() {
    if (!config_.handle_signals)
        return;
    signals_.add(SIGINT);
    signals_.add(SIGTERM);
    signals_.async_wait([this](const boost::system::error_code& error, int signal_number) {
        if (!error) {
            Logger::info("Signal " + std::to_string(signal_number)
                         + " received. Cancelling run...");
            cancel_.cancel();
        }
    });
}

void IngestionRun::init_deadline() {
    if (config_.run_deadline_seconds <= 0)
        return;
    auto deadline = std::chrono::milliseconds(
        static_cast<long long>(std::llround(config_.run_deadline_seconds * 1000.0)));
    deadline_.expires_after(deadline);
    deadline_.async_wait([this](const boost::system::error_code& error) {
        if (!error) {
            Logger::warn("Run deadline reached. Cancelling run...");
            cancel_.cancel();
        }
    });
}

void IngestionRun::finish() {
    boost::system::error_code ec;
    signals_.cancel(ec);
    if (ec)
        Logger::debug("Signal set cancel: " + ec.message());
    deadline_.cancel();
}

void IngestionRun::cancel() {
    net::post(ioc_, [this] { cancel_.cancel(); });
}

void IngestionRun::record(TargetOutcome outcome) {
    report_->summary.record(outcome);
    report_->outcomes.push_back(std::move(outcome));
}

void IngestionRun::enqueue(const std::vector<std::string>& raw_targets) {
    std::unordered_set<std::string> seen;
    for (const auto& raw : raw_targets) {
        Target::Target target = Target::Target::from_raw(raw);
        if (target.valid && !seen.insert(target.content_address).second) {
            Logger::info("[" + target.short_id() + "] Duplicate in input, skipping");
            TargetOutcome duplicate;
            duplicate.kind            = OutcomeKind::SkippedAlreadyIngested;
            duplicate.content_address = target.content_address;
            record(std::move(duplicate));
            continue;
        }
        queue_.push_back(std::move(target));
    }
}

net::awaitable<void> IngestionRun::start() {
    if (config_.require_control_channel) {
        Logger::info("Probing overlay control channel...");
        if (!co_await control_->probe())
            throw FatalRunError("Overlay control channel unreachable at startup");
    }

    std::size_t workers =
        std::min(queue_.size(), static_cast<std::size_t>(config_.max_concurrent_targets));
    if (workers == 0) {
        finish();
        co_return;
    }

    Logger::info("Processing " + std::to_string(queue_.size()) + " targets with "
                 + std::to_string(workers) + " workers");
    active_workers_ = static_cast<int>(workers);
    for (std::size_t i = 0; i < workers; ++i) {
        net::co_spawn(ioc_, worker_loop(), [this](std::exception_ptr error) {
            if (error) {
                try {
                    std::rethrow_exception(error);
                } catch (const std::exception& e) {
                    Logger::error("Worker Loop Exception: " + std::string(e.what()));
                    if (!report_->fatal) {
                        report_->fatal       = true;
                        report_->fatal_error = e.what();
                    }
                    cancel_.cancel();
                }
            }
            if (--active_workers_ == 0)
                finish();
        });
    }
    co_return;
}

net::awaitable<void> IngestionRun::worker_loop() {
    while (!queue_.empty()) {
        Target::Target target = std::move(queue_.front());
        queue_.pop_front();
        record(co_await orchestrator_->run(target, cancel_));
    }
    co_return;
}

RunReport IngestionRun::execute(const std::vector<std::string>& raw_targets) {
    if (executed_)
        throw std::logic_error("IngestionRun::execute called twice");
    executed_ = true;

    RunReport report{RunSummary(static_cast<std::size_t>(config_.max_reported_failures))};
    report_ = &report;
    report.summary.set_targets_total(raw_targets.size());

    enqueue(raw_targets);
    init_signals();
    init_deadline();

    net::co_spawn(ioc_, start(), [this](std::exception_ptr error) {
        if (!error)
            return;
        try {
            std::rethrow_exception(error);
        } catch (const FatalRunError& e) {
            Logger::error("Fatal: " + std::string(e.what()));
            report_->fatal       = true;
            report_->fatal_error = e.what();
        } catch (const std::exception& e) {
            Logger::error("Fatal: " + std::string(e.what()));
            report_->fatal       = true;
            report_->fatal_error = e.what();
        }
        finish();
    });

    ioc_.run();

    report.summary.set_rotations(circuits_->stats().rotations);
    if (cancel_.cancelled())
        report.summary.mark_cancelled();
    report_ = nullptr;
    report.summary.log();
    return report;
}

}  // namespace Engine
}  // namespace Umbra

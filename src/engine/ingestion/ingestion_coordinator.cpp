#include "ingestion_coordinator.hpp"
#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>
#include "../../core/errors/errors.hpp"
#include "../../core/logger/logger.hpp"

namespace Umbra {
namespace Engine {

namespace net = boost::asio;
using namespace Umbra::Core;

namespace {
constexpr int STORE_ATTEMPTS = 2;
}  // namespace

IngestionCoordinator::IngestionCoordinator(Pipeline::ContentProcessor& processor,
                                           Storage::DocumentStore&     store,
                                           Anomaly::AnomalySink&       anomalies,
                                           net::thread_pool*           content_pool)
    : processor_(processor), store_(store), anomalies_(anomalies), content_pool_(content_pool) {
}

bool IngestionCoordinator::claim(const std::string& content_address) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ingested_.count(content_address) || in_flight_.count(content_address))
        return false;
    in_flight_.insert(content_address);
    return true;
}

void IngestionCoordinator::commit(const std::string& content_address) {
    std::lock_guard<std::mutex> lock(mutex_);
    in_flight_.erase(content_address);
    ingested_.insert(content_address);
}

void IngestionCoordinator::release(const std::string& content_address) {
    std::lock_guard<std::mutex> lock(mutex_);
    in_flight_.erase(content_address);
}

bool IngestionCoordinator::store_contains(const std::string& content_address) {
    try {
        return store_.contains(content_address);
    } catch (const StorageError& e) {
        Logger::warn("Dedup lookup failed, assuming not ingested: " + std::string(e.what()));
        return false;
    }
}

bool IngestionCoordinator::is_ingested(const std::string& content_address) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (ingested_.count(content_address))
            return true;
    }
    if (!store_contains(content_address))
        return false;

    std::lock_guard<std::mutex> lock(mutex_);
    ingested_.insert(content_address);
    return true;
}

IngestResult IngestionCoordinator::run_pipeline(const Target::Target&         target,
                                                const Transport::RawDocument& document) {
    Pipeline::ProcessedDocument processed;
    try {
        processed = processor_.process(document, target.content_address);
    } catch (const std::exception& e) {
        Logger::error("[" + target.short_id() + "] Content processing failed: " + e.what());
        return {IngestStatus::EmptyContent, 0, e.what()};
    }

    if (processed.text_length == 0 || processed.chunks.empty()) {
        Logger::warn("[" + target.short_id() + "] No text content found");
        return {IngestStatus::EmptyContent, 0, "no extractable text"};
    }

    std::string last_error;
    for (int attempt = 1; attempt <= STORE_ATTEMPTS; ++attempt) {
        try {
            store_.store(processed.chunks, target.content_address);
            return {IngestStatus::Stored, processed.chunks.size(), ""};
        } catch (const StorageError& e) {
            last_error = e.what();
            Logger::warn("[" + target.short_id() + "] Store attempt " + std::to_string(attempt)
                         + " failed: " + last_error);
        }
    }

    anomalies_.report("storage_failure",
                      {{"target", target.short_id()},
                       {"chunks", std::to_string(processed.chunks.size())},
                       {"error", Logger::redact(last_error)}});
    return {IngestStatus::StorageFailed, 0, last_error};
}

net::awaitable<IngestResult> IngestionCoordinator::ingest(const Target::Target&         target,
                                                          const Transport::RawDocument& document) {
    const std::string& address = target.content_address;
    if (!claim(address)) {
        co_return IngestResult{IngestStatus::AlreadyIngested, 0, ""};
    }
    if (store_contains(address)) {
        commit(address);
        co_return IngestResult{IngestStatus::AlreadyIngested, 0, ""};
    }

    IngestResult result;
    try {
        if (content_pool_) {
            result = co_await net::co_spawn(
                *content_pool_,
                [this, &target, &document]() -> net::awaitable<IngestResult> {
                    co_return run_pipeline(target, document);
                },
                net::use_awaitable);
        }
        else {
            result = run_pipeline(target, document);
        }
    } catch (const std::exception&) {
        release(address);
        throw;
    }

    if (result.status == IngestStatus::Stored) {
        commit(address);
        chunks_ingested_ += result.chunks;
        Logger::success("[" + target.short_id() + "] Ingested " + std::to_string(result.chunks)
                        + " chunks");
    }
    else {
        release(address);
    }
    co_return result;
}

}  // namespace Engine
}  // namespace Umbra

#pragma once
#include <atomic>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/thread_pool.hpp>
#include <mutex>
#include <string>
#include <unordered_set>
#include "../../anomaly/anomaly_sink.hpp"
#include "../../pipeline/content_processor.hpp"
#include "../../storage/document_store.hpp"
#include "../../target/target.hpp"
#include "../../transport/transport_router.hpp"

namespace Umbra {
namespace Engine {

enum class IngestStatus { Stored, AlreadyIngested, EmptyContent, StorageFailed };

struct IngestResult {
    IngestStatus status = IngestStatus::Stored;
    std::size_t  chunks = 0;
    std::string  error;
};

// An address is claimed before pipeline work, committed once stored and
// released otherwise.
class IngestionCoordinator {
public:
    // Content work runs on `content_pool` when given, inline otherwise.
    IngestionCoordinator(Pipeline::ContentProcessor& processor,
                         Storage::DocumentStore&     store,
                         Anomaly::AnomalySink&       anomalies,
                         boost::asio::thread_pool*   content_pool = nullptr);

    bool is_ingested(const std::string& content_address);

    boost::asio::awaitable<IngestResult> ingest(const Target::Target&         target,
                                                const Transport::RawDocument& document);

    std::size_t chunks_ingested() const {
        return chunks_ingested_.load();
    }

private:
    Pipeline::ContentProcessor& processor_;
    Storage::DocumentStore&     store_;
    Anomaly::AnomalySink&       anomalies_;
    boost::asio::thread_pool*   content_pool_;

    std::mutex                      mutex_;
    std::unordered_set<std::string> ingested_;
    std::unordered_set<std::string> in_flight_;
    std::atomic<std::size_t>        chunks_ingested_{0};

    bool claim(const std::string& content_address);
    void commit(const std::string& content_address);
    void release(const std::string& content_address);

    bool         store_contains(const std::string& content_address);
    IngestResult run_pipeline(const Target::Target& target, const Transport::RawDocument& document);
};

}  // namespace Engine
}  // namespace Umbra

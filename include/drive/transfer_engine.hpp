#pragma once

#include "drive/chunk_planner.hpp"
#include "drive/config.hpp"
#include "drive/delete_ledger.hpp"
#include "drive/download_streamer.hpp"
#include "drive/local_staging.hpp"
#include "drive/metadata_store.hpp"
#include "drive/provider_registry.hpp"
#include "drive/transfer_limiter.hpp"
#include "drive/upload_session_manager.hpp"
#include "tg/rate_limiter.hpp"

#include <chrono>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace tgdrive {

/// Configuration for TransferEngine
struct TransferEngineConfig {
    int64_t chunk_size{kDefaultChunkSize};
    std::filesystem::path staging_dir;
    RuntimeSettings settings;
    std::chrono::hours session_ttl{24};
    std::chrono::minutes delete_retry_interval{10};
    RetryPolicy send_retry{.max_attempts = 6, .backoff_step = std::chrono::milliseconds(500)};
    RetryPolicy delete_retry{.max_attempts = 5, .backoff_step = std::chrono::milliseconds(300)};
    DownloadStreamerConfig downloads;
    std::chrono::milliseconds sweep_request_interval{500};  // Spacing of delete-retry requests

    /// Derive engine settings from the application configuration
    static TransferEngineConfig from_drive_config(const DriveConfig& config);
};

/// Result of deleting one chunk message
struct ChunkDeleteOutcome {
    std::string item_id;
    std::string item_path;
    int chunk_index{0};
    std::string chat_id;
    int64_t message_id{0};
    bool deleted{false};       // Removed now or already gone
    bool already_gone{false};
    int attempts{0};
    std::string error;         // Set when the failure went to the ledger
};

/// Result of deleting an item and its descendants
struct DeleteItemResult {
    std::string item_id;
    int items_removed{0};
    int attempted{0};
    int deleted{0};
    int failed{0};
    std::vector<ChunkDeleteOutcome> outcomes;
};

/// Entry points used by request handlers
///
/// Wires the planner, session manager, streamer, limiter and ledger around
/// one metadata store and one provider registry.
class TransferEngine {
public:
    using Config = TransferEngineConfig;

    TransferEngine(MetadataStore& store, ProviderRegistry& registry, Config config);

    // Disable copy
    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    /// Plan the upload for the active provider and open a session
    UploadStart start_upload(
        const std::string& file_name,
        const std::string& mime_type,
        int64_t size,
        const std::optional<std::string>& parent_id = std::nullopt
    );

    /// Send one chunk while holding an upload slot
    ChunkResult upload_chunk(const std::string& session_id, int chunk_index, std::istream& data, std::stop_token stop = {});

    CompleteResult complete_upload(const std::string& session_id, std::stop_token stop = {});

    ResumeState resume_upload(const std::string& item_id);

    void cancel_upload(const std::string& session_id);

    std::unique_ptr<DownloadStream> open_download(
        const std::string& item_id,
        const std::optional<ByteRange>& range = std::nullopt,
        std::stop_token stop = {}
    );

    /// Validate and activate a new provider configuration
    /// @throws ProviderValidationException, leaving the active provider in place
    ProviderHandle swap_provider(const ProviderConfig& candidate, std::stop_token stop = {});

    /// Delete the provider messages of an item and its descendants, then the items
    ///
    /// Failed message deletes are handed to the ledger and never fail the call.
    DeleteItemResult delete_item_chunks(const std::string& item_id, std::stop_token stop = {});

    /// Background sweeps
    std::vector<UploadSession> reap_sessions(Timestamp now);
    DeleteRetrySummary retry_failed_deletes(Timestamp now, std::stop_token stop = {});

    /// Apply new concurrency limits and disk reserve
    void apply_settings(const RuntimeSettings& settings);

    [[nodiscard]] MetadataStore& store() { return store_; }
    [[nodiscard]] ProviderRegistry& registry() { return registry_; }
    [[nodiscard]] TransferLimiter& limiter() { return limiter_; }
    [[nodiscard]] DeleteLedger& ledger() { return ledger_; }
    [[nodiscard]] const ChunkPlanner& planner() const { return planner_; }
    [[nodiscard]] const Config& get_config() const { return config_; }

private:
    MetadataStore& store_;
    ProviderRegistry& registry_;
    Config config_;

    ChunkPlanner planner_;
    TransferLimiter limiter_;
    LocalStaging staging_;
    DeleteLedger ledger_;
    UploadSessionManager sessions_;
    DownloadStreamer downloads_;
    tg::RateLimiter sweep_limiter_;
};

}  // namespace tgdrive

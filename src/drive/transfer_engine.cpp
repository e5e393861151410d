#include "drive/transfer_engine.hpp"

#include "drive/errors.hpp"

#include <spdlog/spdlog.h>

namespace tgdrive {

TransferEngineConfig TransferEngineConfig::from_drive_config(const DriveConfig& config) {
    TransferEngineConfig result;
    result.chunk_size = config.chunk_size_bytes;
    result.staging_dir = config.resolved_staging_dir();
    result.settings = config.runtime_settings();
    result.session_ttl = std::chrono::hours(config.upload_session_ttl_hours);
    result.delete_retry_interval = std::chrono::minutes(config.delete_retry_interval_minutes);
    return result;
}

TransferEngine::TransferEngine(MetadataStore& store, ProviderRegistry& registry, Config config)
    : store_(store),
      registry_(registry),
      config_(std::move(config)),
      planner_(ChunkPlanner::Config{.chunk_size = config_.chunk_size}),
      limiter_(
          TransferLimiter::Config{
              .max_uploads = config_.settings.upload_concurrency,
              .max_downloads = config_.settings.download_concurrency,
          }
      ),
      staging_(
          LocalStaging::Config{
              .root = config_.staging_dir,
              .reserved_disk_bytes = config_.settings.reserved_disk_bytes,
          }
      ),
      ledger_(store_, DeleteLedger::Config{.retry_interval = config_.delete_retry_interval}),
      sessions_(
          store_,
          registry_,
          staging_,
          ledger_,
          UploadSessionManager::Config{
              .session_ttl = config_.session_ttl,
              .send_retry = config_.send_retry,
              .cleanup_delete_retry = config_.delete_retry,
          }
      ),
      downloads_(store_, registry_, limiter_, config_.downloads),
      sweep_limiter_(tg::RateLimiter::Config{.min_interval = config_.sweep_request_interval}) {}

//------------------------------------------------------------------------------
// Uploads
//------------------------------------------------------------------------------

UploadStart TransferEngine::start_upload(
    const std::string& file_name,
    const std::string& mime_type,
    int64_t size,
    const std::optional<std::string>& parent_id
) {
    auto mode = registry_.current().config.mode;
    auto plan = planner_.plan(file_name, mime_type, size, mode);
    return sessions_.start(file_name, mime_type, parent_id, plan);
}

ChunkResult TransferEngine::upload_chunk(
    const std::string& session_id,
    int chunk_index,
    std::istream& data,
    std::stop_token stop
) {
    return sessions_.accept_chunk(session_id, chunk_index, data, stop, &limiter_);
}

CompleteResult TransferEngine::complete_upload(const std::string& session_id, std::stop_token stop) {
    auto session = store_.get_session(session_id);
    if (!session) {
        throw SessionNotFoundException(session_id);
    }

    // Only merged uploads send anything on completion
    TransferSlot slot;
    if (session->staging == StagingStrategy::LOCAL_MERGE) {
        slot = TransferSlot(limiter_, TransferKind::UPLOAD);
    }
    return sessions_.complete(session_id, stop);
}

ResumeState TransferEngine::resume_upload(const std::string& item_id) { return sessions_.resume(item_id); }

void TransferEngine::cancel_upload(const std::string& session_id) { sessions_.cancel(session_id); }

//------------------------------------------------------------------------------
// Downloads
//------------------------------------------------------------------------------

std::unique_ptr<DownloadStream> TransferEngine::open_download(
    const std::string& item_id,
    const std::optional<ByteRange>& range,
    std::stop_token stop
) {
    return downloads_.open(item_id, range, std::move(stop));
}

//------------------------------------------------------------------------------
// Provider
//------------------------------------------------------------------------------

ProviderHandle TransferEngine::swap_provider(const ProviderConfig& candidate, std::stop_token stop) {
    auto handle = registry_.swap(candidate, std::move(stop));
    // Paths are keyed by generation, entries of the old provider are dead weight
    downloads_.path_cache().clear();
    return handle;
}

//------------------------------------------------------------------------------
// Deletion
//------------------------------------------------------------------------------

DeleteItemResult TransferEngine::delete_item_chunks(const std::string& item_id, std::stop_token stop) {
    auto item = store_.get_item(item_id);
    if (!item) {
        throw ItemNotFoundException(item_id);
    }

    DeleteItemResult result;
    result.item_id = item_id;

    auto chunks = store_.list_chunks_in_tree(*item);
    auto sessions = store_.list_sessions_in_tree(*item);

    for (const auto& owned : chunks) {
        const auto& chunk = owned.chunk;
        auto provider = registry_.current();

        auto attempt = ledger_.delete_or_record(
            *provider, chunk.chat_id, chunk.message_id, chunk.item_id, owned.item_path, config_.delete_retry, stop
        );

        ChunkDeleteOutcome outcome;
        outcome.item_id = chunk.item_id;
        outcome.item_path = owned.item_path;
        outcome.chunk_index = chunk.chunk_index;
        outcome.chat_id = chunk.chat_id;
        outcome.message_id = chunk.message_id;
        outcome.deleted = attempt.ok;
        outcome.already_gone = attempt.ok && attempt.status == tg::DeleteStatus::ALREADY_GONE;
        outcome.attempts = attempt.attempts;
        outcome.error = attempt.error;

        ++result.attempted;
        if (attempt.ok) {
            ++result.deleted;
        } else {
            ++result.failed;
        }
        result.outcomes.push_back(std::move(outcome));
    }

    result.items_removed = store_.delete_item_tree(*item);
    for (const auto& session : sessions) {
        staging_.remove_session(session.id);
    }

    spdlog::info(
        "TransferEngine: deleted {} ({} item(s), {} message(s) deleted, {} handed to the ledger)",
        item->path,
        result.items_removed,
        result.deleted,
        result.failed
    );
    return result;
}

//------------------------------------------------------------------------------
// Maintenance
//------------------------------------------------------------------------------

std::vector<UploadSession> TransferEngine::reap_sessions(Timestamp now) { return sessions_.reap(now); }

DeleteRetrySummary TransferEngine::retry_failed_deletes(Timestamp now, std::stop_token stop) {
    return ledger_.retry_pending(registry_, sweep_limiter_, now, std::move(stop));
}

void TransferEngine::apply_settings(const RuntimeSettings& settings) {
    limiter_.set_limits(settings.upload_concurrency, settings.download_concurrency);
    staging_.set_reserved_disk_bytes(settings.reserved_disk_bytes);
    config_.settings = settings;
}

}  // namespace tgdrive

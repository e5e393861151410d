#pragma once

#include "drive/chunk_planner.hpp"
#include "drive/delete_ledger.hpp"
#include "drive/local_staging.hpp"
#include "drive/metadata_store.hpp"
#include "drive/provider_registry.hpp"
#include "drive/transfer_limiter.hpp"
#include "drive/types.hpp"

#include <chrono>
#include <istream>
#include <optional>
#include <stop_token>
#include <string>
#include <variant>
#include <vector>

namespace tgdrive {

/// Configuration for UploadSessionManager
struct UploadSessionManagerConfig {
    std::chrono::hours session_ttl{24};
    RetryPolicy send_retry{.max_attempts = 6, .backoff_step = std::chrono::milliseconds(500)};
    RetryPolicy cleanup_delete_retry{.max_attempts = 5, .backoff_step = std::chrono::milliseconds(300)};
};

/// A freshly started upload
struct UploadStart {
    Item item;
    UploadSession session;
    UploadPlan plan;
    int next_chunk_index{0};
};

/// A chunk the session has accepted
struct ChunkAccepted {
    int chunk_index{0};
    int64_t chunk_size{0};
    int received_chunks{0};
    int total_chunks{0};
    bool replayed{false};          // Index was already recorded, nothing was sent
    std::optional<Chunk> chunk;    // Provider mapping (empty while staged locally)

    int next_chunk_index() const { return received_chunks; }
    bool complete() const { return received_chunks == total_chunks; }
};

using ChunkResult = std::variant<ChunkAccepted, tg::RetryAfter>;
using CompleteResult = std::variant<Item, tg::RetryAfter>;

/// Progress of an open session, for reconnecting clients
struct ResumeState {
    UploadSession session;
    std::vector<int> received;
    int next_chunk_index{0};
};

/// Resumable upload state machine
///
/// Sessions move pending -> uploading -> completed, or to failed/expired.
/// Chunks must arrive in index order; resubmitting a recorded index is a
/// no-op that reports the earlier success. Direct sessions send each chunk
/// as its own provider message. Local-merge sessions stage chunks on disk
/// and send the reassembled file once on completion.
class UploadSessionManager {
public:
    using Config = UploadSessionManagerConfig;

    UploadSessionManager(
        MetadataStore& store,
        ProviderRegistry& registry,
        LocalStaging& staging,
        DeleteLedger& ledger,
        Config config = {}
    );

    // Disable copy
    UploadSessionManager(const UploadSessionManager&) = delete;
    UploadSessionManager& operator=(const UploadSessionManager&) = delete;

    /// Create the placeholder item and its session
    /// @throws AlreadyInProgressException if a same-named item is still uploading
    /// @throws InsufficientDiskSpaceException when staging would eat into the disk reserve
    UploadStart start(
        const std::string& file_name,
        const std::string& mime_type,
        const std::optional<std::string>& parent_id,
        const UploadPlan& plan
    );

    /// Accept the bytes of one chunk
    /// @return ChunkAccepted, or RetryAfter when the provider rate-limited the send
    /// @throws InvalidChunkIndexException, ChunkSizeMismatchException for bad input
    /// @throws UploadChunkException when the provider failed (resumable() tells whether the session survived)
    /// @throws TooManyConcurrentTransfersException when `slots` has no free upload slot for new bytes
    ///
    /// A replayed index never takes a slot from `slots`.
    ChunkResult accept_chunk(
        const std::string& session_id,
        int chunk_index,
        std::istream& data,
        std::stop_token stop = {},
        TransferLimiter* slots = nullptr
    );

    /// Verify every chunk is present, finalize the item and drop the session
    /// @throws IncompleteUploadException listing the missing indices
    CompleteResult complete(const std::string& session_id, std::stop_token stop = {});

    /// Recorded progress of the item's open session
    /// @throws SessionNotFoundException if the item has no open session
    ResumeState resume(const std::string& item_id);

    /// Drop sessions untouched for longer than the TTL
    /// Their items stay behind, incomplete.
    std::vector<UploadSession> reap(Timestamp now);

    /// Abandon a session; chunks already sent stay with the item
    void cancel(const std::string& session_id);

    [[nodiscard]] const Config& get_config() const { return config_; }

private:
    UploadSession load_session(const std::string& session_id);

    /// Indices accepted so far, ascending
    std::vector<int> received_indices(const UploadSession& session);

    ChunkResult accept_direct(
        const UploadSession& session,
        int chunk_index,
        std::istream& data,
        std::stop_token stop,
        TransferLimiter* slots
    );
    ChunkResult accept_staged(const UploadSession& session, int chunk_index, std::istream& data, TransferLimiter* slots);

    CompleteResult complete_direct(const UploadSession& session);
    CompleteResult complete_staged(const UploadSession& session, std::stop_token stop);

    /// Send one message with the network retry policy
    /// @throws UploadChunkException on cancellation, exhausted retries or provider rejection
    template <typename Send>
    tg::ApiResult<tg::Message> send_with_retry(const UploadSession& session, int chunk_index, Send&& send, std::stop_token stop);

    /// Make sure the sent message carries a file reference, forwarding it if needed
    tg::PrimaryFile require_file(
        const ProviderHandle& provider,
        const UploadSession& session,
        int chunk_index,
        const tg::Message& message,
        std::stop_token stop
    );

    void mark_failed(const UploadSession& session, const std::string& reason);

    /// Delete a message the store did not take ownership of
    void discard_message(const ProviderHandle& provider, const UploadSession& session, int64_t message_id);

    MetadataStore& store_;
    ProviderRegistry& registry_;
    LocalStaging& staging_;
    DeleteLedger& ledger_;
    Config config_;
};

}  // namespace tgdrive

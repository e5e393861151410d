#pragma once

#include "tg/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace tgdrive {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

// Defaults
inline constexpr int64_t kDefaultChunkSize = 20LL * 1024 * 1024;             // 20 MiB
inline constexpr int64_t kDefaultReservedDiskBytes = 2LL * 1024 * 1024 * 1024;  // 2 GiB

// Enumerations
enum class ItemType { FILE, FOLDER };

enum class ProviderMode {
    OFFICIAL,    // api.telegram.org, multipart uploads only
    SELF_HOSTED  // Local Bot API server, accepts file:// references
};

enum class SessionStatus { PENDING, UPLOADING, COMPLETED, FAILED, EXPIRED };

enum class StagingStrategy {
    DIRECT,      // Each chunk becomes one provider message
    LOCAL_MERGE  // Chunks are staged on disk and sent as one message on completion
};

enum class TransferKind { UPLOAD, DOWNLOAD };

// Data structures
struct Item {
    std::string id;
    ItemType type{ItemType::FILE};
    std::string name;
    std::optional<std::string> parent_id;
    std::string path;  // "/parent/name", derived from the parent chain
    int64_t size{0};
    std::optional<std::string> mime_type;
    Timestamp created_at;
    Timestamp updated_at;

    bool is_folder() const { return type == ItemType::FOLDER; }
};

/// One piece of a file stored as one provider message
struct Chunk {
    std::string item_id;
    int chunk_index{0};
    int64_t chunk_size{0};
    std::string chat_id;
    int64_t message_id{0};
    std::string file_id;
    std::string file_unique_id;
    std::optional<std::string> content_hash;
    Timestamp created_at;
};

/// Chunk together with the path of the item owning it
struct OwnedChunk {
    Chunk chunk;
    std::string item_path;
};

struct UploadSession {
    std::string id;
    std::string item_id;
    std::string file_name;
    std::string mime_type;
    int64_t file_size{0};
    int64_t chunk_size{0};
    int total_chunks{0};
    StagingStrategy staging{StagingStrategy::DIRECT};
    SessionStatus status{SessionStatus::PENDING};
    Timestamp created_at;
    Timestamp updated_at;

    /// Byte size expected for a chunk index (the last chunk may be shorter)
    int64_t chunk_size_for_index(int index) const;
};

struct DeleteFailureRecord {
    int64_t id{0};
    std::optional<std::string> item_id;
    std::string item_path;
    std::string chat_id;
    int64_t message_id{0};
    std::string error_message;
    int retry_count{0};
    bool resolved{false};
    Timestamp failed_at;
    std::optional<Timestamp> last_retry_at;
    std::optional<Timestamp> resolved_at;
};

/// Active provider endpoint
struct ProviderConfig {
    std::string bot_token;
    std::string api_base_url{tg::kDefaultApiBaseUrl};
    ProviderMode mode{ProviderMode::OFFICIAL};
    std::string storage_chat_id;
};

/// Bounded retry with linear back-off (attempt n waits n * backoff_step)
struct RetryPolicy {
    int max_attempts{1};
    std::chrono::milliseconds backoff_step{0};
    std::chrono::seconds max_retry_after{60};  // Longer provider back-off requests are not waited out

    std::chrono::milliseconds backoff_for(int attempt) const { return backoff_step * attempt; }
};

/// Inclusive byte range
struct ByteRange {
    int64_t start{0};
    int64_t end{0};

    int64_t length() const { return end - start + 1; }
};

// Utility functions
std::string to_string(ItemType type);
std::string to_string(ProviderMode mode);
std::string to_string(SessionStatus status);
std::string to_string(StagingStrategy staging);
std::string to_string(TransferKind kind);

ItemType item_type_from_string(std::string_view value);
ProviderMode provider_mode_from_string(std::string_view value);
SessionStatus session_status_from_string(std::string_view value);
StagingStrategy staging_from_string(std::string_view value);

/// Random RFC 4122 version 4 identifier
std::string generate_id();

/// Sleep unless the stop token fires first
/// @return false if interrupted
bool interruptible_sleep(std::chrono::milliseconds duration, std::stop_token stop);

int64_t to_unix_millis(Timestamp time);
Timestamp from_unix_millis(int64_t millis);

}  // namespace tgdrive

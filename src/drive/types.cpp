#include "drive/types.hpp"

#include "drive/errors.hpp"

#include <fmt/format.h>

#include <condition_variable>
#include <mutex>
#include <random>

namespace tgdrive {

int64_t UploadSession::chunk_size_for_index(int index) const {
    if (index < 0 || index >= total_chunks) {
        return 0;
    }
    if (index == total_chunks - 1) {
        return file_size - static_cast<int64_t>(index) * chunk_size;
    }
    return chunk_size;
}

std::string to_string(ItemType type) { return type == ItemType::FOLDER ? "folder" : "file"; }

std::string to_string(ProviderMode mode) { return mode == ProviderMode::SELF_HOSTED ? "self_hosted" : "official"; }

std::string to_string(SessionStatus status) {
    switch (status) {
        case SessionStatus::PENDING:
            return "pending";
        case SessionStatus::UPLOADING:
            return "uploading";
        case SessionStatus::COMPLETED:
            return "completed";
        case SessionStatus::FAILED:
            return "failed";
        case SessionStatus::EXPIRED:
            return "expired";
        default:
            return "unknown";
    }
}

std::string to_string(StagingStrategy staging) {
    return staging == StagingStrategy::LOCAL_MERGE ? "local_merge" : "direct";
}

std::string to_string(TransferKind kind) { return kind == TransferKind::DOWNLOAD ? "download" : "upload"; }

ItemType item_type_from_string(std::string_view value) {
    if (value == "file") return ItemType::FILE;
    if (value == "folder") return ItemType::FOLDER;
    throw ValidationException(fmt::format("unknown item type '{}'", value));
}

ProviderMode provider_mode_from_string(std::string_view value) {
    if (value == "official") return ProviderMode::OFFICIAL;
    if (value == "self_hosted" || value == "self-hosted") return ProviderMode::SELF_HOSTED;
    throw ValidationException(fmt::format("unknown provider mode '{}'", value));
}

SessionStatus session_status_from_string(std::string_view value) {
    if (value == "pending") return SessionStatus::PENDING;
    if (value == "uploading") return SessionStatus::UPLOADING;
    if (value == "completed") return SessionStatus::COMPLETED;
    if (value == "failed") return SessionStatus::FAILED;
    if (value == "expired") return SessionStatus::EXPIRED;
    throw ValidationException(fmt::format("unknown session status '{}'", value));
}

StagingStrategy staging_from_string(std::string_view value) {
    if (value == "direct") return StagingStrategy::DIRECT;
    if (value == "local_merge") return StagingStrategy::LOCAL_MERGE;
    throw ValidationException(fmt::format("unknown staging strategy '{}'", value));
}

std::string generate_id() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    uint64_t hi = rng();
    uint64_t lo = rng();

    // Version 4, variant 10xx
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    return fmt::format(
        "{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
        hi >> 32,
        (hi >> 16) & 0xFFFF,
        hi & 0xFFFF,
        lo >> 48,
        lo & 0xFFFFFFFFFFFFULL
    );
}

bool interruptible_sleep(std::chrono::milliseconds duration, std::stop_token stop) {
    if (duration.count() <= 0) {
        return !stop.stop_requested();
    }

    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lock(mutex);
    cv.wait_for(lock, stop, duration, [] { return false; });
    return !stop.stop_requested();
}

int64_t to_unix_millis(Timestamp time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

Timestamp from_unix_millis(int64_t millis) { return Timestamp(std::chrono::milliseconds(millis)); }

}  // namespace tgdrive

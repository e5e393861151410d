#include "drive/chunk_planner.hpp"

#include "drive/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <filesystem>

namespace tgdrive {

ChunkPlanner::ChunkPlanner(Config config) : config_(config) {}

UploadPlan ChunkPlanner::plan(
    std::string_view file_name,
    std::string_view mime_type,
    int64_t file_size,
    ProviderMode mode
) const {
    auto chunk_size = effective_chunk_size(config_.chunk_size, file_name, mime_type, mode);
    return plan_with_chunk_size(file_name, mime_type, file_size, chunk_size, mode);
}

UploadPlan ChunkPlanner::plan_with_chunk_size(
    std::string_view file_name,
    std::string_view mime_type,
    int64_t file_size,
    int64_t chunk_size,
    ProviderMode mode
) {
    if (file_size <= 0) {
        throw ValidationException(fmt::format("file size must be positive, got {}", file_size));
    }
    if (chunk_size <= 0) {
        throw ValidationException(fmt::format("chunk size must be positive, got {}", chunk_size));
    }

    const bool self_hosted = mode == ProviderMode::SELF_HOSTED;
    if (self_hosted && file_size > tg::kSelfHostedUploadLimit) {
        throw ValidationException(
            fmt::format("file of {} bytes exceeds the {} byte single-message limit", file_size, tg::kSelfHostedUploadLimit)
        );
    }

    UploadPlan plan;
    plan.mode = mode;
    plan.file_size = file_size;
    plan.chunk_size = chunk_size;
    plan.total_chunks = count_chunks(file_size, chunk_size);
    plan.staging = self_hosted ? StagingStrategy::LOCAL_MERGE : StagingStrategy::DIRECT;

    // The provider sees one message per chunk (official) or one merged message
    // (self-hosted). Media kinds only survive when that message fits the kind's ceiling.
    auto kind = tg::select_upload_kind(file_name, mime_type);
    auto message_size = self_hosted ? file_size : std::min(file_size, chunk_size);
    bool single_message = self_hosted || plan.total_chunks == 1;
    if (!single_message || message_size > tg::single_upload_limit(kind, self_hosted)) {
        kind = tg::UploadKind::DOCUMENT;
    }
    plan.kind = kind;

    plan.chunks.reserve(static_cast<size_t>(plan.total_chunks));
    for (int i = 0; i < plan.total_chunks; ++i) {
        ChunkDescriptor chunk;
        chunk.index = i;
        chunk.offset = static_cast<int64_t>(i) * chunk_size;
        chunk.length = std::min(chunk_size, file_size - chunk.offset);
        chunk.kind = kind;
        plan.chunks.push_back(chunk);
    }

    return plan;
}

int64_t effective_chunk_size(int64_t configured, std::string_view file_name, std::string_view mime_type, ProviderMode mode) {
    if (configured <= 0) {
        configured = kDefaultChunkSize;
    }
    if (mode == ProviderMode::SELF_HOSTED) {
        return configured;
    }
    auto kind = tg::select_upload_kind(file_name, mime_type);
    return std::min(configured, tg::single_upload_limit(kind, false));
}

int count_chunks(int64_t file_size, int64_t chunk_size) {
    if (file_size <= 0 || chunk_size <= 0) {
        return 0;
    }
    return static_cast<int>((file_size + chunk_size - 1) / chunk_size);
}

std::string chunk_file_name(std::string_view file_name, std::string_view item_id, int chunk_index, int total_chunks) {
    auto base = std::filesystem::path(std::string(file_name)).filename();
    if (total_chunks <= 1) {
        return base.empty() ? std::string("file") : base.string();
    }

    auto ext = base.extension().string();
    auto stem = base.stem().string();
    if (stem.empty()) {
        stem = "file";
    }
    return fmt::format("{}-{}.part{:05d}{}", stem, item_id.substr(0, 8), chunk_index, ext);
}

}  // namespace tgdrive

#pragma once

#include "drive/types.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tgdrive {

/// One planned chunk: byte window of the source file and the send method
struct ChunkDescriptor {
    int index{0};
    int64_t offset{0};
    int64_t length{0};
    tg::UploadKind kind{tg::UploadKind::DOCUMENT};
};

/// Result of planning an upload
struct UploadPlan {
    ProviderMode mode{ProviderMode::OFFICIAL};
    tg::UploadKind kind{tg::UploadKind::DOCUMENT};  // Kind of the file as a whole
    int64_t file_size{0};
    int64_t chunk_size{0};
    int total_chunks{0};
    StagingStrategy staging{StagingStrategy::DIRECT};
    std::vector<ChunkDescriptor> chunks;
};

/// Configuration for ChunkPlanner
struct ChunkPlannerConfig {
    int64_t chunk_size{kDefaultChunkSize};
};

/// Splits a file into provider-sized chunks
///
/// Planning is pure: the same inputs always give the same plan, so an
/// interrupted upload can be re-planned on resume.
class ChunkPlanner {
public:
    using Config = ChunkPlannerConfig;

    explicit ChunkPlanner(Config config = {});

    /// @throws ValidationException for an empty file or a non-positive chunk size
    [[nodiscard]] UploadPlan plan(
        std::string_view file_name,
        std::string_view mime_type,
        int64_t file_size,
        ProviderMode mode
    ) const;

    /// Plan with an explicit chunk size (used to re-plan a persisted session)
    [[nodiscard]] static UploadPlan plan_with_chunk_size(
        std::string_view file_name,
        std::string_view mime_type,
        int64_t file_size,
        int64_t chunk_size,
        ProviderMode mode
    );

    [[nodiscard]] const Config& get_config() const { return config_; }

private:
    Config config_;
};

/// Chunk size actually used for a file: the configured size, capped by the
/// single-message ceiling of the file's kind on official servers
int64_t effective_chunk_size(int64_t configured, std::string_view file_name, std::string_view mime_type, ProviderMode mode);

/// Number of chunks for a file, ceil(file_size / chunk_size)
int count_chunks(int64_t file_size, int64_t chunk_size);

/// File name of a chunk message: the original name for single-chunk uploads,
/// "<stem>-<itemId8>.partNNNNN<ext>" otherwise
std::string chunk_file_name(std::string_view file_name, std::string_view item_id, int chunk_index, int total_chunks);

}  // namespace tgdrive

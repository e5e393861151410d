#include "drive/chunk_planner.hpp"

#include "drive/errors.hpp"

#include <gtest/gtest.h>

namespace tgdrive {
namespace {

constexpr int64_t kMiB = 1024 * 1024;

// The chunks of a plan must tile [0, size) in index order
void expect_partition(const UploadPlan& plan) {
    ASSERT_EQ(static_cast<int>(plan.chunks.size()), plan.total_chunks);

    int64_t offset = 0;
    for (int i = 0; i < plan.total_chunks; ++i) {
        const auto& chunk = plan.chunks[static_cast<size_t>(i)];
        EXPECT_EQ(chunk.index, i);
        EXPECT_EQ(chunk.offset, offset);
        EXPECT_GT(chunk.length, 0);
        EXPECT_LE(chunk.length, plan.chunk_size);
        if (i + 1 < plan.total_chunks) {
            EXPECT_EQ(chunk.length, plan.chunk_size);
        }
        offset += chunk.length;
    }
    EXPECT_EQ(offset, plan.file_size);
}

TEST(ChunkPlannerTest, ChunksPartitionTheFile) {
    for (int64_t size : {int64_t{1}, int64_t{9}, int64_t{10}, int64_t{11}, int64_t{25}, int64_t{1000}}) {
        auto plan = ChunkPlanner::plan_with_chunk_size("data.bin", "", size, 10, ProviderMode::OFFICIAL);
        SCOPED_TRACE(size);
        expect_partition(plan);
        EXPECT_EQ(plan.total_chunks, count_chunks(size, 10));
    }
}

TEST(ChunkPlannerTest, TwentyFiveBytesInChunksOfTen) {
    auto plan = ChunkPlanner::plan_with_chunk_size("data.bin", "", 25, 10, ProviderMode::OFFICIAL);

    ASSERT_EQ(plan.total_chunks, 3);
    EXPECT_EQ(plan.chunks[0].length, 10);
    EXPECT_EQ(plan.chunks[1].length, 10);
    EXPECT_EQ(plan.chunks[2].offset, 20);
    EXPECT_EQ(plan.chunks[2].length, 5);
    EXPECT_EQ(plan.staging, StagingStrategy::DIRECT);
}

TEST(ChunkPlannerTest, RejectsEmptyFilesAndBadChunkSizes) {
    EXPECT_THROW(ChunkPlanner::plan_with_chunk_size("a", "", 0, 10, ProviderMode::OFFICIAL), ValidationException);
    EXPECT_THROW(ChunkPlanner::plan_with_chunk_size("a", "", -1, 10, ProviderMode::OFFICIAL), ValidationException);
    EXPECT_THROW(ChunkPlanner::plan_with_chunk_size("a", "", 10, 0, ProviderMode::OFFICIAL), ValidationException);
}

TEST(ChunkPlannerTest, OfficialChunkSizeIsCappedByKindLimit) {
    ChunkPlanner planner(ChunkPlanner::Config{.chunk_size = 100 * kMiB});

    auto document = planner.plan("archive.zip", "application/zip", 120 * kMiB, ProviderMode::OFFICIAL);
    EXPECT_EQ(document.chunk_size, tg::kOfficialUploadLimit);
    EXPECT_EQ(document.total_chunks, 3);

    auto photo = planner.plan("big.jpg", "image/jpeg", 15 * kMiB, ProviderMode::OFFICIAL);
    EXPECT_EQ(photo.chunk_size, tg::kOfficialPhotoLimit);
    EXPECT_EQ(photo.total_chunks, 2);
}

TEST(ChunkPlannerTest, MediaKindKeptForSingleChunk) {
    ChunkPlanner planner;

    auto photo = planner.plan("cat.png", "image/png", 2 * kMiB, ProviderMode::OFFICIAL);
    EXPECT_EQ(photo.total_chunks, 1);
    EXPECT_EQ(photo.kind, tg::UploadKind::PHOTO);

    auto video = planner.plan("clip.mp4", "video/mp4", 5 * kMiB, ProviderMode::OFFICIAL);
    EXPECT_EQ(video.kind, tg::UploadKind::VIDEO);
    EXPECT_EQ(video.chunks[0].kind, tg::UploadKind::VIDEO);
}

TEST(ChunkPlannerTest, MultiChunkFilesAreDocuments) {
    ChunkPlanner planner;

    auto video = planner.plan("movie.mkv", "video/x-matroska", 90 * kMiB, ProviderMode::OFFICIAL);
    EXPECT_GT(video.total_chunks, 1);
    EXPECT_EQ(video.kind, tg::UploadKind::DOCUMENT);
    for (const auto& chunk : video.chunks) {
        EXPECT_EQ(chunk.kind, tg::UploadKind::DOCUMENT);
    }
}

TEST(ChunkPlannerTest, SelfHostedStagesLocally) {
    ChunkPlanner planner(ChunkPlanner::Config{.chunk_size = 64 * kMiB});

    auto plan = planner.plan("movie.mp4", "video/mp4", 500 * kMiB, ProviderMode::SELF_HOSTED);
    EXPECT_EQ(plan.staging, StagingStrategy::LOCAL_MERGE);
    EXPECT_EQ(plan.chunk_size, 64 * kMiB);
    EXPECT_EQ(plan.total_chunks, 8);
    EXPECT_EQ(plan.kind, tg::UploadKind::VIDEO);
    expect_partition(plan);
}

TEST(ChunkPlannerTest, SelfHostedPhotoOverLimitBecomesDocument) {
    auto plan = ChunkPlanner::plan_with_chunk_size("huge.png", "image/png", 30 * kMiB, 8 * kMiB, ProviderMode::SELF_HOSTED);
    EXPECT_EQ(plan.kind, tg::UploadKind::DOCUMENT);
}

TEST(ChunkPlannerTest, SelfHostedRejectsFilesOverMessageLimit) {
    EXPECT_THROW(
        ChunkPlanner::plan_with_chunk_size(
            "disk.img", "", tg::kSelfHostedUploadLimit + 1, 64 * kMiB, ProviderMode::SELF_HOSTED
        ),
        ValidationException
    );
}

TEST(ChunkPlannerTest, EffectiveChunkSizeFallsBackToDefault) {
    EXPECT_EQ(effective_chunk_size(0, "a.bin", "", ProviderMode::SELF_HOSTED), kDefaultChunkSize);
    EXPECT_EQ(effective_chunk_size(0, "a.bin", "", ProviderMode::OFFICIAL), kDefaultChunkSize);
}

TEST(ChunkPlannerTest, ChunkFileNames) {
    EXPECT_EQ(chunk_file_name("report.pdf", "0123456789abcdef", 0, 1), "report.pdf");
    EXPECT_EQ(chunk_file_name("movie.mkv", "0123456789abcdef", 3, 10), "movie-01234567.part00003.mkv");
    EXPECT_EQ(chunk_file_name("README", "abcdefgh", 1, 2), "README-abcdefgh.part00001");
    EXPECT_EQ(chunk_file_name("", "abcdefgh", 0, 1), "file");
}

}  // namespace
}  // namespace tgdrive

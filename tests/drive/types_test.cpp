#include "drive/types.hpp"

#include "drive/errors.hpp"

#include <gtest/gtest.h>

#include <set>
#include <thread>

namespace tgdrive {
namespace {

using namespace std::chrono_literals;

TEST(DriveTypesTest, EnumStringsRoundTrip) {
    EXPECT_EQ(session_status_from_string(to_string(SessionStatus::UPLOADING)), SessionStatus::UPLOADING);
    EXPECT_EQ(staging_from_string(to_string(StagingStrategy::LOCAL_MERGE)), StagingStrategy::LOCAL_MERGE);
    EXPECT_EQ(item_type_from_string(to_string(ItemType::FOLDER)), ItemType::FOLDER);
    EXPECT_EQ(provider_mode_from_string("self-hosted"), ProviderMode::SELF_HOSTED);
    EXPECT_EQ(to_string(ProviderMode::SELF_HOSTED), "self_hosted");
}

TEST(DriveTypesTest, UnknownEnumStringsThrow) {
    EXPECT_THROW(session_status_from_string("paused"), ValidationException);
    EXPECT_THROW(provider_mode_from_string("cloud"), ValidationException);
}

TEST(DriveTypesTest, LastChunkMayBeShorter) {
    UploadSession session;
    session.file_size = 25;
    session.chunk_size = 10;
    session.total_chunks = 3;

    EXPECT_EQ(session.chunk_size_for_index(0), 10);
    EXPECT_EQ(session.chunk_size_for_index(1), 10);
    EXPECT_EQ(session.chunk_size_for_index(2), 5);
}

TEST(DriveTypesTest, GeneratedIdsAreUuidV4) {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        auto id = generate_id();
        ASSERT_EQ(id.size(), 36u);
        EXPECT_EQ(id[8], '-');
        EXPECT_EQ(id[14], '4');
        EXPECT_TRUE(seen.insert(id).second);
    }
}

TEST(DriveTypesTest, UnixMillisRoundTrip) {
    auto now = std::chrono::time_point_cast<std::chrono::milliseconds>(Clock::now());
    EXPECT_EQ(from_unix_millis(to_unix_millis(now)), now);
}

TEST(DriveTypesTest, RetryPolicyBackoffIsLinear) {
    RetryPolicy policy{.max_attempts = 4, .backoff_step = 250ms};
    EXPECT_EQ(policy.backoff_for(1), 250ms);
    EXPECT_EQ(policy.backoff_for(3), 750ms);
}

TEST(DriveTypesTest, InterruptibleSleepWakesOnStop) {
    std::stop_source source;
    std::thread stopper([&source] {
        std::this_thread::sleep_for(20ms);
        source.request_stop();
    });

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(interruptible_sleep(10s, source.get_token()));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);

    stopper.join();
}

TEST(DriveTypesTest, InterruptibleSleepCompletes) {
    EXPECT_TRUE(interruptible_sleep(5ms, {}));
    EXPECT_TRUE(interruptible_sleep(0ms, {}));
}

}  // namespace
}  // namespace tgdrive

#include "drive/download_streamer.hpp"

#include "drive/errors.hpp"
#include "tg/exceptions.hpp"
#include "tg/mock_bot_api.hpp"

#include <gtest/gtest.h>

#include <ctime>
#include <filesystem>
#include <sstream>

namespace tgdrive {
namespace {

namespace fs = std::filesystem;
using namespace std::chrono_literals;

const std::string kData = "abcdefghijklmnopqrstuvwxy";  // 25 bytes

class DownloadStreamerTest : public ::testing::Test {
protected:
    void SetUp() override {
        static int counter = 0;
        dir_ = fs::temp_directory_path() /
               ("tgdrive_download_test_" + std::to_string(std::time(nullptr)) + "_" + std::to_string(counter++));
        fs::create_directories(dir_);

        store_ = std::make_unique<MetadataStore>((dir_ / "drive.db").string());
        api_ = std::make_shared<tg::MockBotApi>();

        ProviderConfig config;
        config.bot_token = "mock";
        config.storage_chat_id = "-100";
        registry_ = std::make_unique<ProviderRegistry>(
            config, api_, [](const ProviderConfig&) -> std::shared_ptr<tg::BotApi> { return nullptr; }
        );
        limiter_ = std::make_unique<TransferLimiter>(TransferLimiter::Config{.max_uploads = 1, .max_downloads = 1});
        streamer_ = std::make_unique<DownloadStreamer>(
            *store_, *registry_, *limiter_, DownloadStreamer::Config{.block_size = 4}
        );
    }

    void TearDown() override {
        streamer_.reset();
        registry_.reset();
        store_.reset();
        fs::remove_all(dir_);
    }

    // Store `data` as provider messages of `chunk_size` bytes and finish the item
    Item store_file(const std::string& name, const std::string& data, int64_t chunk_size) {
        auto now = Clock::now();
        auto size = static_cast<int64_t>(data.size());

        Item item;
        item.name = name;
        item.mime_type = "text/plain";

        UploadSession session;
        session.file_name = name;
        session.mime_type = "text/plain";
        session.file_size = size;
        session.chunk_size = chunk_size;
        session.total_chunks = static_cast<int>((size + chunk_size - 1) / chunk_size);
        store_->create_upload(item, session, now);

        for (int i = 0; i < session.total_chunks; ++i) {
            auto piece = data.substr(static_cast<size_t>(i * chunk_size), static_cast<size_t>(chunk_size));
            std::istringstream in(piece);
            auto sent = api_->send_stream(
                "-100", tg::UploadKind::DOCUMENT, name, in, static_cast<int64_t>(piece.size()), "", nullptr, {}
            );
            const auto& message = std::get<tg::Message>(sent);

            Chunk chunk;
            chunk.item_id = item.id;
            chunk.chunk_index = i;
            chunk.chunk_size = static_cast<int64_t>(piece.size());
            chunk.chat_id = "-100";
            chunk.message_id = message.message_id;
            chunk.file_id = message.file->file_id;
            chunk.file_unique_id = message.file->file_unique_id;
            chunk.created_at = now;
            store_->record_chunk(chunk, session.id, now);
        }

        return store_->finalize_upload(session, std::nullopt, now);
    }

    static std::string read_all(DownloadStream& stream) {
        std::ostringstream out;
        stream.write_to(out);
        return out.str();
    }

    fs::path dir_;
    std::unique_ptr<MetadataStore> store_;
    std::shared_ptr<tg::MockBotApi> api_;
    std::unique_ptr<ProviderRegistry> registry_;
    std::unique_ptr<TransferLimiter> limiter_;
    std::unique_ptr<DownloadStreamer> streamer_;
};

TEST_F(DownloadStreamerTest, StreamsWholeItem) {
    auto item = store_file("data.txt", kData, 10);

    auto stream = streamer_->open(item.id);
    EXPECT_FALSE(stream->partial());
    EXPECT_EQ(stream->content_length(), 25);
    EXPECT_EQ(stream->content_type(), "text/plain");
    EXPECT_EQ(read_all(*stream), kData);
    EXPECT_EQ(stream->remaining(), 0);
}

TEST_F(DownloadStreamerTest, RangeSpansChunkBoundary) {
    auto item = store_file("data.txt", kData, 10);

    auto stream = streamer_->open(item.id, ByteRange{5, 14});
    EXPECT_TRUE(stream->partial());
    EXPECT_EQ(stream->content_length(), 10);
    EXPECT_EQ(stream->content_range(), "bytes 5-14/25");
    EXPECT_EQ(read_all(*stream), "fghijklmno");
}

TEST_F(DownloadStreamerTest, RangeEndIsClamped) {
    auto item = store_file("data.txt", kData, 10);

    auto stream = streamer_->open(item.id, ByteRange{20, 1000});
    EXPECT_EQ(stream->range().end, 24);
    EXPECT_EQ(read_all(*stream), "uvwxy");
}

TEST_F(DownloadStreamerTest, RangePastEndIsUnsatisfiable) {
    auto item = store_file("data.txt", kData, 10);

    EXPECT_THROW(streamer_->open(item.id, ByteRange{25, 30}), UnsatisfiableRangeException);
    EXPECT_THROW(streamer_->open(item.id, ByteRange{10, 5}), InvalidRangeException);

    // Rejected opens do not hold a slot
    EXPECT_EQ(limiter_->active(TransferKind::DOWNLOAD), 0);
}

TEST_F(DownloadStreamerTest, SmallReadsReassembleBytes) {
    auto item = store_file("data.txt", kData, 7);

    auto stream = streamer_->open(item.id);
    std::string collected;
    char buffer[3];
    while (auto n = stream->read(buffer, sizeof(buffer))) {
        collected.append(buffer, n);
    }
    EXPECT_EQ(collected, kData);
    EXPECT_EQ(stream->read(buffer, sizeof(buffer)), 0u);
}

TEST_F(DownloadStreamerTest, RejectsFoldersUnknownAndUploadingItems) {
    auto folder = store_->create_folder("docs", std::nullopt, Clock::now());
    EXPECT_THROW(streamer_->open(folder.id), ValidationException);
    EXPECT_THROW(streamer_->open("missing"), ItemNotFoundException);

    Item item;
    item.name = "partial.bin";
    UploadSession session;
    session.file_name = "partial.bin";
    session.file_size = 10;
    session.chunk_size = 10;
    session.total_chunks = 1;
    store_->create_upload(item, session, Clock::now());
    EXPECT_THROW(streamer_->open(item.id), ValidationException);
}

TEST_F(DownloadStreamerTest, AbandonedUploadIsNotDownloadable) {
    Item item;
    item.name = "abandoned.bin";
    UploadSession session;
    session.file_name = "abandoned.bin";
    session.file_size = 25;
    session.chunk_size = 10;
    session.total_chunks = 3;
    store_->create_upload(item, session, Clock::now());
    ASSERT_TRUE(store_->delete_session(session.id));

    EXPECT_THROW(streamer_->open(item.id), ValidationException);
    EXPECT_EQ(limiter_->active(TransferKind::DOWNLOAD), 0);
}

TEST_F(DownloadStreamerTest, AbandonedUploadWithChunksIsNotDownloadable) {
    Item item;
    item.name = "half.bin";
    UploadSession session;
    session.file_name = "half.bin";
    session.file_size = 25;
    session.chunk_size = 10;
    session.total_chunks = 3;
    store_->create_upload(item, session, Clock::now());

    Chunk chunk;
    chunk.item_id = item.id;
    chunk.chunk_index = 0;
    chunk.chunk_size = 10;
    chunk.chat_id = "-100";
    chunk.message_id = 1;
    chunk.file_id = "file-0";
    chunk.file_unique_id = "unique-0";
    chunk.created_at = Clock::now();
    store_->record_chunk(chunk, session.id, Clock::now());
    ASSERT_TRUE(store_->delete_session(session.id));

    EXPECT_THROW(streamer_->open(item.id), ValidationException);
}

TEST_F(DownloadStreamerTest, EmptyReadKeepsSlot) {
    auto item = store_file("data.txt", kData, 10);

    auto stream = streamer_->open(item.id);
    char buffer[4];
    EXPECT_EQ(stream->read(buffer, 0), 0u);
    EXPECT_EQ(limiter_->active(TransferKind::DOWNLOAD), 1);
    EXPECT_EQ(stream->remaining(), 25);

    EXPECT_EQ(read_all(*stream), kData);
    EXPECT_EQ(limiter_->active(TransferKind::DOWNLOAD), 0);
}

TEST_F(DownloadStreamerTest, SlotIsHeldUntilExhausted) {
    auto item = store_file("data.txt", kData, 10);

    auto stream = streamer_->open(item.id);
    EXPECT_EQ(limiter_->active(TransferKind::DOWNLOAD), 1);
    EXPECT_THROW(streamer_->open(item.id), TooManyConcurrentTransfersException);

    read_all(*stream);
    EXPECT_EQ(limiter_->active(TransferKind::DOWNLOAD), 0);

    auto second = streamer_->open(item.id);
    second.reset();
    EXPECT_EQ(limiter_->active(TransferKind::DOWNLOAD), 0);
}

TEST_F(DownloadStreamerTest, ReadsLocalServerPaths) {
    auto item = store_file("data.txt", kData, 10);
    api_->set_local_file_root(dir_ / "server-files");

    auto stream = streamer_->open(item.id, ByteRange{8, 21});
    EXPECT_EQ(read_all(*stream), kData.substr(8, 14));
}

TEST_F(DownloadStreamerTest, StopTokenAbortsStream) {
    auto item = store_file("data.txt", kData, 10);
    std::stop_source source;

    auto stream = streamer_->open(item.id, std::nullopt, source.get_token());
    char buffer[4];
    EXPECT_EQ(stream->read(buffer, sizeof(buffer)), 4u);

    source.request_stop();
    EXPECT_THROW(stream->read(buffer, sizeof(buffer)), tg::CancelledException);
}

//------------------------------------------------------------------------------
// Chunk sequence and range helpers
//------------------------------------------------------------------------------

Chunk sized_chunk(int index, int64_t size) {
    Chunk chunk;
    chunk.chunk_index = index;
    chunk.chunk_size = size;
    return chunk;
}

TEST(ChunkSequenceTest, AcceptsContiguousChunks) {
    EXPECT_NO_THROW(verify_chunk_sequence("i", {sized_chunk(0, 10), sized_chunk(1, 10), sized_chunk(2, 5)}, 25));
}

TEST(ChunkSequenceTest, DetectsGapsAndSizeMismatch) {
    EXPECT_THROW(verify_chunk_sequence("i", {sized_chunk(0, 10), sized_chunk(2, 10)}, 20), CorruptedItemException);
    EXPECT_THROW(verify_chunk_sequence("i", {sized_chunk(0, 10), sized_chunk(1, 10)}, 25), CorruptedItemException);
    EXPECT_THROW(verify_chunk_sequence("i", {sized_chunk(0, 0)}, 0), CorruptedItemException);
    EXPECT_THROW(verify_chunk_sequence("i", {}, 10), CorruptedItemException);
}

TEST(RangeHeaderTest, ParsesSingleRanges) {
    auto explicit_range = parse_range_header("bytes=0-4", 25);
    ASSERT_TRUE(explicit_range.has_value());
    EXPECT_EQ(explicit_range->start, 0);
    EXPECT_EQ(explicit_range->end, 4);

    auto open_ended = parse_range_header("bytes=5-", 25);
    ASSERT_TRUE(open_ended.has_value());
    EXPECT_EQ(open_ended->start, 5);
    EXPECT_EQ(open_ended->end, 24);

    auto suffix = parse_range_header("bytes=-3", 25);
    ASSERT_TRUE(suffix.has_value());
    EXPECT_EQ(suffix->start, 22);
    EXPECT_EQ(suffix->end, 24);

    auto long_suffix = parse_range_header("bytes=-100", 25);
    ASSERT_TRUE(long_suffix.has_value());
    EXPECT_EQ(long_suffix->start, 0);

    auto clamped = parse_range_header("bytes=20-99", 25);
    ASSERT_TRUE(clamped.has_value());
    EXPECT_EQ(clamped->end, 24);
}

TEST(RangeHeaderTest, EmptyHeaderMeansWholeItem) {
    EXPECT_FALSE(parse_range_header("", 25).has_value());
    EXPECT_FALSE(parse_range_header("   ", 25).has_value());
}

TEST(RangeHeaderTest, RejectsMalformedHeaders) {
    EXPECT_THROW(parse_range_header("bytes=-0", 25), InvalidRangeException);
    EXPECT_THROW(parse_range_header("bytes=0-4,6-8", 25), InvalidRangeException);
    EXPECT_THROW(parse_range_header("items=0-4", 25), InvalidRangeException);
    EXPECT_THROW(parse_range_header("bytes=", 25), InvalidRangeException);
    EXPECT_THROW(parse_range_header("bytes=4", 25), InvalidRangeException);
    EXPECT_THROW(parse_range_header("bytes=a-4", 25), InvalidRangeException);
    EXPECT_THROW(parse_range_header("bytes=9-3", 25), InvalidRangeException);
}

TEST(RangeHeaderTest, StartPastEndIsUnsatisfiable) {
    EXPECT_THROW(parse_range_header("bytes=25-", 25), UnsatisfiableRangeException);
    EXPECT_THROW(parse_range_header("bytes=0-", 0), UnsatisfiableRangeException);
}

TEST(FilePathCacheTest, EntriesExpireAndAreScopedByGeneration) {
    FilePathCache cache(55min);
    auto now = Clock::now();

    cache.put(1, "file-a", "documents/a", now);
    EXPECT_EQ(cache.get(1, "file-a", now + 1min), std::optional<std::string>("documents/a"));
    EXPECT_FALSE(cache.get(2, "file-a", now).has_value());
    EXPECT_FALSE(cache.get(1, "file-a", now + 56min).has_value());

    cache.put(1, "file-b", "documents/b", now);
    cache.invalidate(1, "file-b");
    EXPECT_FALSE(cache.get(1, "file-b", now).has_value());

    cache.put(3, "file-c", "documents/c", now);
    cache.clear();
    EXPECT_FALSE(cache.get(3, "file-c", now).has_value());
}

TEST(FilePathCacheTest, PutSweepsExpiredEntries) {
    FilePathCache cache(55min);
    auto now = Clock::now();

    for (std::size_t i = 0; i < FilePathCache::kPruneThreshold; ++i) {
        cache.put(1, "old-" + std::to_string(i), "documents/old", now);
    }
    EXPECT_EQ(cache.size(), FilePathCache::kPruneThreshold);

    cache.put(1, "fresh", "documents/fresh", now + 1h);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.get(1, "fresh", now + 1h), std::optional<std::string>("documents/fresh"));
}

}  // namespace
}  // namespace tgdrive

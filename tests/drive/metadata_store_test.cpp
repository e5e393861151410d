#include "drive/metadata_store.hpp"

#include "drive/errors.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <ctime>
#include <filesystem>

namespace tgdrive {
namespace {

namespace fs = std::filesystem;
using namespace std::chrono_literals;

std::string unique_db_path(const char* tag) {
    static std::atomic<int> counter{0};
    return "/tmp/tgdrive_" + std::string(tag) + "_" + std::to_string(std::time(nullptr)) + "_" +
           std::to_string(counter++) + ".db";
}

// Test fixture for metadata store tests
class MetadataStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_db_path_ = unique_db_path("store_test");
        store_ = std::make_unique<MetadataStore>(temp_db_path_);
        now_ = Clock::now();
    }

    void TearDown() override {
        store_.reset();  // Close database
        fs::remove(temp_db_path_);
        fs::remove(temp_db_path_ + "-wal");
        fs::remove(temp_db_path_ + "-shm");
    }

    std::pair<Item, UploadSession> start_upload(
        const std::string& name,
        int64_t size,
        int64_t chunk_size,
        const std::optional<std::string>& parent_id = std::nullopt
    ) {
        Item item;
        item.name = name;
        item.parent_id = parent_id;
        item.mime_type = "application/octet-stream";

        UploadSession session;
        session.file_name = name;
        session.mime_type = "application/octet-stream";
        session.file_size = size;
        session.chunk_size = chunk_size;
        session.total_chunks = static_cast<int>((size + chunk_size - 1) / chunk_size);

        store_->create_upload(item, session, now_);
        return {item, session};
    }

    Chunk make_chunk(const std::string& item_id, int index, int64_t size, int64_t message_id) {
        Chunk chunk;
        chunk.item_id = item_id;
        chunk.chunk_index = index;
        chunk.chunk_size = size;
        chunk.chat_id = "-100";
        chunk.message_id = message_id;
        chunk.file_id = "file-" + std::to_string(message_id);
        chunk.file_unique_id = "uniq-" + std::to_string(message_id);
        chunk.created_at = now_;
        return chunk;
    }

    std::string temp_db_path_;
    std::unique_ptr<MetadataStore> store_;
    Timestamp now_;
};

// Folder tests
TEST_F(MetadataStoreTest, CreateFolderBuildsPaths) {
    auto docs = store_->create_folder("docs", std::nullopt, now_);
    auto reports = store_->create_folder("reports", docs.id, now_);

    EXPECT_EQ(docs.path, "/docs");
    EXPECT_EQ(reports.path, "/docs/reports");
    EXPECT_TRUE(reports.is_folder());

    auto found = store_->find_child(docs.id, "reports");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id, reports.id);
}

TEST_F(MetadataStoreTest, CreateFolderUnderMissingParent) {
    EXPECT_THROW(store_->create_folder("x", std::string("missing"), now_), ItemNotFoundException);
}

// Upload session tests
TEST_F(MetadataStoreTest, CreateUploadInsertsItemAndSession) {
    auto [item, session] = start_upload("movie.mkv", 25, 10);

    EXPECT_FALSE(item.id.empty());
    EXPECT_EQ(item.path, "/movie.mkv");
    EXPECT_EQ(item.size, 0);
    EXPECT_EQ(session.item_id, item.id);
    EXPECT_EQ(session.status, SessionStatus::PENDING);

    auto loaded = store_->get_session_by_item(item.id);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->id, session.id);
    EXPECT_EQ(loaded->total_chunks, 3);
    EXPECT_EQ(loaded->staging, StagingStrategy::DIRECT);
}

TEST_F(MetadataStoreTest, SameNameWhileUploadingIsRejected) {
    auto [item, session] = start_upload("a.bin", 10, 10);

    try {
        start_upload("a.bin", 10, 10);
        FAIL() << "Expected AlreadyInProgressException";
    } catch (const AlreadyInProgressException& e) {
        EXPECT_NE(std::string(e.what()).find(item.id), std::string::npos);
    }
}

TEST_F(MetadataStoreTest, SameNameAfterCompletionGetsSuffix) {
    auto [item, session] = start_upload("report.pdf", 10, 10);
    ASSERT_TRUE(store_->record_chunk(make_chunk(item.id, 0, 10, 1), session.id, now_));
    store_->finalize_upload(session, std::nullopt, now_);

    auto [second, second_session] = start_upload("report.pdf", 10, 10);
    EXPECT_EQ(second.name, "report (1).pdf");
    EXPECT_EQ(second.path, "/report (1).pdf");
}

TEST_F(MetadataStoreTest, RecordChunkAdvancesSession) {
    auto [item, session] = start_upload("a.bin", 25, 10);

    EXPECT_TRUE(store_->record_chunk(make_chunk(item.id, 0, 10, 1), session.id, now_ + 1s));
    auto loaded = store_->get_session(session.id);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->status, SessionStatus::UPLOADING);
    EXPECT_EQ(to_unix_millis(loaded->updated_at), to_unix_millis(now_ + 1s));
}

TEST_F(MetadataStoreTest, RecordChunkTwiceKeepsFirst) {
    auto [item, session] = start_upload("a.bin", 25, 10);

    EXPECT_TRUE(store_->record_chunk(make_chunk(item.id, 0, 10, 1), session.id, now_));
    EXPECT_FALSE(store_->record_chunk(make_chunk(item.id, 0, 10, 2), session.id, now_));

    auto chunk = store_->get_chunk(item.id, 0);
    ASSERT_TRUE(chunk.has_value());
    EXPECT_EQ(chunk->message_id, 1);
}

TEST_F(MetadataStoreTest, FinalizeSetsSizeAndDropsSession) {
    auto [item, session] = start_upload("a.bin", 25, 10);
    store_->record_chunk(make_chunk(item.id, 0, 10, 1), session.id, now_);
    store_->record_chunk(make_chunk(item.id, 1, 10, 2), session.id, now_);
    store_->record_chunk(make_chunk(item.id, 2, 5, 3), session.id, now_);

    auto done = store_->finalize_upload(session, std::nullopt, now_);
    EXPECT_EQ(done.size, 25);
    EXPECT_FALSE(store_->get_session(session.id).has_value());

    auto chunks = store_->list_chunks(item.id);
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0].chunk_index, 0);
    EXPECT_EQ(chunks[2].chunk_size, 5);
}

TEST_F(MetadataStoreTest, DeleteSessionsUpdatedBefore) {
    auto [old_item, old_session] = start_upload("old.bin", 10, 10);
    now_ += 2h;
    auto [new_item, new_session] = start_upload("new.bin", 10, 10);

    auto expired = store_->delete_sessions_updated_before(now_ - 1h);
    ASSERT_EQ(expired.size(), 1u);
    EXPECT_EQ(expired[0].id, old_session.id);
    EXPECT_EQ(expired[0].status, SessionStatus::EXPIRED);

    EXPECT_FALSE(store_->get_session(old_session.id).has_value());
    EXPECT_TRUE(store_->get_session(new_session.id).has_value());
    EXPECT_TRUE(store_->get_item(old_item.id).has_value());
}

// Tree tests
TEST_F(MetadataStoreTest, TreeQueriesCoverDescendantsOnly) {
    auto docs = store_->create_folder("docs", std::nullopt, now_);
    auto docs2 = store_->create_folder("docs2", std::nullopt, now_);

    auto [inside, inside_session] = start_upload("a.bin", 10, 10, docs.id);
    store_->record_chunk(make_chunk(inside.id, 0, 10, 1), inside_session.id, now_);

    auto [sibling, sibling_session] = start_upload("b.bin", 10, 10, docs2.id);
    store_->record_chunk(make_chunk(sibling.id, 0, 10, 2), sibling_session.id, now_);

    auto chunks = store_->list_chunks_in_tree(docs);
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].chunk.message_id, 1);
    EXPECT_EQ(chunks[0].item_path, "/docs/a.bin");

    auto sessions = store_->list_sessions_in_tree(docs);
    ASSERT_EQ(sessions.size(), 1u);
    EXPECT_EQ(sessions[0].id, inside_session.id);

    EXPECT_EQ(store_->delete_item_tree(docs), 2);
    EXPECT_FALSE(store_->get_item(inside.id).has_value());
    EXPECT_TRUE(store_->list_chunks(inside.id).empty());
    EXPECT_FALSE(store_->get_session(inside_session.id).has_value());
    EXPECT_TRUE(store_->get_item(sibling.id).has_value());
}

// Delete failure tests
TEST_F(MetadataStoreTest, UpsertDeleteFailureBumpsRetryCount) {
    DeleteFailureReport report{
        .item_id = std::string("item-1"),
        .item_path = "/a.bin",
        .chat_id = "-100",
        .message_id = 77,
        .error_message = "first",
    };
    store_->upsert_delete_failure(report, now_);

    report.error_message = "second";
    store_->upsert_delete_failure(report, now_ + 1min);

    auto record = store_->find_delete_failure("-100", 77);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->retry_count, 2);
    EXPECT_EQ(record->error_message, "second");
    EXPECT_FALSE(record->resolved);
    ASSERT_TRUE(record->last_retry_at.has_value());
    EXPECT_EQ(to_unix_millis(*record->last_retry_at), to_unix_millis(now_ + 1min));
    EXPECT_EQ(store_->list_unresolved_delete_failures().size(), 1u);
}

TEST_F(MetadataStoreTest, ResolvingTwiceKeepsFirstTimestamp) {
    store_->upsert_delete_failure(DeleteFailureReport{.item_path = "/x", .chat_id = "-100", .message_id = 5}, now_);
    auto record = store_->find_delete_failure("-100", 5);
    ASSERT_TRUE(record.has_value());

    EXPECT_TRUE(store_->mark_delete_failure_resolved(record->id, now_ + 1min));
    EXPECT_TRUE(store_->mark_delete_failure_resolved(record->id, now_ + 2min));

    auto resolved = store_->get_delete_failure(record->id);
    ASSERT_TRUE(resolved.has_value());
    EXPECT_TRUE(resolved->resolved);
    ASSERT_TRUE(resolved->resolved_at.has_value());
    EXPECT_EQ(to_unix_millis(*resolved->resolved_at), to_unix_millis(now_ + 1min));
    EXPECT_TRUE(store_->list_unresolved_delete_failures().empty());

    EXPECT_FALSE(store_->mark_delete_failure_resolved(9999, now_));
}

}  // namespace
}  // namespace tgdrive

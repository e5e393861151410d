#include "drive/delete_ledger.hpp"

#include "drive/provider_registry.hpp"
#include "tg/mock_bot_api.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <ctime>
#include <filesystem>
#include <sstream>

namespace tgdrive {
namespace {

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using tg::MockFailure;

const RetryPolicy kFastRetry{.max_attempts = 3, .backoff_step = 0ms};

std::string unique_db_path() {
    static std::atomic<int> counter{0};
    return "/tmp/tgdrive_ledger_test_" + std::to_string(std::time(nullptr)) + "_" + std::to_string(counter++) + ".db";
}

// Send a one-byte message and return its id
int64_t send_message(tg::MockBotApi& api, const std::string& chat_id) {
    std::istringstream data("x");
    auto result = api.send_stream(chat_id, tg::UploadKind::DOCUMENT, "x.bin", data, 1, "", nullptr, {});
    return std::get<tg::Message>(result).message_id;
}

//------------------------------------------------------------------------------
// delete_message_with_retry
//------------------------------------------------------------------------------

TEST(DeleteWithRetryTest, DeletesExistingMessage) {
    tg::MockBotApi api;
    auto message_id = send_message(api, "-100");

    auto attempt = delete_message_with_retry(api, "-100", message_id, kFastRetry, {});
    EXPECT_TRUE(attempt.ok);
    EXPECT_EQ(attempt.status, tg::DeleteStatus::DELETED);
    EXPECT_EQ(attempt.attempts, 1);
    EXPECT_EQ(api.message_count(), 0u);
}

TEST(DeleteWithRetryTest, MissingMessageCountsAsDeleted) {
    tg::MockBotApi api;
    auto attempt = delete_message_with_retry(api, "-100", 404, kFastRetry, {});
    EXPECT_TRUE(attempt.ok);
    EXPECT_EQ(attempt.status, tg::DeleteStatus::ALREADY_GONE);
}

TEST(DeleteWithRetryTest, ClientErrorIsNotRetried) {
    tg::MockBotApi api;
    api.queue_delete_failure(MockFailure{.type = MockFailure::Type::API_ERROR, .code = 403, .description = "Forbidden"});

    auto attempt = delete_message_with_retry(api, "-100", 1, kFastRetry, {});
    EXPECT_FALSE(attempt.ok);
    EXPECT_EQ(attempt.attempts, 1);
    EXPECT_NE(attempt.error.find("Forbidden"), std::string::npos);
}

TEST(DeleteWithRetryTest, TransientErrorsAreRetried) {
    tg::MockBotApi api;
    auto message_id = send_message(api, "-100");
    api.queue_delete_failure(MockFailure{.type = MockFailure::Type::NETWORK_ERROR, .description = "reset"});
    api.queue_delete_failure(MockFailure{.type = MockFailure::Type::API_ERROR, .code = 502, .description = "Bad Gateway"});

    auto attempt = delete_message_with_retry(api, "-100", message_id, kFastRetry, {});
    EXPECT_TRUE(attempt.ok);
    EXPECT_EQ(attempt.attempts, 3);
    EXPECT_TRUE(attempt.error.empty());
}

TEST(DeleteWithRetryTest, GivesUpAfterMaxAttempts) {
    tg::MockBotApi api;
    for (int i = 0; i < 3; ++i) {
        api.queue_delete_failure(MockFailure{.type = MockFailure::Type::NETWORK_ERROR, .description = "down"});
    }

    auto attempt = delete_message_with_retry(api, "-100", 1, kFastRetry, {});
    EXPECT_FALSE(attempt.ok);
    EXPECT_EQ(attempt.attempts, 3);
    EXPECT_NE(attempt.error.find("down"), std::string::npos);
}

TEST(DeleteWithRetryTest, ShortRateLimitIsWaitedOut) {
    tg::MockBotApi api;
    api.queue_delete_failure(MockFailure{.type = MockFailure::Type::RATE_LIMIT, .retry_after = 0s});

    auto attempt = delete_message_with_retry(api, "-100", 1, kFastRetry, {});
    EXPECT_TRUE(attempt.ok);
    EXPECT_EQ(attempt.attempts, 2);
}

TEST(DeleteWithRetryTest, LongRateLimitGivesUp) {
    tg::MockBotApi api;
    api.queue_delete_failure(MockFailure{.type = MockFailure::Type::RATE_LIMIT, .retry_after = 3600s});

    auto attempt = delete_message_with_retry(api, "-100", 1, kFastRetry, {});
    EXPECT_FALSE(attempt.ok);
    EXPECT_EQ(attempt.attempts, 1);
    EXPECT_NE(attempt.error.find("rate limited"), std::string::npos);
}

TEST(DeleteWithRetryTest, StopTokenAbortsWithoutThrowing) {
    tg::MockBotApi api;
    std::stop_source source;
    source.request_stop();

    DeleteAttempt attempt;
    EXPECT_NO_THROW(attempt = delete_message_with_retry(api, "-100", 1, kFastRetry, source.get_token()));
    EXPECT_FALSE(attempt.ok);
    EXPECT_EQ(api.delete_count(), 0u);
}

//------------------------------------------------------------------------------
// DeleteLedger
//------------------------------------------------------------------------------

class DeleteLedgerTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_path_ = unique_db_path();
        store_ = std::make_unique<MetadataStore>(db_path_);
        ledger_ = std::make_unique<DeleteLedger>(*store_, DeleteLedger::Config{.retry_interval = 10min, .max_backoff = 1h});

        api_ = std::make_shared<tg::MockBotApi>();
        ProviderConfig config;
        config.bot_token = "mock";
        config.storage_chat_id = "-100";
        registry_ = std::make_unique<ProviderRegistry>(config, api_, make_factory());

        now_ = Clock::now();
    }

    void TearDown() override {
        ledger_.reset();
        store_.reset();
        fs::remove(db_path_);
        fs::remove(db_path_ + "-wal");
        fs::remove(db_path_ + "-shm");
    }

    ClientFactory make_factory() {
        return [](const ProviderConfig&) -> std::shared_ptr<tg::BotApi> { return std::make_shared<tg::MockBotApi>(); };
    }

    std::string db_path_;
    std::unique_ptr<MetadataStore> store_;
    std::unique_ptr<DeleteLedger> ledger_;
    std::shared_ptr<tg::MockBotApi> api_;
    std::unique_ptr<ProviderRegistry> registry_;
    tg::RateLimiter rate_limiter_{tg::RateLimiter::Config{.min_interval = 0ms}};
    Timestamp now_;
};

TEST_F(DeleteLedgerTest, RepeatedFailureUpdatesOneRecord) {
    ledger_->record_failure("-100", 7, "/a.bin", "first", std::string("item-1"), now_);
    ledger_->record_failure("-100", 7, "", "second", std::nullopt, now_ + 1min);

    auto pending = ledger_->pending();
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0].retry_count, 2);
    EXPECT_EQ(pending[0].error_message, "second");
    EXPECT_EQ(pending[0].item_path, "/a.bin");
    EXPECT_EQ(pending[0].item_id, std::optional<std::string>("item-1"));
}

TEST_F(DeleteLedgerTest, BackoffDoublesUpToCap) {
    ledger_->record_failure("-100", 1, "/a", "e", std::nullopt, now_);
    auto record = ledger_->pending().at(0);

    EXPECT_EQ(ledger_->next_retry_at(record), record.last_retry_at.value_or(record.failed_at) + 10min);

    record.retry_count = 2;
    EXPECT_EQ(ledger_->next_retry_at(record), record.last_retry_at.value_or(record.failed_at) + 20min);

    record.retry_count = 3;
    EXPECT_EQ(ledger_->next_retry_at(record), record.last_retry_at.value_or(record.failed_at) + 40min);

    record.retry_count = 30;
    EXPECT_EQ(ledger_->next_retry_at(record), record.last_retry_at.value_or(record.failed_at) + 1h);
}

TEST_F(DeleteLedgerTest, RetryDueHonoursBackoff) {
    ledger_->record_failure("-100", 1, "/a", "e", std::nullopt, now_);
    ledger_->record_failure("-100", 2, "/b", "e", std::nullopt, now_ + 30min);

    EXPECT_TRUE(ledger_->retry_due(now_ + 5min).empty());

    auto due = ledger_->retry_due(now_ + 15min);
    ASSERT_EQ(due.size(), 1u);
    EXPECT_EQ(due[0].message_id, 1);

    EXPECT_EQ(ledger_->retry_due(now_ + 2h).size(), 2u);
}

TEST_F(DeleteLedgerTest, DeleteOrRecordOnlyRecordsFailures) {
    auto message_id = send_message(*api_, "-100");
    auto ok = ledger_->delete_or_record(*api_, "-100", message_id, std::nullopt, "/a", kFastRetry, {});
    EXPECT_TRUE(ok.ok);
    EXPECT_TRUE(ledger_->pending().empty());

    api_->set_deletes_failing(true);
    auto failed = ledger_->delete_or_record(*api_, "-100", 99, std::string("item-9"), "/b", kFastRetry, {});
    EXPECT_FALSE(failed.ok);

    auto pending = ledger_->pending();
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0].message_id, 99);
    EXPECT_EQ(pending[0].item_path, "/b");
    EXPECT_NE(pending[0].error_message.find("can't be deleted"), std::string::npos);
}

TEST_F(DeleteLedgerTest, SweepResolvesDeletedAndGoneMessages) {
    auto message_id = send_message(*api_, "-100");
    ledger_->record_failure("-100", message_id, "/a", "e", std::nullopt, now_);
    ledger_->record_failure("-100", 4242, "/b", "e", std::nullopt, now_);

    auto summary = ledger_->retry_pending(*registry_, rate_limiter_, now_ + 11min);
    EXPECT_EQ(summary.attempted, 2);
    EXPECT_EQ(summary.resolved, 2);
    EXPECT_EQ(summary.failed, 0);
    EXPECT_FALSE(summary.rate_limited);
    EXPECT_TRUE(ledger_->pending().empty());
    EXPECT_EQ(api_->message_count(), 0u);

    auto record = store_->find_delete_failure("-100", 4242);
    ASSERT_TRUE(record.has_value());
    EXPECT_TRUE(record->resolved);
}

TEST_F(DeleteLedgerTest, SweepSkipsRecordsNotYetDue) {
    ledger_->record_failure("-100", 1, "/a", "e", std::nullopt, now_);

    auto summary = ledger_->retry_pending(*registry_, rate_limiter_, now_ + 1min);
    EXPECT_EQ(summary.attempted, 0);
    EXPECT_EQ(api_->delete_count(), 0u);
    EXPECT_EQ(ledger_->pending().size(), 1u);
}

TEST_F(DeleteLedgerTest, SweepFailureBumpsRetryCount) {
    ledger_->record_failure("-100", 1, "/a", "e", std::nullopt, now_);
    api_->set_deletes_failing(true);

    auto summary = ledger_->retry_pending(*registry_, rate_limiter_, now_ + 11min);
    EXPECT_EQ(summary.failed, 1);
    EXPECT_EQ(summary.resolved, 0);

    auto pending = ledger_->pending();
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0].retry_count, 2);

    // The doubled back-off now applies from the sweep time
    EXPECT_TRUE(ledger_->retry_due(now_ + 25min).empty());
    EXPECT_EQ(ledger_->retry_due(now_ + 32min).size(), 1u);
}

TEST_F(DeleteLedgerTest, RateLimitStopsSweep) {
    ledger_->record_failure("-100", 1, "/a", "e", std::nullopt, now_);
    ledger_->record_failure("-100", 2, "/b", "e", std::nullopt, now_);
    api_->queue_delete_failure(MockFailure{.type = MockFailure::Type::RATE_LIMIT, .retry_after = 30s});

    auto summary = ledger_->retry_pending(*registry_, rate_limiter_, now_ + 11min);
    EXPECT_TRUE(summary.rate_limited);
    EXPECT_EQ(summary.attempted, 0);
    EXPECT_EQ(ledger_->pending().size(), 2u);

    // The limiter refuses requests until the provider's delay has passed
    EXPECT_FALSE(rate_limiter_.try_acquire());
}

TEST_F(DeleteLedgerTest, SweepUsesActiveProvider) {
    ledger_->record_failure("-100", 1, "/a", "e", std::nullopt, now_);
    api_->set_deletes_failing(true);

    ProviderConfig next;
    next.bot_token = "next";
    next.storage_chat_id = "-100";
    registry_->swap(next);

    auto summary = ledger_->retry_pending(*registry_, rate_limiter_, now_ + 11min);
    EXPECT_EQ(summary.resolved, 1);
    EXPECT_EQ(api_->delete_count(), 0u);
}

TEST_F(DeleteLedgerTest, MarkResolvedUnknownId) { EXPECT_FALSE(ledger_->mark_resolved(12345, now_)); }

}  // namespace
}  // namespace tgdrive

#pragma once

#include "drive/metadata_store.hpp"
#include "drive/types.hpp"
#include "tg/bot_api.hpp"
#include "tg/rate_limiter.hpp"

#include <chrono>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace tgdrive {

class ProviderRegistry;

/// Configuration for DeleteLedger
struct DeleteLedgerConfig {
    std::chrono::minutes retry_interval{10};  // Wait after the first failure
    std::chrono::hours max_backoff{24};       // Ceiling of the doubling wait
};

/// Outcome of deleting one provider message
struct DeleteAttempt {
    bool ok{false};
    tg::DeleteStatus status{tg::DeleteStatus::DELETED};  // Meaningful when ok
    int attempts{0};
    std::string error;  // Last error when not ok
};

/// Totals of one retry sweep
struct DeleteRetrySummary {
    int attempted{0};
    int resolved{0};
    int failed{0};
    bool rate_limited{false};
};

/// Delete a message, retrying transient failures and waiting out short rate limits
/// Never throws for provider failures: they are reported in the result.
DeleteAttempt delete_message_with_retry(
    tg::BotApi& api,
    const std::string& chat_id,
    int64_t message_id,
    const RetryPolicy& policy,
    std::stop_token stop
);

/// Compensation log for provider messages that could not be deleted
///
/// Failures are keyed by (chat_id, message_id). Repeated failures update the
/// existing record. Records are never removed, only marked resolved.
class DeleteLedger {
public:
    using Config = DeleteLedgerConfig;

    explicit DeleteLedger(MetadataStore& store, Config config = {});

    // Disable copy
    DeleteLedger(const DeleteLedger&) = delete;
    DeleteLedger& operator=(const DeleteLedger&) = delete;

    /// Insert a failure or bump the retry count of the existing one
    void record_failure(
        const std::string& chat_id,
        int64_t message_id,
        const std::string& item_path,
        const std::string& error,
        const std::optional<std::string>& item_id,
        Timestamp now
    );

    /// Unresolved records whose back-off has elapsed, oldest attempt first
    [[nodiscard]] std::vector<DeleteFailureRecord> retry_due(Timestamp now);

    /// Unresolved records regardless of back-off
    [[nodiscard]] std::vector<DeleteFailureRecord> pending();

    /// Flag a record resolved; resolving twice keeps the first resolved_at
    /// @return false if no record has this id
    bool mark_resolved(int64_t id, Timestamp now);

    /// When a record becomes due: last attempt + interval * 2^(retry_count-1), capped
    [[nodiscard]] Timestamp next_retry_at(const DeleteFailureRecord& record) const;

    /// Delete a message and record it here if every attempt fails
    DeleteAttempt delete_or_record(
        tg::BotApi& api,
        const std::string& chat_id,
        int64_t message_id,
        const std::optional<std::string>& item_id,
        const std::string& item_path,
        const RetryPolicy& policy,
        std::stop_token stop
    );

    /// Retry every due record through the active provider
    ///
    /// Successful and "already gone" deletes are resolved. A rate-limit answer
    /// defers `rate_limiter` and ends the sweep early.
    DeleteRetrySummary retry_pending(
        ProviderRegistry& registry,
        tg::RateLimiter& rate_limiter,
        Timestamp now,
        std::stop_token stop = {}
    );

    [[nodiscard]] const Config& get_config() const { return config_; }

private:
    MetadataStore& store_;
    Config config_;
};

}  // namespace tgdrive

#include "drive/delete_ledger.hpp"

#include "drive/provider_registry.hpp"
#include "tg/exceptions.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace tgdrive {

DeleteAttempt delete_message_with_retry(
    tg::BotApi& api,
    const std::string& chat_id,
    int64_t message_id,
    const RetryPolicy& policy,
    std::stop_token stop
) {
    DeleteAttempt attempt;
    const int max_attempts = std::max(1, policy.max_attempts);

    for (int i = 1; i <= max_attempts; ++i) {
        attempt.attempts = i;
        std::chrono::milliseconds wait = policy.backoff_for(i);

        try {
            auto result = api.delete_message(chat_id, message_id, stop);
            if (auto* status = std::get_if<tg::DeleteStatus>(&result)) {
                attempt.ok = true;
                attempt.status = *status;
                attempt.error.clear();
                return attempt;
            }

            const auto& retry = std::get<tg::RetryAfter>(result);
            attempt.error = "rate limited: " + retry.description;
            if (retry.delay > policy.max_retry_after) {
                return attempt;
            }
            wait = std::max<std::chrono::milliseconds>(wait, retry.delay);
        } catch (const tg::CancelledException& e) {
            attempt.error = e.what();
            return attempt;
        } catch (const tg::NetworkException& e) {
            attempt.error = e.what();
        } catch (const tg::ApiException& e) {
            attempt.error = e.what();
            // 4xx other than 429 will not change on retry
            if (e.code() >= 400 && e.code() < 500 && e.code() != 429) {
                return attempt;
            }
        } catch (const tg::TelegramException& e) {
            attempt.error = e.what();
        }

        if (i < max_attempts && !interruptible_sleep(wait, stop)) {
            attempt.error = "cancelled: " + attempt.error;
            return attempt;
        }
    }

    return attempt;
}

DeleteLedger::DeleteLedger(MetadataStore& store, Config config) : store_(store), config_(config) {}

void DeleteLedger::record_failure(
    const std::string& chat_id,
    int64_t message_id,
    const std::string& item_path,
    const std::string& error,
    const std::optional<std::string>& item_id,
    Timestamp now
) {
    DeleteFailureReport report;
    report.item_id = item_id;
    report.item_path = item_path;
    report.chat_id = chat_id;
    report.message_id = message_id;
    report.error_message = error;
    store_.upsert_delete_failure(report, now);

    spdlog::warn("DeleteLedger: recorded failed delete of message {} in {} ({}): {}", message_id, chat_id, item_path, error);
}

std::vector<DeleteFailureRecord> DeleteLedger::retry_due(Timestamp now) {
    auto records = store_.list_unresolved_delete_failures();
    std::erase_if(records, [&](const DeleteFailureRecord& record) { return next_retry_at(record) > now; });
    return records;
}

std::vector<DeleteFailureRecord> DeleteLedger::pending() { return store_.list_unresolved_delete_failures(); }

bool DeleteLedger::mark_resolved(int64_t id, Timestamp now) { return store_.mark_delete_failure_resolved(id, now); }

Timestamp DeleteLedger::next_retry_at(const DeleteFailureRecord& record) const {
    auto last = record.last_retry_at.value_or(record.failed_at);

    auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(config_.retry_interval);
    auto cap = std::chrono::duration_cast<std::chrono::milliseconds>(config_.max_backoff);
    for (int i = 1; i < record.retry_count && wait < cap; ++i) {
        wait *= 2;
    }
    return last + std::min(wait, cap);
}

DeleteAttempt DeleteLedger::delete_or_record(
    tg::BotApi& api,
    const std::string& chat_id,
    int64_t message_id,
    const std::optional<std::string>& item_id,
    const std::string& item_path,
    const RetryPolicy& policy,
    std::stop_token stop
) {
    auto attempt = delete_message_with_retry(api, chat_id, message_id, policy, stop);
    if (!attempt.ok) {
        record_failure(chat_id, message_id, item_path, attempt.error, item_id, Clock::now());
    }
    return attempt;
}

DeleteRetrySummary DeleteLedger::retry_pending(
    ProviderRegistry& registry,
    tg::RateLimiter& rate_limiter,
    Timestamp now,
    std::stop_token stop
) {
    DeleteRetrySummary summary;

    auto due = retry_due(now);
    if (due.empty()) {
        return summary;
    }
    spdlog::info("DeleteLedger: retrying {} failed delete(s)", due.size());

    for (const auto& record : due) {
        if (!rate_limiter.acquire(stop)) {
            break;
        }

        auto provider = registry.current();
        ++summary.attempted;

        try {
            auto result = provider->delete_message(record.chat_id, record.message_id, stop);
            if (auto* retry = std::get_if<tg::RetryAfter>(&result)) {
                spdlog::warn("DeleteLedger: rate limited, retry after {}s", retry->delay.count());
                rate_limiter.defer(retry->delay);
                summary.rate_limited = true;
                --summary.attempted;
                break;
            }

            mark_resolved(record.id, now);
            ++summary.resolved;
            spdlog::debug(
                "DeleteLedger: message {} in {} {}",
                record.message_id,
                record.chat_id,
                std::get<tg::DeleteStatus>(result) == tg::DeleteStatus::ALREADY_GONE ? "was already gone" : "deleted"
            );
        } catch (const tg::CancelledException&) {
            --summary.attempted;
            break;
        } catch (const tg::TelegramException& e) {
            record_failure(record.chat_id, record.message_id, record.item_path, e.what(), record.item_id, now);
            ++summary.failed;
        }
    }

    spdlog::info(
        "DeleteLedger: sweep done, {} resolved, {} still failing{}",
        summary.resolved,
        summary.failed,
        summary.rate_limited ? ", stopped by rate limit" : ""
    );
    return summary;
}

}  // namespace tgdrive

#include "maintenance.hpp"
#include "config.hpp"
#include "engine.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <iostream>

namespace tgdrive::ctl {

int exec_sessions_reap() {
    auto config = require_config();
    if (!config) {
        return 1;
    }

    setup_file_logging();

    try {
        auto ctx = open_engine(*config);
        auto expired = ctx.engine->reap_sessions(Clock::now());
        for (const auto& session : expired) {
            std::cout << fmt::format("Expired {} ({}, item {})\n", session.id, session.file_name, session.item_id);
        }
        std::cout << expired.size() << " session(s) expired\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

int exec_deletes_list() {
    auto config = require_config();
    if (!config) {
        return 1;
    }

    try {
        auto ctx = open_engine(*config);
        auto& ledger = ctx.engine->ledger();
        auto pending = ledger.pending();

        if (pending.empty()) {
            std::cout << "No pending deletions.\n";
            return 0;
        }

        for (const auto& record : pending) {
            auto next = std::chrono::time_point_cast<std::chrono::seconds>(ledger.next_retry_at(record));
            std::cout << fmt::format(
                "#{} chat {} message {} ({}): {} attempt(s), next {:%Y-%m-%d %H:%M:%S}\n  {}\n",
                record.id,
                record.chat_id,
                record.message_id,
                record.item_path,
                record.retry_count,
                next,
                record.error_message
            );
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

int exec_deletes_retry() {
    auto config = require_config();
    if (!config) {
        return 1;
    }

    setup_file_logging();

    try {
        auto ctx = open_engine(*config);
        auto summary = ctx.engine->retry_failed_deletes(Clock::now());
        std::cout << fmt::format(
            "{} attempted, {} resolved, {} still failing{}\n",
            summary.attempted,
            summary.resolved,
            summary.failed,
            summary.rate_limited ? " (stopped by rate limit)" : ""
        );
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace tgdrive::ctl

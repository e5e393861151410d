#include "drive/upload_session_manager.hpp"

#include "drive/errors.hpp"
#include "tg/exceptions.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>

namespace tgdrive {

namespace {

std::vector<int> missing_indices(const std::vector<int>& received, int total) {
    std::vector<bool> seen(static_cast<size_t>(std::max(total, 0)), false);
    for (int index : received) {
        if (index >= 0 && index < total) {
            seen[static_cast<size_t>(index)] = true;
        }
    }

    std::vector<int> missing;
    for (int i = 0; i < total; ++i) {
        if (!seen[static_cast<size_t>(i)]) {
            missing.push_back(i);
        }
    }
    return missing;
}

/// First index not yet received (received is ascending)
int first_gap(const std::vector<int>& received) {
    int next = 0;
    for (int index : received) {
        if (index != next) {
            break;
        }
        ++next;
    }
    return next;
}

void validate_file_name(const std::string& name) {
    if (name.empty() || name == "." || name == ".." || name.find('/') != std::string::npos) {
        throw ValidationException(fmt::format("invalid file name '{}'", name));
    }
}

}  // namespace

UploadSessionManager::UploadSessionManager(
    MetadataStore& store,
    ProviderRegistry& registry,
    LocalStaging& staging,
    DeleteLedger& ledger,
    Config config
)
    : store_(store), registry_(registry), staging_(staging), ledger_(ledger), config_(config) {}

//------------------------------------------------------------------------------
// Start / resume / cancel
//------------------------------------------------------------------------------

UploadStart UploadSessionManager::start(
    const std::string& file_name,
    const std::string& mime_type,
    const std::optional<std::string>& parent_id,
    const UploadPlan& plan
) {
    validate_file_name(file_name);
    if (plan.total_chunks <= 0 || plan.chunk_size <= 0 || plan.file_size <= 0) {
        throw ValidationException("upload plan is empty");
    }

    // Staged uploads keep every chunk on disk until the merge
    staging_.ensure_space(plan.staging == StagingStrategy::LOCAL_MERGE ? plan.file_size : plan.chunk_size);

    auto now = Clock::now();

    Item item;
    item.name = file_name;
    item.parent_id = parent_id;
    if (!mime_type.empty()) {
        item.mime_type = mime_type;
    }

    UploadSession session;
    session.file_name = file_name;
    session.mime_type = mime_type;
    session.file_size = plan.file_size;
    session.chunk_size = plan.chunk_size;
    session.total_chunks = plan.total_chunks;
    session.staging = plan.staging;

    store_.create_upload(item, session, now);

    spdlog::info(
        "UploadSessionManager: started session {} for {} ({} bytes, {} chunk(s) of {}, {})",
        session.id,
        item.path,
        session.file_size,
        session.total_chunks,
        session.chunk_size,
        to_string(session.staging)
    );

    return UploadStart{std::move(item), std::move(session), plan, 0};
}

ResumeState UploadSessionManager::resume(const std::string& item_id) {
    auto session = store_.get_session_by_item(item_id);
    if (!session) {
        throw SessionNotFoundException("item " + item_id);
    }

    ResumeState state;
    state.received = received_indices(*session);
    state.next_chunk_index = first_gap(state.received);
    state.session = std::move(*session);

    spdlog::debug(
        "UploadSessionManager: resume item {} at chunk {}/{}", item_id, state.next_chunk_index, state.session.total_chunks
    );
    return state;
}

void UploadSessionManager::cancel(const std::string& session_id) {
    auto session = load_session(session_id);
    store_.delete_session(session.id);
    staging_.remove_session(session.id);
    spdlog::info("UploadSessionManager: cancelled session {} (item {})", session.id, session.item_id);
}

std::vector<UploadSession> UploadSessionManager::reap(Timestamp now) {
    auto cutoff = now - config_.session_ttl;
    auto expired = store_.delete_sessions_updated_before(cutoff);

    for (const auto& session : expired) {
        staging_.remove_session(session.id);
        spdlog::info(
            "UploadSessionManager: expired session {} (item {}, last activity {}s ago)",
            session.id,
            session.item_id,
            std::chrono::duration_cast<std::chrono::seconds>(now - session.updated_at).count()
        );
    }
    return expired;
}

UploadSession UploadSessionManager::load_session(const std::string& session_id) {
    auto session = store_.get_session(session_id);
    if (!session) {
        throw SessionNotFoundException(session_id);
    }
    return *session;
}

std::vector<int> UploadSessionManager::received_indices(const UploadSession& session) {
    std::vector<int> received;
    if (session.staging == StagingStrategy::LOCAL_MERGE) {
        for (int i = 0; i < session.total_chunks; ++i) {
            if (staging_.has_chunk(session.id, i, session.chunk_size_for_index(i))) {
                received.push_back(i);
            }
        }
        return received;
    }

    for (const auto& chunk : store_.list_chunks(session.item_id)) {
        received.push_back(chunk.chunk_index);
    }
    return received;
}

//------------------------------------------------------------------------------
// Chunks
//------------------------------------------------------------------------------

ChunkResult UploadSessionManager::accept_chunk(
    const std::string& session_id,
    int chunk_index,
    std::istream& data,
    std::stop_token stop,
    TransferLimiter* slots
) {
    auto session = load_session(session_id);

    if (session.status == SessionStatus::FAILED) {
        throw UploadChunkException(chunk_index, false, "upload session has failed");
    }
    if (chunk_index < 0 || chunk_index >= session.total_chunks) {
        throw InvalidChunkIndexException(chunk_index, 0, session.total_chunks);
    }

    if (session.staging == StagingStrategy::LOCAL_MERGE) {
        return accept_staged(session, chunk_index, data, slots);
    }
    return accept_direct(session, chunk_index, data, stop, slots);
}

ChunkResult UploadSessionManager::accept_direct(
    const UploadSession& session,
    int chunk_index,
    std::istream& data,
    std::stop_token stop,
    TransferLimiter* slots
) {
    auto received = received_indices(session);
    int expected = first_gap(received);

    if (std::binary_search(received.begin(), received.end(), chunk_index)) {
        auto existing = store_.get_chunk(session.item_id, chunk_index);
        spdlog::debug("UploadSessionManager: chunk {} of session {} already recorded", chunk_index, session.id);
        return ChunkAccepted{
            chunk_index, existing ? existing->chunk_size : 0, expected, session.total_chunks, true, existing
        };
    }
    if (chunk_index != expected) {
        throw InvalidChunkIndexException(chunk_index, expected, session.total_chunks);
    }

    TransferSlot slot;
    if (slots) {
        slot = TransferSlot(*slots, TransferKind::UPLOAD);
    }

    auto size = session.chunk_size_for_index(chunk_index);
    staging_.ensure_space(size);
    ScopedFile spool(staging_.spool(session.id, chunk_index, data, size));

    auto plan = ChunkPlanner::plan_with_chunk_size(
        session.file_name, session.mime_type, session.file_size, session.chunk_size, ProviderMode::OFFICIAL
    );
    auto name = chunk_file_name(session.file_name, session.item_id, chunk_index, session.total_chunks);
    auto caption = tg::chunk_caption(session.item_id, chunk_index);

    ProviderHandle provider;
    auto result = send_with_retry(
        session,
        chunk_index,
        [&](const ProviderHandle& handle, std::stop_token token) {
            provider = handle;
            std::ifstream in(spool.path(), std::ios::binary);
            if (!in.is_open()) {
                throw tg::FileException("cannot reopen spooled chunk " + spool.path().string());
            }
            return handle->send_stream(
                handle.config.storage_chat_id, plan.kind, name, in, size, caption, nullptr, token
            );
        },
        stop
    );

    if (auto* retry = std::get_if<tg::RetryAfter>(&result)) {
        spdlog::info(
            "UploadSessionManager: chunk {} of session {} rate limited, retry after {}s",
            chunk_index,
            session.id,
            retry->delay.count()
        );
        return *retry;
    }

    auto message = std::get<tg::Message>(std::move(result));
    auto file = require_file(provider, session, chunk_index, message, stop);

    Chunk chunk;
    chunk.item_id = session.item_id;
    chunk.chunk_index = chunk_index;
    chunk.chunk_size = size;
    chunk.chat_id = message.chat_id.empty() ? provider.config.storage_chat_id : message.chat_id;
    chunk.message_id = message.message_id;
    chunk.file_id = file.file_id;
    chunk.file_unique_id = file.file_unique_id;
    chunk.created_at = Clock::now();

    bool inserted = false;
    try {
        inserted = store_.record_chunk(chunk, session.id, chunk.created_at);
    } catch (const DatabaseException& e) {
        spdlog::error("UploadSessionManager: failed to record chunk {} of session {}: {}", chunk_index, session.id, e.what());
        discard_message(provider, session, chunk.message_id);
        throw;
    }

    if (!inserted) {
        // A concurrent replay recorded this index first
        spdlog::warn(
            "UploadSessionManager: chunk {} of session {} recorded concurrently, discarding message {}",
            chunk_index,
            session.id,
            chunk.message_id
        );
        discard_message(provider, session, chunk.message_id);
        auto existing = store_.get_chunk(session.item_id, chunk_index);
        return ChunkAccepted{
            chunk_index, size, first_gap(received_indices(session)), session.total_chunks, true, existing
        };
    }

    spdlog::debug(
        "UploadSessionManager: chunk {}/{} of session {} stored as message {}",
        chunk_index + 1,
        session.total_chunks,
        session.id,
        chunk.message_id
    );
    return ChunkAccepted{chunk_index, size, chunk_index + 1, session.total_chunks, false, std::move(chunk)};
}

ChunkResult UploadSessionManager::accept_staged(
    const UploadSession& session,
    int chunk_index,
    std::istream& data,
    TransferLimiter* slots
) {
    auto received = received_indices(session);
    int expected = first_gap(received);
    auto size = session.chunk_size_for_index(chunk_index);

    if (std::binary_search(received.begin(), received.end(), chunk_index)) {
        return ChunkAccepted{chunk_index, size, expected, session.total_chunks, true, std::nullopt};
    }
    if (chunk_index != expected) {
        throw InvalidChunkIndexException(chunk_index, expected, session.total_chunks);
    }

    TransferSlot slot;
    if (slots) {
        slot = TransferSlot(*slots, TransferKind::UPLOAD);
    }

    staging_.ensure_space(size);
    staging_.stage_chunk(session.id, chunk_index, data, size);
    store_.touch_session(session.id, Clock::now());

    return ChunkAccepted{chunk_index, size, chunk_index + 1, session.total_chunks, false, std::nullopt};
}

//------------------------------------------------------------------------------
// Completion
//------------------------------------------------------------------------------

CompleteResult UploadSessionManager::complete(const std::string& session_id, std::stop_token stop) {
    auto session = load_session(session_id);

    if (session.status == SessionStatus::FAILED) {
        throw UploadChunkException(0, false, "upload session has failed");
    }

    auto missing = missing_indices(received_indices(session), session.total_chunks);
    if (!missing.empty()) {
        spdlog::debug("UploadSessionManager: session {} missing chunks [{}]", session.id, fmt::join(missing, ", "));
        throw IncompleteUploadException(std::move(missing));
    }

    if (session.staging == StagingStrategy::LOCAL_MERGE) {
        return complete_staged(session, stop);
    }
    return complete_direct(session);
}

CompleteResult UploadSessionManager::complete_direct(const UploadSession& session) {
    auto chunks = store_.list_chunks(session.item_id);

    int64_t total = 0;
    for (const auto& chunk : chunks) {
        total += chunk.chunk_size;
    }
    if (static_cast<int>(chunks.size()) != session.total_chunks || total != session.file_size) {
        throw CorruptedItemException(
            session.item_id,
            fmt::format("{} chunk(s) totalling {} bytes, expected {} bytes", chunks.size(), total, session.file_size)
        );
    }

    auto item = store_.finalize_upload(session, std::nullopt, Clock::now());
    staging_.remove_session(session.id);

    spdlog::info("UploadSessionManager: completed {} ({} bytes, {} chunk(s))", item.path, item.size, chunks.size());
    return item;
}

CompleteResult UploadSessionManager::complete_staged(const UploadSession& session, std::stop_token stop) {
    std::vector<int64_t> sizes;
    sizes.reserve(static_cast<size_t>(session.total_chunks));
    for (int i = 0; i < session.total_chunks; ++i) {
        sizes.push_back(session.chunk_size_for_index(i));
    }

    staging_.ensure_space(session.file_size);
    auto merged = staging_.merge(session.id, sizes);

    auto caption = tg::chunk_caption(session.item_id, 0);
    auto file_name = chunk_file_name(session.file_name, session.item_id, 0, 1);

    ProviderHandle provider;
    auto result = send_with_retry(
        session,
        0,
        [&](const ProviderHandle& handle, std::stop_token token) -> tg::ApiResult<tg::Message> {
            provider = handle;
            auto plan = ChunkPlanner::plan_with_chunk_size(
                session.file_name, session.mime_type, session.file_size, session.file_size, handle.config.mode
            );
            if (handle.self_hosted()) {
                return handle->send_local_path(
                    handle.config.storage_chat_id, plan.kind, merged.string(), caption, nullptr, token
                );
            }

            // The provider was swapped to the official API after staging began
            if (session.file_size > tg::single_upload_limit(plan.kind, false)) {
                throw tg::ApiException(
                    tg::upload_kind_method(plan.kind),
                    413,
                    fmt::format("file of {} bytes is too large for the active provider", session.file_size)
                );
            }
            std::ifstream in(merged, std::ios::binary);
            if (!in.is_open()) {
                throw tg::FileException("cannot open merged file " + merged.string());
            }
            return handle->send_stream(
                handle.config.storage_chat_id, plan.kind, file_name, in, session.file_size, caption, nullptr, token
            );
        },
        stop
    );

    if (auto* retry = std::get_if<tg::RetryAfter>(&result)) {
        spdlog::info(
            "UploadSessionManager: merged send of session {} rate limited, retry after {}s", session.id, retry->delay.count()
        );
        return *retry;
    }

    auto message = std::get<tg::Message>(std::move(result));
    auto file = require_file(provider, session, 0, message, stop);

    Chunk chunk;
    chunk.item_id = session.item_id;
    chunk.chunk_index = 0;
    chunk.chunk_size = session.file_size;
    chunk.chat_id = message.chat_id.empty() ? provider.config.storage_chat_id : message.chat_id;
    chunk.message_id = message.message_id;
    chunk.file_id = file.file_id;
    chunk.file_unique_id = file.file_unique_id;
    chunk.created_at = Clock::now();

    Item item;
    try {
        item = store_.finalize_upload(session, chunk, chunk.created_at);
    } catch (const DriveException& e) {
        spdlog::error("UploadSessionManager: failed to finalize session {}: {}", session.id, e.what());
        discard_message(provider, session, chunk.message_id);
        throw;
    }

    staging_.remove_session(session.id);
    spdlog::info("UploadSessionManager: completed {} ({} bytes, merged from {} chunk(s))", item.path, item.size, sizes.size());
    return item;
}

//------------------------------------------------------------------------------
// Provider plumbing
//------------------------------------------------------------------------------

template <typename Send>
tg::ApiResult<tg::Message> UploadSessionManager::send_with_retry(
    const UploadSession& session,
    int chunk_index,
    Send&& send,
    std::stop_token stop
) {
    const int max_attempts = std::max(1, config_.send_retry.max_attempts);

    for (int attempt = 1;; ++attempt) {
        try {
            // The registry is consulted per attempt so a hot swap applies to the next call
            return send(registry_.current(), stop);
        } catch (const tg::CancelledException& e) {
            throw UploadChunkException(chunk_index, true, e.what());
        } catch (const tg::NetworkException& e) {
            if (attempt >= max_attempts) {
                spdlog::warn(
                    "UploadSessionManager: chunk {} of session {} gave up after {} attempt(s): {}",
                    chunk_index,
                    session.id,
                    attempt,
                    e.what()
                );
                throw UploadChunkException(chunk_index, true, e.what());
            }
            spdlog::debug(
                "UploadSessionManager: chunk {} of session {} attempt {} failed: {}", chunk_index, session.id, attempt, e.what()
            );
            if (!interruptible_sleep(config_.send_retry.backoff_for(attempt), stop)) {
                throw UploadChunkException(chunk_index, true, "cancelled");
            }
        } catch (const tg::FileException& e) {
            // Local I/O trouble, the session itself is fine
            throw UploadChunkException(chunk_index, true, e.what());
        } catch (const tg::TelegramException& e) {
            mark_failed(session, e.what());
            throw UploadChunkException(chunk_index, false, e.what());
        }
    }
}

tg::PrimaryFile UploadSessionManager::require_file(
    const ProviderHandle& provider,
    const UploadSession& session,
    int chunk_index,
    const tg::Message& message,
    std::stop_token stop
) {
    if (message.has_file()) {
        return *message.file;
    }

    // Some answers omit the media object; a forwarded copy carries it
    spdlog::debug("UploadSessionManager: message {} has no file, recovering by forward", message.message_id);
    auto chat_id = message.chat_id.empty() ? provider.config.storage_chat_id : message.chat_id;

    std::optional<tg::PrimaryFile> file;
    try {
        auto forwarded = provider->forward_message(chat_id, chat_id, message.message_id, stop);
        if (auto* copy = std::get_if<tg::Message>(&forwarded)) {
            if (copy->has_file()) {
                file = copy->file;
            }
            discard_message(provider, session, copy->message_id);
        }
    } catch (const tg::TelegramException& e) {
        spdlog::warn("UploadSessionManager: forward of message {} failed: {}", message.message_id, e.what());
    }

    if (!file) {
        discard_message(provider, session, message.message_id);
        mark_failed(session, "provider answer carried no file");
        throw UploadChunkException(chunk_index, false, "provider answer carried no file");
    }
    return *file;
}

void UploadSessionManager::mark_failed(const UploadSession& session, const std::string& reason) {
    spdlog::error("UploadSessionManager: session {} failed: {}", session.id, reason);
    store_.set_session_status(session.id, SessionStatus::FAILED, Clock::now());
}

void UploadSessionManager::discard_message(const ProviderHandle& provider, const UploadSession& session, int64_t message_id) {
    auto item = store_.get_item(session.item_id);
    ledger_.delete_or_record(
        *provider,
        provider.config.storage_chat_id,
        message_id,
        session.item_id,
        item ? item->path : session.file_name,
        config_.cleanup_delete_retry,
        {}
    );
}

}  // namespace tgdrive

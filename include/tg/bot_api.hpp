#pragma once

#include "tg/types.hpp"

#include <cstdint>
#include <istream>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace tg {

/// Abstract client for a Telegram-style Bot HTTP API
///
/// Every call returns either its result or a RetryAfter rate-limit signal.
/// Every other failure is thrown as a TelegramException subclass.
/// The stop token aborts an in-flight request (CancelledException).
class BotApi {
public:
    virtual ~BotApi() = default;

    /// Upload `size` bytes read from `data` as a new message
    /// @param video Optional sendVideo side-channel parts (ignored for other kinds)
    virtual ApiResult<Message> send_stream(
        const std::string& chat_id,
        UploadKind kind,
        const std::string& file_name,
        std::istream& data,
        int64_t size,
        const std::string& caption,
        const VideoOptions* video,
        std::stop_token stop
    ) = 0;

    /// Send a file the API server can read from its own disk (local Bot API servers only)
    virtual ApiResult<Message> send_local_path(
        const std::string& chat_id,
        UploadKind kind,
        const std::string& local_path,
        const std::string& caption,
        const VideoOptions* video,
        std::stop_token stop
    ) = 0;

    /// Re-send a file already stored by the provider
    virtual ApiResult<Message> send_existing(
        const std::string& chat_id,
        UploadKind kind,
        const std::string& file_id,
        const std::string& caption,
        std::stop_token stop
    ) = 0;

    virtual ApiResult<Message> forward_message(
        const std::string& to_chat_id,
        const std::string& from_chat_id,
        int64_t message_id,
        std::stop_token stop
    ) = 0;

    /// Resolve a file reference to a download path
    virtual ApiResult<File> get_file(const std::string& file_id, std::stop_token stop) = 0;

    /// Delete a message; a message that no longer exists counts as deleted
    virtual ApiResult<DeleteStatus> delete_message(const std::string& chat_id, int64_t message_id, std::stop_token stop) = 0;

    /// Fetch `length` bytes starting at `offset` of a relative download path
    virtual std::string fetch_file_range(
        const std::string& file_path,
        int64_t offset,
        int64_t length,
        std::stop_token stop
    ) = 0;

    virtual ApiResult<BotUser> get_me(std::stop_token stop) = 0;
    virtual ApiResult<Chat> get_chat(const std::string& chat_id, std::stop_token stop) = 0;
    virtual ApiResult<std::vector<ChatMember>> get_chat_administrators(const std::string& chat_id, std::stop_token stop) = 0;

    /// Human-readable endpoint description, safe to log (no credentials)
    [[nodiscard]] virtual std::string describe() const = 0;
};

/// Verify that the credential belongs to a bot administering the storage chat
/// @throws BotValidationException when either condition fails
void run_self_check(BotApi& api, const std::string& storage_chat_id, std::stop_token stop = {});

/// True for 400 answers meaning the message is already gone
bool is_ignorable_delete_error(int code, std::string_view description);

/// Build the caption attached to a chunk message
std::string chunk_caption(std::string_view item_id, int chunk_index);

}  // namespace tg

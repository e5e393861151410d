#pragma once

#include "tg/bot_api.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

namespace tg {

/// Configuration for BotApiClient
struct BotApiClientConfig {
    std::string token;
    std::string base_url{kDefaultApiBaseUrl};
    std::chrono::seconds connect_timeout{15};
    std::chrono::seconds request_timeout{60};   // JSON method calls
    std::chrono::seconds stall_timeout{120};    // Uploads/downloads below 1 KiB/s for this long abort
};

/// Bot HTTP API client backed by libcurl
///
/// Thread-safe: each call uses its own easy handle.
class BotApiClient : public BotApi {
public:
    using Config = BotApiClientConfig;

    explicit BotApiClient(Config config);
    ~BotApiClient() override;

    // Disable copy
    BotApiClient(const BotApiClient&) = delete;
    BotApiClient& operator=(const BotApiClient&) = delete;

    ApiResult<Message> send_stream(
        const std::string& chat_id,
        UploadKind kind,
        const std::string& file_name,
        std::istream& data,
        int64_t size,
        const std::string& caption,
        const VideoOptions* video,
        std::stop_token stop
    ) override;

    ApiResult<Message> send_local_path(
        const std::string& chat_id,
        UploadKind kind,
        const std::string& local_path,
        const std::string& caption,
        const VideoOptions* video,
        std::stop_token stop
    ) override;

    ApiResult<Message> send_existing(
        const std::string& chat_id,
        UploadKind kind,
        const std::string& file_id,
        const std::string& caption,
        std::stop_token stop
    ) override;

    ApiResult<Message> forward_message(
        const std::string& to_chat_id,
        const std::string& from_chat_id,
        int64_t message_id,
        std::stop_token stop
    ) override;

    ApiResult<File> get_file(const std::string& file_id, std::stop_token stop) override;
    ApiResult<DeleteStatus> delete_message(const std::string& chat_id, int64_t message_id, std::stop_token stop) override;

    std::string fetch_file_range(
        const std::string& file_path,
        int64_t offset,
        int64_t length,
        std::stop_token stop
    ) override;

    ApiResult<BotUser> get_me(std::stop_token stop) override;
    ApiResult<Chat> get_chat(const std::string& chat_id, std::stop_token stop) override;
    ApiResult<std::vector<ChatMember>> get_chat_administrators(const std::string& chat_id, std::stop_token stop) override;

    [[nodiscard]] std::string describe() const override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// Request/response helpers (exposed for tests)

/// {base}/bot{token}/{method}
std::string build_method_url(std::string_view base_url, std::string_view token, std::string_view method);

/// {base}/file/bot{token}/{file_path}
std::string build_file_url(std::string_view base_url, std::string_view token, std::string_view file_path);

/// Absolute path to a file:// URI accepted by local Bot API servers
std::string local_path_to_file_uri(std::string_view path);

/// Replace every occurrence of the token so the text can be logged
std::string redact_token(std::string text, std::string_view token);

/// Decode the {ok, result, description, error_code, parameters} envelope
/// @return The `result` member, or RetryAfter for 429 answers with retry_after
/// @throws ApiException when ok is false, InvalidResponseException when the body is not an envelope
ApiResult<nlohmann::json> parse_api_response(std::string_view method, long http_status, const std::string& body);

}  // namespace tg

#pragma once

#include "tg/bot_api.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tg {

/// Message stored by the mock
struct MockMessage {
    std::string chat_id;
    int64_t message_id{0};
    UploadKind kind{UploadKind::DOCUMENT};
    std::string file_name;
    std::string caption;
    std::string file_id;
    std::string file_unique_id;
    std::string data;
};

/// Scripted failure for the next send call
struct MockFailure {
    enum class Type { RATE_LIMIT, API_ERROR, NETWORK_ERROR };

    Type type{Type::API_ERROR};
    std::chrono::seconds retry_after{0};
    int code{400};
    std::string description;
};

/// In-memory Bot API
///
/// Keeps sent files in memory and serves them back through get_file and
/// fetch_file_range. Failures, identity and admin rights are scriptable so
/// upload, download, hot-swap and deletion paths can run without a network.
class MockBotApi : public BotApi {
public:
    explicit MockBotApi(std::string name = "mock");
    ~MockBotApi() override = default;

    // Disable copy
    MockBotApi(const MockBotApi&) = delete;
    MockBotApi& operator=(const MockBotApi&) = delete;

    // BotApi interface implementation
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

    [[nodiscard]] std::string describe() const override { return "mock:" + name_; }

    // Mock-specific methods for testing/configuration
    void set_is_bot(bool is_bot);
    void set_is_admin(bool is_admin);
    void set_chat_accessible(bool accessible);

    /// Queue a failure consumed by the next send call (FIFO)
    void queue_send_failure(MockFailure failure);

    /// Queue a failure consumed by the next delete call (FIFO)
    void queue_delete_failure(MockFailure failure);

    /// Fail every delete with a non-ignorable error until turned off
    void set_deletes_failing(bool failing);

    /// Return sent messages without their file object (forces recovery by forwarding)
    void set_omit_sent_files(bool omit);

    /// Serve get_file as absolute paths under `dir`, like a local Bot API server
    void set_local_file_root(std::filesystem::path dir);

    [[nodiscard]] std::size_t message_count() const;
    [[nodiscard]] std::size_t send_count() const;
    [[nodiscard]] std::size_t delete_count() const;
    [[nodiscard]] std::optional<MockMessage> find_message(const std::string& chat_id, int64_t message_id) const;
    [[nodiscard]] std::vector<MockMessage> messages() const;

private:
    /// Store a new message and build the API answer (caller holds mutex_)
    Message store_message(MockMessage msg);

    /// Pop the next scripted send failure and apply it (caller holds mutex_)
    std::optional<RetryAfter> consume_send_failure();

    void check_stop(const std::stop_token& stop, const char* operation) const;

    std::string name_;
    int64_t bot_id_{7000001};
    bool is_bot_{true};
    bool is_admin_{true};
    bool chat_accessible_{true};
    bool deletes_failing_{false};
    bool omit_sent_files_{false};
    std::optional<std::filesystem::path> local_file_root_;

    int64_t next_message_id_{1};
    int64_t next_file_id_{1};
    std::size_t send_count_{0};
    std::size_t delete_count_{0};

    std::deque<MockFailure> send_failures_;
    std::deque<MockFailure> delete_failures_;

    // (chat_id, message_id) -> message
    std::map<std::pair<std::string, int64_t>, MockMessage> messages_;
    // file_id -> stored bytes (shared between forwarded copies)
    std::map<std::string, std::string> files_;

    mutable std::mutex mutex_;
};

}  // namespace tg

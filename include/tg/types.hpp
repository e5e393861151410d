#pragma once

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tg {

// Bot API single-message upload ceilings
inline constexpr int64_t kOfficialPhotoLimit = 10LL * 1024 * 1024;          // 10 MiB
inline constexpr int64_t kOfficialUploadLimit = 50LL * 1024 * 1024;         // 50 MiB
inline constexpr int64_t kSelfHostedPhotoLimit = 10LL * 1024 * 1024;        // 10 MiB
inline constexpr int64_t kSelfHostedUploadLimit = 2000LL * 1024 * 1024;     // 2000 MiB

inline constexpr std::string_view kDefaultApiBaseUrl = "https://api.telegram.org";

// Enumerations
enum class UploadKind { DOCUMENT, PHOTO, VIDEO, AUDIO, ANIMATION };

enum class DeleteStatus {
    DELETED,      // Message removed by this call
    ALREADY_GONE  // Provider reported the message as missing
};

/// Rate-limit signal (HTTP 429 with parameters.retry_after)
struct RetryAfter {
    std::chrono::seconds delay{0};
    std::string description;
};

/// Result of a provider call: either the value or a rate-limit signal
template <typename T>
using ApiResult = std::variant<T, RetryAfter>;

template <typename T>
bool is_rate_limited(const ApiResult<T>& result) {
    return std::holds_alternative<RetryAfter>(result);
}

// Data structures

/// The single file attached to a message, whatever media subtype carried it
struct PrimaryFile {
    std::string file_id;
    std::string file_unique_id;
    std::string file_name;
    std::string mime_type;
    int64_t file_size{0};
};

struct Message {
    int64_t message_id{0};
    std::string chat_id;
    std::string caption;
    std::optional<PrimaryFile> file;

    bool has_file() const { return file.has_value() && !file->file_id.empty(); }
};

struct File {
    std::string file_id;
    std::string file_unique_id;
    int64_t file_size{0};
    std::string file_path;  // Relative for api.telegram.org, absolute for local servers
};

struct BotUser {
    int64_t id{0};
    bool is_bot{false};
    std::string username;
    std::string first_name;
};

struct Chat {
    std::string id;
    std::string type;
    std::string title;
    std::string username;
};

struct ChatMember {
    int64_t user_id{0};
    std::string status;  // creator, administrator, ...
};

/// Optional side-channel parts of a sendVideo call
struct VideoOptions {
    std::string thumbnail_path;  // Local image, empty for none
    std::string cover_path;      // Local image, empty for none
    bool supports_streaming{true};
};

// Utility functions
std::string upload_kind_to_string(UploadKind kind);
std::string upload_kind_method(UploadKind kind);  // sendDocument, sendPhoto, ...
std::string normalize_mime_type(std::string_view mime_type);
UploadKind select_upload_kind(std::string_view file_name, std::string_view mime_type);
int64_t single_upload_limit(UploadKind kind, bool self_hosted);

// JSON decoding of Bot API result objects
std::optional<PrimaryFile> extract_primary_file(const nlohmann::json& message);
Message parse_message(const nlohmann::json& message);
File parse_file(const nlohmann::json& file);
BotUser parse_user(const nlohmann::json& user);
Chat parse_chat(const nlohmann::json& chat);
ChatMember parse_chat_member(const nlohmann::json& member);

}  // namespace tg

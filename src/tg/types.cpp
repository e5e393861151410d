#include "tg/types.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <cctype>

namespace tg {

namespace {

std::string to_lower(std::string_view value) {
    std::string result(value);
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string lower_extension(std::string_view file_name) {
    auto pos = file_name.find_last_of('.');
    if (pos == std::string_view::npos || pos + 1 == file_name.size()) {
        return "";
    }
    return to_lower(file_name.substr(pos));
}

template <std::size_t N>
bool contains(const std::array<std::string_view, N>& values, std::string_view value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

constexpr std::array<std::string_view, 9> kVideoExtensions = {
    ".mp4", ".mov", ".m4v", ".webm", ".mkv", ".avi", ".mpeg", ".mpg", ".3gp"
};
constexpr std::array<std::string_view, 4> kPhotoExtensions = {".jpg", ".jpeg", ".png", ".webp"};
constexpr std::array<std::string_view, 4> kPhotoMimeTypes = {"image/jpeg", "image/jpg", "image/png", "image/webp"};
constexpr std::array<std::string_view, 8> kAudioExtensions = {
    ".mp3", ".m4a", ".aac", ".ogg", ".oga", ".flac", ".wav", ".opus"
};

// Media fields that carry exactly one file object, in preference order
constexpr std::array<std::string_view, 7> kFileFields = {
    "document", "video", "audio", "animation", "voice", "video_note", "sticker"
};

std::string json_id_to_string(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number_integer()) {
        return std::to_string(value.get<int64_t>());
    }
    return "";
}

PrimaryFile parse_primary_file(const nlohmann::json& obj) {
    PrimaryFile file;
    file.file_id = obj.value("file_id", "");
    file.file_unique_id = obj.value("file_unique_id", "");
    file.file_name = obj.value("file_name", "");
    file.mime_type = obj.value("mime_type", "");
    file.file_size = obj.value("file_size", int64_t{0});
    return file;
}

}  // namespace

std::string upload_kind_to_string(UploadKind kind) {
    switch (kind) {
        case UploadKind::PHOTO:
            return "photo";
        case UploadKind::VIDEO:
            return "video";
        case UploadKind::AUDIO:
            return "audio";
        case UploadKind::ANIMATION:
            return "animation";
        case UploadKind::DOCUMENT:
        default:
            return "document";
    }
}

std::string upload_kind_method(UploadKind kind) {
    switch (kind) {
        case UploadKind::PHOTO:
            return "sendPhoto";
        case UploadKind::VIDEO:
            return "sendVideo";
        case UploadKind::AUDIO:
            return "sendAudio";
        case UploadKind::ANIMATION:
            return "sendAnimation";
        case UploadKind::DOCUMENT:
        default:
            return "sendDocument";
    }
}

std::string normalize_mime_type(std::string_view mime_type) {
    auto semicolon = mime_type.find(';');
    if (semicolon != std::string_view::npos) {
        mime_type = mime_type.substr(0, semicolon);
    }
    while (!mime_type.empty() && std::isspace(static_cast<unsigned char>(mime_type.front()))) {
        mime_type.remove_prefix(1);
    }
    while (!mime_type.empty() && std::isspace(static_cast<unsigned char>(mime_type.back()))) {
        mime_type.remove_suffix(1);
    }
    return to_lower(mime_type);
}

UploadKind select_upload_kind(std::string_view file_name, std::string_view mime_type) {
    auto ext = lower_extension(file_name);
    auto mime = normalize_mime_type(mime_type);

    if (contains(kVideoExtensions, ext) || mime.starts_with("video/")) {
        return UploadKind::VIDEO;
    }
    if (ext == ".gif" || mime == "image/gif") {
        return UploadKind::ANIMATION;
    }
    if (contains(kPhotoExtensions, ext) || contains(kPhotoMimeTypes, mime)) {
        return UploadKind::PHOTO;
    }
    if (contains(kAudioExtensions, ext) || mime.starts_with("audio/")) {
        return UploadKind::AUDIO;
    }
    return UploadKind::DOCUMENT;
}

int64_t single_upload_limit(UploadKind kind, bool self_hosted) {
    if (kind == UploadKind::PHOTO) {
        return self_hosted ? kSelfHostedPhotoLimit : kOfficialPhotoLimit;
    }
    return self_hosted ? kSelfHostedUploadLimit : kOfficialUploadLimit;
}

std::optional<PrimaryFile> extract_primary_file(const nlohmann::json& message) {
    for (auto field : kFileFields) {
        auto it = message.find(std::string(field));
        if (it == message.end() || !it->is_object()) {
            continue;
        }
        auto file = parse_primary_file(*it);
        if (!file.file_id.empty()) {
            return file;
        }
    }

    // Photos arrive as a list of sizes, keep the largest
    auto photos = message.find("photo");
    if (photos != message.end() && photos->is_array() && !photos->empty()) {
        const nlohmann::json* best = nullptr;
        int64_t best_size = -1;
        for (const auto& size : *photos) {
            auto candidate = size.value("file_size", int64_t{0});
            if (candidate > best_size || best == nullptr) {
                best = &size;
                best_size = candidate;
            }
        }
        auto file = parse_primary_file(*best);
        if (file.mime_type.empty()) {
            file.mime_type = "image/jpeg";
        }
        if (!file.file_id.empty()) {
            return file;
        }
    }

    return std::nullopt;
}

Message parse_message(const nlohmann::json& message) {
    Message msg;
    msg.message_id = message.value("message_id", int64_t{0});
    msg.caption = message.value("caption", "");
    if (auto chat = message.find("chat"); chat != message.end() && chat->is_object()) {
        msg.chat_id = json_id_to_string(chat->value("id", nlohmann::json()));
    }
    msg.file = extract_primary_file(message);
    return msg;
}

File parse_file(const nlohmann::json& file) {
    File result;
    result.file_id = file.value("file_id", "");
    result.file_unique_id = file.value("file_unique_id", "");
    result.file_size = file.value("file_size", int64_t{0});
    result.file_path = file.value("file_path", "");
    return result;
}

BotUser parse_user(const nlohmann::json& user) {
    BotUser result;
    result.id = user.value("id", int64_t{0});
    result.is_bot = user.value("is_bot", false);
    result.username = user.value("username", "");
    result.first_name = user.value("first_name", "");
    return result;
}

Chat parse_chat(const nlohmann::json& chat) {
    Chat result;
    result.id = json_id_to_string(chat.value("id", nlohmann::json()));
    result.type = chat.value("type", "");
    result.title = chat.value("title", "");
    result.username = chat.value("username", "");
    return result;
}

ChatMember parse_chat_member(const nlohmann::json& member) {
    ChatMember result;
    result.status = member.value("status", "");
    if (auto user = member.find("user"); user != member.end() && user->is_object()) {
        result.user_id = user->value("id", int64_t{0});
    }
    return result;
}

}  // namespace tg

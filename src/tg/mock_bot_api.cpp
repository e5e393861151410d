#include "tg/mock_bot_api.hpp"

#include "tg/exceptions.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <iterator>
#include <sstream>

namespace tg {

namespace {

constexpr std::string_view kRelativePrefix = "documents/";

}  // namespace

MockBotApi::MockBotApi(std::string name) : name_(std::move(name)) {}

void MockBotApi::check_stop(const std::stop_token& stop, const char* operation) const {
    if (stop.stop_requested()) {
        throw CancelledException(operation);
    }
}

std::optional<RetryAfter> MockBotApi::consume_send_failure() {
    if (send_failures_.empty()) {
        return std::nullopt;
    }

    auto failure = send_failures_.front();
    send_failures_.pop_front();

    switch (failure.type) {
        case MockFailure::Type::RATE_LIMIT:
            return RetryAfter{failure.retry_after, "Too Many Requests: retry after " + std::to_string(failure.retry_after.count())};
        case MockFailure::Type::NETWORK_ERROR:
            throw NetworkException("mock network failure: " + failure.description);
        case MockFailure::Type::API_ERROR:
        default:
            throw ApiException("send", failure.code, failure.description);
    }
}

Message MockBotApi::store_message(MockMessage msg) {
    msg.message_id = next_message_id_++;
    if (msg.file_id.empty()) {
        auto n = next_file_id_++;
        msg.file_id = fmt::format("{}-file-{}", name_, n);
        msg.file_unique_id = fmt::format("{}-uniq-{}", name_, n);
        files_[msg.file_id] = msg.data;
    }

    Message result;
    result.message_id = msg.message_id;
    result.chat_id = msg.chat_id;
    result.caption = msg.caption;
    if (!omit_sent_files_) {
        PrimaryFile file;
        file.file_id = msg.file_id;
        file.file_unique_id = msg.file_unique_id;
        file.file_name = msg.file_name;
        file.file_size = static_cast<int64_t>(msg.data.size());
        result.file = file;
    }

    ++send_count_;
    messages_[{msg.chat_id, msg.message_id}] = std::move(msg);
    return result;
}

ApiResult<Message> MockBotApi::send_stream(
    const std::string& chat_id,
    UploadKind kind,
    const std::string& file_name,
    std::istream& data,
    int64_t size,
    const std::string& caption,
    const VideoOptions*,
    std::stop_token stop
) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_stop(stop, "send_stream");

    if (auto retry = consume_send_failure()) {
        return *retry;
    }

    std::string bytes(static_cast<size_t>(size), '\0');
    data.read(bytes.data(), size);
    if (data.gcount() != size) {
        throw FileException(fmt::format("mock send: expected {} bytes, stream had {}", size, data.gcount()));
    }

    MockMessage msg;
    msg.chat_id = chat_id;
    msg.kind = kind;
    msg.file_name = file_name;
    msg.caption = caption;
    msg.data = std::move(bytes);

    spdlog::debug("MockBotApi[{}]: {} {} ({} bytes) to {}", name_, upload_kind_method(kind), file_name, size, chat_id);
    return store_message(std::move(msg));
}

ApiResult<Message> MockBotApi::send_local_path(
    const std::string& chat_id,
    UploadKind kind,
    const std::string& local_path,
    const std::string& caption,
    const VideoOptions*,
    std::stop_token stop
) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_stop(stop, "send_local_path");

    if (auto retry = consume_send_failure()) {
        return *retry;
    }

    std::ifstream in(local_path, std::ios::binary);
    if (!in.is_open()) {
        throw ApiException(upload_kind_method(kind), 400, "Bad Request: file not found: " + local_path);
    }

    MockMessage msg;
    msg.chat_id = chat_id;
    msg.kind = kind;
    msg.file_name = std::filesystem::path(local_path).filename().string();
    msg.caption = caption;
    msg.data.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());

    return store_message(std::move(msg));
}

ApiResult<Message> MockBotApi::send_existing(
    const std::string& chat_id,
    UploadKind kind,
    const std::string& file_id,
    const std::string& caption,
    std::stop_token stop
) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_stop(stop, "send_existing");

    if (auto retry = consume_send_failure()) {
        return *retry;
    }

    auto it = files_.find(file_id);
    if (it == files_.end()) {
        throw ApiException(upload_kind_method(kind), 400, "Bad Request: wrong file identifier");
    }

    MockMessage msg;
    msg.chat_id = chat_id;
    msg.kind = kind;
    msg.caption = caption;
    msg.file_id = file_id;
    msg.file_unique_id = file_id + "-uniq";
    msg.data = it->second;
    return store_message(std::move(msg));
}

ApiResult<Message> MockBotApi::forward_message(
    const std::string& to_chat_id,
    const std::string& from_chat_id,
    int64_t message_id,
    std::stop_token stop
) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_stop(stop, "forward_message");

    auto it = messages_.find({from_chat_id, message_id});
    if (it == messages_.end()) {
        throw ApiException("forwardMessage", 400, "Bad Request: message to forward not found");
    }

    MockMessage copy = it->second;
    copy.chat_id = to_chat_id;

    // Forwarded copies always carry their file object
    bool omit = omit_sent_files_;
    omit_sent_files_ = false;
    auto result = store_message(std::move(copy));
    omit_sent_files_ = omit;
    return result;
}

ApiResult<File> MockBotApi::get_file(const std::string& file_id, std::stop_token stop) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_stop(stop, "get_file");

    auto it = files_.find(file_id);
    if (it == files_.end()) {
        throw ApiException("getFile", 400, "Bad Request: invalid file_id");
    }

    File file;
    file.file_id = file_id;
    file.file_size = static_cast<int64_t>(it->second.size());

    if (local_file_root_) {
        auto path = *local_file_root_ / file_id;
        if (!std::filesystem::exists(path)) {
            std::filesystem::create_directories(*local_file_root_);
            std::ofstream out(path, std::ios::binary);
            out.write(it->second.data(), static_cast<std::streamsize>(it->second.size()));
        }
        file.file_path = path.string();
    } else {
        file.file_path = std::string(kRelativePrefix) + file_id;
    }
    return file;
}

ApiResult<DeleteStatus> MockBotApi::delete_message(const std::string& chat_id, int64_t message_id, std::stop_token stop) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_stop(stop, "delete_message");

    if (!delete_failures_.empty()) {
        auto failure = delete_failures_.front();
        delete_failures_.pop_front();
        if (failure.type == MockFailure::Type::RATE_LIMIT) {
            return RetryAfter{failure.retry_after, "Too Many Requests"};
        }
        if (failure.type == MockFailure::Type::NETWORK_ERROR) {
            throw NetworkException("mock network failure: " + failure.description);
        }
        throw ApiException("deleteMessage", failure.code, failure.description);
    }

    if (deletes_failing_) {
        throw ApiException("deleteMessage", 400, "Bad Request: message can't be deleted");
    }

    ++delete_count_;
    if (messages_.erase({chat_id, message_id}) == 0) {
        return DeleteStatus::ALREADY_GONE;
    }
    return DeleteStatus::DELETED;
}

std::string MockBotApi::fetch_file_range(
    const std::string& file_path,
    int64_t offset,
    int64_t length,
    std::stop_token stop
) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_stop(stop, "fetch_file_range");

    std::string_view path(file_path);
    if (!path.starts_with(kRelativePrefix)) {
        throw FileDownloadException(file_path, "HTTP 404");
    }
    path.remove_prefix(kRelativePrefix.size());

    auto it = files_.find(std::string(path));
    if (it == files_.end()) {
        throw FileDownloadException(file_path, "HTTP 404");
    }

    const auto& data = it->second;
    if (offset < 0 || offset + length > static_cast<int64_t>(data.size())) {
        throw FileDownloadException(file_path, "HTTP 416");
    }
    return data.substr(static_cast<size_t>(offset), static_cast<size_t>(length));
}

ApiResult<BotUser> MockBotApi::get_me(std::stop_token stop) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_stop(stop, "get_me");

    BotUser me;
    me.id = bot_id_;
    me.is_bot = is_bot_;
    me.username = name_ + "_bot";
    me.first_name = name_;
    return me;
}

ApiResult<Chat> MockBotApi::get_chat(const std::string& chat_id, std::stop_token stop) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_stop(stop, "get_chat");

    if (!chat_accessible_) {
        throw ApiException("getChat", 400, "Bad Request: chat not found");
    }

    Chat chat;
    chat.id = chat_id;
    chat.type = "channel";
    chat.title = "storage";
    return chat;
}

ApiResult<std::vector<ChatMember>> MockBotApi::get_chat_administrators(const std::string&, std::stop_token stop) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_stop(stop, "get_chat_administrators");

    std::vector<ChatMember> admins;
    admins.push_back(ChatMember{.user_id = 1, .status = "creator"});
    if (is_admin_) {
        admins.push_back(ChatMember{.user_id = bot_id_, .status = "administrator"});
    }
    return admins;
}

void MockBotApi::set_is_bot(bool is_bot) {
    std::lock_guard<std::mutex> lock(mutex_);
    is_bot_ = is_bot;
}

void MockBotApi::set_is_admin(bool is_admin) {
    std::lock_guard<std::mutex> lock(mutex_);
    is_admin_ = is_admin;
}

void MockBotApi::set_chat_accessible(bool accessible) {
    std::lock_guard<std::mutex> lock(mutex_);
    chat_accessible_ = accessible;
}

void MockBotApi::queue_send_failure(MockFailure failure) {
    std::lock_guard<std::mutex> lock(mutex_);
    send_failures_.push_back(std::move(failure));
}

void MockBotApi::queue_delete_failure(MockFailure failure) {
    std::lock_guard<std::mutex> lock(mutex_);
    delete_failures_.push_back(std::move(failure));
}

void MockBotApi::set_deletes_failing(bool failing) {
    std::lock_guard<std::mutex> lock(mutex_);
    deletes_failing_ = failing;
}

void MockBotApi::set_omit_sent_files(bool omit) {
    std::lock_guard<std::mutex> lock(mutex_);
    omit_sent_files_ = omit;
}

void MockBotApi::set_local_file_root(std::filesystem::path dir) {
    std::lock_guard<std::mutex> lock(mutex_);
    local_file_root_ = std::move(dir);
}

std::size_t MockBotApi::message_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_.size();
}

std::size_t MockBotApi::send_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return send_count_;
}

std::size_t MockBotApi::delete_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return delete_count_;
}

std::optional<MockMessage> MockBotApi::find_message(const std::string& chat_id, int64_t message_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = messages_.find({chat_id, message_id});
    if (it == messages_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<MockMessage> MockBotApi::messages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<MockMessage> result;
    result.reserve(messages_.size());
    for (const auto& [key, msg] : messages_) {
        result.push_back(msg);
    }
    return result;
}

}  // namespace tg

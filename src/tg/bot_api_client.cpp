#include "tg/bot_api_client.hpp"

#include "tg/exceptions.hpp"

#include <curl/curl.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <functional>
#include <mutex>
#include <string_view>
#include <utility>

namespace tg {

namespace {

struct CurlEasyDeleter {
    void operator()(CURL* handle) const noexcept { curl_easy_cleanup(handle); }
};
using unique_curl_easy = std::unique_ptr<CURL, CurlEasyDeleter>;

struct CurlMimeDeleter {
    void operator()(curl_mime* mime) const noexcept { curl_mime_free(mime); }
};
using unique_curl_mime = std::unique_ptr<curl_mime, CurlMimeDeleter>;

using FormParams = std::vector<std::pair<std::string, std::string>>;

void ensure_curl_global_init() {
    static std::once_flag once;
    std::call_once(once, []() {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw NetworkException("curl_global_init failed");
        }
    });
}

size_t write_to_string(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

// Non-zero return aborts the transfer with CURLE_ABORTED_BY_CALLBACK
int abort_on_stop(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* stop = static_cast<const std::stop_token*>(clientp);
    return stop->stop_requested() ? 1 : 0;
}

size_t read_from_stream(char* buffer, size_t size, size_t nitems, void* arg) {
    auto* in = static_cast<std::istream*>(arg);
    in->read(buffer, static_cast<std::streamsize>(size * nitems));
    if (in->bad()) {
        return CURL_READFUNC_ABORT;
    }
    return static_cast<size_t>(in->gcount());
}

// Lets curl rewind the body when it has to resend it (redirects, auth)
int seek_stream(void* arg, curl_off_t offset, int origin) {
    if (origin != SEEK_SET) {
        return CURL_SEEKFUNC_CANTSEEK;
    }
    auto* in = static_cast<std::istream*>(arg);
    in->clear();
    in->seekg(static_cast<std::streamoff>(offset));
    return in->fail() ? CURL_SEEKFUNC_FAIL : CURL_SEEKFUNC_OK;
}

/// Collects one byte window of a download
struct RangeSink {
    CURL* handle{nullptr};
    int64_t offset{0};
    int64_t remaining{0};
    int64_t skip{-1};  // Unknown until the first body bytes arrive
    std::string data;
};

size_t write_range(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* sink = static_cast<RangeSink*>(userdata);
    size_t total = size * nmemb;

    if (sink->skip < 0) {
        long status = 0;
        curl_easy_getinfo(sink->handle, CURLINFO_RESPONSE_CODE, &status);
        // 200 means the server ignored the Range header and sends the whole file
        sink->skip = status == 200 ? sink->offset : 0;
    }

    std::string_view chunk(ptr, total);
    if (sink->skip > 0) {
        auto n = std::min<int64_t>(sink->skip, static_cast<int64_t>(chunk.size()));
        chunk.remove_prefix(static_cast<size_t>(n));
        sink->skip -= n;
    }

    auto take = std::min<int64_t>(sink->remaining, static_cast<int64_t>(chunk.size()));
    sink->data.append(chunk.data(), static_cast<size_t>(take));
    sink->remaining -= take;

    if (sink->remaining == 0) {
        return 0;  // Stop early, the window is complete
    }
    return total;
}

void add_text_part(curl_mime* mime, const char* name, const std::string& value) {
    curl_mimepart* part = curl_mime_addpart(mime);
    curl_mime_name(part, name);
    curl_mime_data(part, value.c_str(), value.size());
}

void add_file_part(curl_mime* mime, const std::string& name, const std::string& path) {
    curl_mimepart* part = curl_mime_addpart(mime);
    curl_mime_name(part, name.c_str());
    if (curl_mime_filedata(part, path.c_str()) != CURLE_OK) {
        throw FileNotFoundException(path);
    }
}

void add_video_parts(curl_mime* mime, const VideoOptions& video) {
    add_text_part(mime, "supports_streaming", video.supports_streaming ? "true" : "false");
    if (!video.thumbnail_path.empty()) {
        add_text_part(mime, "thumbnail", "attach://thumbnail_file");
        add_file_part(mime, "thumbnail_file", video.thumbnail_path);
    }
    if (!video.cover_path.empty()) {
        add_text_part(mime, "cover", "attach://cover_file");
        add_file_part(mime, "cover_file", video.cover_path);
    }
}

std::string encode_form(CURL* curl, const FormParams& params) {
    std::string result;
    for (const auto& [key, value] : params) {
        char* escaped = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
        if (!escaped) {
            throw NetworkException("curl_easy_escape failed for " + key);
        }
        if (!result.empty()) {
            result += '&';
        }
        result += key;
        result += '=';
        result += escaped;
        curl_free(escaped);
    }
    return result;
}

template <typename T, typename F>
ApiResult<T> map_result(ApiResult<nlohmann::json> result, F&& convert) {
    if (auto* retry = std::get_if<RetryAfter>(&result)) {
        return *retry;
    }
    return convert(std::get<nlohmann::json>(result));
}

}  // namespace

//------------------------------------------------------------------------------
// Helpers
//------------------------------------------------------------------------------

std::string build_method_url(std::string_view base_url, std::string_view token, std::string_view method) {
    while (!base_url.empty() && base_url.back() == '/') {
        base_url.remove_suffix(1);
    }
    return fmt::format("{}/bot{}/{}", base_url, token, method);
}

std::string build_file_url(std::string_view base_url, std::string_view token, std::string_view file_path) {
    while (!base_url.empty() && base_url.back() == '/') {
        base_url.remove_suffix(1);
    }
    while (!file_path.empty() && file_path.front() == '/') {
        file_path.remove_prefix(1);
    }
    return fmt::format("{}/file/bot{}/{}", base_url, token, file_path);
}

std::string local_path_to_file_uri(std::string_view path) {
    constexpr std::string_view kUnreserved = "-._~/";
    std::string result = "file://";
    for (unsigned char c : path) {
        if (std::isalnum(c) || kUnreserved.find(static_cast<char>(c)) != std::string_view::npos) {
            result += static_cast<char>(c);
        } else {
            result += fmt::format("%{:02X}", c);
        }
    }
    return result;
}

std::string redact_token(std::string text, std::string_view token) {
    if (token.empty()) {
        return text;
    }
    size_t pos = 0;
    while ((pos = text.find(token, pos)) != std::string::npos) {
        text.replace(pos, token.size(), "<redacted>");
        pos += 10;
    }
    return text;
}

ApiResult<nlohmann::json> parse_api_response(std::string_view method, long http_status, const std::string& body) {
    auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw InvalidResponseException(std::string(method), fmt::format("HTTP {} with a non-JSON body", http_status));
    }

    if (j.value("ok", false)) {
        auto it = j.find("result");
        if (it == j.end()) {
            throw InvalidResponseException(std::string(method), "missing result");
        }
        return ApiResult<nlohmann::json>{std::in_place_index<0>, *it};
    }

    int code = j.value("error_code", static_cast<int>(http_status));
    std::string description = j.value("description", "");

    if (code == 429) {
        int retry_after = 0;
        if (auto params = j.find("parameters"); params != j.end() && params->is_object()) {
            retry_after = params->value("retry_after", 0);
        }
        if (retry_after > 0) {
            return ApiResult<nlohmann::json>{
                std::in_place_index<1>, RetryAfter{std::chrono::seconds(retry_after), description}
            };
        }
    }

    throw ApiException(std::string(method), code, description);
}

//------------------------------------------------------------------------------
// Implementation
//------------------------------------------------------------------------------

class BotApiClient::Impl {
public:
    explicit Impl(Config config) : config_(std::move(config)) { ensure_curl_global_init(); }

    const Config& config() const { return config_; }

    ApiResult<nlohmann::json> call_form(const std::string& method, const FormParams& params, const std::stop_token& stop) {
        auto curl = new_handle();
        auto url = build_method_url(config_.base_url, config_.token, method);
        auto fields = encode_form(curl.get(), params);

        std::string body;
        char error_buffer[CURL_ERROR_SIZE] = {0};
        configure(curl.get(), url, body, error_buffer, stop, false);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, fields.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(fields.size()));

        return finish(curl.get(), method, body, error_buffer, stop);
    }

    ApiResult<nlohmann::json> call_multipart(
        const std::string& method,
        const std::function<void(CURL*, curl_mime*)>& build,
        const std::stop_token& stop
    ) {
        auto curl = new_handle();
        unique_curl_mime mime{curl_mime_init(curl.get())};
        if (!mime) {
            throw NetworkException("curl_mime_init failed");
        }
        build(curl.get(), mime.get());

        auto url = build_method_url(config_.base_url, config_.token, method);
        std::string body;
        char error_buffer[CURL_ERROR_SIZE] = {0};
        configure(curl.get(), url, body, error_buffer, stop, true);
        curl_easy_setopt(curl.get(), CURLOPT_MIMEPOST, mime.get());

        return finish(curl.get(), method, body, error_buffer, stop);
    }

    std::string fetch_range(const std::string& file_path, int64_t offset, int64_t length, const std::stop_token& stop) {
        auto curl = new_handle();
        auto url = build_file_url(config_.base_url, config_.token, file_path);
        auto range = fmt::format("{}-{}", offset, offset + length - 1);

        std::string unused;
        char error_buffer[CURL_ERROR_SIZE] = {0};
        configure(curl.get(), url, unused, error_buffer, stop, true);

        RangeSink sink;
        sink.handle = curl.get();
        sink.offset = offset;
        sink.remaining = length;
        sink.data.reserve(static_cast<size_t>(length));

        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_range);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &sink);

        CURLcode rc = curl_easy_perform(curl.get());
        if (rc == CURLE_WRITE_ERROR && sink.remaining == 0) {
            rc = CURLE_OK;
        }
        if (rc == CURLE_HTTP_RETURNED_ERROR) {
            long status = 0;
            curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
            throw FileDownloadException(file_path, fmt::format("HTTP {}", status));
        }
        if (rc != CURLE_OK) {
            throw_transport_error(rc, "download " + file_path, error_buffer, stop);
        }
        if (sink.remaining > 0) {
            throw FileDownloadException(
                file_path, fmt::format("short read, got {} of {} bytes", sink.data.size(), length)
            );
        }

        spdlog::trace("BotApiClient: fetched {} bytes at offset {} of {}", sink.data.size(), offset, file_path);
        return std::move(sink.data);
    }

private:
    unique_curl_easy new_handle() {
        unique_curl_easy curl{curl_easy_init()};
        if (!curl) {
            throw NetworkException("curl_easy_init failed");
        }
        return curl;
    }

    void configure(
        CURL* curl,
        const std::string& url,
        std::string& body,
        char* error_buffer,
        const std::stop_token& stop,
        bool transfer
    ) {
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_to_string);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
        curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(config_.connect_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, abort_on_stop);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &stop);

        if (transfer) {
            // Large bodies: no overall deadline, abort on stalls instead
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1024L);
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(config_.stall_timeout.count()));
        } else {
            curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(config_.request_timeout.count()));
        }
    }

    ApiResult<nlohmann::json> finish(
        CURL* curl,
        const std::string& method,
        const std::string& body,
        const char* error_buffer,
        const std::stop_token& stop
    ) {
        CURLcode rc = curl_easy_perform(curl);
        if (rc != CURLE_OK) {
            throw_transport_error(rc, method, error_buffer, stop);
        }

        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        spdlog::trace("BotApiClient: {} -> HTTP {}", method, status);

        return parse_api_response(method, status, body);
    }

    [[noreturn]] void throw_transport_error(
        CURLcode rc,
        const std::string& what,
        const char* error_buffer,
        const std::stop_token& stop
    ) {
        if (rc == CURLE_ABORTED_BY_CALLBACK && stop.stop_requested()) {
            throw CancelledException(what);
        }
        if (rc == CURLE_OPERATION_TIMEDOUT) {
            throw TimeoutException(what);
        }
        std::string detail = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(rc);
        throw NetworkException(fmt::format("{} failed: {}", what, redact_token(std::move(detail), config_.token)));
    }

    Config config_;
};

//------------------------------------------------------------------------------
// BotApiClient
//------------------------------------------------------------------------------

BotApiClient::BotApiClient(Config config) : impl_(std::make_unique<Impl>(std::move(config))) {
    spdlog::debug("BotApiClient: created for {}", impl_->config().base_url);
}

BotApiClient::~BotApiClient() = default;

ApiResult<Message> BotApiClient::send_stream(
    const std::string& chat_id,
    UploadKind kind,
    const std::string& file_name,
    std::istream& data,
    int64_t size,
    const std::string& caption,
    const VideoOptions* video,
    std::stop_token stop
) {
    auto method = upload_kind_method(kind);
    auto field = upload_kind_to_string(kind);

    auto result = impl_->call_multipart(
        method,
        [&](CURL*, curl_mime* mime) {
            add_text_part(mime, "chat_id", chat_id);
            if (!caption.empty()) {
                add_text_part(mime, "caption", caption);
            }

            curl_mimepart* part = curl_mime_addpart(mime);
            curl_mime_name(part, field.c_str());
            curl_mime_filename(part, file_name.c_str());
            curl_mime_data_cb(part, static_cast<curl_off_t>(size), read_from_stream, seek_stream, nullptr, &data);

            if (kind == UploadKind::VIDEO && video) {
                add_video_parts(mime, *video);
            }
        },
        stop
    );

    return map_result<Message>(std::move(result), parse_message);
}

ApiResult<Message> BotApiClient::send_local_path(
    const std::string& chat_id,
    UploadKind kind,
    const std::string& local_path,
    const std::string& caption,
    const VideoOptions* video,
    std::stop_token stop
) {
    auto method = upload_kind_method(kind);
    auto field = upload_kind_to_string(kind);
    auto uri = local_path_to_file_uri(local_path);

    auto result = impl_->call_multipart(
        method,
        [&](CURL*, curl_mime* mime) {
            add_text_part(mime, "chat_id", chat_id);
            if (!caption.empty()) {
                add_text_part(mime, "caption", caption);
            }
            add_text_part(mime, field.c_str(), uri);
            if (kind == UploadKind::VIDEO && video) {
                add_video_parts(mime, *video);
            }
        },
        stop
    );

    return map_result<Message>(std::move(result), parse_message);
}

ApiResult<Message> BotApiClient::send_existing(
    const std::string& chat_id,
    UploadKind kind,
    const std::string& file_id,
    const std::string& caption,
    std::stop_token stop
) {
    FormParams params{{"chat_id", chat_id}, {upload_kind_to_string(kind), file_id}};
    if (!caption.empty()) {
        params.emplace_back("caption", caption);
    }

    auto result = impl_->call_form(upload_kind_method(kind), params, stop);
    return map_result<Message>(std::move(result), parse_message);
}

ApiResult<Message> BotApiClient::forward_message(
    const std::string& to_chat_id,
    const std::string& from_chat_id,
    int64_t message_id,
    std::stop_token stop
) {
    auto result = impl_->call_form(
        "forwardMessage",
        {{"chat_id", to_chat_id},
         {"from_chat_id", from_chat_id},
         {"message_id", std::to_string(message_id)},
         {"disable_notification", "true"}},
        stop
    );
    return map_result<Message>(std::move(result), parse_message);
}

ApiResult<File> BotApiClient::get_file(const std::string& file_id, std::stop_token stop) {
    auto result = impl_->call_form("getFile", {{"file_id", file_id}}, stop);
    return map_result<File>(std::move(result), [&](const nlohmann::json& j) {
        auto file = parse_file(j);
        if (file.file_path.empty()) {
            throw InvalidResponseException("getFile", "empty file_path for " + file_id);
        }
        return file;
    });
}

ApiResult<DeleteStatus> BotApiClient::delete_message(const std::string& chat_id, int64_t message_id, std::stop_token stop) {
    try {
        auto result = impl_->call_form(
            "deleteMessage", {{"chat_id", chat_id}, {"message_id", std::to_string(message_id)}}, stop
        );
        return map_result<DeleteStatus>(std::move(result), [](const nlohmann::json&) { return DeleteStatus::DELETED; });
    } catch (const ApiException& e) {
        if (is_ignorable_delete_error(e.code(), e.description())) {
            spdlog::debug("BotApiClient: message {}/{} already gone: {}", chat_id, message_id, e.description());
            return DeleteStatus::ALREADY_GONE;
        }
        throw;
    }
}

std::string BotApiClient::fetch_file_range(
    const std::string& file_path,
    int64_t offset,
    int64_t length,
    std::stop_token stop
) {
    if (length <= 0) {
        return "";
    }
    return impl_->fetch_range(file_path, offset, length, stop);
}

ApiResult<BotUser> BotApiClient::get_me(std::stop_token stop) {
    return map_result<BotUser>(impl_->call_form("getMe", {}, stop), parse_user);
}

ApiResult<Chat> BotApiClient::get_chat(const std::string& chat_id, std::stop_token stop) {
    return map_result<Chat>(impl_->call_form("getChat", {{"chat_id", chat_id}}, stop), parse_chat);
}

ApiResult<std::vector<ChatMember>> BotApiClient::get_chat_administrators(const std::string& chat_id, std::stop_token stop) {
    auto result = impl_->call_form("getChatAdministrators", {{"chat_id", chat_id}}, stop);
    return map_result<std::vector<ChatMember>>(std::move(result), [](const nlohmann::json& j) {
        std::vector<ChatMember> members;
        if (!j.is_array()) {
            throw InvalidResponseException("getChatAdministrators", "result is not an array");
        }
        for (const auto& member : j) {
            members.push_back(parse_chat_member(member));
        }
        return members;
    });
}

std::string BotApiClient::describe() const { return impl_->config().base_url; }

}  // namespace tg

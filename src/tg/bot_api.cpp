#include "tg/bot_api.hpp"

#include "tg/exceptions.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>

namespace tg {

namespace {

template <typename T>
T require_result(ApiResult<T> result, const char* step) {
    if (auto* retry = std::get_if<RetryAfter>(&result)) {
        throw BotValidationException(
            fmt::format("{} was rate limited, retry after {}s", step, retry->delay.count())
        );
    }
    return std::get<T>(std::move(result));
}

}  // namespace

void run_self_check(BotApi& api, const std::string& storage_chat_id, std::stop_token stop) {
    if (storage_chat_id.empty()) {
        throw BotValidationException("storage chat id is not configured");
    }

    BotUser me;
    try {
        me = require_result(api.get_me(stop), "getMe");
    } catch (const ApiException& e) {
        throw BotValidationException("getMe failed: " + e.description());
    }
    if (!me.is_bot) {
        throw BotValidationException("token does not belong to a bot");
    }

    try {
        require_result(api.get_chat(storage_chat_id, stop), "getChat");
    } catch (const ApiException& e) {
        throw BotValidationException("storage chat is not accessible: " + e.description());
    }

    std::vector<ChatMember> admins;
    try {
        admins = require_result(api.get_chat_administrators(storage_chat_id, stop), "getChatAdministrators");
    } catch (const ApiException& e) {
        throw BotValidationException("cannot list storage chat administrators: " + e.description());
    }

    bool is_admin = std::any_of(admins.begin(), admins.end(), [&](const ChatMember& m) { return m.user_id == me.id; });
    if (!is_admin) {
        throw BotValidationException("bot is not an administrator of the storage chat");
    }

    spdlog::debug("Self-check passed for bot @{} on {}", me.username, api.describe());
}

bool is_ignorable_delete_error(int code, std::string_view description) {
    if (code != 400) {
        return false;
    }

    std::string lower(description);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });

    constexpr std::array<std::string_view, 3> kGoneMarkers = {
        "message to delete not found", "message not found", "message_id_invalid"
    };
    return std::any_of(kGoneMarkers.begin(), kGoneMarkers.end(), [&](std::string_view marker) {
        return lower.find(marker) != std::string::npos;
    });
}

std::string chunk_caption(std::string_view item_id, int chunk_index) {
    return fmt::format("tgd:{}:{}", item_id, chunk_index);
}

}  // namespace tg

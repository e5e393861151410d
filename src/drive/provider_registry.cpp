#include "drive/provider_registry.hpp"

#include "drive/errors.hpp"
#include "tg/bot_api_client.hpp"
#include "tg/exceptions.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace tgdrive {

ClientFactory make_bot_api_client_factory() {
    return [](const ProviderConfig& config) -> std::shared_ptr<tg::BotApi> {
        tg::BotApiClient::Config client_config;
        client_config.token = config.bot_token;
        client_config.base_url = config.api_base_url;
        if (config.mode == ProviderMode::SELF_HOSTED) {
            // Local servers answer uploads only after fetching the whole file from disk
            client_config.request_timeout = std::chrono::seconds(600);
        }
        return std::make_shared<tg::BotApiClient>(std::move(client_config));
    };
}

ProviderRegistry::ProviderRegistry(ProviderConfig initial, ClientFactory factory)
    : factory_(std::move(factory)), config_(std::move(initial)) {
    active_ = factory_(config_);
    spdlog::info("ProviderRegistry: active provider {} ({})", active_->describe(), to_string(config_.mode));
}

ProviderRegistry::ProviderRegistry(ProviderConfig initial, std::shared_ptr<tg::BotApi> client, ClientFactory factory)
    : factory_(std::move(factory)), active_(std::move(client)), config_(std::move(initial)) {}

ProviderHandle ProviderRegistry::current() const {
    std::shared_lock<std::shared_mutex> lock(lock_);
    return ProviderHandle{active_, config_, generation_};
}

uint64_t ProviderRegistry::generation() const {
    std::shared_lock<std::shared_mutex> lock(lock_);
    return generation_;
}

ProviderHandle ProviderRegistry::swap(const ProviderConfig& candidate, std::stop_token stop) {
    std::lock_guard<std::mutex> swap_lock(swap_mutex_);

    if (candidate.bot_token.empty()) {
        throw ProviderValidationException("bot token is empty");
    }
    if (candidate.storage_chat_id.empty()) {
        throw ProviderValidationException("storage chat id is empty");
    }
    if (candidate.api_base_url.empty()) {
        throw ProviderValidationException("API base URL is empty");
    }

    std::shared_ptr<tg::BotApi> client;
    try {
        client = factory_(candidate);
        if (!client) {
            throw ProviderValidationException("client factory returned no client");
        }
        tg::run_self_check(*client, candidate.storage_chat_id, stop);
    } catch (const tg::TelegramException& e) {
        spdlog::warn("ProviderRegistry: candidate {} rejected: {}", to_string(candidate.mode), e.what());
        throw ProviderValidationException(e.what());
    }

    std::unique_lock<std::shared_mutex> lock(lock_);
    active_ = std::move(client);
    config_ = candidate;
    ++generation_;

    spdlog::info(
        "ProviderRegistry: switched to {} ({}), generation {}", active_->describe(), to_string(config_.mode), generation_
    );
    return ProviderHandle{active_, config_, generation_};
}

}  // namespace tgdrive

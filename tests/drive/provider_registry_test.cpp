#include "drive/provider_registry.hpp"

#include "drive/errors.hpp"
#include "tg/mock_bot_api.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

namespace tgdrive {
namespace {

ProviderConfig make_config(const std::string& token) {
    ProviderConfig config;
    config.bot_token = token;
    config.storage_chat_id = "-100";
    return config;
}

// Builds a mock per token; tokens starting with "guest" are not chat admins
class ProviderRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        factory_ = [this](const ProviderConfig& config) -> std::shared_ptr<tg::BotApi> {
            ++built_;
            auto api = std::make_shared<tg::MockBotApi>(config.bot_token);
            if (config.bot_token.starts_with("guest")) {
                api->set_is_admin(false);
            }
            return api;
        };
        registry_ = std::make_unique<ProviderRegistry>(make_config("first"), factory_);
    }

    ClientFactory factory_;
    std::atomic<int> built_{0};
    std::unique_ptr<ProviderRegistry> registry_;
};

TEST_F(ProviderRegistryTest, InitialClientIsActive) {
    auto handle = registry_->current();
    EXPECT_EQ(handle->describe(), "mock:first");
    EXPECT_EQ(handle.generation, 1u);
    EXPECT_FALSE(handle.self_hosted());
    EXPECT_EQ(built_.load(), 1);
}

TEST_F(ProviderRegistryTest, SwapActivatesValidatedCandidate) {
    auto candidate = make_config("second");
    candidate.mode = ProviderMode::SELF_HOSTED;
    candidate.api_base_url = "http://localhost:8081";

    auto handle = registry_->swap(candidate);
    EXPECT_EQ(handle->describe(), "mock:second");
    EXPECT_EQ(handle.generation, 2u);

    auto current = registry_->current();
    EXPECT_EQ(current->describe(), "mock:second");
    EXPECT_TRUE(current.self_hosted());
    EXPECT_EQ(current.config.api_base_url, "http://localhost:8081");
    EXPECT_EQ(registry_->generation(), 2u);
}

TEST_F(ProviderRegistryTest, FailedSelfCheckKeepsActiveProvider) {
    EXPECT_THROW(registry_->swap(make_config("guest-bot")), ProviderValidationException);

    auto current = registry_->current();
    EXPECT_EQ(current->describe(), "mock:first");
    EXPECT_EQ(current.config.bot_token, "first");
    EXPECT_EQ(registry_->generation(), 1u);
}

TEST_F(ProviderRegistryTest, IncompleteCandidateIsRejectedBeforeBuilding) {
    auto no_token = make_config("");
    EXPECT_THROW(registry_->swap(no_token), ProviderValidationException);

    auto no_chat = make_config("second");
    no_chat.storage_chat_id.clear();
    EXPECT_THROW(registry_->swap(no_chat), ProviderValidationException);

    auto no_url = make_config("second");
    no_url.api_base_url.clear();
    EXPECT_THROW(registry_->swap(no_url), ProviderValidationException);

    EXPECT_EQ(built_.load(), 1);
    EXPECT_EQ(registry_->generation(), 1u);
}

TEST_F(ProviderRegistryTest, FactoryWithoutClientIsRejected) {
    ProviderRegistry registry(
        make_config("first"),
        std::make_shared<tg::MockBotApi>("first"),
        [](const ProviderConfig&) -> std::shared_ptr<tg::BotApi> { return nullptr; }
    );
    EXPECT_THROW(registry.swap(make_config("second")), ProviderValidationException);
    EXPECT_EQ(registry.current()->describe(), "mock:first");
}

TEST_F(ProviderRegistryTest, OldHandleOutlivesSwap) {
    auto old_handle = registry_->current();
    registry_->swap(make_config("second"));

    // The old client is still usable by whoever captured it
    auto me = old_handle->get_me({});
    ASSERT_TRUE(std::holds_alternative<tg::BotUser>(me));
    EXPECT_EQ(old_handle->describe(), "mock:first");
    EXPECT_EQ(old_handle.generation, 1u);
}

TEST_F(ProviderRegistryTest, ConcurrentSwapsAreSerialised) {
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([this, i] { registry_->swap(make_config("bot-" + std::to_string(i))); });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(registry_->generation(), 9u);
    auto current = registry_->current();
    EXPECT_EQ(current->describe(), "mock:" + current.config.bot_token);
}

}  // namespace
}  // namespace tgdrive

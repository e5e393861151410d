#pragma once

#include "drive/types.hpp"
#include "tg/bot_api.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stop_token>

namespace tgdrive {

/// Snapshot of the active provider
///
/// Holds its own reference to the client, so a swap that happens while a
/// call is in flight only affects the next current() call.
struct ProviderHandle {
    std::shared_ptr<tg::BotApi> api;
    ProviderConfig config;
    uint64_t generation{0};

    tg::BotApi* operator->() const { return api.get(); }
    tg::BotApi& operator*() const { return *api; }

    bool self_hosted() const { return config.mode == ProviderMode::SELF_HOSTED; }
};

/// Builds a client for a provider configuration
using ClientFactory = std::function<std::shared_ptr<tg::BotApi>(const ProviderConfig&)>;

/// Factory producing libcurl-backed BotApiClient instances
ClientFactory make_bot_api_client_factory();

/// Holds the single active provider client and swaps it atomically
class ProviderRegistry {
public:
    /// Build the initial client with `factory` (no self-check)
    ProviderRegistry(ProviderConfig initial, ClientFactory factory);

    /// Start with an already constructed client
    ProviderRegistry(ProviderConfig initial, std::shared_ptr<tg::BotApi> client, ClientFactory factory);

    // Disable copy
    ProviderRegistry(const ProviderRegistry&) = delete;
    ProviderRegistry& operator=(const ProviderRegistry&) = delete;

    /// The active client and its configuration
    [[nodiscard]] ProviderHandle current() const;

    /// Validate a candidate and make it active
    ///
    /// The candidate is built and self-checked without holding the registry
    /// lock. On failure the active client is left untouched. Concurrent swaps
    /// run one after another.
    /// @return Handle of the new active client
    /// @throws ProviderValidationException when the candidate cannot be built or fails the self-check
    ProviderHandle swap(const ProviderConfig& candidate, std::stop_token stop = {});

    [[nodiscard]] uint64_t generation() const;

private:
    ClientFactory factory_;

    std::shared_ptr<tg::BotApi> active_;
    ProviderConfig config_;
    uint64_t generation_{1};

    mutable std::shared_mutex lock_;  // Guards active_, config_, generation_
    std::mutex swap_mutex_;          // Serialises swap()
};

}  // namespace tgdrive

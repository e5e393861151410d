#include "engine.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>

namespace tgdrive::ctl {

EngineContext open_engine(const DriveConfig& config) {
    auto db_path = config.resolved_database_path();
    if (db_path.has_parent_path()) {
        std::filesystem::create_directories(db_path.parent_path());
    }

    EngineContext ctx;
    ctx.config = config;
    ctx.store = std::make_unique<MetadataStore>(db_path.string());
    ctx.registry = std::make_unique<ProviderRegistry>(config.provider, make_bot_api_client_factory());

    ctx.engine = std::make_unique<TransferEngine>(
        *ctx.store, *ctx.registry, TransferEngine::Config::from_drive_config(config)
    );

    spdlog::debug("Opened {} with provider {}", db_path.string(), ctx.registry->current()->describe());
    return ctx;
}

}  // namespace tgdrive::ctl

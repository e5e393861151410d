#pragma once

#include "drive/config.hpp"
#include "drive/metadata_store.hpp"
#include "drive/provider_registry.hpp"
#include "drive/transfer_engine.hpp"

#include <memory>

namespace tgdrive::ctl {

/// Store, provider and engine opened for one command
struct EngineContext {
    DriveConfig config;
    std::unique_ptr<MetadataStore> store;
    std::unique_ptr<ProviderRegistry> registry;
    std::unique_ptr<TransferEngine> engine;
};

/// Open the metadata store and the provider client described by `config`
/// @throws DriveException if the database cannot be opened
EngineContext open_engine(const DriveConfig& config);

}  // namespace tgdrive::ctl

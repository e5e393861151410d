#pragma once

#include "drive/types.hpp"

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace tgdrive {

/// Limits the handler layer reads on every request
struct RuntimeSettings {
    int upload_concurrency{1};
    int download_concurrency{2};
    int64_t reserved_disk_bytes{kDefaultReservedDiskBytes};
};

/// Application configuration (~/.config/tg-drive/config.json)
struct DriveConfig {
    ProviderConfig provider;
    int64_t chunk_size_bytes{kDefaultChunkSize};
    int upload_concurrency{1};
    int download_concurrency{2};
    int64_t reserved_disk_bytes{kDefaultReservedDiskBytes};
    int upload_session_ttl_hours{24};
    int cleanup_interval_minutes{30};
    int delete_retry_interval_minutes{10};
    std::string database_path;  // Empty: <data dir>/drive.db
    std::string staging_dir;    // Empty: <data dir>/uploads

    bool has_credentials() const { return !provider.bot_token.empty() && !provider.storage_chat_id.empty(); }

    RuntimeSettings runtime_settings() const;

    std::filesystem::path resolved_database_path() const;
    std::filesystem::path resolved_staging_dir() const;
};

/// Get XDG config directory (~/.config/tg-drive)
std::filesystem::path get_config_dir();

/// Get XDG data directory (~/.local/share/tg-drive)
std::filesystem::path get_data_dir();

/// Get config file path (~/.config/tg-drive/config.json)
std::filesystem::path get_config_path();

/// Decode a configuration object; missing keys keep their defaults
/// @throws ValidationException for values of the wrong type or out of range
DriveConfig config_from_json(const nlohmann::json& j);

nlohmann::json config_to_json(const DriveConfig& config);

/// Load configuration from disk
/// Returns std::nullopt if the config file doesn't exist or is invalid
std::optional<DriveConfig> load_config(const std::filesystem::path& path = get_config_path());

/// Save configuration to disk
/// Creates directories if needed
void save_config(const DriveConfig& config, const std::filesystem::path& path = get_config_path());

}  // namespace tgdrive

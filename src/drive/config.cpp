#include "drive/config.hpp"

#include "drive/errors.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>

namespace tgdrive {

namespace {

std::filesystem::path get_xdg_config_home() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && xdg[0] != '\0') {
        return xdg;
    }
    const char* home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / ".config";
    }
    return ".config";
}

std::filesystem::path get_xdg_data_home() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && xdg[0] != '\0') {
        return xdg;
    }
    const char* home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / ".local" / "share";
    }
    return ".local/share";
}

template <typename T>
T positive(const nlohmann::json& j, const char* key, T fallback) {
    T value = j.value(key, fallback);
    if (value <= 0) {
        throw ValidationException(std::string("config key '") + key + "' must be positive");
    }
    return value;
}

}  // namespace

std::filesystem::path get_config_dir() { return get_xdg_config_home() / "tg-drive"; }

std::filesystem::path get_data_dir() { return get_xdg_data_home() / "tg-drive"; }

std::filesystem::path get_config_path() { return get_config_dir() / "config.json"; }

RuntimeSettings DriveConfig::runtime_settings() const {
    return RuntimeSettings{
        .upload_concurrency = upload_concurrency,
        .download_concurrency = download_concurrency,
        .reserved_disk_bytes = reserved_disk_bytes,
    };
}

std::filesystem::path DriveConfig::resolved_database_path() const {
    return database_path.empty() ? get_data_dir() / "drive.db" : std::filesystem::path(database_path);
}

std::filesystem::path DriveConfig::resolved_staging_dir() const {
    return staging_dir.empty() ? get_data_dir() / "uploads" : std::filesystem::path(staging_dir);
}

DriveConfig config_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ValidationException("config must be a JSON object");
    }

    DriveConfig config;
    try {
        config.provider.bot_token = j.value("bot_token", "");
        config.provider.api_base_url = j.value("api_base_url", std::string(tg::kDefaultApiBaseUrl));
        config.provider.mode = provider_mode_from_string(j.value("mode", "official"));
        if (j.contains("storage_chat_id") && j["storage_chat_id"].is_number_integer()) {
            config.provider.storage_chat_id = std::to_string(j["storage_chat_id"].get<int64_t>());
        } else {
            config.provider.storage_chat_id = j.value("storage_chat_id", "");
        }

        config.chunk_size_bytes = positive<int64_t>(j, "chunk_size_bytes", kDefaultChunkSize);
        config.upload_concurrency = positive(j, "upload_concurrency", 1);
        config.download_concurrency = positive(j, "download_concurrency", 2);
        config.reserved_disk_bytes = j.value("reserved_disk_bytes", kDefaultReservedDiskBytes);
        config.upload_session_ttl_hours = positive(j, "upload_session_ttl_hours", 24);
        config.cleanup_interval_minutes = positive(j, "cleanup_interval_minutes", 30);
        config.delete_retry_interval_minutes = positive(j, "delete_retry_interval_minutes", 10);
        config.database_path = j.value("database_path", "");
        config.staging_dir = j.value("staging_dir", "");
    } catch (const nlohmann::json::exception& e) {
        throw ValidationException(std::string("invalid config: ") + e.what());
    }

    if (config.reserved_disk_bytes < 0) {
        throw ValidationException("config key 'reserved_disk_bytes' must not be negative");
    }
    return config;
}

nlohmann::json config_to_json(const DriveConfig& config) {
    nlohmann::json j;
    j["bot_token"] = config.provider.bot_token;
    j["api_base_url"] = config.provider.api_base_url;
    j["mode"] = to_string(config.provider.mode);
    j["storage_chat_id"] = config.provider.storage_chat_id;
    j["chunk_size_bytes"] = config.chunk_size_bytes;
    j["upload_concurrency"] = config.upload_concurrency;
    j["download_concurrency"] = config.download_concurrency;
    j["reserved_disk_bytes"] = config.reserved_disk_bytes;
    j["upload_session_ttl_hours"] = config.upload_session_ttl_hours;
    j["cleanup_interval_minutes"] = config.cleanup_interval_minutes;
    j["delete_retry_interval_minutes"] = config.delete_retry_interval_minutes;
    if (!config.database_path.empty()) {
        j["database_path"] = config.database_path;
    }
    if (!config.staging_dir.empty()) {
        j["staging_dir"] = config.staging_dir;
    }
    return j;
}

std::optional<DriveConfig> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        spdlog::debug("Config file not found: {}", path.string());
        return std::nullopt;
    }

    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            spdlog::warn("Failed to open config file: {}", path.string());
            return std::nullopt;
        }

        nlohmann::json j;
        file >> j;

        auto config = config_from_json(j);
        spdlog::debug("Loaded config from {}", path.string());
        return config;

    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Failed to parse config file: {}", e.what());
        return std::nullopt;
    } catch (const ValidationException& e) {
        spdlog::warn("Config file rejected: {}", e.what());
        return std::nullopt;
    }
}

void save_config(const DriveConfig& config, const std::filesystem::path& path) {
    // Create directory if needed
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        throw DriveException("Failed to create config file: " + path.string());
    }

    file << config_to_json(config).dump(2) << std::endl;
    spdlog::info("Configuration saved to {}", path.string());
}

}  // namespace tgdrive

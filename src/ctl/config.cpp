#include "config.hpp"

#include "drive/errors.hpp"
#include "tg/bot_api_client.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <iostream>

namespace tgdrive::ctl {

std::optional<DriveConfig> require_config() {
    auto config = load_config();
    if (!config || !config->has_credentials()) {
        std::cerr << "Error: Not configured. Run 'tg-drive config set --token <token> --chat <chat id>' first.\n";
        return std::nullopt;
    }
    return config;
}

int exec_config_set(const ConfigSetOptions& options) {
    // Start from what is stored so partial updates keep the rest
    auto config = load_config().value_or(DriveConfig{});

    try {
        if (options.bot_token) {
            config.provider.bot_token = *options.bot_token;
        }
        if (options.storage_chat_id) {
            config.provider.storage_chat_id = *options.storage_chat_id;
        }
        if (options.api_base_url) {
            config.provider.api_base_url = *options.api_base_url;
        }
        if (options.mode) {
            config.provider.mode = provider_mode_from_string(*options.mode);
        }
        if (options.chunk_size_bytes) {
            config.chunk_size_bytes = *options.chunk_size_bytes;
        }
        if (options.upload_concurrency) {
            config.upload_concurrency = *options.upload_concurrency;
        }
        if (options.download_concurrency) {
            config.download_concurrency = *options.download_concurrency;
        }
        if (options.reserved_disk_bytes) {
            config.reserved_disk_bytes = *options.reserved_disk_bytes;
        }
        if (options.upload_session_ttl_hours) {
            config.upload_session_ttl_hours = *options.upload_session_ttl_hours;
        }

        // Round-trip through the decoder so invalid values are rejected before saving
        config = config_from_json(config_to_json(config));
        save_config(config);
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

int exec_config_show() {
    auto config = load_config();
    if (!config) {
        std::cout << "No configuration stored at " << get_config_path().string() << "\n";
        return 0;
    }

    auto j = config_to_json(*config);
    if (!config->provider.bot_token.empty()) {
        j["bot_token"] = tg::redact_token(config->provider.bot_token, config->provider.bot_token);
    }
    std::cout << j.dump(2) << "\n";
    return 0;
}

void setup_file_logging() {
    auto logs_dir = get_data_dir() / "logs";
    std::filesystem::create_directories(logs_dir);

    auto log_path = (logs_dir / "tg-drive.log").string();

    try {
        auto file_logger = spdlog::basic_logger_mt("file_logger", log_path, true);
        spdlog::set_default_logger(file_logger);
    } catch (const spdlog::spdlog_ex& e) {
        // If we can't set up file logging, just continue with console
        std::cerr << "Warning: Could not set up file logging: " << e.what() << "\n";
    }
}

}  // namespace tgdrive::ctl

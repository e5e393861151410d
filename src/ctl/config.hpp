#pragma once

#include "drive/config.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace tgdrive::ctl {

/// Values passed to `config set`; unset options keep their stored value
struct ConfigSetOptions {
    std::optional<std::string> bot_token;
    std::optional<std::string> storage_chat_id;
    std::optional<std::string> api_base_url;
    std::optional<std::string> mode;
    std::optional<int64_t> chunk_size_bytes;
    std::optional<int> upload_concurrency;
    std::optional<int> download_concurrency;
    std::optional<int64_t> reserved_disk_bytes;
    std::optional<int> upload_session_ttl_hours;
};

/// Load the stored configuration, or report how to create one
/// Prints an error and returns std::nullopt when nothing usable is stored.
std::optional<DriveConfig> require_config();

/// Execute config set command
int exec_config_set(const ConfigSetOptions& options);

/// Print the stored configuration with the token redacted
int exec_config_show();

/// Configure spdlog to write to file instead of stderr
/// Call this early in commands that talk to the provider
void setup_file_logging();

}  // namespace tgdrive::ctl

#include "config.hpp"
#include "maintenance.hpp"
#include "transfers.hpp"

#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <cstdint>
#include <optional>
#include <string>

int main(int argc, char* argv[]) {
    CLI::App app{"tg-drive - chunked file storage on Telegram"};
    app.require_subcommand(1);

    int verbosity = 0;
    app.add_flag("-v,--verbose", verbosity, "Increase verbosity (-v, -vv, -vvv)");

    // Config subcommand with nested subcommands
    auto* config_cmd = app.add_subcommand("config", "Manage configuration");
    config_cmd->require_subcommand(1);

    // config set
    auto* config_set_cmd = config_cmd->add_subcommand("set", "Set provider credentials and limits");
    tgdrive::ctl::ConfigSetOptions set_options;
    config_set_cmd->add_option("--token", set_options.bot_token, "Bot token");
    config_set_cmd->add_option("--chat", set_options.storage_chat_id, "Storage chat id");
    config_set_cmd->add_option("--api-url", set_options.api_base_url, "Bot API base URL");
    config_set_cmd->add_option("--mode", set_options.mode, "Provider mode")
        ->check(CLI::IsMember({"official", "self_hosted"}));
    config_set_cmd->add_option("--chunk-size", set_options.chunk_size_bytes, "Chunk size in bytes");
    config_set_cmd->add_option("--upload-concurrency", set_options.upload_concurrency, "Concurrent uploads");
    config_set_cmd->add_option("--download-concurrency", set_options.download_concurrency, "Concurrent downloads");
    config_set_cmd->add_option("--reserved-disk", set_options.reserved_disk_bytes, "Free bytes to keep on the staging disk");
    config_set_cmd->add_option("--session-ttl", set_options.upload_session_ttl_hours, "Hours before an idle upload expires");

    // config show
    auto* config_show_cmd = config_cmd->add_subcommand("show", "Show the stored configuration");

    // check
    auto* check_cmd = app.add_subcommand("check", "Verify the bot credential and storage chat");

    // mkdir <name>
    auto* mkdir_cmd = app.add_subcommand("mkdir", "Create a folder");
    std::string folder_name;
    std::optional<std::string> mkdir_parent;
    mkdir_cmd->add_option("name", folder_name, "Folder name")->required();
    mkdir_cmd->add_option("-p,--parent", mkdir_parent, "Parent folder id");

    // upload <file>
    auto* upload_cmd = app.add_subcommand("upload", "Upload a file");
    std::string upload_path;
    std::optional<std::string> upload_parent;
    std::string mime_type = "application/octet-stream";
    upload_cmd->add_option("file", upload_path, "Local file")->required()->check(CLI::ExistingFile);
    upload_cmd->add_option("-p,--parent", upload_parent, "Parent folder id");
    upload_cmd->add_option("--mime", mime_type, "MIME type of the file");

    // resume <item> <file>
    auto* resume_cmd = app.add_subcommand("resume", "Continue an interrupted upload");
    std::string resume_item;
    std::string resume_path;
    resume_cmd->add_option("item", resume_item, "Item id of the interrupted upload")->required();
    resume_cmd->add_option("file", resume_path, "Local file being uploaded")->required()->check(CLI::ExistingFile);

    // download <item>
    auto* download_cmd = app.add_subcommand("download", "Download an item");
    std::string download_item;
    std::string download_output;
    std::string download_range;
    download_cmd->add_option("item", download_item, "Item id")->required();
    download_cmd->add_option("-o,--output", download_output, "Output file (default: stdout)");
    download_cmd->add_option("-r,--range", download_range, "Byte range: start-end, start- or -suffix");

    // rm <item>
    auto* rm_cmd = app.add_subcommand("rm", "Delete an item and everything below it");
    std::string rm_item;
    rm_cmd->add_option("item", rm_item, "Item id")->required();

    // sessions reap
    auto* sessions_cmd = app.add_subcommand("sessions", "Manage upload sessions");
    sessions_cmd->require_subcommand(1);
    auto* sessions_reap_cmd = sessions_cmd->add_subcommand("reap", "Expire idle upload sessions");

    // deletes list / retry
    auto* deletes_cmd = app.add_subcommand("deletes", "Manage pending message deletions");
    deletes_cmd->require_subcommand(1);
    auto* deletes_list_cmd = deletes_cmd->add_subcommand("list", "List pending deletions");
    auto* deletes_retry_cmd = deletes_cmd->add_subcommand("retry", "Retry pending deletions that are due");

    CLI11_PARSE(app, argc, argv);

    // Configure logging based on verbosity
    if (verbosity >= 2) {
        spdlog::set_level(spdlog::level::trace);
    } else if (verbosity == 1) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    // Handle subcommands
    if (config_set_cmd->parsed()) {
        return tgdrive::ctl::exec_config_set(set_options);
    }

    if (config_show_cmd->parsed()) {
        return tgdrive::ctl::exec_config_show();
    }

    if (check_cmd->parsed()) {
        return tgdrive::ctl::exec_check();
    }

    if (mkdir_cmd->parsed()) {
        return tgdrive::ctl::exec_mkdir(folder_name, mkdir_parent);
    }

    if (upload_cmd->parsed()) {
        return tgdrive::ctl::exec_upload(upload_path, upload_parent, mime_type);
    }

    if (resume_cmd->parsed()) {
        return tgdrive::ctl::exec_resume(resume_item, resume_path);
    }

    if (download_cmd->parsed()) {
        return tgdrive::ctl::exec_download(download_item, download_output, download_range);
    }

    if (rm_cmd->parsed()) {
        return tgdrive::ctl::exec_rm(rm_item);
    }

    if (sessions_reap_cmd->parsed()) {
        return tgdrive::ctl::exec_sessions_reap();
    }

    if (deletes_list_cmd->parsed()) {
        return tgdrive::ctl::exec_deletes_list();
    }

    if (deletes_retry_cmd->parsed()) {
        return tgdrive::ctl::exec_deletes_retry();
    }

    return 0;
}

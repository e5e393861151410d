#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include "drive/config.hpp"
#include "drive/errors.hpp"
#include "drive/metadata_store.hpp"
#include "drive/periodic_task.hpp"
#include "drive/provider_registry.hpp"
#include "drive/transfer_engine.hpp"
#include "tg/mock_bot_api.hpp"

#include <pthread.h>
#include <signal.h>
#include <unistd.h>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stop_token>
#include <vector>

namespace {

namespace fs = std::filesystem;

//------------------------------------------------------------------------------
// Configuration structures
//------------------------------------------------------------------------------

/// Daemon configuration from command line
struct DaemonConfig {
    std::string config_path;
    bool foreground{false};
    int verbosity{0};
    bool mock_mode{false};
    bool flush_logs{false};  // Flush logs on every message (useful for debugging)
};

//------------------------------------------------------------------------------
// Logging
//------------------------------------------------------------------------------

/// Convert verbosity level to spdlog level
spdlog::level::level_enum verbosity_to_level(int verbosity) {
    if (verbosity >= 2) return spdlog::level::trace;
    if (verbosity == 1) return spdlog::level::debug;
    return spdlog::level::info;
}

/// Set up logging with file and optional stderr output
bool setup_logging(const DaemonConfig& config) {
    try {
        fs::path log_dir = tgdrive::get_data_dir() / "logs";
        std::error_code ec;
        fs::create_directories(log_dir, ec);
        if (ec) {
            return false;
        }

        fs::path log_file = log_dir / "tg-drived.log";
        auto log_level = verbosity_to_level(config.verbosity);

        std::vector<spdlog::sink_ptr> sinks;

        if (config.foreground) {
            auto stderr_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            stderr_sink->set_level(spdlog::level::trace);
            sinks.push_back(stderr_sink);
        } else {
            auto file_sink =
                std::make_shared<spdlog::sinks::rotating_file_sink_mt>(log_file.string(), 5 * 1024 * 1024, 3);
            file_sink->set_level(spdlog::level::trace);
            sinks.push_back(file_sink);
        }

        auto logger = std::make_shared<spdlog::logger>("tg-drived", sinks.begin(), sinks.end());
        logger->set_level(log_level);

        // Set flush level based on config
        if (config.flush_logs) {
            logger->flush_on(spdlog::level::trace);  // Flush every message
        } else {
            logger->flush_on(spdlog::level::warn);
        }

        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");

        return true;
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Failed to set up logging: " << e.what() << "\n";
        return false;
    }
}

//------------------------------------------------------------------------------
// Daemonisation
//------------------------------------------------------------------------------

/// Daemonise the process
/// @return 0 on success (in child), -1 on error, parent exits
int daemonise() {
    // First fork
    pid_t pid = fork();
    if (pid < 0) {
        return -1;
    }
    if (pid > 0) {
        _exit(0);
    }

    // Create new session
    if (setsid() < 0) {
        return -1;
    }

    // Second fork (prevent acquiring terminal)
    pid = fork();
    if (pid < 0) {
        return -1;
    }
    if (pid > 0) {
        _exit(0);
    }

    // Change working directory
    if (chdir("/") < 0) {
        return -1;
    }

    // Close standard file descriptors
    close(STDIN_FILENO);
    close(STDOUT_FILENO);
    close(STDERR_FILENO);

    return 0;
}

//------------------------------------------------------------------------------
// Daemon context - holds all runtime state
//------------------------------------------------------------------------------

struct DaemonContext {
    tgdrive::DriveConfig config;
    std::unique_ptr<tgdrive::MetadataStore> store;
    std::unique_ptr<tgdrive::ProviderRegistry> registry;
    std::unique_ptr<tgdrive::TransferEngine> engine;
};

/// Load the configuration file, falling back to defaults in mock mode
std::optional<tgdrive::DriveConfig> load_daemon_config(const DaemonConfig& config) {
    auto path = config.config_path.empty() ? tgdrive::get_config_path() : fs::path(config.config_path);
    auto loaded = tgdrive::load_config(path);

    if (config.mock_mode) {
        auto result = loaded.value_or(tgdrive::DriveConfig{});
        result.provider.bot_token = "mock";
        result.provider.storage_chat_id = "-1000000000001";
        return result;
    }
    if (!loaded || !loaded->has_credentials()) {
        return std::nullopt;
    }
    return loaded;
}

//------------------------------------------------------------------------------
// Initialisation - called AFTER daemonising
//------------------------------------------------------------------------------

/// Initialise the daemon (logging, metadata store, provider client)
/// @return Daemon context on success, nullopt on failure
std::optional<DaemonContext> initialise(const DaemonConfig& config) {
    // Set up logging first
    if (!setup_logging(config)) {
        return std::nullopt;
    }

    spdlog::info("tg-drived starting...");
    if (!config.foreground) {
        spdlog::info("Log file: {}", (tgdrive::get_data_dir() / "logs" / "tg-drived.log").string());
    }
    spdlog::debug("Foreground: {}", config.foreground);
    spdlog::debug("Verbosity: {}", config.verbosity);
    spdlog::debug("Mock mode: {}", config.mock_mode);

    auto drive_config = load_daemon_config(config);
    if (!drive_config) {
        spdlog::error("Not configured. Run 'tg-drive config set' first.");
        return std::nullopt;
    }

    try {
        DaemonContext ctx;
        ctx.config = *drive_config;

        auto db_path = ctx.config.resolved_database_path();
        fs::create_directories(db_path.parent_path());
        ctx.store = std::make_unique<tgdrive::MetadataStore>(db_path.string());

        if (config.mock_mode) {
            spdlog::info("Running in mock mode");
            tgdrive::ClientFactory factory = [](const tgdrive::ProviderConfig&) {
                return std::make_shared<tg::MockBotApi>();
            };
            ctx.registry = std::make_unique<tgdrive::ProviderRegistry>(ctx.config.provider, factory);
        } else {
            ctx.registry = std::make_unique<tgdrive::ProviderRegistry>(
                ctx.config.provider, tgdrive::make_bot_api_client_factory()
            );
        }

        ctx.engine = std::make_unique<tgdrive::TransferEngine>(
            *ctx.store, *ctx.registry, tgdrive::TransferEngine::Config::from_drive_config(ctx.config)
        );
        return ctx;
    } catch (const std::exception& e) {
        spdlog::error("Initialisation failed: {}", e.what());
        return std::nullopt;
    }
}

//------------------------------------------------------------------------------
// Reload - SIGHUP
//------------------------------------------------------------------------------

bool same_provider(const tgdrive::ProviderConfig& a, const tgdrive::ProviderConfig& b) {
    return a.bot_token == b.bot_token && a.api_base_url == b.api_base_url && a.mode == b.mode &&
           a.storage_chat_id == b.storage_chat_id;
}

/// Re-read the configuration, apply new limits and swap the provider if it changed
void reload(const DaemonConfig& config, DaemonContext& ctx, std::stop_token stop) {
    auto fresh = load_daemon_config(config);
    if (!fresh) {
        spdlog::warn("Reload skipped: configuration missing or invalid");
        return;
    }

    ctx.engine->apply_settings(fresh->runtime_settings());
    spdlog::info(
        "Applied limits: {} upload(s), {} download(s), {} reserved bytes",
        fresh->upload_concurrency,
        fresh->download_concurrency,
        fresh->reserved_disk_bytes
    );

    if (same_provider(fresh->provider, ctx.config.provider)) {
        ctx.config = *fresh;
        return;
    }

    try {
        auto handle = ctx.engine->swap_provider(fresh->provider, stop);
        spdlog::info("Provider swapped to {} (generation {})", handle->describe(), handle.generation);
        ctx.config = *fresh;
    } catch (const tgdrive::ProviderValidationException& e) {
        spdlog::error("Keeping current provider: {}", e.what());
        fresh->provider = ctx.config.provider;
        ctx.config = *fresh;
    }
}

//------------------------------------------------------------------------------
// Main work loop - called AFTER initialisation
//------------------------------------------------------------------------------

/// Run the maintenance sweeps until SIGINT or SIGTERM
/// @return Exit code
int run(const DaemonConfig& config, DaemonContext& ctx, const sigset_t& signals) {
    std::stop_source shutdown;
    auto& engine = *ctx.engine;

    tgdrive::PeriodicTask reaper(
        "session-reaper",
        [&engine]() {
            auto expired = engine.reap_sessions(tgdrive::Clock::now());
            if (!expired.empty()) {
                spdlog::info("Expired {} idle upload session(s)", expired.size());
            }
        },
        tgdrive::PeriodicTask::Config{
            .interval = std::chrono::minutes(ctx.config.cleanup_interval_minutes),
            .run_immediately = true,
        }
    );

    auto token = shutdown.get_token();
    tgdrive::PeriodicTask delete_retry(
        "delete-retry",
        [&engine, token]() {
            auto summary = engine.retry_failed_deletes(tgdrive::Clock::now(), token);
            if (summary.attempted > 0) {
                spdlog::info(
                    "Delete retry: {} attempted, {} resolved, {} failed",
                    summary.attempted,
                    summary.resolved,
                    summary.failed
                );
            }
        },
        tgdrive::PeriodicTask::Config{
            .interval = std::chrono::minutes(ctx.config.delete_retry_interval_minutes),
            .run_immediately = true,
        }
    );

    reaper.start();
    delete_retry.start();
    spdlog::info("tg-drived running (provider {})", ctx.registry->current()->describe());

    int result = 0;
    while (true) {
        int sig = 0;
        if (sigwait(&signals, &sig) != 0) {
            spdlog::error("sigwait failed");
            result = 1;
            break;
        }
        if (sig == SIGHUP) {
            spdlog::info("SIGHUP received, reloading configuration");
            reload(config, ctx, token);
            delete_retry.trigger();
            continue;
        }
        spdlog::info("Signal {} received, shutting down", sig);
        break;
    }

    shutdown.request_stop();
    reaper.stop();
    delete_retry.stop();

    spdlog::info("tg-drived exiting with code: {}", result);
    return result;
}

}  // namespace

//------------------------------------------------------------------------------
// Main entry point
//------------------------------------------------------------------------------

int main(int argc, char* argv[]) {
    CLI::App app{"tg-drived - tg-drive maintenance daemon"};

    DaemonConfig config;

    app.add_option("-c,--config", config.config_path, "Configuration file (default: ~/.config/tg-drive/config.json)");
    app.add_flag("-f,--foreground", config.foreground, "Run in foreground (don't daemonise)");
    app.add_flag("-v,--verbose", config.verbosity, "Increase verbosity (-v, -vv, -vvv)");
    app.add_flag("--flush-logs", config.flush_logs, "Flush logs immediately (useful for debugging)");
    app.add_flag("--mock", config.mock_mode, "Use an in-memory provider (no Telegram connection)");

    CLI11_PARSE(app, argc, argv);

    // Pre-flight checks BEFORE daemonising (so errors go to stderr)
    if (!load_daemon_config(config)) {
        std::cerr << "Error: Not configured. Run 'tg-drive config set' first.\n";
        return 1;
    }

    // Daemonise BEFORE creating any threads or connections
    if (!config.foreground) {
        if (daemonise() < 0) {
            std::cerr << "Failed to daemonise\n";
            return 1;
        }
    }

    // Block the signals we wait for, so worker threads inherit the mask
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    sigaddset(&signals, SIGHUP);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    // All initialisation happens AFTER daemonising
    auto ctx = initialise(config);
    if (!ctx) {
        return 1;
    }

    return run(config, *ctx, signals);
}

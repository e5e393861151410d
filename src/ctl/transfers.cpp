#include "transfers.hpp"
#include "config.hpp"
#include "engine.hpp"

#include "drive/errors.hpp"
#include "tg/bot_api.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>
#include <variant>

namespace tgdrive::ctl {

namespace {

/// Print how to continue after a failure that kept the session alive
void print_resume_hint(const std::string& item_id, const std::string& file_path) {
    std::cerr << "The upload can be continued with: tg-drive resume " << item_id << " " << file_path << "\n";
}

/// Send chunks `next..total-1` of `session` from the local file, then complete it
int send_remaining(TransferEngine& engine, const UploadSession& session, int next, const std::string& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot open " << file_path << "\n";
        return 1;
    }

    int index = next;
    while (index < session.total_chunks) {
        auto size = session.chunk_size_for_index(index);
        std::string bytes(static_cast<std::size_t>(size), '\0');
        file.seekg(static_cast<std::streamoff>(index) * session.chunk_size);
        file.read(bytes.data(), static_cast<std::streamsize>(size));
        if (file.gcount() != size) {
            std::cerr << "Error: " << file_path << " changed since the upload started\n";
            return 1;
        }

        std::istringstream in(bytes);
        auto result = engine.upload_chunk(session.id, index, in);
        if (auto* wait = std::get_if<tg::RetryAfter>(&result)) {
            std::cerr << "Rate limited, retrying chunk " << index << " in " << wait->delay.count() << "s\n";
            std::this_thread::sleep_for(wait->delay);
            continue;
        }

        const auto& accepted = std::get<ChunkAccepted>(result);
        std::cout << fmt::format(
            "Chunk {}/{} ({} bytes){}\n",
            accepted.chunk_index + 1,
            accepted.total_chunks,
            accepted.chunk_size,
            accepted.replayed ? " already stored" : ""
        );
        index = accepted.next_chunk_index();
    }

    while (true) {
        auto result = engine.complete_upload(session.id);
        if (auto* wait = std::get_if<tg::RetryAfter>(&result)) {
            std::cerr << "Rate limited, completing in " << wait->delay.count() << "s\n";
            std::this_thread::sleep_for(wait->delay);
            continue;
        }

        const auto& item = std::get<Item>(result);
        std::cout << "Uploaded " << item.path << " (" << item.size << " bytes)\n";
        std::cout << "Item id: " << item.id << "\n";
        return 0;
    }
}

/// Parse "start-end", "start-" or "-suffix"
std::optional<ByteRange> parse_range_option(const std::string& range, int64_t size) {
    if (range.empty()) {
        return std::nullopt;
    }
    return parse_range_header("bytes=" + range, size);
}

}  // namespace

int exec_check() {
    auto config = require_config();
    if (!config) {
        return 1;
    }

    setup_file_logging();

    try {
        auto factory = make_bot_api_client_factory();
        auto api = factory(config->provider);
        tg::run_self_check(*api, config->provider.storage_chat_id);
        std::cout << "Provider OK: " << api->describe() << ", chat " << config->provider.storage_chat_id << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

int exec_mkdir(const std::string& name, const std::optional<std::string>& parent_id) {
    auto config = require_config();
    if (!config) {
        return 1;
    }

    try {
        auto ctx = open_engine(*config);
        auto folder = ctx.store->create_folder(name, parent_id, Clock::now());
        std::cout << "Created " << folder.path << "\n";
        std::cout << "Item id: " << folder.id << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

int exec_upload(const std::string& file_path, const std::optional<std::string>& parent_id, const std::string& mime_type) {
    auto config = require_config();
    if (!config) {
        return 1;
    }

    std::error_code ec;
    auto size = std::filesystem::file_size(file_path, ec);
    if (ec) {
        std::cerr << "Error: Cannot read " << file_path << ": " << ec.message() << "\n";
        return 1;
    }

    setup_file_logging();

    std::string item_id;
    try {
        auto ctx = open_engine(*config);
        auto name = std::filesystem::path(file_path).filename().string();
        auto start = ctx.engine->start_upload(name, mime_type, static_cast<int64_t>(size), parent_id);
        item_id = start.item.id;

        std::cout << fmt::format(
            "Uploading {} as {}: {} chunk(s) of up to {} bytes ({})\n",
            file_path,
            start.item.path,
            start.plan.total_chunks,
            start.plan.chunk_size,
            to_string(start.plan.staging)
        );

        return send_remaining(*ctx.engine, start.session, start.next_chunk_index, file_path);
    } catch (const UploadChunkException& e) {
        std::cerr << "Error: " << e.what() << "\n";
        if (e.resumable() && !item_id.empty()) {
            print_resume_hint(item_id, file_path);
        }
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

int exec_resume(const std::string& item_id, const std::string& file_path) {
    auto config = require_config();
    if (!config) {
        return 1;
    }

    setup_file_logging();

    try {
        auto ctx = open_engine(*config);
        auto state = ctx.engine->resume_upload(item_id);

        std::error_code ec;
        auto size = std::filesystem::file_size(file_path, ec);
        if (ec || static_cast<int64_t>(size) != state.session.file_size) {
            std::cerr << "Error: " << file_path << " does not match the interrupted upload ("
                      << state.session.file_size << " bytes expected)\n";
            return 1;
        }

        std::cout << fmt::format(
            "Resuming {}: {}/{} chunk(s) already stored\n",
            state.session.file_name,
            state.received.size(),
            state.session.total_chunks
        );

        return send_remaining(*ctx.engine, state.session, state.next_chunk_index, file_path);
    } catch (const UploadChunkException& e) {
        std::cerr << "Error: " << e.what() << "\n";
        if (e.resumable()) {
            print_resume_hint(item_id, file_path);
        }
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

int exec_download(const std::string& item_id, const std::string& output, const std::string& range) {
    auto config = require_config();
    if (!config) {
        return 1;
    }

    setup_file_logging();

    try {
        auto ctx = open_engine(*config);
        auto item = ctx.store->get_item(item_id);
        if (!item) {
            throw ItemNotFoundException(item_id);
        }

        auto stream = ctx.engine->open_download(item_id, parse_range_option(range, item->size));

        int64_t written = 0;
        if (output.empty() || output == "-") {
            written = stream->write_to(std::cout);
            std::cout.flush();
        } else {
            std::ofstream out(output, std::ios::binary | std::ios::trunc);
            if (!out.is_open()) {
                std::cerr << "Error: Cannot create " << output << "\n";
                return 1;
            }
            written = stream->write_to(out);
            if (!out.flush()) {
                std::cerr << "Error: Failed to write " << output << "\n";
                return 1;
            }
            std::cerr << "Wrote " << written << " bytes to " << output;
            if (stream->partial()) {
                std::cerr << " (" << stream->content_range() << ")";
            }
            std::cerr << "\n";
        }

        spdlog::info("Downloaded {} bytes of {}", written, item->path);
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

int exec_rm(const std::string& item_id) {
    auto config = require_config();
    if (!config) {
        return 1;
    }

    setup_file_logging();

    try {
        auto ctx = open_engine(*config);
        auto result = ctx.engine->delete_item_chunks(item_id);

        std::cout << fmt::format(
            "Removed {} item(s); {} of {} message(s) deleted\n",
            result.items_removed,
            result.deleted,
            result.attempted
        );
        for (const auto& outcome : result.outcomes) {
            if (!outcome.deleted) {
                std::cout << fmt::format(
                    "  {} chunk {} (message {}): queued for retry: {}\n",
                    outcome.item_path,
                    outcome.chunk_index,
                    outcome.message_id,
                    outcome.error
                );
            }
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace tgdrive::ctl

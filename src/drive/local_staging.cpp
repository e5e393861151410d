#include "drive/local_staging.hpp"

#include "drive/errors.hpp"
#include "drive/types.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <limits>

namespace tgdrive {

namespace {

constexpr std::size_t kCopyBufferSize = 64 * 1024;

}  // namespace

LocalStaging::LocalStaging(Config config) : config_(std::move(config)), reserved_bytes_(config_.reserved_disk_bytes) {
    if (!config_.root.empty()) {
        std::filesystem::create_directories(config_.root);
    }
}

std::filesystem::path LocalStaging::session_dir(const std::string& session_id) const { return config_.root / session_id; }

std::filesystem::path LocalStaging::chunk_path(const std::string& session_id, int chunk_index) const {
    return session_dir(session_id) / "chunks" / fmt::format("chunk-{:06d}.part", chunk_index);
}

void LocalStaging::ensure_space(int64_t bytes) const {
    std::error_code ec;
    auto info = std::filesystem::space(config_.root, ec);
    if (ec) {
        spdlog::warn("LocalStaging: cannot query free space of {}: {}", config_.root.string(), ec.message());
        return;
    }

    auto available = static_cast<int64_t>(std::min<uintmax_t>(info.available, std::numeric_limits<int64_t>::max()));
    auto reserved = reserved_bytes_.load();
    if (available - bytes < reserved) {
        throw InsufficientDiskSpaceException(bytes + reserved, available);
    }
}

void LocalStaging::write_exact(
    std::istream& in,
    int64_t expected_size,
    const std::filesystem::path& target,
    int chunk_index
) const {
    std::filesystem::create_directories(target.parent_path());

    auto tmp = target;
    tmp += fmt::format(".{}.tmp", generate_id().substr(0, 8));

    int64_t written = 0;
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw DriveException("Failed to create staging file: " + tmp.string());
        }

        std::vector<char> buffer(kCopyBufferSize);
        while (written < expected_size) {
            auto want = static_cast<std::streamsize>(std::min<int64_t>(buffer.size(), expected_size - written));
            in.read(buffer.data(), want);
            auto got = in.gcount();
            if (got <= 0) {
                break;
            }
            out.write(buffer.data(), got);
            written += got;
        }

        out.flush();
        if (!out) {
            std::filesystem::remove(tmp);
            throw DriveException("Failed to write staging file: " + tmp.string());
        }
    }

    int64_t extra = 0;
    if (written == expected_size && in.peek() != std::char_traits<char>::eof()) {
        in.ignore(std::numeric_limits<std::streamsize>::max());
        extra = in.gcount();
    }

    if (written != expected_size || extra > 0) {
        std::filesystem::remove(tmp);
        throw ChunkSizeMismatchException(chunk_index, expected_size, written + extra);
    }

    std::filesystem::rename(tmp, target);
}

std::filesystem::path LocalStaging::spool(
    const std::string& session_id,
    int chunk_index,
    std::istream& in,
    int64_t expected_size
) const {
    auto path = session_dir(session_id) / fmt::format("spool-{:06d}-{}.tmp", chunk_index, generate_id().substr(0, 8));
    write_exact(in, expected_size, path, chunk_index);
    return path;
}

void LocalStaging::stage_chunk(const std::string& session_id, int chunk_index, std::istream& in, int64_t expected_size)
    const {
    write_exact(in, expected_size, chunk_path(session_id, chunk_index), chunk_index);
    spdlog::debug("LocalStaging: staged chunk {} of session {} ({} bytes)", chunk_index, session_id, expected_size);
}

bool LocalStaging::has_chunk(const std::string& session_id, int chunk_index, int64_t expected_size) const {
    std::error_code ec;
    auto size = std::filesystem::file_size(chunk_path(session_id, chunk_index), ec);
    return !ec && static_cast<int64_t>(size) == expected_size;
}

std::filesystem::path LocalStaging::merge(const std::string& session_id, const std::vector<int64_t>& chunk_sizes) const {
    for (std::size_t i = 0; i < chunk_sizes.size(); ++i) {
        if (!has_chunk(session_id, static_cast<int>(i), chunk_sizes[i])) {
            throw DriveException(fmt::format("staged chunk {} of session {} is missing or truncated", i, session_id));
        }
    }

    auto merged = std::filesystem::absolute(session_dir(session_id) / "merged");
    std::ofstream out(merged, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw DriveException("Failed to create merged file: " + merged.string());
    }

    for (std::size_t i = 0; i < chunk_sizes.size(); ++i) {
        std::ifstream chunk(chunk_path(session_id, static_cast<int>(i)), std::ios::binary);
        if (!chunk.is_open()) {
            throw DriveException(fmt::format("Failed to open staged chunk {} of session {}", i, session_id));
        }
        out << chunk.rdbuf();
    }

    out.flush();
    if (!out) {
        throw DriveException("Failed to write merged file: " + merged.string());
    }

    spdlog::debug("LocalStaging: merged {} chunk(s) of session {}", chunk_sizes.size(), session_id);
    return merged;
}

void LocalStaging::remove_session(const std::string& session_id) const {
    std::error_code ec;
    std::filesystem::remove_all(session_dir(session_id), ec);
    if (ec) {
        spdlog::warn("LocalStaging: failed to remove {}: {}", session_dir(session_id).string(), ec.message());
    }
}

ScopedFile::~ScopedFile() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        spdlog::debug("ScopedFile: failed to remove {}: {}", path_.string(), ec.message());
    }
}

}  // namespace tgdrive

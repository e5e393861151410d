#include "drive/download_streamer.hpp"

#include "drive/errors.hpp"
#include "tg/exceptions.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <cstring>
#include <fstream>

namespace tgdrive {

namespace {

std::string_view trim(std::string_view value) {
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) {
        value.remove_suffix(1);
    }
    return value;
}

std::optional<int64_t> parse_offset(std::string_view value) {
    int64_t result = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (ec != std::errc() || ptr != value.data() + value.size() || result < 0) {
        return std::nullopt;
    }
    return result;
}

std::string read_local_range(const std::string& path, int64_t offset, int64_t length) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw tg::FileDownloadException(path, "cannot open local file");
    }

    in.seekg(offset);
    std::string data(static_cast<size_t>(length), '\0');
    in.read(data.data(), length);
    if (in.gcount() != length) {
        throw tg::FileDownloadException(path, fmt::format("short read at offset {}", offset));
    }
    return data;
}

}  // namespace

//------------------------------------------------------------------------------
// FilePathCache
//------------------------------------------------------------------------------

std::optional<std::string> FilePathCache::get(uint64_t generation, const std::string& file_id, Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find({generation, file_id});
    if (it == entries_.end()) {
        return std::nullopt;
    }
    if (it->second.expires_at <= now) {
        entries_.erase(it);
        return std::nullopt;
    }
    return it->second.path;
}

void FilePathCache::put(uint64_t generation, const std::string& file_id, std::string path, Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (entries_.size() >= kPruneThreshold) {
        std::erase_if(entries_, [now](const auto& entry) { return entry.second.expires_at <= now; });
    }
    entries_[{generation, file_id}] = Entry{std::move(path), now + ttl_};
}

void FilePathCache::invalidate(uint64_t generation, const std::string& file_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase({generation, file_id});
}

void FilePathCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

std::size_t FilePathCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

//------------------------------------------------------------------------------
// DownloadStream
//------------------------------------------------------------------------------

DownloadStream::DownloadStream(
    Item item,
    ByteRange range,
    bool partial,
    std::vector<ChunkWindow> windows,
    ProviderRegistry& registry,
    FilePathCache& paths,
    const DownloadStreamerConfig& config,
    TransferSlot slot,
    std::stop_token stop
)
    : item_(std::move(item)),
      range_(range),
      partial_(partial),
      windows_(std::move(windows)),
      registry_(registry),
      paths_(paths),
      config_(config),
      slot_(std::move(slot)),
      stop_(std::move(stop)) {
    if (!windows_.empty()) {
        window_position_ = windows_.front().start;
    }
}

std::string DownloadStream::content_type() const {
    return item_.mime_type && !item_.mime_type->empty() ? *item_.mime_type : "application/octet-stream";
}

std::string DownloadStream::content_range() const {
    return fmt::format("bytes {}-{}/{}", range_.start, range_.end, item_.size);
}

std::size_t DownloadStream::read(char* buffer, std::size_t size) {
    std::size_t copied = 0;

    while (copied < size) {
        if (buffer_offset_ >= buffer_.size() && !fill()) {
            slot_.release();
            break;
        }

        auto n = std::min(size - copied, buffer_.size() - buffer_offset_);
        std::memcpy(buffer + copied, buffer_.data() + buffer_offset_, n);
        buffer_offset_ += n;
        copied += n;
    }

    delivered_ += static_cast<int64_t>(copied);
    return copied;
}

int64_t DownloadStream::write_to(std::ostream& out) {
    std::vector<char> buffer(64 * 1024);
    int64_t written = 0;

    while (auto n = read(buffer.data(), buffer.size())) {
        out.write(buffer.data(), static_cast<std::streamsize>(n));
        if (!out) {
            throw DriveException("Failed to write download output");
        }
        written += static_cast<int64_t>(n);
    }
    return written;
}

bool DownloadStream::fill() {
    while (window_index_ < windows_.size()) {
        const auto& window = windows_[window_index_];
        if (window_position_ > window.end) {
            if (++window_index_ < windows_.size()) {
                window_position_ = windows_[window_index_].start;
            }
            continue;
        }

        if (stop_.stop_requested()) {
            throw tg::CancelledException("download of " + item_.id);
        }

        auto length = std::min(config_.block_size, window.end - window_position_ + 1);
        auto provider = registry_.current();
        buffer_ = fetch(provider, window.chunk, window_position_, length);
        if (static_cast<int64_t>(buffer_.size()) != length) {
            throw tg::FileDownloadException(
                window.chunk.file_id, fmt::format("expected {} bytes, got {}", length, buffer_.size())
            );
        }

        buffer_offset_ = 0;
        window_position_ += length;
        return true;
    }

    buffer_.clear();
    buffer_offset_ = 0;
    return false;
}

std::string DownloadStream::resolve_path(const ProviderHandle& provider, const Chunk& chunk, bool refresh) {
    if (!refresh) {
        if (auto cached = paths_.get(provider.generation, chunk.file_id, Clock::now())) {
            return *cached;
        }
    }

    for (int waits = 0;; ++waits) {
        auto result = provider->get_file(chunk.file_id, stop_);
        if (auto* file = std::get_if<tg::File>(&result)) {
            if (file->file_path.empty()) {
                throw tg::FileDownloadException(chunk.file_id, "provider returned no download path");
            }
            paths_.put(provider.generation, chunk.file_id, file->file_path, Clock::now());
            return file->file_path;
        }

        const auto& retry = std::get<tg::RetryAfter>(result);
        if (waits >= config_.max_rate_limit_waits) {
            throw tg::ApiException("getFile", 429, retry.description);
        }
        spdlog::debug("DownloadStream: getFile rate limited, waiting {}s", retry.delay.count());
        if (!interruptible_sleep(retry.delay, stop_)) {
            throw tg::CancelledException("getFile");
        }
    }
}

std::string DownloadStream::fetch(const ProviderHandle& provider, const Chunk& chunk, int64_t offset, int64_t length) {
    auto read_from = [&](const std::string& path) {
        if (!path.empty() && path.front() == '/') {
            // Local Bot API servers hand out paths on their own disk
            return read_local_range(path, offset, length);
        }
        return provider->fetch_file_range(path, offset, length, stop_);
    };

    auto path = resolve_path(provider, chunk, false);
    try {
        return read_from(path);
    } catch (const tg::FileDownloadException& e) {
        // The cached path may have expired on the provider side
        spdlog::debug("DownloadStream: refreshing path of {} after: {}", chunk.file_id, e.what());
        paths_.invalidate(provider.generation, chunk.file_id);
    }
    return read_from(resolve_path(provider, chunk, true));
}

//------------------------------------------------------------------------------
// DownloadStreamer
//------------------------------------------------------------------------------

DownloadStreamer::DownloadStreamer(MetadataStore& store, ProviderRegistry& registry, TransferLimiter& limiter, Config config)
    : store_(store), registry_(registry), limiter_(limiter), config_(config), paths_(config.path_ttl) {
    if (config_.block_size <= 0) {
        config_.block_size = 1024 * 1024;
    }
}

std::unique_ptr<DownloadStream> DownloadStreamer::open(
    const std::string& item_id,
    const std::optional<ByteRange>& range,
    std::stop_token stop
) {
    auto item = store_.get_item(item_id);
    if (!item) {
        throw ItemNotFoundException(item_id);
    }
    if (item->is_folder()) {
        throw ValidationException("cannot download a folder: " + item->path);
    }
    if (store_.get_session_by_item(item_id)) {
        throw ValidationException("item is still uploading: " + item->path);
    }
    // Finalized files always have a positive size; zero means a cancelled or expired upload
    if (item->size <= 0) {
        throw ValidationException("upload was not completed: " + item->path);
    }

    auto chunks = store_.list_chunks(item_id);
    try {
        verify_chunk_sequence(item_id, chunks, item->size);
    } catch (const CorruptedItemException& e) {
        spdlog::error("DownloadStreamer: {}", e.what());
        throw;
    }

    ByteRange resolved{0, item->size - 1};
    bool partial = range.has_value();
    if (range) {
        resolved = resolve_range(*range, item->size);
    }

    // Prefix sums give each chunk's absolute offset
    std::vector<ChunkWindow> windows;
    int64_t offset = 0;
    for (auto& chunk : chunks) {
        int64_t chunk_end = offset + chunk.chunk_size - 1;
        if (item->size > 0 && chunk_end >= resolved.start && offset <= resolved.end) {
            ChunkWindow window;
            window.chunk_offset = offset;
            window.start = std::max(resolved.start, offset) - offset;
            window.end = std::min(resolved.end, chunk_end) - offset;
            window.chunk = std::move(chunk);
            windows.push_back(std::move(window));
        }
        offset = chunk_end + 1;
    }

    TransferSlot slot(limiter_, TransferKind::DOWNLOAD);

    spdlog::debug(
        "DownloadStreamer: {} bytes {}-{} of {} across {} chunk(s)",
        item->path,
        resolved.start,
        resolved.end,
        item->size,
        windows.size()
    );

    return std::make_unique<DownloadStream>(
        std::move(*item), resolved, partial, std::move(windows), registry_, paths_, config_, std::move(slot), std::move(stop)
    );
}

void verify_chunk_sequence(const std::string& item_id, const std::vector<Chunk>& chunks, int64_t size) {
    int64_t total = 0;
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        if (chunks[i].chunk_index != static_cast<int>(i)) {
            throw CorruptedItemException(
                item_id, fmt::format("chunk {} found where chunk {} was expected", chunks[i].chunk_index, i)
            );
        }
        if (chunks[i].chunk_size <= 0) {
            throw CorruptedItemException(item_id, fmt::format("chunk {} is empty", i));
        }
        total += chunks[i].chunk_size;
    }

    if (total != size) {
        throw CorruptedItemException(item_id, fmt::format("chunks hold {} bytes, item size is {}", total, size));
    }
}

ByteRange resolve_range(const ByteRange& requested, int64_t size) {
    if (requested.start < 0) {
        throw InvalidRangeException(fmt::format("negative start {}", requested.start));
    }
    if (requested.start >= size) {
        throw UnsatisfiableRangeException(requested.start, size);
    }
    if (requested.end < requested.start) {
        throw InvalidRangeException(fmt::format("end {} before start {}", requested.end, requested.start));
    }
    return ByteRange{requested.start, std::min(requested.end, size - 1)};
}

std::optional<ByteRange> parse_range_header(std::string_view header, int64_t size) {
    auto raw = trim(header);
    if (raw.empty()) {
        return std::nullopt;
    }
    if (size <= 0) {
        throw UnsatisfiableRangeException(0, size);
    }

    constexpr std::string_view kUnit = "bytes=";
    if (!raw.starts_with(kUnit)) {
        throw InvalidRangeException(fmt::format("unsupported unit in '{}'", raw));
    }

    auto ranges = trim(raw.substr(kUnit.size()));
    if (ranges.empty()) {
        throw InvalidRangeException("empty range");
    }
    if (ranges.find(',') != std::string_view::npos) {
        throw InvalidRangeException("multiple ranges are not supported");
    }

    auto dash = ranges.find('-');
    if (dash == std::string_view::npos) {
        throw InvalidRangeException(fmt::format("missing '-' in '{}'", ranges));
    }

    auto start_raw = trim(ranges.substr(0, dash));
    auto end_raw = trim(ranges.substr(dash + 1));

    // bytes=-N: the last N bytes
    if (start_raw.empty()) {
        auto n = parse_offset(end_raw);
        if (!n || *n == 0) {
            throw InvalidRangeException(fmt::format("bad suffix length '{}'", end_raw));
        }
        return ByteRange{std::max<int64_t>(0, size - *n), size - 1};
    }

    auto start = parse_offset(start_raw);
    if (!start) {
        throw InvalidRangeException(fmt::format("bad start '{}'", start_raw));
    }

    int64_t end = size - 1;
    if (!end_raw.empty()) {
        auto parsed = parse_offset(end_raw);
        if (!parsed) {
            throw InvalidRangeException(fmt::format("bad end '{}'", end_raw));
        }
        end = *parsed;
    }

    return resolve_range(ByteRange{*start, end}, size);
}

}  // namespace tgdrive

#pragma once

#include "drive/metadata_store.hpp"
#include "drive/provider_registry.hpp"
#include "drive/transfer_limiter.hpp"
#include "drive/types.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tgdrive {

/// Configuration for DownloadStreamer
struct DownloadStreamerConfig {
    int64_t block_size{1024 * 1024};         // Bytes fetched per provider request
    std::chrono::minutes path_ttl{55};       // Download paths expire after an hour on the provider side
    int max_rate_limit_waits{3};             // getFile rate limits waited out before giving up
};

/// Download paths resolved by getFile, per provider generation
class FilePathCache {
public:
    explicit FilePathCache(std::chrono::minutes ttl) : ttl_(ttl) {}

    // Disable copy
    FilePathCache(const FilePathCache&) = delete;
    FilePathCache& operator=(const FilePathCache&) = delete;

    [[nodiscard]] std::optional<std::string> get(uint64_t generation, const std::string& file_id, Timestamp now);
    void put(uint64_t generation, const std::string& file_id, std::string path, Timestamp now);
    void invalidate(uint64_t generation, const std::string& file_id);
    void clear();

    [[nodiscard]] std::size_t size() const;

    /// Expired entries are swept from put() once the map holds this many
    static constexpr std::size_t kPruneThreshold = 256;

private:
    struct Entry {
        std::string path;
        Timestamp expires_at;
    };

    std::chrono::minutes ttl_;
    std::map<std::pair<uint64_t, std::string>, Entry> entries_;
    mutable std::mutex mutex_;
};

/// Part of one chunk to stream
struct ChunkWindow {
    Chunk chunk;
    int64_t chunk_offset{0};  // Absolute offset of the chunk in the file
    int64_t start{0};         // First byte inside the chunk
    int64_t end{0};           // Last byte inside the chunk (inclusive)
};

/// Lazy, single-pass byte sequence of one item
///
/// Bytes are pulled from the provider one block at a time, so memory use is
/// bounded by the block size. Holds a download slot until the range is
/// exhausted or the stream is destroyed.
class DownloadStream {
public:
    DownloadStream(
        Item item,
        ByteRange range,
        bool partial,
        std::vector<ChunkWindow> windows,
        ProviderRegistry& registry,
        FilePathCache& paths,
        const DownloadStreamerConfig& config,
        TransferSlot slot,
        std::stop_token stop
    );

    // Disable copy
    DownloadStream(const DownloadStream&) = delete;
    DownloadStream& operator=(const DownloadStream&) = delete;

    /// Read up to `size` bytes
    /// @return Bytes copied, 0 once the range is exhausted
    std::size_t read(char* buffer, std::size_t size);

    /// Pump the remaining bytes into `out`
    /// @return Bytes written
    int64_t write_to(std::ostream& out);

    [[nodiscard]] const Item& item() const { return item_; }
    [[nodiscard]] int64_t total_size() const { return item_.size; }
    [[nodiscard]] const ByteRange& range() const { return range_; }
    [[nodiscard]] int64_t content_length() const { return item_.size == 0 ? 0 : range_.length(); }
    [[nodiscard]] bool partial() const { return partial_; }
    [[nodiscard]] std::string content_type() const;
    [[nodiscard]] int64_t remaining() const { return content_length() - delivered_; }

    /// "bytes start-end/size" for a 206 answer
    [[nodiscard]] std::string content_range() const;

private:
    /// Fetch the next block of the current window into buffer_
    bool fill();

    /// Resolve a file reference to a download path through the cache
    std::string resolve_path(const ProviderHandle& provider, const Chunk& chunk, bool refresh);

    std::string fetch(const ProviderHandle& provider, const Chunk& chunk, int64_t offset, int64_t length);

    Item item_;
    ByteRange range_;
    bool partial_;
    std::vector<ChunkWindow> windows_;
    ProviderRegistry& registry_;
    FilePathCache& paths_;
    DownloadStreamerConfig config_;
    TransferSlot slot_;
    std::stop_token stop_;

    std::size_t window_index_{0};
    int64_t window_position_{0};  // Next byte inside the current window's chunk
    std::string buffer_;
    std::size_t buffer_offset_{0};
    int64_t delivered_{0};
};

/// Opens byte-range streams over an item's chunks
class DownloadStreamer {
public:
    using Config = DownloadStreamerConfig;

    DownloadStreamer(MetadataStore& store, ProviderRegistry& registry, TransferLimiter& limiter, Config config = {});

    // Disable copy
    DownloadStreamer(const DownloadStreamer&) = delete;
    DownloadStreamer& operator=(const DownloadStreamer&) = delete;

    /// Open a stream over the whole item or an inclusive byte range
    /// @throws ItemNotFoundException, ValidationException for folders and items still uploading
    /// @throws UnsatisfiableRangeException if the range starts past the end
    /// @throws CorruptedItemException if the chunk sequence does not cover the item
    /// @throws TooManyConcurrentTransfersException when every download slot is taken
    std::unique_ptr<DownloadStream> open(
        const std::string& item_id,
        const std::optional<ByteRange>& range = std::nullopt,
        std::stop_token stop = {}
    );

    [[nodiscard]] FilePathCache& path_cache() { return paths_; }

private:
    MetadataStore& store_;
    ProviderRegistry& registry_;
    TransferLimiter& limiter_;
    Config config_;
    FilePathCache paths_;
};

/// Check an item's chunks form 0..n-1 and add up to `size`
/// @throws CorruptedItemException otherwise
void verify_chunk_sequence(const std::string& item_id, const std::vector<Chunk>& chunks, int64_t size);

/// Clamp a requested range to an item of `size` bytes
/// @throws UnsatisfiableRangeException if start >= size
/// @throws InvalidRangeException if end < start
ByteRange resolve_range(const ByteRange& requested, int64_t size);

/// Parse a single-range HTTP Range header ("bytes=a-b", "bytes=a-", "bytes=-n")
/// @return std::nullopt for an empty header (whole item)
/// @throws InvalidRangeException for malformed or multi-range headers
/// @throws UnsatisfiableRangeException if the range starts past the end
std::optional<ByteRange> parse_range_header(std::string_view header, int64_t size);

}  // namespace tgdrive

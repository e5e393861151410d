#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <string>
#include <utility>
#include <vector>

namespace tgdrive {

/// Configuration for LocalStaging
struct LocalStagingConfig {
    std::filesystem::path root;
    int64_t reserved_disk_bytes{0};  // Free space that must remain after staging
};

/// On-disk working area for uploads
///
/// Layout: <root>/<session_id>/chunks/chunk-NNNNNN.part for staged chunks,
/// <root>/<session_id>/spool-*.tmp for chunks on their way to the provider
/// and <root>/<session_id>/merged for the reassembled file.
class LocalStaging {
public:
    using Config = LocalStagingConfig;

    explicit LocalStaging(Config config);

    // Disable copy
    LocalStaging(const LocalStaging&) = delete;
    LocalStaging& operator=(const LocalStaging&) = delete;

    /// @throws InsufficientDiskSpaceException if writing `bytes` would eat into the reserve
    void ensure_space(int64_t bytes) const;

    /// Copy exactly `expected_size` bytes from `in` to `target`
    ///
    /// The data is written to a temporary sibling and renamed into place, so
    /// `target` either holds the complete chunk or does not exist.
    /// @throws ChunkSizeMismatchException if the stream is shorter or longer
    void write_exact(std::istream& in, int64_t expected_size, const std::filesystem::path& target, int chunk_index) const;

    /// Spool a chunk to a fresh temporary file and return its path
    std::filesystem::path spool(const std::string& session_id, int chunk_index, std::istream& in, int64_t expected_size) const;

    /// Stage a chunk for a later merge
    void stage_chunk(const std::string& session_id, int chunk_index, std::istream& in, int64_t expected_size) const;

    /// True if chunk `index` is staged with exactly `expected_size` bytes
    [[nodiscard]] bool has_chunk(const std::string& session_id, int chunk_index, int64_t expected_size) const;

    /// Concatenate staged chunks 0..sizes.size()-1 into the merged file
    /// @throws DriveException if a staged chunk is missing or has the wrong size
    std::filesystem::path merge(const std::string& session_id, const std::vector<int64_t>& chunk_sizes) const;

    /// Remove everything staged for a session
    void remove_session(const std::string& session_id) const;

    /// Change the free-space reserve (thread-safe)
    void set_reserved_disk_bytes(int64_t bytes) { reserved_bytes_.store(bytes); }
    [[nodiscard]] int64_t reserved_disk_bytes() const { return reserved_bytes_.load(); }

    [[nodiscard]] std::filesystem::path session_dir(const std::string& session_id) const;
    [[nodiscard]] std::filesystem::path chunk_path(const std::string& session_id, int chunk_index) const;
    [[nodiscard]] const Config& get_config() const { return config_; }

private:
    Config config_;
    std::atomic<int64_t> reserved_bytes_;
};

/// Removes a file when it goes out of scope
class ScopedFile {
public:
    explicit ScopedFile(std::filesystem::path path) : path_(std::move(path)) {}
    ~ScopedFile();

    // Disable copy
    ScopedFile(const ScopedFile&) = delete;
    ScopedFile& operator=(const ScopedFile&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

}  // namespace tgdrive

#pragma once

#include <cstdint>
#include <exception>
#include <string>
#include <vector>

namespace tgdrive {

// Base exception for all transfer engine errors
class DriveException : public std::exception {
public:
    explicit DriveException(const std::string& message) : message_(message) {}

    const char* what() const noexcept override { return message_.c_str(); }

    const std::string& message() const { return message_; }

private:
    std::string message_;
};

// Validation errors: the caller must correct its input, retrying is pointless
class ValidationException : public DriveException {
public:
    explicit ValidationException(const std::string& message) : DriveException(message) {}
};

class AlreadyInProgressException : public ValidationException {
public:
    AlreadyInProgressException(const std::string& item_id, const std::string& session_id)
        : ValidationException("Upload already in progress for item " + item_id + " (session " + session_id + ")"),
          item_id_(item_id),
          session_id_(session_id) {}

    const std::string& item_id() const { return item_id_; }
    const std::string& session_id() const { return session_id_; }

private:
    std::string item_id_;
    std::string session_id_;
};

class InvalidChunkIndexException : public ValidationException {
public:
    InvalidChunkIndexException(int index, int expected, int total)
        : ValidationException(
              "Invalid chunk index " + std::to_string(index) + ", expected " + std::to_string(expected) + " of " +
              std::to_string(total)
          ),
          expected_(expected) {}

    int expected() const { return expected_; }

private:
    int expected_;
};

class ChunkSizeMismatchException : public ValidationException {
public:
    ChunkSizeMismatchException(int index, int64_t expected, int64_t actual)
        : ValidationException(
              "Chunk " + std::to_string(index) + " has " + std::to_string(actual) + " bytes, expected " +
              std::to_string(expected)
          ) {}
};

class IncompleteUploadException : public ValidationException {
public:
    explicit IncompleteUploadException(std::vector<int> missing)
        : ValidationException("Upload incomplete, " + std::to_string(missing.size()) + " chunk(s) missing"),
          missing_(std::move(missing)) {}

    const std::vector<int>& missing() const { return missing_; }

private:
    std::vector<int> missing_;
};

class InvalidRangeException : public ValidationException {
public:
    explicit InvalidRangeException(const std::string& detail) : ValidationException("Invalid range: " + detail) {}
};

class UnsatisfiableRangeException : public ValidationException {
public:
    UnsatisfiableRangeException(int64_t start, int64_t size)
        : ValidationException(
              "Range start " + std::to_string(start) + " not satisfiable for size " + std::to_string(size)
          ),
          size_(size) {}

    int64_t size() const { return size_; }

private:
    int64_t size_;
};

class ProviderValidationException : public ValidationException {
public:
    explicit ProviderValidationException(const std::string& detail)
        : ValidationException("Provider validation failed: " + detail) {}
};

// Lookup errors
class NotFoundException : public DriveException {
public:
    explicit NotFoundException(const std::string& message) : DriveException(message) {}
};

class ItemNotFoundException : public NotFoundException {
public:
    explicit ItemNotFoundException(const std::string& item_id) : NotFoundException("Item not found: " + item_id) {}
};

class SessionNotFoundException : public NotFoundException {
public:
    explicit SessionNotFoundException(const std::string& key) : NotFoundException("Upload session not found: " + key) {}
};

// Admission control
class TooManyConcurrentTransfersException : public DriveException {
public:
    TooManyConcurrentTransfersException(const std::string& kind, int limit)
        : DriveException("Too many concurrent " + kind + "s (limit " + std::to_string(limit) + ")") {}
};

class InsufficientDiskSpaceException : public DriveException {
public:
    InsufficientDiskSpaceException(int64_t required, int64_t available)
        : DriveException(
              "Insufficient disk space: need " + std::to_string(required) + " bytes, " + std::to_string(available) +
              " available"
          ) {}
};

// A chunk could not be stored by the provider
class UploadChunkException : public DriveException {
public:
    UploadChunkException(int chunk_index, bool resumable, const std::string& reason)
        : DriveException(
              "Chunk " + std::to_string(chunk_index) + " upload failed (" +
              (resumable ? "resumable" : "session failed") + "): " + reason
          ),
          chunk_index_(chunk_index),
          resumable_(resumable) {}

    int chunk_index() const { return chunk_index_; }
    bool resumable() const { return resumable_; }

private:
    int chunk_index_;
    bool resumable_;
};

// Fatal errors
class CorruptedItemException : public DriveException {
public:
    CorruptedItemException(const std::string& item_id, const std::string& detail)
        : DriveException("Item " + item_id + " is corrupted: " + detail) {}
};

class DatabaseException : public DriveException {
public:
    explicit DatabaseException(const std::string& message) : DriveException("Database error: " + message) {}
};

}  // namespace tgdrive

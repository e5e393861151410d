#pragma once

#include "drive/types.hpp"

#include <mutex>

namespace tgdrive {

/// Configuration for TransferLimiter
struct TransferLimiterConfig {
    int max_uploads{1};
    int max_downloads{2};
};

/// Process-wide admission control for uploads and downloads
///
/// Both counters share one mutex. acquire() never blocks: it either takes a
/// slot or throws TooManyConcurrentTransfersException.
class TransferLimiter {
public:
    using Config = TransferLimiterConfig;

    explicit TransferLimiter(Config config = {});

    // Disable copy
    TransferLimiter(const TransferLimiter&) = delete;
    TransferLimiter& operator=(const TransferLimiter&) = delete;

    /// Take a slot of the given kind
    /// @throws TooManyConcurrentTransfersException when the kind is at its limit
    void acquire(TransferKind kind);

    /// Give a slot back; releasing with no slot held is ignored
    void release(TransferKind kind);

    /// Change both limits (values below 1 are raised to 1)
    /// Slots already held above a lowered limit stay valid until released.
    void set_limits(int max_uploads, int max_downloads);

    [[nodiscard]] int active(TransferKind kind) const;
    [[nodiscard]] int limit(TransferKind kind) const;

private:
    int max_uploads_;
    int max_downloads_;
    int active_uploads_{0};
    int active_downloads_{0};
    mutable std::mutex mutex_;
};

/// Slot held for the lifetime of a transfer
class TransferSlot {
public:
    TransferSlot() = default;

    /// @throws TooManyConcurrentTransfersException
    TransferSlot(TransferLimiter& limiter, TransferKind kind);
    ~TransferSlot();

    // Disable copy
    TransferSlot(const TransferSlot&) = delete;
    TransferSlot& operator=(const TransferSlot&) = delete;

    TransferSlot(TransferSlot&& other) noexcept;
    TransferSlot& operator=(TransferSlot&& other) noexcept;

    /// Release early (idempotent)
    void release();

    [[nodiscard]] bool held() const { return limiter_ != nullptr; }

private:
    TransferLimiter* limiter_{nullptr};
    TransferKind kind_{TransferKind::UPLOAD};
};

}  // namespace tgdrive

#include "drive/transfer_limiter.hpp"

#include "drive/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace tgdrive {

TransferLimiter::TransferLimiter(Config config)
    : max_uploads_(std::max(1, config.max_uploads)), max_downloads_(std::max(1, config.max_downloads)) {}

void TransferLimiter::acquire(TransferKind kind) {
    std::lock_guard<std::mutex> lock(mutex_);

    int& active = kind == TransferKind::UPLOAD ? active_uploads_ : active_downloads_;
    int max = kind == TransferKind::UPLOAD ? max_uploads_ : max_downloads_;
    if (active >= max) {
        spdlog::debug("TransferLimiter: rejecting {} ({}/{} active)", to_string(kind), active, max);
        throw TooManyConcurrentTransfersException(to_string(kind), max);
    }
    ++active;
}

void TransferLimiter::release(TransferKind kind) {
    std::lock_guard<std::mutex> lock(mutex_);

    int& active = kind == TransferKind::UPLOAD ? active_uploads_ : active_downloads_;
    if (active > 0) {
        --active;
    }
}

void TransferLimiter::set_limits(int max_uploads, int max_downloads) {
    std::lock_guard<std::mutex> lock(mutex_);
    max_uploads_ = std::max(1, max_uploads);
    max_downloads_ = std::max(1, max_downloads);
    spdlog::debug("TransferLimiter: limits set to {} upload(s), {} download(s)", max_uploads_, max_downloads_);
}

int TransferLimiter::active(TransferKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return kind == TransferKind::UPLOAD ? active_uploads_ : active_downloads_;
}

int TransferLimiter::limit(TransferKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return kind == TransferKind::UPLOAD ? max_uploads_ : max_downloads_;
}

TransferSlot::TransferSlot(TransferLimiter& limiter, TransferKind kind) : kind_(kind) {
    limiter.acquire(kind);
    limiter_ = &limiter;
}

TransferSlot::~TransferSlot() { release(); }

TransferSlot::TransferSlot(TransferSlot&& other) noexcept
    : limiter_(std::exchange(other.limiter_, nullptr)), kind_(other.kind_) {}

TransferSlot& TransferSlot::operator=(TransferSlot&& other) noexcept {
    if (this != &other) {
        release();
        limiter_ = std::exchange(other.limiter_, nullptr);
        kind_ = other.kind_;
    }
    return *this;
}

void TransferSlot::release() {
    if (limiter_) {
        limiter_->release(kind_);
        limiter_ = nullptr;
    }
}

}  // namespace tgdrive

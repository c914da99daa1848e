/**
 * @file operation_locks.cpp
 * @brief OperationLocks and OperationGuard implementation
 */

#include "operation_locks.h"

#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

namespace infrastructure {

// =============================================================================
// OperationGuard
// =============================================================================

OperationGuard::OperationGuard(std::unique_lock<std::mutex> local, IInterprocessLock* shared,
                               OperationCategory category)
    : local_(std::move(local)), shared_(shared), category_(category) {}

OperationGuard::~OperationGuard() {
    unlock();
}

OperationGuard::OperationGuard(OperationGuard&& other) noexcept
    : local_(std::move(other.local_)), shared_(other.shared_), category_(other.category_) {
    other.shared_ = nullptr;
}

OperationGuard& OperationGuard::operator=(OperationGuard&& other) noexcept {
    if (this != &other) {
        unlock();
        local_ = std::move(other.local_);
        shared_ = other.shared_;
        category_ = other.category_;
        other.shared_ = nullptr;
    }
    return *this;
}

void OperationGuard::unlock() {
    if (shared_) {
        IInterprocessLock* shared = shared_;
        shared_ = nullptr;
        try {
            shared->unlock(category_);
        } catch (const std::exception& e) {
            spdlog::error("[OperationLocks] Failed to release cross-process lock {}: {}",
                          static_cast<size_t>(category_), e.what());
        }
    }
    if (local_.owns_lock()) {
        local_.unlock();
    }
}

// =============================================================================
// OperationLocks
// =============================================================================

OperationGuard OperationLocks::acquire(OperationCategory category) {
    std::unique_lock<std::mutex> local(mutexFor(category));
    if (shared_) {
        // Throws with the local mutex still owned by `local`, which releases it
        shared_->lock(category);
    }
    return OperationGuard(std::move(local), shared_, category);
}

} // namespace infrastructure

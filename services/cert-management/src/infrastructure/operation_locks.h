#pragma once

/**
 * @file operation_locks.h
 * @brief Per-category mutual exclusion for certificate workflows
 *
 * Each category has its own mutex. Workflows hold the guard for the whole
 * operation, so two creates never interleave while a create and a delete may.
 *
 * The in-process mutex only covers threads of one process. When an
 * IInterprocessLock is attached, the guard also holds the category's
 * cross-process lock, so a one-shot CLI command and the daemon exclude each
 * other as well.
 *
 * Lock order: CaCreate / CaUpdate -> CertificateCreate -> SerialAllocation.
 */

#include <array>
#include <cstddef>
#include <mutex>

namespace infrastructure {

enum class OperationCategory : size_t {
    CertificateCreate = 0,
    CertificateUpdate,
    CertificateDelete,
    CaCreate,
    CaUpdate,
    CaDelete,
    AcmeRenewal,
    SerialAllocation,   ///< Held from serial allocation until the record is stored
    Count_
};

/**
 * @brief Cross-process lock keyed by operation category
 *
 * lock() and unlock() for one category are always called by the thread
 * holding that category's in-process mutex.
 */
class IInterprocessLock {
public:
    virtual ~IInterprocessLock() = default;

    /// Block until no other process holds @p category
    virtual void lock(OperationCategory category) = 0;

    virtual void unlock(OperationCategory category) = 0;
};

/**
 * @brief Movable guard over one category's in-process and cross-process locks
 *
 * Default-constructed guards own nothing; assign from OperationLocks::acquire().
 */
class OperationGuard {
public:
    OperationGuard() = default;
    OperationGuard(std::unique_lock<std::mutex> local, IInterprocessLock* shared,
                   OperationCategory category);
    ~OperationGuard();

    OperationGuard(const OperationGuard&) = delete;
    OperationGuard& operator=(const OperationGuard&) = delete;
    OperationGuard(OperationGuard&& other) noexcept;
    OperationGuard& operator=(OperationGuard&& other) noexcept;

    bool owns_lock() const { return local_.owns_lock(); }

    /// Release both locks before scope exit; no-op if nothing is held
    void unlock();

private:
    std::unique_lock<std::mutex> local_;
    IInterprocessLock* shared_ = nullptr;  // Non-owning; null once released
    OperationCategory category_ = OperationCategory::Count_;
};

class OperationLocks {
public:
    /// @param shared Optional cross-process lock (non-owning)
    explicit OperationLocks(IInterprocessLock* shared = nullptr) : shared_(shared) {}
    OperationLocks(const OperationLocks&) = delete;
    OperationLocks& operator=(const OperationLocks&) = delete;

    /**
     * @brief Block until the category is free in this and every other process
     * @throws common::DatabaseException if the cross-process lock fails
     */
    [[nodiscard]] OperationGuard acquire(OperationCategory category);

private:
    std::mutex& mutexFor(OperationCategory category) {
        return mutexes_[static_cast<size_t>(category)];
    }

    IInterprocessLock* shared_;
    std::array<std::mutex, static_cast<size_t>(OperationCategory::Count_)> mutexes_;
};

} // namespace infrastructure

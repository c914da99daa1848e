#pragma once

/**
 * @file renewal_scheduler.h
 * @brief Periodic ACME renewal sweep
 *
 * Runs the renewal callback once after a startup delay and then every
 * configured interval. A sweep can also be triggered manually.
 *
 * @date 2026-02-22
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace infrastructure {

class RenewalScheduler {
public:
    using RenewFn = std::function<void()>;

    RenewalScheduler();
    ~RenewalScheduler();

    RenewalScheduler(const RenewalScheduler&) = delete;
    RenewalScheduler& operator=(const RenewalScheduler&) = delete;

    /**
     * @brief Configure scheduler parameters
     * @param startupDelay Wait before the first sweep
     * @param interval Wait between sweeps
     */
    void configure(std::chrono::seconds startupDelay, std::chrono::seconds interval);

    void setRenewFn(RenewFn fn);

    /** @brief Start the scheduler thread */
    void start();

    /** @brief Stop the scheduler and join its thread */
    void stop();

    /** @brief Run a sweep now instead of waiting for the next interval */
    void triggerRenewal();

    /// Completed sweeps, failed ones included
    size_t sweepCount() const { return sweeps_; }

private:
    void run();
    bool waitFor(std::chrono::seconds duration);

    std::atomic<bool> running_;
    std::atomic<size_t> sweeps_;
    bool forceRenewal_ = false;

    std::chrono::seconds startupDelay_{10};
    std::chrono::seconds interval_{24 * 3600};

    RenewFn renewFn_;

    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace infrastructure

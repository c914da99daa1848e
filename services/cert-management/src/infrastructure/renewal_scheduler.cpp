/**
 * @file renewal_scheduler.cpp
 * @brief RenewalScheduler implementation
 */

#include "renewal_scheduler.h"
#include <spdlog/spdlog.h>

namespace infrastructure {

RenewalScheduler::RenewalScheduler() : running_(false), sweeps_(0) {}

RenewalScheduler::~RenewalScheduler() {
    stop();
}

void RenewalScheduler::configure(std::chrono::seconds startupDelay, std::chrono::seconds interval) {
    startupDelay_ = startupDelay;
    interval_ = interval;
}

void RenewalScheduler::setRenewFn(RenewFn fn) {
    renewFn_ = std::move(fn);
}

void RenewalScheduler::start() {
    if (running_.exchange(true)) return;

    thread_ = std::thread([this]() { run(); });
}

void RenewalScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
}

void RenewalScheduler::triggerRenewal() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        forceRenewal_ = true;
    }
    cv_.notify_all();
}

// Returns false when stopped during the wait
bool RenewalScheduler::waitFor(std::chrono::seconds duration) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, duration, [this]() { return !running_ || forceRenewal_; });
    forceRenewal_ = false;
    return running_;
}

void RenewalScheduler::run() {
    spdlog::info("[RenewalScheduler] Started (first sweep in {}s, then every {}h)",
                 startupDelay_.count(), interval_.count() / 3600);

    std::chrono::seconds wait = startupDelay_;
    while (waitFor(wait)) {
        spdlog::info("[RenewalScheduler] === Starting renewal sweep ===");
        try {
            if (renewFn_) {
                renewFn_();
            }
            spdlog::info("[RenewalScheduler] === Renewal sweep completed ===");
        } catch (const std::exception& e) {
            spdlog::error("[RenewalScheduler] Renewal sweep failed: {}", e.what());
        }
        ++sweeps_;
        wait = interval_;
    }

    spdlog::info("[RenewalScheduler] Stopped");
}

} // namespace infrastructure

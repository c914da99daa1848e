#pragma once

#include <memory>
#include <mutex>
#include <string>

/**
 * @file progress_reporter.h
 * @brief Best-effort job progress reporting
 *
 * Workflows report percentage and a description through ProgressReporter.
 * Percentages never go backwards, and a sink that throws is logged and
 * ignored so reporting can never fail a workflow.
 *
 * @date 2026-02-18
 */

namespace common {

/**
 * @brief Destination for progress updates (log, job table, UI push)
 */
class IProgressSink {
public:
    virtual ~IProgressSink() = default;

    virtual void onProgress(const std::string& job, double percent, const std::string& description) = 0;
};

/**
 * @brief Writes progress lines to spdlog
 */
class LoggingProgressSink : public IProgressSink {
public:
    void onProgress(const std::string& job, double percent, const std::string& description) override;
};

/**
 * @brief Thread-safe, monotonic progress for one job
 */
class ProgressReporter {
public:
    /**
     * @param job Job label used in every update (e.g. "certificate.create")
     * @param sink Non-owning; nullptr discards updates
     */
    explicit ProgressReporter(std::string job, IProgressSink* sink = nullptr);

    /**
     * @brief Report progress
     *
     * Values below the current percentage keep the current one; values
     * above 100 are capped.
     */
    void set(double percent, const std::string& description = "");

    /// Re-send the current percentage with a new description
    void describe(const std::string& description);

    double current() const;

    const std::string& job() const { return job_; }

private:
    void emit(double percent, const std::string& description);

    std::string job_;
    IProgressSink* sink_;
    mutable std::mutex mutex_;
    double percent_ = 0.0;
};

} // namespace common

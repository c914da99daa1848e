#include "progress_reporter.h"

#include <algorithm>
#include <spdlog/spdlog.h>

namespace common {

void LoggingProgressSink::onProgress(const std::string& job, double percent,
                                     const std::string& description) {
    if (description.empty()) {
        spdlog::info("[Progress] {} {:.0f}%", job, percent);
    } else {
        spdlog::info("[Progress] {} {:.0f}% - {}", job, percent, description);
    }
}

ProgressReporter::ProgressReporter(std::string job, IProgressSink* sink)
    : job_(std::move(job)), sink_(sink) {}

void ProgressReporter::set(double percent, const std::string& description) {
    double reported;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        percent_ = std::max(percent_, std::min(percent, 100.0));
        reported = percent_;
    }
    emit(reported, description);
}

void ProgressReporter::describe(const std::string& description) {
    emit(current(), description);
}

double ProgressReporter::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return percent_;
}

void ProgressReporter::emit(double percent, const std::string& description) {
    if (!sink_) return;
    try {
        sink_->onProgress(job_, percent, description);
    } catch (const std::exception& e) {
        spdlog::warn("[ProgressReporter] Progress sink failed for {}: {}", job_, e.what());
    }
}

} // namespace common

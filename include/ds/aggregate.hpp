#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "ds/model.hpp"

namespace ds {

using ProgressCallback = std::function<void(const ProgressSnapshot&)>;

// requested 0 -> every 5% of total (at least 1)
size_t resolve_cadence(int requested, size_t total);

// Thread-safe fan-in point for lookup outcomes.
class ResultAggregator {
public:
    // cadence 0 disables progress notifications.
    ResultAggregator(size_t total, size_t cadence, ProgressCallback on_progress = {});

    // Called concurrently by workers. The progress callback, when due, runs
    // after the internal lock is released; it must not block (see
    // ProgressReporter::publish).
    void record(const std::string& domain, const LookupOutcome& outcome);

    RunStatistics            statistics() const;
    std::vector<std::string> available() const;
    std::vector<Failure>     failures() const;

private:
    ProgressSnapshot snapshot_locked() const;

    mutable std::mutex       mtx_;
    RunStatistics            stats_;
    std::vector<std::string> available_;
    std::vector<Failure>     failures_;
    const size_t             cadence_;
    ProgressCallback         on_progress_;
};

// Delivers progress snapshots to a callback on its own thread.
// publish() only stores the snapshot; a slow callback sees the latest one
// and skips the ones superseded while it was busy.
class ProgressReporter {
public:
    explicit ProgressReporter(ProgressCallback on_progress);
    ~ProgressReporter();

    ProgressReporter(const ProgressReporter&) = delete;
    ProgressReporter& operator=(const ProgressReporter&) = delete;

    void publish(const ProgressSnapshot& snap);

    // Deliver what is still pending, then join. Safe to call more than once.
    void stop();

    // First failure raised by the callback; empty if none. Later snapshots
    // are dropped once the callback has failed.
    std::string error() const;

private:
    void loop();

    mutable std::mutex              mtx_;
    std::condition_variable         cv_;
    std::optional<ProgressSnapshot> pending_;
    bool                            stopping_{false};
    std::string                     error_;
    ProgressCallback                on_progress_;
    std::thread                     thread_;
};

} // namespace ds

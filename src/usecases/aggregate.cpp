#include "ds/aggregate.hpp"

#include <algorithm>
#include <exception>
#include <optional>
#include <utility>

namespace ds {

size_t resolve_cadence(int requested, size_t total)
{
    if (requested > 0) return static_cast<size_t>(requested);
    return std::max<size_t>(1, total / 20);
}

ResultAggregator::ResultAggregator(size_t total, size_t cadence, ProgressCallback on_progress)
    : cadence_(cadence), on_progress_(std::move(on_progress))
{
    stats_.total = total;
}

void ResultAggregator::record(const std::string& domain, const LookupOutcome& outcome)
{
    std::optional<ProgressSnapshot> due;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        ++stats_.processed;
        switch (outcome.status)
        {
            case LookupStatus::Available:
                ++stats_.available;
                available_.push_back(domain);
                break;
            case LookupStatus::Taken:
                ++stats_.taken;
                break;
            case LookupStatus::Error:
                ++stats_.errors;
                if (outcome.kind == LookupErrorKind::Timeout) ++stats_.timeouts;
                failures_.push_back(Failure{domain, outcome.kind, outcome.error});
                break;
        }
        if (cadence_ > 0 &&
            (stats_.processed % cadence_ == 0 || stats_.processed == stats_.total))
        {
            due = snapshot_locked();
        }
    }
    if (due && on_progress_) on_progress_(*due);
}

ProgressSnapshot ResultAggregator::snapshot_locked() const
{
    ProgressSnapshot s{};
    s.processed = stats_.processed;
    s.total = stats_.total;
    s.available = stats_.available;
    s.errors = stats_.errors;
    return s;
}

RunStatistics ResultAggregator::statistics() const
{
    std::lock_guard<std::mutex> lk(mtx_);
    return stats_;
}

std::vector<std::string> ResultAggregator::available() const
{
    std::lock_guard<std::mutex> lk(mtx_);
    return available_;
}

std::vector<Failure> ResultAggregator::failures() const
{
    std::lock_guard<std::mutex> lk(mtx_);
    return failures_;
}

ProgressReporter::ProgressReporter(ProgressCallback on_progress)
    : on_progress_(std::move(on_progress))
{
    thread_ = std::thread([this]{ loop(); });
}

ProgressReporter::~ProgressReporter()
{
    stop();
}

void ProgressReporter::publish(const ProgressSnapshot& snap)
{
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!pending_ || pending_->processed < snap.processed) pending_ = snap;
    }
    cv_.notify_one();
}

void ProgressReporter::stop()
{
    {
        std::lock_guard<std::mutex> lk(mtx_);
        stopping_ = true;
    }
    cv_.notify_one();
    if (thread_.joinable()) thread_.join();
}

std::string ProgressReporter::error() const
{
    std::lock_guard<std::mutex> lk(mtx_);
    return error_;
}

void ProgressReporter::loop()
{
    for (;;)
    {
        ProgressSnapshot snap;
        {
            std::unique_lock<std::mutex> lk(mtx_);
            cv_.wait(lk, [&]{ return stopping_ || pending_.has_value(); });
            if (!pending_) return;
            snap = *pending_;
            pending_.reset();
            if (!error_.empty() || !on_progress_) continue;
        }
        std::string failed;
        try {
            on_progress_(snap);
        } catch (const std::exception& e) {
            failed = e.what();
        } catch (...) {
            failed = "unknown exception in progress callback";
        }
        if (!failed.empty())
        {
            std::lock_guard<std::mutex> lk(mtx_);
            error_ = std::move(failed);
        }
    }
}

} // namespace ds

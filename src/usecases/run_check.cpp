#include "ds/usecases.hpp"

#include <chrono>
#include <exception>
#include <filesystem>
#include <memory>
#include <mutex>

#include "ds/output.hpp"
#include "ds/storage.hpp"

namespace ds {

const char *run_state_str(RunState s)
{
    switch (s)
    {
        case RunState::Idle: return "idle";
        case RunState::Loading: return "loading";
        case RunState::Running: return "running";
        case RunState::Draining: return "draining";
        case RunState::Reporting: return "reporting";
        case RunState::Done: return "done";
    }
    return "idle";
}

const char *run_error_str(RunErrorKind k)
{
    switch (k)
    {
        case RunErrorKind::None: return "none";
        case RunErrorKind::InputMissing: return "input-missing";
        case RunErrorKind::InputUnreadable: return "input-unreadable";
        case RunErrorKind::NoValidDomains: return "no-valid-domains";
        case RunErrorKind::OutputWriteFailed: return "output-write-failed";
    }
    return "none";
}

int exit_status(const RunReport& report)
{
    if (report.kind != RunErrorKind::None) return kExitFailure;
    return report.cancelled ? kExitInterrupted : kExitOk;
}

namespace {

// First hook failure of a run; shared by the coordinator and the workers.
class HookErrors {
public:
    template <class F>
    void guard(F&& f)
    {
        try {
            f();
        } catch (const std::exception& e) {
            note(e.what());
        } catch (...) {
            note("unknown exception in hook");
        }
    }

    void note(const std::string& what)
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (first_.empty()) first_ = what;
    }

    std::string first() const
    {
        std::lock_guard<std::mutex> lk(mtx_);
        return first_;
    }

private:
    mutable std::mutex mtx_;
    std::string first_;
};

} // namespace

static void enter(RunReport& report, RunState s, const RunHooks& hooks, HookErrors& errors)
{
    report.state = s;
    if (hooks.on_state) errors.guard([&]{ hooks.on_state(s); });
}

static RunErrorKind to_run_error(LoadErrorKind k)
{
    switch (k)
    {
        case LoadErrorKind::InputMissing: return RunErrorKind::InputMissing;
        case LoadErrorKind::InputUnreadable: return RunErrorKind::InputUnreadable;
        case LoadErrorKind::NoValidDomains: return RunErrorKind::NoValidDomains;
        case LoadErrorKind::None: break;
    }
    return RunErrorKind::None;
}

RunReport run_domains(const std::vector<std::string>& domains,
                      const Options& opt,
                      const LookupFn& lookup,
                      const RunHooks& hooks,
                      Cancellation* cancel)
{
    RunReport report{};
    HookErrors errors;
    const auto t0 = std::chrono::steady_clock::now();

    enter(report, RunState::Running, hooks, errors);

    std::unique_ptr<ProgressReporter> reporter;
    ProgressCallback publish;
    if (hooks.on_progress)
    {
        reporter = std::make_unique<ProgressReporter>(hooks.on_progress);
        publish = [r = reporter.get()](const ProgressSnapshot& s) { r->publish(s); };
    }
    ResultAggregator agg(domains.size(),
                         resolve_cadence(opt.progress_every, domains.size()),
                         publish);

    auto handle = [&](std::string domain)
    {
        LookupOutcome out;
        try {
            out = lookup(domain);
        } catch (const std::exception& e) {
            out.status = LookupStatus::Error;
            out.kind = LookupErrorKind::Internal;
            out.error = e.what();
        } catch (...) {
            out.status = LookupStatus::Error;
            out.kind = LookupErrorKind::Internal;
            out.error = "unknown exception in lookup";
        }
        agg.record(domain, out);
        if (hooks.on_outcome) errors.guard([&]{ hooks.on_outcome(domain, out); });
    };

    DomainQueue queue(opt.queue_capacity > 0 ? static_cast<size_t>(opt.queue_capacity) : 0);
    {
        WorkerPool pool(opt.threads, queue, handle, cancel);
        for (const auto& d : domains)
        {
            // refused once a cancelled worker closed the queue
            if (!queue.push(d)) break;
        }
        queue.close();

        enter(report, RunState::Draining, hooks, errors);
        pool.join();
    }
    if (reporter)
    {
        reporter->stop();
        if (std::string e = reporter->error(); !e.empty()) errors.note(e);
    }

    report.stats = agg.statistics();
    report.available = agg.available();
    report.failures = agg.failures();
    report.cancelled = cancel && cancel->is_cancelled() &&
                       report.stats.processed < report.stats.total;
    report.elapsed_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - t0).count();
    report.hook_error = errors.first();
    return report;
}

RunReport run_check(const Options& opt,
                    const LookupFn& lookup,
                    const RunHooks& hooks,
                    Cancellation* cancel)
{
    RunReport report{};
    HookErrors errors;
    report.started = std::time(nullptr);

    enter(report, RunState::Loading, hooks, errors);
    LoadResult loaded = load_domains(opt.input);
    if (hooks.on_rejected)
    {
        for (const auto& line : loaded.rejected)
            errors.guard([&]{ hooks.on_rejected(line); });
    }
    report.rejected = loaded.rejected.size();
    report.blank = loaded.blank;
    if (loaded.kind != LoadErrorKind::None)
    {
        report.kind = to_run_error(loaded.kind);
        report.error = loaded.error;
        report.hook_error = errors.first();
        return report;
    }

    RunReport ran = run_domains(loaded.domains, opt, lookup, hooks, cancel);
    report.stats = ran.stats;
    report.available = std::move(ran.available);
    report.failures = std::move(ran.failures);
    report.cancelled = ran.cancelled;
    report.elapsed_ms = ran.elapsed_ms;
    if (!ran.hook_error.empty()) errors.note(ran.hook_error);

    enter(report, RunState::Reporting, hooks, errors);
    const std::filesystem::path path =
        std::filesystem::path(opt.output_dir) / output_filename(report.started);
    std::string error;
    if (!write_text_file(path.string(), format_result_file(opt, report), error))
    {
        report.kind = RunErrorKind::OutputWriteFailed;
        report.error = error;
    }
    else
    {
        report.output_path = path.string();
    }

    enter(report, RunState::Done, hooks, errors);
    report.hook_error = errors.first();
    return report;
}

} // namespace ds

// Domain availability checker (C++23)
// Resolves every candidate in the input file with a fixed worker pool and
// writes the names that came back "no such name" to available_<ts>.txt.

#include <csignal>
#include <cstdio>
#include <exception>
#include <format>
#include <print>
#include <string>

#include "ds/cli.hpp"
#include "ds/console.hpp"
#include "ds/output.hpp"
#include "ds/rawdns.hpp"
#include "ds/resolver.hpp"
#include "ds/usecases.hpp"

namespace
{
ds::Cancellation g_cancel;

void on_sigint(int)
{
    g_cancel.cancel();
}
} // namespace

int main(int argc, char **argv)
{
    ds::Options opt;
    switch (ds::parse_args(argc, argv, opt))
    {
        case ds::ParseStatus::Help: return ds::kExitOk;
        case ds::ParseStatus::Error:
            std::println(stderr, "try '{} --help'", argv[0]);
            return ds::kExitFailure;
        case ds::ParseStatus::Ok: break;
    }

    if (opt.backend == ds::Backend::RawDns && !ds::rawdns_available())
    {
        std::println(stderr,
                     "error: --resolver rawdns needs ldns; rebuild with ldns (pkg-config ldns)");
        return ds::kExitFailure;
    }

    const bool verbose = opt.verbosity == ds::Verbosity::Verbose;
    const bool progress = opt.verbosity != ds::Verbosity::Quiet && !opt.json;

    ds::RunHooks hooks;
    if (verbose)
    {
        hooks.on_rejected = [](const std::string &line)
        {
            ds::err_line(std::format("warning: skipping invalid domain: {}", line));
        };
        hooks.on_outcome = [](const std::string &domain, const ds::LookupOutcome &out)
        {
            if (out.status == ds::LookupStatus::Available)
            {
                ds::out_line(std::format("Available: {}", domain));
            }
            else if (out.status == ds::LookupStatus::Error)
            {
                ds::err_line(std::format("warning: {} {} ({}): {}", domain,
                                         ds::status_str(out.status),
                                         ds::error_kind_str(out.kind), out.error));
            }
        };
    }
    if (progress)
    {
        hooks.on_progress = [](const ds::ProgressSnapshot &snap)
        {
            ds::out_line(ds::format_progress_text(snap));
        };
        hooks.on_state = [&opt](ds::RunState s)
        {
            if (s == ds::RunState::Running)
            {
                ds::out_block(ds::format_start_text(opt));
            }
        };
    }

    std::signal(SIGINT, on_sigint);

    ds::RunReport report;
    try
    {
        report = ds::run_check(opt, ds::make_lookup(opt), hooks, &g_cancel);
    }
    catch (const std::exception &e)
    {
        std::println(stderr, "error: worker failure: {}", e.what());
        return ds::kExitFailure;
    }

    if (!report.hook_error.empty())
    {
        std::println(stderr, "warning: output hook failed: {}", report.hook_error);
    }

    if (opt.json)
    {
        ds::out_line(ds::build_summary_json(opt, report));
    }

    switch (report.kind)
    {
        case ds::RunErrorKind::None:
            break;
        case ds::RunErrorKind::OutputWriteFailed:
        {
            std::println(stderr, "error: results not saved: {}", report.error);
            if (!opt.json)
            {
                // fall back to stdout
                ds::out_block(ds::format_summary_text(report));
                for (const auto &d : report.available) ds::out_line(d);
            }
            return ds::exit_status(report);
        }
        default:
            std::println(stderr, "error: {}", report.error);
            return ds::exit_status(report);
    }

    if (!opt.json)
    {
        ds::out_block(ds::format_summary_text(report));
        if (verbose)
        {
            for (const auto &f : report.failures)
            {
                ds::out_line(std::format("  {} [{}] {}", f.domain,
                                         ds::error_kind_str(f.kind), f.reason));
            }
        }
    }
    return ds::exit_status(report);
}

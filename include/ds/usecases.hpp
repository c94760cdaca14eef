#pragma once

#include <ctime>
#include <functional>
#include <string>
#include <vector>

#include "ds/options.hpp"
#include "ds/model.hpp"
#include "ds/aggregate.hpp"
#include "ds/concurrency.hpp"
#include "ds/resolver.hpp"

namespace ds {

enum class RunState { Idle, Loading, Running, Draining, Reporting, Done };

enum class RunErrorKind {
    None = 0,
    InputMissing,
    InputUnreadable,
    NoValidDomains,
    OutputWriteFailed,
};

// Hooks never abort a run: the first failure is kept in RunReport::hook_error.
struct RunHooks {
    std::function<void(RunState)> on_state;
    // runs on a reporter thread, never on a worker
    ProgressCallback on_progress;
    // per completed lookup, called outside the aggregator lock
    std::function<void(const std::string&, const LookupOutcome&)> on_outcome;
    // per rejected input line (trimmed), during Loading
    std::function<void(const std::string&)> on_rejected;
};

struct RunReport {
    RunState                 state{RunState::Idle};
    RunErrorKind             kind{RunErrorKind::None};
    std::string              error;
    RunStatistics            stats;
    std::vector<std::string> available;   // completion order
    std::vector<Failure>     failures;
    size_t                   rejected{};
    size_t                   blank{};
    std::time_t              started{};
    double                   elapsed_ms{};
    bool                     cancelled{};
    std::string              output_path; // set once Reporting succeeds
    std::string              hook_error;  // first exception raised by a hook
};

inline constexpr int kExitOk = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitInterrupted = 130;

// Process exit status for a finished run.
int exit_status(const RunReport& report);

const char *run_state_str(RunState s);
const char *run_error_str(RunErrorKind k);

// Running + Draining only: fan domains out to opt.threads workers and
// collect every outcome. Does not touch the filesystem.
RunReport run_domains(const std::vector<std::string>& domains,
                      const Options& opt,
                      const LookupFn& lookup,
                      const RunHooks& hooks = {},
                      Cancellation* cancel = nullptr);

// Full pass: Loading -> Running -> Draining -> Reporting -> Done.
// Fatal load errors return before any worker starts and before any output
// file is created.
RunReport run_check(const Options& opt,
                    const LookupFn& lookup,
                    const RunHooks& hooks = {},
                    Cancellation* cancel = nullptr);

} // namespace ds

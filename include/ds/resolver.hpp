#pragma once

#include <chrono>
#include <functional>
#include <string>

#include "ds/options.hpp"
#include "ds/model.hpp"

namespace ds
{
// One lookup for one domain. Must be callable from any worker thread.
using LookupFn = std::function<LookupOutcome(const std::string & /*domain*/)>;

// getaddrinfo の rc を Available / Taken / Error に分類する
LookupOutcome classify_gai(int rc);

// POSIX getaddrinfo ベースの1回分解決 (ブロッキング、タイムアウトなし)
LookupOutcome resolve_posix_once(const std::string &domain, Family family);

// Upper bound on helper threads alive at once, abandoned ones included.
inline constexpr int kMaxLookupHelpers = 256;

// Run fn on a helper thread and wait at most `timeout`.
// On expiry the lookup is abandoned and Error/Timeout is returned at once;
// the helper thread finishes in the background and its result is dropped.
// With `max_helpers` helpers already alive, fn is not run and Error/Internal
// is returned.
LookupOutcome lookup_with_deadline(std::function<LookupOutcome()> fn,
                                   std::chrono::milliseconds timeout,
                                   int max_helpers = kMaxLookupHelpers);

// Helper threads started by lookup_with_deadline that have not finished yet.
int active_lookup_helpers();

// Backend selected by opt.backend, wrapped in lookup_with_deadline.
LookupFn make_lookup(const Options &opt);

std::chrono::milliseconds lookup_timeout(const Options &opt);
} // namespace ds

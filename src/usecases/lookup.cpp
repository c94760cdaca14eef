#include "ds/resolver.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <system_error>
#include <thread>

#include "ds/rawdns.hpp"

namespace ds {

namespace {

std::atomic<int> g_active_helpers{0};

struct PendingLookup {
    std::mutex              mtx;
    std::condition_variable cv;
    bool                    done{false};
    LookupOutcome           result;
};

LookupOutcome internal_error(const char* what)
{
    LookupOutcome out{};
    out.status = LookupStatus::Error;
    out.kind = LookupErrorKind::Internal;
    out.error = what;
    return out;
}

} // namespace

int active_lookup_helpers()
{
    return g_active_helpers.load();
}

std::chrono::milliseconds lookup_timeout(const Options& opt)
{
    const int sec = std::clamp(opt.timeout_sec, 1, kMaxTimeoutSec);
    return std::chrono::seconds(sec);
}

LookupOutcome lookup_with_deadline(std::function<LookupOutcome()> fn,
                                   std::chrono::milliseconds timeout,
                                   int max_helpers)
{
    // reserve a helper slot; hung resolver calls keep theirs until they return
    if (g_active_helpers.fetch_add(1) >= max_helpers)
    {
        g_active_helpers.fetch_sub(1);
        return internal_error("too many lookups in flight");
    }

    // shared with the helper so an abandoned lookup can still complete safely
    auto pending = std::make_shared<PendingLookup>();
    const auto t0 = std::chrono::steady_clock::now();

    try {
        std::thread([pending, fn = std::move(fn)]
        {
            LookupOutcome r;
            try {
                r = fn();
            } catch (const std::exception& e) {
                r = internal_error(e.what());
            } catch (...) {
                r = internal_error("unknown exception in lookup");
            }
            {
                std::lock_guard<std::mutex> lk(pending->mtx);
                pending->result = std::move(r);
                pending->done = true;
            }
            pending->cv.notify_one();
            g_active_helpers.fetch_sub(1);
        }).detach();
    } catch (const std::system_error& e) {
        g_active_helpers.fetch_sub(1);
        return internal_error(e.what());
    }

    std::unique_lock<std::mutex> lk(pending->mtx);
    if (!pending->cv.wait_for(lk, timeout, [&]{ return pending->done; }))
    {
        LookupOutcome out{};
        out.status = LookupStatus::Error;
        out.kind = LookupErrorKind::Timeout;
        out.error = "timed out after " + std::to_string(timeout.count()) + " ms";
        out.ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - t0).count();
        return out;
    }
    return std::move(pending->result);
}

LookupFn make_lookup(const Options& opt)
{
    const auto timeout = lookup_timeout(opt);
    // one live and one abandoned helper per worker before refusing
    const int cap = std::max(kMaxLookupHelpers, opt.threads * 2);
    if (opt.backend == Backend::RawDns)
    {
        return [opt, timeout, cap](const std::string& domain)
        {
            return lookup_with_deadline(
                [opt, domain] { return resolve_rawdns_once(domain, opt); },
                timeout, cap);
        };
    }
    const Family family = opt.family;
    return [family, timeout, cap](const std::string& domain)
    {
        return lookup_with_deadline(
            [family, domain] { return resolve_posix_once(domain, family); },
            timeout, cap);
    };
}

} // namespace ds

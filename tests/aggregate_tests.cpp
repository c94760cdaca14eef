#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "ds/aggregate.hpp"

using namespace ds;

static void assert_true(bool cond, std::string_view msg)
{
    if (!cond)
    {
        std::cerr << "ASSERT FAILED: " << msg << std::endl;
        std::exit(1);
    }
}

static LookupOutcome outcome(LookupStatus st, LookupErrorKind kind = LookupErrorKind::None)
{
    LookupOutcome o{};
    o.status = st;
    o.kind = kind;
    if (st == LookupStatus::Error) o.error = "simulated";
    return o;
}

static void test_cadence_resolution()
{
    assert_true(resolve_cadence(10, 1000) == 10, "explicit cadence kept");
    assert_true(resolve_cadence(0, 1000) == 50, "auto cadence = 5%");
    assert_true(resolve_cadence(0, 7) == 1, "auto cadence at least 1");
    assert_true(resolve_cadence(0, 0) == 1, "auto cadence on empty");
}

static void test_counts_and_sets()
{
    ResultAggregator agg(5, 0);
    agg.record("a.com", outcome(LookupStatus::Available));
    agg.record("b.com", outcome(LookupStatus::Taken));
    agg.record("c.com", outcome(LookupStatus::Error, LookupErrorKind::Timeout));
    agg.record("d.com", outcome(LookupStatus::Error, LookupErrorKind::Network));
    agg.record("e.com", outcome(LookupStatus::Available));

    RunStatistics s = agg.statistics();
    assert_true(s.total == 5, "total");
    assert_true(s.processed == 5, "processed");
    assert_true(s.available == 2, "available");
    assert_true(s.taken == 1, "taken");
    assert_true(s.errors == 2, "errors");
    assert_true(s.timeouts == 1, "timeouts");
    assert_true(s.processed == s.available + s.taken + s.errors, "partition");

    auto av = agg.available();
    assert_true(av.size() == 2 && av[0] == "a.com" && av[1] == "e.com", "append order");

    auto fs = agg.failures();
    assert_true(fs.size() == 2, "failures listed");
    assert_true(fs[0].domain == "c.com" && fs[0].kind == LookupErrorKind::Timeout,
                "timeout failure");
    assert_true(fs[1].reason == "simulated", "failure reason kept");
}

static void test_progress_cadence()
{
    std::vector<ProgressSnapshot> seen;
    ResultAggregator agg(25, 10, [&](const ProgressSnapshot& s) { seen.push_back(s); });
    for (int i = 0; i < 25; ++i)
    {
        agg.record("x" + std::to_string(i) + ".com",
                   outcome(i % 5 == 0 ? LookupStatus::Available : LookupStatus::Taken));
    }
    assert_true(seen.size() == 3, "fires at 10, 20 and final 25");
    assert_true(seen[0].processed == 10 && seen[1].processed == 20, "cadence points");
    assert_true(seen[2].processed == 25 && seen[2].total == 25, "final snapshot");
    assert_true(seen[2].available == 5, "available in snapshot");
}

static void test_progress_disabled()
{
    int calls = 0;
    ResultAggregator agg(3, 0, [&](const ProgressSnapshot&) { ++calls; });
    for (int i = 0; i < 3; ++i) agg.record("x.com", outcome(LookupStatus::Taken));
    assert_true(calls == 0, "cadence 0 -> no notifications");
}

static void test_callback_runs_outside_lock()
{
    // The callback reads back through the aggregator; this deadlocks if the
    // notification were delivered while the internal mutex is held.
    ResultAggregator* self = nullptr;
    size_t observed = 0;
    ResultAggregator agg(4, 2, [&](const ProgressSnapshot&)
    {
        observed = self->statistics().processed;
    });
    self = &agg;
    for (int i = 0; i < 4; ++i) agg.record("x.com", outcome(LookupStatus::Taken));
    assert_true(observed == 4, "callback could take the lock");
}

static void test_concurrent_records_exact()
{
    const int threads = 16;
    const int per_thread = 500;
    std::atomic<int> notifications{0};
    ResultAggregator agg(threads * per_thread, 100,
                         [&](const ProgressSnapshot&) { notifications.fetch_add(1); });
    std::vector<std::thread> ts;
    for (int t = 0; t < threads; ++t)
    {
        ts.emplace_back([&, t]
        {
            for (int i = 0; i < per_thread; ++i)
            {
                const int k = t * per_thread + i;
                LookupStatus st = k % 3 == 0 ? LookupStatus::Available
                                : k % 3 == 1 ? LookupStatus::Taken
                                             : LookupStatus::Error;
                agg.record("d" + std::to_string(k) + ".com", outcome(st, LookupErrorKind::Network));
            }
        });
    }
    for (auto& th : ts) th.join();

    RunStatistics s = agg.statistics();
    const size_t n = threads * per_thread;
    assert_true(s.processed == n, "no lost increments");
    assert_true(s.available == (n + 2) / 3, "available exact");
    assert_true(s.processed == s.available + s.taken + s.errors, "partition under contention");
    std::set<std::string> uniq;
    for (const auto& d : agg.available()) uniq.insert(d);
    assert_true(uniq.size() == s.available, "available set has no duplicates");
    assert_true(notifications.load() == static_cast<int>(n / 100), "one notification per cadence point");
}

static ProgressSnapshot at(size_t processed)
{
    ProgressSnapshot s{};
    s.processed = processed;
    s.total = 100;
    return s;
}

static void test_reporter_keeps_newest()
{
    std::mutex m;
    std::vector<size_t> seen;
    std::atomic<bool> release{false};
    {
        ProgressReporter rep([&](const ProgressSnapshot& s)
        {
            while (!release.load()) std::this_thread::yield();
            std::lock_guard<std::mutex> lk(m);
            seen.push_back(s.processed);
        });
        rep.publish(at(10));
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        // callback is stuck on 10; these queue behind it
        rep.publish(at(30));
        rep.publish(at(20));
        rep.publish(at(40));
        release.store(true);
        rep.stop();
        rep.stop();
        assert_true(rep.error().empty(), "no error");
    }
    assert_true(seen.size() == 2, "stale snapshots coalesced");
    assert_true(seen[0] == 10 && seen[1] == 40, "newest delivered last");
}

static void test_reporter_captures_error()
{
    std::atomic<int> calls{0};
    ProgressReporter rep([&](const ProgressSnapshot&)
    {
        calls.fetch_add(1);
        throw std::runtime_error("write failed");
    });
    rep.publish(at(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    rep.publish(at(2));
    rep.stop();
    assert_true(rep.error() == "write failed", "error kept");
    assert_true(calls.load() == 1, "no more calls after a failure");
}

int main()
{
    test_cadence_resolution();
    test_counts_and_sets();
    test_progress_cadence();
    test_progress_disabled();
    test_callback_runs_outside_lock();
    test_concurrent_records_exact();
    test_reporter_keeps_newest();
    test_reporter_captures_error();

    std::cout << "aggregate tests: OK" << std::endl;
    return 0;
}

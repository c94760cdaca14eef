#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>

#include <netdb.h>

#include "ds/rawdns.hpp"
#include "ds/resolver.hpp"

using namespace ds;
using namespace std::chrono;

static void assert_true(bool cond, std::string_view msg)
{
    if (!cond)
    {
        std::cerr << "ASSERT FAILED: " << msg << std::endl;
        std::exit(1);
    }
}

static void test_classify_gai()
{
    assert_true(classify_gai(0).status == LookupStatus::Taken, "rc 0 -> taken");

    LookupOutcome nx = classify_gai(EAI_NONAME);
    assert_true(nx.status == LookupStatus::Available, "EAI_NONAME -> available");
    assert_true(nx.rc == EAI_NONAME, "rc kept");

    LookupOutcome again = classify_gai(EAI_AGAIN);
    assert_true(again.status == LookupStatus::Error, "EAI_AGAIN is not available");
    assert_true(again.kind == LookupErrorKind::Network, "EAI_AGAIN -> network");
    assert_true(!again.error.empty(), "gai_strerror text");

    assert_true(classify_gai(EAI_FAIL).status == LookupStatus::Error, "EAI_FAIL -> error");
    assert_true(classify_gai(EAI_SYSTEM).status == LookupStatus::Error, "EAI_SYSTEM -> error");
#ifdef EAI_NODATA
    assert_true(classify_gai(EAI_NODATA).status == LookupStatus::Taken, "EAI_NODATA -> taken");
#endif
}

static void test_classify_rcode()
{
    assert_true(classify_rcode(0).status == LookupStatus::Taken, "NOERROR -> taken");
    assert_true(classify_rcode(3).status == LookupStatus::Available, "NXDOMAIN -> available");
    LookupOutcome sf = classify_rcode(2);
    assert_true(sf.status == LookupStatus::Error, "SERVFAIL -> error");
    assert_true(sf.kind == LookupErrorKind::Network, "SERVFAIL -> network");
    assert_true(sf.error.find("SERVFAIL") != std::string::npos, "rcode named");
    assert_true(classify_rcode(5).status == LookupStatus::Error, "REFUSED -> error");
    assert_true(std::string(rcode_str(3)) == "NXDOMAIN", "rcode_str");
}

static void test_deadline_fast_path()
{
    LookupOutcome o = lookup_with_deadline(
        []
        {
            LookupOutcome r{};
            r.status = LookupStatus::Available;
            return r;
        },
        milliseconds(1000));
    assert_true(o.status == LookupStatus::Available, "result passes through");
}

static void test_deadline_hanging_lookup()
{
    auto t0 = steady_clock::now();
    LookupOutcome o = lookup_with_deadline(
        []
        {
            std::this_thread::sleep_for(hours(1));
            return LookupOutcome{};
        },
        milliseconds(1000));
    auto dt = duration_cast<milliseconds>(steady_clock::now() - t0);
    assert_true(o.status == LookupStatus::Error, "hanging lookup -> error");
    assert_true(o.kind == LookupErrorKind::Timeout, "hanging lookup -> timeout");
    assert_true(dt.count() >= 1000, "waited for the deadline");
    assert_true(dt.count() <= 1500, "returned within 1.5x the deadline");
    assert_true(o.ms >= 1000.0, "elapsed recorded");
}

static void test_deadline_abandoned_result_dropped()
{
    auto done = std::make_shared<std::atomic<bool>>(false);
    LookupOutcome o = lookup_with_deadline(
        [done]
        {
            std::this_thread::sleep_for(milliseconds(200));
            done->store(true);
            LookupOutcome r{};
            r.status = LookupStatus::Available;
            return r;
        },
        milliseconds(50));
    assert_true(o.kind == LookupErrorKind::Timeout, "late result is not used");
    // abandoned helper finishes on its own
    std::this_thread::sleep_for(milliseconds(400));
    assert_true(done->load(), "helper ran to completion");
}

static void test_deadline_exception_contained()
{
    LookupOutcome o = lookup_with_deadline(
        []() -> LookupOutcome { throw std::runtime_error("resolver exploded"); },
        milliseconds(1000));
    assert_true(o.status == LookupStatus::Error, "exception -> error");
    assert_true(o.kind == LookupErrorKind::Internal, "exception -> internal");
    assert_true(o.error == "resolver exploded", "message kept");
}

static void test_deadline_non_std_exception_contained()
{
    LookupOutcome o = lookup_with_deadline(
        []() -> LookupOutcome { throw 42; },
        milliseconds(1000));
    assert_true(o.status == LookupStatus::Error, "non-std throw -> error");
    assert_true(o.kind == LookupErrorKind::Internal, "non-std throw -> internal");
    assert_true(!o.error.empty(), "reason given");
}

static void test_helper_cap()
{
    // the hanging lookup above still holds its helper
    assert_true(active_lookup_helpers() >= 1, "abandoned helper counted");

    std::atomic<bool> ran{false};
    auto t0 = steady_clock::now();
    LookupOutcome o = lookup_with_deadline(
        [&ran]
        {
            ran.store(true);
            return LookupOutcome{};
        },
        milliseconds(1000), active_lookup_helpers());
    auto dt = duration_cast<milliseconds>(steady_clock::now() - t0);
    assert_true(o.status == LookupStatus::Error, "over the cap -> error");
    assert_true(o.kind == LookupErrorKind::Internal, "over the cap -> internal");
    assert_true(!ran.load(), "lookup not started");
    assert_true(dt.count() < 500, "refused without waiting");

    const int before = active_lookup_helpers();
    LookupOutcome ok = lookup_with_deadline(
        []
        {
            LookupOutcome r{};
            r.status = LookupStatus::Taken;
            return r;
        },
        milliseconds(1000), before + 1);
    assert_true(ok.status == LookupStatus::Taken, "room for one more");
    std::this_thread::sleep_for(milliseconds(100));
    assert_true(active_lookup_helpers() == before, "finished helper released its slot");
}

static void test_timeout_clamp()
{
    Options opt{};
    opt.timeout_sec = 5;
    assert_true(lookup_timeout(opt) == seconds(5), "default 5s");
    opt.timeout_sec = 90;
    assert_true(lookup_timeout(opt) == seconds(kMaxTimeoutSec), "clamped to max");
    opt.timeout_sec = 0;
    assert_true(lookup_timeout(opt) == seconds(1), "at least 1s");
}

static void test_posix_localhost()
{
    // localhost is answered from the hosts file, no network needed
    LookupOutcome o = resolve_posix_once("localhost", Family::Any);
    assert_true(o.status == LookupStatus::Taken, "localhost resolves");
    assert_true(o.ms >= 0.0, "timing recorded");
}

static void test_make_lookup_posix()
{
    Options opt{};
    opt.timeout_sec = 5;
    LookupFn fn = make_lookup(opt);
    LookupOutcome o = fn("localhost");
    assert_true(o.status == LookupStatus::Taken, "bound posix lookup");
}

static void test_rawdns_unavailable_reports_error()
{
    if (rawdns_available()) return;
    Options opt{};
    opt.backend = Backend::RawDns;
    LookupOutcome o = resolve_rawdns_once("example.com", opt);
    assert_true(o.status == LookupStatus::Error, "no ldns -> error");
    assert_true(o.kind == LookupErrorKind::Internal, "no ldns -> internal");
}

int main()
{
    test_classify_gai();
    test_classify_rcode();
    test_deadline_fast_path();
    test_deadline_hanging_lookup();
    test_deadline_abandoned_result_dropped();
    test_deadline_exception_contained();
    test_deadline_non_std_exception_contained();
    test_helper_cap();
    test_timeout_clamp();
    test_posix_localhost();
    test_make_lookup_posix();
    test_rawdns_unavailable_reports_error();

    std::cout << "lookup tests: OK" << std::endl;
    return 0;
}

#include "ds/cli.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <print>
#include <stdexcept>
#include <string>
#include <string_view>

using namespace std::string_view_literals;

namespace ds {

void print_usage(const char *prog)
{
    std::println("Domain availability checker (DNS heuristic)");
    std::println("Usage: {} [options]", prog);
    std::println("Options:");
    std::println(
        "  -f, --file PATH      Input file, one domain per line (default: domains.txt)");
    std::println(
        "  -t, --threads N      Number of worker threads (default: {})", kDefaultThreads);
    std::println(
        "  -o, --timeout S      Per-lookup timeout in seconds (default: {}, max: {})",
        kDefaultTimeoutSec, kMaxTimeoutSec);
    std::println(
        "  --resolver R         posix|rawdns (default: posix)");
    std::println(
        "  --family F           Address family: any|inet|inet6 (default: any)");
    std::println("  -4                   Shortcut for --family inet");
    std::println("  -6                   Shortcut for --family inet6");
    std::println("  --ns SERVER          DNS server to query (rawdns)");
    std::println("  --type RR            A,AAAA,NS,SOA,MX (rawdns, default: A)");
    std::println("  --tcp                Force TCP transport (rawdns)");
    std::println(
        "  --progress-every N   Progress line every N results (default: every 5%)");
    std::println(
        "  --queue-capacity N   Bound the work queue (default: unbounded)");
    std::println(
        "  --output-dir DIR     Directory for available_<date>_<time>.txt (default: .)");
    std::println("  --json               Print the final summary as JSON");
    std::println("  -q, --quiet          No progress output");
    std::println(
        "  -v, --verbose        Report skipped lines, available domains and failures");
    std::println("  -h, --help           Show this help");
    std::println("");
    std::println("Note: an unresolvable name only suggests the domain is unregistered.");
    std::println("");
    std::println("Examples:");
    std::println("  {} -f domains.txt", prog);
    std::println("  {} --file=list.txt --threads 32 --timeout 3", prog);
}

// Matches "--name VALUE", "--name=VALUE" and, when short is given, "-s VALUE".
// Returns false when a does not name this option; sets bad on a missing value.
static bool take_value(std::string_view a, std::string_view name, std::string_view short_name,
                       int argc, char **argv, int &i, std::string &val, bool &bad)
{
    if (a == name || (!short_name.empty() && a == short_name))
    {
        if (i + 1 >= argc)
        {
            std::println(stderr, "missing value for {}", a);
            bad = true;
            return true;
        }
        val = argv[++i];
        return true;
    }
    if (a.size() > name.size() + 1 && a.starts_with(name) && a[name.size()] == '=')
    {
        val = std::string(a.substr(name.size() + 1));
        return true;
    }
    return false;
}

static bool to_int(const std::string &val, std::string_view what, int &out)
{
    size_t pos = 0;
    try { out = std::stoi(val, &pos); }
    catch (const std::exception &)
    {
        std::println(stderr, "invalid {}: {}", what, val);
        return false;
    }
    if (pos != val.size())
    {
        std::println(stderr, "invalid {}: {}", what, val);
        return false;
    }
    return true;
}

ParseStatus parse_args(int argc, char **argv, Options &opt)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string_view a = argv[i];
        std::string val;
        bool bad = false;

        if (a == "-h"sv || a == "--help"sv)
        {
            print_usage(argv[0]);
            return ParseStatus::Help;
        }
        if (a == "-4"sv)
        {
            opt.family = Family::IPv4;
        }
        else if (a == "-6"sv)
        {
            opt.family = Family::IPv6;
        }
        else if (a == "--tcp"sv)
        {
            opt.tcp = true;
        }
        else if (a == "--json"sv)
        {
            opt.json = true;
        }
        else if (a == "-q"sv || a == "--quiet"sv)
        {
            opt.verbosity = Verbosity::Quiet;
        }
        else if (a == "-v"sv || a == "--verbose"sv)
        {
            opt.verbosity = Verbosity::Verbose;
        }
        else if (take_value(a, "--file", "-f", argc, argv, i, val, bad))
        {
            if (bad) return ParseStatus::Error;
            if (val.empty())
            {
                std::println(stderr, "empty --file value");
                return ParseStatus::Error;
            }
            opt.input = std::move(val);
        }
        else if (take_value(a, "--threads", "-t", argc, argv, i, val, bad))
        {
            if (bad || !to_int(val, "thread count", opt.threads))
                return ParseStatus::Error;
            if (opt.threads < 1)
            {
                std::println(stderr, "thread count must be at least 1: {}", val);
                return ParseStatus::Error;
            }
        }
        else if (take_value(a, "--timeout", "-o", argc, argv, i, val, bad))
        {
            if (bad || !to_int(val, "timeout", opt.timeout_sec))
                return ParseStatus::Error;
            if (opt.timeout_sec < 1)
            {
                std::println(stderr, "timeout must be at least 1 second: {}", val);
                return ParseStatus::Error;
            }
            opt.timeout_sec = std::min(opt.timeout_sec, kMaxTimeoutSec);
        }
        else if (take_value(a, "--resolver", "", argc, argv, i, val, bad))
        {
            if (bad) return ParseStatus::Error;
            if (val == "posix") opt.backend = Backend::Posix;
            else if (val == "rawdns") opt.backend = Backend::RawDns;
            else
            {
                std::println(stderr, "unknown resolver: {}", val);
                return ParseStatus::Error;
            }
        }
        else if (take_value(a, "--family", "", argc, argv, i, val, bad))
        {
            if (bad) return ParseStatus::Error;
            if (val == "any") opt.family = Family::Any;
            else if (val == "inet") opt.family = Family::IPv4;
            else if (val == "inet6") opt.family = Family::IPv6;
            else
            {
                std::println(stderr, "unknown family: {}", val);
                return ParseStatus::Error;
            }
        }
        else if (take_value(a, "--ns", "", argc, argv, i, val, bad))
        {
            if (bad) return ParseStatus::Error;
            opt.ns = std::move(val);
        }
        else if (take_value(a, "--type", "", argc, argv, i, val, bad))
        {
            if (bad) return ParseStatus::Error;
            // Uppercase normalize
            std::ranges::transform(
                val,
                val.begin(),
                [](unsigned char c)
                {
                    return static_cast<char>(std::toupper(c));
                });
            if (val != "A" && val != "AAAA" && val != "NS" && val != "SOA" && val != "MX")
            {
                std::println(stderr, "unsupported record type: {}", val);
                return ParseStatus::Error;
            }
            opt.qtype = std::move(val);
        }
        else if (take_value(a, "--progress-every", "", argc, argv, i, val, bad))
        {
            if (bad || !to_int(val, "progress interval", opt.progress_every))
                return ParseStatus::Error;
            if (opt.progress_every < 0)
            {
                std::println(stderr, "progress interval must not be negative: {}", val);
                return ParseStatus::Error;
            }
        }
        else if (take_value(a, "--queue-capacity", "", argc, argv, i, val, bad))
        {
            if (bad || !to_int(val, "queue capacity", opt.queue_capacity))
                return ParseStatus::Error;
            if (opt.queue_capacity < 0)
            {
                std::println(stderr, "queue capacity must not be negative: {}", val);
                return ParseStatus::Error;
            }
        }
        else if (take_value(a, "--output-dir", "", argc, argv, i, val, bad))
        {
            if (bad) return ParseStatus::Error;
            opt.output_dir = val.empty() ? std::string(".") : std::move(val);
        }
        else
        {
            std::println(stderr, "unknown option: {}", a);
            return ParseStatus::Error;
        }
    }
    return ParseStatus::Ok;
}

} // namespace ds

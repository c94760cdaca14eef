#pragma once

#include <string>

namespace ds
{
enum class Family { Any, IPv4, IPv6 };

enum class Backend { Posix, RawDns };

enum class Verbosity { Quiet, Normal, Verbose };

inline constexpr int kDefaultThreads = 8;
inline constexpr int kDefaultTimeoutSec = 5;
inline constexpr int kMaxTimeoutSec = 25;

struct Options
{
    std::string input = "domains.txt";   // one candidate per line
    int threads = kDefaultThreads;       // worker count (>= 1)
    int timeout_sec = kDefaultTimeoutSec; // per-lookup deadline, <= kMaxTimeoutSec
    Backend backend = Backend::Posix;
    Family family = Family::Any;         // getaddrinfo family
    // Raw DNS (ldns) controls
    std::string ns;                      // server IP, empty = system resolv.conf
    std::string qtype = "A";
    bool tcp = false;
    // Run controls
    int progress_every = 0;              // 0 = every 5% of total
    int queue_capacity = 0;              // 0 = unbounded
    std::string output_dir = ".";
    bool json = false;                   // JSON summary
    Verbosity verbosity = Verbosity::Normal;
};
} // namespace ds

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace ds {

enum class LookupStatus { Available, Taken, Error };

enum class LookupErrorKind {
    None = 0,
    Timeout,    // deadline expired, lookup abandoned
    Network,    // resolver reported a failure other than "no such name"
    Internal,   // lookup threw or could not be started
};

struct LookupOutcome {
    LookupStatus    status{LookupStatus::Error};
    LookupErrorKind kind{LookupErrorKind::None};
    int             rc{};       // backend code (gai rc or DNS rcode)
    std::string     error;      // valid if status == Error
    double          ms{};
};

struct Failure {
    std::string     domain;
    LookupErrorKind kind{LookupErrorKind::None};
    std::string     reason;
};

struct RunStatistics {
    size_t total{};       // domains enqueued
    size_t processed{};
    size_t available{};
    size_t taken{};
    size_t errors{};
    size_t timeouts{};    // subset of errors
};

struct ProgressSnapshot {
    size_t processed{};
    size_t total{};
    size_t available{};
    size_t errors{};
};

const char *status_str(LookupStatus s);
const char *error_kind_str(LookupErrorKind k);

} // namespace ds

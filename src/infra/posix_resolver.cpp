#include "ds/resolver.hpp"

#include <chrono>
#include <string>

// POSIX networking
#include <netdb.h>
#include <sys/socket.h>

namespace ds
{
static int family_to_af(const Family f)
{
    switch (f)
    {
        case Family::IPv4: return AF_INET;
        case Family::IPv6: return AF_INET6;
        default: return AF_UNSPEC;
    }
}

LookupOutcome classify_gai(const int rc)
{
    LookupOutcome out{};
    out.rc = rc;
    if (rc == 0)
    {
        out.status = LookupStatus::Taken;
        return out;
    }
    switch (rc)
    {
        case EAI_NONAME:
            out.status = LookupStatus::Available;
            return out;
#ifdef EAI_NODATA
        // name exists without address records: registered
        case EAI_NODATA:
            out.status = LookupStatus::Taken;
            return out;
#endif
        default:
            break;
    }
    out.status = LookupStatus::Error;
    out.kind = LookupErrorKind::Network;
    out.error = gai_strerror(rc);
    return out;
}

LookupOutcome resolve_posix_once(const std::string &domain, const Family family)
{
    addrinfo hints{};
    hints.ai_family = family_to_af(family);
    hints.ai_socktype = SOCK_STREAM; // one entry per address is enough

    addrinfo *res = nullptr;
    auto t0 = std::chrono::steady_clock::now();
    int rc = getaddrinfo(domain.c_str(), nullptr, &hints, &res);
    auto t1 = std::chrono::steady_clock::now();
    if (res) freeaddrinfo(res);

    LookupOutcome out = classify_gai(rc);
    out.ms = std::chrono::duration<double, std::milli>(t1 - t0).count();
    return out;
}
} // namespace ds

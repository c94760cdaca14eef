#include "ds/rawdns.hpp"

#include <chrono>
#include <string>
#include <utility>
#include <sys/time.h>

#include "ds/resolver.hpp"

#ifdef DS_HAVE_LDNS
#include <ldns/ldns.h>
#endif

namespace ds
{
bool rawdns_available()
{
#ifdef DS_HAVE_LDNS
    return true;
#else
    return false;
#endif
}

const char *rcode_str(const int rcode)
{
    switch (rcode)
    {
        case 0: return "NOERROR";
        case 1: return "FORMERR";
        case 2: return "SERVFAIL";
        case 3: return "NXDOMAIN";
        case 4: return "NOTIMP";
        case 5: return "REFUSED";
        default: return "RCODE?";
    }
}

LookupOutcome classify_rcode(const int rcode)
{
    LookupOutcome out{};
    out.rc = rcode;
    switch (rcode)
    {
        case 0:
            out.status = LookupStatus::Taken;
            break;
        case 3:
            out.status = LookupStatus::Available;
            break;
        default:
            out.status = LookupStatus::Error;
            out.kind = LookupErrorKind::Network;
            out.error = std::string("server answered ") + rcode_str(rcode);
            break;
    }
    return out;
}

LookupOutcome resolve_rawdns_once(const std::string &domain, const Options &opt)
{
    LookupOutcome out{};
    auto t0 = std::chrono::steady_clock::now();
    auto stamp = [&]
    {
        out.ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - t0).count();
    };

#ifndef DS_HAVE_LDNS
    (void) domain;
    (void) opt;
    stamp();
    out.status = LookupStatus::Error;
    out.kind = LookupErrorKind::Internal;
    out.error =
            "ldns not available: rebuild with ldns (pkg-config ldns) to enable raw DNS";
    return out;
#else
    auto fail = [&](LookupErrorKind kind, std::string msg)
    {
        stamp();
        out.status = LookupStatus::Error;
        out.kind = kind;
        out.error = std::move(msg);
        return out;
    };

    ldns_resolver *res = nullptr;
    ldns_status st = LDNS_STATUS_OK;

    if (opt.ns.empty())
    {
        st = ldns_resolver_new_frm_file(&res, nullptr);
    }
    else
    {
        res = ldns_resolver_new();
        if (res)
        {
            ldns_rdf *ns_rdf = nullptr;
            if (opt.ns.find(':') != std::string::npos)
            {
                ns_rdf = ldns_rdf_new_frm_str(
                    LDNS_RDF_TYPE_AAAA,
                    opt.ns.c_str());
            }
            else
            {
                ns_rdf = ldns_rdf_new_frm_str(LDNS_RDF_TYPE_A, opt.ns.c_str());
            }
            if (ns_rdf)
            {
                st = ldns_resolver_push_nameserver(res, ns_rdf);
                ldns_rdf_deep_free(ns_rdf);
            }
            else
            {
                st = LDNS_STATUS_SYNTAX_RDATA_ERR;
            }
        }
        else
        {
            st = LDNS_STATUS_MEM_ERR;
        }
    }

    if (st != LDNS_STATUS_OK || !res)
    {
        if (res) ldns_resolver_deep_free(res);
        return fail(LookupErrorKind::Internal,
                    std::string("ldns_resolver init failed: ") +
                    ldns_get_errorstr_by_id(st));
    }

    // Apply resolver settings
    const auto timeout = lookup_timeout(opt);
    struct timeval tv{
        .tv_sec = static_cast<time_t>(timeout.count() / 1000),
        .tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000)
    };
    ldns_resolver_set_timeout(res, tv);
    ldns_resolver_set_retry(res, 1);
    ldns_resolver_set_recursive(res, true);
    ldns_resolver_set_usevc(res, opt.tcp);
    ldns_resolver_set_fallback(res, true);
    ldns_resolver_set_edns_udp_size(res, 1232);

    // Absolute name so the resolver never appends a search domain
    std::string fqdn = domain;
    if (fqdn.empty() || fqdn.back() != '.') fqdn.push_back('.');
    ldns_rdf *name = ldns_dname_new_frm_str(fqdn.c_str());
    if (!name)
    {
        ldns_resolver_deep_free(res);
        return fail(LookupErrorKind::Internal, "invalid qname");
    }

    static const std::pair<const char *, ldns_rr_type> kTypeMap[] = {
        {"A", LDNS_RR_TYPE_A},
        {"AAAA", LDNS_RR_TYPE_AAAA},
        {"NS", LDNS_RR_TYPE_NS},
        {"SOA", LDNS_RR_TYPE_SOA},
        {"MX", LDNS_RR_TYPE_MX},
    };
    ldns_rr_type qtype = LDNS_RR_TYPE_A;
    for (const auto &kv: kTypeMap)
    {
        if (opt.qtype == kv.first)
        {
            qtype = kv.second;
            break;
        }
    }

    ldns_pkt *pkt = nullptr;
    st = ldns_resolver_query_status(
        &pkt,
        res,
        name,
        qtype,
        LDNS_RR_CLASS_IN,
        LDNS_RD);

    if (st != LDNS_STATUS_OK || !pkt)
    {
        if (pkt) ldns_pkt_free(pkt);
        ldns_rdf_deep_free(name);
        ldns_resolver_deep_free(res);
        return fail(LookupErrorKind::Network,
                    std::string("ldns query failed: ") +
                    ldns_get_errorstr_by_id(st));
    }

    const int rcode = static_cast<int>(ldns_pkt_get_rcode(pkt));
    ldns_pkt_free(pkt);
    ldns_rdf_deep_free(name);
    ldns_resolver_deep_free(res);

    out = classify_rcode(rcode);
    stamp();
    return out;
#endif
}
} // namespace ds

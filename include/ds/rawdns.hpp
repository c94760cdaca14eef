#pragma once

#include <string>

#include "ds/options.hpp"
#include "ds/model.hpp"

namespace ds {

// True when the build links ldns.
bool rawdns_available();

// DNS response code -> outcome. NOERROR is Taken, NXDOMAIN is Available,
// everything else is a Network error carrying the rcode.
LookupOutcome classify_rcode(int rcode);

const char *rcode_str(int rcode);

// Perform one raw DNS query for domain using ldns.
// Without ldns at build time, returns Error/Internal.
LookupOutcome resolve_rawdns_once(const std::string& domain, const Options& opt);

} // namespace ds

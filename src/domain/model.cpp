#include "ds/model.hpp"

namespace ds {

const char *status_str(LookupStatus s)
{
    switch (s)
    {
        case LookupStatus::Available: return "available";
        case LookupStatus::Taken: return "taken";
        case LookupStatus::Error: return "error";
    }
    return "error";
}

const char *error_kind_str(LookupErrorKind k)
{
    switch (k)
    {
        case LookupErrorKind::None: return "none";
        case LookupErrorKind::Timeout: return "timeout";
        case LookupErrorKind::Network: return "network";
        case LookupErrorKind::Internal: return "internal";
    }
    return "none";
}

} // namespace ds

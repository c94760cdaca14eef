#include "ds/output.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

#include "ds/options.hpp"
#include "ds/model.hpp"
#include "ds/usecases.hpp"

namespace ds {

static std::string format_local(std::time_t t, const char *fmt)
{
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream os;
    os << std::put_time(&tm, fmt);
    return os.str();
}

static const char* backend_str(Backend b)
{
    switch (b)
    {
        case Backend::Posix: return "posix";
        case Backend::RawDns: return "rawdns";
    }
    return "posix";
}

static const char* family_str(Family f)
{
    switch (f)
    {
        case Family::Any: return "any";
        case Family::IPv4: return "inet";
        case Family::IPv6: return "inet6";
    }
    return "any";
}

std::string output_filename(std::time_t t)
{
    return "available_" + format_local(t, "%Y%m%d_%H%M%S") + ".txt";
}

std::string format_timestamp(std::time_t t)
{
    return format_local(t, "%Y-%m-%d %H:%M:%S");
}

std::string format_start_text(const Options& opt)
{
    std::ostringstream os;
    os << "Starting domain check of " << opt.input
       << " with " << opt.threads << " threads\n";
    os << "Resolver: " << backend_str(opt.backend);
    if (opt.backend == Backend::Posix)
    {
        os << "  Family: " << family_str(opt.family);
    }
    else
    {
        os << "  Type: " << opt.qtype
           << "  NS: " << (opt.ns.empty() ? "(system)" : opt.ns)
           << "  TCP: " << (opt.tcp ? "on" : "off");
    }
    os << "  Timeout: " << opt.timeout_sec << "s\n";
    return os.str();
}

std::string format_progress_text(const ProgressSnapshot& snap)
{
    const double pct = snap.total > 0
        ? 100.0 * static_cast<double>(snap.processed) / static_cast<double>(snap.total)
        : 0.0;
    std::ostringstream os;
    os << "Progress: " << snap.processed << '/' << snap.total << " domains ("
       << std::fixed << std::setprecision(1) << pct << "%) - Found "
       << snap.available << " available, " << snap.errors << " errors";
    return os.str();
}

std::string format_summary_text(const RunReport& report)
{
    const RunStatistics& s = report.stats;
    std::ostringstream os;
    if (report.cancelled)
    {
        os << "Interrupted! Checked " << s.processed << " of " << s.total << " domains";
    }
    else
    {
        os << "Completed! Checked " << s.processed << " domains";
    }
    os << " in " << std::fixed << std::setprecision(1)
       << report.elapsed_ms / 1000.0 << " s\n";
    os << "Found " << s.available << " available, " << s.taken << " taken, "
       << s.errors << " errors (" << s.timeouts << " timeouts)\n";
    if (report.rejected > 0)
    {
        os << "Skipped " << report.rejected << " invalid lines\n";
    }
    if (!report.output_path.empty())
    {
        os << "Results saved to " << report.output_path << '\n';
    }
    return os.str();
}

std::string format_result_file(const Options& opt, const RunReport& report)
{
    const RunStatistics& s = report.stats;
    std::ostringstream os;
    os << "# Available domains - " << format_timestamp(report.started) << '\n';
    os << "# Original input file: " << opt.input << '\n';
    os << "# checked=" << s.processed << " available=" << s.available
       << " errors=" << s.errors << " timeouts=" << s.timeouts;
    if (report.cancelled) os << " interrupted=" << s.total - s.processed;
    os << "\n\n";
    for (const auto& d : report.available) os << d << '\n';
    return os.str();
}

} // namespace ds

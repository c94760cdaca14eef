#include "ds/output.hpp"

#include <iomanip>
#include <sstream>

#include "ds/options.hpp"
#include "ds/model.hpp"
#include "ds/usecases.hpp"
#include "ds/json.hpp"

namespace ds
{
std::string build_summary_json(const Options &opt, const RunReport &report)
{
    const RunStatistics &s = report.stats;
    std::ostringstream os;
    os << '{';
    os << "\"input\":" << json_quote(opt.input) << ',';
    os << "\"started\":" << json_quote(format_timestamp(report.started)) << ',';
    os << "\"state\":\"" << run_state_str(report.state) << "\",";
    os << "\"error\":";
    if (report.kind == RunErrorKind::None) os << "null,";
    else
    {
        os << "{\"kind\":\"" << run_error_str(report.kind)
           << "\",\"message\":" << json_quote(report.error) << "},";
    }
    os << "\"threads\":" << opt.threads << ',';
    os << "\"timeout_sec\":" << opt.timeout_sec << ',';
    os << "\"total\":" << s.total << ',';
    os << "\"checked\":" << s.processed << ',';
    os << "\"available\":" << s.available << ',';
    os << "\"taken\":" << s.taken << ',';
    os << "\"errors\":" << s.errors << ',';
    os << "\"timeouts\":" << s.timeouts << ',';
    os << "\"rejected\":" << report.rejected << ',';
    os << "\"interrupted\":" << (report.cancelled ? "true" : "false") << ',';
    os << "\"elapsed_ms\":" << std::fixed << std::setprecision(3) << report.elapsed_ms << ',';
    os << "\"output\":";
    if (report.output_path.empty()) os << "null,";
    else os << json_quote(report.output_path) << ',';

    os << "\"domains\":[";
    for (size_t i = 0; i < report.available.size(); ++i)
    {
        if (i) os << ',';
        os << json_quote(report.available[i]);
    }
    os << "],";

    os << "\"failures\":[";
    for (size_t i = 0; i < report.failures.size(); ++i)
    {
        const Failure &f = report.failures[i];
        if (i) os << ',';
        os << "{\"domain\":" << json_quote(f.domain)
           << ",\"kind\":\"" << error_kind_str(f.kind)
           << "\",\"reason\":" << json_quote(f.reason) << '}';
    }
    os << "]}";
    return os.str();
}
} // namespace ds

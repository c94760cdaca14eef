#pragma once

#include <ctime>
#include <string>

namespace ds
{
// Forward declarations to avoid heavy includes in header
struct Options;
struct ProgressSnapshot;
struct RunReport;

// available_YYYYMMDD_HHMMSS.txt (local time)
std::string output_filename(std::time_t t);

// "YYYY-MM-DD HH:MM:SS" (local time)
std::string format_timestamp(std::time_t t);

// Text formatting (returns complete text block with trailing newlines when applicable)
std::string format_start_text(const Options &opt);

std::string format_progress_text(const ProgressSnapshot &snap);

std::string format_summary_text(const RunReport &report);

// Result file body: header block, blank line, one domain per line.
std::string format_result_file(const Options &opt, const RunReport &report);

// Final JSON (single object string without trailing newline)
std::string build_summary_json(const Options &opt, const RunReport &report);
} // namespace ds

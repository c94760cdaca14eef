#include "ds/storage.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <vector>

namespace ds {

LoadResult load_domains(const std::string& path)
{
    LoadResult out{};

    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
    {
        out.kind = LoadErrorKind::InputMissing;
        out.error = "input file not found: " + path;
        return out;
    }
    if (std::filesystem::is_directory(path, ec))
    {
        out.kind = LoadErrorKind::InputUnreadable;
        out.error = "input path is a directory: " + path;
        return out;
    }

    std::ifstream in(path);
    if (!in)
    {
        out.kind = LoadErrorKind::InputUnreadable;
        out.error = "cannot read " + path + ": " + std::strerror(errno);
        return out;
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) lines.push_back(std::move(line));
    if (in.bad())
    {
        out.kind = LoadErrorKind::InputUnreadable;
        out.error = "read error on " + path;
        return out;
    }

    out = filter_domains(lines);
    if (out.kind == LoadErrorKind::NoValidDomains)
    {
        out.error = "no valid domains in " + path;
    }
    return out;
}

bool write_text_file(const std::string& path, const std::string& content, std::string& error)
{
    // never replace an earlier run's file
    std::error_code ec;
    if (std::filesystem::exists(path, ec))
    {
        error = "cannot create " + path + ": already exists";
        return false;
    }
    std::ofstream os(path, std::ios::out | std::ios::noreplace);
    if (!os)
    {
        error = "cannot create " + path + ": " + std::strerror(errno);
        return false;
    }
    os << content;
    os.flush();
    if (!os)
    {
        error = "write failed on " + path;
        return false;
    }
    return true;
}

} // namespace ds

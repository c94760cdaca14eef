#include "ds/validate.hpp"

#include <cctype>
#include <regex>

namespace ds {

namespace {

constexpr size_t kMaxDomainLength = 253;

const std::regex& domain_regex()
{
    static const std::regex re(
        R"(^(?:[A-Za-z0-9](?:[A-Za-z0-9-]{0,61}[A-Za-z0-9])?\.)+[A-Za-z]{2,63}$)");
    return re;
}

} // namespace

std::string_view trim(std::string_view line)
{
    size_t b = 0;
    size_t e = line.size();
    while (b < e && std::isspace(static_cast<unsigned char>(line[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(line[e - 1]))) --e;
    return line.substr(b, e - b);
}

bool is_valid_domain(std::string_view text)
{
    if (text.empty() || text.size() > kMaxDomainLength) return false;
    return std::regex_match(text.begin(), text.end(), domain_regex());
}

ValidationResult validate_line(std::string_view line)
{
    ValidationResult r{};
    std::string_view t = trim(line);
    if (t.empty())
    {
        r.cls = LineClass::Blank;
        return r;
    }
    r.domain = std::string(t);
    r.cls = is_valid_domain(t) ? LineClass::Valid : LineClass::Rejected;
    return r;
}

LoadResult filter_domains(const std::vector<std::string>& lines)
{
    LoadResult out{};
    for (const auto& line : lines)
    {
        ValidationResult v = validate_line(line);
        switch (v.cls)
        {
            case LineClass::Valid: out.domains.push_back(std::move(v.domain)); break;
            case LineClass::Blank: ++out.blank; break;
            case LineClass::Rejected: out.rejected.push_back(std::move(v.domain)); break;
        }
    }
    if (out.domains.empty())
    {
        out.kind = LoadErrorKind::NoValidDomains;
        out.error = "no valid domains in input";
    }
    return out;
}

} // namespace ds

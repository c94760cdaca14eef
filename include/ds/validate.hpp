#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace ds {

enum class LineClass { Valid, Blank, Rejected };

struct ValidationResult {
    LineClass   cls{LineClass::Rejected};
    std::string domain;   // trimmed text; empty when Blank
};

enum class LoadErrorKind {
    None = 0,
    InputMissing,
    InputUnreadable,
    NoValidDomains,
};

struct LoadResult {
    LoadErrorKind            kind{LoadErrorKind::None};
    std::string              error;
    std::vector<std::string> domains;   // valid, input order
    std::vector<std::string> rejected;  // trimmed text of rejected lines
    size_t                   blank{};
};

std::string_view trim(std::string_view line);

// Syntax only: labels of [A-Za-z0-9-] not starting/ending with '-',
// at least one dot, alphabetic TLD of two or more characters.
bool is_valid_domain(std::string_view text);

ValidationResult validate_line(std::string_view line);

// Classify every line; kind is NoValidDomains when nothing survives.
LoadResult filter_domains(const std::vector<std::string>& lines);

} // namespace ds

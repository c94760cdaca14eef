#pragma once

#include <string>
#include <string_view>

namespace ds {

std::string json_escape(std::string_view s);

// "..." with json_escape applied
std::string json_quote(std::string_view s);

} // namespace ds

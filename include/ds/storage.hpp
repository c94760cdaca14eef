#pragma once

#include <string>

#include "ds/validate.hpp"

namespace ds {

// Read path line by line and filter through the domain validator.
// Missing or unreadable files set kind/error; domains stay empty.
LoadResult load_domains(const std::string& path);

// Create path exclusively and write content. Returns false and fills error
// when path already exists, cannot be opened, or the write does not complete.
bool write_text_file(const std::string& path, const std::string& content, std::string& error);

} // namespace ds

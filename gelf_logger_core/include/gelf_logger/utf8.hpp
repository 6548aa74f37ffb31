#pragma once
#include <cstddef>
#include <string_view>

namespace gelf_logger
{

bool is_valid_utf8(std::string_view s);

// Length in Unicode scalars. An invalid byte counts as one scalar.
size_t utf8_length(std::string_view s);

// Longest prefix holding at most `max_scalars` scalars, never splitting one.
std::string_view utf8_prefix(std::string_view s, size_t max_scalars);

}  // namespace gelf_logger

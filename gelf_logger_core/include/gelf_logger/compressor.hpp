#pragma once
#include <string>
#include <string_view>

#include "config.hpp"

namespace gelf_logger
{

// gzip (RFC 1952) or zlib (RFC 1950) deflate; None is a copy.
// Throws CompressionError when zlib reports a failure.
std::string compress(std::string_view data, Compression mode);

// Inverse of compress() for the same mode.
std::string decompress(std::string_view data, Compression mode);

}  // namespace gelf_logger

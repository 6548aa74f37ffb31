#include "gelf_logger/utf8.hpp"
#include <cstdint>

namespace gelf_logger {

namespace {

// Byte length of the well-formed sequence starting at s[pos], 0 if malformed.
size_t sequence_length(std::string_view s, size_t pos) {
    auto byte = [&](size_t i) { return static_cast<unsigned char>(s[i]); };
    unsigned char c = byte(pos);
    size_t len;
    uint32_t cp;
    if (c < 0x80) {
        return 1;
    } else if ((c & 0xE0) == 0xC0) {
        len = 2;
        cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
        len = 3;
        cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
        len = 4;
        cp = c & 0x07;
    } else {
        return 0;
    }
    if (pos + len > s.size()) return 0;
    for (size_t i = 1; i < len; ++i) {
        unsigned char cc = byte(pos + i);
        if ((cc & 0xC0) != 0x80) return 0;
        cp = (cp << 6) | (cc & 0x3F);
    }
    // overlong forms, surrogates, out of range
    if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return 0;
    if (cp >= 0xD800 && cp <= 0xDFFF) return 0;
    if (cp > 0x10FFFF) return 0;
    return len;
}

} // namespace

bool is_valid_utf8(std::string_view s) {
    size_t pos = 0;
    while (pos < s.size()) {
        size_t n = sequence_length(s, pos);
        if (n == 0) return false;
        pos += n;
    }
    return true;
}

size_t utf8_length(std::string_view s) {
    size_t pos = 0;
    size_t count = 0;
    while (pos < s.size()) {
        size_t n = sequence_length(s, pos);
        pos += (n == 0) ? 1 : n;
        ++count;
    }
    return count;
}

std::string_view utf8_prefix(std::string_view s, size_t max_scalars) {
    size_t pos = 0;
    size_t count = 0;
    while (pos < s.size() && count < max_scalars) {
        size_t n = sequence_length(s, pos);
        pos += (n == 0) ? 1 : n;
        ++count;
    }
    return s.substr(0, pos);
}

} // namespace gelf_logger

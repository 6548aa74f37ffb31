#include "gelf_logger/encoders/json_encoder.hpp"
#include "gelf_logger/errors.hpp"
#include "gelf_logger/utf8.hpp"

#include <fmt/format.h>

#include <iterator>

gelf_logger::JsonEncoder::JsonEncoder(bool pretty)
    : pretty_(pretty) {
}

void gelf_logger::JsonEncoder::EscapeJsonString(std::string_view src, std::string& out) {
    if (!is_valid_utf8(src)) {
        throw EncodeError("invalid UTF-8 in string value");
    }
    const char* hex_digits = "0123456789ABCDEF";
    out += '"';
    for (char ch : src) {
        unsigned char c = static_cast<unsigned char>(ch);
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (c <= 0x1F) {
                    out += "\\u00";
                    out += hex_digits[(c >> 4) & 0x0F];
                    out += hex_digits[c & 0x0F];
                } else {
                    out += static_cast<char>(c);
                }
                break;
        }
    }
    out += '"';
}

std::string gelf_logger::JsonEncoder::Encode(const GelfDocument& doc) const {
    std::string out;
    out.reserve(256 + doc.full_message.size() * 2);

    const char* nl = pretty_ ? "\n" : "";
    const char* ind = pretty_ ? "  " : "";
    const char* sep = pretty_ ? ": " : ":";
    const char* comma = pretty_ ? ",\n" : ",";

    bool first = true;
    auto key = [&](std::string_view name) {
        if (!first) {
            out += comma;
        }
        first = false;
        out += ind;
        EscapeJsonString(name, out);
        out += sep;
    };

    out += '{';
    out += nl;

    key("short_message");
    EscapeJsonString(doc.short_message, out);

    key("full_message");
    EscapeJsonString(doc.full_message, out);

    key("version");
    EscapeJsonString(doc.version, out);

    key("host");
    EscapeJsonString(doc.host, out);

    key("level");
    fmt::format_to(std::back_inserter(out), "{}", doc.level);

    // GELF 1.1 wants an unquoted number with millisecond decimals
    key("timestamp");
    fmt::format_to(std::back_inserter(out), "{:.3f}", doc.timestamp);

    key("_application");
    if (doc.application) {
        EscapeJsonString(*doc.application, out);
    } else {
        out += "null";
    }

    for (const auto& field : doc.fields) {
        key(field.first);
        EscapeJsonString(field.second, out);
    }

    out += nl;
    out += '}';
    return out;
}

#pragma once
#include <string>
#include <string_view>

#include "../gelf_document.hpp"

namespace gelf_logger {

class IJsonEncoder {
public:
    virtual ~IJsonEncoder() = default;

    // Throws EncodeError when the document cannot be represented.
    virtual std::string Encode(const GelfDocument& doc) const = 0;
};

class JsonEncoder : public IJsonEncoder {
public:
    explicit JsonEncoder(bool pretty = false);
    std::string Encode(const GelfDocument& doc) const override;

private:
    bool pretty_;
    static void EscapeJsonString(std::string_view src, std::string& out);
};

} // namespace gelf_logger

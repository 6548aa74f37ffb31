#include "gelf_logger/formatters/message_template.hpp"
#include "gelf_logger/errors.hpp"

namespace gelf_logger {

MessageTemplate::MessageTemplate(std::string_view pattern)
    : pattern_(pattern) {
    CompilePattern();
}

void MessageTemplate::CompilePattern() {
    ops_.clear();
    size_t i = 0;
    std::string literal_buf;

    auto flush_literal = [&]() {
        if (!literal_buf.empty()) {
            ops_.push_back({OpType::Literal, std::move(literal_buf)});
            literal_buf.clear();
        }
    };

    auto is_token_char = [](char c) { return c >= 'a' && c <= 'z'; };

    while (i < pattern_.size()) {
        if (pattern_[i] == '$' && i + 1 < pattern_.size() && is_token_char(pattern_[i + 1])) {
            size_t end = i + 1;
            while (end < pattern_.size() && is_token_char(pattern_[end])) {
                ++end;
            }
            std::string_view token(pattern_.data() + i + 1, end - i - 1);

            OpType op;
            if (token == "message")       op = OpType::Message;
            else if (token == "level")    op = OpType::Level;
            else if (token == "levelpad") op = OpType::LevelPad;
            else if (token == "date")     op = OpType::Date;
            else if (token == "time")     op = OpType::Time;
            else if (token == "metadata") op = OpType::Metadata;
            else if (token == "node")     op = OpType::Node;
            else {
                throw ConfigError("invalid format token: $" + std::string(token));
            }

            flush_literal();
            ops_.push_back({op, {}});
            i = end;
        } else {
            literal_buf += pattern_[i];
            ++i;
        }
    }
    flush_literal();
}

std::string MessageTemplate::Render(Severity level, std::string_view message,
                                    const Timestamp& ts, const Metadata& metadata,
                                    std::string_view node) const {
    std::string out;
    char tmp[64];

    for (const auto& op : ops_) {
        switch (op.type) {
            case OpType::Literal:
                out += op.literal;
                break;

            case OpType::Message:
                out += message;
                break;

            case OpType::Level:
                out += to_string(level);
                break;

            case OpType::LevelPad: {
                size_t len = to_string(level).size();
                out.append(kMaxSeverityNameLen - len, ' ');
                break;
            }

            case OpType::Date: {
                size_t n = format_date(ts, tmp, sizeof(tmp));
                out.append(tmp, n);
                break;
            }

            case OpType::Time: {
                size_t n = format_time(ts, tmp, sizeof(tmp));
                out.append(tmp, n);
                break;
            }

            case OpType::Metadata:
                for (const auto& entry : metadata) {
                    out += entry.first;
                    out += '=';
                    out += entry.second.ToText();
                    out += ' ';
                }
                break;

            case OpType::Node:
                out += node;
                break;
        }
    }

    return out;
}

} // namespace gelf_logger

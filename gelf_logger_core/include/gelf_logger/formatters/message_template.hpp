#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "../log_level.hpp"
#include "../metadata.hpp"
#include "../timestamp.hpp"

namespace gelf_logger
{

// Renders "$token" templates such as "[$level] $message".
// Tokens: $message $level $levelpad $date $time $metadata $node.
class MessageTemplate
{
 public:
  // Throws ConfigError on an unknown token.
  explicit MessageTemplate(std::string_view pattern = "$message");

  std::string Render(Severity level, std::string_view message, const Timestamp& ts,
                     const Metadata& metadata, std::string_view node) const;

  const std::string& Pattern() const { return pattern_; }

 private:
  std::string pattern_;

  enum class OpType : uint8_t
  {
    Literal,
    Message,
    Level,
    LevelPad,
    Date,
    Time,
    Metadata,
    Node
  };

  struct FormatOp
  {
    OpType type;
    std::string literal;
  };

  std::vector<FormatOp> ops_;
  void CompilePattern();
};

}  // namespace gelf_logger

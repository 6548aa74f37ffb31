#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gelf_logger
{

struct GelfDocument
{
  std::string short_message;
  std::string full_message;
  std::string version = "1.1";
  std::string host;
  int level = 6;
  double timestamp = 0.0;
  std::optional<std::string> application;  // null in JSON when unset

  // Additional fields. Keys carry the leading '_', values are always text.
  std::vector<std::pair<std::string, std::string>> fields;

  const std::string* Field(std::string_view key) const
  {
    for (const auto& f : fields)
    {
      if (f.first == key) return &f.second;
    }
    return nullptr;
  }
};

}  // namespace gelf_logger

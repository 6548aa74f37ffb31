#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "encoders/json_encoder.hpp"
#include "formatters/message_template.hpp"
#include "log_event.hpp"
#include "platform.hpp"

namespace gelf_logger
{

enum class Compression : uint8_t
{
  Gzip,
  Zlib,
  None
};

// What to do with a compressed payload above GELF_LOG_MAX_SIZE.
enum class OversizePolicy : uint8_t
{
  Drop,
  Fail
};

class MetadataSelection
{
 public:
  MetadataSelection() = default;

  static MetadataSelection All();
  static MetadataSelection Keys(std::vector<std::string> keys);

  bool IsAll() const { return all_; }
  const std::vector<std::string>& KeyList() const { return keys_; }

  // Applies the selection. Reserved keys are dropped under "all"; the
  // result holds each key once with its last-seen value.
  Metadata Select(const Metadata& metadata) const;

 private:
  bool all_ = false;
  std::vector<std::string> keys_;
};

// Custom formatter. Receives and returns (level, message, timestamp, metadata).
using FormatCallback = std::function<LogEvent(Severity level, const std::string& message,
                                              const Timestamp& timestamp,
                                              const Metadata& metadata)>;

using PortValue = std::variant<int64_t, std::string>;
using FormatValue = std::variant<std::string, FormatCallback>;

// Raw option set as handed over by the host.
struct ConfigOptions
{
  std::string host = GELF_LOG_DEFAULT_HOST;
  PortValue port = int64_t{GELF_LOG_DEFAULT_PORT};
  std::optional<std::string> application;
  std::optional<std::string> hostname;
  std::string compression = "gzip";
  MetadataSelection metadata;
  Metadata tags;
  std::shared_ptr<const IJsonEncoder> json_encoder;
  FormatValue format = std::string("$message");
  std::optional<Severity> level;
  size_t pool_size = 1;
  size_t queue_capacity = 0;
  OversizePolicy oversize_policy = OversizePolicy::Drop;
};

// Immutable snapshot shared by every worker until the next reconfigure.
struct Config
{
  std::string collector_host;
  uint16_t collector_port = GELF_LOG_DEFAULT_PORT;
  std::optional<std::string> application;
  std::string hostname;
  Compression compression = Compression::Gzip;
  MetadataSelection metadata;
  Metadata tags;
  std::shared_ptr<const IJsonEncoder> encoder;
  FormatCallback format_callback;
  MessageTemplate message_template;
  std::optional<Severity> min_level;
  OversizePolicy oversize_policy = OversizePolicy::Drop;
  size_t pool_size = 1;
  size_t queue_capacity = 0;
};

using ConfigPtr = std::shared_ptr<const Config>;

// Throws ConfigError on an invalid port.
ConfigPtr make_config(const ConfigOptions& options);

uint16_t parse_port(const PortValue& port);

// "gzip" and "zlib" select a codec, anything else means no compression.
Compression parse_compression(std::string_view name);

std::string local_hostname();

}  // namespace gelf_logger

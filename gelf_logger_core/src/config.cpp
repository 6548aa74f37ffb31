#include "gelf_logger/config.hpp"
#include "gelf_logger/errors.hpp"

#include <fmt/format.h>
#include <unistd.h>

#include <algorithm>
#include <array>

namespace gelf_logger
{

namespace
{

constexpr std::array<std::string_view, 3> kReservedKeys = {"crash_reason", "ancestors",
                                                           "callers"};

bool is_reserved(std::string_view key)
{
  return std::find(kReservedKeys.begin(), kReservedKeys.end(), key) != kReservedKeys.end();
}

// Inserts or overwrites in place so the first position of a key is kept.
void put(Metadata& out, const MetadataEntry& entry)
{
  for (auto& existing : out)
  {
    if (existing.first == entry.first)
    {
      existing.second = entry.second;
      return;
    }
  }
  out.push_back(entry);
}

uint16_t checked_port(int64_t value)
{
  if (value <= 0 || value > 65535)
  {
    throw ConfigError(fmt::format("port out of range: {}", value));
  }
  return static_cast<uint16_t>(value);
}

}  // namespace

MetadataSelection MetadataSelection::All()
{
  MetadataSelection sel;
  sel.all_ = true;
  return sel;
}

MetadataSelection MetadataSelection::Keys(std::vector<std::string> keys)
{
  MetadataSelection sel;
  sel.keys_ = std::move(keys);
  return sel;
}

Metadata MetadataSelection::Select(const Metadata& metadata) const
{
  Metadata out;
  for (const auto& entry : metadata)
  {
    if (all_)
    {
      if (is_reserved(entry.first)) continue;
    }
    else if (std::find(keys_.begin(), keys_.end(), entry.first) == keys_.end())
    {
      continue;
    }
    put(out, entry);
  }
  return out;
}

uint16_t parse_port(const PortValue& port)
{
  if (const auto* num = std::get_if<int64_t>(&port))
  {
    return checked_port(*num);
  }

  const std::string& text = std::get<std::string>(port);
  if (text.empty() || text.size() > 5 ||
      !std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; }))
  {
    throw ConfigError(fmt::format("port is not an unsigned integer: '{}'", text));
  }
  return checked_port(std::stoll(text));
}

Compression parse_compression(std::string_view name)
{
  if (name == "gzip") return Compression::Gzip;
  if (name == "zlib") return Compression::Zlib;
  return Compression::None;
}

std::string local_hostname()
{
  // HOST_NAME_MAX 仅 Linux 提供
  char buf[256] = {};
  if (::gethostname(buf, sizeof(buf) - 1) != 0)
  {
    return "localhost";
  }
  return buf;
}

ConfigPtr make_config(const ConfigOptions& options)
{
  auto cfg = std::make_shared<Config>();
  cfg->collector_host = options.host;
  cfg->collector_port = parse_port(options.port);
  cfg->application = options.application;
  cfg->hostname = options.hostname ? *options.hostname : local_hostname();
  cfg->compression = parse_compression(options.compression);
  cfg->metadata = options.metadata;
  cfg->tags = options.tags;
  cfg->encoder = options.json_encoder ? options.json_encoder
                                      : std::make_shared<const JsonEncoder>();
  cfg->min_level = options.level;
  cfg->oversize_policy = options.oversize_policy;
  cfg->pool_size = options.pool_size;
  cfg->queue_capacity = options.queue_capacity;

  if (const auto* callback = std::get_if<FormatCallback>(&options.format))
  {
    // an empty callback falls through to the default template
    cfg->format_callback = *callback;
  }
  else
  {
    try
    {
      cfg->message_template = MessageTemplate(std::get<std::string>(options.format));
    }
    catch (const ConfigError& e)
    {
      fmt::print(stderr, "gelf_logger: {}, using \"$message\"\n", e.what());
      cfg->message_template = MessageTemplate();
    }
  }
  return cfg;
}

}  // namespace gelf_logger

#include "gelf_logger/document_builder.hpp"
#include "gelf_logger/platform.hpp"
#include "gelf_logger/utf8.hpp"

#include <exception>

namespace gelf_logger
{

namespace
{

LogEvent render_template(const LogEvent& event, const Config& config)
{
  LogEvent out = event;
  out.message = config.message_template.Render(event.level, event.message, event.timestamp,
                                               config.metadata.Select(event.metadata),
                                               config.hostname);
  return out;
}

}  // namespace

LogEvent apply_formatter(const LogEvent& event, const Config& config)
{
  if (config.format_callback)
  {
    try
    {
      return config.format_callback(event.level, event.message, event.timestamp,
                                    event.metadata);
    }
    catch (const std::exception&)
    {
      // fall back to the default rendering below
    }
    catch (...)
    {
      // 回调可能抛出任意类型，同样回退
    }
  }
  return render_template(event, config);
}

std::optional<GelfDocument> build_document(const LogEvent& event, const Config& config)
{
  LogEvent formatted = apply_formatter(event, config);
  if (formatted.message.empty())
  {
    return std::nullopt;
  }

  GelfDocument doc;
  doc.short_message = std::string(utf8_prefix(formatted.message, GELF_LOG_SHORT_MESSAGE_LEN));
  doc.full_message = std::move(formatted.message);
  doc.host = config.hostname;
  doc.level = to_syslog_code(formatted.level);
  doc.timestamp = to_gelf_seconds(formatted.timestamp);
  doc.application = config.application;

  // tags go in last so they win on key collision
  Metadata fields = config.metadata.Select(formatted.metadata);
  for (const auto& tag : config.tags)
  {
    bool replaced = false;
    for (auto& field : fields)
    {
      if (field.first == tag.first)
      {
        field.second = tag.second;
        replaced = true;
        break;
      }
    }
    if (!replaced) fields.push_back(tag);
  }

  doc.fields.reserve(fields.size());
  for (const auto& field : fields)
  {
    std::string key = "_" + field.first;
    if (key == "_application")
    {
      doc.application = field.second.ToText();
      continue;
    }
    doc.fields.emplace_back(std::move(key), field.second.ToText());
  }
  return doc;
}

}  // namespace gelf_logger

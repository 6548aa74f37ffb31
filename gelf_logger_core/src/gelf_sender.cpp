#include "gelf_logger/gelf_sender.hpp"
#include "gelf_logger/chunker.hpp"
#include "gelf_logger/compressor.hpp"
#include "gelf_logger/document_builder.hpp"
#include "gelf_logger/errors.hpp"
#include "gelf_logger/platform.hpp"

#include <fmt/format.h>

namespace gelf_logger
{

std::optional<std::string> serialize_event(const LogEvent& event, const Config& config)
{
  auto doc = build_document(event, config);
  if (!doc)
  {
    return std::nullopt;
  }
  std::string json = config.encoder->Encode(*doc);
  return compress(json, config.compression);
}

GelfSender::GelfSender(ConfigPtr config, TransportFactory factory)
    : config_(std::move(config)), factory_(std::move(factory))
{
}

SendStatus GelfSender::Send(const LogEvent& event)
{
  auto payload = serialize_event(event, *config_);
  if (!payload)
  {
    ++stats_.skipped;
    return SendStatus::Skipped;
  }
  return Transmit(*payload);
}

SendStatus GelfSender::Transmit(std::string_view payload)
{
  if (payload.empty())
  {
    ++stats_.skipped;
    return SendStatus::Skipped;
  }

  if (payload.size() > GELF_LOG_MAX_SIZE)
  {
    if (config_->oversize_policy == OversizePolicy::Fail)
    {
      throw MessageTooLargeError(payload.size(), GELF_LOG_MAX_SIZE);
    }
    ++stats_.dropped_oversize;
    fmt::print(stderr, "GelfSender: dropped {} byte message (limit {})\n", payload.size(),
               GELF_LOG_MAX_SIZE);
    return SendStatus::Dropped;
  }

  IDatagramTransport& transport = EnsureTransport();

  if (payload.size() <= GELF_LOG_MAX_PACKET_SIZE)
  {
    transport.Send(payload);
    ++stats_.sent;
    return SendStatus::Sent;
  }

  Chunker chunker(payload, generate_message_id());
  std::string_view datagram;
  while (chunker.Next(datagram))
  {
    transport.Send(datagram);
    ++stats_.chunks;
  }
  ++stats_.sent_chunked;
  return SendStatus::SentChunked;
}

void GelfSender::Reconfigure(ConfigPtr config)
{
  transport_.reset();
  config_ = std::move(config);
}

IDatagramTransport& GelfSender::EnsureTransport()
{
  if (!transport_)
  {
    transport_ = factory_(*config_);
    if (!transport_)
    {
      throw TransportError("transport factory returned no transport");
    }
  }
  return *transport_;
}

}  // namespace gelf_logger

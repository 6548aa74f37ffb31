#include <gtest/gtest.h>

#include <memory>
#include <random>
#include <string>

#include "fake_transport.hpp"
#include "gelf_logger/compressor.hpp"
#include "gelf_logger/errors.hpp"
#include "gelf_logger/gelf_sender.hpp"

using gelf_logger::Compression;
using gelf_logger::ConfigOptions;
using gelf_logger::GelfSender;
using gelf_logger::LogEvent;
using gelf_logger::make_config;
using gelf_logger::SendStatus;
using gelf_logger::Severity;

namespace
{

LogEvent make_test_event(const std::string& msg = "test")
{
  LogEvent ev;
  ev.level = Severity::Info;
  ev.message = msg;
  ev.timestamp = gelf_logger::Timestamp{2025, 2, 16, 7, 50, 0, 123};
  return ev;
}

ConfigOptions base_options(const std::string& compression = "gzip")
{
  ConfigOptions opts;
  opts.application = "myapp";
  opts.hostname = "host-a";
  opts.compression = compression;
  return opts;
}

// Random bytes compress poorly, which makes payload size predictable.
std::string random_text(size_t size)
{
  std::mt19937 rng(42);
  std::uniform_int_distribution<int> dist('!', '~');
  std::string s(size, ' ');
  for (auto& c : s) c = static_cast<char>(dist(rng));
  return s;
}

class ThrowingEncoder : public gelf_logger::IJsonEncoder
{
 public:
  std::string Encode(const gelf_logger::GelfDocument&) const override
  {
    throw gelf_logger::EncodeError("cannot encode");
  }
};

}  // namespace

TEST(GelfSender, SerializeEventIsCompressedJson)
{
  auto cfg = make_config(base_options());
  auto payload = gelf_logger::serialize_event(make_test_event(), *cfg);
  ASSERT_TRUE(payload.has_value());
  std::string json = gelf_logger::decompress(*payload, Compression::Gzip);
  EXPECT_NE(json.find("\"short_message\":\"test\""), std::string::npos);
  EXPECT_NE(json.find("\"_application\":\"myapp\""), std::string::npos);
}

TEST(GelfSender, SerializeSkipsEmptyMessage)
{
  auto cfg = make_config(base_options());
  EXPECT_FALSE(gelf_logger::serialize_event(make_test_event(""), *cfg).has_value());
}

TEST(GelfSender, SmallMessageIsOneDatagram)
{
  auto log = std::make_shared<DatagramLog>();
  GelfSender sender(make_config(base_options()), recording_factory(log));
  EXPECT_FALSE(sender.HasTransport());

  EXPECT_EQ(sender.Send(make_test_event()), SendStatus::Sent);
  EXPECT_TRUE(sender.HasTransport());

  auto datagrams = log->Snapshot();
  ASSERT_EQ(datagrams.size(), 1u);
  std::string json = gelf_logger::decompress(datagrams[0], Compression::Gzip);
  EXPECT_NE(json.find("\"full_message\":\"test\""), std::string::npos);
  EXPECT_EQ(sender.Stats().sent, 1u);
}

TEST(GelfSender, UncompressedPayload)
{
  auto log = std::make_shared<DatagramLog>();
  GelfSender sender(make_config(base_options("raw")), recording_factory(log));
  sender.Send(make_test_event());
  auto datagrams = log->Snapshot();
  ASSERT_EQ(datagrams.size(), 1u);
  EXPECT_EQ(datagrams[0].front(), '{');
}

TEST(GelfSender, LargeMessageIsChunked)
{
  auto log = std::make_shared<DatagramLog>();
  GelfSender sender(make_config(base_options("raw")), recording_factory(log));

  EXPECT_EQ(sender.Send(make_test_event(random_text(30000))), SendStatus::SentChunked);

  auto datagrams = log->Snapshot();
  ASSERT_GE(datagrams.size(), 4u);
  std::string joined;
  for (size_t i = 0; i < datagrams.size(); ++i)
  {
    const auto& d = datagrams[i];
    ASSERT_LE(d.size(), static_cast<size_t>(GELF_LOG_MAX_PACKET_SIZE));
    EXPECT_EQ(static_cast<uint8_t>(d[0]), 0x1E);
    EXPECT_EQ(static_cast<uint8_t>(d[1]), 0x0F);
    EXPECT_EQ(d.substr(2, 8), datagrams[0].substr(2, 8));
    EXPECT_EQ(static_cast<uint8_t>(d[10]), i);
    EXPECT_EQ(static_cast<uint8_t>(d[11]), datagrams.size());
    joined += d.substr(12);
  }
  EXPECT_EQ(joined.front(), '{');
  EXPECT_EQ(joined.back(), '}');
  EXPECT_EQ(sender.Stats().sent_chunked, 1u);
  EXPECT_EQ(sender.Stats().chunks, datagrams.size());
}

TEST(GelfSender, ChunkedMessagesGetDistinctIds)
{
  auto log = std::make_shared<DatagramLog>();
  GelfSender sender(make_config(base_options("raw")), recording_factory(log));
  sender.Send(make_test_event(random_text(10000)));
  size_t first_count = log->Count();
  sender.Send(make_test_event(random_text(10000)));

  auto datagrams = log->Snapshot();
  ASSERT_GT(datagrams.size(), first_count);
  EXPECT_NE(datagrams[0].substr(2, 8), datagrams[first_count].substr(2, 8));
}

TEST(GelfSender, OversizeIsDroppedByDefault)
{
  auto log = std::make_shared<DatagramLog>();
  GelfSender sender(make_config(base_options("raw")), recording_factory(log));

  std::string payload(GELF_LOG_MAX_SIZE + 1, 'x');
  EXPECT_EQ(sender.Transmit(payload), SendStatus::Dropped);
  EXPECT_EQ(log->Count(), 0u);
  EXPECT_EQ(sender.Stats().dropped_oversize, 1u);
}

TEST(GelfSender, OversizeFailsUnderFailPolicy)
{
  auto log = std::make_shared<DatagramLog>();
  auto opts = base_options("raw");
  opts.oversize_policy = gelf_logger::OversizePolicy::Fail;
  GelfSender sender(make_config(opts), recording_factory(log));

  std::string payload(GELF_LOG_MAX_SIZE + 1, 'x');
  try
  {
    sender.Transmit(payload);
    FAIL() << "expected MessageTooLargeError";
  }
  catch (const gelf_logger::MessageTooLargeError& e)
  {
    EXPECT_EQ(e.Size(), payload.size());
  }
  EXPECT_EQ(log->Count(), 0u);
}

TEST(GelfSender, MaximumSizeIsStillSent)
{
  auto log = std::make_shared<DatagramLog>();
  GelfSender sender(make_config(base_options("raw")), recording_factory(log));

  std::string payload(GELF_LOG_MAX_SIZE, 'x');
  EXPECT_EQ(sender.Transmit(payload), SendStatus::SentChunked);
  EXPECT_EQ(log->Count(), 128u);
}

TEST(GelfSender, PacketSizeBoundary)
{
  auto log = std::make_shared<DatagramLog>();
  GelfSender sender(make_config(base_options("raw")), recording_factory(log));

  EXPECT_EQ(sender.Transmit(std::string(GELF_LOG_MAX_PACKET_SIZE, 'x')), SendStatus::Sent);
  EXPECT_EQ(sender.Transmit(std::string(GELF_LOG_MAX_PACKET_SIZE + 1, 'x')),
            SendStatus::SentChunked);
  EXPECT_EQ(log->Count(), 3u);
}

TEST(GelfSender, EmptyMessageSendsNothing)
{
  auto log = std::make_shared<DatagramLog>();
  GelfSender sender(make_config(base_options()), recording_factory(log));
  EXPECT_EQ(sender.Send(make_test_event("")), SendStatus::Skipped);
  EXPECT_EQ(log->Count(), 0u);
  EXPECT_FALSE(sender.HasTransport());
  EXPECT_EQ(sender.Stats().skipped, 1u);
}

TEST(GelfSender, EncoderErrorPropagates)
{
  auto log = std::make_shared<DatagramLog>();
  auto opts = base_options();
  opts.json_encoder = std::make_shared<ThrowingEncoder>();
  GelfSender sender(make_config(opts), recording_factory(log));
  EXPECT_THROW(sender.Send(make_test_event()), gelf_logger::EncodeError);
  EXPECT_EQ(log->Count(), 0u);
}

TEST(GelfSender, TransportErrorPropagates)
{
  GelfSender sender(make_config(base_options()),
                    [](const gelf_logger::Config&)
                    { return std::unique_ptr<gelf_logger::IDatagramTransport>(new BrokenTransport); });
  EXPECT_THROW(sender.Send(make_test_event()), gelf_logger::TransportError);
}

TEST(GelfSender, ReconfigureReopensTransport)
{
  auto log = std::make_shared<DatagramLog>();
  auto opts = base_options();
  GelfSender sender(make_config(opts), recording_factory(log));
  sender.Send(make_test_event());
  EXPECT_EQ(log->opened.load(), 1);

  opts.host = "10.0.0.9";
  sender.Reconfigure(make_config(opts));
  EXPECT_FALSE(sender.HasTransport());
  sender.Send(make_test_event());
  EXPECT_EQ(log->opened.load(), 2);

  std::lock_guard<std::mutex> lock(log->mutex);
  ASSERT_EQ(log->hosts.size(), 2u);
  EXPECT_EQ(log->hosts[0], "127.0.0.1");
  EXPECT_EQ(log->hosts[1], "10.0.0.9");
}

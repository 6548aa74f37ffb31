#include <gtest/gtest.h>

#include <optional>
#include <stdexcept>
#include <string>

#include "gelf_logger/config.hpp"
#include "gelf_logger/document_builder.hpp"

using gelf_logger::build_document;
using gelf_logger::ConfigOptions;
using gelf_logger::LogEvent;
using gelf_logger::make_config;
using gelf_logger::Metadata;
using gelf_logger::MetadataSelection;
using gelf_logger::MetadataValue;
using gelf_logger::Severity;
using gelf_logger::Timestamp;

static LogEvent make_test_event(const std::string& msg = "test", Severity level = Severity::Info,
                                Metadata md = {})
{
  LogEvent ev;
  ev.level = level;
  ev.message = msg;
  ev.timestamp = Timestamp{2025, 2, 16, 7, 50, 0, 123};
  ev.metadata = std::move(md);
  return ev;
}

static ConfigOptions base_options()
{
  ConfigOptions opts;
  opts.application = "myapp";
  opts.hostname = "host-a";
  return opts;
}

TEST(DocumentBuilder, BasicDocument)
{
  auto cfg = make_config(base_options());
  auto doc = build_document(make_test_event(), *cfg);
  ASSERT_TRUE(doc.has_value());
  EXPECT_EQ(doc->short_message, "test");
  EXPECT_EQ(doc->full_message, "test");
  EXPECT_EQ(doc->version, "1.1");
  EXPECT_EQ(doc->host, "host-a");
  EXPECT_EQ(doc->level, 6);
  EXPECT_DOUBLE_EQ(doc->timestamp, 1739692200.123);
  ASSERT_TRUE(doc->application.has_value());
  EXPECT_EQ(*doc->application, "myapp");
  EXPECT_TRUE(doc->fields.empty());
}

TEST(DocumentBuilder, ApplicationUnset)
{
  ConfigOptions opts;
  opts.hostname = "h";
  auto doc = build_document(make_test_event(), *make_config(opts));
  ASSERT_TRUE(doc.has_value());
  EXPECT_FALSE(doc->application.has_value());
}

TEST(DocumentBuilder, ShortMessageTruncatedTo80)
{
  std::string msg(140, 'a');
  auto doc = build_document(make_test_event(msg), *make_config(base_options()));
  ASSERT_TRUE(doc.has_value());
  EXPECT_EQ(doc->short_message, std::string(80, 'a'));
  EXPECT_EQ(doc->full_message, msg);
}

TEST(DocumentBuilder, ShortMessageCountsScalarsNotBytes)
{
  std::string msg;
  for (int i = 0; i < 100; ++i) msg += "\xC3\xA9";
  auto doc = build_document(make_test_event(msg), *make_config(base_options()));
  ASSERT_TRUE(doc.has_value());
  EXPECT_EQ(doc->short_message.size(), 160u);
}

TEST(DocumentBuilder, SeverityCodes)
{
  auto cfg = make_config(base_options());
  EXPECT_EQ(build_document(make_test_event("x", Severity::Debug), *cfg)->level, 7);
  EXPECT_EQ(build_document(make_test_event("x", Severity::Notice), *cfg)->level, 5);
  EXPECT_EQ(build_document(make_test_event("x", Severity::Warning), *cfg)->level, 4);
  EXPECT_EQ(build_document(make_test_event("x", Severity::Error), *cfg)->level, 3);
  EXPECT_EQ(build_document(make_test_event("x", Severity::Emergency), *cfg)->level, 0);
}

TEST(DocumentBuilder, NoMetadataByDefault)
{
  auto doc = build_document(make_test_event("x", Severity::Info, {{"this", "that"}}),
                            *make_config(base_options()));
  ASSERT_TRUE(doc.has_value());
  EXPECT_EQ(doc->Field("_this"), nullptr);
}

TEST(DocumentBuilder, SelectedMetadataKeys)
{
  auto opts = base_options();
  opts.metadata = MetadataSelection::Keys({"this"});
  auto doc = build_document(
      make_test_event("x", Severity::Info, {{"this", "that"}, {"other", "skip"}}),
      *make_config(opts));
  ASSERT_TRUE(doc.has_value());
  ASSERT_NE(doc->Field("_this"), nullptr);
  EXPECT_EQ(*doc->Field("_this"), "that");
  EXPECT_EQ(doc->Field("_other"), nullptr);
}

TEST(DocumentBuilder, AllMetadataWithoutReservedKeys)
{
  auto opts = base_options();
  opts.metadata = MetadataSelection::All();
  Metadata md{{"user", "ann"}, {"crash_reason", "boom"}, {"count", 3},
              {"list", MetadataValue::List({"elixir"})}};
  auto doc = build_document(make_test_event("x", Severity::Info, md), *make_config(opts));
  ASSERT_TRUE(doc.has_value());
  EXPECT_EQ(*doc->Field("_user"), "ann");
  EXPECT_EQ(*doc->Field("_count"), "3");
  EXPECT_EQ(*doc->Field("_list"), "[\"elixir\"]");
  EXPECT_EQ(doc->Field("_crash_reason"), nullptr);
}

TEST(DocumentBuilder, TagsAreAlwaysAdded)
{
  auto opts = base_options();
  opts.tags = {{"env", "prod"}, {"region", "eu"}};
  auto doc = build_document(make_test_event(), *make_config(opts));
  ASSERT_TRUE(doc.has_value());
  EXPECT_EQ(*doc->Field("_env"), "prod");
  EXPECT_EQ(*doc->Field("_region"), "eu");
}

TEST(DocumentBuilder, TagsOverrideMetadata)
{
  auto opts = base_options();
  opts.metadata = MetadataSelection::All();
  opts.tags = {{"env", "prod"}};
  auto doc = build_document(make_test_event("x", Severity::Info, {{"env", "dev"}}),
                            *make_config(opts));
  ASSERT_TRUE(doc.has_value());
  size_t env_count = 0;
  for (const auto& f : doc->fields)
  {
    if (f.first == "_env") ++env_count;
  }
  EXPECT_EQ(env_count, 1u);
  EXPECT_EQ(*doc->Field("_env"), "prod");
}

TEST(DocumentBuilder, ApplicationKeyOverridesApplication)
{
  auto opts = base_options();
  opts.tags = {{"application", "tagged"}};
  auto doc = build_document(make_test_event(), *make_config(opts));
  ASSERT_TRUE(doc.has_value());
  EXPECT_EQ(*doc->application, "tagged");
  EXPECT_EQ(doc->Field("_application"), nullptr);
}

TEST(DocumentBuilder, TemplateIsApplied)
{
  auto opts = base_options();
  opts.format = std::string("[$level] $message");
  auto doc = build_document(make_test_event("hello", Severity::Error), *make_config(opts));
  ASSERT_TRUE(doc.has_value());
  EXPECT_EQ(doc->full_message, "[error] hello");
}

TEST(DocumentBuilder, EmptyMessageIsSkipped)
{
  EXPECT_FALSE(build_document(make_test_event(""), *make_config(base_options())).has_value());

  auto opts = base_options();
  opts.format = std::string("");
  EXPECT_FALSE(build_document(make_test_event("hello"), *make_config(opts)).has_value());
}

TEST(DocumentBuilder, CallbackCanChangeEverything)
{
  auto opts = base_options();
  opts.metadata = MetadataSelection::All();
  opts.format = gelf_logger::FormatCallback(
      [](Severity, const std::string& msg, const Timestamp& ts, const Metadata& md)
      {
        Metadata out = md;
        out.emplace_back("timestamp_us", int64_t{1739692200123000});
        return LogEvent{Severity::Critical, "cb: " + msg, ts, out};
      });
  auto doc = build_document(make_test_event("hello"), *make_config(opts));
  ASSERT_TRUE(doc.has_value());
  EXPECT_EQ(doc->full_message, "cb: hello");
  EXPECT_EQ(doc->level, 2);
  ASSERT_NE(doc->Field("_timestamp_us"), nullptr);
  EXPECT_EQ(*doc->Field("_timestamp_us"), "1739692200123000");
}

TEST(DocumentBuilder, ThrowingCallbackFallsBackToMessage)
{
  auto opts = base_options();
  opts.format = gelf_logger::FormatCallback(
      [](Severity, const std::string&, const Timestamp&, const Metadata&) -> LogEvent
      { throw std::runtime_error("formatter bug"); });
  auto doc = build_document(make_test_event("hello"), *make_config(opts));
  ASSERT_TRUE(doc.has_value());
  EXPECT_EQ(doc->full_message, "hello");
}

TEST(DocumentBuilder, NonStdThrowingCallbackFallsBack)
{
  auto opts = base_options();
  opts.format = gelf_logger::FormatCallback(
      [](Severity, const std::string&, const Timestamp&, const Metadata&) -> LogEvent
      { throw 42; });
  auto cfg = make_config(opts);
  std::optional<gelf_logger::GelfDocument> doc;
  EXPECT_NO_THROW(doc = build_document(make_test_event("hello"), *cfg));
  ASSERT_TRUE(doc.has_value());
  EXPECT_EQ(doc->full_message, "hello");
  EXPECT_EQ(doc->short_message, "hello");
}

TEST(DocumentBuilder, EmptyCallbackFallsBackToMessage)
{
  auto opts = base_options();
  opts.format = gelf_logger::FormatCallback();
  auto doc = build_document(make_test_event("hello"), *make_config(opts));
  ASSERT_TRUE(doc.has_value());
  EXPECT_EQ(doc->full_message, "hello");
}

TEST(DocumentBuilder, NullMetadataRendersEmpty)
{
  auto opts = base_options();
  opts.metadata = MetadataSelection::Keys({"gone"});
  auto doc = build_document(make_test_event("x", Severity::Info, {{"gone", nullptr}}),
                            *make_config(opts));
  ASSERT_TRUE(doc.has_value());
  ASSERT_NE(doc->Field("_gone"), nullptr);
  EXPECT_EQ(*doc->Field("_gone"), "");
}

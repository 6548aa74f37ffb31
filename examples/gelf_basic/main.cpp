#include <gelf_logger/config.hpp>
#include <gelf_logger/errors.hpp>
#include <gelf_logger/log_event.hpp>
#include <gelf_logger/sinks/gelf_async_sink.hpp>
#include <gelf_logger/sinks/gelf_sink.hpp>

#include <fmt/format.h>

#include <cstdlib>
#include <string>
#include <thread>
#include <vector>

int main(int argc, char** argv)
{
  // --- Configuration ---

  gelf_logger::ConfigOptions opts;
  opts.host = argc > 1 ? argv[1] : "127.0.0.1";
  opts.port = std::string(argc > 2 ? argv[2] : "12201");
  opts.application = "gelf_basic_example";
  opts.compression = "gzip";
  opts.format = std::string("[$level] $message");
  opts.metadata = gelf_logger::MetadataSelection::Keys({"request_id", "user"});
  opts.tags = {{"env", "dev"}};
  opts.pool_size = 2;

  gelf_logger::ConfigPtr config;
  try
  {
    config = gelf_logger::make_config(opts);
  }
  catch (const gelf_logger::ConfigError& e)
  {
    fmt::print(stderr, "invalid configuration: {}\n", e.what());
    return EXIT_FAILURE;
  }

  // 1) Synchronous sink: sends in the calling thread
  gelf_logger::GelfSink sync_sink(config);
  sync_sink.Submit(gelf_logger::make_event(gelf_logger::Severity::Notice, "application started"));

  // 2) Async sink backed by a worker pool
  gelf_logger::GelfAsyncSink sink(config);
  sink.SetLevel(gelf_logger::Severity::Info);

  // --- Basic logging ---

  sink.Submit(gelf_logger::make_event(gelf_logger::Severity::Debug, "filtered out"));
  sink.Submit(gelf_logger::make_event(gelf_logger::Severity::Info, "hello world",
                                      {{"request_id", "abc123"}, {"user", "ann"}}));
  sink.Submit(gelf_logger::make_event(gelf_logger::Severity::Warning, "disk usage at 85%"));
  sink.Submit(gelf_logger::make_event(gelf_logger::Severity::Error, "connection failed: timeout"));

  // --- Multi-threaded logging ---

  std::vector<std::thread> threads;
  for (int t = 0; t < 3; ++t)
  {
    threads.emplace_back(
        [&sink, t]()
        {
          for (int i = 0; i < 5; ++i)
          {
            sink.Submit(gelf_logger::make_event(gelf_logger::Severity::Info,
                                                fmt::format("worker {} message {}", t, i)));
          }
        });
  }
  for (auto& th : threads)
  {
    th.join();
  }

  // --- Large message, sent as GELF chunks ---

  std::string big;
  for (int i = 0; i < 4000; ++i)
  {
    big += fmt::format("row {} ", i);
  }
  sink.Submit(gelf_logger::make_event(gelf_logger::Severity::Info, big));

  // --- Reconfigure at runtime ---

  opts.format = std::string("$levelpad$level $message");
  sink.Configure(gelf_logger::make_config(opts));
  sink.Submit(gelf_logger::make_event(gelf_logger::Severity::Info, "after reconfigure"));

  sink.Flush();
  sink.Stop();

  const auto& pool = sink.Pool();
  fmt::print("workers: {}, replacements: {}, dropped: {}, failed: {}\n", pool.Size(),
             pool.ReplacementCount(), pool.DroppedCount(), pool.FailedCount());
  return 0;
}

#pragma once
#include <atomic>

#include "../log_event.hpp"
#include "../log_level.hpp"

namespace gelf_logger
{

class ILogSink
{
 public:
  virtual ~ILogSink() = default;

  // 提交一条日志事件（由宿主日志管线调用）
  virtual void Submit(const LogEvent& event) = 0;

  // 等待已提交的事件发送完毕
  virtual void Flush() = 0;

  // 设置该 Sink 的最低输出级别
  void SetLevel(Severity level) { min_level_.store(level, std::memory_order_relaxed); }

  Severity Level() const { return min_level_.load(std::memory_order_relaxed); }

  // Sink 级别过滤
  bool ShouldLog(Severity event_level) const { return event_level >= Level(); }

 protected:
  std::atomic<Severity> min_level_{Severity::Debug};
};

}  // namespace gelf_logger

#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

#include "config.hpp"
#include "gelf_sender.hpp"
#include "log_event.hpp"
#include "platform.hpp"

namespace gelf_logger
{

// One thread, one inbox, one transport. Events are sent in inbox order.
// A transport failure ends the worker; the pool is told through the exit
// callback and starts a replacement.
class GelfWorker
{
 public:
  using ExitCallback = std::function<void(size_t slot, uint64_t generation)>;

  // queue_capacity == 0 means an unbounded inbox.
  GelfWorker(size_t slot, uint64_t generation, ConfigPtr config, TransportFactory factory,
             size_t queue_capacity, ExitCallback on_exit);
  ~GelfWorker();

  GelfWorker(const GelfWorker&) = delete;
  GelfWorker& operator=(const GelfWorker&) = delete;

  // 生产者调用：入队后立即返回。队列已满或线程已退出时返回 false
  bool TryPush(LogEvent event);

  // Queued behind pending events; closes the socket and adopts `config`.
  // The new queue capacity applies to pushes from this call on.
  void PushReconfigure(ConfigPtr config);

  // Processes what is already queued, then joins the thread.
  void Stop();

  // Joins a worker that already exited.
  void Join();

  bool IsAlive() const { return alive_.load(std::memory_order_acquire); }
  bool IsIdle() const;

  size_t Slot() const { return slot_; }
  uint64_t Generation() const { return generation_; }

  uint64_t Processed() const { return processed_.load(std::memory_order_relaxed); }
  uint64_t Failed() const { return failed_.load(std::memory_order_relaxed); }
  uint64_t Lost() const { return lost_.load(std::memory_order_relaxed); }

 private:
  struct Job
  {
    std::optional<LogEvent> event;
    ConfigPtr config;  // set for a reconfigure job
  };

  size_t slot_;
  uint64_t generation_;
  size_t queue_capacity_;
  ExitCallback on_exit_;
  GelfSender sender_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Job> inbox_;
  bool stopping_ = false;
  bool busy_ = false;

  std::atomic<bool> alive_{true};
  // 计数器由 worker 线程写入，与队列锁分开缓存行
  alignas(GELF_LOG_CACHELINE_SIZE) std::atomic<uint64_t> processed_{0};
  std::atomic<uint64_t> failed_{0};
  std::atomic<uint64_t> lost_{0};

  std::thread thread_;

  void WorkerLoop();
  void Process(const LogEvent& event);
  void Die();
};

}  // namespace gelf_logger

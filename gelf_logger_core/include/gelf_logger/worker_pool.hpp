#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include "config.hpp"
#include "log_event.hpp"
#include "transport/udp_transport.hpp"
#include "worker.hpp"

namespace gelf_logger
{

// Fixed set of config->pool_size workers fed in strict round-robin order.
// A supervisor thread replaces workers that die; Dispatch() also replaces
// a dead worker in the target slot before handing it a job.
class WorkerPool
{
 public:
  // Throws ConfigError when config->pool_size is 0.
  explicit WorkerPool(ConfigPtr config, TransportFactory factory = udp_transport_factory());
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  // 非阻塞：选中下一个 worker 并入队。被丢弃时返回 false
  bool Dispatch(LogEvent event);

  // Broadcasts the new snapshot to every worker. The pool size is fixed
  // at construction and is not changed by a reconfigure. A new
  // queue_capacity applies to live inboxes right away.
  void Reconfigure(ConfigPtr config);

  // Waits until every inbox is empty and no worker is sending.
  bool WaitIdle(std::chrono::milliseconds timeout);

  // Sends what is queued, then stops workers and the supervisor.
  void Stop();

  size_t Size() const;
  size_t AliveCount() const;
  uint64_t ReplacementCount() const { return replacements_.load(std::memory_order_relaxed); }
  uint64_t DroppedCount() const { return dropped_.load(std::memory_order_relaxed); }
  uint64_t FailedCount() const;
  std::vector<uint64_t> ProcessedPerWorker() const;
  ConfigPtr CurrentConfig() const;

 private:
  mutable std::mutex mutex_;
  ConfigPtr config_;
  TransportFactory factory_;
  std::vector<std::unique_ptr<GelfWorker>> workers_;
  size_t cursor_ = 0;
  uint64_t next_generation_ = 0;
  bool stopped_ = false;

  std::atomic<uint64_t> replacements_{0};
  std::atomic<uint64_t> dropped_{0};

  // supervisor: exit notices from workers
  std::mutex exit_mutex_;
  std::condition_variable exit_cv_;
  std::deque<std::pair<size_t, uint64_t>> exits_;
  bool supervisor_stop_ = false;
  std::thread supervisor_;

  std::unique_ptr<GelfWorker> SpawnWorker(size_t slot);
  void ReplaceIfDead(size_t slot);
  void OnWorkerExit(size_t slot, uint64_t generation);
  void SupervisorLoop();
};

}  // namespace gelf_logger

#include "gelf_logger/worker_pool.hpp"
#include "gelf_logger/errors.hpp"

#include <fmt/format.h>

namespace gelf_logger
{

WorkerPool::WorkerPool(ConfigPtr config, TransportFactory factory)
    : config_(std::move(config)), factory_(std::move(factory))
{
  if (!config_ || config_->pool_size == 0)
  {
    throw ConfigError("pool_size must be at least 1");
  }
  if (!factory_)
  {
    throw ConfigError("no transport factory");
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    workers_.reserve(config_->pool_size);
    for (size_t slot = 0; slot < config_->pool_size; ++slot)
    {
      workers_.push_back(SpawnWorker(slot));
    }
  }
  supervisor_ = std::thread(&WorkerPool::SupervisorLoop, this);
}

WorkerPool::~WorkerPool() { Stop(); }

std::unique_ptr<GelfWorker> WorkerPool::SpawnWorker(size_t slot)
{
  return std::make_unique<GelfWorker>(
      slot, next_generation_++, config_, factory_, config_->queue_capacity,
      [this](size_t s, uint64_t generation) { OnWorkerExit(s, generation); });
}

void WorkerPool::ReplaceIfDead(size_t slot)
{
  auto& worker = workers_[slot];
  if (worker->IsAlive())
  {
    return;
  }
  worker->Join();
  worker = SpawnWorker(slot);
  replacements_.fetch_add(1, std::memory_order_relaxed);
}

bool WorkerPool::Dispatch(LogEvent event)
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (stopped_)
  {
    dropped_.fetch_add(1, std::memory_order_relaxed);
    return false;
  }

  size_t slot = cursor_;
  cursor_ = (cursor_ + 1) % workers_.size();

  ReplaceIfDead(slot);
  if (!workers_[slot]->TryPush(std::move(event)))
  {
    dropped_.fetch_add(1, std::memory_order_relaxed);
    return false;
  }
  return true;
}

void WorkerPool::Reconfigure(ConfigPtr config)
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (stopped_ || !config)
  {
    return;
  }
  config_ = std::move(config);
  for (size_t slot = 0; slot < workers_.size(); ++slot)
  {
    ReplaceIfDead(slot);
    workers_[slot]->PushReconfigure(config_);
  }
}

bool WorkerPool::WaitIdle(std::chrono::milliseconds timeout)
{
  auto deadline = std::chrono::steady_clock::now() + timeout;
  for (;;)
  {
    bool idle = true;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (const auto& worker : workers_)
      {
        if (worker->IsAlive() && !worker->IsIdle())
        {
          idle = false;
          break;
        }
      }
    }
    if (idle)
    {
      return true;
    }
    if (std::chrono::steady_clock::now() >= deadline)
    {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
}

void WorkerPool::Stop()
{
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_)
    {
      return;
    }
    stopped_ = true;
  }

  {
    std::lock_guard<std::mutex> lock(exit_mutex_);
    supervisor_stop_ = true;
  }
  exit_cv_.notify_one();
  if (supervisor_.joinable())
  {
    supervisor_.join();
  }

  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& worker : workers_)
  {
    worker->Stop();
  }
}

size_t WorkerPool::Size() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return workers_.size();
}

size_t WorkerPool::AliveCount() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  size_t alive = 0;
  for (const auto& worker : workers_)
  {
    if (worker->IsAlive()) ++alive;
  }
  return alive;
}

uint64_t WorkerPool::FailedCount() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  uint64_t failed = 0;
  for (const auto& worker : workers_)
  {
    failed += worker->Failed();
  }
  return failed;
}

std::vector<uint64_t> WorkerPool::ProcessedPerWorker() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<uint64_t> counts;
  counts.reserve(workers_.size());
  for (const auto& worker : workers_)
  {
    counts.push_back(worker->Processed());
  }
  return counts;
}

ConfigPtr WorkerPool::CurrentConfig() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return config_;
}

// Runs on the dying worker's own thread; must not take mutex_.
void WorkerPool::OnWorkerExit(size_t slot, uint64_t generation)
{
  {
    std::lock_guard<std::mutex> lock(exit_mutex_);
    exits_.emplace_back(slot, generation);
  }
  exit_cv_.notify_one();
}

void WorkerPool::SupervisorLoop()
{
  for (;;)
  {
    std::pair<size_t, uint64_t> notice;
    {
      std::unique_lock<std::mutex> lock(exit_mutex_);
      exit_cv_.wait(lock, [this] { return supervisor_stop_ || !exits_.empty(); });
      if (supervisor_stop_)
      {
        return;
      }
      notice = exits_.front();
      exits_.pop_front();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_)
    {
      return;
    }
    // Dispatch may already have replaced this generation
    if (workers_[notice.first]->Generation() == notice.second)
    {
      ReplaceIfDead(notice.first);
      fmt::print(stderr, "WorkerPool: restarted worker {}\n", notice.first);
    }
  }
}

}  // namespace gelf_logger

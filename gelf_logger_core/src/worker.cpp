#include "gelf_logger/worker.hpp"
#include "gelf_logger/errors.hpp"

#include <fmt/format.h>

#include <exception>

namespace gelf_logger
{

GelfWorker::GelfWorker(size_t slot, uint64_t generation, ConfigPtr config,
                       TransportFactory factory, size_t queue_capacity, ExitCallback on_exit)
    : slot_(slot),
      generation_(generation),
      queue_capacity_(queue_capacity),
      on_exit_(std::move(on_exit)),
      sender_(std::move(config), std::move(factory))
{
  thread_ = std::thread(&GelfWorker::WorkerLoop, this);
}

GelfWorker::~GelfWorker() { Stop(); }

bool GelfWorker::TryPush(LogEvent event)
{
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_ || !IsAlive())
    {
      return false;
    }
    if (queue_capacity_ > 0 && inbox_.size() >= queue_capacity_)
    {
      return false;
    }
    inbox_.push_back(Job{std::move(event), nullptr});
  }
  cv_.notify_one();
  return true;
}

void GelfWorker::PushReconfigure(ConfigPtr config)
{
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_)
    {
      return;
    }
    // 新容量立即生效，已入队的事件不受影响
    queue_capacity_ = config->queue_capacity;
    inbox_.push_back(Job{std::nullopt, std::move(config)});
  }
  cv_.notify_one();
}

void GelfWorker::Stop()
{
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_one();
  Join();
}

void GelfWorker::Join()
{
  if (thread_.joinable())
  {
    thread_.join();
  }
}

bool GelfWorker::IsIdle() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return inbox_.empty() && !busy_;
}

void GelfWorker::WorkerLoop()
{
  for (;;)
  {
    Job job;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] { return stopping_ || !inbox_.empty(); });
      if (inbox_.empty())
      {
        return;
      }
      job = std::move(inbox_.front());
      inbox_.pop_front();
      busy_ = true;
    }

    try
    {
      if (job.config)
      {
        sender_.Reconfigure(std::move(job.config));
      }
      else if (job.event)
      {
        Process(*job.event);
      }
    }
    catch (const TransportError& e)
    {
      fmt::print(stderr, "GelfWorker[{}]: transport failure: {}\n", slot_, e.what());
      Die();
      return;
    }
    catch (const std::exception& e)
    {
      fmt::print(stderr, "GelfWorker[{}]: worker failure: {}\n", slot_, e.what());
      Die();
      return;
    }
    catch (...)
    {
      fmt::print(stderr, "GelfWorker[{}]: unknown failure\n", slot_);
      Die();
      return;
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      busy_ = false;
    }
  }
}

void GelfWorker::Process(const LogEvent& event)
{
  try
  {
    sender_.Send(event);
    processed_.fetch_add(1, std::memory_order_relaxed);
  }
  catch (const TransportError&)
  {
    throw;
  }
  catch (const std::exception& e)
  {
    // encoder, codec or size failure: only this event is lost
    failed_.fetch_add(1, std::memory_order_relaxed);
    fmt::print(stderr, "GelfWorker[{}]: event dropped: {}\n", slot_, e.what());
  }
}

void GelfWorker::Die()
{
  {
    std::lock_guard<std::mutex> lock(mutex_);
    alive_.store(false, std::memory_order_release);
    lost_.fetch_add(1 + inbox_.size(), std::memory_order_relaxed);
    inbox_.clear();
    busy_ = false;
    stopping_ = true;
  }
  if (on_exit_)
  {
    on_exit_(slot_, generation_);
  }
}

}  // namespace gelf_logger

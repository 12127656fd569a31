#include "SyncScheduler.hpp"
#include "JsonFormat.hpp"
#include <algorithm>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <iostream>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace nassync {

struct ScheduledJob {
  std::chrono::milliseconds interval;
  std::chrono::steady_clock::time_point nextFire;
};

struct SyncScheduler::Impl {
  Job job;

  mutable std::mutex mtx;
  std::condition_variable cv;
  std::thread timerThread;
  bool running = false;

  std::optional<ScheduledJob> scheduled;
  // Bumped whenever the job is replaced or removed so a pending wait
  // re-evaluates its deadline.
  uint64_t generation = 0;

  std::vector<std::future<void>> inFlight;

  void fire() {
    std::cout << "[Scheduler] Scheduled sync triggered" << std::endl;
    try {
      job();
    } catch (const std::exception &e) {
      std::cerr << "[Scheduler] Scheduled sync error: " << e.what()
                << std::endl;
    }
  }

  // Caller holds mtx.
  void reapFinished() {
    inFlight.erase(std::remove_if(inFlight.begin(), inFlight.end(),
                                  [](std::future<void> &f) {
                                    return f.wait_for(std::chrono::seconds(
                                               0)) == std::future_status::ready;
                                  }),
                   inFlight.end());
  }

  void timerLoop() {
    std::unique_lock<std::mutex> lock(mtx);
    while (running) {
      if (!scheduled) {
        cv.wait(lock, [this] { return !running || scheduled.has_value(); });
        continue;
      }

      uint64_t gen = generation;
      auto due = scheduled->nextFire;
      bool interrupted = cv.wait_until(
          lock, due, [this, gen] { return !running || generation != gen; });
      if (interrupted)
        continue;

      auto now = std::chrono::steady_clock::now();
      scheduled->nextFire += scheduled->interval;
      if (scheduled->nextFire <= now)
        scheduled->nextFire = now + scheduled->interval;

      reapFinished();
      inFlight.push_back(
          std::async(std::launch::async, [this] { fire(); }));
    }
  }
};

SyncScheduler::SyncScheduler(DatabaseManager &dbManager, SyncEngine &engine)
    : SyncScheduler(dbManager, [&engine] {
        auto result = engine.runAll();
        std::cout << "[Scheduler] Scheduled sync result: "
                  << toString(result.status)
                  << (result.reason ? " (" + *result.reason + ")" : "")
                  << std::endl;
      }) {}

SyncScheduler::SyncScheduler(DatabaseManager &dbManager, Job job)
    : m_impl(std::make_unique<Impl>()), m_dbManager(dbManager) {
  m_impl->job = std::move(job);
}

SyncScheduler::~SyncScheduler() { stop(); }

void SyncScheduler::start() {
  std::lock_guard<std::mutex> lock(m_impl->mtx);
  if (m_impl->running)
    return;
  m_impl->running = true;
  m_impl->timerThread = std::thread(&Impl::timerLoop, m_impl.get());
  std::cout << "[Scheduler] Scheduler started" << std::endl;
}

void SyncScheduler::stop() {
  {
    std::lock_guard<std::mutex> lock(m_impl->mtx);
    if (!m_impl->running)
      return;
    m_impl->running = false;
  }
  m_impl->cv.notify_all();
  if (m_impl->timerThread.joinable())
    m_impl->timerThread.join();

  // Runs already fired proceed to completion.
  std::vector<std::future<void>> pending;
  {
    std::lock_guard<std::mutex> lock(m_impl->mtx);
    pending.swap(m_impl->inFlight);
  }
  for (auto &f : pending)
    f.wait();
  std::cout << "[Scheduler] Scheduler stopped" << std::endl;
}

void SyncScheduler::configure() {
  auto cfg = m_dbManager.getSchedulerConfig();
  if (cfg.enabled) {
    int minutes = std::max(1, cfg.interval_minutes);
    schedule(std::chrono::minutes(minutes));
    std::cout << "[Scheduler] Scheduler enabled: running every " << minutes
              << " minutes" << std::endl;
  } else {
    unschedule();
    std::cout << "[Scheduler] Scheduler disabled" << std::endl;
  }
}

void SyncScheduler::schedule(std::chrono::milliseconds interval) {
  if (interval <= std::chrono::milliseconds::zero())
    interval = std::chrono::milliseconds(1);
  {
    std::lock_guard<std::mutex> lock(m_impl->mtx);
    m_impl->scheduled =
        ScheduledJob{interval, std::chrono::steady_clock::now() + interval};
    ++m_impl->generation;
  }
  m_impl->cv.notify_all();
}

void SyncScheduler::unschedule() {
  {
    std::lock_guard<std::mutex> lock(m_impl->mtx);
    m_impl->scheduled.reset();
    ++m_impl->generation;
  }
  m_impl->cv.notify_all();
}

SchedulerStatus SyncScheduler::status() const {
  std::lock_guard<std::mutex> lock(m_impl->mtx);
  SchedulerStatus status;
  status.running = m_impl->running;
  status.jobActive = m_impl->scheduled.has_value();
  // Without the timer thread nothing fires, so there is no next run.
  if (m_impl->running && m_impl->scheduled) {
    auto remaining =
        m_impl->scheduled->nextFire - std::chrono::steady_clock::now();
    status.nextRunTime =
        std::chrono::system_clock::now() +
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            remaining);
  }
  return status;
}

} // namespace nassync

#pragma once
#include "DatabaseManager.hpp"
#include "SyncEngine.hpp"
#include "types.hpp"
#include <chrono>
#include <functional>
#include <memory>

namespace nassync {

/**
 * SyncScheduler owns one recurring job ("nas_sync_job") and a timer thread
 * that fires it. Each firing runs on its own worker so a long transfer never
 * delays the next tick; that tick simply finds the engine busy.
 */
class SyncScheduler {
public:
  using Job = std::function<void()>;

  static constexpr const char *kJobId = "nas_sync_job";

  SyncScheduler(DatabaseManager &dbManager, SyncEngine &engine);
  SyncScheduler(DatabaseManager &dbManager, Job job);
  ~SyncScheduler();

  SyncScheduler(const SyncScheduler &) = delete;
  SyncScheduler &operator=(const SyncScheduler &) = delete;

  void start();
  void stop();

  // Re-reads the scheduler setting and installs or removes the job.
  void configure();

  // Installs the job with the given period, replacing any existing one.
  void schedule(std::chrono::milliseconds interval);
  void unschedule();

  SchedulerStatus status() const;

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
  DatabaseManager &m_dbManager;
};

} // namespace nassync

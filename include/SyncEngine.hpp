#pragma once
#include "DatabaseManager.hpp"
#include "NasProbe.hpp"
#include "PostSyncActionRunner.hpp"
#include "RsyncRunner.hpp"
#include "types.hpp"
#include <atomic>
#include <future>
#include <mutex>
#include <optional>

namespace nassync {

/**
 * SyncEngine runs folder mappings against the NAS, one at a time, and never
 * more than one run at once: a request arriving while a run is in flight is
 * answered immediately with "already running".
 */
class SyncEngine {
public:
  SyncEngine(DatabaseManager &dbManager, NasProbe &probe, RsyncRunner &rsync,
             PostSyncActionRunner &actions);
  ~SyncEngine();

  SyncEngine(const SyncEngine &) = delete;
  SyncEngine &operator=(const SyncEngine &) = delete;

  RunAllResult runAll();
  RunOneResult runOne(int mappingId);

  // Same as above on a dedicated thread.
  std::future<RunAllResult> runAllAsync();
  std::future<RunOneResult> runOneAsync(int mappingId);

  SyncStatus getSyncStatus() const;

  static constexpr const char *kAlreadyRunning = "Sync already running";

private:
  // Holds the single-flight flag for the lifetime of one run.
  class RunGuard {
  public:
    explicit RunGuard(std::atomic<bool> &flag);
    ~RunGuard();
    RunGuard(const RunGuard &) = delete;
    RunGuard &operator=(const RunGuard &) = delete;
    bool acquired() const { return m_acquired; }

  private:
    std::atomic<bool> &m_flag;
    bool m_acquired = false;
  };

  bool syncMapping(const FolderMapping &mapping, const NasConfig &nas);
  void runPostSyncActions();
  void setCurrentMapping(std::optional<int> mappingId);

  DatabaseManager &m_dbManager;
  NasProbe &m_probe;
  RsyncRunner &m_rsync;
  PostSyncActionRunner &m_actions;

  std::atomic<bool> m_running{false};
  mutable std::mutex m_statusMutex;
  std::optional<int> m_currentMappingId;
};

} // namespace nassync

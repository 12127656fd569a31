#include "SyncEngine.hpp"
#include "TimeUtils.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>

namespace nassync {

SyncEngine::RunGuard::RunGuard(std::atomic<bool> &flag) : m_flag(flag) {
  bool expected = false;
  m_acquired = m_flag.compare_exchange_strong(expected, true);
}

SyncEngine::RunGuard::~RunGuard() {
  if (m_acquired)
    m_flag.store(false);
}

SyncEngine::SyncEngine(DatabaseManager &dbManager, NasProbe &probe,
                       RsyncRunner &rsync, PostSyncActionRunner &actions)
    : m_dbManager(dbManager), m_probe(probe), m_rsync(rsync),
      m_actions(actions) {}

SyncEngine::~SyncEngine() = default;

void SyncEngine::setCurrentMapping(std::optional<int> mappingId) {
  std::lock_guard<std::mutex> lock(m_statusMutex);
  m_currentMappingId = mappingId;
}

SyncStatus SyncEngine::getSyncStatus() const {
  SyncStatus status;
  status.inProgress = m_running.load();
  std::lock_guard<std::mutex> lock(m_statusMutex);
  status.currentMappingId = m_currentMappingId;
  return status;
}

bool SyncEngine::syncMapping(const FolderMapping &mapping,
                             const NasConfig &nas) {
  setCurrentMapping(mapping.id);
  std::string startedAt = TimeUtils::nowIso();
  auto start = std::chrono::steady_clock::now();

  std::cout << "[Sync] Starting sync for mapping '" << mapping.name
            << "': " << mapping.source_path << " -> "
            << mapping.destination_path << std::endl;

  TransferResult result;
  try {
    result = m_rsync.transfer(mapping, nas);
  } catch (const std::exception &e) {
    std::cerr << "[Sync] Error syncing mapping " << mapping.id << ": "
              << e.what() << std::endl;
    result.success = false;
    result.message = e.what();
    result.stats = TransferStats{};
  }

  std::chrono::duration<double> duration =
      std::chrono::steady_clock::now() - start;
  std::string status = result.success ? "success" : "error";

  try {
    m_dbManager.updateMappingSyncStatus(mapping.id, status, result.message);
  } catch (const std::exception &e) {
    std::cerr << "[Sync] Failed to update last run of mapping " << mapping.id
              << ": " << e.what() << std::endl;
  }
  try {
    m_dbManager.createSyncLog(mapping.id, status, result.message,
                              result.stats.filesTransferred,
                              result.stats.bytesTransferred, duration.count(),
                              startedAt);
  } catch (const std::exception &e) {
    std::cerr << "[Sync] Failed to write sync log for mapping " << mapping.id
              << ": " << e.what() << std::endl;
  }

  std::cout << "[Sync] Mapping '" << mapping.name << "' finished: " << status
            << " (" << result.stats.filesTransferred << " files, "
            << result.stats.bytesTransferred << " bytes, " << duration.count()
            << "s)" << std::endl;

  setCurrentMapping(std::nullopt);
  return result.success;
}

void SyncEngine::runPostSyncActions() {
  try {
    m_actions.runAll();
  } catch (const std::exception &e) {
    std::cerr << "[Sync] Post-sync actions failed: " << e.what() << std::endl;
  }
}

RunAllResult SyncEngine::runAll() {
  RunAllResult results;

  RunGuard guard(m_running);
  if (!guard.acquired()) {
    std::cout << "[Sync] Sync already in progress, skipping" << std::endl;
    results.status = RunStatus::Skipped;
    results.reason = kAlreadyRunning;
    return results;
  }

  auto nas = m_dbManager.getNasConfig();
  if (!nas) {
    std::cerr << "[Sync] No NAS configuration found" << std::endl;
    results.status = RunStatus::Error;
    results.reason = "No NAS configuration";
    return results;
  }

  if (!m_probe.isReachable(nas->hostname)) {
    std::cout << "[Sync] NAS " << nas->hostname
              << " is offline, skipping sync" << std::endl;
    results.status = RunStatus::Skipped;
    results.reason = "NAS is offline";
    return results;
  }

  auto mappings = m_dbManager.getFolderMappings();
  mappings.erase(std::remove_if(mappings.begin(), mappings.end(),
                                [](const FolderMapping &m) {
                                  return !m.enabled;
                                }),
                 mappings.end());
  if (mappings.empty()) {
    std::cout << "[Sync] No enabled mappings to sync" << std::endl;
    results.status = RunStatus::Skipped;
    results.reason = "No enabled mappings";
    return results;
  }

  results.status = RunStatus::Completed;
  for (const auto &mapping : mappings) {
    bool success = syncMapping(mapping, *nas);
    results.mappings.push_back({mapping.id, mapping.name, success});
    if (success)
      results.anySynced = true;
  }

  if (results.anySynced)
    runPostSyncActions();

  return results;
}

RunOneResult SyncEngine::runOne(int mappingId) {
  RunOneResult result;
  result.status = RunStatus::Error;

  RunGuard guard(m_running);
  if (!guard.acquired()) {
    result.reason = kAlreadyRunning;
    return result;
  }

  auto nas = m_dbManager.getNasConfig();
  if (!nas) {
    result.reason = "No NAS configuration";
    return result;
  }

  if (!m_probe.isReachable(nas->hostname)) {
    result.reason = "NAS is offline";
    return result;
  }

  auto mapping = m_dbManager.getFolderMapping(mappingId);
  if (!mapping) {
    result.reason = "Mapping not found";
    return result;
  }

  bool success = syncMapping(*mapping, *nas);
  if (success)
    runPostSyncActions();

  result.status = success ? RunStatus::Completed : RunStatus::Error;
  result.mapping = mapping->name;
  result.success = success;
  return result;
}

std::future<RunAllResult> SyncEngine::runAllAsync() {
  return std::async(std::launch::async, [this] { return runAll(); });
}

std::future<RunOneResult> SyncEngine::runOneAsync(int mappingId) {
  return std::async(std::launch::async,
                    [this, mappingId] { return runOne(mappingId); });
}

} // namespace nassync

#pragma once
#include "types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace nassync {

class DatabaseManager {
public:
  explicit DatabaseManager(const std::string &dbPath);
  ~DatabaseManager();

  // Connection management
  bool open();
  void initializeSchema();

  // NAS endpoint (singleton row)
  std::optional<NasConfig> getNasConfig();
  void saveNasConfig(const std::string &hostname, const std::string &sshUser,
                     const std::string &sshKeyPath = "/config/id_rsa",
                     int sshPort = 22);

  // Folder mappings, ordered by name
  std::vector<FolderMapping> getFolderMappings();
  std::optional<FolderMapping> getFolderMapping(int mappingId);
  int createFolderMapping(const std::string &name,
                          const std::string &sourcePath,
                          const std::string &destinationPath,
                          bool deleteSource = false);
  bool updateFolderMapping(int mappingId, const std::string &name,
                           const std::string &sourcePath,
                           const std::string &destinationPath, bool enabled,
                           bool deleteSource);
  bool deleteFolderMapping(int mappingId);
  void updateMappingSyncStatus(int mappingId, const std::string &status,
                               const std::string &message);

  // Sync logs, append-only
  int createSyncLog(int mappingId, const std::string &status,
                    const std::string &message, int64_t filesTransferred,
                    int64_t bytesTransferred, double durationSeconds,
                    const std::string &startedAt);
  std::vector<SyncLogEntry> getRecentSyncLogs(int limit = 50);
  std::vector<SyncLogEntry> getMappingSyncLogs(int mappingId, int limit = 20);

  // Scheduler setting, defaults to {enabled, 15 minutes} when unset
  SchedulerConfig getSchedulerConfig();
  void saveSchedulerConfig(bool enabled, int intervalMinutes);

  // Post-sync actions, ordered by name
  std::vector<PostSyncActionRecord> getPostSyncActions();
  int createPostSyncAction(const std::string &name,
                           const std::string &actionType,
                           const std::string &configJson);
  bool updatePostSyncAction(int actionId, const std::string &name,
                            const std::string &actionType,
                            const std::string &configJson, bool enabled);
  bool deletePostSyncAction(int actionId);

private:
  std::string m_dbPath;
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace nassync

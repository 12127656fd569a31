#include "DatabaseManager.hpp"
#include "TimeUtils.hpp"
#include <iostream>
#include <mutex>
#include <sqlite3.h>
#include <sqlite_orm/sqlite_orm.h>

using namespace sqlite_orm;

namespace nassync {

// We define a helper function to create the storage.
// This helps us deduce the complex template type of the storage.
inline auto create_storage_impl(const std::string &path) {
  return make_storage(
      path,
      make_table<NasConfig>(
          "nas_config", make_column("id", &NasConfig::id, primary_key()),
          make_column("hostname", &NasConfig::hostname),
          make_column("ssh_user", &NasConfig::ssh_user),
          make_column("ssh_key_path", &NasConfig::ssh_key_path),
          make_column("ssh_port", &NasConfig::ssh_port),
          make_column("created_at", &NasConfig::created_at),
          make_column("updated_at", &NasConfig::updated_at)),
      make_table<FolderMapping>(
          "folder_mappings",
          make_column("id", &FolderMapping::id, primary_key().autoincrement()),
          make_column("name", &FolderMapping::name),
          make_column("source_path", &FolderMapping::source_path),
          make_column("destination_path", &FolderMapping::destination_path),
          make_column("enabled", &FolderMapping::enabled),
          make_column("delete_source", &FolderMapping::delete_source),
          make_column("last_sync_at", &FolderMapping::last_sync_at),
          make_column("last_sync_status", &FolderMapping::last_sync_status),
          make_column("last_sync_message", &FolderMapping::last_sync_message),
          make_column("created_at", &FolderMapping::created_at)),
      make_table<SyncLogEntry>(
          "sync_logs",
          make_column("id", &SyncLogEntry::id, primary_key().autoincrement()),
          make_column("mapping_id", &SyncLogEntry::mapping_id),
          make_column("status", &SyncLogEntry::status),
          make_column("message", &SyncLogEntry::message),
          make_column("files_transferred", &SyncLogEntry::files_transferred),
          make_column("bytes_transferred", &SyncLogEntry::bytes_transferred),
          make_column("duration_seconds", &SyncLogEntry::duration_seconds),
          make_column("started_at", &SyncLogEntry::started_at),
          make_column("completed_at", &SyncLogEntry::completed_at)),
      make_table<SchedulerConfig>(
          "scheduler_config",
          make_column("id", &SchedulerConfig::id, primary_key()),
          make_column("enabled", &SchedulerConfig::enabled),
          make_column("interval_minutes", &SchedulerConfig::interval_minutes),
          make_column("updated_at", &SchedulerConfig::updated_at)),
      make_table<PostSyncActionRecord>(
          "post_sync_actions",
          make_column("id", &PostSyncActionRecord::id,
                      primary_key().autoincrement()),
          make_column("name", &PostSyncActionRecord::name),
          make_column("action_type", &PostSyncActionRecord::action_type),
          make_column("config", &PostSyncActionRecord::config),
          make_column("enabled", &PostSyncActionRecord::enabled),
          make_column("created_at", &PostSyncActionRecord::created_at)));
}

// Typedef for easier access within the Impl
using Storage = decltype(create_storage_impl(""));

struct DatabaseManager::Impl {
  Storage storage;
  std::mutex mtx;
  Impl(const std::string &path) : storage(create_storage_impl(path)) {}
};

DatabaseManager::DatabaseManager(const std::string &dbPath)
    : m_dbPath(dbPath), m_impl(std::make_unique<Impl>(dbPath)) {}

DatabaseManager::~DatabaseManager() = default;

bool DatabaseManager::open() {
  std::lock_guard<std::mutex> lock(m_impl->mtx);
  try {
    m_impl->storage.open_forever();
    std::cout << "[DB] Database connection verified: " << m_dbPath << std::endl;
    return true;
  } catch (const std::exception &e) {
    std::cerr << "[DB] Failed to open " << m_dbPath << ": " << e.what()
              << std::endl;
    return false;
  }
}

void DatabaseManager::initializeSchema() {
  std::lock_guard<std::mutex> lock(m_impl->mtx);
  std::cout << "[DB] Synchronizing schema via sqlite_orm..." << std::endl;
  m_impl->storage.sync_schema(true);

  // Seed the scheduler row so the first configure() finds a setting.
  if (!m_impl->storage.get_optional<SchedulerConfig>(1)) {
    SchedulerConfig defaults;
    defaults.updated_at = TimeUtils::nowIso();
    m_impl->storage.replace(defaults);
  }
  std::cout << "[DB] Schema synchronized successfully." << std::endl;
}

// NAS endpoint
std::optional<NasConfig> DatabaseManager::getNasConfig() {
  std::lock_guard<std::mutex> lock(m_impl->mtx);
  return m_impl->storage.get_optional<NasConfig>(1);
}

void DatabaseManager::saveNasConfig(const std::string &hostname,
                                    const std::string &sshUser,
                                    const std::string &sshKeyPath,
                                    int sshPort) {
  std::lock_guard<std::mutex> lock(m_impl->mtx);
  auto now = TimeUtils::nowIso();
  NasConfig cfg;
  if (auto existing = m_impl->storage.get_optional<NasConfig>(1)) {
    cfg = *existing;
  } else {
    cfg.created_at = now;
  }
  cfg.id = 1;
  cfg.hostname = hostname;
  cfg.ssh_user = sshUser;
  cfg.ssh_key_path = sshKeyPath;
  cfg.ssh_port = sshPort;
  cfg.updated_at = now;
  m_impl->storage.replace(cfg);
}

// Folder mappings
std::vector<FolderMapping> DatabaseManager::getFolderMappings() {
  std::lock_guard<std::mutex> lock(m_impl->mtx);
  return m_impl->storage.get_all<FolderMapping>(
      order_by(&FolderMapping::name));
}

std::optional<FolderMapping> DatabaseManager::getFolderMapping(int mappingId) {
  std::lock_guard<std::mutex> lock(m_impl->mtx);
  return m_impl->storage.get_optional<FolderMapping>(mappingId);
}

int DatabaseManager::createFolderMapping(const std::string &name,
                                         const std::string &sourcePath,
                                         const std::string &destinationPath,
                                         bool deleteSource) {
  std::lock_guard<std::mutex> lock(m_impl->mtx);
  FolderMapping m;
  m.name = name;
  m.source_path = sourcePath;
  m.destination_path = destinationPath;
  m.delete_source = deleteSource;
  m.created_at = TimeUtils::nowIso();
  return static_cast<int>(m_impl->storage.insert(m));
}

bool DatabaseManager::updateFolderMapping(int mappingId,
                                          const std::string &name,
                                          const std::string &sourcePath,
                                          const std::string &destinationPath,
                                          bool enabled, bool deleteSource) {
  std::lock_guard<std::mutex> lock(m_impl->mtx);
  auto m = m_impl->storage.get_optional<FolderMapping>(mappingId);
  if (!m)
    return false;
  m->name = name;
  m->source_path = sourcePath;
  m->destination_path = destinationPath;
  m->enabled = enabled;
  m->delete_source = deleteSource;
  m_impl->storage.update(*m);
  return true;
}

bool DatabaseManager::deleteFolderMapping(int mappingId) {
  std::lock_guard<std::mutex> lock(m_impl->mtx);
  try {
    // Sync logs are kept as history of the removed mapping.
    m_impl->storage.remove<FolderMapping>(mappingId);
    return true;
  } catch (const std::exception &e) {
    std::cerr << "[DB] deleteFolderMapping Error: " << e.what() << std::endl;
    return false;
  }
}

void DatabaseManager::updateMappingSyncStatus(int mappingId,
                                              const std::string &status,
                                              const std::string &message) {
  std::lock_guard<std::mutex> lock(m_impl->mtx);
  auto m = m_impl->storage.get_optional<FolderMapping>(mappingId);
  if (!m) {
    std::cerr << "[DB] updateMappingSyncStatus: no mapping " << mappingId
              << std::endl;
    return;
  }
  m->last_sync_at = TimeUtils::nowIso();
  m->last_sync_status = status;
  m->last_sync_message = message;
  m_impl->storage.update(*m);
}

// Sync logs
int DatabaseManager::createSyncLog(int mappingId, const std::string &status,
                                   const std::string &message,
                                   int64_t filesTransferred,
                                   int64_t bytesTransferred,
                                   double durationSeconds,
                                   const std::string &startedAt) {
  std::lock_guard<std::mutex> lock(m_impl->mtx);
  SyncLogEntry entry;
  entry.mapping_id = mappingId;
  entry.status = status;
  entry.message = message;
  entry.files_transferred = filesTransferred;
  entry.bytes_transferred = bytesTransferred;
  entry.duration_seconds = durationSeconds;
  entry.started_at = startedAt;
  entry.completed_at = TimeUtils::nowIso();
  return static_cast<int>(m_impl->storage.insert(entry));
}

std::vector<SyncLogEntry> DatabaseManager::getRecentSyncLogs(int limit) {
  std::lock_guard<std::mutex> lock(m_impl->mtx);
  return m_impl->storage.get_all<SyncLogEntry>(
      order_by(&SyncLogEntry::id).desc(), sqlite_orm::limit(limit));
}

std::vector<SyncLogEntry> DatabaseManager::getMappingSyncLogs(int mappingId,
                                                              int limit) {
  std::lock_guard<std::mutex> lock(m_impl->mtx);
  return m_impl->storage.get_all<SyncLogEntry>(
      where(c(&SyncLogEntry::mapping_id) == mappingId),
      order_by(&SyncLogEntry::id).desc(), sqlite_orm::limit(limit));
}

// Scheduler setting
SchedulerConfig DatabaseManager::getSchedulerConfig() {
  std::lock_guard<std::mutex> lock(m_impl->mtx);
  if (auto cfg = m_impl->storage.get_optional<SchedulerConfig>(1))
    return *cfg;
  return SchedulerConfig{};
}

void DatabaseManager::saveSchedulerConfig(bool enabled, int intervalMinutes) {
  std::lock_guard<std::mutex> lock(m_impl->mtx);
  SchedulerConfig cfg;
  cfg.id = 1;
  cfg.enabled = enabled;
  cfg.interval_minutes = intervalMinutes;
  cfg.updated_at = TimeUtils::nowIso();
  m_impl->storage.replace(cfg);
}

// Post-sync actions
std::vector<PostSyncActionRecord> DatabaseManager::getPostSyncActions() {
  std::lock_guard<std::mutex> lock(m_impl->mtx);
  return m_impl->storage.get_all<PostSyncActionRecord>(
      order_by(&PostSyncActionRecord::name));
}

int DatabaseManager::createPostSyncAction(const std::string &name,
                                          const std::string &actionType,
                                          const std::string &configJson) {
  std::lock_guard<std::mutex> lock(m_impl->mtx);
  PostSyncActionRecord a;
  a.name = name;
  a.action_type = actionType;
  a.config = configJson;
  a.created_at = TimeUtils::nowIso();
  return static_cast<int>(m_impl->storage.insert(a));
}

bool DatabaseManager::updatePostSyncAction(int actionId,
                                           const std::string &name,
                                           const std::string &actionType,
                                           const std::string &configJson,
                                           bool enabled) {
  std::lock_guard<std::mutex> lock(m_impl->mtx);
  auto a = m_impl->storage.get_optional<PostSyncActionRecord>(actionId);
  if (!a)
    return false;
  a->name = name;
  a->action_type = actionType;
  a->config = configJson;
  a->enabled = enabled;
  m_impl->storage.update(*a);
  return true;
}

bool DatabaseManager::deletePostSyncAction(int actionId) {
  std::lock_guard<std::mutex> lock(m_impl->mtx);
  try {
    m_impl->storage.remove<PostSyncActionRecord>(actionId);
    return true;
  } catch (const std::exception &e) {
    std::cerr << "[DB] deletePostSyncAction Error: " << e.what() << std::endl;
    return false;
  }
}

} // namespace nassync

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace nassync {

struct NasConfig {
  int id = 1;
  std::string hostname;
  std::string ssh_user;
  std::string ssh_key_path = "/config/id_rsa";
  int ssh_port = 22;
  std::string created_at; // Store as string for SQLite compatibility
  std::string updated_at;
};

struct FolderMapping {
  int id = 0;
  std::string name;
  std::string source_path;
  std::string destination_path;
  bool enabled = true;
  bool delete_source = false;
  std::optional<std::string> last_sync_at;
  std::optional<std::string> last_sync_status;
  std::optional<std::string> last_sync_message;
  std::string created_at;
};

struct SyncLogEntry {
  int id = 0;
  int mapping_id = 0;
  std::string status;
  std::string message;
  int64_t files_transferred = 0;
  int64_t bytes_transferred = 0;
  double duration_seconds = 0.0;
  std::string started_at;
  std::string completed_at;
};

struct SchedulerConfig {
  int id = 1;
  bool enabled = true;
  int interval_minutes = 15;
  std::string updated_at;
};

// Row as stored; config is a JSON object serialized to text.
struct PostSyncActionRecord {
  int id = 0;
  std::string name;
  std::string action_type;
  std::string config;
  bool enabled = true;
  std::string created_at;
};

enum class ActionKind { LibraryRefresh, Webhook };

struct LibraryRefreshConfig {
  std::string baseUrl;
  std::string token;
  std::string librarySection = "1";
};

struct WebhookConfig {
  std::string url;
  std::string method = "POST";
};

struct PostSyncAction {
  int id = 0;
  std::string name;
  bool enabled = true;
  std::variant<LibraryRefreshConfig, WebhookConfig> config;

  ActionKind kind() const {
    return std::holds_alternative<WebhookConfig>(config)
               ? ActionKind::Webhook
               : ActionKind::LibraryRefresh;
  }
};

struct TransferStats {
  int64_t filesTransferred = 0;
  int64_t bytesTransferred = 0;
};

struct TransferResult {
  bool success = false;
  std::string message;
  TransferStats stats;
};

struct ConnectionTestResult {
  bool success = false;
  std::string message;
};

enum class RunStatus { Completed, Skipped, Error };

struct MappingOutcome {
  int id = 0;
  std::string name;
  bool success = false;
};

struct RunAllResult {
  RunStatus status = RunStatus::Completed;
  std::optional<std::string> reason;
  std::vector<MappingOutcome> mappings;
  bool anySynced = false;
};

struct RunOneResult {
  RunStatus status = RunStatus::Error;
  std::optional<std::string> mapping;
  std::optional<bool> success;
  std::optional<std::string> reason;
};

struct SyncStatus {
  bool inProgress = false;
  std::optional<int> currentMappingId;
};

struct SchedulerStatus {
  bool running = false;
  bool jobActive = false;
  std::optional<std::chrono::system_clock::time_point> nextRunTime;
};

} // namespace nassync

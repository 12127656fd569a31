#include "JsonFormat.hpp"
#include "TimeUtils.hpp"

using json = nlohmann::json;

namespace nassync {

namespace {

template <typename T>
json optionalValue(const std::optional<T> &value) {
  return value ? json(*value) : json(nullptr);
}

} // namespace

const char *toString(RunStatus status) {
  switch (status) {
  case RunStatus::Completed:
    return "completed";
  case RunStatus::Skipped:
    return "skipped";
  case RunStatus::Error:
    return "error";
  }
  return "unknown";
}

void to_json(json &j, const NasConfig &cfg) {
  j = json{{"hostname", cfg.hostname},
           {"ssh_user", cfg.ssh_user},
           {"ssh_key_path", cfg.ssh_key_path},
           {"ssh_port", cfg.ssh_port},
           {"updated_at", cfg.updated_at}};
}

void to_json(json &j, const FolderMapping &m) {
  j = json{{"id", m.id},
           {"name", m.name},
           {"source_path", m.source_path},
           {"destination_path", m.destination_path},
           {"enabled", m.enabled},
           {"delete_source", m.delete_source},
           {"last_sync_at", optionalValue(m.last_sync_at)},
           {"last_sync_status", optionalValue(m.last_sync_status)},
           {"last_sync_message", optionalValue(m.last_sync_message)}};
}

void to_json(json &j, const SyncLogEntry &entry) {
  j = json{{"id", entry.id},
           {"mapping_id", entry.mapping_id},
           {"status", entry.status},
           {"message", entry.message},
           {"files_transferred", entry.files_transferred},
           {"bytes_transferred", entry.bytes_transferred},
           {"duration_seconds", entry.duration_seconds},
           {"started_at", entry.started_at},
           {"completed_at", entry.completed_at}};
}

void to_json(json &j, const SchedulerConfig &cfg) {
  j = json{{"enabled", cfg.enabled},
           {"interval_minutes", cfg.interval_minutes}};
}

void to_json(json &j, const MappingOutcome &outcome) {
  j = json{{"id", outcome.id},
           {"name", outcome.name},
           {"success", outcome.success}};
}

void to_json(json &j, const RunAllResult &result) {
  j = json{{"status", toString(result.status)}};
  if (result.reason)
    j["reason"] = *result.reason;
  if (result.status == RunStatus::Completed) {
    j["mappings"] = result.mappings;
    j["any_synced"] = result.anySynced;
  }
}

void to_json(json &j, const RunOneResult &result) {
  j = json{{"status", toString(result.status)}};
  if (result.reason)
    j["reason"] = *result.reason;
  if (result.mapping)
    j["mapping"] = *result.mapping;
  if (result.success)
    j["success"] = *result.success;
}

void to_json(json &j, const SyncStatus &status) {
  j = json{{"in_progress", status.inProgress},
           {"current_mapping", optionalValue(status.currentMappingId)}};
}

void to_json(json &j, const SchedulerStatus &status) {
  j = json{{"running", status.running}, {"job_active", status.jobActive}};
  j["next_run"] = status.nextRunTime
                      ? json(TimeUtils::toIsoString(*status.nextRunTime))
                      : json(nullptr);
}

void to_json(json &j, const ConnectionTestResult &result) {
  j = json{{"success", result.success}, {"message", result.message}};
}

} // namespace nassync

#pragma once
#include "types.hpp"
#include <nlohmann/json.hpp>

namespace nassync {

const char *toString(RunStatus status);

void to_json(nlohmann::json &j, const NasConfig &cfg);
void to_json(nlohmann::json &j, const FolderMapping &m);
void to_json(nlohmann::json &j, const SyncLogEntry &entry);
void to_json(nlohmann::json &j, const SchedulerConfig &cfg);
void to_json(nlohmann::json &j, const MappingOutcome &outcome);
void to_json(nlohmann::json &j, const RunAllResult &result);
void to_json(nlohmann::json &j, const RunOneResult &result);
void to_json(nlohmann::json &j, const SyncStatus &status);
void to_json(nlohmann::json &j, const SchedulerStatus &status);
void to_json(nlohmann::json &j, const ConnectionTestResult &result);

} // namespace nassync

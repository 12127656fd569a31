#pragma once

#include "DatabaseManager.hpp"
#include "types.hpp"
#include <cstddef>
#include <optional>
#include <string>

namespace nassync {

/**
 * PostSyncActionRunner fires the configured side effects after a run that
 * moved data: a Plex-style library refresh or a plain webhook.
 * Uses cpp-httplib for networking and nlohmann/json for the stored config.
 */
class PostSyncActionRunner {
public:
  explicit PostSyncActionRunner(DatabaseManager &dbManager);

  // Runs every enabled action; one failing action never stops the rest.
  // Returns how many actions ran without a fault.
  std::size_t runAll();

  // Throws on transport failure.
  void execute(const PostSyncAction &action);

  // Maps a stored row onto the closed set of action kinds. Unknown kinds
  // yield nullopt; malformed JSON throws nlohmann::json::exception.
  static std::optional<PostSyncAction>
  parseAction(const PostSyncActionRecord &record);

  struct UrlParts {
    std::string base; // scheme://host[:port]
    std::string path; // path plus query, at least "/"
  };
  static UrlParts splitUrl(const std::string &url);

private:
  DatabaseManager &m_dbManager;

  void refreshLibrary(const LibraryRefreshConfig &cfg);
  void callWebhook(const WebhookConfig &cfg);
};

} // namespace nassync

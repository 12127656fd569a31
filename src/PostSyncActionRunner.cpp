#include "PostSyncActionRunner.hpp"
#include "StringUtils.hpp"
#include "httplib.h"
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace nassync {

namespace {

constexpr time_t kHttpTimeoutSeconds = 10;

// Helper for URL encoding
std::string urlEncode(const std::string &value) {
  std::ostringstream escaped;
  escaped.fill('0');
  escaped << std::hex;

  for (auto i = value.begin(), n = value.end(); i != n; ++i) {
    std::string::value_type c = (*i);
    // Keep alphanumeric and other safe characters
    if (isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' ||
        c == '.' || c == '~') {
      escaped << c;
      continue;
    }
    // Any other characters are percent-encoded
    escaped << std::uppercase;
    escaped << '%' << std::setw(2) << int((unsigned char)c);
    escaped << std::nouppercase;
  }

  return escaped.str();
}

std::string stringField(const json &cfg, const char *key,
                        const std::string &fallback = "") {
  auto it = cfg.find(key);
  if (it == cfg.end() || it->is_null())
    return fallback;
  if (it->is_string())
    return it->get<std::string>();
  // Numbers such as library_section: 2 are accepted as their text.
  return it->dump();
}

httplib::Result sendRequest(const std::string &method, const std::string &url) {
  auto parts = PostSyncActionRunner::splitUrl(url);
  httplib::Client client(parts.base);
  client.set_connection_timeout(kHttpTimeoutSeconds, 0);
  client.set_read_timeout(kHttpTimeoutSeconds, 0);
  client.set_write_timeout(kHttpTimeoutSeconds, 0);
  client.set_follow_location(true);

  auto res = method == "GET" ? client.Get(parts.path) : client.Post(parts.path);
  if (!res) {
    throw std::runtime_error(method + " " + url +
                             " failed: " + httplib::to_string(res.error()));
  }
  return res;
}

} // namespace

PostSyncActionRunner::PostSyncActionRunner(DatabaseManager &dbManager)
    : m_dbManager(dbManager) {}

PostSyncActionRunner::UrlParts
PostSyncActionRunner::splitUrl(const std::string &url) {
  std::string rest = url;
  std::string scheme = "http";
  auto schemeEnd = rest.find("://");
  if (schemeEnd != std::string::npos) {
    scheme = rest.substr(0, schemeEnd);
    rest = rest.substr(schemeEnd + 3);
  }

  auto pathStart = rest.find_first_of("/?");
  UrlParts parts;
  parts.base = scheme + "://" + rest.substr(0, pathStart);
  parts.path = pathStart == std::string::npos ? "/" : rest.substr(pathStart);
  if (parts.path.front() == '?')
    parts.path = "/" + parts.path;
  return parts;
}

std::optional<PostSyncAction>
PostSyncActionRunner::parseAction(const PostSyncActionRecord &record) {
  json cfg = record.config.empty() ? json::object() : json::parse(record.config);
  if (!cfg.is_object())
    throw std::invalid_argument("action config must be a JSON object");

  PostSyncAction action;
  action.id = record.id;
  action.name = record.name;
  action.enabled = record.enabled;

  if (record.action_type == "library-refresh" ||
      record.action_type == "plex_refresh") {
    LibraryRefreshConfig lib;
    lib.baseUrl = stringField(cfg, "plex_url");
    while (!lib.baseUrl.empty() && lib.baseUrl.back() == '/')
      lib.baseUrl.pop_back();
    lib.token = stringField(cfg, "plex_token");
    lib.librarySection = stringField(cfg, "library_section", "1");
    action.config = lib;
  } else if (record.action_type == "webhook") {
    WebhookConfig hook;
    hook.url = stringField(cfg, "url");
    hook.method = StringUtils::toUpper(stringField(cfg, "method", "POST"));
    action.config = hook;
  } else {
    return std::nullopt;
  }
  return action;
}

std::size_t PostSyncActionRunner::runAll() {
  std::size_t succeeded = 0;
  auto records = m_dbManager.getPostSyncActions();
  for (const auto &record : records) {
    if (!record.enabled)
      continue;

    try {
      auto action = parseAction(record);
      if (!action) {
        std::cerr << "[Actions] Unknown action type '" << record.action_type
                  << "' for '" << record.name << "', skipping" << std::endl;
        continue;
      }
      execute(*action);
      ++succeeded;
    } catch (const std::exception &e) {
      std::cerr << "[Actions] Post-sync action '" << record.name
                << "' failed: " << e.what() << std::endl;
    }
  }
  return succeeded;
}

void PostSyncActionRunner::execute(const PostSyncAction &action) {
  switch (action.kind()) {
  case ActionKind::LibraryRefresh:
    refreshLibrary(std::get<LibraryRefreshConfig>(action.config));
    break;
  case ActionKind::Webhook:
    callWebhook(std::get<WebhookConfig>(action.config));
    break;
  }
}

void PostSyncActionRunner::refreshLibrary(const LibraryRefreshConfig &cfg) {
  if (cfg.baseUrl.empty() || cfg.token.empty()) {
    std::cerr << "[Actions] Plex refresh skipped: missing URL or token"
              << std::endl;
    return;
  }

  std::string url = cfg.baseUrl + "/library/sections/" +
                    urlEncode(cfg.librarySection) +
                    "/refresh?X-Plex-Token=" + urlEncode(cfg.token);
  auto res = sendRequest("GET", url);
  if (res->status == 200) {
    std::cout << "[Actions] Plex library section " << cfg.librarySection
              << " refresh triggered" << std::endl;
  } else {
    std::cerr << "[Actions] Plex refresh returned status " << res->status
              << std::endl;
  }
}

void PostSyncActionRunner::callWebhook(const WebhookConfig &cfg) {
  if (cfg.url.empty()) {
    std::cerr << "[Actions] Webhook skipped: missing URL" << std::endl;
    return;
  }

  auto res = sendRequest(cfg.method == "GET" ? "GET" : "POST", cfg.url);
  std::cout << "[Actions] Webhook " << cfg.url << " returned status "
            << res->status << std::endl;
}

} // namespace nassync

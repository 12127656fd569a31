#include "PostSyncActionRunner.hpp"
#include "TestSupport.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace nassync;
using json = nlohmann::json;

class PostSyncActionRunnerTest : public ::testing::Test {
protected:
  test::TempDatabase temp;
  DatabaseManager &db = temp.db();
  test::LocalHttpServer server;
  PostSyncActionRunner runner{db};

  void addWebhook(const std::string &name, const std::string &url,
                  const std::string &method = "") {
    json cfg = {{"url", url}};
    if (!method.empty())
      cfg["method"] = method;
    db.createPostSyncAction(name, "webhook", cfg.dump());
  }
};

TEST_F(PostSyncActionRunnerTest, WebhookDefaultsToPost) {
  addWebhook("Notify", server.url("/hook"));
  EXPECT_EQ(runner.runAll(), 1u);
  EXPECT_EQ(server.hits("POST /hook"), 1);
  EXPECT_EQ(server.hits("GET /hook"), 0);
}

TEST_F(PostSyncActionRunnerTest, WebhookHonoursGetCaseInsensitively) {
  addWebhook("Notify", server.url("/hook?source=nas"), "get");
  EXPECT_EQ(runner.runAll(), 1u);
  EXPECT_EQ(server.hits("GET /hook"), 1);
  EXPECT_EQ(server.queryParam("/hook", "source"), "nas");
}

TEST_F(PostSyncActionRunnerTest, LibraryRefreshBuildsSectionUrl) {
  json cfg = {{"plex_url", server.url("/")},
              {"plex_token", "secret token"},
              {"library_section", "3"}};
  db.createPostSyncAction("Plex", "library-refresh", cfg.dump());

  EXPECT_EQ(runner.runAll(), 1u);
  EXPECT_EQ(server.hits("GET /library/sections/3/refresh"), 1);
  EXPECT_EQ(server.queryParam("/library/sections/3/refresh", "X-Plex-Token"),
            "secret token");
}

TEST_F(PostSyncActionRunnerTest, LibraryRefreshDefaultsToSectionOne) {
  json cfg = {{"plex_url", server.url()}, {"plex_token", "t"}};
  db.createPostSyncAction("Plex", "plex_refresh", cfg.dump());
  runner.runAll();
  EXPECT_EQ(server.hits("GET /library/sections/1/refresh"), 1);
}

TEST_F(PostSyncActionRunnerTest, Non200IsOnlyAWarning) {
  server.respondWith(401);
  json cfg = {{"plex_url", server.url()}, {"plex_token", "t"}};
  db.createPostSyncAction("Plex", "library-refresh", cfg.dump());
  EXPECT_EQ(runner.runAll(), 1u);
  EXPECT_EQ(server.totalHits(), 1);
}

TEST_F(PostSyncActionRunnerTest, MissingSettingsShortCircuit) {
  db.createPostSyncAction("NoUrl", "webhook", "{}");
  db.createPostSyncAction("NoToken", "library-refresh",
                          json({{"plex_url", server.url()}}).dump());
  runner.runAll();
  EXPECT_EQ(server.totalHits(), 0);
}

TEST_F(PostSyncActionRunnerTest, DisabledActionsAreSkipped) {
  int id = db.createPostSyncAction(
      "Notify", "webhook", json({{"url", server.url("/hook")}}).dump());
  db.updatePostSyncAction(id, "Notify", "webhook",
                          json({{"url", server.url("/hook")}}).dump(), false);
  EXPECT_EQ(runner.runAll(), 0u);
  EXPECT_EQ(server.totalHits(), 0);
}

TEST_F(PostSyncActionRunnerTest, OneFailureDoesNotStopTheRest) {
  // Enumerated by name: A, B, C, D.
  addWebhook("A refused", "http://127.0.0.1:1/hook");
  db.createPostSyncAction("B broken", "webhook", "{not json");
  db.createPostSyncAction("C unknown", "email", "{}");
  addWebhook("D ok", server.url("/hook"));

  EXPECT_EQ(runner.runAll(), 1u);
  EXPECT_EQ(server.hits("POST /hook"), 1);
}

TEST(PostSyncActionParse, ClosedSetOfKinds) {
  PostSyncActionRecord record;
  record.id = 7;
  record.name = "Hook";
  record.action_type = "webhook";
  record.config = R"({"url":"http://h/x","method":"get"})";

  auto action = PostSyncActionRunner::parseAction(record);
  ASSERT_TRUE(action.has_value());
  EXPECT_EQ(action->kind(), ActionKind::Webhook);
  EXPECT_EQ(std::get<WebhookConfig>(action->config).method, "GET");
  EXPECT_EQ(action->id, 7);

  record.action_type = "library-refresh";
  record.config = R"({"plex_url":"http://plex:32400///","plex_token":"t",
                      "library_section":4})";
  action = PostSyncActionRunner::parseAction(record);
  ASSERT_TRUE(action.has_value());
  EXPECT_EQ(action->kind(), ActionKind::LibraryRefresh);
  const auto &lib = std::get<LibraryRefreshConfig>(action->config);
  EXPECT_EQ(lib.baseUrl, "http://plex:32400");
  EXPECT_EQ(lib.librarySection, "4");

  record.action_type = "sms";
  EXPECT_FALSE(PostSyncActionRunner::parseAction(record).has_value());
}

TEST(PostSyncActionParse, MalformedConfigThrows) {
  PostSyncActionRecord record;
  record.action_type = "webhook";
  record.config = "{oops";
  EXPECT_THROW(PostSyncActionRunner::parseAction(record), json::exception);

  record.config = "[1,2]";
  EXPECT_THROW(PostSyncActionRunner::parseAction(record),
               std::invalid_argument);
}

TEST(PostSyncActionSplitUrl, SeparatesOriginFromPath) {
  auto parts = PostSyncActionRunner::splitUrl("http://plex:32400/a/b?x=1");
  EXPECT_EQ(parts.base, "http://plex:32400");
  EXPECT_EQ(parts.path, "/a/b?x=1");

  parts = PostSyncActionRunner::splitUrl("https://hooks.example.com");
  EXPECT_EQ(parts.base, "https://hooks.example.com");
  EXPECT_EQ(parts.path, "/");

  parts = PostSyncActionRunner::splitUrl("example.com?ping=1");
  EXPECT_EQ(parts.base, "http://example.com");
  EXPECT_EQ(parts.path, "/?ping=1");
}

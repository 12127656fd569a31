#include "DatabaseManager.hpp"
#include "TestSupport.hpp"
#include <gtest/gtest.h>

using namespace nassync;

class DatabaseManagerTest : public ::testing::Test {
protected:
  test::TempDatabase temp;
  DatabaseManager &db = temp.db();
};

TEST_F(DatabaseManagerTest, SchedulerDefaultsAreSeeded) {
  auto cfg = db.getSchedulerConfig();
  EXPECT_TRUE(cfg.enabled);
  EXPECT_EQ(cfg.interval_minutes, 15);

  db.saveSchedulerConfig(false, 30);
  cfg = db.getSchedulerConfig();
  EXPECT_FALSE(cfg.enabled);
  EXPECT_EQ(cfg.interval_minutes, 30);
}

TEST_F(DatabaseManagerTest, NasConfigIsSingleton) {
  EXPECT_FALSE(db.getNasConfig().has_value());

  db.saveNasConfig("nas.local", "backup");
  auto nas = db.getNasConfig();
  ASSERT_TRUE(nas.has_value());
  EXPECT_EQ(nas->hostname, "nas.local");
  EXPECT_EQ(nas->ssh_key_path, "/config/id_rsa");
  EXPECT_EQ(nas->ssh_port, 22);
  std::string createdAt = nas->created_at;

  db.saveNasConfig("10.0.0.5", "admin", "/keys/nas", 2222);
  nas = db.getNasConfig();
  ASSERT_TRUE(nas.has_value());
  EXPECT_EQ(nas->hostname, "10.0.0.5");
  EXPECT_EQ(nas->ssh_user, "admin");
  EXPECT_EQ(nas->ssh_port, 2222);
  EXPECT_EQ(nas->created_at, createdAt);
}

TEST_F(DatabaseManagerTest, MappingsAreOrderedByName) {
  db.createFolderMapping("Photos", "/data/photos", "/volume1/photos");
  db.createFolderMapping("Movies", "/data/movies", "/volume1/movies", true);
  db.createFolderMapping("Backups", "/data/backups", "/volume1/backups");

  auto mappings = db.getFolderMappings();
  ASSERT_EQ(mappings.size(), 3u);
  EXPECT_EQ(mappings[0].name, "Backups");
  EXPECT_EQ(mappings[1].name, "Movies");
  EXPECT_EQ(mappings[2].name, "Photos");
  EXPECT_TRUE(mappings[1].delete_source);
  EXPECT_TRUE(mappings[1].enabled);
  EXPECT_FALSE(mappings[1].last_sync_status.has_value());
}

TEST_F(DatabaseManagerTest, UpdateAndLookupMapping) {
  int id = db.createFolderMapping("Movies", "/data/movies", "/volume1/movies");
  EXPECT_TRUE(db.updateFolderMapping(id, "Films", "/data/films",
                                     "/volume1/films", false, true));
  auto m = db.getFolderMapping(id);
  ASSERT_TRUE(m.has_value());
  EXPECT_EQ(m->name, "Films");
  EXPECT_FALSE(m->enabled);
  EXPECT_TRUE(m->delete_source);

  EXPECT_FALSE(db.getFolderMapping(id + 100).has_value());
  EXPECT_FALSE(db.updateFolderMapping(id + 100, "x", "y", "z", true, false));
}

TEST_F(DatabaseManagerTest, LastRunFieldsAreRecorded) {
  int id = db.createFolderMapping("Movies", "/data/movies", "/volume1/movies");
  db.updateMappingSyncStatus(id, "error", "Rsync error: boom");

  auto m = db.getFolderMapping(id);
  ASSERT_TRUE(m.has_value());
  EXPECT_EQ(m->last_sync_status.value_or(""), "error");
  EXPECT_EQ(m->last_sync_message.value_or(""), "Rsync error: boom");
  EXPECT_TRUE(m->last_sync_at.has_value());
}

TEST_F(DatabaseManagerTest, SyncLogsAreNewestFirst) {
  int a = db.createFolderMapping("A", "/a", "/na");
  int b = db.createFolderMapping("B", "/b", "/nb");
  db.createSyncLog(a, "success", "ok", 1, 100, 0.5, "2024-01-01T00:00:00Z");
  db.createSyncLog(b, "error", "failed", 0, 0, 0.1, "2024-01-01T00:01:00Z");
  db.createSyncLog(a, "success", "ok", 2, 200, 0.7, "2024-01-01T00:02:00Z");

  auto recent = db.getRecentSyncLogs();
  ASSERT_EQ(recent.size(), 3u);
  EXPECT_EQ(recent[0].bytes_transferred, 200);
  EXPECT_EQ(recent[2].bytes_transferred, 100);
  EXPECT_FALSE(recent[0].completed_at.empty());

  EXPECT_EQ(db.getRecentSyncLogs(2).size(), 2u);

  auto forA = db.getMappingSyncLogs(a);
  ASSERT_EQ(forA.size(), 2u);
  EXPECT_EQ(forA[0].files_transferred, 2);
  EXPECT_EQ(forA[0].started_at, "2024-01-01T00:02:00Z");
  EXPECT_DOUBLE_EQ(forA[1].duration_seconds, 0.5);
}

TEST_F(DatabaseManagerTest, DeletingMappingKeepsItsLogs) {
  int a = db.createFolderMapping("A", "/a", "/na");
  int b = db.createFolderMapping("B", "/b", "/nb");
  db.createSyncLog(a, "success", "ok", 1, 100, 0.5, "t");
  db.createSyncLog(b, "success", "ok", 1, 100, 0.5, "t");

  EXPECT_TRUE(db.deleteFolderMapping(a));
  EXPECT_FALSE(db.getFolderMapping(a).has_value());
  EXPECT_EQ(db.getMappingSyncLogs(a).size(), 1u);
  EXPECT_EQ(db.getMappingSyncLogs(b).size(), 1u);
  EXPECT_EQ(db.getRecentSyncLogs().size(), 2u);
}

TEST_F(DatabaseManagerTest, PostSyncActionCrud) {
  int hook = db.createPostSyncAction("Notify", "webhook",
                                     R"({"url":"http://example/hook"})");
  db.createPostSyncAction("Library", "library-refresh",
                          R"({"plex_url":"http://plex:32400","plex_token":"t"})");

  auto actions = db.getPostSyncActions();
  ASSERT_EQ(actions.size(), 2u);
  EXPECT_EQ(actions[0].name, "Library");
  EXPECT_EQ(actions[1].name, "Notify");
  EXPECT_TRUE(actions[1].enabled);

  EXPECT_TRUE(db.updatePostSyncAction(hook, "Notify", "webhook",
                                      R"({"url":"http://example/other"})",
                                      false));
  actions = db.getPostSyncActions();
  EXPECT_FALSE(actions[1].enabled);
  EXPECT_EQ(actions[1].config, R"({"url":"http://example/other"})");

  EXPECT_TRUE(db.deletePostSyncAction(hook));
  EXPECT_EQ(db.getPostSyncActions().size(), 1u);
}

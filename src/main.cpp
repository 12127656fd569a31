#include "DatabaseManager.hpp"
#include "JsonFormat.hpp"
#include "NasProbe.hpp"
#include "PostSyncActionRunner.hpp"
#include "RsyncRunner.hpp"
#include "SyncEngine.hpp"
#include "SyncScheduler.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using json = nlohmann::json;
namespace fs = std::filesystem;

std::atomic<bool> running{true};
std::atomic<bool> reloadRequested{false};
std::mutex cv_m;
std::condition_variable cv;

static void signalHandler(int) {
  running.store(false);
  cv.notify_all();
}

static void reloadHandler(int) {
  reloadRequested.store(true);
  cv.notify_all();
}

static void printUsage() {
  std::cerr
      << "Usage: nassync [--db <path>] <command> [args]\n"
         "\n"
         "Commands:\n"
         "  daemon                               run the scheduler (default)\n"
         "  run [mappingId]                      sync all mappings or one\n"
         "  status                               scheduler setting and last log\n"
         "  nas-status                           ping the configured NAS\n"
         "  test-connection                      try an SSH login\n"
         "  logs [limit]                         recent sync logs\n"
         "  mappings                             list folder mappings\n"
         "  set-nas <host> <user> [key] [port]   configure the NAS\n"
         "  add-mapping <name> <src> <dst> [--delete-source]\n"
         "  set-scheduler <on|off> <minutes>\n"
         "  add-action <name> <library-refresh|webhook> <configJson>\n";
}

static int runDaemon(nassync::DatabaseManager &dbManager,
                     nassync::SyncEngine &engine) {
  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);
  std::signal(SIGHUP, reloadHandler);

  nassync::SyncScheduler scheduler(dbManager, engine);
  scheduler.start();
  scheduler.configure();
  std::cout << "[Main] Running. Press Ctrl+C to exit gracefully, send SIGHUP "
               "to reload the scheduler setting."
            << std::endl;

  // Polled too; a notify from the signal handler can be lost.
  std::unique_lock<std::mutex> lock(cv_m);
  while (running.load()) {
    cv.wait_for(lock, std::chrono::seconds(1));
    if (reloadRequested.exchange(false)) {
      std::cout << "[Main] Reloading scheduler setting" << std::endl;
      try {
        scheduler.configure();
      } catch (const std::exception &e) {
        std::cerr << "[Main] Reload failed: " << e.what() << std::endl;
      }
      std::cout << "[Main] Scheduler: " << json(scheduler.status()).dump()
                << std::endl;
      std::cout << "[Main] Sync: " << json(engine.getSyncStatus()).dump()
                << std::endl;
    }
  }

  std::cout << "[Main] Shutdown signal received" << std::endl;
  scheduler.stop();
  return 0;
}

int main(int argc, char **argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  std::string dbPath = "/config/nas_sync.db";
  if (const char *env = std::getenv("NASSYNC_DB"))
    dbPath = env;
  if (args.size() >= 2 && args[0] == "--db") {
    dbPath = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }

  std::string command = args.empty() ? "daemon" : args[0];
  if (command == "-h" || command == "--help" || command == "help") {
    printUsage();
    return 0;
  }

  try {
    fs::path parent = fs::path(dbPath).parent_path();
    if (!parent.empty() && !fs::exists(parent)) {
      std::cout << "[Main] Creating missing config folder: " << parent
                << std::endl;
      fs::create_directories(parent);
    }

    nassync::DatabaseManager dbManager(dbPath);
    if (!dbManager.open()) {
      std::cerr << "[Main] Failed to open database." << std::endl;
      return 1;
    }
    dbManager.initializeSchema();

    nassync::NasProbe probe;
    nassync::RsyncRunner rsync;
    nassync::PostSyncActionRunner actions(dbManager);
    nassync::SyncEngine engine(dbManager, probe, rsync, actions);

    if (command == "daemon") {
      std::cout << "[Main] Starting NAS Sync" << std::endl;
      return runDaemon(dbManager, engine);
    }

    if (command == "run") {
      if (args.size() >= 2) {
        auto result = engine.runOne(std::stoi(args[1]));
        std::cout << json(result).dump(2) << std::endl;
        return result.status == nassync::RunStatus::Completed ? 0 : 1;
      }
      auto result = engine.runAll();
      std::cout << json(result).dump(2) << std::endl;
      return result.status == nassync::RunStatus::Error ? 1 : 0;
    }

    // Live engine and timer state belongs to the daemon (see SIGHUP); this
    // reports what the store knows.
    if (command == "status") {
      json out;
      out["scheduler_setting"] = dbManager.getSchedulerConfig();
      auto latest = dbManager.getRecentSyncLogs(1);
      out["last_log"] = latest.empty() ? json(nullptr) : json(latest.front());
      std::cout << out.dump(2) << std::endl;
      return 0;
    }

    if (command == "nas-status") {
      auto nas = dbManager.getNasConfig();
      json out;
      if (!nas) {
        out = {{"online", false}, {"configured", false}};
      } else {
        out = {{"online", probe.isReachable(nas->hostname)},
               {"configured", true},
               {"hostname", nas->hostname}};
      }
      std::cout << out.dump(2) << std::endl;
      return 0;
    }

    if (command == "test-connection") {
      auto nas = dbManager.getNasConfig();
      nassync::ConnectionTestResult result{false, "NAS not configured"};
      if (nas)
        result = probe.testConnection(nas->hostname, nas->ssh_user,
                                      nas->ssh_key_path, nas->ssh_port);
      std::cout << json(result).dump(2) << std::endl;
      return result.success ? 0 : 1;
    }

    if (command == "logs") {
      int limit = args.size() >= 2 ? std::stoi(args[1]) : 50;
      std::cout << json(dbManager.getRecentSyncLogs(limit)).dump(2)
                << std::endl;
      return 0;
    }

    if (command == "mappings") {
      std::cout << json(dbManager.getFolderMappings()).dump(2) << std::endl;
      return 0;
    }

    if (command == "set-nas" && args.size() >= 3) {
      std::string key = args.size() >= 4 ? args[3] : "/config/id_rsa";
      int port = args.size() >= 5 ? std::stoi(args[4]) : 22;
      dbManager.saveNasConfig(args[1], args[2], key, port);
      std::cout << "[Main] NAS configuration saved" << std::endl;
      return 0;
    }

    if (command == "add-mapping" && args.size() >= 4) {
      bool deleteSource = args.size() >= 5 && args[4] == "--delete-source";
      int id =
          dbManager.createFolderMapping(args[1], args[2], args[3], deleteSource);
      std::cout << "[Main] Created mapping " << id << std::endl;
      return 0;
    }

    if (command == "set-scheduler" && args.size() >= 3) {
      bool enabled = args[1] == "on" || args[1] == "true" || args[1] == "1";
      dbManager.saveSchedulerConfig(enabled, std::stoi(args[2]));
      std::cout << "[Main] Scheduler configuration saved" << std::endl;
      return 0;
    }

    if (command == "add-action" && args.size() >= 4) {
      nassync::PostSyncActionRecord record;
      record.action_type = args[2];
      record.config = json::parse(args[3]).dump();
      if (!nassync::PostSyncActionRunner::parseAction(record)) {
        std::cerr << "[Main] Unknown action type: " << args[2] << std::endl;
        return 2;
      }
      int id = dbManager.createPostSyncAction(args[1], args[2], record.config);
      std::cout << "[Main] Created post-sync action " << id << std::endl;
      return 0;
    }

    printUsage();
    return 2;
  } catch (const std::exception &e) {
    std::cerr << "[Main] Error: " << e.what() << std::endl;
    return 1;
  }
}

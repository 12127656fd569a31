#include "NasProbe.hpp"
#include "TestSupport.hpp"
#include <algorithm>
#include <gtest/gtest.h>
#include <system_error>

using namespace nassync;
using nassync::test::ScriptedRunner;

TEST(NasProbe, ReachableWhenPingSucceeds) {
  ScriptedRunner script;
  script.on("ping", CommandResult{0, "1 packets transmitted, 1 received", ""});
  NasProbe probe(script.runner());

  EXPECT_TRUE(probe.isReachable("nas.local"));
  auto calls = script.calls("ping");
  ASSERT_EQ(calls.size(), 1u);
  std::vector<std::string> expected = {"ping", "-c", "1", "-W", "2",
                                       "nas.local"};
  EXPECT_EQ(calls[0], expected);
}

TEST(NasProbe, UnreachableWhenPingFails) {
  ScriptedRunner script;
  script.on("ping", CommandResult{1, "", ""});
  NasProbe probe(script.runner());
  EXPECT_FALSE(probe.isReachable("nas.local", 1));
  EXPECT_EQ(script.calls("ping")[0][4], "1");
}

TEST(NasProbe, LaunchFailureMeansUnreachable) {
  ScriptedRunner script;
  script.on("ping", [](const std::vector<std::string> &) -> CommandResult {
    throw std::system_error(ENOENT, std::generic_category(), "ping");
  });
  NasProbe probe(script.runner());
  EXPECT_FALSE(probe.isReachable("nas.local"));
}

TEST(NasProbe, ConnectionTestSuccess) {
  ScriptedRunner script;
  script.on("ssh", CommandResult{0, "Connection successful\n", ""});
  NasProbe probe(script.runner());

  auto result = probe.testConnection("nas.local", "backup", "/keys/id", 2222);
  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.message, "SSH connection successful");

  auto argv = script.calls("ssh").at(0);
  auto has = [&argv](const std::string &s) {
    return std::find(argv.begin(), argv.end(), s) != argv.end();
  };
  EXPECT_TRUE(has("BatchMode=yes"));
  EXPECT_TRUE(has("ConnectTimeout=5"));
  EXPECT_TRUE(has("StrictHostKeyChecking=accept-new"));
  EXPECT_TRUE(has("/keys/id"));
  EXPECT_TRUE(has("2222"));
  EXPECT_TRUE(has("backup@nas.local"));
}

TEST(NasProbe, ConnectionTestCapturesRemoteError) {
  ScriptedRunner script;
  script.on("ssh", CommandResult{255, "",
                                 "backup@nas.local: Permission denied "
                                 "(publickey,password).\n"});
  NasProbe probe(script.runner());

  auto result = probe.testConnection("nas.local", "backup", "/keys/id");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.message, "SSH connection failed: backup@nas.local: "
                            "Permission denied (publickey,password).");
}

TEST(NasProbe, ConnectionTestWithoutStderr) {
  ScriptedRunner script;
  script.on("ssh", CommandResult{255, "", ""});
  NasProbe probe(script.runner());
  auto result = probe.testConnection("nas.local", "backup", "/keys/id");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.message, "SSH connection failed: Unknown SSH error");
}

TEST(NasProbe, ConnectionTestLaunchFailure) {
  ScriptedRunner script;
  script.on("ssh", [](const std::vector<std::string> &) -> CommandResult {
    throw std::system_error(ENOENT, std::generic_category(), "cannot execute ssh");
  });
  NasProbe probe(script.runner());
  auto result = probe.testConnection("nas.local", "backup", "/keys/id");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.message.rfind("SSH test error: ", 0), 0u);
}

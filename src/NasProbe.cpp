#include "NasProbe.hpp"
#include "StringUtils.hpp"
#include <iostream>
#include <utility>

namespace nassync {

NasProbe::NasProbe(CommandRunner runner) : m_runner(std::move(runner)) {}

bool NasProbe::isReachable(const std::string &hostname, int timeoutSeconds) {
  try {
    auto res = m_runner(
        {"ping", "-c", "1", "-W", std::to_string(timeoutSeconds), hostname});
    return res.exitCode == 0;
  } catch (const std::exception &e) {
    std::cerr << "[Probe] Error checking NAS status: " << e.what()
              << std::endl;
    return false;
  }
}

ConnectionTestResult NasProbe::testConnection(const std::string &hostname,
                                              const std::string &sshUser,
                                              const std::string &sshKeyPath,
                                              int sshPort,
                                              int timeoutSeconds) {
  std::vector<std::string> argv = {
      "ssh",
      "-i",
      sshKeyPath,
      "-p",
      std::to_string(sshPort),
      "-o",
      "StrictHostKeyChecking=accept-new",
      "-o",
      "ConnectTimeout=" + std::to_string(timeoutSeconds),
      "-o",
      "BatchMode=yes",
      sshUser + "@" + hostname,
      "echo 'Connection successful'"};

  try {
    auto res = m_runner(argv);
    if (res.exitCode == 0)
      return {true, "SSH connection successful"};

    std::string error = StringUtils::trim(res.stderrText);
    if (error.empty())
      error = "Unknown SSH error";
    return {false, "SSH connection failed: " + error};
  } catch (const std::exception &e) {
    return {false, std::string("SSH test error: ") + e.what()};
  }
}

} // namespace nassync

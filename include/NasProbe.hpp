#pragma once
#include "ProcessRunner.hpp"
#include "types.hpp"
#include <string>

namespace nassync {

/**
 * NasProbe answers "is the NAS up?" (ping) and "can we log in?" (ssh).
 * Neither call throws; failures come back as false / a message.
 */
class NasProbe {
public:
  explicit NasProbe(CommandRunner runner = runCommand);

  bool isReachable(const std::string &hostname, int timeoutSeconds = 2);

  ConnectionTestResult testConnection(const std::string &hostname,
                                      const std::string &sshUser,
                                      const std::string &sshKeyPath,
                                      int sshPort = 22,
                                      int timeoutSeconds = 5);

private:
  CommandRunner m_runner;
};

} // namespace nassync

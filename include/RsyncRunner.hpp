#ifndef RSYNC_RUNNER_HPP
#define RSYNC_RUNNER_HPP

#include "ProcessRunner.hpp"
#include "types.hpp"
#include <string>
#include <vector>

namespace nassync {

// Pulls "sent N bytes" and "Number of regular files transferred: N" out of
// rsync --stats output. Missing or unreadable figures are zero.
TransferStats parseRsyncOutput(const std::string &output);

class RsyncRunner {
public:
  explicit RsyncRunner(CommandRunner runner = runCommand);
  ~RsyncRunner();

  TransferResult transfer(const FolderMapping &mapping, const NasConfig &nas);

  std::vector<std::string> buildCommand(const FolderMapping &mapping,
                                        const NasConfig &nas) const;

private:
  CommandRunner m_runner;
};

} // namespace nassync

#endif // RSYNC_RUNNER_HPP

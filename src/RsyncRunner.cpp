#include "RsyncRunner.hpp"
#include "StringUtils.hpp"
#include <algorithm>
#include <iostream>
#include <regex>
#include <utility>

namespace nassync {

namespace {

int64_t parseCount(std::string digits) {
  digits.erase(std::remove(digits.begin(), digits.end(), ','), digits.end());
  try {
    return std::stoll(digits);
  } catch (const std::exception &) {
    // Out of range or empty after stripping separators.
    return 0;
  }
}

} // namespace

TransferStats parseRsyncOutput(const std::string &output) {
  static const std::regex bytesPattern(R"(sent ([\d,]+) bytes)");
  static const std::regex filesPattern(
      R"(Number of regular files transferred: ([\d,]+))");

  TransferStats stats;
  std::smatch match;
  if (std::regex_search(output, match, bytesPattern))
    stats.bytesTransferred = parseCount(match[1].str());
  if (std::regex_search(output, match, filesPattern))
    stats.filesTransferred = parseCount(match[1].str());
  return stats;
}

RsyncRunner::RsyncRunner(CommandRunner runner) : m_runner(std::move(runner)) {}
RsyncRunner::~RsyncRunner() = default;

std::vector<std::string>
RsyncRunner::buildCommand(const FolderMapping &mapping,
                          const NasConfig &nas) const {
  std::string sshCmd = "ssh -i " + nas.ssh_key_path + " -p " +
                       std::to_string(nas.ssh_port) +
                       " -o StrictHostKeyChecking=accept-new";

  // Trailing slash: copy the directory's contents, not the directory itself.
  std::string source = mapping.source_path;
  if (source.empty() || source.back() != '/')
    source += '/';

  std::vector<std::string> cmd = {"rsync",      "-avz", "--stats",
                                  "--progress", "-e",   sshCmd};
  if (mapping.delete_source)
    cmd.push_back("--remove-source-files");

  cmd.push_back(source);
  cmd.push_back(nas.ssh_user + "@" + nas.hostname + ":" +
                mapping.destination_path);
  return cmd;
}

TransferResult RsyncRunner::transfer(const FolderMapping &mapping,
                                     const NasConfig &nas) {
  auto cmd = buildCommand(mapping, nas);
  std::cout << "[Rsync] Running rsync: " << joinCommandLine(cmd) << std::endl;

  TransferResult result;
  try {
    auto res = m_runner(cmd);
    if (res.exitCode == 0) {
      result.success = true;
      result.message = "Sync completed successfully";
      result.stats = parseRsyncOutput(res.stdoutText);
      return result;
    }

    std::string error = StringUtils::trim(res.stderrText);
    if (error.empty())
      error = StringUtils::trim(res.stdoutText);
    if (error.empty())
      error = "Unknown rsync error (exit code " +
              std::to_string(res.exitCode) + ")";
    result.message = error;
  } catch (const std::exception &e) {
    std::cerr << "[Rsync] Rsync execution error: " << e.what() << std::endl;
    result.message = std::string("Rsync error: ") + e.what();
  }
  result.success = false;
  result.stats = TransferStats{};
  return result;
}

} // namespace nassync

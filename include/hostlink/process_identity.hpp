/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file process_identity.hpp
 * @brief Process self-identification for the announce payload.
 *
 * The host agent binds a session to this process across PID namespaces, so
 * the payload carries:
 * - the PID as seen from the host (first line of /proc/self/sched),
 * - the command line (/proc/self/cmdline, else registered program args),
 * - the cpuset the process runs in,
 * - the fd and socket inode of a live TCP connection to the agent, which
 *   the agent can match against its own side of that connection.
 *
 * Every source is best-effort: failures degrade to the next source or leave
 * a field empty, and are logged at debug level.
 */

#ifndef HOSTLINK_PROCESS_IDENTITY_HPP_
#define HOSTLINK_PROCESS_IDENTITY_HPP_

#include "hostlink/log.hpp"
#include "hostlink/procfs.hpp"
#include "hostlink/socket.hpp"
#include "hostlink/vocabulary.hpp"

#include <cstdint>
#include <cstdlib>
#include <mutex>
#include <string>
#include <vector>

#include <unistd.h>

namespace hostlink {

enum class IdentityError : uint8_t {
  kUnavailable = 0,
  kMalformed,
};

struct CommandLine {
  std::string name;
  std::vector<std::string> args;
};

struct DiscoveryInfo {
  int32_t pid = 0;
  std::string name;
  std::vector<std::string> args;
  optional<std::string> fd;
  optional<std::string> inode;
  optional<std::string> cpu_set;
};

// ============================================================================
// Parsers
// ============================================================================

/**
 * @brief Extract the host PID from the first line of /proc/<pid>/sched.
 *
 * The line looks like "app (12345, #threads: 4)"; the PID is the first run
 * of digits that directly follows '(' and is terminated by ','.
 */
inline expected<int32_t, IdentityError> ParseSchedPid(const std::string& line) {
  size_t open = line.find('(');
  while (open != std::string::npos) {
    size_t i = open + 1U;
    while (i < line.size() && line[i] >= '0' && line[i] <= '9') {
      ++i;
    }
    if (i > open + 1U && i < line.size() && line[i] == ',') {
      const long pid = std::strtol(line.substr(open + 1U, i - open - 1U).c_str(),
                                   nullptr, 10);
      if (pid > 0 && pid <= INT32_MAX) {
        return expected<int32_t, IdentityError>::success(
            static_cast<int32_t>(pid));
      }
      return expected<int32_t, IdentityError>::error(IdentityError::kMalformed);
    }
    open = line.find('(', open + 1U);
  }
  return expected<int32_t, IdentityError>::error(IdentityError::kMalformed);
}

/** @brief Split NUL-separated /proc/<pid>/cmdline content. */
inline expected<CommandLine, IdentityError> ParseCmdline(
    const std::string& content) {
  CommandLine cmd;
  std::vector<std::string> parts;
  size_t start = 0U;
  while (start < content.size()) {
    size_t end = content.find('\0', start);
    if (end == std::string::npos) {
      end = content.size();
    }
    parts.emplace_back(content, start, end - start);
    start = end + 1U;
  }
  if (parts.empty() || parts[0].empty()) {
    return expected<CommandLine, IdentityError>::error(
        IdentityError::kMalformed);
  }
  cmd.name = parts[0];
  cmd.args.assign(parts.begin() + 1, parts.end());
  return expected<CommandLine, IdentityError>::success(
      static_cast<CommandLine&&>(cmd));
}

// ============================================================================
// Program Arguments Registry
// ============================================================================

namespace detail {

struct ProgramArgsSlot {
  std::mutex mutex;
  CommandLine cmd;
};

inline ProgramArgsSlot& ProgramArgs() {
  static ProgramArgsSlot slot;
  return slot;
}

}  // namespace detail

/**
 * @brief Record argv for use when procfs offers no command line.
 *
 * Typically called once from main().
 */
inline void SetProgramArguments(int argc, const char* const* argv) {
  CommandLine cmd;
  if (argc > 0 && argv != nullptr && argv[0] != nullptr) {
    cmd.name = argv[0];
    for (int i = 1; i < argc; ++i) {
      cmd.args.emplace_back(argv[i] != nullptr ? argv[i] : "");
    }
  }
  std::lock_guard<std::mutex> lock(detail::ProgramArgs().mutex);
  detail::ProgramArgs().cmd = static_cast<CommandLine&&>(cmd);
}

inline CommandLine ProgramArguments() {
  std::lock_guard<std::mutex> lock(detail::ProgramArgs().mutex);
  return detail::ProgramArgs().cmd;
}

// ============================================================================
// ProcessMetadataSource
// ============================================================================

class ProcessMetadataSource {
 public:
  virtual ~ProcessMetadataSource() = default;

  virtual optional<int32_t> AlternateProcessId() = 0;
  virtual optional<CommandLine> AlternateCommandLine() = 0;
  virtual optional<std::string> CpuSetContent() = 0;

  /** @brief True when per-process kernel metadata (procfs) is mounted. */
  virtual bool HasKernelMetadata() = 0;

  /** @brief Link target of descriptor @p fd of process @p pid. */
  virtual optional<std::string> DescriptorLink(int32_t pid, int32_t fd) = 0;
};

/** @brief ProcessMetadataSource over a procfs mount (default "/proc"). */
class ProcfsMetadataSource final : public ProcessMetadataSource {
 public:
  explicit ProcfsMetadataSource(std::string proc_root = "/proc")
      : root_(static_cast<std::string&&>(proc_root)) {}

  optional<int32_t> AlternateProcessId() override {
    auto line = procfs::ReadFirstLine(root_ + "/self/sched");
    if (!line.has_value()) {
      HOSTLINK_LOG_DEBUG("Identity", "no %s/self/sched", root_.c_str());
      return optional<int32_t>();
    }
    auto pid = ParseSchedPid(line.value());
    if (!pid.has_value()) {
      HOSTLINK_LOG_DEBUG("Identity", "unexpected sched header: %s",
                         line.value().c_str());
      return optional<int32_t>();
    }
    return optional<int32_t>(pid.value());
  }

  optional<CommandLine> AlternateCommandLine() override {
    auto content = procfs::ReadFile(root_ + "/self/cmdline");
    if (!content.has_value()) {
      HOSTLINK_LOG_DEBUG("Identity", "no %s/self/cmdline", root_.c_str());
      return optional<CommandLine>();
    }
    auto cmd = ParseCmdline(content.value());
    if (!cmd.has_value()) {
      HOSTLINK_LOG_DEBUG("Identity", "empty command line in procfs");
      return optional<CommandLine>();
    }
    return optional<CommandLine>(static_cast<CommandLine&&>(cmd.value()));
  }

  optional<std::string> CpuSetContent() override {
    auto content = procfs::ReadFile(root_ + "/self/cpuset", 4096U);
    if (!content.has_value()) {
      return content;
    }
    std::string& text = content.value();
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
      text.pop_back();
    }
    return content;
  }

  bool HasKernelMetadata() override { return procfs::Exists(root_); }

  optional<std::string> DescriptorLink(int32_t pid, int32_t fd) override {
    const std::string link =
        root_ + "/" + std::to_string(pid) + "/fd/" + std::to_string(fd);
    if (!procfs::Exists(link)) {
      return optional<std::string>();
    }
    return procfs::ReadLink(link);
  }

  const std::string& Root() const noexcept { return root_; }

 private:
  std::string root_;
};

// ============================================================================
// BuildProcessIdentity
// ============================================================================

/**
 * @brief Announce payload plus the connection its fd/inode refer to.
 *
 * Keep the object alive until the announce request completes so that the
 * agent can still observe the correlated connection.
 */
struct ProcessIdentity {
  DiscoveryInfo info;
#if HOSTLINK_HAS_NETWORK
  TcpSocket correlation;
#endif
};

/**
 * @brief Assemble the announce payload for this process.
 *
 * @param host        Candidate host of the agent.
 * @param port        Agent port.
 * @param timeout_ms  Connect timeout for the correlation socket.
 */
inline ProcessIdentity BuildProcessIdentity(ProcessMetadataSource& source,
                                            const std::string& host,
                                            uint16_t port,
                                            uint32_t timeout_ms) {
  ProcessIdentity identity;
  DiscoveryInfo& info = identity.info;
  const int32_t local_pid = static_cast<int32_t>(::getpid());

  info.pid = source.AlternateProcessId().value_or(local_pid);

  auto cmd = source.AlternateCommandLine();
  if (cmd.has_value()) {
    HOSTLINK_LOG_DEBUG("Identity", "command line from procfs: %s",
                       cmd.value().name.c_str());
    info.name = cmd.value().name;
    info.args = cmd.value().args;
  } else {
    HOSTLINK_LOG_DEBUG("Identity", "no procfs command line, using program "
                                   "arguments");
    CommandLine fallback = ProgramArguments();
    info.name = static_cast<std::string&&>(fallback.name);
    info.args = static_cast<std::vector<std::string>&&>(fallback.args);
  }

  info.cpu_set = source.CpuSetContent();

#if HOSTLINK_HAS_NETWORK
  if (!source.HasKernelMetadata()) {
    return identity;
  }
  auto addr = SocketAddress::Resolve(host.c_str(), port);
  if (!addr.has_value()) {
    HOSTLINK_LOG_DEBUG("Identity", "cannot resolve %s for correlation",
                       host.c_str());
    return identity;
  }
  auto sock = TcpSocket::ConnectTo(addr.value(), timeout_ms);
  if (!sock.has_value()) {
    HOSTLINK_LOG_DEBUG("Identity", "correlation connect to %s:%u failed: %s",
                       host.c_str(), port,
                       SocketErrorToString(sock.get_error()));
    return identity;
  }
  identity.correlation = static_cast<TcpSocket&&>(sock.value());
  const int32_t fd = identity.correlation.Fd();
  info.fd = optional<std::string>(std::to_string(fd));
  info.inode = source.DescriptorLink(local_pid, fd);
  if (!info.inode.has_value()) {
    HOSTLINK_LOG_DEBUG("Identity", "no descriptor link for fd %d", fd);
  }
#else
  (void)host;
  (void)port;
  (void)timeout_ms;
#endif
  return identity;
}

}  // namespace hostlink

#endif  // HOSTLINK_PROCESS_IDENTITY_HPP_

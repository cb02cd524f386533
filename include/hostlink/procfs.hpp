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
 * @file procfs.hpp
 * @brief Small helpers for reading procfs-style files and links.
 *
 * Files are read with open()/read() into a bounded buffer; nothing here
 * throws or aborts, absent or unreadable entries yield an empty optional.
 */

#ifndef HOSTLINK_PROCFS_HPP_
#define HOSTLINK_PROCFS_HPP_

#include "hostlink/platform.hpp"
#include "hostlink/vocabulary.hpp"

#include <cerrno>
#include <cstdint>
#include <string>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace hostlink {
namespace procfs {

static constexpr uint32_t kDefaultMaxFileBytes = 64U * 1024U;

/** @brief Read at most @p max_bytes of @p path. */
inline optional<std::string> ReadFile(
    const std::string& path, uint32_t max_bytes = kDefaultMaxFileBytes) {
  const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    return optional<std::string>();
  }
  std::string content;
  char buf[1024];
  while (content.size() < max_bytes) {
    const ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      ::close(fd);
      return optional<std::string>();
    }
    if (n == 0) {
      break;
    }
    content.append(buf, static_cast<size_t>(n));
  }
  ::close(fd);
  if (content.size() > max_bytes) {
    content.resize(max_bytes);
  }
  return optional<std::string>(static_cast<std::string&&>(content));
}

/** @brief First line of @p path without the trailing newline. */
inline optional<std::string> ReadFirstLine(const std::string& path) {
  auto content = ReadFile(path, 4096U);
  if (!content.has_value()) {
    return content;
  }
  std::string& text = content.value();
  const size_t eol = text.find('\n');
  if (eol != std::string::npos) {
    text.resize(eol);
  }
  return content;
}

/** @brief Target of the symbolic link at @p path. */
inline optional<std::string> ReadLink(const std::string& path) {
  char buf[256];
  const ssize_t n = ::readlink(path.c_str(), buf, sizeof(buf) - 1U);
  if (n <= 0) {
    return optional<std::string>();
  }
  return optional<std::string>(std::string(buf, static_cast<size_t>(n)));
}

inline bool Exists(const std::string& path) noexcept {
  struct stat st;
  return ::lstat(path.c_str(), &st) == 0;
}

}  // namespace procfs
}  // namespace hostlink

#endif  // HOSTLINK_PROCFS_HPP_

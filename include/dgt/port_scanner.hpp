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
 * @file port_scanner.hpp
 * @brief Serial port discovery and glob filtering.
 *
 * PortEnumerator is the collaborator that lists the serial ports attached to
 * the host. SysfsPortEnumerator reads them from /sys/class/tty (Linux);
 * tests substitute their own enumerator. PortScanner narrows the list down
 * to the ports matching the user's glob patterns.
 */

#ifndef DGT_PORT_SCANNER_HPP_
#define DGT_PORT_SCANNER_HPP_

#include "dgt/log.hpp"
#include "dgt/platform.hpp"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#if defined(DGT_PLATFORM_POSIX)
#include <dirent.h>
#include <fcntl.h>
#include <fnmatch.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace dgt {

struct PortInfo {
  std::string path;    ///< Device node, e.g. "/dev/ttyUSB0".
  std::string name;    ///< Descriptive name (USB product string if any).
  std::string vendor;  ///< Manufacturer and "vid:pid", may be empty.
};

// ============================================================================
// PortEnumerator
// ============================================================================

class PortEnumerator {
 public:
  virtual ~PortEnumerator() = default;
  virtual std::vector<PortInfo> ListSerialPorts() = 0;
};

#if defined(DGT_PLATFORM_POSIX)

namespace detail {

/// @brief RAII wrapper for DIR* (closedir on destruction).
class DirGuard {
 public:
  explicit DirGuard(DIR* d) : dir_(d) {}
  ~DirGuard() {
    if (dir_ != nullptr) closedir(dir_);
  }
  DIR* get() const { return dir_; }
  DirGuard(const DirGuard&) = delete;
  DirGuard& operator=(const DirGuard&) = delete;

 private:
  DIR* dir_;
};

/// @brief First line of a small sysfs attribute file, "" on error.
inline std::string ReadSysfsAttr(const std::string& path) {
  int fd = ::open(path.c_str(), O_RDONLY);
  if (fd < 0) {
    return std::string();
  }
  char buf[256];
  const ssize_t n = ::read(fd, buf, sizeof(buf) - 1U);
  ::close(fd);
  if (n <= 0) {
    return std::string();
  }
  buf[n] = '\0';
  char* nl = std::strchr(buf, '\n');
  if (nl != nullptr) *nl = '\0';
  return std::string(buf);
}

/// @brief Basename of a symlink target, "" when not a link.
inline std::string LinkBasename(const std::string& path) {
  char buf[512];
  const ssize_t n = ::readlink(path.c_str(), buf, sizeof(buf) - 1U);
  if (n <= 0) {
    return std::string();
  }
  buf[n] = '\0';
  const char* slash = std::strrchr(buf, '/');
  return std::string(slash != nullptr ? slash + 1 : buf);
}

inline bool IsDirectory(const std::string& path) {
  struct stat st;
  return ::stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

}  // namespace detail

// ============================================================================
// SysfsPortEnumerator
// ============================================================================

/**
 * @brief Lists ttys that have a backing device.
 *
 * USB attributes (product, manufacturer, idVendor, idProduct) are looked up
 * on the device and up to two parents, which covers both ttyUSB (usb-serial
 * port -> interface -> device) and ttyACM (interface -> device) layouts.
 * Legacy platform UARTs (serial8250) are skipped.
 */
class SysfsPortEnumerator final : public PortEnumerator {
 public:
  explicit SysfsPortEnumerator(std::string sysfs_root = "/sys/class/tty",
                               std::string dev_dir = "/dev")
      : sysfs_root_(std::move(sysfs_root)), dev_dir_(std::move(dev_dir)) {}

  std::vector<PortInfo> ListSerialPorts() override {
    std::vector<PortInfo> ports;
    detail::DirGuard dir(::opendir(sysfs_root_.c_str()));
    if (dir.get() == nullptr) {
      DGT_LOG_WARN("Scanner", "cannot open %s", sysfs_root_.c_str());
      return ports;
    }

    struct dirent* entry;
    while ((entry = ::readdir(dir.get())) != nullptr) {
      if (entry->d_name[0] == '.') continue;
      const std::string tty = entry->d_name;
      const std::string device = sysfs_root_ + "/" + tty + "/device";
      if (!detail::IsDirectory(device)) continue;
      if (detail::LinkBasename(device + "/subsystem") == "platform") continue;

      PortInfo info;
      info.path = dev_dir_ + "/" + tty;
      const std::string product = FindAttr(device, "product");
      info.name = product.empty() ? tty : product;

      const std::string manufacturer = FindAttr(device, "manufacturer");
      const std::string vid = FindAttr(device, "idVendor");
      const std::string pid = FindAttr(device, "idProduct");
      info.vendor = manufacturer;
      if (!vid.empty()) {
        if (!info.vendor.empty()) info.vendor += " ";
        info.vendor += "(" + vid + ":" + pid + ")";
      }
      ports.push_back(std::move(info));
    }
    return ports;
  }

 private:
  static std::string FindAttr(const std::string& device, const char* attr) {
    static const char* const kLevels[] = {"/", "/../", "/../../"};
    for (const char* level : kLevels) {
      std::string value = detail::ReadSysfsAttr(device + level + attr);
      if (!value.empty()) {
        return value;
      }
    }
    return std::string();
  }

  std::string sysfs_root_;
  std::string dev_dir_;
};

#endif  // DGT_PLATFORM_POSIX

// ============================================================================
// PortScanner
// ============================================================================

/**
 * @brief Case-insensitive glob match of @p port against any pattern.
 *
 * A pattern matches when it matches the device path or the descriptive
 * name.
 */
inline bool PortMatches(const PortInfo& port,
                        const std::vector<std::string>& patterns) {
#if defined(DGT_PLATFORM_POSIX)
  for (const auto& pattern : patterns) {
    if (::fnmatch(pattern.c_str(), port.path.c_str(), FNM_CASEFOLD) == 0 ||
        ::fnmatch(pattern.c_str(), port.name.c_str(), FNM_CASEFOLD) == 0) {
      return true;
    }
  }
#else
  (void)port;
  (void)patterns;
#endif
  return false;
}

class PortScanner final {
 public:
  explicit PortScanner(PortEnumerator& enumerator) : enumerator_(enumerator) {}

  /// @brief Every attached port, sorted by path.
  std::vector<PortInfo> ListAll() {
    std::vector<PortInfo> ports = enumerator_.ListSerialPorts();
    std::sort(ports.begin(), ports.end(),
              [](const PortInfo& a, const PortInfo& b) {
                return a.path < b.path;
              });
    return ports;
  }

  /**
   * @brief Ports matching @p patterns, de-duplicated and sorted by path.
   *
   * An empty pattern list matches nothing.
   */
  std::vector<PortInfo> ListCandidates(
      const std::vector<std::string>& patterns) {
    std::vector<PortInfo> out;
    if (patterns.empty()) {
      return out;
    }
    for (auto& port : ListAll()) {
      if (!PortMatches(port, patterns)) continue;
      if (!out.empty() && out.back().path == port.path) continue;
      out.push_back(std::move(port));
    }
    DGT_LOG_DEBUG("Scanner", "%zu candidate port(s)", out.size());
    return out;
  }

 private:
  PortEnumerator& enumerator_;
};

}  // namespace dgt

#endif  // DGT_PORT_SCANNER_HPP_

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
 * @file transport.hpp
 * @brief Byte-stream transport to the board plus its I/O worker threads.
 *
 * Transport is the seam between protocol logic and the device. The
 * production implementation, SerialPortTransport, is pure POSIX
 * (termios + poll + a self-pipe for wake-ups). Tests inject their own
 * Transport through a TransportFactory.
 *
 * TransportWorker gives each open Transport one reader thread and one
 * writer thread. Both only block on the device; everything they learn is
 * posted back to the EventLoop.
 */

#ifndef DGT_TRANSPORT_HPP_
#define DGT_TRANSPORT_HPP_

#include "dgt/event_loop.hpp"
#include "dgt/log.hpp"
#include "dgt/platform.hpp"
#include "dgt/vocabulary.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <cstring>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#if defined(DGT_PLATFORM_POSIX)
#include <cerrno>

#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>
#endif

namespace dgt {

/// Default DGT line speed.
static constexpr uint32_t kDefaultBaudRate = 9600U;

// ============================================================================
// Transport
// ============================================================================

/**
 * @brief Bidirectional byte stream to one device.
 *
 * Threading contract: ReadChunk() is called from a single reader thread and
 * Write() from a single writer thread; Interrupt() may be called from any
 * thread. Close() is only called once both threads are gone.
 */
class Transport {
 public:
  virtual ~Transport() = default;

  /// @return kUnavailable when the device cannot be opened or configured.
  virtual expected<void, DgtError> Open(const std::string& path) = 0;

  /**
   * @brief Block until at least one byte arrives.
   * @return Bytes read (> 0), kIoLost when the link is gone (a 0-byte read
   *         counts as gone), kCancelled after Interrupt().
   */
  virtual expected<size_t, DgtError> ReadChunk(uint8_t* buf, size_t cap) = 0;

  /// @return kIoLost on write failure.
  virtual expected<void, DgtError> Write(const uint8_t* data, size_t size) = 0;

  /// @brief Wake a blocked ReadChunk() with kCancelled.
  virtual void Interrupt() = 0;

  virtual void Close() = 0;
  virtual bool IsOpen() const = 0;
};

using TransportFactory = std::function<std::unique_ptr<Transport>()>;

// ============================================================================
// SerialPortTransport
// ============================================================================

#if defined(DGT_PLATFORM_POSIX)

class SerialPortTransport final : public Transport {
 public:
  explicit SerialPortTransport(uint32_t baud_rate = kDefaultBaudRate)
      : baud_rate_(baud_rate) {}

  ~SerialPortTransport() override { Close(); }

  SerialPortTransport(const SerialPortTransport&) = delete;
  SerialPortTransport& operator=(const SerialPortTransport&) = delete;

  expected<void, DgtError> Open(const std::string& path) override {
    if (fd_ >= 0) {
      return expected<void, DgtError>::success();
    }

    fd_ = ::open(path.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd_ < 0) {
      DGT_LOG_DEBUG("Serial", "open %s failed: %s", path.c_str(),
                    std::strerror(errno));
      return expected<void, DgtError>::error(DgtError::kUnavailable);
    }

    auto r = ConfigurePort();
    if (!r) {
      DGT_LOG_WARN("Serial", "configure %s failed: %s", path.c_str(),
                   std::strerror(errno));
      Close();
      return r;
    }

    if (::pipe(wake_fds_) != 0) {
      DGT_LOG_WARN("Serial", "pipe failed: %s", std::strerror(errno));
      Close();
      return expected<void, DgtError>::error(DgtError::kUnavailable);
    }
    for (int fd : wake_fds_) {
      const int flags = ::fcntl(fd, F_GETFL, 0);
      (void)::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
      (void)::fcntl(fd, F_SETFD, FD_CLOEXEC);
    }

    path_ = path;
    DGT_LOG_DEBUG("Serial", "opened %s at %u baud", path.c_str(), baud_rate_);
    return expected<void, DgtError>::success();
  }

  expected<size_t, DgtError> ReadChunk(uint8_t* buf, size_t cap) override {
    using Result = expected<size_t, DgtError>;
    if (fd_ < 0) {
      return Result::error(DgtError::kIoLost);
    }

    for (;;) {
      struct pollfd fds[2];
      fds[0].fd = fd_;
      fds[0].events = POLLIN;
      fds[0].revents = 0;
      fds[1].fd = wake_fds_[0];
      fds[1].events = POLLIN;
      fds[1].revents = 0;

      const int rc = ::poll(fds, 2, -1);
      if (rc < 0) {
        if (errno == EINTR) continue;
        return Result::error(DgtError::kIoLost);
      }

      if ((fds[1].revents & POLLIN) != 0) {
        DrainWakePipe();
        return Result::error(DgtError::kCancelled);
      }

      if ((fds[0].revents & POLLIN) != 0) {
        const ssize_t n = ::read(fd_, buf, cap);
        if (n > 0) {
          return Result::success(static_cast<size_t>(n));
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK ||
                      errno == EINTR)) {
          continue;
        }
        DGT_LOG_DEBUG("Serial", "%s read failed (n=%zd)", path_.c_str(), n);
        return Result::error(DgtError::kIoLost);
      }

      if ((fds[0].revents & (POLLHUP | POLLERR | POLLNVAL)) != 0) {
        DGT_LOG_DEBUG("Serial", "%s hang-up (revents=0x%x)", path_.c_str(),
                      static_cast<unsigned>(fds[0].revents));
        return Result::error(DgtError::kIoLost);
      }
    }
  }

  /**
   * @brief Write all bytes; EAGAIN waits for POLLOUT a bounded number of
   *        times within this one call.
   */
  expected<void, DgtError> Write(const uint8_t* data, size_t size) override {
    if (fd_ < 0) {
      return expected<void, DgtError>::error(DgtError::kIoLost);
    }

    size_t written = 0U;
    uint32_t retry_count = 0U;
    while (written < size) {
      const ssize_t n = ::write(fd_, data + written, size - written);
      if (n < 0) {
        const int err = errno;
        if (err == EINTR) continue;
        if (err == EAGAIN || err == EWOULDBLOCK) {
          if (retry_count >= kWriteRetryCount) {
            return expected<void, DgtError>::error(DgtError::kIoLost);
          }
          ++retry_count;
          struct pollfd pfd;
          pfd.fd = fd_;
          pfd.events = POLLOUT;
          pfd.revents = 0;
          (void)::poll(&pfd, 1, static_cast<int>(kWriteRetryDelayMs));
          continue;
        }
        DGT_LOG_DEBUG("Serial", "%s write failed: %s", path_.c_str(),
                      std::strerror(err));
        return expected<void, DgtError>::error(DgtError::kIoLost);
      }
      written += static_cast<size_t>(n);
      retry_count = 0U;
    }
    return expected<void, DgtError>::success();
  }

  void Interrupt() override {
    if (wake_fds_[1] >= 0) {
      const uint8_t b = 1U;
      (void)::write(wake_fds_[1], &b, 1U);
    }
  }

  void Close() override {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
    for (int& fd : wake_fds_) {
      if (fd >= 0) {
        ::close(fd);
        fd = -1;
      }
    }
  }

  bool IsOpen() const override { return fd_ >= 0; }

  uint32_t BaudRate() const noexcept { return baud_rate_; }

 private:
  static constexpr uint32_t kWriteRetryCount = 50U;
  static constexpr uint32_t kWriteRetryDelayMs = 20U;

  expected<void, DgtError> ConfigurePort() {
    struct termios tio;
    std::memset(&tio, 0, sizeof(tio));

    if (::tcgetattr(fd_, &tio) != 0) {
      return expected<void, DgtError>::error(DgtError::kUnavailable);
    }

    // Raw 8N1, no flow control
    tio.c_iflag &= static_cast<tcflag_t>(~(IGNBRK | BRKINT | PARMRK | ISTRIP |
                                           INLCR | IGNCR | ICRNL | IXON |
                                           IXOFF | IXANY));
    tio.c_oflag &= static_cast<tcflag_t>(~OPOST);
    tio.c_lflag &=
        static_cast<tcflag_t>(~(ECHO | ECHONL | ICANON | ISIG | IEXTEN));
    tio.c_cflag &= static_cast<tcflag_t>(~(CSIZE | PARENB | PARODD | CSTOPB));
#ifdef CRTSCTS
    tio.c_cflag &= static_cast<tcflag_t>(~CRTSCTS);
#endif
    tio.c_cflag |= static_cast<tcflag_t>(CLOCAL | CREAD | CS8);

    tio.c_cc[VMIN] = 0;
    tio.c_cc[VTIME] = 0;

    const speed_t speed = BaudToSpeed(baud_rate_);
    ::cfsetispeed(&tio, speed);
    ::cfsetospeed(&tio, speed);

    if (::tcsetattr(fd_, TCSANOW, &tio) != 0) {
      return expected<void, DgtError>::error(DgtError::kUnavailable);
    }
    ::tcflush(fd_, TCIOFLUSH);
    return expected<void, DgtError>::success();
  }

  static speed_t BaudToSpeed(uint32_t baud) noexcept {
    switch (baud) {
      case 9600U:
        return B9600;
      case 19200U:
        return B19200;
      case 38400U:
        return B38400;
      case 57600U:
        return B57600;
      case 115200U:
        return B115200;
      default:
        return B9600;
    }
  }

  void DrainWakePipe() {
    uint8_t sink[16];
    while (::read(wake_fds_[0], sink, sizeof(sink)) > 0) {
    }
  }

  uint32_t baud_rate_;
  int fd_ = -1;
  int wake_fds_[2] = {-1, -1};
  std::string path_;
};

/// @brief Factory producing SerialPortTransport instances.
inline TransportFactory SerialTransportFactory(
    uint32_t baud_rate = kDefaultBaudRate) {
  return [baud_rate]() -> std::unique_ptr<Transport> {
    return std::unique_ptr<Transport>(new SerialPortTransport(baud_rate));
  };
}

#endif  // DGT_PLATFORM_POSIX

// ============================================================================
// TransportWorker
// ============================================================================

/**
 * @brief Reader + writer threads for one open Transport.
 *
 * Incoming chunks and the first I/O failure are posted to the EventLoop
 * through the callbacks given at construction. After an error the worker
 * reports nothing more. Stop() joins both threads and closes the
 * transport; it must not be called from the worker's own threads.
 */
class TransportWorker final {
 public:
  using DataCallback = std::function<void(std::vector<uint8_t>)>;
  using ErrorCallback = std::function<void(DgtError)>;

  TransportWorker(EventLoop& loop, std::unique_ptr<Transport> transport,
                  DataCallback on_data, ErrorCallback on_error)
      : loop_(loop),
        transport_(std::move(transport)),
        on_data_(std::move(on_data)),
        on_error_(std::move(on_error)) {}

  ~TransportWorker() { Stop(); }

  TransportWorker(const TransportWorker&) = delete;
  TransportWorker& operator=(const TransportWorker&) = delete;

  void Start() {
    if (started_) {
      return;
    }
    started_ = true;
    reader_ = std::thread(&TransportWorker::ReadLoop, this);
    writer_ = std::thread(&TransportWorker::WriteLoop, this);
  }

  /// @return false once the worker is stopped or failed.
  bool Send(std::vector<uint8_t> bytes) {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (stop_ || failed_.load(std::memory_order_acquire)) {
        return false;
      }
      outbox_.push_back(std::move(bytes));
    }
    cv_.notify_one();
    return true;
  }

  void Stop() {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (stop_ && !reader_.joinable() && !writer_.joinable()) {
        return;
      }
      stop_ = true;
      outbox_.clear();
    }
    cv_.notify_all();
    if (transport_) {
      transport_->Interrupt();
    }
    if (reader_.joinable()) reader_.join();
    if (writer_.joinable()) writer_.join();
    if (transport_) {
      transport_->Close();
    }
  }

 private:
  static constexpr size_t kReadChunkSize = 256U;

  bool Stopping() {
    std::lock_guard<std::mutex> lock(mtx_);
    return stop_;
  }

  void ReportError(DgtError err) {
    if (failed_.exchange(true, std::memory_order_acq_rel)) {
      return;
    }
    {
      std::lock_guard<std::mutex> lock(mtx_);
    }
    cv_.notify_all();
    if (Stopping()) {
      return;
    }
    ErrorCallback cb = on_error_;
    (void)loop_.Post([cb, err]() { cb(err); });
  }

  void ReadLoop() {
    uint8_t buf[kReadChunkSize];
    for (;;) {
      auto r = transport_->ReadChunk(buf, sizeof(buf));
      if (Stopping() || failed_.load(std::memory_order_acquire)) {
        return;
      }
      if (!r) {
        if (r.get_error() == DgtError::kCancelled) {
          continue;
        }
        ReportError(r.get_error());
        return;
      }
      std::vector<uint8_t> chunk(buf, buf + r.value());
      DataCallback cb = on_data_;
      (void)loop_.Post([cb, chunk]() mutable { cb(std::move(chunk)); });
    }
  }

  void WriteLoop() {
    for (;;) {
      std::vector<uint8_t> bytes;
      {
        std::unique_lock<std::mutex> lock(mtx_);
        cv_.wait(lock, [this]() {
          return stop_ || failed_.load(std::memory_order_acquire) ||
                 !outbox_.empty();
        });
        if (stop_ || failed_.load(std::memory_order_acquire)) {
          return;
        }
        bytes = std::move(outbox_.front());
        outbox_.pop_front();
      }
      auto r = transport_->Write(bytes.data(), bytes.size());
      if (!r) {
        ReportError(r.get_error());
        return;
      }
    }
  }

  EventLoop& loop_;
  std::unique_ptr<Transport> transport_;
  DataCallback on_data_;
  ErrorCallback on_error_;

  std::mutex mtx_;
  std::condition_variable cv_;
  std::deque<std::vector<uint8_t>> outbox_;
  bool stop_ = false;
  bool started_ = false;
  std::atomic<bool> failed_{false};
  std::thread reader_;
  std::thread writer_;
};

}  // namespace dgt

#endif  // DGT_TRANSPORT_HPP_

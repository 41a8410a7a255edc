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
 * @file dgt_demo.cpp
 * @brief Connects to a DGT board, prints events and exercises the clock.
 *
 * Usage:
 *   dgt_demo [--debug] [--config <file>] <port-glob>...
 *
 *   --debug          Enable debug logging.
 *   --config <file>  Load driver settings (ports, timing, log level).
 *   <port-glob>      Glob matched against device paths and port names,
 *                    e.g. "/dev/ttyUSB*" or "DGT*".
 *
 * Press Ctrl+C to exit.
 */

#include "dgt/config.hpp"
#include "dgt/driver.hpp"
#include "dgt/log.hpp"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <signal.h>
#include <unistd.h>

// ============================================================================
// Shutdown signal
// ============================================================================

static int g_wake_pipe[2] = {-1, -1};

static void OnSignal(int /*signo*/) {
  const uint8_t byte = 1;
  (void)::write(g_wake_pipe[1], &byte, 1);
}

static bool InstallSignalHandlers() {
  if (::pipe(g_wake_pipe) != 0) return false;
  struct sigaction sa;
  sa.sa_handler = &OnSignal;
  ::sigemptyset(&sa.sa_mask);
  sa.sa_flags = SA_RESTART;
  return ::sigaction(SIGINT, &sa, nullptr) == 0 &&
         ::sigaction(SIGTERM, &sa, nullptr) == 0;
}

static void WaitForSignal() {
  uint8_t buf = 0;
  while (::read(g_wake_pipe[0], &buf, 1) < 0 && errno == EINTR) {
  }
}

// ============================================================================
// Helpers
// ============================================================================

static int Usage(const char* prog) {
  std::printf("Usage: %s [--debug] [--config <file>] <port-glob>...\n", prog);
  std::printf("  Probably one of:\n");
  dgt::SysfsPortEnumerator enumerator;
  for (const auto& port : enumerator.ListSerialPorts()) {
    std::printf("  * %s (%s %s)\n", port.path.c_str(), port.name.c_str(),
                port.vendor.c_str());
  }
  return 1;
}

template <typename V>
static void PrintResult(const char* label, const dgt::expected<V, dgt::DgtError>& r) {
  if (r) {
    std::printf("%s: %s\n", label, r.value().c_str());
  } else {
    std::printf("%s failed: %s\n", label, dgt::DgtErrorName(r.get_error()));
  }
}

static void ReportAck(const char* what,
                      const dgt::expected<void, dgt::DgtError>& r) {
  if (r) return;
  if (r.get_error() == dgt::DgtError::kTimeout) {
    std::printf("%s timed out.\n", what);
  } else {
    std::printf("%s failed: %s\n", what, dgt::DgtErrorName(r.get_error()));
  }
}

static void DisplaySentence(dgt::Driver& driver, const std::string& sentence) {
  std::istringstream words(sentence);
  std::string word;
  while (words >> word) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    ReportAck("Sending clock text", driver.ClockText(word, false, 500U));
  }
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
  bool debug = false;
  const char* config_path = nullptr;
  std::vector<std::string> globs;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--debug") == 0) {
      debug = true;
    } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
      config_path = argv[++i];
    } else {
      globs.emplace_back(argv[i]);
    }
  }

  dgt::DriverConfig config;
  if (config_path != nullptr) {
    auto loaded = dgt::LoadDriverConfig(config_path);
    if (!loaded) {
      std::fprintf(stderr, "cannot load config %s\n", config_path);
      return 1;
    }
    config = loaded.value();
  }
  if (!globs.empty()) {
    config.port_patterns = globs;
  }
  if (config.port_patterns.empty()) {
    return Usage(argv[0]);
  }

  dgt::log::Init();
  dgt::log::SetLevel(debug ? dgt::log::Level::kDebug : config.log_level);

  if (!InstallSignalHandlers()) {
    DGT_LOG_ERROR("Demo", "cannot install signal handlers");
    return 1;
  }

  dgt::Driver driver(config);

  driver.On<dgt::ConnectedEvent>([](const dgt::ConnectedEvent& e) {
    std::printf("Board connected to %s!\n", e.port.c_str());
  });
  driver.On<dgt::DisconnectedEvent>(
      [](const dgt::DisconnectedEvent&) { std::printf("Board disconnected!\n"); });
  driver.On<dgt::BoardEvent>([](const dgt::BoardEvent& e) {
    std::printf("Position changed:\n%s\n", e.board.ToString().c_str());
  });
  driver.On<dgt::ButtonPressedEvent>([](const dgt::ButtonPressedEvent& e) {
    std::printf("Button %u pressed!\n", static_cast<unsigned>(e.button));
  });
  driver.On<dgt::ClockEvent>([](const dgt::ClockEvent& e) {
    std::printf("Clock status changed: %s\n", e.clock.ToString().c_str());
  });

  auto started = driver.Start();
  if (!started) {
    DGT_LOG_ERROR("Demo", "start failed: %s",
                  dgt::DgtErrorName(started.get_error()));
    return 1;
  }

  // Each request waits for the connection, so a board plugged in late
  // still answers.
  const uint32_t kQueryTimeoutMs = 60000U;
  PrintResult("Version", driver.GetVersion(kQueryTimeoutMs));
  PrintResult("Serial", driver.GetSerialNumber(kQueryTimeoutMs));
  PrintResult("Long serial", driver.GetLongSerialNumber(kQueryTimeoutMs));
  auto board = driver.GetBoard(kQueryTimeoutMs);
  if (board) {
    std::printf("Board: %s\n", board.value().BoardFen().c_str());
  } else {
    std::printf("Board failed: %s\n", dgt::DgtErrorName(board.get_error()));
  }

  auto clock_version = driver.GetClockVersion(1000U);
  if (clock_version) {
    std::printf("Clock version: %s\n", clock_version.value().c_str());
  } else {
    ReportAck("Clock version request",
              dgt::expected<void, dgt::DgtError>::error(
                  clock_version.get_error()));
  }

  std::printf("Displaying text ...\n");
  DisplaySentence(driver,
                  "Now, I am become death, the destroyer of worlds. Ready");

  std::printf("Beep ...\n");
  ReportAck("Beep", driver.ClockBeep(100U, 1000U));

  std::printf("Countdown ...\n");
  ReportAck("Clock set", driver.ClockSet(10U, 7U, true, false, 1000U));

  std::printf("Running ... Press Ctrl+C to exit.\n");
  WaitForSignal();

  std::printf("\nShutting down ...\n");
  driver.Close();
  dgt::log::Shutdown();
  ::close(g_wake_pipe[0]);
  ::close(g_wake_pipe[1]);
  return 0;
}

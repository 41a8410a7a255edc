/**
 * @file test_driver.cpp
 * @brief End-to-end tests for driver.hpp against scripted fake boards.
 */

#include <catch2/catch.hpp>
#include "dgt/driver.hpp"

#include "fake_device.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using dgt::DgtError;
using dgt::DriverState;
using dgt_test::BoardScript;
using dgt_test::FakeHost;
using dgt_test::FakeLink;
using dgt_test::WaitFor;

namespace {

dgt::DriverConfig TestConfig() {
  dgt::DriverConfig cfg;
  cfg.port_patterns = {"/dev/ttyUSB*"};
  cfg.scan_interval_ms = 20U;
  cfg.max_backoff_ms = 100U;
  cfg.handshake_timeout_ms = 200U;
  return cfg;
}

int64_t ElapsedMs(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - start)
      .count();
}

/// Records what a Driver publishes.
struct Recorder {
  std::mutex mtx;
  std::vector<std::string> connected;
  std::vector<std::string> fens;
  std::vector<uint8_t> buttons;
  int disconnects = 0;

  void Attach(dgt::Driver& d) {
    (void)d.On<dgt::ConnectedEvent>([this](const dgt::ConnectedEvent& e) {
      std::lock_guard<std::mutex> lock(mtx);
      connected.push_back(e.port);
    });
    (void)d.On<dgt::DisconnectedEvent>([this](const dgt::DisconnectedEvent&) {
      std::lock_guard<std::mutex> lock(mtx);
      ++disconnects;
    });
    (void)d.On<dgt::BoardEvent>([this](const dgt::BoardEvent& e) {
      std::lock_guard<std::mutex> lock(mtx);
      fens.push_back(e.board.BoardFen());
    });
    (void)d.On<dgt::ButtonPressedEvent>(
        [this](const dgt::ButtonPressedEvent& e) {
          std::lock_guard<std::mutex> lock(mtx);
          buttons.push_back(e.button);
        });
  }

  std::vector<std::string> Connected() {
    std::lock_guard<std::mutex> lock(mtx);
    return connected;
  }
  int Disconnects() {
    std::lock_guard<std::mutex> lock(mtx);
    return disconnects;
  }
  bool SawFen(const std::string& fen) {
    std::lock_guard<std::mutex> lock(mtx);
    for (const auto& f : fens) {
      if (f == fen) return true;
    }
    return false;
  }
};

struct DriverFixture {
  std::shared_ptr<FakeHost> host = std::make_shared<FakeHost>();
  dgt_test::FakeEnumerator* enumerator = nullptr;
  std::vector<dgt::PortInfo> ports;
  std::unique_ptr<dgt::Driver> driver;
  Recorder rec;

  explicit DriverFixture(dgt::DriverConfig cfg = TestConfig()) {
    std::unique_ptr<dgt_test::FakeEnumerator> e(
        new dgt_test::FakeEnumerator());
    enumerator = e.get();
    driver.reset(
        new dgt::Driver(std::move(cfg), std::move(e), host->Factory(host)));
    rec.Attach(*driver);
  }

  ~DriverFixture() { driver.reset(); }

  std::shared_ptr<FakeLink> PlugBoard(
      const std::string& path,
      std::shared_ptr<BoardScript> script = std::make_shared<BoardScript>()) {
    auto link = std::make_shared<FakeLink>();
    dgt_test::AttachBoard(*link, std::move(script));
    host->Plug(path, link);
    ports.push_back(dgt_test::Port(path));
    enumerator->SetPorts(ports);
    return link;
  }

  void UnplugBoard(const std::string& path) {
    for (auto it = ports.begin(); it != ports.end(); ++it) {
      if (it->path == path) {
        ports.erase(it);
        break;
      }
    }
    enumerator->SetPorts(ports);
    host->Unplug(path);
  }

  void StartAndConnect() {
    REQUIRE(driver->Start().has_value());
    REQUIRE(driver->WaitConnected(3000).has_value());
  }
};

}  // namespace

// ============================================================================
// Connection
// ============================================================================

TEST_CASE("driver - Connects to the matching port", "[driver]") {
  DriverFixture fx;
  auto link = fx.PlugBoard("/dev/ttyUSB0");
  (void)fx.PlugBoard("/dev/ttyS0");
  REQUIRE(fx.driver->State() == DriverState::kIdle);
  fx.StartAndConnect();

  REQUIRE(fx.driver->IsConnected());
  REQUIRE(fx.driver->State() == DriverState::kConnected);
  REQUIRE(fx.driver->ConnectedPort() == "/dev/ttyUSB0");
  REQUIRE(fx.rec.Connected() == std::vector<std::string>{"/dev/ttyUSB0"});
  REQUIRE(fx.host->OpenAttempts("/dev/ttyS0") == 0U);

  auto version = fx.driver->GetVersion(1000);
  REQUIRE(version.has_value());
  REQUIRE(version.value() == "1.2");
}

TEST_CASE("driver - Updates are enabled before the first board dump",
          "[driver]") {
  DriverFixture fx;
  auto link = fx.PlugBoard("/dev/ttyUSB0");
  fx.StartAndConnect();
  REQUIRE(WaitFor([&]() {
    return fx.rec.SawFen("rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR");
  }));

  auto writes = link->Writes();
  REQUIRE(writes.size() >= 3U);
  REQUIRE(writes[0] == std::vector<uint8_t>{dgt::kCmdSendVersion});
  REQUIRE(writes[1] == std::vector<uint8_t>{dgt::kCmdSendUpdateNice});
  REQUIRE(writes[2] == std::vector<uint8_t>{dgt::kCmdSendBoard});
}

TEST_CASE("driver - Updates can be left disabled", "[driver]") {
  auto cfg = TestConfig();
  cfg.enable_updates = false;
  DriverFixture fx(cfg);
  auto link = fx.PlugBoard("/dev/ttyUSB0");
  fx.StartAndConnect();
  REQUIRE(WaitFor([&]() { return link->CountWrites(dgt::kCmdSendBoard) == 1U; }));
  REQUIRE(link->CountWrites(dgt::kCmdSendUpdateNice) == 0U);
}

TEST_CASE("driver - Silent candidate is skipped", "[driver]") {
  auto cfg = TestConfig();
  cfg.handshake_timeout_ms = 100U;
  DriverFixture fx(cfg);
  auto silent = std::make_shared<BoardScript>();
  silent->answer_version = false;
  auto silent_link = fx.PlugBoard("/dev/ttyUSB0", silent);
  (void)fx.PlugBoard("/dev/ttyUSB1");
  fx.StartAndConnect();

  REQUIRE(fx.driver->ConnectedPort() == "/dev/ttyUSB1");
  REQUIRE(fx.rec.Connected() == std::vector<std::string>{"/dev/ttyUSB1"});
  REQUIRE(fx.host->OpenAttempts("/dev/ttyUSB0") >= 1U);
  REQUIRE(WaitFor([&]() { return silent_link->IsClosed(); }));
}

TEST_CASE("driver - Failed handshake never emits connected", "[driver]") {
  auto cfg = TestConfig();
  cfg.handshake_timeout_ms = 50U;
  DriverFixture fx(cfg);
  auto script = std::make_shared<BoardScript>();
  script->Set([](BoardScript& s) { s.answer_version = false; });
  (void)fx.PlugBoard("/dev/ttyUSB0", script);
  REQUIRE(fx.driver->Start().has_value());

  REQUIRE(WaitFor([&]() {
    return fx.host->OpenAttempts("/dev/ttyUSB0") >= 2U;
  }));
  REQUIRE(fx.rec.Connected().empty());
  REQUIRE_FALSE(fx.driver->IsConnected());
  REQUIRE(fx.driver->State() != DriverState::kConnected);
  REQUIRE(fx.driver->WaitConnected(10).get_error() == DgtError::kTimeout);

  script->Set([](BoardScript& s) { s.answer_version = true; });
  REQUIRE(fx.driver->WaitConnected(3000).has_value());
  REQUIRE(fx.rec.Connected().size() == 1U);
}

TEST_CASE("driver - Empty scans back off", "[driver]") {
  auto cfg = TestConfig();
  cfg.scan_interval_ms = 20U;
  cfg.max_backoff_ms = 160U;
  DriverFixture fx(cfg);
  REQUIRE(fx.driver->Start().has_value());
  std::this_thread::sleep_for(std::chrono::milliseconds(400));
  const size_t calls = fx.enumerator->Calls();
  REQUIRE(calls >= 3U);
  REQUIRE(calls <= 8U);
  REQUIRE(fx.driver->State() == DriverState::kSearching);
}

TEST_CASE("driver - Start is idempotent", "[driver]") {
  DriverFixture fx;
  (void)fx.PlugBoard("/dev/ttyUSB0");
  REQUIRE(fx.driver->Start().has_value());
  REQUIRE(fx.driver->Start().has_value());
  REQUIRE(fx.driver->WaitConnected(3000).has_value());
  REQUIRE(fx.rec.Connected().size() == 1U);
}

TEST_CASE("driver - ListPorts reports every attached port", "[driver]") {
  DriverFixture fx;
  (void)fx.PlugBoard("/dev/ttyUSB0");
  (void)fx.PlugBoard("/dev/ttyS0");
  auto ports = fx.driver->ListPorts();
  REQUIRE(ports.size() == 2U);
  REQUIRE(ports[0].path == "/dev/ttyS0");
  REQUIRE(ports[1].path == "/dev/ttyUSB0");
}

TEST_CASE("driver - AutoConnect starts the driver", "[driver]") {
  auto host = std::make_shared<FakeHost>();
  auto link = std::make_shared<FakeLink>();
  dgt_test::AttachBoard(*link, std::make_shared<BoardScript>());
  host->Plug("/dev/ttyUSB3", link);
  std::unique_ptr<dgt_test::FakeEnumerator> e(new dgt_test::FakeEnumerator());
  e->SetPorts({dgt_test::Port("/dev/ttyUSB3")});

  auto driver = dgt::AutoConnect(TestConfig(), std::move(e),
                                 host->Factory(host));
  REQUIRE(driver->WaitConnected(3000).has_value());
  REQUIRE(driver->ConnectedPort() == "/dev/ttyUSB3");
}

// ============================================================================
// Requests
// ============================================================================

TEST_CASE("driver - Board queries", "[driver]") {
  DriverFixture fx;
  (void)fx.PlugBoard("/dev/ttyUSB0");
  fx.StartAndConnect();

  REQUIRE(fx.driver->GetSerialNumber(1000).value() == "12345");
  REQUIRE(fx.driver->GetLongSerialNumber(1000).value() == "0123456789");
  REQUIRE(fx.driver->GetTrademark(1000).value() == "Digital Game Technology");

  auto board = fx.driver->GetBoard(1000);
  REQUIRE(board.has_value());
  REQUIRE(board.value().BoardFen() ==
          "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR");
  REQUIRE(board.value().sequence > 0U);
}

TEST_CASE("driver - Clock requests", "[driver]") {
  DriverFixture fx;
  (void)fx.PlugBoard("/dev/ttyUSB0");
  fx.StartAndConnect();

  auto version = fx.driver->GetClockVersion(1000);
  REQUIRE(version.has_value());
  REQUIRE(version.value() == "1.5");

  auto clock = fx.driver->GetClock(1000);
  REQUIRE(clock.has_value());
  REQUIRE(clock.value().left_time_s == 300U);
  REQUIRE(clock.value().right_time_s == 240U);
  REQUIRE(clock.value().left_running);

  REQUIRE(fx.driver->ClockBeep(100, 1000).has_value());
  REQUIRE(fx.driver->ClockSet(10, 7, true, false, 1000).has_value());
  REQUIRE(fx.driver->ClockText("Ready", true, 1000).has_value());
  REQUIRE(fx.driver->ClockEndDisplay(1000).has_value());
}

TEST_CASE("driver - ClockSet rejects invalid arguments", "[driver]") {
  DriverFixture fx;
  REQUIRE(fx.driver->ClockSet(10, 7, true, true, 100).get_error() ==
          DgtError::kInvalidArgument);
  REQUIRE(fx.driver->ClockSet(36000, 7, false, false, 100).get_error() ==
          DgtError::kInvalidArgument);
}

TEST_CASE("driver - Request waits for a board that appears later",
          "[driver]") {
  DriverFixture fx;
  REQUIRE(fx.driver->Start().has_value());
  std::thread plugger([&fx]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    (void)fx.PlugBoard("/dev/ttyUSB0");
  });
  const auto start = std::chrono::steady_clock::now();
  auto r = fx.driver->ClockBeep(100, 1000);
  plugger.join();
  REQUIRE(r.has_value());
  REQUIRE(ElapsedMs(start) >= 250);
}

TEST_CASE("driver - Default scan interval finds a late board in time",
          "[driver]") {
  dgt::DriverConfig cfg;
  cfg.port_patterns = {"/dev/ttyUSB*"};
  DriverFixture fx(cfg);
  REQUIRE(fx.driver->Start().has_value());
  std::thread plugger([&fx]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    (void)fx.PlugBoard("/dev/ttyUSB0");
  });
  auto r = fx.driver->ClockBeep(100, 1000);
  plugger.join();
  REQUIRE(r.has_value());
}

TEST_CASE("driver - Request times out without a board", "[driver]") {
  DriverFixture fx;
  REQUIRE(fx.driver->Start().has_value());
  const auto start = std::chrono::steady_clock::now();
  auto r = fx.driver->ClockBeep(100, 100);
  REQUIRE(r.get_error() == DgtError::kTimeout);
  REQUIRE(ElapsedMs(start) < 1000);
}

TEST_CASE("driver - Timed out request leaves no pending entry",
          "[driver]") {
  DriverFixture fx;
  auto script = std::make_shared<BoardScript>();
  script->Set([](BoardScript& s) { s.answer_clock = false; });
  (void)fx.PlugBoard("/dev/ttyUSB0", script);
  fx.StartAndConnect();

  auto r = fx.driver->ClockBeep(100, 100);
  REQUIRE(r.get_error() == DgtError::kTimeout);

  script->Set([](BoardScript& s) { s.answer_clock = true; });
  REQUIRE(fx.driver->ClockBeep(100, 1000).has_value());
}

TEST_CASE("driver - Cancelled request", "[driver]") {
  DriverFixture fx;
  auto script = std::make_shared<BoardScript>();
  script->Set([](BoardScript& s) { s.answer_clock = false; });
  (void)fx.PlugBoard("/dev/ttyUSB0", script);
  fx.StartAndConnect();

  dgt::CancelToken token;
  std::thread canceller([&token]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    token.Cancel();
  });
  const auto start = std::chrono::steady_clock::now();
  auto r = fx.driver->ClockBeep(100, 5000, &token);
  canceller.join();
  REQUIRE(r.get_error() == DgtError::kCancelled);
  REQUIRE(ElapsedMs(start) < 2000);

  script->Set([](BoardScript& s) { s.answer_clock = true; });
  REQUIRE(fx.driver->ClockBeep(100, 1000).has_value());
}

TEST_CASE("driver - Pre-cancelled token fails immediately", "[driver]") {
  DriverFixture fx;
  REQUIRE(fx.driver->Start().has_value());
  dgt::CancelToken token;
  token.Cancel();
  REQUIRE(fx.driver->GetVersion(5000, &token).get_error() ==
          DgtError::kCancelled);
}

TEST_CASE("driver - Requests from an event handler would deadlock",
          "[driver]") {
  DriverFixture fx;
  std::atomic<int> request_error{-1};
  std::atomic<int> wait_error{-1};
  dgt::Driver* d = fx.driver.get();
  (void)d->On<dgt::ConnectedEvent>([&, d](const dgt::ConnectedEvent&) {
    auto r = d->GetVersion(100);
    request_error = r ? -2 : static_cast<int>(r.get_error());
    auto w = d->WaitConnected(100);
    wait_error = w ? -2 : static_cast<int>(w.get_error());
  });
  (void)fx.PlugBoard("/dev/ttyUSB0");
  fx.StartAndConnect();
  REQUIRE(request_error == static_cast<int>(DgtError::kWouldDeadlock));
  REQUIRE(wait_error == static_cast<int>(DgtError::kWouldDeadlock));
}

// ============================================================================
// Loss / Reconnection
// ============================================================================

TEST_CASE("driver - Link loss fails the in-flight request", "[driver]") {
  DriverFixture fx;
  auto script = std::make_shared<BoardScript>();
  script->Set([](BoardScript& s) { s.answer_board = false; });
  auto link = fx.PlugBoard("/dev/ttyUSB0", script);
  fx.StartAndConnect();

  dgt::expected<dgt::BoardState, DgtError> result =
      dgt::expected<dgt::BoardState, DgtError>::error(DgtError::kUnavailable);
  std::thread caller([&]() { result = fx.driver->GetBoard(5000); });
  REQUIRE(WaitFor([&]() {
    return link->CountWrites(dgt::kCmdSendBoard) == 2U;
  }));
  fx.UnplugBoard("/dev/ttyUSB0");
  caller.join();

  REQUIRE_FALSE(result.has_value());
  REQUIRE(result.get_error() == DgtError::kConnectionLost);
  REQUIRE(WaitFor([&]() { return fx.rec.Disconnects() == 1; }));
  REQUIRE(WaitFor([&]() {
    return fx.driver->State() == DriverState::kSearching;
  }));
  REQUIRE_FALSE(fx.driver->IsConnected());
  REQUIRE(fx.driver->ConnectedPort().empty());
}

TEST_CASE("driver - Reconnects when the board comes back", "[driver]") {
  DriverFixture fx;
  (void)fx.PlugBoard("/dev/ttyUSB0");
  fx.StartAndConnect();

  fx.UnplugBoard("/dev/ttyUSB0");
  REQUIRE(WaitFor([&]() { return fx.rec.Disconnects() == 1; }));
  REQUIRE(WaitFor([&]() { return !fx.driver->IsConnected(); }));
  REQUIRE(fx.driver->GetVersion(50).get_error() == DgtError::kTimeout);

  (void)fx.PlugBoard("/dev/ttyUSB0");
  REQUIRE(WaitFor([&]() { return fx.rec.Connected().size() == 2U; }, 3000));
  REQUIRE(fx.driver->GetVersion(1000).value() == "1.2");
}

TEST_CASE("driver - Events flow from the board", "[driver]") {
  DriverFixture fx;
  auto link = fx.PlugBoard("/dev/ttyUSB0");
  fx.StartAndConnect();
  REQUIRE(WaitFor([&]() {
    return fx.rec.SawFen("rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR");
  }));

  link->Inject(dgt_test::BoardMessage(dgt::kMsgFieldUpdate,
                                      {52, dgt::kPieceEmpty}));
  link->Inject(dgt_test::BoardMessage(dgt::kMsgFieldUpdate,
                                      {36, dgt::kPieceWhitePawn}));
  REQUIRE(WaitFor([&]() {
    return fx.rec.SawFen("rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR");
  }));

  link->Inject(dgt_test::BoardMessage(
      dgt::kMsgBwTime,
      dgt_test::AckPayload(dgt::kClockAckHeader, dgt::kClockAckButton, 0,
                           0x31)));
  REQUIRE(WaitFor([&]() {
    std::lock_guard<std::mutex> lock(fx.rec.mtx);
    return fx.rec.buttons.size() == 1U && fx.rec.buttons[0] == 0U;
  }));
}

// ============================================================================
// Close
// ============================================================================

TEST_CASE("driver - Close fails in-flight and later requests", "[driver]") {
  DriverFixture fx;
  auto script = std::make_shared<BoardScript>();
  script->Set([](BoardScript& s) { s.answer_clock = false; });
  auto link = fx.PlugBoard("/dev/ttyUSB0", script);
  fx.StartAndConnect();

  dgt::expected<void, DgtError> result =
      dgt::expected<void, DgtError>::success();
  std::thread caller([&]() { result = fx.driver->ClockBeep(100, 5000); });
  REQUIRE(WaitFor([&]() {
    return link->CountWrites(dgt::kCmdClockMessage) == 1U;
  }));
  fx.driver->Close();
  caller.join();

  REQUIRE(result.get_error() == DgtError::kClosed);
  REQUIRE(fx.rec.Disconnects() == 1);
  REQUIRE(fx.driver->State() == DriverState::kClosed);
  REQUIRE_FALSE(fx.driver->IsConnected());
  REQUIRE(fx.driver->GetVersion(100).get_error() == DgtError::kClosed);
  REQUIRE(fx.driver->Start().get_error() == DgtError::kClosed);
  REQUIRE(link->IsClosed());

  fx.driver->Close();
  REQUIRE(fx.rec.Disconnects() == 1);
}

TEST_CASE("driver - Close wakes callers waiting for a connection",
          "[driver]") {
  DriverFixture fx;
  REQUIRE(fx.driver->Start().has_value());
  dgt::expected<std::string, DgtError> result =
      dgt::expected<std::string, DgtError>::error(DgtError::kUnavailable);
  std::thread caller([&]() { result = fx.driver->GetVersion(5000); });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  fx.driver->Close();
  caller.join();
  REQUIRE(result.get_error() == DgtError::kClosed);
  REQUIRE(fx.driver->WaitConnected(10).get_error() == DgtError::kClosed);
}

TEST_CASE("driver - Close without Start", "[driver]") {
  DriverFixture fx;
  fx.driver->Close();
  REQUIRE(fx.driver->State() == DriverState::kClosed);
  REQUIRE(fx.driver->GetVersion(10).get_error() == DgtError::kClosed);
}

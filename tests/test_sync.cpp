/**
 * @file test_sync.cpp
 * @brief Tests for sync.hpp: Deadline, CancelToken, ReadySignal.
 */

#include <catch2/catch.hpp>
#include "dgt/sync.hpp"

#include <atomic>
#include <chrono>
#include <thread>

using dgt::DgtError;

TEST_CASE("sync - Deadline expiry", "[sync]") {
  auto never = dgt::Deadline::Never();
  REQUIRE(never.IsInfinite());
  REQUIRE_FALSE(never.Expired());
  REQUIRE(never.RemainingMs() == dgt::kWaitForever);

  auto soon = dgt::Deadline::After(20);
  REQUIRE_FALSE(soon.IsInfinite());
  REQUIRE(soon.RemainingMs() <= 20U);
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  REQUIRE(soon.Expired());
  REQUIRE(soon.RemainingMs() == 0U);

  REQUIRE(dgt::Deadline::After(dgt::kWaitForever).IsInfinite());
}

TEST_CASE("sync - CancelToken runs hooks once", "[sync]") {
  dgt::CancelToken token;
  int calls = 0;
  auto id = token.OnCancel([&]() { ++calls; });
  REQUIRE(id != 0U);
  REQUIRE_FALSE(token.IsCancelled());
  token.Cancel();
  token.Cancel();
  REQUIRE(token.IsCancelled());
  REQUIRE(calls == 1);
}

TEST_CASE("sync - Hook registered after cancel runs inline", "[sync]") {
  dgt::CancelToken token;
  token.Cancel();
  bool ran = false;
  auto id = token.OnCancel([&]() { ran = true; });
  REQUIRE(id == 0U);
  REQUIRE(ran);
}

TEST_CASE("sync - Removed hook does not run", "[sync]") {
  dgt::CancelToken token;
  bool ran = false;
  auto id = token.OnCancel([&]() { ran = true; });
  token.Remove(id);
  token.Cancel();
  REQUIRE_FALSE(ran);
}

TEST_CASE("sync - ReadySignal already set", "[sync]") {
  dgt::ReadySignal ready;
  ready.Set();
  REQUIRE(ready.IsSet());
  REQUIRE(ready.WaitUntil(dgt::Deadline::After(0)).has_value());
}

TEST_CASE("sync - ReadySignal times out", "[sync]") {
  dgt::ReadySignal ready;
  auto r = ready.WaitUntil(dgt::Deadline::After(20));
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == DgtError::kTimeout);
}

TEST_CASE("sync - ReadySignal wakes a waiter", "[sync]") {
  dgt::ReadySignal ready;
  std::thread setter([&]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    ready.Set();
  });
  auto r = ready.WaitUntil(dgt::Deadline::After(2000));
  setter.join();
  REQUIRE(r.has_value());

  ready.Clear();
  REQUIRE_FALSE(ready.IsSet());
}

TEST_CASE("sync - Closed ReadySignal fails waiters", "[sync]") {
  dgt::ReadySignal ready;
  std::thread closer([&]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    ready.Close();
  });
  auto r = ready.WaitUntil(dgt::Deadline::Never());
  closer.join();
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == DgtError::kClosed);

  ready.Set();
  REQUIRE(ready.IsClosed());
  REQUIRE(ready.WaitUntil(dgt::Deadline::After(10)).get_error() ==
          DgtError::kClosed);
}

TEST_CASE("sync - Cancel wakes a ReadySignal waiter", "[sync]") {
  dgt::ReadySignal ready;
  dgt::CancelToken token;
  std::thread canceller([&]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    token.Cancel();
  });
  auto r = ready.WaitUntil(dgt::Deadline::After(5000), &token);
  canceller.join();
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == DgtError::kCancelled);
}

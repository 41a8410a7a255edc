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
 * @file event_bus.hpp
 * @brief Typed synchronous publish/subscribe for driver events.
 *
 * Usage:
 *   dgt::EventBus bus;
 *   auto h = bus.On<dgt::BoardEvent>([](const dgt::BoardEvent& e) { ... });
 *   bus.Emit(dgt::BoardEvent{board});
 *   bus.Off(h);
 *
 * Emit() calls handlers for the event's kind in registration order, on the
 * emitting thread, outside the registry lock. Handlers may subscribe or
 * unsubscribe from inside a callback; the change applies to the next Emit().
 */

#ifndef DGT_EVENT_BUS_HPP_
#define DGT_EVENT_BUS_HPP_

#include "dgt/board.hpp"
#include "dgt/clock.hpp"
#include "dgt/log.hpp"
#include "dgt/platform.hpp"

#include <array>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace dgt {

// ============================================================================
// Event Kinds
// ============================================================================

struct ConnectedEvent {
  std::string port;
};

struct DisconnectedEvent {};

struct BoardEvent {
  BoardState board;
};

struct ButtonPressedEvent {
  uint8_t button = 0U;
};

struct ClockEvent {
  ClockState clock;
};

using DgtEvent = std::variant<ConnectedEvent, DisconnectedEvent, BoardEvent,
                              ButtonPressedEvent, ClockEvent>;

static constexpr size_t kEventKindCount = std::variant_size<DgtEvent>::value;

enum class EventKind : uint8_t {
  kConnected = 0,
  kDisconnected,
  kBoard,
  kButtonPressed,
  kClock,
};

inline const char* EventKindName(EventKind kind) noexcept {
  switch (kind) {
    case EventKind::kConnected:
      return "connected";
    case EventKind::kDisconnected:
      return "disconnected";
    case EventKind::kBoard:
      return "board";
    case EventKind::kButtonPressed:
      return "button_pressed";
    case EventKind::kClock:
      return "clock";
    default:
      return "unknown";
  }
}

namespace detail {

template <typename T, size_t I, typename Variant>
struct EventIndexImpl;

template <typename T, size_t I>
struct EventIndexImpl<T, I, std::variant<>> {
  static constexpr size_t value = static_cast<size_t>(-1);
};

template <typename T, size_t I, typename First, typename... Rest>
struct EventIndexImpl<T, I, std::variant<First, Rest...>> {
  static constexpr size_t value =
      std::is_same<T, First>::value
          ? I
          : EventIndexImpl<T, I + 1, std::variant<Rest...>>::value;
};

}  // namespace detail

template <typename T>
struct EventIndex {
  static constexpr size_t value =
      detail::EventIndexImpl<T, 0, DgtEvent>::value;
  static_assert(value != static_cast<size_t>(-1), "Type is not a DgtEvent");
};

template <typename T>
constexpr EventKind KindOf() noexcept {
  return static_cast<EventKind>(EventIndex<T>::value);
}

// ============================================================================
// Subscription Handle
// ============================================================================

struct SubscriptionHandle {
  uint32_t kind;
  uint32_t callback_id;

  bool IsValid() const noexcept { return callback_id != UINT32_MAX; }

  static SubscriptionHandle Invalid() noexcept { return {0, UINT32_MAX}; }
};

// ============================================================================
// EventBus
// ============================================================================

class EventBus final {
 public:
  using Handler = std::function<void(const DgtEvent&)>;

  EventBus() = default;
  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  /**
   * @brief Register @p fn for events of type @p T.
   * @tparam Func Callable with signature void(const T&).
   */
  template <typename T, typename Func>
  SubscriptionHandle On(Func&& fn) {
    constexpr size_t kind = EventIndex<T>::value;
    Handler wrapper = [f = std::forward<Func>(fn)](const DgtEvent& ev) {
      f(std::get<T>(ev));
    };
    std::lock_guard<std::mutex> lock(mutex_);
    const uint32_t id = next_callback_id_++;
    handlers_[kind].push_back(Entry{id, std::move(wrapper)});
    return SubscriptionHandle{static_cast<uint32_t>(kind), id};
  }

  /// @return true if the handler was found and removed.
  bool Off(const SubscriptionHandle& handle) {
    if (!handle.IsValid() || handle.kind >= kEventKindCount) {
      return false;
    }
    Handler removed;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto& list = handlers_[handle.kind];
      for (auto it = list.begin(); it != list.end(); ++it) {
        if (it->id == handle.callback_id) {
          removed = std::move(it->fn);
          list.erase(it);
          break;
        }
      }
    }
    return static_cast<bool>(removed);
  }

  /**
   * @brief Deliver @p event to every handler of its kind.
   *
   * A handler that throws is logged and skipped; the remaining handlers
   * still run.
   */
  void Emit(const DgtEvent& event) {
    const size_t kind = event.index();
    std::vector<Entry> snapshot;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      snapshot = handlers_[kind];
    }
    for (const auto& entry : snapshot) {
#ifdef DGT_HAS_EXCEPTIONS
      try {
        entry.fn(event);
      } catch (const std::exception& e) {
        DGT_LOG_ERROR("EventBus", "%s handler #%u threw: %s",
                      EventKindName(static_cast<EventKind>(kind)), entry.id,
                      e.what());
      } catch (...) {
        DGT_LOG_ERROR("EventBus",
                      "%s handler #%u threw a non-standard exception",
                      EventKindName(static_cast<EventKind>(kind)), entry.id);
      }
#else
      entry.fn(event);
#endif
    }
  }

  size_t HandlerCount(EventKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_[static_cast<size_t>(kind)].size();
  }

 private:
  struct Entry {
    uint32_t id;
    Handler fn;
  };

  mutable std::mutex mutex_;
  std::array<std::vector<Entry>, kEventKindCount> handlers_;
  uint32_t next_callback_id_ = 0U;
};

}  // namespace dgt

#endif  // DGT_EVENT_BUS_HPP_

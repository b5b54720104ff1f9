// pkgindex/index/event.hpp - Package change notifications
#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/logger.h>

namespace pkgindex
{

enum class EventKind : uint8_t {
  Create,
  Update,
  Delete,
};

/// "CreateEvent", "UpdateEvent", "DeleteEvent"
[[nodiscard]] std::string_view to_string(EventKind kind) noexcept;

/// "created", "updated", "deleted"
[[nodiscard]] std::string_view event_verb(EventKind kind) noexcept;

struct Event
{
  EventKind kind = EventKind::Create;
  std::string path;  ///< Absolute package directory

  /// Package: created "<dir>"
  [[nodiscard]] std::string message() const;

  bool operator==(const Event & other) const = default;
};

using EventHandler = std::function<void(const Event &)>;

/**
 * Collects change notifications in emission order.
 *
 * emit() is called from walker threads after the registry mutation it
 * describes is visible. A disabled sink drops everything. The handler is
 * never run concurrently with itself and sees events in queue order; it may
 * call drain() but must not emit.
 */
class EventSink
{
public:
  EventSink(bool enabled, std::shared_ptr<spdlog::logger> logger);

  EventSink(const EventSink &) = delete;
  EventSink & operator=(const EventSink &) = delete;

  void emit(EventKind kind, std::string path);

  /// Take every queued event.
  [[nodiscard]] std::vector<Event> drain();

  /// Install a callback run synchronously by emit(), possibly on a worker.
  void set_handler(EventHandler handler);

  [[nodiscard]] bool enabled() const noexcept { return enabled_.load(); }

  /// Suppress or resume emission.
  void set_enabled(bool enabled) noexcept { enabled_.store(enabled); }

private:
  std::atomic<bool> enabled_;
  std::shared_ptr<spdlog::logger> logger_;
  std::mutex dispatch_mu_;  ///< Orders queue pushes with handler calls
  std::mutex mu_;
  std::vector<Event> queue_;
  EventHandler handler_;
};

}  // namespace pkgindex

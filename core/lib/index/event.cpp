// pkgindex/index/event.cpp - Package change notifications
#include "pkgindex/index/event.hpp"

#include <utility>

#include <fmt/format.h>

namespace pkgindex
{

std::string_view to_string(EventKind kind) noexcept
{
  switch (kind) {
    case EventKind::Create:
      return "CreateEvent";
    case EventKind::Update:
      return "UpdateEvent";
    case EventKind::Delete:
      return "DeleteEvent";
  }
  return "Invalid";
}

std::string_view event_verb(EventKind kind) noexcept
{
  switch (kind) {
    case EventKind::Create:
      return "created";
    case EventKind::Update:
      return "updated";
    case EventKind::Delete:
      return "deleted";
  }
  return "invalid";
}

std::string Event::message() const
{
  return fmt::format("Package: {} \"{}\"", event_verb(kind), path);
}

EventSink::EventSink(bool enabled, std::shared_ptr<spdlog::logger> logger)
: enabled_(enabled), logger_(std::move(logger))
{
}

void EventSink::emit(EventKind kind, std::string path)
{
  if (!enabled_.load()) {
    return;
  }

  Event event{kind, std::move(path)};
  if (logger_) {
    logger_->info(event.message());
  }

  // Held across the handler so calls are serialized in queue order.
  std::lock_guard dispatch(dispatch_mu_);
  EventHandler handler;
  {
    std::lock_guard lock(mu_);
    queue_.push_back(event);
    handler = handler_;
  }
  if (handler) {
    handler(event);
  }
}

std::vector<Event> EventSink::drain()
{
  std::lock_guard lock(mu_);
  std::vector<Event> out;
  out.swap(queue_);
  return out;
}

void EventSink::set_handler(EventHandler handler)
{
  std::lock_guard lock(mu_);
  handler_ = std::move(handler);
}

}  // namespace pkgindex

#pragma once

#include <cstdint>
#include <functional>

namespace kalx {

using HostTimerId = std::uint64_t;

/**
 * The host's event loop as seen by the scheduler.
 *
 * Mirrors the primitives a browser-like host offers: a microtask turn, a
 * frame callback carrying the frame start time, an idle callback with a
 * bounded wait, and plain timeouts. All callbacks run on the thread that
 * drives the loop.
 */
class HostEventLoop {
public:
  using Callback = std::function<void()>;
  using FrameCallback = std::function<void(double frameStartMs)>;

  virtual ~HostEventLoop() = default;

  // Milliseconds on a monotonic clock.
  [[nodiscard]] virtual double now() const = 0;

  virtual void queueMicrotask(Callback callback) = 0;
  virtual void requestAnimationFrame(FrameCallback callback) = 0;
  // Runs when the host is idle, or after timeoutMs at the latest.
  virtual void requestIdleCallback(Callback callback, double timeoutMs) = 0;
  virtual HostTimerId setTimeout(Callback callback, double delayMs) = 0;
  virtual void clearTimeout(HostTimerId id) = 0;
};

} // namespace kalx

#ifndef CLOCK_HPP
#define CLOCK_HPP

#include <atomic>
#include <chrono>
#include <cstdint>

namespace meshlink {

/**
 * Wall clock used for link first_seen/last_seen stamps.
 *
 * Production code calls Clock::instance().now_millis(). Tests install a
 * MockClock:
 *   MockClock mock(1000);
 *   Clock::set_instance(&mock);
 *   ...
 *   Clock::reset();
 */
class Clock {
 public:
  virtual ~Clock() = default;

  // Milliseconds since the Unix epoch.
  virtual int64_t now_millis() const = 0;

  static Clock& instance() {
    Clock* inst = instance_.load(std::memory_order_acquire);
    return inst ? *inst : default_instance();
  }

  // Pass nullptr to restore the SystemClock.
  static void set_instance(Clock* clock) {
    instance_.store(clock, std::memory_order_release);
  }

  static void reset() { set_instance(nullptr); }

 private:
  static Clock& default_instance();
  static std::atomic<Clock*> instance_;
};

class SystemClock : public Clock {
 public:
  int64_t now_millis() const override {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
  }
};

class MockClock : public Clock {
 public:
  explicit MockClock(int64_t initial_millis = 0)
      : current_millis_(initial_millis) {}

  int64_t now_millis() const override {
    return current_millis_.load(std::memory_order_relaxed);
  }

  void set_time(int64_t millis) {
    current_millis_.store(millis, std::memory_order_relaxed);
  }

  void advance_millis(int64_t millis) {
    current_millis_.fetch_add(millis, std::memory_order_relaxed);
  }

  void advance_seconds(int64_t seconds) { advance_millis(seconds * 1000); }

 private:
  std::atomic<int64_t> current_millis_;
};

inline int64_t now_millis() { return Clock::instance().now_millis(); }

}  // namespace meshlink

#endif  // CLOCK_HPP

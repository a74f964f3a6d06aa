#include "clock.hpp"

namespace meshlink {

std::atomic<Clock*> Clock::instance_{nullptr};

Clock& Clock::default_instance() {
  static SystemClock system_clock;
  return system_clock;
}

}  // namespace meshlink

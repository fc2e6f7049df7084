#include "Clock.h"

#include <chrono>
#include <ctime>

uint32_t SystemClock::nowS() const {
  using namespace std::chrono;
  return (uint32_t)duration_cast<seconds>(steady_clock::now().time_since_epoch()).count();
}

std::string SystemClock::timestamp() const {
  const std::time_t t = std::time(nullptr);
  std::tm tmv{};
  localtime_r(&t, &tmv);

  char buf[32];
  if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tmv) == 0) return std::string{};
  return std::string(buf);
}

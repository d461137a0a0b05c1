#ifndef SCOPED_TIMER_HPP
#define SCOPED_TIMER_HPP

#include <chrono>
#include <functional>
#include <utility>

// Reports the lifetime of the scope, in seconds, to `observer` on destruction.
class ScopedTimer {
public:
  using Observer = std::function<void(double)>;

  explicit ScopedTimer(Observer observer)
      : observer_(std::move(observer)),
        start_time_(std::chrono::high_resolution_clock::now()) {}

  ScopedTimer(const ScopedTimer &) = delete;
  ScopedTimer &operator=(const ScopedTimer &) = delete;

  ~ScopedTimer() {
    if (!observer_)
      return;
    auto end_time = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::duration<double>>(
        end_time - start_time_);
    observer_(duration.count());
  }

private:
  Observer observer_;
  std::chrono::time_point<std::chrono::high_resolution_clock> start_time_;
};

#endif // SCOPED_TIMER_HPP

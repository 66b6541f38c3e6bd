#pragma once
#include <chrono>
#include <type_traits>
#include <utility>

using dmilliseconds = std::chrono::duration<double, std::milli>;

struct timer {
  using clock = std::chrono::steady_clock;
  clock::time_point started = clock::now();

  dmilliseconds measure() const {
    return std::chrono::duration_cast<dmilliseconds>(clock::now() - started);
  }
};

template<typename T>
struct timed_result {
  T result;
  dmilliseconds elapsed;
};

// Runs fn on the calling thread. Whatever fn throws escapes unchanged.
template<typename Fn>
auto timed(Fn&& fn) -> timed_result<std::decay_t<std::invoke_result_t<Fn&>>> {
  timer t;
  auto result = fn();
  auto elapsed = t.measure();
  return {std::move(result), elapsed};
}

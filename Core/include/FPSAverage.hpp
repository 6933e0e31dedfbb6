#pragma once

#include "Logger.hpp"
#include "Types.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <tuple>

namespace DnD {

template <usize N = 10000> struct FPSAverage {
  std::array<floating, N> frame_times{};
  floating frame_time_sum = 0.0;
  usize frame_time_index = 0;
  usize frame_counter = 0;

  std::chrono::high_resolution_clock::time_point last_time;
  bool initialized = false;

  auto update() -> void {
    if (!initialized) {
      last_time = std::chrono::high_resolution_clock::now();
      initialized = true;
      return;
    }

    const auto current_time = std::chrono::high_resolution_clock::now();
    const auto delta_time_seconds =
        std::chrono::duration<floating>(current_time - last_time).count();
    last_time = current_time;
    record(delta_time_seconds);
  }

  auto record(floating delta_time_seconds) -> void {
    frame_time_sum -= frame_times[frame_time_index];
    frame_times[frame_time_index] = delta_time_seconds;
    frame_time_sum += delta_time_seconds;
    frame_time_index = (frame_time_index + 1) % N;

    frame_counter++;
  }

  [[nodiscard]] auto should_print() const -> bool {
    return (frame_counter + 1) % N == 0;
  }

  auto print() const -> void {
    const auto [frame_time_ms, fps] = get_statistics();
    debug("Average Frame Time: {:.6f} ms, FPS: {:.0f}", frame_time_ms, fps);
  }

  /// Average over the recorded frames only. Zero until a frame time is
  /// recorded.
  [[nodiscard]] auto get_statistics() const -> std::tuple<floating, floating> {
    const auto samples = std::min(frame_counter, N);
    if (samples == 0 || frame_time_sum <= 0.0F) {
      return {0.0F, 0.0F};
    }
    const auto avg_frame_time = frame_time_sum / static_cast<floating>(samples);
    return {1000.0F * avg_frame_time, 1.0F / avg_frame_time};
  }
};

} // namespace DnD

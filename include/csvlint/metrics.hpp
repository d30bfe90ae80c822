#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace csvlint {

struct StageTiming {
  std::string name;
  double duration_ms = 0.0;
};

struct RunStats {
  std::uint64_t records = 0;
  std::uint64_t bytes = 0;
  double wall_time_ms = 0.0;
  double throughput_mb_s = 0.0;

  std::vector<StageTiming> stages;                 // first-start order
  std::map<std::string, std::uint64_t> errors_by_kind;
};

// Per-run counters. Not thread-safe; one registry per validation run.
class MetricsRegistry {
public:
  void reset();
  void add_record() noexcept { ++records_; }
  void add_bytes(std::uint64_t b) noexcept { bytes_ += b; }

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);

  void add_error(std::string_view kind);

  std::uint64_t records() const noexcept { return records_; }
  std::uint64_t bytes() const noexcept { return bytes_; }

  RunStats snapshot(double wall_ms) const;

private:
  std::uint64_t records_{0};
  std::uint64_t bytes_{0};
  std::map<std::string, std::uint64_t> kind_errs_;
  std::vector<std::string> stage_order_;
  std::unordered_map<std::string, double> stage_accum_ms_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> stage_starts_;
};

}

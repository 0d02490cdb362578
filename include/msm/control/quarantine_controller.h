// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>

namespace msm { namespace control {

// Concurrent-free tracker. free_begin/free_end bracket each free; the peak
// number of overlapping frees since the last read feeds the controller.
class ContentionSignal final {
 public:
  void free_begin() noexcept;
  void free_end() noexcept;
  std::uint64_t current() const noexcept { return active_.load(std::memory_order_relaxed); }
  std::uint64_t read_and_reset_peak() noexcept;

 private:
  std::atomic<std::uint64_t> active_{0};
  std::atomic<std::uint64_t> peak_{0};
};

class ContentionScope final {
 public:
  explicit ContentionScope(ContentionSignal& s) noexcept : s_(s) { s_.free_begin(); }
  ~ContentionScope() { s_.free_end(); }
  ContentionScope(const ContentionScope&) = delete;
  ContentionScope& operator=(const ContentionScope&) = delete;

 private:
  ContentionSignal& s_;
};

struct QuarantineControllerSummary {
  std::size_t depth{0};
  double lambda_latency{0.0};
  double lambda_memory{0.0};
  double escape_rate{0.0};
  double last_p99_ns{0.0};
  std::uint64_t epochs{0};
  std::uint64_t total_frees{0};
  std::uint64_t total_detections{0};
  std::uint64_t last_contention_peak{0};
};

// Primal-dual controller for the quarantine depth. Every kEpochFrees frees it
// takes one projected gradient step on the depth against a Lagrangian of
// memory cost, p99 free latency and detection benefit, then a dual ascent
// step on the latency and memory constraints.
class QuarantineController final {
 public:
  static constexpr std::size_t kMinDepth = 64;
  static constexpr std::size_t kMaxDepth = 65536;
  static constexpr std::size_t kDefaultDepth = 4096;
  static constexpr std::uint64_t kEpochFrees = 256;
  static constexpr double kPrimalLr = 0.1;
  static constexpr double kDualLr = 0.01;
  static constexpr double kSafetyEpsilon = 1e-6;
  static constexpr std::size_t kLatencyWindow = 64;
  static constexpr double kLatencyBudgetNs = 1e6;
  static constexpr double kMemorySoftFraction = 0.5;
  static constexpr double kDualMax = 10.0;

  QuarantineController() = default;
  QuarantineController(const QuarantineController&) = delete;
  QuarantineController& operator=(const QuarantineController&) = delete;

  // detection: this free (or a use since the last free) caught a stale
  // pointer. Returns true when an epoch update ran.
  bool record_free(std::uint64_t latency_ns, bool detection);

  std::size_t depth() const noexcept { return depth_atomic_.load(std::memory_order_relaxed); }
  ContentionSignal& contention() noexcept { return contention_; }

  QuarantineControllerSummary summary() const;

 private:
  void update_epoch_locked_();
  double p99_locked_() const;

  mutable std::mutex mu_;
  double depth_{static_cast<double>(kDefaultDepth)};
  double lambda_latency_{0.1};
  double lambda_memory_{0.1};
  double escape_rate_{0.0};
  double last_p99_{0.0};
  std::array<std::uint64_t, kLatencyWindow> latencies_{};
  std::size_t latency_pos_{0};
  std::size_t latency_count_{0};
  std::uint64_t frees_this_epoch_{0};
  std::uint64_t detections_this_epoch_{0};
  std::uint64_t epochs_{0};
  std::uint64_t total_frees_{0};
  std::uint64_t total_detections_{0};
  std::uint64_t last_peak_{0};
  ContentionSignal contention_;
  std::atomic<std::size_t> depth_atomic_{kDefaultDepth};
};

// Process-wide published depth, readable without locking.
std::size_t published_quarantine_depth() noexcept;
void publish_quarantine_depth(std::size_t depth) noexcept;

}} // namespace msm::control

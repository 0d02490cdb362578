// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>

namespace msm { namespace control {

enum class Stage : std::uint8_t {
  Null = 0,
  TlsCache = 1,
  Bloom = 2,
  Arena = 3,
  Fingerprint = 4,
  Canary = 5,
  Bounds = 6,
};

inline constexpr std::size_t kNumStages = 7;
using StageOrder = std::array<Stage, kNumStages>;

inline constexpr StageOrder kDefaultStageOrder = {
    Stage::Null, Stage::TlsCache, Stage::Bloom, Stage::Arena,
    Stage::Fingerprint, Stage::Canary, Stage::Bounds};

// Nominal per-stage cost in nanoseconds.
inline constexpr std::array<std::uint32_t, kNumStages> kStageCostNs = {1, 5, 10, 30, 20, 10, 5};

std::string_view to_string(Stage s) noexcept;

// True when order holds every stage exactly once.
bool is_permutation_of_all_stages(const StageOrder& order) noexcept;

// Null first, then the lookup stages (TlsCache, Bloom, Arena) in their
// relative order within the input, then the integrity stages
// (Fingerprint, Canary, Bounds) in their relative order.
StageOrder dependency_safe(const StageOrder& order) noexcept;

struct StageOracleSummary {
  std::uint64_t calls{0};
  std::uint64_t early_exits{0};
  std::uint64_t reorderings_applied{0};
  std::uint64_t recomputations{0};
  std::uint64_t dropped_reports{0};
  std::array<StageOrder, 16> orders{};
};

// Contextual bandit over stage orderings. Each (family, alignment) context
// keeps Beta(alpha, beta) early-exit estimates per stage and re-sorts the
// stages by exit probability per nanosecond every kRecomputeInterval
// reports. Published orders are lock-free to read.
class StageOracle final {
 public:
  static constexpr std::size_t kNumContexts = 16;
  static constexpr std::uint64_t kRecomputeInterval = 128;
  static constexpr double kDecayThreshold = 512.0;
  static constexpr double kDecayTarget = 256.0;

  StageOracle();

  StageOracle(const StageOracle&) = delete;
  StageOracle& operator=(const StageOracle&) = delete;

  static std::size_t context_index(std::uint8_t family, bool aligned) noexcept {
    const std::size_t f = family < 7 ? family : 7;
    return (f * 2 + (aligned ? 1 : 0)) % kNumContexts;
  }

  StageOrder order_for(std::uint8_t family, bool aligned) const noexcept;

  // Report the order that was run and the stage that ended the call
  // conclusively (nullopt when every stage ran). Stages after the exit
  // are not updated. Dropped without blocking if another thread holds the
  // oracle lock.
  void report_outcome(std::uint8_t family, bool aligned, const StageOrder& order_used,
                      std::optional<Stage> exit_stage);

  // Exit probability estimate for tests and telemetry.
  double exit_probability(std::size_t context, Stage s) const;

  StageOracleSummary summary() const;

 private:
  struct Arm {
    double alpha{1.0};
    double beta{1.0};
    double mean() const noexcept { return alpha / (alpha + beta); }
  };
  struct Context {
    std::array<Arm, kNumStages> arms{};
    std::uint64_t reports{0};
  };

  void recompute_locked_(std::size_t ctx);
  static std::uint32_t pack_(const StageOrder& order) noexcept;
  static StageOrder unpack_(std::uint32_t packed) noexcept;

  mutable std::mutex mu_;
  std::array<Context, kNumContexts> contexts_{};
  std::array<std::atomic<std::uint32_t>, kNumContexts> published_{};
  std::uint64_t calls_{0};
  std::uint64_t early_exits_{0};
  std::uint64_t reorderings_{0};
  std::uint64_t recomputations_{0};
  std::atomic<std::uint64_t> dropped_{0};
};

}} // namespace msm::control

// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string_view>
#include <vector>

#include "msm/arena/arena.h"
#include "msm/control/fusion.h"
#include "msm/control/probe_scheduler.h"
#include "msm/control/risk_envelope.h"
#include "msm/core/api_family.h"
#include "msm/core/safety_level.h"
#include "msm/monitors/base_signals.h"
#include "msm/monitors/ensemble.h"

namespace msm { namespace control {

enum class Profile : std::uint8_t {
  Fast = 0,
  Full = 1,
};

std::string_view to_string(Profile p) noexcept;

struct Decision {
  Profile profile{Profile::Full};
  std::uint32_t risk_ppm{0};
};

// One finished validation as seen by the kernel.
struct ValidationEvent {
  core::ApiFamily family{core::ApiFamily::PointerValidation};
  Profile profile{Profile::Full};
  std::uint64_t elapsed_ns{0};
  std::uint32_t lookup_cost_ns{0};  // nominal cost of the lookup stages that ran
  bool adverse{false};
  bool null{false};
  bool cache_hit{false};
  bool foreign{false};
  bool temporal{false};
  bool bloom_reject{false};
  bool page_disagreement{false};
  bool arena_miss{false};
  bool interior_pointer{false};
  bool fingerprint_mismatch{false};
};

struct FreeEvent {
  arena::FreeResult result{arena::FreeResult::Freed};
  std::uint64_t latency_ns{0};
  double byte_pressure{0.0};   // user size over the per-shard byte budget
  std::size_t drained{0};
  bool evicted_self{false};    // the block left quarantine in the same call
  std::uint64_t contention_peak{0};
};

struct RuntimeKernelSummary {
  std::uint64_t decisions{0};
  std::uint64_t full_decisions{0};
  std::uint64_t risk_escalations{0};
  std::uint64_t observations{0};
  std::uint64_t dropped_observations{0};
  std::uint64_t meta_steps{0};
  std::uint64_t plan_refreshes{0};
  monitors::Level worst_level{monitors::Level::Calibrating};
  bool calibrating{true};
  std::size_t warning_monitors{0};
  std::size_t critical_monitors{0};
  std::uint32_t fusion_bonus_ppm{0};
  FusionSummary fusion{};
  ProbeSchedulerSummary probes{};
  monitors::SeverityVector severity{};
};

// Risk fusion kernel. decide() is the hot path and only reads published
// atomics; observations fold into the base signals under one coarse lock
// and are dropped rather than waited for when the lock is busy. Every
// kMetaCadence observations the severity vector is pushed through the
// monitor ensemble and the fused state is republished.
class RuntimeKernel final {
 public:
  static constexpr std::uint64_t kMetaCadence = 8;
  static constexpr std::uint64_t kPlanEpoch = 512;
  static constexpr std::uint32_t kStrictFullThresholdPpm = 180000;
  static constexpr std::uint32_t kHardenedFullThresholdPpm = 100000;
  static constexpr std::uint32_t kWarningBonusPpm = 100000;
  static constexpr std::uint32_t kCriticalBonusPpm = 250000;
  static constexpr std::size_t kLargeAllocation = std::size_t{1} << 20;

  RuntimeKernel();

  RuntimeKernel(const RuntimeKernel&) = delete;
  RuntimeKernel& operator=(const RuntimeKernel&) = delete;

  Decision decide(core::ApiFamily family, core::SafetyLevel mode) noexcept;

  void observe_validation(const ValidationEvent& e);
  void observe_free(const FreeEvent& e);
  void observe_allocation(std::size_t size, bool ok);

  monitors::Level worst_level() const noexcept {
    return static_cast<monitors::Level>(worst_level_.load(std::memory_order_acquire));
  }
  bool calibrating() const noexcept { return calibrating_.load(std::memory_order_acquire); }

  const RiskEnvelope& risk() const noexcept { return risk_; }
  RuntimeKernelSummary summary() const;
  std::vector<monitors::MonitorSummary> monitor_summaries() const;
  ProbePlan plan() const;

 private:
  void after_observation_locked_(bool adverse);
  void meta_step_locked_(core::SafetyLevel mode);

  RiskEnvelope risk_;

  mutable std::mutex mu_;
  monitors::BaseSignals signals_;
  monitors::Ensemble ensemble_;
  ProbeScheduler scheduler_;
  FusionWeights fusion_;
  ProbePlan plan_{};
  std::uint64_t observations_{0};
  std::uint64_t meta_steps_{0};
  std::uint64_t plan_refreshes_{0};
  std::uint64_t last_plan_decisions_{0};
  std::uint64_t last_meta_decisions_{0};
  std::uint64_t last_meta_risk_full_{0};
  bool adverse_since_meta_{false};

  std::atomic<std::uint8_t> worst_level_{static_cast<std::uint8_t>(monitors::Level::Calibrating)};
  std::atomic<bool> calibrating_{true};
  std::atomic<std::uint32_t> fusion_bonus_ppm_{0};
  std::atomic<std::uint64_t> decisions_{0};
  std::atomic<std::uint64_t> full_decisions_{0};
  std::atomic<std::uint64_t> risk_full_decisions_{0};
  std::atomic<std::uint64_t> dropped_{0};
};

}} // namespace msm::control

// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "msm/control/runtime_kernel.h"

#include <algorithm>

#include "msm/logging/logging.h"

namespace msm { namespace control {

using monitors::Level;
using monitors::Signal;

namespace {

constexpr double flag(bool b) noexcept { return b ? 1.0 : 0.0; }

} // namespace

std::string_view to_string(Profile p) noexcept {
  return p == Profile::Fast ? "fast" : "full";
}

RuntimeKernel::RuntimeKernel() : fusion_(ensemble_.size()) {}

Decision RuntimeKernel::decide(core::ApiFamily family, core::SafetyLevel mode) noexcept {
  decisions_.fetch_add(1, std::memory_order_relaxed);
  const Level worst = worst_level();
  const bool calibrating = calibrating_.load(std::memory_order_acquire);

  std::uint64_t risk = risk_.upper_bound_ppm(family);
  risk += fusion_bonus_ppm_.load(std::memory_order_relaxed);
  if (worst == Level::Warning) risk += kWarningBonusPpm;
  if (worst == Level::Critical) risk += kCriticalBonusPpm;
  Decision d;
  d.risk_ppm = static_cast<std::uint32_t>(std::min<std::uint64_t>(risk, 1000000));

  if (mode == core::SafetyLevel::Off) {
    d.profile = Profile::Fast;
    return d;
  }
  if (calibrating || worst >= Level::Warning) {
    d.profile = Profile::Full;
  } else {
    const std::uint32_t threshold =
        mode == core::SafetyLevel::Hardened ? kHardenedFullThresholdPpm : kStrictFullThresholdPpm;
    if (d.risk_ppm >= threshold) {
      d.profile = Profile::Full;
      risk_full_decisions_.fetch_add(1, std::memory_order_relaxed);
    } else {
      d.profile = Profile::Fast;
    }
  }
  if (d.profile == Profile::Full) full_decisions_.fetch_add(1, std::memory_order_relaxed);
  return d;
}

void RuntimeKernel::observe_validation(const ValidationEvent& e) {
  risk_.observe(e.family, e.adverse);
  std::unique_lock<std::mutex> lk(mu_, std::try_to_lock);
  if (!lk.owns_lock()) {
    dropped_.fetch_add(1, std::memory_order_relaxed);
    return;
  }
  signals_.record(Signal::ValidateLatency, static_cast<double>(e.elapsed_ns));
  signals_.record(Signal::NullRate, flag(e.null));
  if (!e.null) {
    signals_.record(Signal::CacheMissRate, flag(!e.cache_hit));
    signals_.record(Signal::StageCost, static_cast<double>(e.lookup_cost_ns));
  }
  if (!e.null && !e.cache_hit) {
    signals_.record(Signal::ForeignRate, flag(e.foreign));
    signals_.record(Signal::TemporalRate, flag(e.temporal));
    signals_.record(Signal::BloomRejectRate, flag(e.bloom_reject));
    signals_.record(Signal::PageOracleDisagreement, flag(e.page_disagreement));
    signals_.record(Signal::ArenaMissRate, flag(e.arena_miss));
    if (!e.foreign && !e.temporal) {
      signals_.record(Signal::InteriorPointerRate, flag(e.interior_pointer));
      if (e.profile == Profile::Full) signals_.record(Signal::FingerprintMismatch, flag(e.fingerprint_mismatch));
    }
  }
  after_observation_locked_(e.adverse);
}

void RuntimeKernel::observe_free(const FreeEvent& e) {
  const bool adverse = arena::is_adverse(e.result);
  risk_.observe(core::ApiFamily::Allocator, adverse);
  std::unique_lock<std::mutex> lk(mu_, std::try_to_lock);
  if (!lk.owns_lock()) {
    dropped_.fetch_add(1, std::memory_order_relaxed);
    return;
  }
  signals_.record(Signal::FreeLatency, static_cast<double>(e.latency_ns));
  signals_.record(Signal::DoubleFree, flag(e.result == arena::FreeResult::DoubleFree));
  signals_.record(Signal::ForeignFree, flag(e.result == arena::FreeResult::ForeignPointer));
  signals_.record(Signal::InvalidFree, flag(e.result == arena::FreeResult::InvalidPointer));
  signals_.record(Signal::CanaryCorruption, flag(e.result == arena::FreeResult::FreedWithCanaryCorruption));
  signals_.record(Signal::FreeContention, static_cast<double>(e.contention_peak));
  if (e.result == arena::FreeResult::Freed || e.result == arena::FreeResult::FreedWithCanaryCorruption) {
    signals_.record(Signal::QuarantineBytePressure, e.byte_pressure);
    signals_.record(Signal::QuarantineDepthPressure,
                    e.drained > 1 ? static_cast<double>(e.drained - 1) / 8.0 : 0.0);
    signals_.record(Signal::EvictionRate, flag(e.evicted_self));
  }
  after_observation_locked_(adverse);
}

void RuntimeKernel::observe_allocation(std::size_t size, bool ok) {
  std::unique_lock<std::mutex> lk(mu_, std::try_to_lock);
  if (!lk.owns_lock()) {
    dropped_.fetch_add(1, std::memory_order_relaxed);
    return;
  }
  signals_.record(Signal::AllocFailure, flag(!ok));
  signals_.record(Signal::LargeAllocRate, flag(size >= kLargeAllocation));
  after_observation_locked_(!ok);
}

void RuntimeKernel::after_observation_locked_(bool adverse) {
  adverse_since_meta_ = adverse_since_meta_ || adverse;
  ++observations_;
  if (observations_ % kMetaCadence == 0) meta_step_locked_(core::safety_level());
}

void RuntimeKernel::meta_step_locked_(core::SafetyLevel mode) {
  ++meta_steps_;
  const std::uint32_t max_ub = risk_.max_upper_bound_ppm();
  signals_.record(Signal::RiskUpperBound, static_cast<double>(max_ub) / 1e6);

  const std::uint64_t decisions = decisions_.load(std::memory_order_relaxed);
  const std::uint64_t risk_full = risk_full_decisions_.load(std::memory_order_relaxed);
  if (decisions > last_meta_decisions_) {
    signals_.record(Signal::FullProfileRate, static_cast<double>(risk_full - last_meta_risk_full_) /
                                                 static_cast<double>(decisions - last_meta_decisions_));
  }
  last_meta_decisions_ = decisions;
  last_meta_risk_full_ = risk_full;

  signals_.record(Signal::ProbeAnomalyRate, static_cast<double>(ensemble_.count_at_least(Level::Warning)) /
                                                static_cast<double>(ensemble_.size()));

  ensemble_.observe(signals_.snapshot(), plan_.mask);
  for (std::size_t p = 0; p < kNumProbes; ++p) {
    const Probe probe = static_cast<Probe>(p);
    if (plan_.includes(probe)) scheduler_.record_probe(probe, ensemble_.group_anomalous(probe));
  }

  const bool adverse = adverse_since_meta_;
  adverse_since_meta_ = false;
  const FusionSummary fs = fusion_.observe(ensemble_.fusion_levels(), adverse, mode);
  fusion_bonus_ppm_.store(fs.bonus_ppm, std::memory_order_relaxed);

  const Level worst = ensemble_.worst_level();
  const bool calibrating = ensemble_.any_calibrating();
  const Level prev = worst_level();
  if (prev != worst && !calibrating) {
    MSM_LOG(INFO) << "membrane risk level " << monitors::to_string(prev) << " -> " << monitors::to_string(worst);
  }
  worst_level_.store(static_cast<std::uint8_t>(worst), std::memory_order_release);
  calibrating_.store(calibrating, std::memory_order_release);

  if (decisions - last_plan_decisions_ >= kPlanEpoch) {
    last_plan_decisions_ = decisions;
    const bool over_budget = signals_.severity(Signal::ValidateLatency) >= 1;
    plan_ = scheduler_.choose_plan(mode, max_ub, adverse || worst >= Level::Warning, over_budget);
    ++plan_refreshes_;
  }
}

RuntimeKernelSummary RuntimeKernel::summary() const {
  RuntimeKernelSummary s;
  s.decisions = decisions_.load(std::memory_order_relaxed);
  s.full_decisions = full_decisions_.load(std::memory_order_relaxed);
  s.risk_escalations = risk_full_decisions_.load(std::memory_order_relaxed);
  s.dropped_observations = dropped_.load(std::memory_order_relaxed);
  s.worst_level = worst_level();
  s.calibrating = calibrating();
  s.fusion_bonus_ppm = fusion_bonus_ppm_.load(std::memory_order_relaxed);
  std::lock_guard<std::mutex> g(mu_);
  s.observations = observations_;
  s.meta_steps = meta_steps_;
  s.plan_refreshes = plan_refreshes_;
  s.warning_monitors = ensemble_.count_at_least(Level::Warning) - ensemble_.count_at_least(Level::Critical);
  s.critical_monitors = ensemble_.count_at_least(Level::Critical);
  s.fusion = fusion_.summary();
  s.probes = scheduler_.summary();
  s.severity = signals_.snapshot();
  return s;
}

std::vector<monitors::MonitorSummary> RuntimeKernel::monitor_summaries() const {
  std::lock_guard<std::mutex> g(mu_);
  return ensemble_.summaries();
}

ProbePlan RuntimeKernel::plan() const {
  std::lock_guard<std::mutex> g(mu_);
  return plan_;
}

}} // namespace msm::control

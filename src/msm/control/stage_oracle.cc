// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "msm/control/stage_oracle.h"

#include <algorithm>

namespace msm { namespace control {

std::string_view to_string(Stage s) noexcept {
  switch (s) {
    case Stage::Null: return "null";
    case Stage::TlsCache: return "tls_cache";
    case Stage::Bloom: return "bloom";
    case Stage::Arena: return "arena";
    case Stage::Fingerprint: return "fingerprint";
    case Stage::Canary: return "canary";
    case Stage::Bounds: return "bounds";
  }
  return "null";
}

bool is_permutation_of_all_stages(const StageOrder& order) noexcept {
  std::array<bool, kNumStages> seen{};
  for (Stage s : order) {
    const auto i = static_cast<std::size_t>(s);
    if (i >= kNumStages || seen[i]) return false;
    seen[i] = true;
  }
  return true;
}

namespace {
inline bool is_lookup_stage(Stage s) noexcept {
  return s == Stage::TlsCache || s == Stage::Bloom || s == Stage::Arena;
}
} // namespace

StageOrder dependency_safe(const StageOrder& order) noexcept {
  StageOrder out = kDefaultStageOrder;
  std::size_t k = 0;
  out[k++] = Stage::Null;
  for (Stage s : order) if (is_lookup_stage(s)) out[k++] = s;
  for (Stage s : order) if (s != Stage::Null && !is_lookup_stage(s)) out[k++] = s;
  if (k != kNumStages || !is_permutation_of_all_stages(out)) return kDefaultStageOrder;
  return out;
}

StageOracle::StageOracle() {
  const std::uint32_t def = pack_(kDefaultStageOrder);
  for (auto& p : published_) p.store(def, std::memory_order_relaxed);
}

std::uint32_t StageOracle::pack_(const StageOrder& order) noexcept {
  std::uint32_t v = 0;
  for (std::size_t i = 0; i < kNumStages; ++i) {
    v |= static_cast<std::uint32_t>(order[i]) << (4 * i);
  }
  return v;
}

StageOrder StageOracle::unpack_(std::uint32_t packed) noexcept {
  StageOrder out{};
  for (std::size_t i = 0; i < kNumStages; ++i) {
    out[i] = static_cast<Stage>((packed >> (4 * i)) & 0xF);
  }
  return out;
}

StageOrder StageOracle::order_for(std::uint8_t family, bool aligned) const noexcept {
  return unpack_(published_[context_index(family, aligned)].load(std::memory_order_acquire));
}

void StageOracle::report_outcome(std::uint8_t family, bool aligned, const StageOrder& order_used,
                                 std::optional<Stage> exit_stage) {
  std::unique_lock<std::mutex> lk(mu_, std::try_to_lock);
  if (!lk.owns_lock()) {
    dropped_.fetch_add(1, std::memory_order_relaxed);
    return;
  }
  const std::size_t ci = context_index(family, aligned);
  Context& ctx = contexts_[ci];
  ++calls_;
  for (Stage s : order_used) {
    Arm& arm = ctx.arms[static_cast<std::size_t>(s)];
    if (exit_stage && s == *exit_stage) {
      arm.alpha += 1.0;
      break;
    }
    arm.beta += 1.0;
  }
  if (exit_stage) ++early_exits_;
  for (Arm& arm : ctx.arms) {
    const double total = arm.alpha + arm.beta;
    if (total > kDecayThreshold) {
      const double scale = kDecayTarget / total;
      arm.alpha *= scale;
      arm.beta *= scale;
    }
  }
  ctx.reports += 1;
  if (ctx.reports % kRecomputeInterval == 0) recompute_locked_(ci);
}

void StageOracle::recompute_locked_(std::size_t ci) {
  const Context& ctx = contexts_[ci];
  StageOrder order = kDefaultStageOrder;
  std::stable_sort(order.begin(), order.end(), [&](Stage a, Stage b) {
    const auto ia = static_cast<std::size_t>(a);
    const auto ib = static_cast<std::size_t>(b);
    const double sa = ctx.arms[ia].mean() / static_cast<double>(kStageCostNs[ia]);
    const double sb = ctx.arms[ib].mean() / static_cast<double>(kStageCostNs[ib]);
    return sa > sb;
  });
  // Null always leads; the remaining relative order is kept.
  auto it = std::find(order.begin(), order.end(), Stage::Null);
  std::rotate(order.begin(), it, it + 1);
  ++recomputations_;
  const std::uint32_t packed = pack_(order);
  if (published_[ci].load(std::memory_order_relaxed) != packed) {
    published_[ci].store(packed, std::memory_order_release);
    ++reorderings_;
  }
}

double StageOracle::exit_probability(std::size_t context, Stage s) const {
  std::lock_guard<std::mutex> lk(mu_);
  return contexts_[context % kNumContexts].arms[static_cast<std::size_t>(s)].mean();
}

StageOracleSummary StageOracle::summary() const {
  StageOracleSummary out;
  {
    std::lock_guard<std::mutex> lk(mu_);
    out.calls = calls_;
    out.early_exits = early_exits_;
    out.reorderings_applied = reorderings_;
    out.recomputations = recomputations_;
  }
  out.dropped_reports = dropped_.load(std::memory_order_relaxed);
  for (std::size_t i = 0; i < kNumContexts; ++i) {
    out.orders[i] = unpack_(published_[i].load(std::memory_order_acquire));
  }
  return out;
}

}} // namespace msm::control

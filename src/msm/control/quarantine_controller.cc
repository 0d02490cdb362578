// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "msm/control/quarantine_controller.h"

#include <algorithm>
#include <cmath>

#include "msm/logging/logging.h"

namespace msm { namespace control {

namespace {
std::atomic<std::size_t> g_published_depth{QuarantineController::kDefaultDepth};
} // namespace

std::size_t published_quarantine_depth() noexcept {
  return g_published_depth.load(std::memory_order_relaxed);
}

void publish_quarantine_depth(std::size_t depth) noexcept {
  g_published_depth.store(depth, std::memory_order_relaxed);
}

void ContentionSignal::free_begin() noexcept {
  const std::uint64_t now = active_.fetch_add(1, std::memory_order_relaxed) + 1;
  std::uint64_t prev = peak_.load(std::memory_order_relaxed);
  while (now > prev && !peak_.compare_exchange_weak(prev, now, std::memory_order_relaxed)) {
  }
}

void ContentionSignal::free_end() noexcept {
  active_.fetch_sub(1, std::memory_order_relaxed);
}

std::uint64_t ContentionSignal::read_and_reset_peak() noexcept {
  return peak_.exchange(active_.load(std::memory_order_relaxed), std::memory_order_relaxed);
}

bool QuarantineController::record_free(std::uint64_t latency_ns, bool detection) {
  std::lock_guard<std::mutex> lk(mu_);
  latencies_[latency_pos_] = latency_ns;
  latency_pos_ = (latency_pos_ + 1) % kLatencyWindow;
  if (latency_count_ < kLatencyWindow) ++latency_count_;
  ++frees_this_epoch_;
  ++total_frees_;
  if (detection) {
    ++detections_this_epoch_;
    ++total_detections_;
  }
  if (frees_this_epoch_ >= kEpochFrees) {
    update_epoch_locked_();
    return true;
  }
  return false;
}

double QuarantineController::p99_locked_() const {
  if (latency_count_ < 2) return 0.0;
  std::array<std::uint64_t, kLatencyWindow> sorted = latencies_;
  std::sort(sorted.begin(), sorted.begin() + static_cast<std::ptrdiff_t>(latency_count_));
  const auto idx = static_cast<std::size_t>(std::ceil(static_cast<double>(latency_count_) * 0.99));
  return static_cast<double>(sorted[std::min(idx, latency_count_ - 1)]);
}

void QuarantineController::update_epoch_locked_() {
  ++epochs_;
  const double contention = static_cast<double>(contention_.read_and_reset_peak());
  last_peak_ = static_cast<std::uint64_t>(contention);
  const double p99 = p99_locked_();
  last_p99_ = p99;
  const double hit_rate = frees_this_epoch_ > 0
      ? static_cast<double>(detections_this_epoch_) / static_cast<double>(frees_this_epoch_)
      : 0.0;
  escape_rate_ = 0.9 * escape_rate_ + 0.1 * hit_rate;

  const double d = depth_;
  const double dmax = static_cast<double>(kMaxDepth);
  const double dmin = static_cast<double>(kMinDepth);

  const double grad_memory = 1.0 / dmax;
  const double grad_latency = p99 / kLatencyBudgetNs;
  const double grad_safety = -1.0 / std::max(d, 1.0);
  const double lagrangian = grad_memory + lambda_latency_ * grad_latency + lambda_memory_ * grad_memory +
                            grad_safety * (escape_rate_ / kSafetyEpsilon);
  const double barrier = -1.0 / std::max(dmax - d, 1.0) + 1.0 / std::max(d - dmin, 1.0);
  const double total = lagrangian + 0.01 * barrier;
  const double boost = std::min(contention / 4.0, 2.0);

  double next = d - kPrimalLr * total * dmax + kPrimalLr * boost * 100.0;
  if (!std::isfinite(next)) next = static_cast<double>(kDefaultDepth);
  depth_ = std::clamp(std::floor(next), dmin, dmax);

  const double latency_violation = (p99 - kLatencyBudgetNs) / kLatencyBudgetNs;
  lambda_latency_ = std::clamp(lambda_latency_ + kDualLr * latency_violation, 0.0, kDualMax);
  const double memory_violation = d / dmax - kMemorySoftFraction;
  lambda_memory_ = std::clamp(lambda_memory_ + kDualLr * memory_violation, 0.0, kDualMax);

  frees_this_epoch_ = 0;
  detections_this_epoch_ = 0;

  const auto published = static_cast<std::size_t>(depth_);
  const std::size_t before = depth_atomic_.exchange(published, std::memory_order_relaxed);
  publish_quarantine_depth(published);
  if (before != published && (epochs_ % 64) == 1) {
    MSM_LOG(INFO) << "quarantine depth " << before << " -> " << published
                  << " (p99=" << p99 << "ns escape=" << escape_rate_ << ")";
  }
}

QuarantineControllerSummary QuarantineController::summary() const {
  std::lock_guard<std::mutex> lk(mu_);
  QuarantineControllerSummary s;
  s.depth = static_cast<std::size_t>(depth_);
  s.lambda_latency = lambda_latency_;
  s.lambda_memory = lambda_memory_;
  s.escape_rate = escape_rate_;
  s.last_p99_ns = last_p99_;
  s.epochs = epochs_;
  s.total_frees = total_frees_;
  s.total_detections = total_detections_;
  s.last_contention_peak = last_peak_;
  return s;
}

}} // namespace msm::control

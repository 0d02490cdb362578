// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "msm/control/probe_scheduler.h"
#include "msm/monitors/monitor.h"

namespace msm { namespace monitors {

// The full monitor set behind one interface. Members are grouped by probe;
// groups in the current plan see every observation, the rest every
// kOffPlanCadence-th one. Not thread-safe; the kernel serializes access.
class Ensemble final {
 public:
  static constexpr std::uint64_t kOffPlanCadence = 8;

  Ensemble();

  // Returns the number of members updated.
  std::size_t observe(const SeverityVector& v, std::uint32_t plan_mask = control::all_probes_mask());

  // Highest non-calibrating level; Calibrating only when every member is.
  Level worst_level() const noexcept;
  bool any_calibrating() const noexcept;
  std::size_t count_at_least(Level l) const noexcept;
  bool group_anomalous(control::Probe p) const noexcept;

  // Per-member code for fusion: 0 healthy or calibrating, 2 warning, 3 critical.
  std::vector<std::uint8_t> fusion_levels() const;
  std::vector<MonitorSummary> summaries() const;

  std::size_t size() const noexcept { return members_.size(); }
  const Monitor& member(std::size_t i) const { return *members_.at(i).monitor; }
  control::Probe probe_of(std::size_t i) const { return members_.at(i).probe; }
  std::uint64_t observations() const noexcept { return ticks_; }
  std::uint64_t transitions() const noexcept { return transitions_; }

 private:
  struct Member {
    std::unique_ptr<Monitor> monitor;
    control::Probe probe;
  };

  template <class M>
  void add_(control::Probe p) {
    members_.push_back(Member{std::make_unique<M>(), p});
  }

  std::vector<Member> members_;
  std::uint64_t ticks_{0};
  std::uint64_t transitions_{0};
};

}} // namespace msm::monitors

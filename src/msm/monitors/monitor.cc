// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "msm/monitors/monitor.h"

namespace msm { namespace monitors {

std::string_view to_string(Level l) noexcept {
  switch (l) {
    case Level::Calibrating: return "calibrating";
    case Level::Nominal: return "nominal";
    case Level::Warning: return "warning";
    case Level::Critical: return "critical";
  }
  return "calibrating";
}

void Monitor::observe_and_update(const SeverityVector& v) {
  ++count_;
  Level next = update(v, count_);
  if (count_ < warmup_) next = Level::Calibrating;
  if (next == Level::Critical && level_ != Level::Critical) ++critical_entries_;
  level_ = next;
}

MonitorSummary Monitor::summary() const {
  MonitorSummary s;
  s.name = name_;
  s.level = level_;
  s.state_name = state_name();
  s.statistic = statistic();
  s.secondary = secondary();
  s.observations = count_;
  s.critical_entries = critical_entries_;
  return s;
}

}} // namespace msm::monitors

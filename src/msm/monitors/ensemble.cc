// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "msm/monitors/ensemble.h"

#include <algorithm>

#include "msm/logging/logging.h"
#include "msm/monitors/chain_monitors.h"
#include "msm/monitors/drift_monitors.h"
#include "msm/monitors/dynamics_monitors.h"
#include "msm/monitors/structure_monitors.h"

namespace msm { namespace monitors {

using control::Probe;

Ensemble::Ensemble() {
  members_.reserve(27);
  add_<WassersteinDriftMonitor>(Probe::Drift);
  add_<KernelMmdMonitor>(Probe::Drift);
  add_<DoobDriftMonitor>(Probe::Martingale);
  add_<AzumaHoeffdingMonitor>(Probe::Martingale);
  add_<BirkhoffErgodicMonitor>(Probe::Martingale);
  add_<MatrixConcentrationMonitor>(Probe::Concentration);
  add_<PacBayesMonitor>(Probe::Concentration);
  add_<FanoEquivocationMonitor>(Probe::MarkovChain);
  add_<DobrushinContractionMonitor>(Probe::MarkovChain);
  add_<EntropyRateMonitor>(Probe::MarkovChain);
  add_<SpectralGapMonitor>(Probe::Spectral);
  add_<TransferEntropyMonitor>(Probe::Causal);
  add_<RenewalMonitor>(Probe::Renewal);
  add_<BorelCantelliMonitor>(Probe::Renewal);
  add_<DispersionMonitor>(Probe::Renewal);
  add_<BifurcationMonitor>(Probe::Criticality);
  add_<OrnsteinUhlenbeckMonitor>(Probe::Criticality);
  add_<LyapunovMonitor>(Probe::Chaos);
  add_<OperatorNormMonitor>(Probe::Chaos);
  add_<HurstMonitor>(Probe::LongMemory);
  add_<QuadraticVariationMonitor>(Probe::Volatility);
  add_<MalliavinMonitor>(Probe::Volatility);
  add_<HodgeCoherenceMonitor>(Probe::Topology);
  add_<NerveComplexMonitor>(Probe::Topology);
  add_<ObstructionMonitor>(Probe::Topology);
  add_<LocalizationMonitor>(Probe::Localization);
  add_<SosInvariantMonitor>(Probe::Localization);
}

std::size_t Ensemble::observe(const SeverityVector& v, std::uint32_t plan_mask) {
  ++ticks_;
  const bool off_plan_turn = ticks_ % kOffPlanCadence == 0;
  std::size_t updated = 0;
  for (Member& m : members_) {
    if (!off_plan_turn && (plan_mask & control::probe_bit(m.probe)) == 0) continue;
    const Level before = m.monitor->level();
    m.monitor->observe_and_update(v);
    ++updated;
    const Level after = m.monitor->level();
    if (after != before) {
      ++transitions_;
      if (after >= Level::Warning || before >= Level::Warning) {
        MSM_LOG(INFO) << "monitor " << m.monitor->name() << ": " << to_string(before) << " -> "
                      << m.monitor->state_name();
      }
    }
  }
  return updated;
}

Level Ensemble::worst_level() const noexcept {
  Level worst = Level::Calibrating;
  for (const Member& m : members_) worst = std::max(worst, m.monitor->level());
  return worst;
}

bool Ensemble::any_calibrating() const noexcept {
  return std::any_of(members_.begin(), members_.end(),
                     [](const Member& m) { return m.monitor->level() == Level::Calibrating; });
}

std::size_t Ensemble::count_at_least(Level l) const noexcept {
  return static_cast<std::size_t>(std::count_if(members_.begin(), members_.end(),
                                                [l](const Member& m) { return m.monitor->level() >= l; }));
}

bool Ensemble::group_anomalous(control::Probe p) const noexcept {
  for (const Member& m : members_) {
    if (m.probe == p && m.monitor->level() >= Level::Warning) return true;
  }
  return false;
}

std::vector<std::uint8_t> Ensemble::fusion_levels() const {
  std::vector<std::uint8_t> out;
  out.reserve(members_.size());
  for (const Member& m : members_) {
    switch (m.monitor->level()) {
      case Level::Warning: out.push_back(2); break;
      case Level::Critical: out.push_back(3); break;
      default: out.push_back(0); break;
    }
  }
  return out;
}

std::vector<MonitorSummary> Ensemble::summaries() const {
  std::vector<MonitorSummary> out;
  out.reserve(members_.size());
  for (const Member& m : members_) out.push_back(m.monitor->summary());
  return out;
}

}} // namespace msm::monitors

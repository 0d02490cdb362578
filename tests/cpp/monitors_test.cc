// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>
#include <cmath>
#include <functional>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "msm/monitors/base_signals.h"
#include "msm/monitors/chain_monitors.h"
#include "msm/monitors/drift_monitors.h"
#include "msm/monitors/dynamics_monitors.h"
#include "msm/monitors/structure_monitors.h"

using namespace msm::monitors;

namespace {

using Factory = std::function<std::unique_ptr<Monitor>()>;

template <class M>
Factory make() {
  return [] { return std::unique_ptr<Monitor>(new M()); };
}

std::vector<Factory> all_monitors() {
  return {
      make<WassersteinDriftMonitor>(),   make<KernelMmdMonitor>(),        make<DoobDriftMonitor>(),
      make<AzumaHoeffdingMonitor>(),     make<BirkhoffErgodicMonitor>(),  make<MatrixConcentrationMonitor>(),
      make<PacBayesMonitor>(),           make<FanoEquivocationMonitor>(), make<DobrushinContractionMonitor>(),
      make<SpectralGapMonitor>(),        make<EntropyRateMonitor>(),      make<TransferEntropyMonitor>(),
      make<RenewalMonitor>(),            make<BorelCantelliMonitor>(),    make<DispersionMonitor>(),
      make<BifurcationMonitor>(),        make<OrnsteinUhlenbeckMonitor>(), make<LyapunovMonitor>(),
      make<OperatorNormMonitor>(),       make<HurstMonitor>(),            make<QuadraticVariationMonitor>(),
      make<MalliavinMonitor>(),          make<LocalizationMonitor>(),     make<HodgeCoherenceMonitor>(),
      make<ObstructionMonitor>(),        make<SosInvariantMonitor>(),     make<NerveComplexMonitor>(),
  };
}

SeverityVector zeros() { return SeverityVector{}; }

SeverityVector filled(std::uint8_t s) {
  SeverityVector v{};
  v.fill(s);
  return v;
}

// Deterministic pseudo-random severities.
struct Lcg {
  std::uint64_t state{0x9e3779b97f4a7c15ull};
  std::uint8_t next() {
    state = state * 6364136223846793005ull + 1442695040888963407ull;
    return static_cast<std::uint8_t>((state >> 33) % 4);
  }
  SeverityVector vector() {
    SeverityVector v{};
    for (auto& s : v) s = next();
    return v;
  }
};

void feed(Monitor& m, const SeverityVector& v, int n) {
  for (int i = 0; i < n; ++i) m.observe_and_update(v);
}

} // namespace

TEST(MonitorTest, WarmupAlpha) {
  EXPECT_DOUBLE_EQ(warmup_alpha(1, 10, 0.05), 1.0);
  EXPECT_DOUBLE_EQ(warmup_alpha(3, 10, 0.05), 0.5);
  EXPECT_DOUBLE_EQ(warmup_alpha(11, 10, 0.05), 0.05);
  EXPECT_EQ(sev(9), 3.0);
  EXPECT_EQ(sev_index(200), 3u);
}

TEST(MonitorTest, CalibratingThroughWarmupThenNominalOnQuietInput) {
  for (const Factory& f : all_monitors()) {
    std::unique_ptr<Monitor> m = f();
    const std::string name(m->name());
    ASSERT_GE(m->warmup(), 1u) << name;
    for (std::uint64_t i = 1; i < m->warmup(); ++i) {
      m->observe_and_update(zeros());
      EXPECT_EQ(m->level(), Level::Calibrating) << name << " at " << i;
    }
    feed(*m, zeros(), 400);
    EXPECT_EQ(m->level(), Level::Nominal) << name << " stat=" << m->statistic();
    EXPECT_EQ(m->critical_entries(), 0u) << name;
    EXPECT_EQ(m->observations(), m->warmup() - 1 + 400) << name;
  }
}

TEST(MonitorTest, RecoversAfterDisturbance) {
  for (const Factory& f : all_monitors()) {
    std::unique_ptr<Monitor> m = f();
    const std::string name(m->name());
    feed(*m, zeros(), 200);
    Lcg rng;
    for (int i = 0; i < 2000; ++i) m->observe_and_update(rng.vector());
    feed(*m, zeros(), 8000);
    EXPECT_EQ(m->level(), Level::Nominal) << name << " stat=" << m->statistic();
  }
}

TEST(MonitorTest, SummaryMirrorsState) {
  BorelCantelliMonitor m;
  feed(m, zeros(), 100);
  feed(m, filled(3), 200);
  const MonitorSummary s = m.summary();
  EXPECT_EQ(s.name, "borel_cantelli");
  EXPECT_EQ(s.level, Level::Critical);
  EXPECT_EQ(s.state_name, "Absorbing");
  EXPECT_EQ(s.observations, 300u);
  EXPECT_EQ(s.critical_entries, 1u);
  EXPECT_DOUBLE_EQ(s.statistic, m.statistic());
  EXPECT_EQ(to_string(Level::Warning), "warning");
}

TEST(MonitorTest, SustainedSaturationIsFlagged) {
  {
    SosInvariantMonitor m;
    feed(m, zeros(), 200);
    feed(m, filled(3), 200);
    EXPECT_EQ(m.level(), Level::Critical);
  }
  {
    MatrixConcentrationMonitor m;
    feed(m, zeros(), 100);
    feed(m, filled(3), 100);
    EXPECT_EQ(m.level(), Level::Critical);
  }
  {
    DoobDriftMonitor m;
    feed(m, zeros(), 200);
    feed(m, filled(3), 100);
    EXPECT_EQ(m.level(), Level::Critical);
  }
}

TEST(MonitorTest, OscillationIsVolatile) {
  QuadraticVariationMonitor qv;
  MalliavinMonitor mal;
  feed(qv, zeros(), 100);
  feed(mal, zeros(), 100);
  for (int i = 0; i < 300; ++i) {
    const SeverityVector v = i % 2 == 0 ? filled(3) : zeros();
    qv.observe_and_update(v);
    mal.observe_and_update(v);
  }
  EXPECT_EQ(qv.level(), Level::Critical);
  EXPECT_EQ(mal.level(), Level::Critical);
}

TEST(MonitorTest, SingleHotSignalIsLocalized) {
  LocalizationMonitor m;
  feed(m, zeros(), 200);
  SeverityVector v{};
  v[static_cast<std::size_t>(Signal::DoubleFree)] = 3;
  feed(m, v, 300);
  EXPECT_EQ(m.level(), Level::Critical);
  EXPECT_GT(m.statistic(), 0.5);
}

TEST(MonitorTest, SpectralGapOfKnownChains) {
  TransitionRows::Matrix identity{};
  for (std::size_t i = 0; i < kSeverityLevels; ++i) identity[i][i] = 1.0;
  EXPECT_NEAR(SpectralGapMonitor::second_eigenvalue(identity), 1.0, 1e-9);

  TransitionRows::Matrix mixing{};
  for (auto& row : mixing) row.fill(0.25);
  EXPECT_NEAR(SpectralGapMonitor::second_eigenvalue(mixing), 0.0, 1e-9);
}

TEST(MonitorTest, LyapunovDistance) {
  EXPECT_DOUBLE_EQ(LyapunovMonitor::distance(zeros(), zeros()), 0.0);
  EXPECT_DOUBLE_EQ(LyapunovMonitor::distance(zeros(), filled(3)), 15.0);  // sqrt(25 * 9)
}

namespace {

// Exposes the shared two-threshold classifier.
struct TwoThresholdClassifier : Monitor {
  using Monitor::classify_high;
};

struct WarmupRow {
  Factory make;
  std::string_view name;
  std::uint64_t warmup;
};

struct ThresholdRow {
  std::string_view name;
  double warning;
  double critical;
  double expected_warning;
  double expected_critical;
};

double just_below(double x) { return std::nextafter(x, -std::numeric_limits<double>::infinity()); }

} // namespace

TEST(MonitorContractTest, NamesAndWarmups) {
  const std::vector<WarmupRow> rows = {
      {make<WassersteinDriftMonitor>(), "wasserstein_drift", 30},
      {make<KernelMmdMonitor>(), "kernel_mmd", 30},
      {make<DoobDriftMonitor>(), "doob_drift", 40},
      {make<AzumaHoeffdingMonitor>(), "azuma_hoeffding", 40},
      {make<BirkhoffErgodicMonitor>(), "birkhoff_ergodic", 60},
      {make<MatrixConcentrationMonitor>(), "matrix_concentration", 30},
      {make<PacBayesMonitor>(), "pac_bayes", 40},
      {make<FanoEquivocationMonitor>(), "fano_equivocation", 40},
      {make<DobrushinContractionMonitor>(), "dobrushin_contraction", 40},
      {make<SpectralGapMonitor>(), "spectral_gap", 48},
      {make<EntropyRateMonitor>(), "entropy_rate", 40},
      {make<TransferEntropyMonitor>(), "transfer_entropy", 40},
      {make<RenewalMonitor>(), "renewal", 40},
      {make<BorelCantelliMonitor>(), "borel_cantelli", 50},
      {make<DispersionMonitor>(), "dispersion", 160},
      {make<BifurcationMonitor>(), "bifurcation", 40},
      {make<OrnsteinUhlenbeckMonitor>(), "ornstein_uhlenbeck", 50},
      {make<LyapunovMonitor>(), "lyapunov", 18},
      {make<OperatorNormMonitor>(), "operator_norm", 128},
      {make<HurstMonitor>(), "hurst", 64},
      {make<QuadraticVariationMonitor>(), "quadratic_variation", 40},
      {make<MalliavinMonitor>(), "malliavin", 20},
      {make<LocalizationMonitor>(), "localization", 128},
      {make<HodgeCoherenceMonitor>(), "hodge_coherence", 40},
      {make<ObstructionMonitor>(), "obstruction", 128},
      {make<SosInvariantMonitor>(), "sos_invariant", 128},
      {make<NerveComplexMonitor>(), "nerve_complex", 30},
  };
  ASSERT_EQ(rows.size(), all_monitors().size());
  for (const WarmupRow& r : rows) {
    std::unique_ptr<Monitor> m = r.make();
    EXPECT_EQ(m->name(), r.name);
    EXPECT_EQ(m->warmup(), r.warmup) << r.name;
    EXPECT_EQ(m->level(), Level::Calibrating) << r.name;
    EXPECT_EQ(m->state_name(), "Calibrating") << r.name;
  }
}

TEST(MonitorContractTest, TwoThresholdBoundaries) {
  const std::vector<ThresholdRow> rows = {
      {"wasserstein_drift", WassersteinDriftMonitor::kDriftThreshold, WassersteinDriftMonitor::kShiftThreshold, 0.15, 0.40},
      {"kernel_mmd", KernelMmdMonitor::kDriftThreshold, KernelMmdMonitor::kAnomalyThreshold, 0.10, 0.40},
      {"doob_drift", DoobDriftMonitor::kDriftThreshold, DoobDriftMonitor::kBreakThreshold, 0.30, 0.60},
      {"azuma_hoeffding", AzumaHoeffdingMonitor::kDiffuseThreshold, AzumaHoeffdingMonitor::kExplosiveThreshold, 0.6, 1.0},
      {"birkhoff_ergodic", BirkhoffErgodicMonitor::kSlowConvergenceThreshold,
       BirkhoffErgodicMonitor::kNonErgodicThreshold, 0.15, 0.40},
      {"fano_equivocation", FanoEquivocationMonitor::kUncertainThreshold, FanoEquivocationMonitor::kChaoticThreshold,
       0.50, 0.75},
      {"dobrushin_contraction", DobrushinContractionMonitor::kSlowThreshold,
       DobrushinContractionMonitor::kNonContractiveThreshold, 0.65, 0.85},
      {"spectral_gap", SpectralGapMonitor::kSlowMixingThreshold, SpectralGapMonitor::kNearDecomposableThreshold, 0.85,
       0.95},
      {"entropy_rate", EntropyRateMonitor::kElevatedThreshold, EntropyRateMonitor::kDisorderedThreshold, 0.40, 0.70},
      {"transfer_entropy", TransferEntropyMonitor::kCouplingThreshold, TransferEntropyMonitor::kCascadeThreshold, 0.08,
       0.20},
      {"renewal", RenewalMonitor::kAgingThreshold, RenewalMonitor::kStalledThreshold, 3.0, 8.0},
      {"bifurcation", BifurcationMonitor::kApproachingThreshold, BifurcationMonitor::kCriticalThreshold, 0.80, 0.95},
      {"lyapunov", LyapunovMonitor::kSensitiveThreshold, LyapunovMonitor::kChaoticThreshold, 0.05, 0.15},
      {"operator_norm", OperatorNormMonitor::kMarginalThreshold, OperatorNormMonitor::kUnstableThreshold, 1.5, 2.5},
      {"hodge_coherence", HodgeCoherenceMonitor::kIncoherentThreshold, HodgeCoherenceMonitor::kInconsistentThreshold,
       0.15, 0.35},
      {"obstruction", ObstructionMonitor::kPartialThreshold, ObstructionMonitor::kObstructedThreshold, 0.25, 0.60},
      {"sos_invariant", SosInvariantMonitor::kStressedThreshold, SosInvariantMonitor::kViolatedThreshold, 0.7, 1.0},
      {"nerve_complex", NerveComplexMonitor::kFragmentedThreshold, NerveComplexMonitor::kShatteredThreshold, 2.0, 4.0},
  };
  for (const ThresholdRow& r : rows) {
    EXPECT_DOUBLE_EQ(r.warning, r.expected_warning) << r.name;
    EXPECT_DOUBLE_EQ(r.critical, r.expected_critical) << r.name;
    ASSERT_LT(r.warning, r.critical) << r.name;
    EXPECT_EQ(TwoThresholdClassifier::classify_high(0.0, r.warning, r.critical), Level::Nominal) << r.name;
    EXPECT_EQ(TwoThresholdClassifier::classify_high(just_below(r.warning), r.warning, r.critical), Level::Nominal)
        << r.name;
    EXPECT_EQ(TwoThresholdClassifier::classify_high(r.warning, r.warning, r.critical), Level::Warning) << r.name;
    EXPECT_EQ(TwoThresholdClassifier::classify_high(just_below(r.critical), r.warning, r.critical), Level::Warning)
        << r.name;
    EXPECT_EQ(TwoThresholdClassifier::classify_high(r.critical, r.warning, r.critical), Level::Critical) << r.name;
  }
}

TEST(MonitorContractTest, CustomDecisionConstants) {
  EXPECT_DOUBLE_EQ(MatrixConcentrationMonitor::kWarningFraction, 0.7);
  EXPECT_DOUBLE_EQ(MatrixConcentrationMonitor::kLogTerm, 7.82);
  EXPECT_DOUBLE_EQ(MatrixConcentrationMonitor::kEffectiveSamples, 39.0);
  EXPECT_DOUBLE_EQ(PacBayesMonitor::kKlWarning, 1.5);
  EXPECT_DOUBLE_EQ(PacBayesMonitor::kKlCritical, 3.0);
  EXPECT_DOUBLE_EQ(PacBayesMonitor::kBoundWarning, 0.35);
  EXPECT_DOUBLE_EQ(PacBayesMonitor::kBoundCritical, 0.6);
  EXPECT_DOUBLE_EQ(BorelCantelliMonitor::kTransientRate, 0.05);
  EXPECT_DOUBLE_EQ(BorelCantelliMonitor::kAbsorbingRate, 0.90);
  EXPECT_EQ(DispersionMonitor::kWindow, 32u);
  EXPECT_EQ(DispersionMonitor::kWarmupWindows, 5u);
  EXPECT_DOUBLE_EQ(DispersionMonitor::kMinMean, 0.5);
  EXPECT_DOUBLE_EQ(DispersionMonitor::kClusteredThreshold, 1.8);
  EXPECT_DOUBLE_EQ(DispersionMonitor::kUnderdispersedThreshold, 0.3);
  EXPECT_DOUBLE_EQ(OrnsteinUhlenbeckMonitor::kDiffusingTheta, 0.02);
  EXPECT_DOUBLE_EQ(OrnsteinUhlenbeckMonitor::kExplosiveTheta, -0.02);
  EXPECT_DOUBLE_EQ(HurstMonitor::kPersistentThreshold, 0.6);
  EXPECT_DOUBLE_EQ(HurstMonitor::kAntiPersistentThreshold, 0.4);
  EXPECT_DOUBLE_EQ(QuadraticVariationMonitor::kFrozenLevel, 2.0);
  EXPECT_DOUBLE_EQ(QuadraticVariationMonitor::kFrozenVariation, 0.02);
  EXPECT_DOUBLE_EQ(QuadraticVariationMonitor::kVolatileVariation, 2.0);
  EXPECT_DOUBLE_EQ(MalliavinMonitor::kSensitiveThreshold, 0.10);
  EXPECT_DOUBLE_EQ(MalliavinMonitor::kFragileThreshold, 0.35);
  EXPECT_DOUBLE_EQ(MalliavinMonitor::kFragilityIndexThreshold, 0.70);
  EXPECT_DOUBLE_EQ(LocalizationMonitor::kLocalizedThreshold, 0.35);
  EXPECT_DOUBLE_EQ(LocalizationMonitor::kConcentratedThreshold, 0.50);
}

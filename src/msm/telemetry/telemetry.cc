// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "msm/telemetry/telemetry.h"

#include "msm/core/safety_level.h"
#include "msm/monitors/base_signals.h"
#include "msm/pipeline/membrane_stats.h"

namespace msm { namespace telemetry {

using ordered_json = nlohmann::ordered_json;

namespace {

std::string str(std::string_view s) { return std::string(s); }

ordered_json stage_order_json(const control::StageOrder& order) {
  ordered_json a = ordered_json::array();
  for (control::Stage s : order) a.push_back(str(control::to_string(s)));
  return a;
}

ordered_json arena_json(const arena::ArenaStats& s, const arena::Arena& a) {
  ordered_json j = ordered_json::object();
  j["live_allocations"] = s.live_allocations;
  j["live_bytes"] = s.live_bytes;
  j["quarantined_entries"] = s.quarantined_entries;
  j["quarantined_bytes"] = s.quarantined_bytes;
  j["max_quarantined_bytes"] = s.max_quarantined_bytes;
  j["quarantine_entry_cap"] = a.quarantine_entry_cap();
  j["quarantine_byte_cap"] = a.quarantine_byte_cap();
  j["total_allocations"] = s.total_allocations;
  j["total_frees"] = s.total_frees;
  j["evictions"] = s.evictions;
  j["canary_failures"] = s.canary_failures;
  j["double_frees"] = s.double_frees;
  j["foreign_frees"] = s.foreign_frees;
  j["invalid_frees"] = s.invalid_frees;
  j["alloc_failures"] = s.alloc_failures;
  j["current_generation"] = a.current_generation();
  return j;
}

ordered_json kernel_json(const control::RuntimeKernelSummary& k) {
  ordered_json j = ordered_json::object();
  j["decisions"] = k.decisions;
  j["full_decisions"] = k.full_decisions;
  j["risk_escalations"] = k.risk_escalations;
  j["observations"] = k.observations;
  j["dropped_observations"] = k.dropped_observations;
  j["meta_steps"] = k.meta_steps;
  j["plan_refreshes"] = k.plan_refreshes;
  j["worst_level"] = str(monitors::to_string(k.worst_level));
  j["calibrating"] = k.calibrating;
  j["warning_monitors"] = k.warning_monitors;
  j["critical_monitors"] = k.critical_monitors;
  j["fusion_bonus_ppm"] = k.fusion_bonus_ppm;

  ordered_json fusion = ordered_json::object();
  fusion["bonus_ppm"] = k.fusion.bonus_ppm;
  fusion["entropy_milli"] = k.fusion.entropy_milli;
  fusion["drift_ppm"] = k.fusion.drift_ppm;
  fusion["dominant_member"] = k.fusion.dominant_signal;
  fusion["updates"] = k.fusion.updates;
  j["fusion"] = std::move(fusion);

  ordered_json probes = ordered_json::object();
  probes["identifiability_ppm"] = k.probes.identifiability_ppm;
  probes["selected_count"] = k.probes.selected_count;
  probes["mask"] = k.probes.mask;
  probes["budget_ns"] = k.probes.budget_ns;
  probes["expected_cost_ns"] = k.probes.expected_cost_ns;
  probes["observations"] = k.probes.observations;
  probes["anomaly_events"] = k.probes.anomaly_events;
  j["probes"] = std::move(probes);

  ordered_json sev = ordered_json::object();
  for (std::size_t i = 0; i < monitors::kNumSignals; ++i) {
    sev[str(monitors::to_string(static_cast<monitors::Signal>(i)))] = k.severity[i];
  }
  j["severity"] = std::move(sev);
  return j;
}

ordered_json monitors_json(const std::vector<monitors::MonitorSummary>& ms) {
  ordered_json a = ordered_json::array();
  for (const monitors::MonitorSummary& m : ms) {
    ordered_json j = ordered_json::object();
    j["name"] = str(m.name);
    j["level"] = str(monitors::to_string(m.level));
    j["state"] = str(m.state_name);
    j["statistic"] = m.statistic;
    j["secondary"] = m.secondary;
    j["observations"] = m.observations;
    j["critical_entries"] = m.critical_entries;
    a.push_back(std::move(j));
  }
  return a;
}

ordered_json risk_json(const control::RiskEnvelopeSummary& r) {
  ordered_json j = ordered_json::object();
  for (std::size_t i = 0; i < core::kNumApiFamilies; ++i) {
    ordered_json f = ordered_json::object();
    f["calls"] = r.calls[i];
    f["adverse"] = r.adverse[i];
    f["upper_bound_ppm"] = r.upper_bound_ppm[i];
    j[str(core::to_string(static_cast<core::ApiFamily>(i)))] = std::move(f);
  }
  return j;
}

ordered_json stage_oracle_json(const control::StageOracleSummary& s) {
  ordered_json j = ordered_json::object();
  j["calls"] = s.calls;
  j["early_exits"] = s.early_exits;
  j["reorderings_applied"] = s.reorderings_applied;
  j["recomputations"] = s.recomputations;
  j["dropped_reports"] = s.dropped_reports;
  ordered_json orders = ordered_json::array();
  for (const control::StageOrder& o : s.orders) orders.push_back(stage_order_json(o));
  j["orders"] = std::move(orders);
  return j;
}

ordered_json quarantine_json(const control::QuarantineControllerSummary& q) {
  ordered_json j = ordered_json::object();
  j["depth"] = q.depth;
  j["published_depth"] = control::published_quarantine_depth();
  j["lambda_latency"] = q.lambda_latency;
  j["lambda_memory"] = q.lambda_memory;
  j["escape_rate"] = q.escape_rate;
  j["last_p99_ns"] = q.last_p99_ns;
  j["epochs"] = q.epochs;
  j["total_frees"] = q.total_frees;
  j["total_detections"] = q.total_detections;
  j["last_contention_peak"] = q.last_contention_peak;
  return j;
}

ordered_json healing_json(const pipeline::HealingSummary& h) {
  ordered_json j = ordered_json::object();
  j["total_heals"] = h.total_heals;
  j["size_clamps"] = h.size_clamps;
  j["null_truncations"] = h.null_truncations;
  j["ignored_double_frees"] = h.ignored_double_frees;
  j["ignored_foreign_frees"] = h.ignored_foreign_frees;
  j["realloc_as_mallocs"] = h.realloc_as_mallocs;
  j["safe_defaults"] = h.safe_defaults;
  j["suppressed"] = h.suppressed;
  return j;
}

ordered_json membrane_json(const pipeline::MembraneStats& s) {
  auto ld = [](const std::atomic<std::uint64_t>& a) { return a.load(std::memory_order_relaxed); };
  ordered_json j = ordered_json::object();
  j["validations"] = ld(s.validations);
  j["null"] = ld(s.null_outcomes);
  j["cached_valid"] = ld(s.cached_outcomes);
  j["validated"] = ld(s.validated_outcomes);
  j["foreign"] = ld(s.foreign_outcomes);
  j["temporal_violations"] = ld(s.temporal_violations);
  j["bypassed"] = ld(s.bypassed_outcomes);
  j["fast_profile"] = ld(s.fast_profile);
  j["full_profile"] = ld(s.full_profile);
  j["bloom_rejects"] = ld(s.bloom_rejects);
  j["page_oracle_rescues"] = ld(s.page_oracle_rescues);
  j["fingerprint_mismatches"] = ld(s.fingerprint_mismatches);
  j["canary_mismatches"] = ld(s.canary_mismatches);
  j["allocations"] = ld(s.allocations);
  j["allocation_failures"] = ld(s.allocation_failures);
  j["registrations"] = ld(s.registrations);
  j["frees"] = ld(s.frees);
  j["double_frees"] = ld(s.double_frees);
  j["foreign_frees"] = ld(s.foreign_frees);
  j["invalid_frees"] = ld(s.invalid_frees);
  j["canary_corrupt_frees"] = ld(s.canary_corrupt_frees);
  return j;
}

} // namespace

ordered_json collect(pipeline::ValidationPipeline& p) {
  ordered_json root = ordered_json::object();
  root["safety_level"] = str(core::to_string(core::safety_level()));
  root["owner"] = p.owner_id();
  root["epoch"] = p.epoch();
  root["arena"] = arena_json(p.arena().stats(), p.arena());
  root["kernel"] = kernel_json(p.kernel().summary());
  root["monitors"] = monitors_json(p.kernel().monitor_summaries());
  root["risk_envelope"] = risk_json(p.kernel().risk().summary());
  root["stage_oracle"] = stage_oracle_json(p.stage_oracle().summary());
  root["quarantine_controller"] = quarantine_json(p.quarantine_controller().summary());
  root["healing"] = healing_json(p.healing().summary());
  root["membrane"] = membrane_json(pipeline::get_membrane_stats());
  return root;
}

std::string to_json(pipeline::ValidationPipeline& p, int indent) {
  return collect(p).dump(indent);
}

}} // namespace msm::telemetry

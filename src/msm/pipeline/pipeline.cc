// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "msm/pipeline/pipeline.h"

#include <algorithm>
#include <chrono>
#include <optional>

#include "msm/core/lattice.h"
#include "msm/core/safety_level.h"
#include "msm/logging/logging.h"
#include "msm/pipeline/membrane_stats.h"
#include "msm/pipeline/validation_cache.h"

namespace msm { namespace pipeline {

using control::Profile;
using control::Stage;

namespace {

std::atomic<std::uint64_t> g_next_owner{1};

std::uint64_t elapsed_ns_since(std::chrono::steady_clock::time_point t0) noexcept {
  const auto d = std::chrono::steady_clock::now() - t0;
  return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(d).count());
}

constexpr std::uint32_t stage_cost(Stage s) noexcept {
  return control::kStageCostNs[static_cast<std::size_t>(s)];
}

} // namespace

ValidationPipeline::ValidationPipeline(const core::MembraneConfig& cfg)
    : cfg_(cfg),
      owner_(g_next_owner.fetch_add(1, std::memory_order_relaxed)),
      arena_(cfg),
      bloom_(cfg.bloom_expected_items, static_cast<double>(cfg.bloom_fp_ppm) / 1e6) {}

ValidationPipeline& ValidationPipeline::get() {
  static ValidationPipeline* inst = [] {
    InitLoggingFromEnv();
    return new ValidationPipeline(core::membrane_config_from_env());
  }();
  return *inst;
}

void ValidationPipeline::register_owned_(std::uintptr_t base, std::size_t size) {
  bloom_.insert(base);
  if (cfg_.page_oracle) pages_.insert(base, size);
}

void* ValidationPipeline::allocate(std::size_t size) {
  void* p = arena_.allocate(size);
  if (p != nullptr) register_owned_(reinterpret_cast<std::uintptr_t>(p), size);
  detail::record_allocation(p != nullptr);
  kernel_.observe_allocation(size, p != nullptr);
  return p;
}

void* ValidationPipeline::allocate_aligned(std::size_t size, std::size_t align) {
  void* p = arena_.allocate_aligned(size, align);
  if (p != nullptr) register_owned_(reinterpret_cast<std::uintptr_t>(p), size);
  detail::record_allocation(p != nullptr);
  kernel_.observe_allocation(size, p != nullptr);
  return p;
}

void ValidationPipeline::register_allocation(std::uintptr_t base, std::size_t size) {
  if (base == 0) return;
  register_owned_(base, size);
  detail::record_registration();
}

arena::FreeResult ValidationPipeline::free(void* ptr) {
  const auto t0 = std::chrono::steady_clock::now();
  arena::FreeReport rep;
  std::uint64_t in_flight = 0;
  {
    control::ContentionScope scope(quarantine_.contention());
    in_flight = quarantine_.contention().current();
    rep = arena_.free(ptr);
  }
  const std::uint64_t latency = elapsed_ns_since(t0);
  // Every cached validation of this pipeline is now stale.
  epoch_.fetch_add(1, std::memory_order_acq_rel);

  const std::uintptr_t addr = reinterpret_cast<std::uintptr_t>(ptr);
  bool evicted_self = false;
  for (const arena::QuarantineEntry& e : rep.drained) {
    if (cfg_.page_oracle) pages_.remove(e.user_base, e.user_size);
    if (e.user_base == addr) evicted_self = true;
  }

  const bool detection = rep.result == arena::FreeResult::DoubleFree ||
                         pending_detections_.exchange(0, std::memory_order_relaxed) > 0;
  if (quarantine_.record_free(latency, detection)) {
    arena_.set_quarantine_depth(quarantine_.depth());
  }

  control::FreeEvent fe;
  fe.result = rep.result;
  fe.latency_ns = latency;
  const std::size_t shard_budget = std::max<std::size_t>(1, arena_.quarantine_byte_cap() / arena::Arena::kNumShards);
  fe.byte_pressure = static_cast<double>(rep.user_size) / static_cast<double>(shard_budget);
  fe.drained = rep.drained.size();
  fe.evicted_self = evicted_self;
  fe.contention_peak = in_flight;
  kernel_.observe_free(fe);
  detail::record_free(rep.result);

  if (rep.result == arena::FreeResult::DoubleFree || rep.result == arena::FreeResult::InvalidPointer) {
    MSM_LOG_EVERY_N(WARNING, 256) << "membrane free: " << arena::to_string(rep.result) << " at 0x" << std::hex
                                  << addr;
  }
  const HealingAction heal = healing_.for_free_result(rep.result);
  if (heal.is_heal()) {
    (void)healing_.apply(heal, core::safety_level());
  }
  return rep.result;
}

PointerAbstraction ValidationPipeline::abstraction_from_slot_(std::uintptr_t addr, const arena::Slot& s) noexcept {
  PointerAbstraction a;
  a.addr = addr;
  a.state = s.state;
  a.alloc_base = s.user_base;
  a.generation = s.generation;
  const std::uintptr_t end = s.user_base + s.user_size;
  a.remaining = (addr >= s.user_base && addr < end) ? static_cast<std::size_t>(end - addr) : 0;
  return a;
}

ValidationOutcome ValidationPipeline::validate(std::uintptr_t addr, core::ApiFamily family) {
  const core::SafetyLevel level = core::safety_level();
  if (!core::validation_enabled(level)) {
    detail::record_outcome(OutcomeKind::Bypassed);
    ValidationOutcome out;
    out.kind = OutcomeKind::Bypassed;
    out.abs.addr = addr;
    return out;
  }

  const auto t0 = std::chrono::steady_clock::now();
  control::ValidationEvent ev;
  ev.family = family;
  ValidationOutcome out;
  out.abs.addr = addr;

  if (addr == 0) {
    out.kind = OutcomeKind::Null;
    ev.null = true;
    ev.profile = Profile::Fast;
    ev.lookup_cost_ns = stage_cost(Stage::Null);
    ev.elapsed_ns = elapsed_ns_since(t0);
    kernel_.observe_validation(ev);
    detail::record_outcome(out.kind);
    return out;
  }

  const bool aligned = (addr & 0x7) == 0;
  const std::uint8_t fam = core::family_index(family);
  const control::Decision decision = kernel_.decide(family, level);
  const bool full = decision.profile == Profile::Full;
  // Hardened keeps the rescue and integrity stages even on the fast profile
  // since its healing depends on precise bounds.
  const bool deep = full || core::heals_enabled(level);
  ev.profile = decision.profile;
  detail::record_profile(full);

  // Read before the arena lookup so a concurrent free makes the entry we
  // insert below stale.
  const std::uint64_t epoch = epoch_.load(std::memory_order_acquire);
  const control::StageOrder order = control::dependency_safe(oracle_.order_for(fam, aligned));

  std::optional<arena::Slot> slot;
  std::optional<Stage> exit_stage;
  bool done = false;
  bool page_rescued = false;
  std::uint32_t cost = 0;

  for (Stage s : order) {
    if (done) break;
    switch (s) {
      case Stage::Null:
        cost += stage_cost(s);
        break;
      case Stage::TlsCache: {
        if (!cfg_.tls_cache) break;
        cost += stage_cost(s);
        if (auto hit = ValidationCache::local().lookup(owner_, addr, epoch)) {
          ev.cache_hit = true;
          out.kind = OutcomeKind::CachedValid;
          out.abs.state = hit->state;
          out.abs.alloc_base = hit->user_base;
          out.abs.generation = hit->generation;
          out.abs.remaining = hit->user_size - static_cast<std::size_t>(addr - hit->user_base);
          exit_stage = s;
          done = true;
        }
        break;
      }
      case Stage::Bloom:
        if (slot) break;
        cost += stage_cost(s);
        if (!bloom_.might_contain(addr)) {
          ev.bloom_reject = true;
          // Only a deep call pays for the page-oracle cross-check;
          // interior pointers are never in the bloom.
          page_rescued = deep && cfg_.page_oracle && pages_.query(addr);
          detail::record_bloom_reject(page_rescued);
          if (!page_rescued) {
            ev.foreign = true;
            out.kind = OutcomeKind::Foreign;
            exit_stage = s;
            done = true;
          }
        }
        break;
      case Stage::Arena:
        if (slot) break;
        cost += stage_cost(s);
        slot = arena_.lookup(addr);
        if (!slot) {
          ev.foreign = true;
          if (page_rescued) {
            ev.page_disagreement = true;
          } else if (!ev.bloom_reject && !(cfg_.page_oracle && pages_.query(addr))) {
            ev.arena_miss = true;
          }
          out.kind = OutcomeKind::Foreign;
          exit_stage = s;
          done = true;
        } else if (!core::is_live(slot->state)) {
          ev.temporal = true;
          ev.adverse = true;
          out.kind = OutcomeKind::TemporalViolation;
          out.abs = abstraction_from_slot_(addr, *slot);
          pending_detections_.fetch_add(1, std::memory_order_relaxed);
          exit_stage = s;
          done = true;
        }
        break;
      case Stage::Fingerprint:
      case Stage::Canary:
      case Stage::Bounds:
        // Integrity stages run after the loop once the slot is known.
        break;
    }
  }

  if (!done && !slot) {
    // Every lookup stage passed without an arena hit; only reachable when
    // the arena stage could not run.
    ev.foreign = true;
    out.kind = OutcomeKind::Foreign;
  } else if (!done) {
    const arena::Slot& sl = *slot;
    // A concurrent free that released the block leaves no report; the
    // outcome then stands on the lookup alone.
    const std::optional<arena::IntegrityReport> integrity =
        deep ? arena_.verify_integrity(sl.user_base, sl.generation) : std::nullopt;
    if (integrity) {
      bool fp_ok = true;
      bool canary_ok = true;
      for (Stage s : order) {
        if (s == Stage::Fingerprint) fp_ok = integrity->header_ok;
        if (s == Stage::Canary) canary_ok = integrity->canary_ok;
      }
      if (!fp_ok || !canary_ok) {
        ev.fingerprint_mismatch = !fp_ok;
        ev.adverse = true;
        detail::record_integrity_mismatch(!fp_ok, !canary_ok);
        MSM_LOG_EVERY_N(WARNING, 1024) << "membrane validate: integrity mismatch on live block 0x" << std::hex
                                       << sl.user_base << (fp_ok ? "" : " (fingerprint)")
                                       << (canary_ok ? "" : " (canary)");
      }
    }
    out.kind = OutcomeKind::Validated;
    out.abs = abstraction_from_slot_(addr, sl);
    ev.interior_pointer = addr != sl.user_base;

    if (cfg_.tls_cache) {
      CacheEntry e;
      e.owner = owner_;
      e.addr = addr;
      e.user_base = sl.user_base;
      e.user_size = sl.user_size;
      e.generation = sl.generation;
      e.state = sl.state;
      e.epoch = epoch;
      e.valid = true;
      ValidationCache::local().insert(e);
    }
  }

  oracle_.report_outcome(fam, aligned, order, exit_stage);
  ev.lookup_cost_ns = cost;
  ev.elapsed_ns = elapsed_ns_since(t0);
  kernel_.observe_validation(ev);
  detail::record_outcome(out.kind);
  return out;
}

std::size_t ValidationPipeline::copy_length(const void* dst, const void* src, std::size_t n) {
  const ValidationOutcome d = validate(dst, core::ApiFamily::StringMemory);
  const ValidationOutcome s = validate(src, core::ApiFamily::StringMemory);
  const std::optional<std::size_t> dst_rem = d.is_valid() ? d.abs.remaining : std::nullopt;
  const std::optional<std::size_t> src_rem = s.is_valid() ? s.abs.remaining : std::nullopt;
  const HealingAction a = healing_.heal_copy_bounds(n, src_rem, dst_rem);
  if (healing_.apply(a, core::safety_level())) return a.value;
  return n;
}

std::size_t ValidationPipeline::string_length(const void* dst, std::size_t src_len) {
  const ValidationOutcome d = validate(dst, core::ApiFamily::StringMemory);
  const std::optional<std::size_t> dst_rem = d.is_valid() ? d.abs.remaining : std::nullopt;
  const HealingAction a = healing_.heal_string_bounds(src_len, dst_rem);
  if (healing_.apply(a, core::safety_level())) return a.value;
  return src_len;
}

}} // namespace msm::pipeline

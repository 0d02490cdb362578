// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "msm/arena/arena.h"

#include <algorithm>
#include <cstdlib>

#include "msm/arena/fingerprint.h"
#include "msm/core/checked_math.h"
#include "msm/logging/logging.h"

namespace msm { namespace arena {

using core::SafetyState;

std::string_view to_string(FreeResult r) noexcept {
  switch (r) {
    case FreeResult::Freed: return "freed";
    case FreeResult::FreedWithCanaryCorruption: return "freed_with_canary_corruption";
    case FreeResult::DoubleFree: return "double_free";
    case FreeResult::ForeignPointer: return "foreign_pointer";
    case FreeResult::InvalidPointer: return "invalid_pointer";
  }
  return "foreign_pointer";
}

Arena::Arena(const core::MembraneConfig& cfg)
    : depth_cap_(cfg.quarantine_max_entries),
      max_bytes_(cfg.quarantine_max_bytes),
      max_entries_(cfg.quarantine_max_entries),
      adaptive_(cfg.adaptive_quarantine) {}

Arena::~Arena() {
  for (auto& sh : shards_) {
    std::lock_guard<std::mutex> lk(sh.mu);
    for (const Slot& s : sh.slots) {
      if (core::is_live(s.state) || s.state == SafetyState::Quarantined) {
        os_free_(reinterpret_cast<void*>(s.raw_base));
      }
    }
    sh.slots.clear();
    sh.by_addr.clear();
    sh.quarantine.clear();
  }
}

void* Arena::os_alloc_(std::size_t nbytes, std::size_t alignment) noexcept {
  void* p = nullptr;
  int rc = posix_memalign(&p, alignment, nbytes);
  if (rc != 0) return nullptr;
  return p;
}

void Arena::os_free_(void* p) noexcept { std::free(p); }

void* Arena::allocate(std::size_t size) { return allocate_impl_(size, kMinAlign); }

void* Arena::allocate_aligned(std::size_t size, std::size_t align) {
  if (!core::is_pow2(align)) {
    alloc_failures_.fetch_add(1, std::memory_order_relaxed);
    return nullptr;
  }
  return allocate_impl_(size, std::max(align, kMinAlign));
}

void* Arena::allocate_impl_(std::size_t size, std::size_t align) {
  if (size == 0) size = 1;
  // The header lives in the alignment padding below user_base.
  const std::size_t offset = align;
  std::size_t total = 0;
  if (!core::checked_add3_size(offset, size, kCanarySize, total)) {
    alloc_failures_.fetch_add(1, std::memory_order_relaxed);
    return nullptr;
  }
  void* raw = os_alloc_(total, align);
  if (!raw) {
    alloc_failures_.fetch_add(1, std::memory_order_relaxed);
    MSM_LOG_EVERY_N(WARNING, 1024) << "system allocation of " << total << " bytes failed";
    return nullptr;
  }
  const std::uintptr_t raw_base = reinterpret_cast<std::uintptr_t>(raw);
  const std::uintptr_t user_base = raw_base + offset;
  const std::uint32_t gen = next_generation_.fetch_add(1, std::memory_order_relaxed);

  const Fingerprint fp = Fingerprint::compute(user_base, size, gen);
  write_header(user_base, fp);
  write_canary(user_base, size, fp);

  Slot slot;
  slot.raw_base = raw_base;
  slot.user_base = user_base;
  slot.user_size = size;
  slot.align = align;
  slot.generation = gen;
  slot.state = SafetyState::Valid;

  Shard& sh = shards_[shard_index(user_base)];
  {
    std::lock_guard<std::mutex> lk(sh.mu);
    std::uint32_t idx = 0;
    if (!sh.free_list.empty()) {
      idx = sh.free_list.back();
      sh.free_list.pop_back();
      sh.slots[idx] = slot;
    } else {
      idx = static_cast<std::uint32_t>(sh.slots.size());
      sh.slots.push_back(slot);
    }
    sh.by_addr[user_base] = idx;
    sh.live_bytes += size;
    sh.live_count += 1;
  }
  total_allocations_.fetch_add(1, std::memory_order_relaxed);
  return reinterpret_cast<void*>(user_base);
}

bool Arena::is_tombstoned_locked_(const Shard& sh, std::uintptr_t addr) const noexcept {
  for (std::uintptr_t t : sh.tombstones) {
    if (t == addr && t != 0) return true;
  }
  return false;
}

void Arena::drain_locked_(Shard& sh, std::vector<QuarantineEntry>& out) noexcept {
  const std::size_t byte_cap = std::max<std::size_t>(1, max_bytes_ / kNumShards);
  const std::size_t entry_cap = std::max<std::size_t>(1, quarantine_entry_cap() / kNumShards);
  while (!sh.quarantine.empty() &&
         (sh.quarantined_bytes > byte_cap || sh.quarantine.size() > entry_cap)) {
    QuarantineEntry e = sh.quarantine.front();
    sh.quarantine.pop_front();
    auto it = sh.by_addr.find(e.user_base);
    if (it != sh.by_addr.end()) {
      const std::uint32_t idx = it->second;
      sh.slots[idx].state = SafetyState::Freed;
      sh.by_addr.erase(it);
      sh.free_list.push_back(idx);
    }
    sh.quarantined_bytes -= e.total_size;
    quarantined_bytes_total_.fetch_sub(e.total_size, std::memory_order_relaxed);
    sh.tombstones[sh.tombstone_pos] = e.user_base;
    sh.tombstone_pos = (sh.tombstone_pos + 1) % kTombstonesPerShard;
    evictions_.fetch_add(1, std::memory_order_relaxed);
    out.push_back(e);
  }
}

FreeReport Arena::free(void* user_ptr) {
  FreeReport rep;
  total_frees_.fetch_add(1, std::memory_order_relaxed);
  const std::uintptr_t addr = reinterpret_cast<std::uintptr_t>(user_ptr);
  if (addr == 0) {
    rep.result = FreeResult::ForeignPointer;
    foreign_frees_.fetch_add(1, std::memory_order_relaxed);
    return rep;
  }
  Shard& sh = shards_[shard_index(addr)];
  bool exact_miss = false;
  {
    std::lock_guard<std::mutex> lk(sh.mu);
    auto it = sh.by_addr.find(addr);
    if (it == sh.by_addr.end()) {
      if (is_tombstoned_locked_(sh, addr)) {
        rep.result = FreeResult::DoubleFree;
      } else {
        exact_miss = true;
      }
    } else {
      Slot& slot = sh.slots[it->second];
      switch (slot.state) {
        case SafetyState::Quarantined:
        case SafetyState::Freed:
          rep.result = FreeResult::DoubleFree;
          break;
        case SafetyState::Invalid:
        case SafetyState::Unknown:
          rep.result = FreeResult::InvalidPointer;
          break;
        default: {
          const bool canary_ok = verify_canary(slot.user_base, slot.user_size, slot.generation);
          slot.generation = next_generation_.fetch_add(1, std::memory_order_relaxed);
          slot.state = SafetyState::Quarantined;
          QuarantineEntry e;
          e.user_base = slot.user_base;
          e.raw_base = slot.raw_base;
          e.user_size = slot.user_size;
          e.align = slot.align;
          e.total_size = slot.align + slot.user_size + kCanarySize;
          rep.generation = slot.generation;
          rep.user_size = slot.user_size;
          sh.live_bytes -= slot.user_size;
          sh.live_count -= 1;
          sh.quarantine.push_back(e);
          sh.quarantined_bytes += e.total_size;
          quarantined_bytes_total_.fetch_add(e.total_size, std::memory_order_relaxed);
          // slot may be invalidated by draining; nothing below touches it
          drain_locked_(sh, rep.drained);
          const std::uint64_t now_q = quarantined_bytes_total_.load(std::memory_order_relaxed);
          std::uint64_t prev_max = max_quarantined_bytes_.load(std::memory_order_relaxed);
          while (now_q > prev_max &&
                 !max_quarantined_bytes_.compare_exchange_weak(prev_max, now_q, std::memory_order_relaxed)) {
          }
          rep.result = canary_ok ? FreeResult::Freed : FreeResult::FreedWithCanaryCorruption;
          break;
        }
      }
    }
  }
  if (exact_miss) {
    // An interior pointer of a tracked block is invalid; anything else is foreign.
    rep.result = lookup(addr).has_value() ? FreeResult::InvalidPointer : FreeResult::ForeignPointer;
  }
  for (const QuarantineEntry& e : rep.drained) {
    os_free_(reinterpret_cast<void*>(e.raw_base));
  }
  switch (rep.result) {
    case FreeResult::FreedWithCanaryCorruption:
      canary_failures_.fetch_add(1, std::memory_order_relaxed);
      MSM_LOG_EVERY_N(WARNING, 256) << "canary corruption detected on free of 0x" << std::hex << addr;
      break;
    case FreeResult::DoubleFree: double_frees_.fetch_add(1, std::memory_order_relaxed); break;
    case FreeResult::ForeignPointer: foreign_frees_.fetch_add(1, std::memory_order_relaxed); break;
    case FreeResult::InvalidPointer: invalid_frees_.fetch_add(1, std::memory_order_relaxed); break;
    case FreeResult::Freed: break;
  }
  return rep;
}

std::optional<Slot> Arena::lookup_in_shard_(const Shard& sh, std::uintptr_t addr) const {
  std::lock_guard<std::mutex> lk(sh.mu);
  auto it = sh.by_addr.upper_bound(addr);
  if (it == sh.by_addr.begin()) return std::nullopt;
  --it;
  const Slot& s = sh.slots[it->second];
  if (!(core::is_live(s.state) || s.state == SafetyState::Quarantined)) return std::nullopt;
  if (addr >= s.user_base && addr - s.user_base < s.user_size) return s;
  return std::nullopt;
}

std::optional<Slot> Arena::lookup(std::uintptr_t addr) const {
  if (addr == 0) return std::nullopt;
  const std::size_t home = shard_index(addr);
  if (auto s = lookup_in_shard_(shards_[home], addr)) return s;
  for (std::size_t i = 0; i < kNumShards; ++i) {
    if (i == home) continue;
    if (auto s = lookup_in_shard_(shards_[i], addr)) return s;
  }
  return std::nullopt;
}

std::optional<IntegrityReport> Arena::verify_integrity(std::uintptr_t user_base,
                                                       std::uint32_t generation) const {
  if (user_base == 0) return std::nullopt;
  const Shard& sh = shards_[shard_index(user_base)];
  std::lock_guard<std::mutex> lk(sh.mu);
  auto it = sh.by_addr.find(user_base);
  if (it == sh.by_addr.end()) return std::nullopt;
  const Slot& s = sh.slots[it->second];
  if (!core::is_live(s.state) || s.generation != generation) return std::nullopt;
  IntegrityReport r;
  r.header_ok = verify_header(s.user_base, s.user_size, s.generation);
  r.canary_ok = verify_canary(s.user_base, s.user_size, s.generation);
  return r;
}

std::optional<std::pair<Slot, std::size_t>> Arena::remaining_from(std::uintptr_t addr) const {
  auto s = lookup(addr);
  if (!s) return std::nullopt;
  const std::size_t remaining = static_cast<std::size_t>(s->user_base + s->user_size - addr);
  return std::make_pair(*s, remaining);
}

void Arena::set_quarantine_depth(std::size_t depth) noexcept {
  depth_cap_.store(depth, std::memory_order_relaxed);
}

std::size_t Arena::quarantine_entry_cap() const noexcept {
  if (!adaptive_) return max_entries_;
  return std::min(max_entries_, depth_cap_.load(std::memory_order_relaxed));
}

ArenaStats Arena::stats() const {
  ArenaStats st;
  for (const auto& sh : shards_) {
    std::lock_guard<std::mutex> lk(sh.mu);
    st.live_allocations += sh.live_count;
    st.live_bytes += sh.live_bytes;
    st.quarantined_entries += sh.quarantine.size();
    st.quarantined_bytes += sh.quarantined_bytes;
  }
  st.total_allocations = total_allocations_.load(std::memory_order_relaxed);
  st.total_frees = total_frees_.load(std::memory_order_relaxed);
  st.evictions = evictions_.load(std::memory_order_relaxed);
  st.canary_failures = canary_failures_.load(std::memory_order_relaxed);
  st.double_frees = double_frees_.load(std::memory_order_relaxed);
  st.foreign_frees = foreign_frees_.load(std::memory_order_relaxed);
  st.invalid_frees = invalid_frees_.load(std::memory_order_relaxed);
  st.alloc_failures = alloc_failures_.load(std::memory_order_relaxed);
  st.max_quarantined_bytes = max_quarantined_bytes_.load(std::memory_order_relaxed);
  return st;
}

}} // namespace msm::arena

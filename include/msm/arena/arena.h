// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include "msm/core/config.h"
#include "msm/core/lattice.h"

namespace msm { namespace arena {

enum class FreeResult : std::uint8_t {
  Freed = 0,
  FreedWithCanaryCorruption = 1,
  DoubleFree = 2,
  ForeignPointer = 3,
  InvalidPointer = 4,
};

std::string_view to_string(FreeResult r) noexcept;

inline constexpr bool is_adverse(FreeResult r) noexcept { return r != FreeResult::Freed; }

struct Slot {
  std::uintptr_t raw_base{0};
  std::uintptr_t user_base{0};
  std::size_t    user_size{0};
  std::size_t    align{0};
  std::uint32_t  generation{0};
  core::SafetyState state{core::SafetyState::Invalid};
};

struct QuarantineEntry {
  std::uintptr_t user_base{0};
  std::uintptr_t raw_base{0};
  std::size_t    total_size{0};
  std::size_t    user_size{0};
  std::size_t    align{0};
};

// Result of Arena::free. drained lists the entries whose memory was released
// by this call; their addresses must be forgotten by any filters.
struct FreeReport {
  FreeResult result{FreeResult::ForeignPointer};
  std::uint32_t generation{0};  // generation after the transition, 0 if none
  std::size_t user_size{0};
  std::vector<QuarantineEntry> drained;
};

struct IntegrityReport {
  bool header_ok{true};
  bool canary_ok{true};
};

struct ArenaStats {
  std::uint64_t live_allocations{0};
  std::uint64_t live_bytes{0};
  std::uint64_t quarantined_entries{0};
  std::uint64_t quarantined_bytes{0};
  std::uint64_t total_allocations{0};
  std::uint64_t total_frees{0};
  std::uint64_t evictions{0};
  std::uint64_t canary_failures{0};
  std::uint64_t double_frees{0};
  std::uint64_t foreign_frees{0};
  std::uint64_t invalid_frees{0};
  std::uint64_t alloc_failures{0};
  std::uint64_t max_quarantined_bytes{0};
};

// Sharded generational arena with per-shard FIFO quarantine.
// Every allocation is laid out as
//   raw_base .. [pad][header 16B] user_base [user_size] [canary 8B]
// Shards are selected by (user_base >> 12) % kNumShards and each holds its
// own lock; no call holds two shard locks at once.
class Arena final {
 public:
  static constexpr std::size_t kNumShards = 16;
  static constexpr std::size_t kMinAlign = 16;
  // Addresses of recently released blocks remembered per shard so that a
  // second free after eviction is still reported as a double free.
  static constexpr std::size_t kTombstonesPerShard = 256;

  explicit Arena(const core::MembraneConfig& cfg = core::MembraneConfig{});
  ~Arena();

  Arena(const Arena&) = delete;
  Arena& operator=(const Arena&) = delete;

  // nullptr on size overflow or system allocation failure. size 0 is
  // treated as 1.
  void* allocate(std::size_t size);
  // align must be a power of two; values below 16 are raised to 16.
  // nullptr on a non power-of-two align.
  void* allocate_aligned(std::size_t size, std::size_t align);

  FreeReport free(void* user_ptr);

  // Exact user base or interior pointer of a live or quarantined slot.
  std::optional<Slot> lookup(std::uintptr_t addr) const;
  // Slot containing addr and the bytes from addr to the end of the user region.
  std::optional<std::pair<Slot, std::size_t>> remaining_from(std::uintptr_t addr) const;
  bool contains(std::uintptr_t addr) const { return lookup(addr).has_value(); }
  // Header and canary check of the live block at user_base, run under its
  // shard lock so the memory cannot be released mid-read. nullopt when the
  // block is no longer live at that generation.
  std::optional<IntegrityReport> verify_integrity(std::uintptr_t user_base, std::uint32_t generation) const;

  // Upper bound on quarantined entries across all shards; the configured
  // maximum still applies. Lock-free.
  void set_quarantine_depth(std::size_t depth) noexcept;
  std::size_t quarantine_entry_cap() const noexcept;
  std::size_t quarantine_byte_cap() const noexcept { return max_bytes_; }

  ArenaStats stats() const;
  std::uint32_t current_generation() const noexcept {
    return next_generation_.load(std::memory_order_relaxed);
  }

  static std::size_t shard_index(std::uintptr_t user_base) noexcept {
    return static_cast<std::size_t>((user_base >> 12) % kNumShards);
  }

 private:
  struct Shard {
    mutable std::mutex mu;
    std::vector<Slot> slots;
    std::vector<std::uint32_t> free_list;
    std::map<std::uintptr_t, std::uint32_t> by_addr;  // user_base -> slot index
    std::deque<QuarantineEntry> quarantine;
    std::size_t quarantined_bytes{0};
    std::size_t live_bytes{0};
    std::size_t live_count{0};
    std::array<std::uintptr_t, kTombstonesPerShard> tombstones{};
    std::size_t tombstone_pos{0};
  };

  void* allocate_impl_(std::size_t size, std::size_t align);
  // Caller holds sh.mu. Appends released entries to out.
  void drain_locked_(Shard& sh, std::vector<QuarantineEntry>& out) noexcept;
  bool is_tombstoned_locked_(const Shard& sh, std::uintptr_t addr) const noexcept;
  std::optional<Slot> lookup_in_shard_(const Shard& sh, std::uintptr_t addr) const;

  static void* os_alloc_(std::size_t nbytes, std::size_t alignment) noexcept;
  static void  os_free_(void* p) noexcept;

  std::array<Shard, kNumShards> shards_;
  std::atomic<std::uint32_t> next_generation_{1};
  std::atomic<std::size_t> depth_cap_;
  const std::size_t max_bytes_;
  const std::size_t max_entries_;
  const bool adaptive_;

  // Counters updated with relaxed ordering.
  std::atomic<std::uint64_t> total_allocations_{0};
  std::atomic<std::uint64_t> total_frees_{0};
  std::atomic<std::uint64_t> evictions_{0};
  std::atomic<std::uint64_t> canary_failures_{0};
  std::atomic<std::uint64_t> double_frees_{0};
  std::atomic<std::uint64_t> foreign_frees_{0};
  std::atomic<std::uint64_t> invalid_frees_{0};
  std::atomic<std::uint64_t> alloc_failures_{0};
  std::atomic<std::uint64_t> max_quarantined_bytes_{0};
  std::atomic<std::uint64_t> quarantined_bytes_total_{0};
};

}} // namespace msm::arena

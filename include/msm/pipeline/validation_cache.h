// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

#include "msm/core/lattice.h"

namespace msm { namespace pipeline {

struct CacheEntry {
  std::uint64_t  owner{0};     // pipeline instance id
  std::uintptr_t addr{0};
  std::uintptr_t user_base{0};
  std::size_t    user_size{0};
  std::uint32_t  generation{0};
  core::SafetyState state{core::SafetyState::Unknown};
  std::uint64_t  epoch{0};
  bool           valid{false};
};

// Direct-mapped per-thread cache of recent validation results. One instance
// per OS thread; never shared, so no synchronization.
class ValidationCache final {
 public:
  static constexpr std::size_t kEntries = 1024;

  static ValidationCache& local() noexcept;

  // Hit only when owner, address and epoch all match.
  std::optional<CacheEntry> lookup(std::uint64_t owner, std::uintptr_t addr,
                                   std::uint64_t epoch) noexcept;
  void insert(const CacheEntry& e) noexcept;
  void invalidate(std::uintptr_t user_base) noexcept;
  void invalidate_all() noexcept;

  std::uint64_t hits() const noexcept { return hits_; }
  std::uint64_t misses() const noexcept { return misses_; }
  void reset_counters_for_tests() noexcept { hits_ = 0; misses_ = 0; }

  static std::size_t index_of(std::uintptr_t addr) noexcept {
    return static_cast<std::size_t>((addr >> 12) & (kEntries - 1));
  }

 private:
  std::array<CacheEntry, kEntries> entries_{};
  std::uint64_t hits_{0};
  std::uint64_t misses_{0};
};

}} // namespace msm::pipeline

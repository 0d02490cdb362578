// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "msm/arena/arena.h"
#include "msm/core/safety_level.h"

namespace msm { namespace pipeline {

enum class HealKind : std::uint8_t {
  None = 0,
  ClampSize,
  TruncateWithNull,
  IgnoreDoubleFree,
  IgnoreForeignFree,
  ReallocAsMalloc,
  ReturnSafeDefault,
};

std::string_view to_string(HealKind k) noexcept;

struct HealingAction {
  HealKind kind{HealKind::None};
  std::size_t requested{0};
  std::size_t value{0};  // clamped size, truncated length or realloc size

  bool is_heal() const noexcept { return kind != HealKind::None; }
  bool operator==(const HealingAction& o) const noexcept {
    return kind == o.kind && requested == o.requested && value == o.value;
  }
};

struct HealingSummary {
  std::uint64_t total_heals{0};
  std::uint64_t size_clamps{0};
  std::uint64_t null_truncations{0};
  std::uint64_t ignored_double_frees{0};
  std::uint64_t ignored_foreign_frees{0};
  std::uint64_t realloc_as_mallocs{0};
  std::uint64_t safe_defaults{0};
  std::uint64_t suppressed{0};  // actions reported while healing was disabled
};

// Repairs the membrane can make instead of failing a call. Constructing an
// action is pure; apply() records it and returns whether the current
// safety level lets the caller act on it.
class HealingPolicy final {
 public:
  HealingAction heal_copy_bounds(std::size_t requested, std::optional<std::size_t> src_remaining,
                                 std::optional<std::size_t> dst_remaining) const noexcept;
  HealingAction heal_string_bounds(std::size_t src_len, std::optional<std::size_t> dst_remaining) const noexcept;
  HealingAction for_free_result(arena::FreeResult r) const noexcept;
  HealingAction realloc_as_malloc(std::size_t size) const noexcept {
    return HealingAction{HealKind::ReallocAsMalloc, size, size};
  }
  HealingAction safe_default() const noexcept { return HealingAction{HealKind::ReturnSafeDefault, 0, 0}; }

  bool apply(const HealingAction& a, core::SafetyLevel level) noexcept;

  HealingSummary summary() const noexcept;
  void reset_for_tests() noexcept;

 private:
  std::atomic<std::uint64_t> total_heals_{0};
  std::atomic<std::uint64_t> size_clamps_{0};
  std::atomic<std::uint64_t> null_truncations_{0};
  std::atomic<std::uint64_t> double_frees_{0};
  std::atomic<std::uint64_t> foreign_frees_{0};
  std::atomic<std::uint64_t> realloc_as_mallocs_{0};
  std::atomic<std::uint64_t> safe_defaults_{0};
  std::atomic<std::uint64_t> suppressed_{0};
};

}} // namespace msm::pipeline

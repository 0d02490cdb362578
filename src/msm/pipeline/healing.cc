// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "msm/pipeline/healing.h"

#include <algorithm>
#include <initializer_list>

namespace msm { namespace pipeline {

std::string_view to_string(HealKind k) noexcept {
  switch (k) {
    case HealKind::None: return "none";
    case HealKind::ClampSize: return "clamp_size";
    case HealKind::TruncateWithNull: return "truncate_with_null";
    case HealKind::IgnoreDoubleFree: return "ignore_double_free";
    case HealKind::IgnoreForeignFree: return "ignore_foreign_free";
    case HealKind::ReallocAsMalloc: return "realloc_as_malloc";
    case HealKind::ReturnSafeDefault: return "return_safe_default";
  }
  return "none";
}

HealingAction HealingPolicy::heal_copy_bounds(std::size_t requested, std::optional<std::size_t> src_remaining,
                                              std::optional<std::size_t> dst_remaining) const noexcept {
  std::size_t available = 0;
  if (src_remaining && dst_remaining) {
    available = std::min(*src_remaining, *dst_remaining);
  } else if (src_remaining) {
    available = *src_remaining;
  } else if (dst_remaining) {
    available = *dst_remaining;
  } else {
    return HealingAction{};
  }
  if (requested <= available) return HealingAction{};
  return HealingAction{HealKind::ClampSize, requested, available};
}

HealingAction HealingPolicy::heal_string_bounds(std::size_t src_len,
                                                std::optional<std::size_t> dst_remaining) const noexcept {
  // The terminator needs a byte of its own.
  if (!dst_remaining || src_len < *dst_remaining) return HealingAction{};
  const std::size_t truncated = *dst_remaining > 0 ? *dst_remaining - 1 : 0;
  return HealingAction{HealKind::TruncateWithNull, src_len, truncated};
}

HealingAction HealingPolicy::for_free_result(arena::FreeResult r) const noexcept {
  switch (r) {
    case arena::FreeResult::DoubleFree: return HealingAction{HealKind::IgnoreDoubleFree, 0, 0};
    case arena::FreeResult::ForeignPointer:
    case arena::FreeResult::InvalidPointer:
      return HealingAction{HealKind::IgnoreForeignFree, 0, 0};
    case arena::FreeResult::Freed:
    case arena::FreeResult::FreedWithCanaryCorruption:
      break;
  }
  return HealingAction{};
}

bool HealingPolicy::apply(const HealingAction& a, core::SafetyLevel level) noexcept {
  if (!a.is_heal()) return false;
  if (!core::heals_enabled(level)) {
    suppressed_.fetch_add(1, std::memory_order_relaxed);
    return false;
  }
  total_heals_.fetch_add(1, std::memory_order_relaxed);
  switch (a.kind) {
    case HealKind::ClampSize: size_clamps_.fetch_add(1, std::memory_order_relaxed); break;
    case HealKind::TruncateWithNull: null_truncations_.fetch_add(1, std::memory_order_relaxed); break;
    case HealKind::IgnoreDoubleFree: double_frees_.fetch_add(1, std::memory_order_relaxed); break;
    case HealKind::IgnoreForeignFree: foreign_frees_.fetch_add(1, std::memory_order_relaxed); break;
    case HealKind::ReallocAsMalloc: realloc_as_mallocs_.fetch_add(1, std::memory_order_relaxed); break;
    case HealKind::ReturnSafeDefault: safe_defaults_.fetch_add(1, std::memory_order_relaxed); break;
    case HealKind::None: break;
  }
  return true;
}

HealingSummary HealingPolicy::summary() const noexcept {
  HealingSummary s;
  s.total_heals = total_heals_.load(std::memory_order_relaxed);
  s.size_clamps = size_clamps_.load(std::memory_order_relaxed);
  s.null_truncations = null_truncations_.load(std::memory_order_relaxed);
  s.ignored_double_frees = double_frees_.load(std::memory_order_relaxed);
  s.ignored_foreign_frees = foreign_frees_.load(std::memory_order_relaxed);
  s.realloc_as_mallocs = realloc_as_mallocs_.load(std::memory_order_relaxed);
  s.safe_defaults = safe_defaults_.load(std::memory_order_relaxed);
  s.suppressed = suppressed_.load(std::memory_order_relaxed);
  return s;
}

void HealingPolicy::reset_for_tests() noexcept {
  for (auto* c : {&total_heals_, &size_clamps_, &null_truncations_, &double_frees_, &foreign_frees_,
                  &realloc_as_mallocs_, &safe_defaults_, &suppressed_}) {
    c->store(0, std::memory_order_relaxed);
  }
}

}} // namespace msm::pipeline

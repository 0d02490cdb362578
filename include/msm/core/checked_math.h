// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>

namespace msm {
namespace core {

[[nodiscard]] inline bool checked_add_size(std::size_t a, std::size_t b, std::size_t& out) noexcept {
  if (a > std::numeric_limits<std::size_t>::max() - b) return false;
  out = a + b;
  return true;
}

[[nodiscard]] inline bool checked_mul_size(std::size_t a, std::size_t b, std::size_t& out) noexcept {
  if (a == 0 || b == 0) { out = 0; return true; }
  if (a > std::numeric_limits<std::size_t>::max() / b) return false;
  out = a * b;
  return true;
}

inline constexpr bool is_pow2(std::size_t v) noexcept { return v && ((v & (v - 1)) == 0); }

// Round v up to a multiple of align (power of two). Fails on overflow.
[[nodiscard]] inline bool align_up_size(std::size_t v, std::size_t align, std::size_t& out) noexcept {
  if (!is_pow2(align)) return false;
  std::size_t tmp = 0;
  if (!checked_add_size(v, align - 1, tmp)) return false;
  out = tmp & ~(align - 1);
  return true;
}

// Sum of three terms, used for header + payload + trailer sizing.
[[nodiscard]] inline bool checked_add3_size(std::size_t a, std::size_t b, std::size_t c, std::size_t& out) noexcept {
  std::size_t ab = 0;
  if (!checked_add_size(a, b, ab)) return false;
  return checked_add_size(ab, c, out);
}

} // namespace core
} // namespace msm

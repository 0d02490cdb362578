// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once
#include <cstdint>
#include <string_view>

namespace msm { namespace core {

// Ordered safety lattice for a pointer's target. Higher is safer.
enum class SafetyState : std::uint8_t {
  Unknown = 0,
  Invalid = 1,
  Freed = 2,
  Quarantined = 3,
  Writable = 4,
  Readable = 5,
  Valid = 6,
};

inline constexpr bool can_read(SafetyState s) noexcept {
  return s == SafetyState::Valid || s == SafetyState::Readable;
}

inline constexpr bool can_write(SafetyState s) noexcept {
  return s == SafetyState::Valid || s == SafetyState::Writable;
}

inline constexpr bool is_live(SafetyState s) noexcept {
  return s == SafetyState::Valid || s == SafetyState::Readable || s == SafetyState::Writable;
}

// Greatest lower bound; combining two facts about the same pointer.
inline constexpr SafetyState meet(SafetyState a, SafetyState b) noexcept {
  return static_cast<std::uint8_t>(a) < static_cast<std::uint8_t>(b) ? a : b;
}

std::string_view to_string(SafetyState s) noexcept;

}} // namespace msm::core

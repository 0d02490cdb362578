// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "msm/core/lattice.h"

namespace msm { namespace pipeline {

enum class OutcomeKind : std::uint8_t {
  Null = 0,
  CachedValid = 1,
  Validated = 2,
  Foreign = 3,
  TemporalViolation = 4,
  Bypassed = 5,
};

std::string_view to_string(OutcomeKind k) noexcept;

// What the membrane knows about one address.
struct PointerAbstraction {
  std::uintptr_t addr{0};
  core::SafetyState state{core::SafetyState::Unknown};
  std::optional<std::uintptr_t> alloc_base;
  std::optional<std::size_t> remaining;  // bytes from addr to the end of the user region
  std::optional<std::uint32_t> generation;
};

struct ValidationOutcome {
  OutcomeKind kind{OutcomeKind::Bypassed};
  PointerAbstraction abs{};

  // Pointers the membrane does not own and bypassed checks are let
  // through; the membrane only vetoes what it can prove stale or null.
  bool can_read() const noexcept {
    switch (kind) {
      case OutcomeKind::CachedValid:
      case OutcomeKind::Validated:
        return core::can_read(abs.state);
      case OutcomeKind::Foreign:
      case OutcomeKind::Bypassed:
        return true;
      case OutcomeKind::Null:
      case OutcomeKind::TemporalViolation:
        return false;
    }
    return false;
  }

  bool can_write() const noexcept {
    switch (kind) {
      case OutcomeKind::CachedValid:
      case OutcomeKind::Validated:
        return core::can_write(abs.state);
      case OutcomeKind::Foreign:
      case OutcomeKind::Bypassed:
        return true;
      case OutcomeKind::Null:
      case OutcomeKind::TemporalViolation:
        return false;
    }
    return false;
  }

  bool is_valid() const noexcept {
    return kind == OutcomeKind::CachedValid || kind == OutcomeKind::Validated;
  }
};

}} // namespace msm::pipeline

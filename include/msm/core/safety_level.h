// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once
#include <cstdint>
#include <string_view>

namespace msm { namespace core {

enum class SafetyLevel : std::uint8_t {
  Strict = 0,
  Hardened = 1,
  Off = 2,
};

// Loose, case-insensitive parse. Unrecognized input maps to Strict.
SafetyLevel parse_safety_level(std::string_view s) noexcept;
std::string_view to_string(SafetyLevel level) noexcept;

// Process-wide level. Initialized from MSM_SAFETY_LEVEL on first read;
// set_safety_level() takes effect on the next call into the membrane.
SafetyLevel safety_level() noexcept;
void set_safety_level(SafetyLevel level) noexcept;

// Re-read MSM_SAFETY_LEVEL and overwrite the current level.
void reload_safety_level_from_env() noexcept;

inline constexpr bool heals_enabled(SafetyLevel level) noexcept { return level == SafetyLevel::Hardened; }
inline constexpr bool validation_enabled(SafetyLevel level) noexcept { return level != SafetyLevel::Off; }

}} // namespace msm::core

// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace msm { namespace core {

// Coarse call family of the collaborator that asked for a validation.
enum class ApiFamily : std::uint8_t {
  PointerValidation = 0,
  Allocator = 1,
  StringMemory = 2,
  Stdio = 3,
  Threading = 4,
  Resolver = 5,
  MathFenv = 6,
  Loader = 7,
};

inline constexpr std::size_t kNumApiFamilies = 8;

inline constexpr std::uint8_t family_index(ApiFamily f) noexcept { return static_cast<std::uint8_t>(f); }

std::string_view to_string(ApiFamily f) noexcept;

}} // namespace msm::core

// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>

namespace msm { namespace arena {

// Header placed immediately below the user region:
//   [u64 hash | u32 generation | u32 size]   (little-endian)
// and an 8-byte canary immediately after it.
inline constexpr std::size_t kFingerprintSize = 16;
inline constexpr std::size_t kCanarySize = 8;
inline constexpr std::size_t kTotalOverhead = kFingerprintSize + kCanarySize;

struct Fingerprint {
  std::uint64_t hash{0};
  std::uint32_t generation{0};
  std::uint32_t size{0};

  // Deterministic in (user_base, user_size, generation). Sizes wider than
  // 32 bits are folded into the hash but truncated in the stored field.
  static Fingerprint compute(std::uintptr_t user_base, std::size_t user_size,
                             std::uint32_t generation) noexcept;

  std::uint64_t canary() const noexcept;
};

// SipHash-2-4 of two 64-bit words under the fixed membrane key.
std::uint64_t siphash_2_4(std::uint64_t m0, std::uint64_t m1) noexcept;

// Raw memory access. Callers guarantee [user_base - 16, user_base + size + 8)
// is owned memory.
void write_header(std::uintptr_t user_base, const Fingerprint& fp) noexcept;
void write_canary(std::uintptr_t user_base, std::size_t user_size, const Fingerprint& fp) noexcept;
Fingerprint read_header(std::uintptr_t user_base) noexcept;

bool verify_header(std::uintptr_t user_base, std::size_t user_size, std::uint32_t generation) noexcept;
bool verify_canary(std::uintptr_t user_base, std::size_t user_size, std::uint32_t generation) noexcept;

}} // namespace msm::arena

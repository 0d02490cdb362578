// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "msm/arena/fingerprint.h"

#include <cstring>
#include <initializer_list>

namespace msm { namespace arena {

namespace {
constexpr std::uint64_t kKey0 = 0x0706050403020100ull;
constexpr std::uint64_t kKey1 = 0x0F0E0D0C0B0A0908ull;
constexpr std::uint64_t kCanaryMix = 0xDEADBEEFCAFEBABEull;

inline std::uint64_t rotl(std::uint64_t x, int b) noexcept { return (x << b) | (x >> (64 - b)); }

inline void sip_round(std::uint64_t& v0, std::uint64_t& v1, std::uint64_t& v2, std::uint64_t& v3) noexcept {
  v0 += v1; v1 = rotl(v1, 13); v1 ^= v0; v0 = rotl(v0, 32);
  v2 += v3; v3 = rotl(v3, 16); v3 ^= v2;
  v0 += v3; v3 = rotl(v3, 21); v3 ^= v0;
  v2 += v1; v1 = rotl(v1, 17); v1 ^= v2; v2 = rotl(v2, 32);
}

inline void store_le64(unsigned char* p, std::uint64_t v) noexcept {
  for (int i = 0; i < 8; ++i) p[i] = static_cast<unsigned char>(v >> (8 * i));
}
inline void store_le32(unsigned char* p, std::uint32_t v) noexcept {
  for (int i = 0; i < 4; ++i) p[i] = static_cast<unsigned char>(v >> (8 * i));
}
inline std::uint64_t load_le64(const unsigned char* p) noexcept {
  std::uint64_t v = 0;
  for (int i = 7; i >= 0; --i) v = (v << 8) | p[i];
  return v;
}
inline std::uint32_t load_le32(const unsigned char* p) noexcept {
  std::uint32_t v = 0;
  for (int i = 3; i >= 0; --i) v = (v << 8) | p[i];
  return v;
}
inline unsigned char* at(std::uintptr_t addr) noexcept { return reinterpret_cast<unsigned char*>(addr); }
} // namespace

std::uint64_t siphash_2_4(std::uint64_t m0, std::uint64_t m1) noexcept {
  std::uint64_t v0 = kKey0 ^ 0x736f6d6570736575ull;
  std::uint64_t v1 = kKey1 ^ 0x646f72616e646f6dull;
  std::uint64_t v2 = kKey0 ^ 0x6c7967656e657261ull;
  std::uint64_t v3 = kKey1 ^ 0x7465646279746573ull;
  for (std::uint64_t m : {m0, m1}) {
    v3 ^= m;
    sip_round(v0, v1, v2, v3);
    sip_round(v0, v1, v2, v3);
    v0 ^= m;
  }
  v2 ^= 0xFF;
  for (int i = 0; i < 4; ++i) sip_round(v0, v1, v2, v3);
  return v0 ^ v1 ^ v2 ^ v3;
}

Fingerprint Fingerprint::compute(std::uintptr_t user_base, std::size_t user_size,
                                 std::uint32_t generation) noexcept {
  const std::uint64_t size64 = static_cast<std::uint64_t>(user_size);
  const std::uint64_t m1 = size64 ^ (static_cast<std::uint64_t>(generation) << 32);
  Fingerprint fp;
  fp.hash = siphash_2_4(static_cast<std::uint64_t>(user_base), m1);
  fp.generation = generation;
  fp.size = static_cast<std::uint32_t>(user_size);
  return fp;
}

std::uint64_t Fingerprint::canary() const noexcept {
  return hash ^ rotl(hash, 32) ^ kCanaryMix;
}

void write_header(std::uintptr_t user_base, const Fingerprint& fp) noexcept {
  unsigned char* h = at(user_base - kFingerprintSize);
  store_le64(h, fp.hash);
  store_le32(h + 8, fp.generation);
  store_le32(h + 12, fp.size);
}

void write_canary(std::uintptr_t user_base, std::size_t user_size, const Fingerprint& fp) noexcept {
  store_le64(at(user_base + user_size), fp.canary());
}

Fingerprint read_header(std::uintptr_t user_base) noexcept {
  const unsigned char* h = at(user_base - kFingerprintSize);
  Fingerprint fp;
  fp.hash = load_le64(h);
  fp.generation = load_le32(h + 8);
  fp.size = load_le32(h + 12);
  return fp;
}

bool verify_header(std::uintptr_t user_base, std::size_t user_size, std::uint32_t generation) noexcept {
  const Fingerprint want = Fingerprint::compute(user_base, user_size, generation);
  const Fingerprint got = read_header(user_base);
  return got.hash == want.hash && got.generation == want.generation && got.size == want.size;
}

bool verify_canary(std::uintptr_t user_base, std::size_t user_size, std::uint32_t generation) noexcept {
  const std::uint64_t want = Fingerprint::compute(user_base, user_size, generation).canary();
  return load_le64(at(user_base + user_size)) == want;
}

}} // namespace msm::arena

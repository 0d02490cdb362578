// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "msm/arena/bloom_filter.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace msm { namespace arena {

BloomFilter::BloomFilter(std::size_t expected_items, double fp_rate) {
  if (expected_items == 0) {
    throw std::invalid_argument("BloomFilter: expected_items must be positive");
  }
  if (!(fp_rate > 0.0 && fp_rate < 1.0)) {
    throw std::invalid_argument("BloomFilter: fp_rate must be in (0, 1)");
  }
  const double n = static_cast<double>(expected_items);
  const double ln2 = std::log(2.0);
  const double m = std::ceil(-n * std::log(fp_rate) / (ln2 * ln2));
  num_bits_ = std::max<std::size_t>(64, static_cast<std::size_t>(m));
  const double k = std::ceil(static_cast<double>(num_bits_) / n * ln2);
  num_hashes_ = static_cast<std::uint32_t>(std::clamp(k, 1.0, 16.0));
  num_words_ = (num_bits_ + 63) / 64;
  words_ = std::make_unique<std::atomic<std::uint64_t>[]>(num_words_);
  for (std::size_t i = 0; i < num_words_; ++i) words_[i].store(0, std::memory_order_relaxed);
}

std::uint64_t BloomFilter::hash1(std::uint64_t x) noexcept {
  x *= 0x9E3779B97F4A7C15ull;
  x ^= x >> 30;
  x *= 0xBF58476D1CE4E5B9ull;
  x ^= x >> 27;
  return x;
}

std::uint64_t BloomFilter::hash2(std::uint64_t x) noexcept {
  x ^= x >> 33;
  x *= 0xFF51AFD7ED558CCDull;
  x ^= x >> 33;
  x *= 0xC4CEB9FE1A85EC53ull;
  x ^= x >> 33;
  return x | 1;  // odd step so probes do not collapse
}

void BloomFilter::insert(std::uintptr_t addr) noexcept {
  const std::uint64_t h1 = hash1(addr);
  const std::uint64_t h2 = hash2(addr);
  for (std::uint32_t i = 0; i < num_hashes_; ++i) {
    const std::uint64_t bit = (h1 + static_cast<std::uint64_t>(i) * h2) % num_bits_;
    words_[bit / 64].fetch_or(1ull << (bit % 64), std::memory_order_relaxed);
  }
  inserts_.fetch_add(1, std::memory_order_relaxed);
}

bool BloomFilter::might_contain(std::uintptr_t addr) const noexcept {
  const std::uint64_t h1 = hash1(addr);
  const std::uint64_t h2 = hash2(addr);
  for (std::uint32_t i = 0; i < num_hashes_; ++i) {
    const std::uint64_t bit = (h1 + static_cast<std::uint64_t>(i) * h2) % num_bits_;
    if ((words_[bit / 64].load(std::memory_order_relaxed) & (1ull << (bit % 64))) == 0) return false;
  }
  return true;
}

void BloomFilter::clear() noexcept {
  for (std::size_t i = 0; i < num_words_; ++i) words_[i].store(0, std::memory_order_relaxed);
  inserts_.store(0, std::memory_order_relaxed);
}

}} // namespace msm::arena

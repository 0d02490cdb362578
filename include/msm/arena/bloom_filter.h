// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>

namespace msm { namespace arena {

// Lock-free bloom filter over allocation base addresses. Bits are only ever
// set, so concurrent readers see a superset of completed inserts.
class BloomFilter final {
 public:
  BloomFilter(std::size_t expected_items, double fp_rate);

  BloomFilter(const BloomFilter&) = delete;
  BloomFilter& operator=(const BloomFilter&) = delete;

  void insert(std::uintptr_t addr) noexcept;
  bool might_contain(std::uintptr_t addr) const noexcept;
  // Not linearizable with concurrent inserts; for tests and resets.
  void clear() noexcept;

  std::size_t num_bits() const noexcept { return num_bits_; }
  std::uint32_t num_hashes() const noexcept { return num_hashes_; }
  std::uint64_t inserts() const noexcept { return inserts_.load(std::memory_order_relaxed); }

  static std::uint64_t hash1(std::uint64_t x) noexcept;
  static std::uint64_t hash2(std::uint64_t x) noexcept;

 private:
  std::size_t num_bits_;
  std::uint32_t num_hashes_;
  std::size_t num_words_;
  std::unique_ptr<std::atomic<std::uint64_t>[]> words_;
  std::atomic<std::uint64_t> inserts_{0};
};

}} // namespace msm::arena

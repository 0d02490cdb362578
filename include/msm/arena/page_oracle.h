// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <unordered_map>

namespace msm { namespace arena {

// Two-level page ownership map. Each 4 KiB page carries a saturating
// reference count of the tracked blocks touching it; a saturated count
// (255) is sticky and never decremented.
class PageOracle final {
 public:
  static constexpr std::size_t kPageSize = 4096;
  static constexpr std::size_t kPagesPerL2 = 4096;
  static constexpr std::uint8_t kSaturated = 255;

  PageOracle() = default;
  PageOracle(const PageOracle&) = delete;
  PageOracle& operator=(const PageOracle&) = delete;

  void insert(std::uintptr_t base, std::size_t size);
  bool query(std::uintptr_t addr) const;
  void remove(std::uintptr_t base, std::size_t size);

  std::size_t l2_blocks() const;

 private:
  struct L2 {
    std::array<std::atomic<std::uint8_t>, kPagesPerL2> counts{};
  };

  mutable std::shared_mutex mu_;
  std::unordered_map<std::uintptr_t, std::unique_ptr<L2>> blocks_;  // key = page >> 12
};

}} // namespace msm::arena

// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "msm/arena/page_oracle.h"

#include <mutex>

namespace msm { namespace arena {

namespace {
inline std::uintptr_t page_of(std::uintptr_t addr) noexcept { return addr / PageOracle::kPageSize; }

// Pages covered by [base, base + size); size 0 covers the base page.
inline std::uintptr_t last_page(std::uintptr_t base, std::size_t size) noexcept {
  if (size == 0) return page_of(base);
  const std::uintptr_t end = base + (size - 1);
  return page_of(end < base ? ~std::uintptr_t{0} : end);
}
} // namespace

void PageOracle::insert(std::uintptr_t base, std::size_t size) {
  const std::uintptr_t first = page_of(base);
  const std::uintptr_t last = last_page(base, size);
  for (std::uintptr_t p = first;; ++p) {
    const std::uintptr_t key = p / kPagesPerL2;
    L2* blk = nullptr;
    {
      std::shared_lock<std::shared_mutex> rl(mu_);
      auto it = blocks_.find(key);
      if (it != blocks_.end()) blk = it->second.get();
    }
    if (!blk) {
      std::unique_lock<std::shared_mutex> wl(mu_);
      auto& slot = blocks_[key];
      if (!slot) slot = std::make_unique<L2>();
      blk = slot.get();
    }
    auto& c = blk->counts[p % kPagesPerL2];
    std::uint8_t cur = c.load(std::memory_order_relaxed);
    while (cur != kSaturated &&
           !c.compare_exchange_weak(cur, static_cast<std::uint8_t>(cur + 1), std::memory_order_relaxed)) {
    }
    if (p == last) break;
  }
}

bool PageOracle::query(std::uintptr_t addr) const {
  const std::uintptr_t p = page_of(addr);
  std::shared_lock<std::shared_mutex> rl(mu_);
  auto it = blocks_.find(p / kPagesPerL2);
  if (it == blocks_.end()) return false;
  return it->second->counts[p % kPagesPerL2].load(std::memory_order_relaxed) != 0;
}

void PageOracle::remove(std::uintptr_t base, std::size_t size) {
  const std::uintptr_t first = page_of(base);
  const std::uintptr_t last = last_page(base, size);
  std::shared_lock<std::shared_mutex> rl(mu_);
  for (std::uintptr_t p = first;; ++p) {
    auto it = blocks_.find(p / kPagesPerL2);
    if (it != blocks_.end()) {
      auto& c = it->second->counts[p % kPagesPerL2];
      std::uint8_t cur = c.load(std::memory_order_relaxed);
      while (cur != 0 && cur != kSaturated &&
             !c.compare_exchange_weak(cur, static_cast<std::uint8_t>(cur - 1), std::memory_order_relaxed)) {
      }
    }
    if (p == last) break;
  }
}

std::size_t PageOracle::l2_blocks() const {
  std::shared_lock<std::shared_mutex> rl(mu_);
  return blocks_.size();
}

}} // namespace msm::arena

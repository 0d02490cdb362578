// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "msm/pipeline/validation_cache.h"

namespace msm { namespace pipeline {

ValidationCache& ValidationCache::local() noexcept {
  thread_local ValidationCache cache;
  return cache;
}

std::optional<CacheEntry> ValidationCache::lookup(std::uint64_t owner, std::uintptr_t addr,
                                                  std::uint64_t epoch) noexcept {
  CacheEntry& e = entries_[index_of(addr)];
  if (e.valid && e.owner == owner && e.addr == addr) {
    if (e.epoch == epoch) {
      ++hits_;
      return e;
    }
    e.valid = false;
  }
  ++misses_;
  return std::nullopt;
}

void ValidationCache::insert(const CacheEntry& e) noexcept {
  CacheEntry& slot = entries_[index_of(e.addr)];
  slot = e;
  slot.valid = true;
}

void ValidationCache::invalidate(std::uintptr_t user_base) noexcept {
  for (auto& e : entries_) {
    if (e.valid && e.user_base == user_base) e.valid = false;
  }
}

void ValidationCache::invalidate_all() noexcept {
  for (auto& e : entries_) e.valid = false;
}

}} // namespace msm::pipeline

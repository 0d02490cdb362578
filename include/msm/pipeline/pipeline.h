// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

#include "msm/arena/arena.h"
#include "msm/arena/bloom_filter.h"
#include "msm/arena/page_oracle.h"
#include "msm/control/quarantine_controller.h"
#include "msm/control/runtime_kernel.h"
#include "msm/control/stage_oracle.h"
#include "msm/core/api_family.h"
#include "msm/core/config.h"
#include "msm/pipeline/healing.h"
#include "msm/pipeline/outcome.h"

namespace msm { namespace pipeline {

// The membrane entry points. Owns the arena, the pre-filters and the
// control system; validation runs the staged pipeline in the order the
// stage oracle publishes for the call's context.
class ValidationPipeline final {
 public:
  explicit ValidationPipeline(const core::MembraneConfig& cfg = core::MembraneConfig{});

  ValidationPipeline(const ValidationPipeline&) = delete;
  ValidationPipeline& operator=(const ValidationPipeline&) = delete;

  // Process-wide instance configured from MSM_CONF on first use and never
  // destroyed.
  static ValidationPipeline& get();

  // nullptr on exhaustion, size overflow or a non power-of-two align.
  void* allocate(std::size_t size);
  void* allocate_aligned(std::size_t size, std::size_t align);
  arena::FreeResult free(void* ptr);

  // Makes a range the arena does not own known to the pre-filters.
  void register_allocation(std::uintptr_t base, std::size_t size);

  ValidationOutcome validate(std::uintptr_t addr, core::ApiFamily family = core::ApiFamily::PointerValidation);
  ValidationOutcome validate(const void* p, core::ApiFamily family = core::ApiFamily::PointerValidation) {
    return validate(reinterpret_cast<std::uintptr_t>(p), family);
  }

  // Number of bytes a copy of n bytes from src to dst may touch. Clamped to
  // the known remaining bytes when healing is enabled, n otherwise.
  std::size_t copy_length(const void* dst, const void* src, std::size_t n);
  // Characters of a src_len string that fit in dst with its terminator.
  std::size_t string_length(const void* dst, std::size_t src_len);

  std::uint64_t owner_id() const noexcept { return owner_; }
  std::uint64_t epoch() const noexcept { return epoch_.load(std::memory_order_acquire); }
  const core::MembraneConfig& config() const noexcept { return cfg_; }

  arena::Arena& arena() noexcept { return arena_; }
  const arena::BloomFilter& bloom() const noexcept { return bloom_; }
  const arena::PageOracle& page_oracle() const noexcept { return pages_; }
  control::RuntimeKernel& kernel() noexcept { return kernel_; }
  control::StageOracle& stage_oracle() noexcept { return oracle_; }
  control::QuarantineController& quarantine_controller() noexcept { return quarantine_; }
  HealingPolicy& healing() noexcept { return healing_; }

 private:
  void register_owned_(std::uintptr_t base, std::size_t size);
  static PointerAbstraction abstraction_from_slot_(std::uintptr_t addr, const arena::Slot& s) noexcept;

  const core::MembraneConfig cfg_;
  const std::uint64_t owner_;
  arena::Arena arena_;
  arena::BloomFilter bloom_;
  arena::PageOracle pages_;
  control::RuntimeKernel kernel_;
  control::StageOracle oracle_;
  control::QuarantineController quarantine_;
  HealingPolicy healing_;
  std::atomic<std::uint64_t> epoch_{1};
  std::atomic<std::uint64_t> pending_detections_{0};
};

}} // namespace msm::pipeline

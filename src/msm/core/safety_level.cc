// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "msm/core/safety_level.h"
#include "msm/core/lattice.h"

#include <atomic>
#include <cctype>
#include <cstdlib>
#include <mutex>
#include <string>

namespace msm { namespace core {

namespace {
std::atomic<SafetyLevel> g_level{SafetyLevel::Strict};
std::once_flag g_env_once;

SafetyLevel level_from_env() noexcept {
  const char* env = std::getenv("MSM_SAFETY_LEVEL");
  if (!env || !*env) return SafetyLevel::Strict;
  return parse_safety_level(env);
}

void ensure_env_loaded() {
  std::call_once(g_env_once, [] { g_level.store(level_from_env(), std::memory_order_relaxed); });
}
} // namespace

SafetyLevel parse_safety_level(std::string_view s) noexcept {
  std::string u;
  u.reserve(s.size());
  for (char c : s) {
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r') continue;
    u.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (u == "hardened" || u == "repair" || u == "tsm" || u == "full") return SafetyLevel::Hardened;
  if (u == "off" || u == "none" || u == "disabled") return SafetyLevel::Off;
  // strict, default, abi and anything unrecognized
  return SafetyLevel::Strict;
}

std::string_view to_string(SafetyLevel level) noexcept {
  switch (level) {
    case SafetyLevel::Strict: return "strict";
    case SafetyLevel::Hardened: return "hardened";
    case SafetyLevel::Off: return "off";
  }
  return "strict";
}

std::string_view to_string(SafetyState s) noexcept {
  switch (s) {
    case SafetyState::Unknown: return "unknown";
    case SafetyState::Invalid: return "invalid";
    case SafetyState::Freed: return "freed";
    case SafetyState::Quarantined: return "quarantined";
    case SafetyState::Writable: return "writable";
    case SafetyState::Readable: return "readable";
    case SafetyState::Valid: return "valid";
  }
  return "unknown";
}

SafetyLevel safety_level() noexcept {
  ensure_env_loaded();
  return g_level.load(std::memory_order_relaxed);
}

void set_safety_level(SafetyLevel level) noexcept {
  ensure_env_loaded();
  g_level.store(level, std::memory_order_relaxed);
}

void reload_safety_level_from_env() noexcept {
  ensure_env_loaded();
  g_level.store(level_from_env(), std::memory_order_relaxed);
}

}} // namespace msm::core

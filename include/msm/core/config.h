// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>

namespace msm { namespace core {

struct MembraneConfig {
  std::size_t quarantine_max_bytes{64ull << 20};
  std::size_t quarantine_max_entries{65536};
  std::size_t bloom_expected_items{1u << 20};
  std::uint32_t bloom_fp_ppm{1000};     // false-positive target, parts per million
  bool        tls_cache{true};
  bool        page_oracle{true};
  bool        adaptive_quarantine{true}; // cap quarantine entries by the published depth
};

// Parse a "key=val,key=val" string. Unknown keys and malformed values are
// ignored; out-of-range values are normalized.
MembraneConfig parse_membrane_config(const char* conf);

// MSM_CONF, parsed on every call.
MembraneConfig membrane_config_from_env();

}} // namespace msm::core

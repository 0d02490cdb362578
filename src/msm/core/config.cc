// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "msm/core/config.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <string>

namespace msm { namespace core {

namespace {
constexpr std::size_t kMinQuarantineBytes = 4096;
constexpr std::size_t kMinQuarantineEntries = 16;
constexpr std::size_t kMinBloomItems = 1024;

void normalize_(MembraneConfig& cfg) {
  if (cfg.quarantine_max_bytes < kMinQuarantineBytes) cfg.quarantine_max_bytes = kMinQuarantineBytes;
  if (cfg.quarantine_max_entries < kMinQuarantineEntries) cfg.quarantine_max_entries = kMinQuarantineEntries;
  if (cfg.bloom_expected_items < kMinBloomItems) cfg.bloom_expected_items = kMinBloomItems;
  if (cfg.bloom_fp_ppm == 0) cfg.bloom_fp_ppm = 1;
  if (cfg.bloom_fp_ppm >= 1000000) cfg.bloom_fp_ppm = 500000;
}
} // namespace

MembraneConfig parse_membrane_config(const char* conf) {
  MembraneConfig cfg;
  if (!conf || !*conf) return cfg;
  auto is_space = [](char c){ return c==' '||c=='\t'||c=='\n' || c=='\r'; };
  std::string s(conf);
  std::size_t i = 0;
  auto trim = [&](std::string& t){ std::size_t a=0; while (a<t.size() && is_space(t[a])) ++a; std::size_t b=t.size(); while (b>a && is_space(t[b-1])) --b; t = t.substr(a, b-a); };
  auto to_uint = [&](const std::string& t, std::size_t& out)->bool{
    if (t.empty()) return false; char* end=nullptr; errno=0; unsigned long long x = std::strtoull(t.c_str(), &end, 10);
    if (errno!=0 || (end && *end!='\0') || t[0]=='-') return false; out = static_cast<std::size_t>(x); return true; };
  auto to_bool = [&](const std::string& t, bool& out)->bool{
    std::string u=t; for (auto& c: u) c = (char)std::tolower(c);
    if (u=="1"||u=="true"||u=="yes"||u=="on") { out=true; return true; }
    if (u=="0"||u=="false"||u=="no"||u=="off") { out=false; return true; }
    return false; };
  while (i < s.size()) {
    while (i < s.size() && (is_space(s[i]) || s[i]==',')) ++i; if (i>=s.size()) break;
    std::size_t k0=i; while (i<s.size() && s[i] != '=' && s[i] != ',') ++i;
    if (i>=s.size() || s[i] != '=') continue;
    std::string key = s.substr(k0, i-k0); ++i;
    std::size_t v0=i; while (i<s.size() && s[i] != ',') ++i; std::string val = s.substr(v0, i-v0);
    trim(key); trim(val);
    if (key == "quarantine_max_bytes") { std::size_t v=0; if (to_uint(val, v)) cfg.quarantine_max_bytes = v; }
    else if (key == "quarantine_max_entries") { std::size_t v=0; if (to_uint(val, v)) cfg.quarantine_max_entries = v; }
    else if (key == "bloom_expected_items") { std::size_t v=0; if (to_uint(val, v)) cfg.bloom_expected_items = v; }
    else if (key == "bloom_fp_ppm") { std::size_t v=0; if (to_uint(val, v) && v <= 1000000) cfg.bloom_fp_ppm = static_cast<std::uint32_t>(v); }
    else if (key == "tls_cache") { bool b=false; if (to_bool(val, b)) cfg.tls_cache = b; }
    else if (key == "page_oracle") { bool b=false; if (to_bool(val, b)) cfg.page_oracle = b; }
    else if (key == "adaptive_quarantine") { bool b=false; if (to_bool(val, b)) cfg.adaptive_quarantine = b; }
  }
  normalize_(cfg);
  return cfg;
}

MembraneConfig membrane_config_from_env() {
  return parse_membrane_config(std::getenv("MSM_CONF"));
}

}} // namespace msm::core

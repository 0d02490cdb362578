// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>
#include <cstdlib>

#include "msm/core/config.h"

using msm::core::MembraneConfig;
using msm::core::membrane_config_from_env;
using msm::core::parse_membrane_config;

static void set_conf(const char* conf) {
  setenv("MSM_CONF", conf, 1);
}

TEST(MembraneConfigTest, DefaultsWhenUnset) {
  const MembraneConfig d;
  const MembraneConfig c = parse_membrane_config(nullptr);
  EXPECT_EQ(c.quarantine_max_bytes, d.quarantine_max_bytes);
  EXPECT_EQ(c.quarantine_max_entries, d.quarantine_max_entries);
  EXPECT_EQ(c.bloom_expected_items, d.bloom_expected_items);
  EXPECT_EQ(c.bloom_fp_ppm, d.bloom_fp_ppm);
  EXPECT_TRUE(c.tls_cache);
  EXPECT_TRUE(c.page_oracle);
  EXPECT_TRUE(c.adaptive_quarantine);
  EXPECT_EQ(parse_membrane_config("").quarantine_max_entries, d.quarantine_max_entries);
}

TEST(MembraneConfigTest, ParsesKeysWithWhitespace) {
  const MembraneConfig c = parse_membrane_config(
      " quarantine_max_bytes = 1048576 , quarantine_max_entries=128,bloom_fp_ppm=50,"
      "tls_cache=off,page_oracle=No,adaptive_quarantine=0");
  EXPECT_EQ(c.quarantine_max_bytes, 1048576u);
  EXPECT_EQ(c.quarantine_max_entries, 128u);
  EXPECT_EQ(c.bloom_fp_ppm, 50u);
  EXPECT_FALSE(c.tls_cache);
  EXPECT_FALSE(c.page_oracle);
  EXPECT_FALSE(c.adaptive_quarantine);
}

TEST(MembraneConfigTest, MalformedAndUnknownIgnored) {
  const MembraneConfig d;
  const MembraneConfig c = parse_membrane_config("quarantine_max_entries=-5,bogus=1,tls_cache=maybe,novalue,bloom_fp_ppm=2000000");
  EXPECT_EQ(c.quarantine_max_entries, d.quarantine_max_entries);
  EXPECT_TRUE(c.tls_cache);
  EXPECT_EQ(c.bloom_fp_ppm, d.bloom_fp_ppm);
}

TEST(MembraneConfigTest, OutOfRangeValuesNormalized) {
  const MembraneConfig c = parse_membrane_config("quarantine_max_bytes=1,quarantine_max_entries=0,bloom_expected_items=3,bloom_fp_ppm=0");
  EXPECT_EQ(c.quarantine_max_bytes, 4096u);
  EXPECT_EQ(c.quarantine_max_entries, 16u);
  EXPECT_EQ(c.bloom_expected_items, 1024u);
  EXPECT_EQ(c.bloom_fp_ppm, 1u);
}

TEST(MembraneConfigTest, ReadsEnvOnEveryCall) {
  set_conf("quarantine_max_entries=256");
  EXPECT_EQ(membrane_config_from_env().quarantine_max_entries, 256u);
  set_conf("quarantine_max_entries=512");
  EXPECT_EQ(membrane_config_from_env().quarantine_max_entries, 512u);
  unsetenv("MSM_CONF");
}

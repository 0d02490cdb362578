// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "msm/pipeline/pipeline.h"

namespace msm { namespace telemetry {

// Snapshot of every controller summary of one pipeline plus the
// process-wide membrane counters. Keys keep insertion order.
nlohmann::ordered_json collect(pipeline::ValidationPipeline& p);

// collect() serialized; indent < 0 yields a single line.
std::string to_json(pipeline::ValidationPipeline& p, int indent = -1);

}} // namespace msm::telemetry

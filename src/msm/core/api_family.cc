// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "msm/core/api_family.h"

namespace msm { namespace core {

std::string_view to_string(ApiFamily f) noexcept {
  switch (f) {
    case ApiFamily::PointerValidation: return "pointer_validation";
    case ApiFamily::Allocator: return "allocator";
    case ApiFamily::StringMemory: return "string_memory";
    case ApiFamily::Stdio: return "stdio";
    case ApiFamily::Threading: return "threading";
    case ApiFamily::Resolver: return "resolver";
    case ApiFamily::MathFenv: return "math_fenv";
    case ApiFamily::Loader: return "loader";
  }
  return "pointer_validation";
}

}} // namespace msm::core

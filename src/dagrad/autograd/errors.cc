// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "dagrad/autograd/errors.h"
#include "dagrad/autograd/types.h"

namespace dagrad { namespace autograd {

const char* to_string(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::TypeMismatch: return "TypeMismatch";
    case ErrorKind::UnsavedContext: return "UnsavedContext";
    case ErrorKind::GradientOnFrozenContext: return "GradientOnFrozenContext";
    case ErrorKind::ArityMismatch: return "ArityMismatch";
    case ErrorKind::NonLeafAccumulation: return "NonLeafAccumulation";
    case ErrorKind::NonLeafMutation: return "NonLeafMutation";
  }
  return "Unknown";
}

std::string payload_type_name(const Payload& p) {
  if (!p.has_value()) return "<empty>";
  return p.type().name();
}

}} // namespace dagrad::autograd

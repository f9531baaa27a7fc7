// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "dagrad/autograd/context.h"

#include "dagrad/core/error_text.h"

#include <stdexcept>
#include <string>

namespace dagrad { namespace autograd {

void Context::save_for_backward(std::vector<Payload> values) {
  if (no_grad_) {
    return;
  }
  saved_ = std::move(values);
}

const std::vector<Payload>& Context::saved_values() const {
  if (no_grad_) {
    throw ContractViolation(ErrorKind::GradientOnFrozenContext,
                            dagrad::core::kSavedValuesFrozenMsg);
  }
  if (!saved_) {
    throw ContractViolation(ErrorKind::UnsavedContext,
                            dagrad::core::kSavedValuesUnsavedMsg);
  }
  return *saved_;
}

const Payload& Context::saved_value(std::size_t i) const {
  const std::vector<Payload>& v = saved_values();
  if (i >= v.size()) {
    throw std::out_of_range(std::string(dagrad::core::kSavedValueIndexPrefix) +
                            std::to_string(i) + " (saved " + std::to_string(v.size()) + ")");
  }
  return v[i];
}

}} // namespace dagrad::autograd

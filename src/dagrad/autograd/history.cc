// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "dagrad/autograd/history.h"
#include "dagrad/autograd/function.h"
#include "dagrad/autograd/node.h"

namespace dagrad { namespace autograd {

History::History(const Operation& op, Context ctx, std::vector<Operand> inputs)
    : op_(&op), ctx_(std::move(ctx)), inputs_(std::move(inputs)) {}

History::~History() = default;

std::vector<GradientPair> History::backprop_step(const Payload& d_output) const {
  return op_->chain_rule(ctx_, inputs_, d_output);
}

}} // namespace dagrad::autograd
